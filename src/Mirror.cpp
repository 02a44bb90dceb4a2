#include "Mirror.hpp"

Mirror::Mirror(int id, SimTime creationTime, SimTime startupDelay,
        SimTime readyDelay) {
  this->id = id;
  this->creationTime = creationTime;
  this->upTime = creationTime + std::max(startupDelay, 0);
  this->readyTime = upTime + std::max(readyDelay, 0);
  this->stopTime = INF_TIME;
  this->state = MirrorState::STARTING;
}

void Mirror::timeStep(SimTime time) {
  switch (state) {
    case MirrorState::STARTING:
      if (time >= readyTime)
        state = MirrorState::READY;
      else if (time >= upTime)
        state = MirrorState::UP;
      break;
    case MirrorState::UP:
      if (time >= readyTime)
        state = MirrorState::READY;
      break;
    case MirrorState::STOPPING:
      if (time > stopTime)
        state = MirrorState::STOPPED;
      break;
    default:
      break;
  }
}

void Mirror::shutdown(SimTime time) {
  if (!isUsable())
    return;
  BOOST_LOG_TRIVIAL(debug) << "Mirror::shutdown() - mirror " << id
          << " stopping at " << time << " with " << links.size()
          << " links still attached";
  BOOST_FOREACH(Link* link, links) {
    link->shutdown();
  }
  links.clear();
  stopTime = time;
  state = MirrorState::STOPPING;
}

bool Mirror::isLinkedWith(const Mirror* other) const {
  BOOST_FOREACH(Link* link, links) {
    if (!link->isClosed() && link->getOther(this) == other)
      return true;
  }
  return false;
}

int Mirror::getNumLinks() const {
  int count = 0;
  BOOST_FOREACH(Link* link, links) {
    if (!link->isClosed())
      count++;
  }
  return count;
}

LinkSet Mirror::getLinksTo(const Mirror* other) const {
  LinkSet result;
  BOOST_FOREACH(Link* link, links) {
    if (!link->isClosed() && link->getOther(this) == other)
      result.insert(link);
  }
  return result;
}
