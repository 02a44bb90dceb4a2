#include "Link.hpp"
#include "Mirror.hpp"

Link::Link(int id, Mirror* source, Mirror* target, SimTime creationTime,
        SimTime activationDelay, int bandwidth) {
  this->id = id;
  this->source = source;
  this->target = target;
  this->creationTime = creationTime;
  this->activationTime = creationTime + std::max(activationDelay, 0);
  this->bandwidth = bandwidth;
  this->state = LinkState::INACTIVE;
  source->addLink(this);
  target->addLink(this);
}

void Link::timeStep(SimTime time) {
  if (state != LinkState::INACTIVE)
    return;
  if (time >= activationTime && source->isReady() && target->isReady()) {
    state = LinkState::ACTIVE;
    BOOST_LOG_TRIVIAL(trace) << "Link::timeStep() - link " << id << " ("
            << source->getId() << "-" << target->getId() << ") active at "
            << time;
  }
}

Mirror* Link::getOther(const Mirror* mirror) const {
  if (mirror == source)
    return target;
  else if (mirror == target)
    return source;
  return nullptr;
}
