#include "Effector.hpp"
#include "Network.hpp"

namespace {

// erases the entry at key only if it still holds exactly action
template <typename T>
bool removeIfSame(std::map<SimTime, std::shared_ptr<T> >& changes,
        const Action* action) {
  typename std::map<SimTime, std::shared_ptr<T> >::iterator it =
          changes.find(action->getTime());
  if (it == changes.end() || it->second.get() != action)
    return false;
  changes.erase(it);
  return true;
}

// removes and returns the entry scheduled at time, if any
template <typename T>
std::shared_ptr<T> takeChange(std::map<SimTime, std::shared_ptr<T> >& changes,
        SimTime time) {
  std::shared_ptr<T> change;
  typename std::map<SimTime, std::shared_ptr<T> >::iterator it =
          changes.find(time);
  if (it != changes.end()) {
    change = it->second;
    changes.erase(it);
  }
  return change;
}

}

Effector::Effector(Network* network) {
  this->network = network;
}

bool Effector::canSchedule(SimTime time, const char* caller) const {
  if (time > network->getCurrentTimeStep())
    return true;
  BOOST_LOG_TRIVIAL(error) << "Effector::" << caller << "() - cannot schedule "
          "an action at " << time << ", the network is already at time "
          << network->getCurrentTimeStep();
  return false;
}

MirrorChangePtr Effector::setMirrors(int newMirrors, SimTime time) {
  if (!canSchedule(time, "setMirrors"))
    return MirrorChangePtr();
  MirrorChangePtr change(new MirrorChange(network,
          network->getIdGenerator().getNextId(), time, newMirrors));
  mirrorChanges[time] = change;
  BOOST_LOG_TRIVIAL(debug) << "Effector::setMirrors() - scheduled "
          << change->toString();
  return change;
}

TopologyChangePtr Effector::setStrategy(StrategyPtr strategy, SimTime time) {
  if (!canSchedule(time, "setStrategy"))
    return TopologyChangePtr();
  TopologyChangePtr change(new TopologyChange(network,
          network->getIdGenerator().getNextId(), time, strategy));
  strategyChanges[time] = change;
  BOOST_LOG_TRIVIAL(debug) << "Effector::setStrategy() - scheduled "
          << change->toString();
  return change;
}

TargetLinkChangePtr Effector::setTargetLinksPerMirror(int newLinksPerMirror,
        SimTime time) {
  if (!canSchedule(time, "setTargetLinksPerMirror"))
    return TargetLinkChangePtr();
  TargetLinkChangePtr change(new TargetLinkChange(network,
          network->getIdGenerator().getNextId(), time, newLinksPerMirror));
  targetLinkChanges[time] = change;
  BOOST_LOG_TRIVIAL(debug) << "Effector::setTargetLinksPerMirror() - scheduled "
          << change->toString();
  return change;
}

void Effector::removeAction(const ActionPtr& action) {
  if (!action)
    return;
  bool removed = false;
  switch (action->getType()) {
    case ActionType::MIRROR_CHANGE:
      removed = removeIfSame(mirrorChanges, action.get());
      break;
    case ActionType::TOPOLOGY_CHANGE:
      removed = removeIfSame(strategyChanges, action.get());
      break;
    case ActionType::TARGET_LINK_CHANGE:
      removed = removeIfSame(targetLinkChanges, action.get());
      break;
  }
  BOOST_LOG_TRIVIAL(debug) << "Effector::removeAction() - " << action->toString()
          << (removed ? " withdrawn" : " not pending, ignored");
}

void Effector::timeStep(SimTime time) {
  TopologyChangePtr topology = takeChange(strategyChanges, time);
  if (topology) {
    BOOST_LOG_TRIVIAL(info) << "Effector::timeStep() - applying "
            << topology->toString();
    network->setTopologyStrategy(topology->getNewTopology(), time);
  }
  MirrorChangePtr mirrors = takeChange(mirrorChanges, time);
  if (mirrors) {
    BOOST_LOG_TRIVIAL(info) << "Effector::timeStep() - applying "
            << mirrors->toString();
    network->setNumMirrors(mirrors->getNewMirrors(), time);
  }
  TargetLinkChangePtr links = takeChange(targetLinkChanges, time);
  if (links) {
    BOOST_LOG_TRIVIAL(info) << "Effector::timeStep() - applying "
            << links->toString();
    network->setNumTargetedLinksPerMirror(links->getNewLinksPerMirror(), time);
  }
}
