#include "Effect.hpp"
#include "Action.hpp"
#include "Network.hpp"
#include <cmath>

namespace {

bool isKind(const TopologyStrategy* topology, TopologyKind kind) {
  return topology != nullptr && topology->getKind() == kind;
}

int roundHalfUp(double value) {
  return (int) std::floor(value + 0.5);
}

int historyAt(const History& history, SimTime time) {
  History::const_iterator it = history.find(time);
  return it == history.end() ? 0 : it->second;
}

}

double Effect::getDeltaActiveLinks() const {
  const Network* network = action.getNetwork();
  StrategyPtr topology = network->getTopologyStrategy();
  int m = network->getNumMirrors();
  int lpm = network->getNumTargetLinksPerMirror();
  switch (action.getType()) {
    case ActionType::MIRROR_CHANGE:
      return -1 * getDeltaActiveLinksForMirrorChange(
              static_cast<const MirrorChange&>(action), topology.get(), m, lpm);
    case ActionType::TARGET_LINK_CHANGE:
      return -1 * getDeltaActiveLinksForTargetLinkChange(
              static_cast<const TargetLinkChange&>(action), topology.get(), m, lpm);
    case ActionType::TOPOLOGY_CHANGE:
      return -1 * getDeltaActiveLinksForTopologyChange(
              static_cast<const TopologyChange&>(action), topology.get(), m, lpm);
  }
  return 0;
}

double Effect::getDeltaActiveLinksForMirrorChange(const MirrorChange& change,
        const TopologyStrategy* topology, int m1, int linksPerMirror) {
  int m2 = change.getNewMirrors();
  if (isKind(topology, TopologyKind::FULLY_CONNECTED)) {
    return 0;
  } else if (isKind(topology, TopologyKind::N_CONNECTED)) {
    int denominator = (m1 - 1) * (m2 - 1);
    if (denominator == 0)
      return 0;
    return (2.0 * linksPerMirror * (m2 - m1)) / denominator;
  }
  if (m1 * m2 == 0)
    return 0;
  return (2.0 * (m2 - m1)) / (m1 * m2);
}

double Effect::getDeltaActiveLinksForTargetLinkChange(
        const TargetLinkChange& change, const TopologyStrategy* topology, int m,
        int lpm1) {
  int lpm2 = change.getNewLinksPerMirror();
  if (isKind(topology, TopologyKind::N_CONNECTED) && m != 1)
    return (2.0 * (lpm1 - lpm2)) / (m - 1);
  return 0;
}

double Effect::getDeltaActiveLinksForTopologyChange(
        const TopologyChange& change, const TopologyStrategy* topology, int m,
        int linksPerMirror) {
  const TopologyStrategy* newTopology = change.getNewTopology().get();
  const int lpm = linksPerMirror;
  if (isKind(topology, TopologyKind::FULLY_CONNECTED)
          && isKind(newTopology, TopologyKind::N_CONNECTED)) {
    return m == 1 ? 0 : (2 * lpm) / (double) (m - 1);
  } else if (isKind(topology, TopologyKind::FULLY_CONNECTED)
          && isKind(newTopology, TopologyKind::BALANCED_TREE)) {
    return m == 0 ? 0 : 1 - (2 / (double) m);
  } else if (isKind(topology, TopologyKind::N_CONNECTED)
          && isKind(newTopology, TopologyKind::FULLY_CONNECTED)) {
    return m == 1 ? 0 : (2 * lpm) / (double) (m - 1) - 1;
  } else if (isKind(topology, TopologyKind::N_CONNECTED)
          && isKind(newTopology, TopologyKind::BALANCED_TREE)) {
    return m * m - m == 0 ? 0 : ((2 * m * (1 - lpm)) - 2) / (double) (m * m - m);
  } else if (isKind(topology, TopologyKind::BALANCED_TREE)
          && isKind(newTopology, TopologyKind::FULLY_CONNECTED)) {
    return m == 0 ? 0 : (2 / (double) m) - 1;
  } else if (isKind(topology, TopologyKind::BALANCED_TREE)
          && isKind(newTopology, TopologyKind::N_CONNECTED)) {
    return m * m - m == 0 ? 0 : (2 * m * (lpm - 1) + 2) / (double) (m * m - m);
  }
  return 0;
}

int Effect::getDeltaBandwidth(const Properties& props) const {
  const Network* network = action.getNetwork();
  int currentRelativeBandwidth = historyAt(network->getBandwidthHistory(),
          network->getCurrentTimeStep());
  int maxBandwidthPerLink = props.getInt("max_bandwidth");
  StrategyPtr topology = network->getTopologyStrategy();
  int predictedTargetLinks = topology ?
          topology->getPredictedNumTargetLinks(action) : 0;
  int predictedMaxTotalBandwidth = predictedTargetLinks * maxBandwidthPerLink;
  if (predictedMaxTotalBandwidth <= 0) {
    BOOST_LOG_TRIVIAL(debug) << "Effect::getDeltaBandwidth() - no bandwidth "
            "predicted for " << action.toString();
    return 0;
  }
  int predictedTotalBandwidth = network->getPredictedBandwidth(
          action.getTime() + getLatency() - 1);
  int newRelativeBandwidth = 100 * predictedTotalBandwidth
          / predictedMaxTotalBandwidth;
  return currentRelativeBandwidth - newRelativeBandwidth;
}

int Effect::getDeltaTimeToWrite() const {
  const Network* network = action.getNetwork();
  int currentRelativeTTW = historyAt(network->getTtwHistory(),
          network->getCurrentTimeStep());
  int m = network->getNumTargetMirrors();
  int lpm = network->getNumTargetLinksPerMirror();
  StrategyPtr topology = network->getTopologyStrategy();
  const TopologyStrategy* newTopology = nullptr;
  if (action.getType() == ActionType::TOPOLOGY_CHANGE)
    newTopology = static_cast<const TopologyChange&>(action).getNewTopology().get();

  if (isKind(newTopology, TopologyKind::FULLY_CONNECTED)
          || (action.getType() != ActionType::TOPOLOGY_CHANGE
          && isKind(topology.get(), TopologyKind::FULLY_CONNECTED))) {
    return 100 - currentRelativeTTW;
  } else if (isKind(newTopology, TopologyKind::BALANCED_TREE)) {
    return getDeltaTimeToWriteForBalancedTrees(m, currentRelativeTTW, lpm);
  } else if (action.getType() == ActionType::MIRROR_CHANGE
          && isKind(topology.get(), TopologyKind::BALANCED_TREE)) {
    m = static_cast<const MirrorChange&>(action).getNewMirrors();
  } else if (action.getType() == ActionType::TARGET_LINK_CHANGE
          && isKind(topology.get(), TopologyKind::BALANCED_TREE)) {
    lpm = static_cast<const TargetLinkChange&>(action).getNewLinksPerMirror();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Effect::getDeltaTimeToWrite() - TTW not "
            "modelled for " << action.toString();
    return 0;
  }
  return getDeltaTimeToWriteForBalancedTrees(m, currentRelativeTTW, lpm);
}

int Effect::getDeltaTimeToWriteForBalancedTrees(int m, int currentRelativeTTW,
        int linksPerMirror) {
  int maxTTW = roundHalfUp(m / 2.0);
  if (maxTTW == 1)
    return 100 - currentRelativeTTW;
  // log base linksPerMirror is undefined below 2
  if (maxTTW <= 0 || linksPerMirror < 2)
    return 0;
  int depth = roundHalfUp(std::log((m + 1) / 2.0) / std::log((double) linksPerMirror));
  return currentRelativeTTW - (100 - 100 * (depth - 1) / (maxTTW - 1));
}

int Effect::getLatency() const {
  const Network* network = action.getNetwork();
  const Properties& props = network->getProps();
  int minStartup = props.getInt("startup_time_min");
  int maxStartup = props.getInt("startup_time_max");
  int minReady = props.getInt("ready_time_min");
  int maxReady = props.getInt("ready_time_max");
  int minActive = props.getInt("link_activation_time_min");
  int maxActive = props.getInt("link_activation_time_max");
  double avgStartup = (minStartup + maxStartup) / 2.0;
  double avgReady = (minReady + maxReady) / 2.0;
  double avgActive = (minActive + maxActive) / 2.0;
  int time = 0;
  switch (action.getType()) {
    case ActionType::MIRROR_CHANGE:
      // shrinking is immediate, mirrors are shut down on the spot
      if (static_cast<const MirrorChange&>(action).getNewMirrors()
              > network->getNumTargetMirrors())
        time = roundHalfUp(avgStartup + avgReady + avgActive);
      break;
    case ActionType::TARGET_LINK_CHANGE:
    case ActionType::TOPOLOGY_CHANGE:
      time = roundHalfUp(avgActive);
      break;
  }
  return std::max(0, time);
}
