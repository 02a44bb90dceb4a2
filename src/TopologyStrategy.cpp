#include "TopologyStrategy.hpp"
#include "Network.hpp"
#include "Action.hpp"
#include "TreeTopologyStrategy.hpp"
#include "BalancedTreeTopologyStrategy.hpp"
#include "DepthLimitTreeTopologyStrategy.hpp"
#include "RingTopologyStrategy.hpp"
#include "LineTopologyStrategy.hpp"
#include "StarTopologyStrategy.hpp"
#include "FullyConnectedTopology.hpp"
#include "NConnectedTopology.hpp"

const char* topologyKindName(TopologyKind kind) {
  switch (kind) {
    case TopologyKind::TREE:
      return "tree";
    case TopologyKind::BALANCED_TREE:
      return "balanced-tree";
    case TopologyKind::DEPTH_LIMIT_TREE:
      return "depth-limit-tree";
    case TopologyKind::RING:
      return "ring";
    case TopologyKind::LINE:
      return "line";
    case TopologyKind::STAR:
      return "star";
    case TopologyKind::FULLY_CONNECTED:
      return "fully-connected";
    case TopologyKind::N_CONNECTED:
      return "n-connected";
  }
  return "unknown";
}

int TopologyStrategy::getNumTargetLinks(const Network& network) const {
  return computeNumTargetLinks(network.getNumMirrors(),
          network.getNumTargetLinksPerMirror());
}

int TopologyStrategy::getPredictedNumTargetLinks(const Action& action) const {
  const Network* network = action.getNetwork();
  int mirrors = network->getNumMirrors();
  int linksPerMirror = network->getNumTargetLinksPerMirror();
  switch (action.getType()) {
    case ActionType::MIRROR_CHANGE:
      mirrors = static_cast<const MirrorChange&>(action).getNewMirrors();
      break;
    case ActionType::TARGET_LINK_CHANGE:
      linksPerMirror = static_cast<const TargetLinkChange&>(action).getNewLinksPerMirror();
      break;
    case ActionType::TOPOLOGY_CHANGE:
    {
      StrategyPtr newTopology = static_cast<const TopologyChange&>(action).getNewTopology();
      if (newTopology)
        return newTopology->computeNumTargetLinks(mirrors, linksPerMirror);
      break;
    }
  }
  return computeNumTargetLinks(mirrors, linksPerMirror);
}

StrategyPtr makeTopologyStrategy(const std::string& name) {
  if (name == "tree")
    return StrategyPtr(new TreeTopologyStrategy());
  else if (name == "balanced-tree")
    return StrategyPtr(new BalancedTreeTopologyStrategy());
  else if (name == "depth-limit-tree")
    return StrategyPtr(new DepthLimitTreeTopologyStrategy());
  else if (name == "ring")
    return StrategyPtr(new RingTopologyStrategy());
  else if (name == "line")
    return StrategyPtr(new LineTopologyStrategy());
  else if (name == "star")
    return StrategyPtr(new StarTopologyStrategy());
  else if (name == "fully-connected")
    return StrategyPtr(new FullyConnectedTopology());
  else if (name == "n-connected")
    return StrategyPtr(new NConnectedTopology());
  BOOST_LOG_TRIVIAL(warning) << "makeTopologyStrategy() - unknown topology "
          << name;
  return StrategyPtr();
}
