#include "DepthLimitTreeTopologyStrategy.hpp"
#include "TreeRules.hpp"

DepthLimitTreeTopologyStrategy::DepthLimitTreeTopologyStrategy(int maxDepth,
        bool preferDepthOverBreadth) {
  this->maxDepth = std::max(1, maxDepth);
  this->preferDepthOverBreadth = preferDepthOverBreadth;
}

NodeId DepthLimitTreeTopologyStrategy::findInsertionPoint(
        const StructureGraph& graph, NodeId head) const {
  typedef std::map<NodeId, int> DepthMap;
  DepthMap depths = TreeRules::getDepths(graph, getStructureType(), head);
  NodeId best = NO_NODE;
  int bestDepth = 0;
  int bestChildren = 0;
  BOOST_FOREACH(const DepthMap::value_type& d, depths) {
    if (d.second >= maxDepth || !graph.canAcceptMoreChildren(d.first))
      continue;
    int children = graph.getNumChildren(d.first);
    bool better;
    if (best == NO_NODE)
      better = true;
    else if (d.second != bestDepth)
      better = preferDepthOverBreadth ? d.second > bestDepth : d.second < bestDepth;
    else
      better = children < bestChildren;
    if (better) {
      best = d.first;
      bestDepth = d.second;
      bestChildren = children;
    }
  }
  return best;
}
