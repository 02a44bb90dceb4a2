#include "BalancedTreeTopologyStrategy.hpp"
#include "TreeRules.hpp"

NodeId BalancedTreeTopologyStrategy::findInsertionPoint(
        const StructureGraph& graph, NodeId head) const {
  typedef std::map<NodeId, int> DepthMap;
  DepthMap depths = TreeRules::getDepths(graph, getStructureType(), head);
  NodeId best = NO_NODE;
  int bestDepth = 0;
  int bestChildren = 0;
  BOOST_FOREACH(const DepthMap::value_type& d, depths) {
    if (!graph.canAcceptMoreChildren(d.first))
      continue;
    int children = graph.getNumChildren(d.first);
    if (best == NO_NODE || d.second < bestDepth
            || (d.second == bestDepth && children < bestChildren)) {
      best = d.first;
      bestDepth = d.second;
      bestChildren = children;
    }
  }
  return best;
}
