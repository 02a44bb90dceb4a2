#include "StarTopologyStrategy.hpp"

int StarTopologyStrategy::buildPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  NodeSet unique(ids.begin(), ids.end());
  if ((int) unique.size() < StarRules::MIN_STAR_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "StarTopologyStrategy::buildPlannedStructure() - "
            "cannot build a star of " << unique.size() << " nodes, at least "
            << StarRules::MIN_STAR_SIZE << " are needed";
    return 0;
  }
  NodeId center = ids.front();
  addPlannedNode(graph, center);
  graph.setHead(center, getStructureType());
  head = center;
  NodeVec rest(ids.begin() + 1, ids.end());
  return 1 + growPlannedStructure(graph, head, rest);
}

int StarTopologyStrategy::growPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  int added = 0;
  BOOST_FOREACH(NodeId id, ids) {
    if (!addPlannedNode(graph, id))
      continue;
    connect(graph, head, id, head);
    added++;
  }
  return added;
}

int StarTopologyStrategy::shrinkPlannedStructure(StructureGraph& graph,
        NodeId& head, int count) const {
  NodeVec leaves = StarRules::getLeaves(graph, getStructureType(), head);
  int size = graph.getAllNodesInStructure(head, getStructureType(), head).size();
  int removable = std::min((int) leaves.size(),
          std::max(0, size - (int) StarRules::MIN_STAR_SIZE));
  if (count > removable) {
    BOOST_LOG_TRIVIAL(debug) << "StarTopologyStrategy::shrinkPlannedStructure() - "
            "request to remove " << count << " nodes clamped to " << removable;
    count = removable;
  }
  // the most recent leaves go first
  for (int i = 0; i < count; i++) {
    removePlannedNode(graph, leaves[leaves.size() - 1 - i]);
  }
  return count;
}
