#include "LineTopologyStrategy.hpp"

int LineTopologyStrategy::buildPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  NodeSet unique(ids.begin(), ids.end());
  if ((int) unique.size() < LineRules::MIN_LINE_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "LineTopologyStrategy::buildPlannedStructure() - "
            "cannot build a line of " << unique.size() << " nodes, at least "
            << LineRules::MIN_LINE_SIZE << " are needed";
    return 0;
  }
  NodeId first = ids.front();
  addPlannedNode(graph, first);
  graph.setHead(first, getStructureType());
  head = first;
  NodeVec rest(ids.begin() + 1, ids.end());
  return 1 + growPlannedStructure(graph, head, rest);
}

int LineTopologyStrategy::growPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  int added = 0;
  NodeId tail = LineRules::getTail(graph, getStructureType(), head);
  BOOST_FOREACH(NodeId id, ids) {
    if (!addPlannedNode(graph, id))
      continue;
    connect(graph, tail, id, head);
    tail = id;
    added++;
  }
  return added;
}

int LineTopologyStrategy::shrinkPlannedStructure(StructureGraph& graph,
        NodeId& head, int count) const {
  int size = graph.getAllNodesInStructure(head, getStructureType(), head).size();
  int removable = std::max(0, size - (int) LineRules::MIN_LINE_SIZE);
  if (count > removable) {
    BOOST_LOG_TRIVIAL(debug) << "LineTopologyStrategy::shrinkPlannedStructure() - "
            "request to remove " << count << " nodes clamped to " << removable;
    count = removable;
  }
  int removed = 0;
  while (removed < count) {
    NodeId tail = LineRules::getTail(graph, getStructureType(), head);
    if (tail == head)
      break;
    removePlannedNode(graph, tail);
    removed++;
  }
  return removed;
}
