#include "FullyConnectedTopology.hpp"

int FullyConnectedTopology::buildPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  if (ids.empty())
    return 0;
  NodeId first = ids.front();
  addPlannedNode(graph, first);
  graph.setHead(first, getStructureType());
  head = first;
  NodeVec rest(ids.begin() + 1, ids.end());
  return 1 + growPlannedStructure(graph, head, rest);
}

int FullyConnectedTopology::growPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  int added = 0;
  BOOST_FOREACH(NodeId id, ids) {
    NodeSet members = graph.getAllNodesInStructure(head, getStructureType(), head);
    if (!addPlannedNode(graph, id))
      continue;
    BOOST_FOREACH(NodeId other, members) {
      connect(graph, other, id, head);
    }
    added++;
  }
  return added;
}

int FullyConnectedTopology::shrinkPlannedStructure(StructureGraph& graph,
        NodeId& head, int count) const {
  NodeSet members = graph.getAllNodesInStructure(head, getStructureType(), head);
  int removable = std::max(0, (int) members.size() - 1);
  if (count > removable) {
    BOOST_LOG_TRIVIAL(debug) << "FullyConnectedTopology::shrinkPlannedStructure() - "
            "request to remove " << count << " nodes clamped to " << removable;
    count = removable;
  }
  int removed = 0;
  for (NodeSet::reverse_iterator it = members.rbegin();
          it != members.rend() && removed < count; it++) {
    if (*it == head)
      continue;
    removePlannedNode(graph, *it);
    removed++;
  }
  return removed;
}
