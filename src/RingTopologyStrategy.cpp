#include "RingTopologyStrategy.hpp"

RingTopologyStrategy::RingTopologyStrategy(int minRingSize) {
  this->minRingSize = std::max((int) RingRules::MIN_RING_SIZE, minRingSize);
}

int RingTopologyStrategy::buildPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  NodeSet unique(ids.begin(), ids.end());
  if ((int) unique.size() < minRingSize) {
    BOOST_LOG_TRIVIAL(warning) << "RingTopologyStrategy::buildPlannedStructure() - "
            "cannot build a ring of " << unique.size() << " nodes, at least "
            << minRingSize << " are needed";
    return 0;
  }
  NodeVec order;
  BOOST_FOREACH(NodeId id, ids) {
    if (addPlannedNode(graph, id))
      order.push_back(id);
  }
  head = order.front();
  graph.setHead(head, getStructureType());
  for (unsigned int i = 0; i < order.size(); i++) {
    connect(graph, order[i], order[(i + 1) % order.size()], head);
  }
  return order.size();
}

int RingTopologyStrategy::growPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  int added = 0;
  NodeId anchor = head;
  BOOST_FOREACH(NodeId id, ids) {
    if (graph.hasNode(id))
      continue;
    NodeId next = RingRules::getNext(graph, anchor, getStructureType(), head);
    if (next == NO_NODE) {
      BOOST_LOG_TRIVIAL(error) << "RingTopologyStrategy::growPlannedStructure() - "
              << anchor << " has no successor, the ring is broken";
      break;
    }
    disconnect(graph, anchor, next);
    addPlannedNode(graph, id);
    connect(graph, anchor, id, head);
    connect(graph, id, next, head);
    anchor = id;
    added++;
  }
  return added;
}

int RingTopologyStrategy::shrinkPlannedStructure(StructureGraph& graph,
        NodeId& head, int count) const {
  int size = RingRules::getRingSize(graph, getStructureType(), head);
  int removable = std::max(0, size - minRingSize);
  if (count > removable) {
    BOOST_LOG_TRIVIAL(debug) << "RingTopologyStrategy::shrinkPlannedStructure() - "
            "request to remove " << count << " nodes clamped to " << removable;
    count = removable;
  }
  int removed = 0;
  while (removed < count) {
    NodeId tail = RingRules::getPrevious(graph, head, getStructureType(), head);
    if (tail == NO_NODE || tail == head)
      break;
    NodeId previous = RingRules::getPrevious(graph, tail, getStructureType(), head);
    removePlannedNode(graph, tail);
    connect(graph, previous, head, head);
    removed++;
  }
  return removed;
}
