#include "TreeTopologyStrategy.hpp"
#include "TreeRules.hpp"
#include <deque>

TreeTopologyStrategy::TreeTopologyStrategy(int childrenPerParent) {
  this->childrenPerParent = std::max(1, childrenPerParent);
}

int TreeTopologyStrategy::buildPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  if (ids.empty())
    return 0;
  NodeId root = ids.front();
  addPlannedNode(graph, root);
  graph.setHead(root, getStructureType());
  head = root;
  NodeVec rest(ids.begin() + 1, ids.end());
  return 1 + growPlannedStructure(graph, head, rest);
}

int TreeTopologyStrategy::growPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  int added = 0;
  BOOST_FOREACH(NodeId id, ids) {
    if (graph.hasNode(id))
      continue;
    NodeId parent = findInsertionPoint(graph, head);
    if (parent == NO_NODE) {
      BOOST_LOG_TRIVIAL(debug) << "TreeTopologyStrategy::growPlannedStructure() - "
              << getName() << " is full, " << ids.size() - added
              << " nodes left out";
      break;
    }
    addPlannedNode(graph, id);
    connect(graph, parent, id, head);
    BOOST_LOG_TRIVIAL(trace) << "TreeTopologyStrategy::growPlannedStructure() - "
            << id << " attached below " << parent;
    added++;
  }
  return added;
}

int TreeTopologyStrategy::shrinkPlannedStructure(StructureGraph& graph,
        NodeId& head, int count) const {
  int size = graph.getAllNodesInStructure(head, getStructureType(), head).size();
  if (count > size - 1) {
    BOOST_LOG_TRIVIAL(debug) << "TreeTopologyStrategy::shrinkPlannedStructure() - "
            "request to remove " << count << " of " << size
            << " nodes clamped to " << size - 1;
    count = size - 1;
  }
  int removed = 0;
  while (removed < count) {
    NodeId victim = selectNodeToRemove(graph, head);
    if (victim == NO_NODE)
      break;
    removePlannedNode(graph, victim);
    BOOST_LOG_TRIVIAL(trace) << "TreeTopologyStrategy::shrinkPlannedStructure() - "
            "removed leaf " << victim;
    removed++;
  }
  return removed;
}

NodeId TreeTopologyStrategy::findInsertionPoint(const StructureGraph& graph,
        NodeId head) const {
  std::deque<NodeId> queue;
  NodeSet visited;
  queue.push_back(head);
  while (!queue.empty()) {
    NodeId current = queue.front();
    queue.pop_front();
    if (!visited.insert(current).second)
      continue;
    if (graph.canAcceptMoreChildren(current))
      return current;
    BOOST_FOREACH(NodeId c, graph.getChildren(current, getStructureType(), head)) {
      queue.push_back(c);
    }
  }
  return NO_NODE;
}

NodeId TreeTopologyStrategy::selectNodeToRemove(const StructureGraph& graph,
        NodeId head) const {
  typedef std::map<NodeId, int> DepthMap;
  DepthMap depths = TreeRules::getDepths(graph, getStructureType(), head);
  NodeId victim = NO_NODE;
  int victimDepth = -1;
  BOOST_FOREACH(const DepthMap::value_type& d, depths) {
    if (d.first == head || !graph.isLeaf(d.first, getStructureType(), head))
      continue;
    // ids are visited in increasing order, so >= keeps the highest on ties
    if (d.second >= victimDepth) {
      victim = d.first;
      victimDepth = d.second;
    }
  }
  return victim;
}
