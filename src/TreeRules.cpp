#include "TreeRules.hpp"
#include "NodeKindRules.hpp"
#include "MirrorNode.hpp"
#include <deque>

bool TreeRules::isValidPlannedStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  if (nodes.count(head) == 0 || !graph.isHead(head, type))
    return false;
  if (GenericRules::countHeads(graph, nodes, type) != 1)
    return false;
  if (!graph.isConnected(nodes, type, head) || graph.hasCycle(nodes, type, head))
    return false;
  if (graph.getNumStructureEdges(nodes, type, head) != (int) nodes.size() - 1)
    return false;
  BOOST_FOREACH(NodeId n, nodes) {
    NodeId parent = graph.getParent(n, type, head);
    if (n == head) {
      if (parent != NO_NODE && nodes.count(parent) > 0)
        return false;
    } else if (parent == NO_NODE || nodes.count(parent) == 0) {
      return false;
    }
  }
  return true;
}

bool TreeRules::isValidStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  return MirrorNode::isValidMirrorStructure(graph, nodes, type, head)
          && isValidPlannedStructure(graph, nodes, type, head)
          && GenericRules::hasEdgeLink(graph, nodes, head);
}

bool TreeRules::canBeRemovedFromStructure(const StructureGraph& graph,
        NodeId id, StructureType type, NodeId head) {
  if (id == head)
    return false;
  NodeSet nodes = graph.getAllNodesInStructure(head, type, head);
  return nodes.count(id) > 0 && graph.isLeaf(id, type, head);
}

int TreeRules::getDepth(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head) {
  NodeVec path = graph.getPathFromHead(id, type, head);
  return path.empty() ? -1 : (int) path.size() - 1;
}

std::map<NodeId, int> TreeRules::getDepths(const StructureGraph& graph,
        StructureType type, NodeId head) {
  std::map<NodeId, int> depths;
  if (!graph.hasNode(head))
    return depths;
  std::deque<NodeId> queue;
  queue.push_back(head);
  depths[head] = 0;
  while (!queue.empty()) {
    NodeId current = queue.front();
    queue.pop_front();
    BOOST_FOREACH(NodeId c, graph.getChildren(current, type, head)) {
      if (depths.find(c) == depths.end()) {
        depths[c] = depths[current] + 1;
        queue.push_back(c);
      }
    }
  }
  return depths;
}

int TreeRules::getMaxDepth(const StructureGraph& graph, StructureType type,
        NodeId head) {
  int maxDepth = -1;
  typedef std::map<NodeId, int> DepthMap;
  DepthMap depths = getDepths(graph, type, head);
  BOOST_FOREACH(const DepthMap::value_type& d, depths) {
    maxDepth = std::max(maxDepth, d.second);
  }
  return maxDepth;
}
