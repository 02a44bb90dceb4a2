#include "StarRules.hpp"
#include "NodeKindRules.hpp"
#include "MirrorNode.hpp"

const int StarRules::MIN_STAR_SIZE;

bool StarRules::isValidPlannedStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  if (nodes.count(head) == 0 || !graph.isHead(head, type))
    return false;
  if (graph.getChildren(head, type, head).size() < 2)
    return false;
  int heads = 0;
  BOOST_FOREACH(NodeId n, nodes) {
    if (n == head) {
      heads++;
      continue;
    }
    if (graph.getParent(n, type, head) != head)
      return false;
    if (isChildHead(graph, n, type, head))
      continue;
    if (graph.isHead(n, type))
      heads++;
    if (!isStarLeaf(graph, n, type, head))
      return false;
  }
  return heads == 1 && graph.isConnected(nodes, type, head);
}

bool StarRules::isValidStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  return MirrorNode::isValidMirrorStructure(graph, nodes, type, head)
          && isValidPlannedStructure(graph, nodes, type, head)
          && GenericRules::hasEdgeLink(graph, nodes, head);
}

bool StarRules::canBeRemovedFromStructure(const StructureGraph& graph,
        NodeId id, StructureType type, NodeId head) {
  if (id == head)
    return false;
  NodeSet nodes = graph.getAllNodesInStructure(head, type, head);
  return nodes.count(id) > 0 && isStarLeaf(graph, id, type, head)
          && (int) nodes.size() - 1 >= MIN_STAR_SIZE;
}

NodeVec StarRules::getLeaves(const StructureGraph& graph, StructureType type,
        NodeId head) {
  NodeVec leaves;
  BOOST_FOREACH(NodeId c, graph.getChildren(head, type, head)) {
    if (isStarLeaf(graph, c, type, head))
      leaves.push_back(c);
  }
  return leaves;
}

bool StarRules::isChildHead(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head) {
  return id != head && graph.isHead(id, type)
          && graph.getParent(id, type, head) == head;
}

bool StarRules::isStarLeaf(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head) {
  return id != head && !graph.isHead(id, type)
          && graph.getConnectivityDegree(id, type, head) == 1
          && graph.getChildren(id, type, head).empty();
}
