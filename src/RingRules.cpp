#include "RingRules.hpp"
#include "NodeKindRules.hpp"
#include "MirrorNode.hpp"

const int RingRules::MIN_RING_SIZE;

bool RingRules::isValidPlannedStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  if ((int) nodes.size() < MIN_RING_SIZE || nodes.count(head) == 0
          || !graph.isHead(head, type))
    return false;
  if (GenericRules::countHeads(graph, nodes, type) != 1)
    return false;
  if (!graph.hasClosedCycle(nodes, type, head))
    return false;
  BOOST_FOREACH(NodeId n, nodes) {
    if (graph.getChildren(n, type, head).size() != 1
            || graph.getConnectivityDegree(n, type, head) != 2)
      return false;
  }
  return true;
}

bool RingRules::isValidStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  return MirrorNode::isValidMirrorStructure(graph, nodes, type, head)
          && isValidPlannedStructure(graph, nodes, type, head)
          && GenericRules::hasEdgeLink(graph, nodes, head);
}

bool RingRules::canBeRemovedFromStructure(const StructureGraph& graph,
        NodeId id, StructureType type, NodeId head) {
  if (id == head)
    return false;
  NodeSet nodes = graph.getAllNodesInStructure(head, type, head);
  return nodes.count(id) > 0 && (int) nodes.size() - 1 >= MIN_RING_SIZE;
}

NodeId RingRules::getNext(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head) {
  NodeVec children = graph.getChildren(id, type, head);
  return children.empty() ? NO_NODE : children.front();
}

NodeId RingRules::getPrevious(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head) {
  return graph.getParent(id, type, head);
}

int RingRules::getPosition(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head) {
  NodeSet visited;
  NodeId current = head;
  int position = 0;
  while (current != NO_NODE && visited.insert(current).second) {
    if (current == id)
      return position;
    current = getNext(graph, current, type, head);
    position++;
  }
  return -1;
}
