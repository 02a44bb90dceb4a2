#include "LineRules.hpp"
#include "NodeKindRules.hpp"
#include "MirrorNode.hpp"

const int LineRules::MIN_LINE_SIZE;

bool LineRules::isValidPlannedStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  if ((int) nodes.size() < MIN_LINE_SIZE || nodes.count(head) == 0
          || !graph.isHead(head, type))
    return false;
  if (GenericRules::countHeads(graph, nodes, type) != 1)
    return false;
  if (!graph.isConnected(nodes, type, head) || graph.hasCycle(nodes, type, head))
    return false;
  int terminals = 0;
  BOOST_FOREACH(NodeId n, nodes) {
    int degree = graph.getConnectivityDegree(n, type, head);
    if (degree == 1) {
      terminals++;
    } else if (degree != 2 || graph.getChildren(n, type, head).size() != 1) {
      return false;
    }
  }
  return terminals == 2;
}

bool LineRules::isValidStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  return MirrorNode::isValidMirrorStructure(graph, nodes, type, head)
          && isValidPlannedStructure(graph, nodes, type, head)
          && GenericRules::hasEdgeLink(graph, nodes, head);
}

bool LineRules::canBeRemovedFromStructure(const StructureGraph& graph,
        NodeId id, StructureType type, NodeId head) {
  if (id == head)
    return false;
  NodeSet nodes = graph.getAllNodesInStructure(head, type, head);
  return nodes.count(id) > 0 && (int) nodes.size() - 1 >= MIN_LINE_SIZE
          && getTail(graph, type, head) == id;
}

int LineRules::getPosition(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head) {
  NodeVec path = graph.getPathFromHead(id, type, head);
  return path.empty() ? -1 : (int) path.size() - 1;
}

NodeId LineRules::getTail(const StructureGraph& graph, StructureType type,
        NodeId head) {
  if (!graph.hasNode(head))
    return NO_NODE;
  NodeSet visited;
  NodeId current = head;
  while (visited.insert(current).second) {
    NodeVec children = graph.getChildren(current, type, head);
    if (children.empty())
      break;
    current = children.front();
  }
  return current;
}
