#include "NodeKindRules.hpp"
#include "MirrorNode.hpp"
#include "TreeRules.hpp"
#include "RingRules.hpp"
#include "LineRules.hpp"
#include "StarRules.hpp"

namespace {

const NodeKindRules genericRules = {NodeKind::GENERIC, 1,
  &GenericRules::isValidPlannedStructure, &GenericRules::isValidStructure,
  &GenericRules::canBeRemovedFromStructure};
const NodeKindRules treeRules = {NodeKind::TREE, 1,
  &TreeRules::isValidPlannedStructure, &TreeRules::isValidStructure,
  &TreeRules::canBeRemovedFromStructure};
const NodeKindRules ringRules = {NodeKind::RING, RingRules::MIN_RING_SIZE,
  &RingRules::isValidPlannedStructure, &RingRules::isValidStructure,
  &RingRules::canBeRemovedFromStructure};
const NodeKindRules lineRules = {NodeKind::LINE, LineRules::MIN_LINE_SIZE,
  &LineRules::isValidPlannedStructure, &LineRules::isValidStructure,
  &LineRules::canBeRemovedFromStructure};
const NodeKindRules starRules = {NodeKind::STAR, StarRules::MIN_STAR_SIZE,
  &StarRules::isValidPlannedStructure, &StarRules::isValidStructure,
  &StarRules::canBeRemovedFromStructure};

}

const NodeKindRules& getNodeKindRules(NodeKind kind) {
  switch (kind) {
    case NodeKind::TREE:
      return treeRules;
    case NodeKind::RING:
      return ringRules;
    case NodeKind::LINE:
      return lineRules;
    case NodeKind::STAR:
      return starRules;
    default:
      return genericRules;
  }
}

bool isValidPlannedStructure(const StructureGraph& graph, StructureType type,
        NodeId head) {
  if (!graph.hasNode(head))
    return false;
  NodeSet nodes = graph.getAllNodesInStructure(head, type, head);
  return getNodeKindRules(graph.getKind(head)).isValidPlannedStructure(graph,
          nodes, type, head);
}

bool isValidStructure(const StructureGraph& graph, StructureType type,
        NodeId head) {
  if (!graph.hasNode(head))
    return false;
  NodeSet nodes = graph.getAllNodesInStructure(head, type, head);
  return getNodeKindRules(graph.getKind(head)).isValidStructure(graph, nodes,
          type, head);
}

bool canBeRemovedFromStructure(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head) {
  if (!graph.hasNode(head))
    return false;
  return getNodeKindRules(graph.getKind(head)).canBeRemovedFromStructure(graph,
          id, type, head);
}

int GenericRules::countHeads(const StructureGraph& graph, const NodeSet& nodes,
        StructureType type) {
  int heads = 0;
  BOOST_FOREACH(NodeId n, nodes) {
    if (graph.isHead(n, type))
      heads++;
  }
  return heads;
}

bool GenericRules::isValidPlannedStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  if (nodes.count(head) == 0 || !graph.isHead(head, type))
    return false;
  return graph.isConnected(nodes, type, head);
}

bool GenericRules::isValidStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  return MirrorNode::isValidMirrorStructure(graph, nodes, type, head)
          && isValidPlannedStructure(graph, nodes, type, head);
}

bool GenericRules::canBeRemovedFromStructure(const StructureGraph& graph,
        NodeId id, StructureType type, NodeId head) {
  NodeSet nodes = graph.getAllNodesInStructure(head, type, head);
  return id != head && nodes.count(id) > 0 && nodes.size() > 1;
}

bool GenericRules::hasEdgeLink(const StructureGraph& graph,
        const NodeSet& nodes, NodeId head) {
  Mirror* headMirror = graph.getMirror(head);
  if (headMirror == nullptr)
    return false;
  MirrorVec mirrors = MirrorNode::getMirrorsOf(graph, nodes);
  std::set<const Mirror*> members(mirrors.begin(), mirrors.end());
  BOOST_FOREACH(Link* link, headMirror->getLinks()) {
    if (!link->isClosed() && members.count(link->getOther(headMirror)) == 0)
      return true;
  }
  return false;
}
