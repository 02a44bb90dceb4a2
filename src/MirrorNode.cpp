#include "MirrorNode.hpp"

StructureType structureTypeOf(NodeKind kind) {
  switch (kind) {
    case NodeKind::TREE:
      return StructureType::TREE;
    case NodeKind::RING:
      return StructureType::RING;
    case NodeKind::LINE:
      return StructureType::LINE;
    case NodeKind::STAR:
      return StructureType::STAR;
    default:
      return StructureType::DEFAULT;
  }
}

MirrorNode::MirrorNode(const StructureGraph& graph, NodeId id) :
    graph(graph), id(id), type(structureTypeOf(graph.getKind(id))) {
}

MirrorNode::MirrorNode(const StructureGraph& graph, NodeId id,
        StructureType type) : graph(graph), id(id), type(type) {
}

int MirrorNode::getNumPlannedLinks() const {
  return graph.getConnectivityDegree(id, type, getHead());
}

int MirrorNode::getNumImplementedLinks() const {
  Mirror* mirror = getMirror();
  return mirror == nullptr ? 0 : mirror->getNumLinks();
}

int MirrorNode::getNumPendingLinks() const {
  return std::max(0, getNumPlannedLinks() - getNumImplementedLinks());
}

bool MirrorNode::isLinkedWith(const MirrorNode& other) const {
  bool planned = graph.hasEdge(id, other.getId())
          || other.graph.hasEdge(other.getId(), id);
  if (!planned)
    return false;
  Mirror* mine = getMirror();
  Mirror* theirs = other.getMirror();
  if (mine == nullptr || theirs == nullptr)
    return false;
  return mine->isLinkedWith(theirs);
}

MirrorVec MirrorNode::getMirrorsOfEndpoints() const {
  NodeId head = getHead();
  return getMirrorsOf(graph, graph.getEndpointsOfStructure(id, type, head));
}

MirrorVec MirrorNode::getMirrorsOf(const StructureGraph& graph,
        const NodeSet& nodes) {
  MirrorVec mirrors;
  BOOST_FOREACH(NodeId n, nodes) {
    Mirror* mirror = graph.getMirror(n);
    if (mirror != nullptr)
      mirrors.push_back(mirror);
  }
  return mirrors;
}

LinkSet MirrorNode::getLinksOf(const StructureGraph& graph,
        const NodeSet& nodes) {
  MirrorVec mirrors = getMirrorsOf(graph, nodes);
  std::set<const Mirror*> members(mirrors.begin(), mirrors.end());
  LinkSet internal;
  BOOST_FOREACH(Mirror* mirror, mirrors) {
    BOOST_FOREACH(Link* link, mirror->getLinks()) {
      if (!link->isClosed() && members.count(link->getOther(mirror)) > 0)
        internal.insert(link);
    }
  }
  return internal;
}

LinkSet MirrorNode::getEdgeLinksOf(const StructureGraph& graph,
        const NodeSet& nodes) {
  MirrorVec mirrors = getMirrorsOf(graph, nodes);
  std::set<const Mirror*> members(mirrors.begin(), mirrors.end());
  LinkSet edge;
  BOOST_FOREACH(Mirror* mirror, mirrors) {
    BOOST_FOREACH(Link* link, mirror->getLinks()) {
      if (!link->isClosed() && members.count(link->getOther(mirror)) == 0)
        edge.insert(link);
    }
  }
  return edge;
}

bool MirrorNode::isValidMirrorStructure(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head) {
  if (nodes.empty() || !graph.isConnected(nodes, type, head))
    return false;
  std::set<const Mirror*> members;
  BOOST_FOREACH(NodeId n, nodes) {
    Mirror* mirror = graph.getMirror(n);
    if (mirror == nullptr || !mirror->isUsable()) {
      BOOST_LOG_TRIVIAL(trace) << "MirrorNode::isValidMirrorStructure() - node "
              << n << " has no usable mirror";
      return false;
    }
    members.insert(mirror);
  }
  BOOST_FOREACH(NodeId n, nodes) {
    Mirror* mirror = graph.getMirror(n);
    int internalLinks = 0;
    BOOST_FOREACH(Link* link, mirror->getLinks()) {
      if (link->getSource() == link->getTarget())
        return false;
      if (!link->isClosed() && members.count(link->getOther(mirror)) > 0)
        internalLinks++;
    }
    if (nodes.size() > 1 && internalLinks == 0)
      return false;
    BOOST_FOREACH(NodeId c, graph.getChildren(n, type, head)) {
      if (nodes.count(c) > 0 && !mirror->isLinkedWith(graph.getMirror(c))) {
        BOOST_LOG_TRIVIAL(trace) << "MirrorNode::isValidMirrorStructure() - "
                "planned link " << n << "-" << c << " not implemented";
        return false;
      }
    }
  }
  return true;
}
