#include "StructureGraph.hpp"
#include <deque>
#include <stack>

const char* structureTypeName(StructureType type) {
  switch (type) {
    case StructureType::DEFAULT:
      return "default";
    case StructureType::MIRROR:
      return "mirror";
    case StructureType::TREE:
      return "tree";
    case StructureType::RING:
      return "ring";
    case StructureType::LINE:
      return "line";
    case StructureType::STAR:
      return "star";
    case StructureType::FULLY_CONNECTED:
      return "fully-connected";
    case StructureType::N_CONNECTED:
      return "n-connected";
  }
  return "unknown";
}

const char* nodeKindName(NodeKind kind) {
  switch (kind) {
    case NodeKind::GENERIC:
      return "generic";
    case NodeKind::TREE:
      return "tree";
    case NodeKind::RING:
      return "ring";
    case NodeKind::LINE:
      return "line";
    case NodeKind::STAR:
      return "star";
  }
  return "unknown";
}

StructureGraph::StructureGraph(const StructureGraph& other) : graph(other.graph) {
  rebuildVertexMap();
}

StructureGraph& StructureGraph::operator=(const StructureGraph& other) {
  if (this != &other) {
    graph = other.graph;
    rebuildVertexMap();
  }
  return *this;
}

void StructureGraph::rebuildVertexMap() {
  vertexMap.clear();
  SVertexIterator vIt, vEnd;
  for (boost::tie(vIt, vEnd) = boost::vertices(graph); vIt != vEnd; ++vIt) {
    vertexMap[graph[*vIt].id] = *vIt;
  }
}

bool StructureGraph::findVertex(NodeId id, SVertex& v) const {
  SVertexMap::const_iterator it = vertexMap.find(id);
  if (it == vertexMap.end())
    return false;
  v = it->second;
  return true;
}

bool StructureGraph::belongsTo(const StructureEdge& edge, StructureType type,
        NodeId head) {
  HeadIdMap::const_iterator it = edge.memberships.find(type);
  if (it == edge.memberships.end())
    return false;
  return head == NO_NODE || it->second == head;
}

void StructureGraph::refreshNodeTypes(SVertex v) {
  TypeSet types = graph[v].headTypes;
  SOutEdgeIterator oIt, oEnd;
  for (boost::tie(oIt, oEnd) = boost::out_edges(v, graph); oIt != oEnd; ++oIt) {
    BOOST_FOREACH(const HeadIdMap::value_type& m, graph[*oIt].memberships) {
      types.insert(m.first);
    }
  }
  SInEdgeIterator iIt, iEnd;
  for (boost::tie(iIt, iEnd) = boost::in_edges(v, graph); iIt != iEnd; ++iIt) {
    BOOST_FOREACH(const HeadIdMap::value_type& m, graph[*iIt].memberships) {
      types.insert(m.first);
    }
  }
  graph[v].nodeTypes = types;
}

bool StructureGraph::addNode(NodeId id, NodeKind kind, int maxChildren) {
  if (hasNode(id)) {
    BOOST_LOG_TRIVIAL(trace) << "StructureGraph::addNode() - node " << id
            << " already present";
    return false;
  }
  StructureVertex vertex;
  vertex.id = id;
  vertex.kind = kind;
  vertex.maxChildren = maxChildren;
  vertex.mirror = nullptr;
  vertexMap[id] = boost::add_vertex(vertex, graph);
  return true;
}

bool StructureGraph::removeNode(NodeId id) {
  SVertex v;
  if (!findVertex(id, v))
    return false;
  NodeVec neighbours = getParents(id);
  NodeVec children = getChildren(id);
  neighbours.insert(neighbours.end(), children.begin(), children.end());
  boost::clear_vertex(v, graph);
  boost::remove_vertex(v, graph);
  vertexMap.erase(id);
  BOOST_FOREACH(NodeId n, neighbours) {
    SVertex nv;
    if (findVertex(n, nv))
      refreshNodeTypes(nv);
  }
  return true;
}

void StructureGraph::clear() {
  graph.clear();
  vertexMap.clear();
}

NodeVec StructureGraph::getNodeIds() const {
  NodeVec ids;
  ids.reserve(vertexMap.size());
  BOOST_FOREACH(const SVertexMap::value_type& entry, vertexMap) {
    ids.push_back(entry.first);
  }
  return ids;
}

NodeKind StructureGraph::getKind(NodeId id) const {
  SVertex v;
  if (!findVertex(id, v))
    return NodeKind::GENERIC;
  return graph[v].kind;
}

void StructureGraph::setKind(NodeId id, NodeKind kind) {
  SVertex v;
  if (findVertex(id, v))
    graph[v].kind = kind;
}

int StructureGraph::getMaxChildren(NodeId id) const {
  SVertex v;
  if (!findVertex(id, v))
    return 0;
  return graph[v].maxChildren;
}

void StructureGraph::setMaxChildren(NodeId id, int maxChildren) {
  SVertex v;
  if (findVertex(id, v))
    graph[v].maxChildren = maxChildren;
}

Mirror* StructureGraph::getMirror(NodeId id) const {
  SVertex v;
  if (!findVertex(id, v))
    return nullptr;
  return graph[v].mirror;
}

void StructureGraph::setMirror(NodeId id, Mirror* mirror) {
  SVertex v;
  if (findVertex(id, v))
    graph[v].mirror = mirror;
}

TypeSet StructureGraph::getNodeTypes(NodeId id) const {
  SVertex v;
  if (!findVertex(id, v))
    return TypeSet();
  return graph[v].nodeTypes;
}

bool StructureGraph::isHead(NodeId id, StructureType type) const {
  SVertex v;
  if (!findVertex(id, v))
    return false;
  return graph[v].headTypes.count(type) > 0;
}

void StructureGraph::setHead(NodeId id, StructureType type, bool head) {
  SVertex v;
  if (!findVertex(id, v))
    return;
  if (head)
    graph[v].headTypes.insert(type);
  else
    graph[v].headTypes.erase(type);
  refreshNodeTypes(v);
}

bool StructureGraph::addChild(NodeId parent, NodeId child, const TypeSet& types,
        const HeadIdMap& headIds) {
  SVertex p, c;
  if (types.empty() || parent == child || !findVertex(parent, p)
          || !findVertex(child, c))
    return false;
  std::pair<SEdge, bool> existing = boost::edge(p, c, graph);
  if (existing.second) {
    HeadIdMap& memberships = graph[existing.first].memberships;
    bool merged = false;
    BOOST_FOREACH(StructureType type, types) {
      if (memberships.find(type) == memberships.end()) {
        HeadIdMap::const_iterator h = headIds.find(type);
        memberships[type] = (h == headIds.end()) ? NO_NODE : h->second;
        merged = true;
      }
    }
    if (merged) {
      refreshNodeTypes(p);
      refreshNodeTypes(c);
    } else {
      BOOST_LOG_TRIVIAL(trace) << "StructureGraph::addChild() - " << child
              << " is already a child of " << parent;
    }
    return merged;
  }
  if (!canAcceptMoreChildren(parent)) {
    BOOST_LOG_TRIVIAL(trace) << "StructureGraph::addChild() - " << parent
            << " cannot accept more than " << graph[p].maxChildren << " children";
    return false;
  }
  SEdge e = boost::add_edge(p, c, graph).first;
  BOOST_FOREACH(StructureType type, types) {
    HeadIdMap::const_iterator h = headIds.find(type);
    graph[e].memberships[type] = (h == headIds.end()) ? NO_NODE : h->second;
  }
  refreshNodeTypes(p);
  refreshNodeTypes(c);
  return true;
}

bool StructureGraph::addChild(NodeId parent, NodeId child, StructureType type,
        NodeId head) {
  TypeSet types;
  types.insert(type);
  HeadIdMap headIds;
  headIds[type] = head;
  return addChild(parent, child, types, headIds);
}

bool StructureGraph::removeChild(NodeId parent, NodeId child,
        const TypeSet& types) {
  SVertex p, c;
  if (!findVertex(parent, p) || !findVertex(child, c))
    return false;
  std::pair<SEdge, bool> existing = boost::edge(p, c, graph);
  if (!existing.second)
    return false;
  HeadIdMap& memberships = graph[existing.first].memberships;
  size_t erased = 0;
  BOOST_FOREACH(StructureType type, types) {
    erased += memberships.erase(type);
  }
  if (memberships.empty())
    boost::remove_edge(p, c, graph);
  refreshNodeTypes(p);
  refreshNodeTypes(c);
  return erased > 0;
}

bool StructureGraph::removeChild(NodeId parent, NodeId child) {
  SVertex p, c;
  if (!findVertex(parent, p) || !findVertex(child, c))
    return false;
  if (!boost::edge(p, c, graph).second)
    return false;
  boost::remove_edge(p, c, graph);
  refreshNodeTypes(p);
  refreshNodeTypes(c);
  return true;
}

bool StructureGraph::hasEdge(NodeId parent, NodeId child) const {
  SVertex p, c;
  if (!findVertex(parent, p) || !findVertex(child, c))
    return false;
  return boost::edge(p, c, graph).second;
}

HeadIdMap StructureGraph::getMemberships(NodeId parent, NodeId child) const {
  SVertex p, c;
  if (!findVertex(parent, p) || !findVertex(child, c))
    return HeadIdMap();
  std::pair<SEdge, bool> existing = boost::edge(p, c, graph);
  if (!existing.second)
    return HeadIdMap();
  return graph[existing.first].memberships;
}

NodeVec StructureGraph::getChildren(NodeId id) const {
  NodeVec children;
  SVertex v;
  if (!findVertex(id, v))
    return children;
  SOutEdgeIterator oIt, oEnd;
  for (boost::tie(oIt, oEnd) = boost::out_edges(v, graph); oIt != oEnd; ++oIt) {
    children.push_back(graph[boost::target(*oIt, graph)].id);
  }
  return children;
}

NodeVec StructureGraph::getChildren(NodeId id, StructureType type,
        NodeId head) const {
  NodeVec children;
  SVertex v;
  if (!findVertex(id, v))
    return children;
  SOutEdgeIterator oIt, oEnd;
  for (boost::tie(oIt, oEnd) = boost::out_edges(v, graph); oIt != oEnd; ++oIt) {
    if (belongsTo(graph[*oIt], type, head))
      children.push_back(graph[boost::target(*oIt, graph)].id);
  }
  return children;
}

NodeVec StructureGraph::getParents(NodeId id) const {
  NodeVec parents;
  SVertex v;
  if (!findVertex(id, v))
    return parents;
  SInEdgeIterator iIt, iEnd;
  for (boost::tie(iIt, iEnd) = boost::in_edges(v, graph); iIt != iEnd; ++iIt) {
    parents.push_back(graph[boost::source(*iIt, graph)].id);
  }
  return parents;
}

NodeId StructureGraph::getParent(NodeId id) const {
  NodeVec parents = getParents(id);
  return parents.empty() ? NO_NODE : parents.front();
}

NodeId StructureGraph::getParent(NodeId id, StructureType type,
        NodeId head) const {
  SVertex v;
  if (!findVertex(id, v))
    return NO_NODE;
  SInEdgeIterator iIt, iEnd;
  for (boost::tie(iIt, iEnd) = boost::in_edges(v, graph); iIt != iEnd; ++iIt) {
    if (belongsTo(graph[*iIt], type, head))
      return graph[boost::source(*iIt, graph)].id;
  }
  return NO_NODE;
}

int StructureGraph::getNumChildren(NodeId id) const {
  SVertex v;
  if (!findVertex(id, v))
    return 0;
  return boost::out_degree(v, graph);
}

bool StructureGraph::canAcceptMoreChildren(NodeId id) const {
  SVertex v;
  if (!findVertex(id, v))
    return false;
  int maxChildren = graph[v].maxChildren;
  return maxChildren < 0 || (int) boost::out_degree(v, graph) < maxChildren;
}

NodeVec StructureGraph::getStructureNeighbours(NodeId id, StructureType type,
        NodeId head) const {
  NodeVec neighbours;
  SVertex v;
  if (!findVertex(id, v))
    return neighbours;
  SInEdgeIterator iIt, iEnd;
  for (boost::tie(iIt, iEnd) = boost::in_edges(v, graph); iIt != iEnd; ++iIt) {
    if (belongsTo(graph[*iIt], type, head))
      neighbours.push_back(graph[boost::source(*iIt, graph)].id);
  }
  SOutEdgeIterator oIt, oEnd;
  for (boost::tie(oIt, oEnd) = boost::out_edges(v, graph); oIt != oEnd; ++oIt) {
    if (belongsTo(graph[*oIt], type, head))
      neighbours.push_back(graph[boost::target(*oIt, graph)].id);
  }
  return neighbours;
}

NodeSet StructureGraph::getAllNodesInStructure(NodeId start, StructureType type,
        NodeId head) const {
  NodeSet result;
  if (!hasNode(start))
    return result;
  if (head == NO_NODE) {
    result.insert(start);
    return result;
  }
  std::stack<NodeId> toVisit;
  toVisit.push(start);
  while (!toVisit.empty()) {
    NodeId current = toVisit.top();
    toVisit.pop();
    if (!result.insert(current).second)
      continue;
    // the head of a nested structure bounds the traversal
    if (current != head && current != start && isHead(current, type))
      continue;
    BOOST_FOREACH(NodeId n, getStructureNeighbours(current, type, head)) {
      if (result.count(n) == 0)
        toVisit.push(n);
    }
  }
  return result;
}

NodeSet StructureGraph::getAllConnectedNodes(NodeId start) const {
  NodeSet result;
  if (!hasNode(start))
    return result;
  std::stack<NodeId> toVisit;
  toVisit.push(start);
  while (!toVisit.empty()) {
    NodeId current = toVisit.top();
    toVisit.pop();
    if (!result.insert(current).second)
      continue;
    BOOST_FOREACH(NodeId n, getParents(current)) {
      toVisit.push(n);
    }
    BOOST_FOREACH(NodeId n, getChildren(current)) {
      toVisit.push(n);
    }
  }
  return result;
}

NodeSet StructureGraph::getEndpointsOfStructure(NodeId start, StructureType type,
        NodeId head) const {
  NodeSet endpoints;
  BOOST_FOREACH(NodeId n, getAllNodesInStructure(start, type, head)) {
    if (isEndpoint(n, type, head))
      endpoints.insert(n);
  }
  return endpoints;
}

int StructureGraph::getConnectivityDegree(NodeId id, StructureType type,
        NodeId head) const {
  return getStructureNeighbours(id, type, head).size();
}

int StructureGraph::getNumStructureEdges(const NodeSet& nodes,
        StructureType type, NodeId head) const {
  int edges = 0;
  BOOST_FOREACH(NodeId n, nodes) {
    BOOST_FOREACH(NodeId c, getChildren(n, type, head)) {
      if (nodes.count(c) > 0)
        edges++;
    }
  }
  return edges;
}

bool StructureGraph::hasClosedCycle(const NodeSet& nodes, StructureType type,
        NodeId head) const {
  if (nodes.empty())
    return false;
  BOOST_FOREACH(NodeId n, nodes) {
    if (getChildren(n, type, head).size() != 1)
      return false;
  }
  NodeId start = *nodes.begin();
  NodeSet visited;
  NodeId current = start;
  while (visited.count(current) == 0) {
    visited.insert(current);
    NodeId child = getChildren(current, type, head).front();
    if (nodes.count(child) == 0)
      return false;
    current = child;
  }
  return current == start && visited.size() == nodes.size();
}

bool StructureGraph::hasCycle(const NodeSet& nodes, StructureType type,
        NodeId head) const {
  // 0 = not visited, 1 = on the current path, 2 = done
  std::map<NodeId, int> color;
  BOOST_FOREACH(NodeId root, nodes) {
    if (color[root] != 0)
      continue;
    std::vector<std::pair<NodeId, size_t> > path;
    path.push_back(std::make_pair(root, (size_t) 0));
    color[root] = 1;
    while (!path.empty()) {
      NodeId current = path.back().first;
      NodeVec children = getChildren(current, type, head);
      if (path.back().second < children.size()) {
        NodeId child = children[path.back().second++];
        if (nodes.count(child) == 0)
          continue;
        if (color[child] == 1)
          return true;
        if (color[child] == 0) {
          color[child] = 1;
          path.push_back(std::make_pair(child, (size_t) 0));
        }
      } else {
        color[current] = 2;
        path.pop_back();
      }
    }
  }
  return false;
}

bool StructureGraph::isConnected(const NodeSet& nodes, StructureType type,
        NodeId head) const {
  if (nodes.empty())
    return false;
  NodeSet reached;
  std::deque<NodeId> queue;
  queue.push_back(*nodes.begin());
  reached.insert(*nodes.begin());
  while (!queue.empty()) {
    NodeId current = queue.front();
    queue.pop_front();
    BOOST_FOREACH(NodeId n, getStructureNeighbours(current, type, head)) {
      if (nodes.count(n) > 0 && reached.insert(n).second)
        queue.push_back(n);
    }
  }
  return reached.size() == nodes.size();
}

NodeId StructureGraph::findHead(NodeId start, StructureType type) const {
  if (!hasNode(start))
    return NO_NODE;
  NodeSet visited;
  NodeId firstRoot = NO_NODE;
  std::stack<NodeId> toVisit;
  toVisit.push(start);
  while (!toVisit.empty()) {
    NodeId current = toVisit.top();
    toVisit.pop();
    if (!visited.insert(current).second)
      continue;
    if (isHead(current, type))
      return current;
    NodeVec parents = getParents(current);
    if (parents.empty() && firstRoot == NO_NODE)
      firstRoot = current;
    for (NodeVec::reverse_iterator it = parents.rbegin(); it != parents.rend(); ++it) {
      if (visited.count(*it) == 0)
        toVisit.push(*it);
    }
  }
  if (firstRoot != NO_NODE)
    return firstRoot;
  return *visited.begin();
}

NodeVec StructureGraph::getPathFromHead(NodeId id, StructureType type,
        NodeId head) const {
  NodeVec path;
  if (!hasNode(id) || !hasNode(head))
    return path;
  NodeSet visited;
  NodeId current = id;
  while (current != NO_NODE && visited.insert(current).second) {
    path.push_back(current);
    if (current == head) {
      std::reverse(path.begin(), path.end());
      return path;
    }
    current = getParent(current, type, head);
  }
  return NodeVec();
}

int StructureGraph::getDescendantCount(NodeId id, StructureType type,
        NodeId head) const {
  if (!hasNode(id))
    return 0;
  NodeSet visited;
  std::stack<NodeId> toVisit;
  toVisit.push(id);
  while (!toVisit.empty()) {
    NodeId current = toVisit.top();
    toVisit.pop();
    if (!visited.insert(current).second)
      continue;
    BOOST_FOREACH(NodeId c, getChildren(current, type, head)) {
      toVisit.push(c);
    }
  }
  return visited.size() - 1;
}

int StructureGraph::getNumPlannedLinksFromStructure(StructureType type,
        NodeId head) const {
  int n = getAllNodesInStructure(head, type, head).size();
  if (n <= 1)
    return 0;
  return type == StructureType::RING ? n : n - 1;
}

LinkPairSet StructureGraph::getLinkPairs() const {
  LinkPairSet pairs;
  SEdgeIterator eIt, eEnd;
  for (boost::tie(eIt, eEnd) = boost::edges(graph); eIt != eEnd; ++eIt) {
    pairs.insert(makeLinkPair(graph[boost::source(*eIt, graph)].id,
            graph[boost::target(*eIt, graph)].id));
  }
  return pairs;
}

LinkPairSet StructureGraph::getLinkPairs(StructureType type, NodeId head) const {
  LinkPairSet pairs;
  SEdgeIterator eIt, eEnd;
  for (boost::tie(eIt, eEnd) = boost::edges(graph); eIt != eEnd; ++eIt) {
    if (belongsTo(graph[*eIt], type, head))
      pairs.insert(makeLinkPair(graph[boost::source(*eIt, graph)].id,
              graph[boost::target(*eIt, graph)].id));
  }
  return pairs;
}
