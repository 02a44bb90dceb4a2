/*
 * File:   StructureGraph.hpp
 * Author: emanuele
 *
 * Created on 11 March 2014, 14:35
 */

#ifndef STRUCTUREGRAPH_HPP
#define	STRUCTUREGRAPH_HPP

#include "MirrorPlan.hpp"
#include "boost/graph/adjacency_list.hpp"
#include "boost/graph/graph_traits.hpp"

// forward declarations to avoid include circles
class Mirror;

/**
 * The topology-kind tag of a structural node. It selects the table of
 * validators and navigators (see NodeKindRules) that applies to the node.
 */
enum class NodeKind {GENERIC, TREE, RING, LINE, STAR};

/**
 * A struct used to define bundled properties for nodes in the structure graph.
 */
struct StructureVertex {
  NodeId id; /**< The identifier of the node, equal to the id of the Mirror bound to it (if any). */
  NodeKind kind; /**< The topology kind of this node. */
  TypeSet nodeTypes; /**< The structure types this node currently takes part in. */
  TypeSet headTypes; /**< The structure types for which this node is the head. */
  int maxChildren; /**< Maximum number of children this node accepts; negative means unlimited. */
  Mirror* mirror; /**< The Mirror bound to this node, nullptr while only planned. Not owned. */
};

/**
 * A struct used to define bundled properties for edges in the structure graph.
 * Every edge goes from a parent to one of its children and records, for each
 * structure type it belongs to, the head of that structure. One physical
 * parent/child connection can therefore be part of several overlaid
 * structures at the same time.
 */
struct StructureEdge {
  HeadIdMap memberships; /**< Structure type -> head id of the structure this edge belongs to. */
};

// Our graph template: out edges kept in insertion order (children order),
// list-based vertex storage so descriptors survive removals
typedef boost::adjacency_list<boost::vecS, boost::listS, boost::bidirectionalS,
        StructureVertex, StructureEdge> SGraph;
// Utility definitions to save time
typedef SGraph::vertex_descriptor SVertex;
typedef SGraph::edge_descriptor SEdge;
typedef boost::graph_traits<SGraph>::vertex_iterator SVertexIterator;
typedef boost::graph_traits<SGraph>::out_edge_iterator SOutEdgeIterator;
typedef boost::graph_traits<SGraph>::in_edge_iterator SInEdgeIterator;
typedef boost::graph_traits<SGraph>::edge_iterator SEdgeIterator;
typedef std::map<NodeId, SVertex> SVertexMap;

/**
 * Human readable name of a NodeKind, used in log messages.
 */
const char* nodeKindName(NodeKind kind);

/**
 * The structural model of the network: an arena of nodes, addressed by
 * integer id, connected by parent->child edges that carry the (type, head)
 * overlay. It knows nothing about Links; the Mirror pointers stored in the
 * nodes are only carried along for the execution layer.
 *
 * Unless stated otherwise, operations on ids that are not part of the graph
 * are no-ops returning an empty or neutral result. All traversals are
 * iterative and track visited nodes, since rings are a legal topology.
 */
class StructureGraph {
protected:
  SGraph graph; /**< The BGL representation of the structure. */
  SVertexMap vertexMap; /**< Node id -> vertex descriptor. Rebuilt whenever the graph is copied. */

  void rebuildVertexMap();
  bool findVertex(NodeId id, SVertex& v) const;
  /**
   * Checks whether an edge belongs to the structure identified by type and
   * head. A head of NO_NODE matches any head.
   */
  static bool belongsTo(const StructureEdge& edge, StructureType type,
          NodeId head);
  /**
   * Recomputes the structure types of a node from its incident edges and its
   * head markers.
   */
  void refreshNodeTypes(SVertex v);
  /**
   * Retrieves the neighbours (parents and children) of a node over the edges
   * of the given structure.
   */
  NodeVec getStructureNeighbours(NodeId id, StructureType type, NodeId head) const;

public:
  StructureGraph() {
  }
  StructureGraph(const StructureGraph& other);
  StructureGraph& operator=(const StructureGraph& other);

  /**
   * Adds a new isolated node to the graph.
   * @param id The identifier of the new node.
   * @param kind The NodeKind of the new node.
   * @param maxChildren The maximum number of children of the new node, negative for unlimited.
   * @return True if the node was added, false if a node with the same id already exists.
   */
  bool addNode(NodeId id, NodeKind kind = NodeKind::GENERIC, int maxChildren = -1);
  /**
   * Removes a node together with all of its incident edges.
   * @return True if the node existed and was removed.
   */
  bool removeNode(NodeId id);
  bool hasNode(NodeId id) const {
    return vertexMap.find(id) != vertexMap.end();
  }
  void clear();
  int getNumNodes() const {
    return vertexMap.size();
  }
  int getNumEdges() const {
    return boost::num_edges(graph);
  }
  /**
   * Retrieves the ids of all the nodes in the graph, in increasing order.
   */
  NodeVec getNodeIds() const;

  NodeKind getKind(NodeId id) const;
  void setKind(NodeId id, NodeKind kind);
  int getMaxChildren(NodeId id) const;
  void setMaxChildren(NodeId id, int maxChildren);
  Mirror* getMirror(NodeId id) const;
  void setMirror(NodeId id, Mirror* mirror);
  TypeSet getNodeTypes(NodeId id) const;
  bool isHead(NodeId id, StructureType type) const;
  /**
   * Marks (or unmarks) a node as the head of a structure of the given type.
   */
  void setHead(NodeId id, StructureType type, bool head = true);

  /**
   * Connects child below parent for the given structure types. The call is a
   * no-op if either node is unknown, if child is already a child of parent
   * for all the given types, or if parent has no spare child capacity.
   * If child is already a child of parent for some other type, the new
   * types are merged into the existing edge and capacity is not consumed.
   * @param parent The id of the parent node.
   * @param child The id of the child node.
   * @param types The structure types the new connection belongs to.
   * @param headIds For each type, the head of the structure; types without an entry get NO_NODE.
   * @return True if the graph was modified.
   */
  bool addChild(NodeId parent, NodeId child, const TypeSet& types,
          const HeadIdMap& headIds);
  bool addChild(NodeId parent, NodeId child, StructureType type, NodeId head);
  /**
   * Removes the membership of the parent->child edge in the given types; the
   * edge itself disappears once no type is left on it.
   * @return True if the graph was modified.
   */
  bool removeChild(NodeId parent, NodeId child, const TypeSet& types);
  /**
   * Removes the parent->child edge regardless of its memberships.
   */
  bool removeChild(NodeId parent, NodeId child);
  bool hasEdge(NodeId parent, NodeId child) const;
  /**
   * Retrieves the (type, head) overlay of the parent->child edge, empty if
   * there is no such edge.
   */
  HeadIdMap getMemberships(NodeId parent, NodeId child) const;

  /**
   * Retrieves all the children of a node, in the order they were added.
   */
  NodeVec getChildren(NodeId id) const;
  NodeVec getChildren(NodeId id, StructureType type, NodeId head) const;
  NodeVec getParents(NodeId id) const;
  /**
   * Retrieves the first parent of a node, or NO_NODE for a root.
   */
  NodeId getParent(NodeId id) const;
  NodeId getParent(NodeId id, StructureType type, NodeId head) const;
  int getNumChildren(NodeId id) const;
  /**
   * Checks whether a node can accept one more child, given its maxChildren.
   */
  bool canAcceptMoreChildren(NodeId id) const;

  /**
   * Collects all the nodes of the structure identified by (type, head) that
   * can be reached from start, moving along edges of that structure only.
   * A node that is the head of a different structure of the same type is
   * included but not expanded, which bounds nested substructures.
   * @return The set of nodes of the structure, or just start if head is NO_NODE.
   */
  NodeSet getAllNodesInStructure(NodeId start, StructureType type, NodeId head) const;
  /**
   * Collects every node connected to start, ignoring types and heads.
   */
  NodeSet getAllConnectedNodes(NodeId start) const;
  /**
   * Filters getAllNodesInStructure() down to its terminal nodes, i.e., the
   * ones with exactly one connection in the structure.
   */
  NodeSet getEndpointsOfStructure(NodeId start, StructureType type, NodeId head) const;
  bool isEndpoint(NodeId id, StructureType type, NodeId head) const {
    return getConnectivityDegree(id, type, head) == 1;
  }
  /**
   * Number of connections (parents plus children) a node has in a structure.
   */
  int getConnectivityDegree(NodeId id, StructureType type, NodeId head) const;
  bool isLeaf(NodeId id, StructureType type, NodeId head) const {
    return getChildren(id, type, head).empty();
  }
  bool isRoot(NodeId id, StructureType type, NodeId head) const {
    return getParent(id, type, head) == NO_NODE;
  }
  bool isTerminal(NodeId id, StructureType type, NodeId head) const {
    return isEndpoint(id, type, head);
  }
  /**
   * Counts the edges of a structure whose endpoints are both in nodes.
   */
  int getNumStructureEdges(const NodeSet& nodes, StructureType type, NodeId head) const;
  /**
   * Walks the chain of single children starting from a node of the set.
   * @return True only if every node has exactly one child in the structure and the walk comes back to its start after visiting all the nodes.
   */
  bool hasClosedCycle(const NodeSet& nodes, StructureType type, NodeId head) const;
  /**
   * Detects any directed cycle among the given nodes over structure edges.
   */
  bool hasCycle(const NodeSet& nodes, StructureType type, NodeId head) const;
  /**
   * Checks whether the given nodes form one connected component over the
   * (undirected) edges of the structure.
   */
  bool isConnected(const NodeSet& nodes, StructureType type, NodeId head) const;
  /**
   * Looks for the nearest node marked as head for type by walking up the
   * parents of start. If there is none, the first root met is returned (or the
   * smallest visited id when the walk only meets cycles).
   * @return The id of the head, NO_NODE if start is unknown.
   */
  NodeId findHead(NodeId start, StructureType type) const;
  /**
   * Retrieves the nodes on the way from head down to id, both included.
   * @return The path, empty if id cannot be reached from head.
   */
  NodeVec getPathFromHead(NodeId id, StructureType type, NodeId head) const;
  /**
   * Counts the nodes below id in the structure, id excluded.
   */
  int getDescendantCount(NodeId id, StructureType type, NodeId head) const;
  /**
   * Number of links a structure is supposed to have: n for a ring, n-1 for
   * any other structure of n nodes.
   */
  int getNumPlannedLinksFromStructure(StructureType type, NodeId head) const;
  /**
   * Retrieves all parent/child connections as normalized LinkPairs.
   */
  LinkPairSet getLinkPairs() const;
  LinkPairSet getLinkPairs(StructureType type, NodeId head) const;
};

#endif	/* STRUCTUREGRAPH_HPP */

