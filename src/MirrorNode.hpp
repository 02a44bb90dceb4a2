/*
 * File:   MirrorNode.hpp
 * Author: emanuele
 *
 * Created on 12 March 2014, 10:15
 */

#ifndef MIRRORNODE_HPP
#define	MIRRORNODE_HPP

#include "StructureGraph.hpp"
#include "Mirror.hpp"

typedef std::vector<Mirror*> MirrorVec;

/**
 * Retrieves the structure type a node of the given kind belongs to by default.
 * GENERIC nodes map to StructureType::DEFAULT.
 */
StructureType structureTypeOf(NodeKind kind);

/**
 * A view over one node of a StructureGraph together with the Mirror bound to
 * it. It reconciles what the structure plans (edges of the node's own
 * structure type) with what has been implemented (the Links of the Mirror),
 * and classifies the Links of a substructure as internal or edge links.
 * A MirrorNode does not own the graph nor the Mirror, and must not outlive
 * the graph it was created from.
 */
class MirrorNode {
protected:
  const StructureGraph& graph; /**< The graph the node lives in. */
  NodeId id; /**< The id of the node (and of its Mirror). */
  StructureType type; /**< The structure type used to count planned links and find the head. */

public:
  /**
   * Builds a view over node id, using the default structure type of its kind.
   */
  MirrorNode(const StructureGraph& graph, NodeId id);
  MirrorNode(const StructureGraph& graph, NodeId id, StructureType type);

  NodeId getId() const {
    return id;
  }

  StructureType getType() const {
    return type;
  }

  Mirror* getMirror() const {
    return graph.getMirror(id);
  }

  /**
   * Retrieves the head of the structure this node belongs to.
   */
  NodeId getHead() const {
    return graph.findHead(id, type);
  }

  /**
   * Retrieves all the nodes of the structure this node belongs to.
   */
  NodeSet getStructureNodes() const {
    return graph.getAllNodesInStructure(id, type, getHead());
  }

  /**
   * Number of links the structure plans for this node, i.e., its number of
   * connections (parent plus children) under its own structure type.
   */
  int getNumPlannedLinks() const;
  /**
   * Number of Links of the bound Mirror, 0 if no Mirror is bound.
   */
  int getNumImplementedLinks() const;
  /**
   * Number of planned links that have not been implemented yet, never negative.
   */
  int getNumPendingLinks() const;
  /**
   * Checks whether this node and other are connected both in the structure
   * (a parent/child edge in either direction) and in the network (a Link
   * between their Mirrors). Either one alone is not enough.
   */
  bool isLinkedWith(const MirrorNode& other) const;

  MirrorVec getMirrorsOfStructure() const {
    return getMirrorsOf(graph, getStructureNodes());
  }

  /**
   * Retrieves the Mirrors bound to the terminal nodes of the structure.
   */
  MirrorVec getMirrorsOfEndpoints() const;

  /**
   * Retrieves the Links with both endpoints inside the structure.
   */
  LinkSet getLinksOfStructure() const {
    return getLinksOf(graph, getStructureNodes());
  }

  /**
   * Retrieves the Links with exactly one endpoint inside the structure.
   */
  LinkSet getEdgeLinks() const {
    return getEdgeLinksOf(graph, getStructureNodes());
  }

  int getNumEdgeLinks() const {
    return getEdgeLinks().size();
  }

  /**
   * Retrieves the Mirrors bound to the given nodes, ordered by node id.
   * Nodes without a Mirror are skipped.
   */
  static MirrorVec getMirrorsOf(const StructureGraph& graph, const NodeSet& nodes);
  static LinkSet getLinksOf(const StructureGraph& graph, const NodeSet& nodes);
  static LinkSet getEdgeLinksOf(const StructureGraph& graph, const NodeSet& nodes);
  /**
   * Base validity of a realised structure: the nodes are connected under
   * (type, head), every node has a usable Mirror, no Link loops on a single
   * Mirror, every planned edge is implemented by a Link and, when the
   * structure has more than one node, every Mirror has at least one Link
   * inside the structure.
   */
  static bool isValidMirrorStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
};

#endif	/* MIRRORNODE_HPP */

