/*
 * File:   NodeKindRules.hpp
 * Author: emanuele
 *
 * Created on 12 March 2014, 15:48
 */

#ifndef NODEKINDRULES_HPP
#define	NODEKINDRULES_HPP

#include "StructureGraph.hpp"

/**
 * Signature of a structure predicate: checks the nodes of the structure
 * identified by (type, head).
 */
typedef bool (*StructurePredicate)(const StructureGraph& graph,
        const NodeSet& nodes, StructureType type, NodeId head);

/**
 * Signature of a node predicate: checks one node of the structure identified
 * by (type, head).
 */
typedef bool (*NodePredicate)(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head);

/**
 * The validators of one NodeKind. Every kind of structural node shares the
 * same data (StructureVertex); what differs between a tree, a ring, a line
 * and a star is only which of these functions apply.
 */
struct NodeKindRules {
  NodeKind kind; /**< The NodeKind these rules apply to. */
  int minNodes; /**< Minimum number of nodes of a valid structure of this kind. */
  StructurePredicate isValidPlannedStructure; /**< Graph-only invariants, usable before any Mirror is bound. */
  StructurePredicate isValidStructure; /**< Full invariants of a realised, embedded structure. */
  NodePredicate canBeRemovedFromStructure; /**< Whether removing a node keeps the structure valid. */
};

/**
 * Retrieves the rules for the given NodeKind.
 */
const NodeKindRules& getNodeKindRules(NodeKind kind);

/**
 * Graph-only validation of the structure headed by head, dispatched on the
 * kind of the head node.
 */
bool isValidPlannedStructure(const StructureGraph& graph, StructureType type,
        NodeId head);

/**
 * Full validation of the structure headed by head (Mirrors, Links and edge
 * links included), dispatched on the kind of the head node.
 */
bool isValidStructure(const StructureGraph& graph, StructureType type,
        NodeId head);

/**
 * Checks whether node id could be removed from the structure headed by head
 * without breaking it, dispatched on the kind of the head node.
 */
bool canBeRemovedFromStructure(const StructureGraph& graph, NodeId id,
        StructureType type, NodeId head);

/**
 * Rules shared by all kinds, and used as they are by GENERIC nodes.
 */
class GenericRules {
public:
  /**
   * Counts the nodes of the set that are marked head for type.
   */
  static int countHeads(const StructureGraph& graph, const NodeSet& nodes,
          StructureType type);
  static bool isValidPlannedStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  static bool isValidStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  static bool canBeRemovedFromStructure(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  /**
   * Checks that the head of a realised structure has at least one Link
   * crossing the structure boundary.
   */
  static bool hasEdgeLink(const StructureGraph& graph, const NodeSet& nodes,
          NodeId head);
};

#endif	/* NODEKINDRULES_HPP */

