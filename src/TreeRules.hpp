/*
 * File:   TreeRules.hpp
 * Author: emanuele
 *
 * Created on 12 March 2014, 16:30
 */

#ifndef TREERULES_HPP
#define	TREERULES_HPP

#include "StructureGraph.hpp"

/**
 * Validators and navigation for NodeKind::TREE nodes.
 * A valid tree has exactly one head (its root), no cycles, n-1 edges for n
 * nodes, and every node other than the root has its parent inside the tree.
 */
class TreeRules {
public:
  static bool isValidPlannedStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  /**
   * Planned invariants plus Mirror checks; the root must also have at least
   * one Link leaving the tree.
   */
  static bool isValidStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  /**
   * Only leaves can leave a tree: removing an inner node would disconnect
   * its subtree.
   */
  static bool canBeRemovedFromStructure(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  /**
   * Depth of a node, the root having depth 0.
   * @return The depth of id, or -1 if id is not below head.
   */
  static int getDepth(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  /**
   * Depth of every node of the tree, computed breadth first from head.
   */
  static std::map<NodeId, int> getDepths(const StructureGraph& graph,
          StructureType type, NodeId head);
  static int getMaxDepth(const StructureGraph& graph, StructureType type,
          NodeId head);
};

#endif	/* TREERULES_HPP */

