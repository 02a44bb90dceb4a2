/*
 * File:   StarRules.hpp
 * Author: emanuele
 *
 * Created on 13 March 2014, 10:02
 */

#ifndef STARRULES_HPP
#define	STARRULES_HPP

#include "StructureGraph.hpp"

/**
 * Validators and navigation for NodeKind::STAR nodes. The head of a star is
 * its center; every other node is a child of the center and is either a plain
 * leaf or the head of a nested structure (a child-head), which allows stars
 * of stars.
 */
class StarRules {
public:
  static const int MIN_STAR_SIZE = 3;

  static bool isValidPlannedStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  static bool isValidStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  /**
   * Only plain leaves can be removed, never the center, and the star must
   * keep at least MIN_STAR_SIZE nodes.
   */
  static bool canBeRemovedFromStructure(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  static NodeId getCenter(const StructureGraph& graph, StructureType type,
          NodeId head) {
    return graph.hasNode(head) ? head : NO_NODE;
  }
  /**
   * Retrieves the plain leaves of the star, in the order they were attached.
   */
  static NodeVec getLeaves(const StructureGraph& graph, StructureType type,
          NodeId head);
  /**
   * Checks whether id is a child of the center that heads a nested structure.
   */
  static bool isChildHead(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  static bool isStarLeaf(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
};

#endif	/* STARRULES_HPP */

