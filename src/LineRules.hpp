/*
 * File:   LineRules.hpp
 * Author: emanuele
 *
 * Created on 13 March 2014, 09:21
 */

#ifndef LINERULES_HPP
#define	LINERULES_HPP

#include "StructureGraph.hpp"

/**
 * Validators and navigation for NodeKind::LINE nodes. Line edges point from
 * the head towards the tail.
 */
class LineRules {
public:
  static const int MIN_LINE_SIZE = 2;

  /**
   * Exactly one head, at least MIN_LINE_SIZE nodes, two terminal nodes, no
   * cycle, and every inner node with one child and two connections.
   */
  static bool isValidPlannedStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  static bool isValidStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  /**
   * Only the tail (the endpoint opposite to the head) can leave the line, and
   * only if at least MIN_LINE_SIZE nodes remain afterwards.
   */
  static bool canBeRemovedFromStructure(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  /**
   * Distance of id from the head (0 for the head itself), -1 if id is not on
   * the line.
   */
  static int getPosition(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  /**
   * @return The last node of the line, head itself for a one node line.
   */
  static NodeId getTail(const StructureGraph& graph, StructureType type,
          NodeId head);
};

#endif	/* LINERULES_HPP */

