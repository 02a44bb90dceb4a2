/*
 * File:   RingRules.hpp
 * Author: emanuele
 *
 * Created on 12 March 2014, 17:05
 */

#ifndef RINGRULES_HPP
#define	RINGRULES_HPP

#include "StructureGraph.hpp"

/**
 * Validators and navigation for NodeKind::RING nodes. Ring edges point from a
 * node to its successor; the last node points back to the head, which may
 * additionally have a parent outside the ring.
 */
class RingRules {
public:
  static const int MIN_RING_SIZE = 3;

  /**
   * Exactly one head, at least MIN_RING_SIZE nodes, and a single closed
   * cycle in which every node has one child and two connections.
   */
  static bool isValidPlannedStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  static bool isValidStructure(const StructureGraph& graph,
          const NodeSet& nodes, StructureType type, NodeId head);
  /**
   * Any node but the head can leave the ring, as long as at least
   * MIN_RING_SIZE nodes remain.
   */
  static bool canBeRemovedFromStructure(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  /**
   * @return The successor of id in the ring, NO_NODE if id has none.
   */
  static NodeId getNext(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  /**
   * @return The predecessor of id in the ring, NO_NODE if id has none.
   */
  static NodeId getPrevious(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  /**
   * Number of successor steps from the head to id (0 for the head itself).
   * @return The position of id, -1 if it cannot be reached from head.
   */
  static int getPosition(const StructureGraph& graph, NodeId id,
          StructureType type, NodeId head);
  static int getRingSize(const StructureGraph& graph, StructureType type,
          NodeId head) {
    return graph.getAllNodesInStructure(head, type, head).size();
  }
};

#endif	/* RINGRULES_HPP */

