/*
 * File:   RingTopologyStrategy.hpp
 * Author: emanuele
 *
 * Created on 17 March 2014, 10:05
 */

#ifndef RINGTOPOLOGYSTRATEGY_HPP
#define	RINGTOPOLOGYSTRATEGY_HPP

#include "BuildAsSubstructure.hpp"
#include "RingRules.hpp"

/**
 * Organises the mirrors as a directed ring starting at the head. New nodes
 * are spliced in right after the head, one after the other; removals take
 * the node preceding the head and never leave fewer than minRingSize nodes.
 */
class RingTopologyStrategy : public BuildAsSubstructure {
protected:
  int minRingSize; /**< The smallest ring this strategy builds or shrinks to. */

  virtual int getMaxChildren() const {
    return 1;
  }
  virtual int buildPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int growPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int shrinkPlannedStructure(StructureGraph& graph, NodeId& head,
          int count) const;

public:
  explicit RingTopologyStrategy(int minRingSize = RingRules::MIN_RING_SIZE);

  virtual TopologyKind getKind() const {
    return TopologyKind::RING;
  }

  virtual StructureType getStructureType() const {
    return StructureType::RING;
  }

  virtual NodeKind getNodeKind() const {
    return NodeKind::RING;
  }

  /**
   * A ring of n nodes has n links; no ring exists below minRingSize.
   */
  virtual int computeNumTargetLinks(int numMirrors, int linksPerMirror) const {
    return numMirrors >= minRingSize ? numMirrors : 0;
  }

  int getMinRingSize() const {
    return minRingSize;
  }
};

#endif	/* RINGTOPOLOGYSTRATEGY_HPP */

