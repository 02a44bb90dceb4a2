/*
 * File:   LineTopologyStrategy.hpp
 * Author: emanuele
 *
 * Created on 17 March 2014, 14:40
 */

#ifndef LINETOPOLOGYSTRATEGY_HPP
#define	LINETOPOLOGYSTRATEGY_HPP

#include "BuildAsSubstructure.hpp"
#include "LineRules.hpp"

/**
 * Organises the mirrors as a chain going from the head to the tail. Nodes are
 * appended at, and removed from, the tail.
 */
class LineTopologyStrategy : public BuildAsSubstructure {
protected:
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
  LineTopologyStrategy() {
  }

  virtual TopologyKind getKind() const {
    return TopologyKind::LINE;
  }

  virtual StructureType getStructureType() const {
    return StructureType::LINE;
  }

  virtual NodeKind getNodeKind() const {
    return NodeKind::LINE;
  }

  virtual int computeNumTargetLinks(int numMirrors, int linksPerMirror) const {
    return std::max(0, numMirrors - 1);
  }
};

#endif	/* LINETOPOLOGYSTRATEGY_HPP */

