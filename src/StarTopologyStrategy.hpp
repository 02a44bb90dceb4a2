/*
 * File:   StarTopologyStrategy.hpp
 * Author: emanuele
 *
 * Created on 18 March 2014, 09:15
 */

#ifndef STARTOPOLOGYSTRATEGY_HPP
#define	STARTOPOLOGYSTRATEGY_HPP

#include "BuildAsSubstructure.hpp"
#include "StarRules.hpp"

/**
 * Organises the mirrors as a star: the head is the center and every other
 * node is one of its leaves.
 */
class StarTopologyStrategy : public BuildAsSubstructure {
protected:
  virtual int buildPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int growPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int shrinkPlannedStructure(StructureGraph& graph, NodeId& head,
          int count) const;

public:
  StarTopologyStrategy() {
  }

  virtual TopologyKind getKind() const {
    return TopologyKind::STAR;
  }

  virtual StructureType getStructureType() const {
    return StructureType::STAR;
  }

  virtual NodeKind getNodeKind() const {
    return NodeKind::STAR;
  }

  virtual int computeNumTargetLinks(int numMirrors, int linksPerMirror) const {
    return std::max(0, numMirrors - 1);
  }
};

#endif	/* STARTOPOLOGYSTRATEGY_HPP */

