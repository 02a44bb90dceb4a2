/*
 * File:   FullyConnectedTopology.hpp
 * Author: emanuele
 *
 * Created on 18 March 2014, 16:02
 */

#ifndef FULLYCONNECTEDTOPOLOGY_HPP
#define	FULLYCONNECTEDTOPOLOGY_HPP

#include "BuildAsSubstructure.hpp"

/**
 * Links every mirror with every other mirror. The head is just the reference
 * node of the structure; removals take the highest ids first.
 */
class FullyConnectedTopology : public BuildAsSubstructure {
protected:
  virtual int buildPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int growPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int shrinkPlannedStructure(StructureGraph& graph, NodeId& head,
          int count) const;

public:
  FullyConnectedTopology() {
  }

  virtual TopologyKind getKind() const {
    return TopologyKind::FULLY_CONNECTED;
  }

  virtual StructureType getStructureType() const {
    return StructureType::FULLY_CONNECTED;
  }

  virtual NodeKind getNodeKind() const {
    return NodeKind::GENERIC;
  }

  virtual int computeNumTargetLinks(int numMirrors, int linksPerMirror) const {
    return numMirrors <= 1 ? 0 : numMirrors * (numMirrors - 1) / 2;
  }
};

#endif	/* FULLYCONNECTEDTOPOLOGY_HPP */

