/*
 * File:   NConnectedTopology.hpp
 * Author: emanuele
 *
 * Created on 19 March 2014, 10:47
 */

#ifndef NCONNECTEDTOPOLOGY_HPP
#define	NCONNECTEDTOPOLOGY_HPP

#include "BuildAsSubstructure.hpp"

/**
 * Gives every mirror about linksPerMirror links. The mirrors are laid out on
 * a circle (head first, then by increasing id) and linked to their
 * neighbours at distance 1, 2, ... until n*k/2 links are planned, so any
 * k >= 2 yields a connected structure. Every change rebuilds the layout.
 */
class NConnectedTopology : public BuildAsSubstructure {
protected:
  virtual int buildPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int growPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int shrinkPlannedStructure(StructureGraph& graph, NodeId& head,
          int count) const;
  /**
   * Lists the members of the structure, head first and the rest by id.
   */
  NodeVec getLayout(const StructureGraph& graph, NodeId head) const;
  /**
   * Replaces graph with a fresh structure over ids.
   */
  int rebuild(StructureGraph& graph, NodeId& head, const NodeVec& ids) const;

public:
  NConnectedTopology() {
  }

  virtual TopologyKind getKind() const {
    return TopologyKind::N_CONNECTED;
  }

  virtual StructureType getStructureType() const {
    return StructureType::N_CONNECTED;
  }

  virtual NodeKind getNodeKind() const {
    return NodeKind::GENERIC;
  }

  /**
   * n*k/2 links, capped by the n*(n-1)/2 of a complete graph.
   */
  virtual int computeNumTargetLinks(int numMirrors, int linksPerMirror) const {
    if (numMirrors <= 0 || linksPerMirror <= 0)
      return 0;
    return std::min(numMirrors * linksPerMirror / 2,
            numMirrors * (numMirrors - 1) / 2);
  }
};

#endif	/* NCONNECTEDTOPOLOGY_HPP */

