/*
 * File:   TreeTopologyStrategy.hpp
 * Author: emanuele
 *
 * Created on 14 March 2014, 09:50
 */

#ifndef TREETOPOLOGYSTRATEGY_HPP
#define	TREETOPOLOGYSTRATEGY_HPP

#include "BuildAsSubstructure.hpp"

/**
 * Organises the mirrors as a tree. New nodes are attached breadth first below
 * the first node that still has room for children; only leaves are removed,
 * deepest first.
 */
class TreeTopologyStrategy : public BuildAsSubstructure {
protected:
  int childrenPerParent; /**< Maximum number of children of every node of the tree. */

  virtual int getMaxChildren() const {
    return childrenPerParent;
  }
  virtual int buildPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int growPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const;
  virtual int shrinkPlannedStructure(StructureGraph& graph, NodeId& head,
          int count) const;
  /**
   * Chooses the parent of the next node added to the tree.
   * @return The id of the parent, NO_NODE if no node can take more children.
   */
  virtual NodeId findInsertionPoint(const StructureGraph& graph,
          NodeId head) const;
  /**
   * Chooses the next leaf to remove from the tree: the deepest one, with the
   * highest id on ties.
   * @return The id of the leaf, NO_NODE if only the root is left.
   */
  virtual NodeId selectNodeToRemove(const StructureGraph& graph,
          NodeId head) const;

public:
  explicit TreeTopologyStrategy(int childrenPerParent = 2);

  virtual TopologyKind getKind() const {
    return TopologyKind::TREE;
  }

  virtual StructureType getStructureType() const {
    return StructureType::TREE;
  }

  virtual NodeKind getNodeKind() const {
    return NodeKind::TREE;
  }

  /**
   * A tree of n nodes has n-1 links.
   */
  virtual int computeNumTargetLinks(int numMirrors, int linksPerMirror) const {
    return std::max(0, numMirrors - 1);
  }

  int getChildrenPerParent() const {
    return childrenPerParent;
  }
};

#endif	/* TREETOPOLOGYSTRATEGY_HPP */

