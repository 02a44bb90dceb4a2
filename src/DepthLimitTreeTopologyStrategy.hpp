/*
 * File:   DepthLimitTreeTopologyStrategy.hpp
 * Author: emanuele
 *
 * Created on 14 March 2014, 12:10
 */

#ifndef DEPTHLIMITTREETOPOLOGYSTRATEGY_HPP
#define	DEPTHLIMITTREETOPOLOGYSTRATEGY_HPP

#include "TreeTopologyStrategy.hpp"

/**
 * A tree that never grows deeper than maxDepth (the root has depth 0), with a
 * fan-out equal to the number of target links per mirror. Once every node
 * above the depth limit is full, further growth requests are clamped.
 */
class DepthLimitTreeTopologyStrategy : public TreeTopologyStrategy {
protected:
  int maxDepth; /**< The maximum depth of a node in the tree. */
  bool preferDepthOverBreadth; /**< If true, new nodes go as deep as possible, otherwise as shallow as possible. */

  virtual int getMaxChildren() const {
    return std::max(1, linksPerMirror);
  }
  virtual NodeId findInsertionPoint(const StructureGraph& graph,
          NodeId head) const;

public:
  explicit DepthLimitTreeTopologyStrategy(int maxDepth = 3,
          bool preferDepthOverBreadth = false);

  virtual TopologyKind getKind() const {
    return TopologyKind::DEPTH_LIMIT_TREE;
  }

  int getMaxDepth() const {
    return maxDepth;
  }

  bool isPreferDepthOverBreadth() const {
    return preferDepthOverBreadth;
  }
};

#endif	/* DEPTHLIMITTREETOPOLOGYSTRATEGY_HPP */

