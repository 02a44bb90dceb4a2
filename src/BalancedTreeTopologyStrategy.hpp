/*
 * File:   BalancedTreeTopologyStrategy.hpp
 * Author: emanuele
 *
 * Created on 14 March 2014, 11:32
 */

#ifndef BALANCEDTREETOPOLOGYSTRATEGY_HPP
#define	BALANCEDTREETOPOLOGYSTRATEGY_HPP

#include "TreeTopologyStrategy.hpp"

/**
 * A tree whose fan-out is the number of target links per mirror. Each new
 * node goes below the shallowest node with the fewest children, which keeps
 * the depth of the tree close to log(m) in base linksPerMirror.
 */
class BalancedTreeTopologyStrategy : public TreeTopologyStrategy {
protected:
  virtual int getMaxChildren() const {
    return std::max(1, linksPerMirror);
  }
  virtual NodeId findInsertionPoint(const StructureGraph& graph,
          NodeId head) const;

public:
  BalancedTreeTopologyStrategy() {
  }

  virtual TopologyKind getKind() const {
    return TopologyKind::BALANCED_TREE;
  }
};

#endif	/* BALANCEDTREETOPOLOGYSTRATEGY_HPP */

