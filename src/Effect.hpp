/*
 * File:   Effect.hpp
 * Author: emanuele
 *
 * Created on 21 March 2014, 11:05
 */

#ifndef EFFECT_HPP
#define	EFFECT_HPP

#include "MirrorPlan.hpp"
#include "Properties.hpp"
#include "TopologyStrategy.hpp"

// forward declarations to avoid include circles
class Action;
class MirrorChange;
class TargetLinkChange;
class TopologyChange;

/**
 * The predicted impact of an Action on the quality of its Network: change in
 * active links (AL), bandwidth (BW), time-to-write (TTW) and the number of
 * steps needed before the Action takes full effect. Nothing is modified on
 * the Network while the predictions are computed.
 *
 * Combinations of topology and action the model does not cover yield 0.
 */
class Effect {
protected:
  const Action& action; /**< The Action this Effect is bound to. */

  static double getDeltaActiveLinksForMirrorChange(const MirrorChange& change,
          const TopologyStrategy* topology, int m1, int linksPerMirror);
  static double getDeltaActiveLinksForTargetLinkChange(
          const TargetLinkChange& change, const TopologyStrategy* topology,
          int m, int lpm1);
  static double getDeltaActiveLinksForTopologyChange(
          const TopologyChange& change, const TopologyStrategy* topology, int m,
          int linksPerMirror);
  /**
   * TTW change for a balanced tree of m mirrors with linksPerMirror children
   * per node, whose depth is about log(m) in base linksPerMirror.
   */
  static int getDeltaTimeToWriteForBalancedTrees(int m, int currentRelativeTTW,
          int linksPerMirror);

public:
  explicit Effect(const Action& action) : action(action) {
  }

  /**
   * Predicted change of the ratio of active links, as a fraction (positive
   * means more active links).
   */
  double getDeltaActiveLinks() const;
  /**
   * Predicted change of the relative bandwidth, in percent, comparing the
   * current value with the one expected once the Action has taken effect.
   * @param props The configuration, providing "max_bandwidth".
   * @throw ConfigurationError if "max_bandwidth" or a delay property is missing or malformed.
   */
  int getDeltaBandwidth(const Properties& props) const;
  /**
   * Predicted change of the relative time-to-write, in percent.
   */
  int getDeltaTimeToWrite() const;
  /**
   * Number of steps the Action needs to take full effect.
   * @throw ConfigurationError if a delay property is missing or malformed.
   */
  int getLatency() const;

  const Action& getAction() const {
    return action;
  }
};

#endif	/* EFFECT_HPP */

