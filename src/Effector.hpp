/*
 * File:   Effector.hpp
 * Author: emanuele
 *
 * Created on 21 March 2014, 15:20
 */

#ifndef EFFECTOR_HPP
#define	EFFECTOR_HPP

#include <map>
#include "Action.hpp"

/**
 * Keeps the reconfiguration Actions scheduled for a Network and applies them
 * when their time comes. At most one Action of each type is kept per
 * SimTime: scheduling another one for the same time replaces it. Applied
 * Actions are no longer pending.
 */
class Effector {
protected:
  Network* network; /**< The Network the Actions apply to. */
  std::map<SimTime, MirrorChangePtr> mirrorChanges; /**< Pending mirror changes, keyed by time. */
  std::map<SimTime, TopologyChangePtr> strategyChanges; /**< Pending topology changes, keyed by time. */
  std::map<SimTime, TargetLinkChangePtr> targetLinkChanges; /**< Pending target link changes, keyed by time. */

  /**
   * Only times after the current time step of the Network can be scheduled.
   */
  bool canSchedule(SimTime time, const char* caller) const;

public:
  explicit Effector(Network* network);

  /**
   * Schedules a change of the number of mirrors.
   * @param newMirrors The number of mirrors requested.
   * @param time The SimTime at which the change is applied.
   * @return The new Action, which replaces any MirrorChange already scheduled
   * at time, or an empty pointer if time is not after the current time step.
   */
  MirrorChangePtr setMirrors(int newMirrors, SimTime time);
  /**
   * Schedules a change of topology.
   * @return The new Action, which replaces any TopologyChange already scheduled
   * at time, or an empty pointer if time is not after the current time step.
   */
  TopologyChangePtr setStrategy(StrategyPtr strategy, SimTime time);
  /**
   * Schedules a change of the number of target links per mirror.
   * @return The new Action, which replaces any TargetLinkChange already
   * scheduled at time, or an empty pointer if time is not after the current
   * time step.
   */
  TargetLinkChangePtr setTargetLinksPerMirror(int newLinksPerMirror,
          SimTime time);
  /**
   * Withdraws a pending Action. Nothing happens unless action is the very
   * instance still scheduled at its time.
   */
  void removeAction(const ActionPtr& action);
  /**
   * Applies the Actions scheduled at time: the topology change first, then
   * the mirror change and finally the target link change.
   */
  void timeStep(SimTime time);

  /**
   * Total number of Actions scheduled, whatever their time.
   */
  int getNumPendingActions() const {
    return mirrorChanges.size() + strategyChanges.size()
            + targetLinkChanges.size();
  }

  Network* getNetwork() const {
    return network;
  }
};

#endif	/* EFFECTOR_HPP */

