/*
 * File:   TopologyStrategy.hpp
 * Author: emanuele
 *
 * Created on 13 March 2014, 14:40
 */

#ifndef TOPOLOGYSTRATEGY_HPP
#define	TOPOLOGYSTRATEGY_HPP

#include <memory>
#include <string>
#include "MirrorPlan.hpp"

// forward declarations to avoid include circles
class Network;
class Action;

/**
 * The topologies a Network can be organised in. Effect predictions are keyed
 * on these values.
 */
enum class TopologyKind {TREE, BALANCED_TREE, DEPTH_LIMIT_TREE, RING, LINE,
  STAR, FULLY_CONNECTED, N_CONNECTED};

/**
 * Human readable name of a TopologyKind, as accepted on the command line.
 */
const char* topologyKindName(TopologyKind kind);

/**
 * Builds, grows, shrinks and tears down the links of a Network according to
 * one topology. The Network delegates every change of its population or of
 * its target links per mirror to the active TopologyStrategy.
 */
class TopologyStrategy {
public:
  virtual ~TopologyStrategy() {
  }

  virtual TopologyKind getKind() const = 0;

  std::string getName() const {
    return topologyKindName(getKind());
  }

  /**
   * Connects the Mirrors already present in the network from scratch.
   * @param network The Network to organise.
   * @param time The current SimTime.
   */
  virtual void initNetwork(Network& network, SimTime time) = 0;
  /**
   * Closes every Link of the network and connects its Mirrors again from
   * scratch, e.g., after a change of topology or of target links.
   */
  virtual void restartNetwork(Network& network, SimTime time) = 0;
  /**
   * Starts new Mirrors and connects them to the existing topology.
   * @return The number of Mirrors actually added, which may be lower than newMirrors if the topology cannot host them all.
   */
  virtual int handleAddNewMirrors(Network& network, int newMirrors,
          SimTime time) = 0;
  /**
   * Disconnects and shuts down Mirrors while keeping the topology valid.
   * @return The number of Mirrors actually removed, which may be lower than removeMirrors if the topology would fall below its minimum size.
   */
  virtual int handleRemoveMirrors(Network& network, int removeMirrors,
          SimTime time) = 0;

  /**
   * Closed-form number of links of this topology.
   * @param numMirrors The number of mirrors.
   * @param linksPerMirror The number of target links per mirror.
   */
  virtual int computeNumTargetLinks(int numMirrors, int linksPerMirror) const = 0;

  /**
   * Number of links this topology targets for the current state of network.
   */
  int getNumTargetLinks(const Network& network) const;

  /**
   * Number of links this topology would target once action is applied. For a
   * TopologyChange the new topology's formula is used.
   */
  int getPredictedNumTargetLinks(const Action& action) const;
};

typedef std::shared_ptr<TopologyStrategy> StrategyPtr;

/**
 * Creates a strategy from its command line name (see topologyKindName()).
 * @return The new strategy, or an empty pointer if the name is unknown.
 */
StrategyPtr makeTopologyStrategy(const std::string& name);

#endif	/* TOPOLOGYSTRATEGY_HPP */

