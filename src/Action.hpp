/*
 * File:   Action.hpp
 * Author: emanuele
 *
 * Created on 21 March 2014, 09:30
 */

#ifndef ACTION_HPP
#define	ACTION_HPP

#include <memory>
#include <string>
#include "MirrorPlan.hpp"
#include "TopologyStrategy.hpp"

// forward declarations to avoid include circles
class Network;
class Effect;

enum class ActionType {MIRROR_CHANGE, TARGET_LINK_CHANGE, TOPOLOGY_CHANGE};

/**
 * A reconfiguration request for a Network, to be applied at a given SimTime.
 * Actions are immutable once created; the Effector creates them and keeps
 * them until their time comes.
 */
class Action {
protected:
  int id; /**< Unique identifier of the Action. */
  SimTime time; /**< The SimTime at which the Action is applied. */
  Network* network; /**< The Network the Action applies to. */

public:
  Action(Network* network, int id, SimTime time);
  virtual ~Action() {
  }

  virtual ActionType getType() const = 0;

  /**
   * Predicts the impact of this Action on the current state of its Network.
   */
  Effect getEffect() const;

  virtual std::string toString() const;

  int getId() const {
    return id;
  }

  SimTime getTime() const {
    return time;
  }

  Network* getNetwork() const {
    return network;
  }
};

/**
 * Changes the number of mirrors of the network.
 */
class MirrorChange : public Action {
protected:
  int newMirrors; /**< The requested number of mirrors. */

public:
  MirrorChange(Network* network, int id, SimTime time, int newMirrors) :
      Action(network, id, time), newMirrors(newMirrors) {
  }

  virtual ActionType getType() const {
    return ActionType::MIRROR_CHANGE;
  }

  virtual std::string toString() const;

  int getNewMirrors() const {
    return newMirrors;
  }
};

/**
 * Changes the number of target links per mirror of the network.
 */
class TargetLinkChange : public Action {
protected:
  int newLinksPerMirror; /**< The requested number of links per mirror. */

public:
  TargetLinkChange(Network* network, int id, SimTime time,
          int newLinksPerMirror) :
      Action(network, id, time), newLinksPerMirror(newLinksPerMirror) {
  }

  virtual ActionType getType() const {
    return ActionType::TARGET_LINK_CHANGE;
  }

  virtual std::string toString() const;

  int getNewLinksPerMirror() const {
    return newLinksPerMirror;
  }
};

/**
 * Replaces the topology strategy of the network.
 */
class TopologyChange : public Action {
protected:
  StrategyPtr newTopology; /**< The strategy to switch to. */

public:
  TopologyChange(Network* network, int id, SimTime time,
          StrategyPtr newTopology) :
      Action(network, id, time), newTopology(newTopology) {
  }

  virtual ActionType getType() const {
    return ActionType::TOPOLOGY_CHANGE;
  }

  virtual std::string toString() const;

  StrategyPtr getNewTopology() const {
    return newTopology;
  }
};

typedef std::shared_ptr<Action> ActionPtr;
typedef std::shared_ptr<MirrorChange> MirrorChangePtr;
typedef std::shared_ptr<TargetLinkChange> TargetLinkChangePtr;
typedef std::shared_ptr<TopologyChange> TopologyChangePtr;

#endif	/* ACTION_HPP */

