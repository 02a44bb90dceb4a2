/*
 * File:   Network.hpp
 * Author: emanuele
 *
 * Created on 20 March 2014, 10:12
 */

#ifndef NETWORK_HPP
#define	NETWORK_HPP

#include <map>
#include <vector>
#include <boost/random/mersenne_twister.hpp>
#include "MirrorPlan.hpp"
#include "IdGenerator.hpp"
#include "Mirror.hpp"
#include "Properties.hpp"
#include "TopologyStrategy.hpp"

// forward declarations to avoid include circles
class Effector;

/**
 * A time-indexed series of relative quality values, in percent.
 */
typedef std::map<SimTime, int> History;

/**
 * The simulated mirroring network. It owns its Mirrors and Links, keeps the
 * target number of mirrors and of links per mirror, and delegates every
 * structural change to the active TopologyStrategy. At the end of every
 * timeStep() it records the relative active links, bandwidth and
 * time-to-write of the network.
 */
class Network {
  friend class EffectTest;
protected:
  Properties props; /**< Configuration of delays and bandwidth. */
  IdGenerator idGenerator; /**< Source of Mirror, Link and Action identifiers. */
  boost::mt19937 gen; /**< Random generator for delays and bandwidths, seeded from the "seed" property. */
  StrategyPtr strategy; /**< The active TopologyStrategy. */
  std::vector<Mirror*> mirrors; /**< The running Mirrors, in creation order. */
  std::vector<Mirror*> stoppingMirrors; /**< Mirrors that were shut down but have not stopped yet. */
  LinkSet links; /**< Every Link of the network, closed ones included until the next timeStep(). */
  int numTargetMirrors; /**< The number of mirrors requested for the network. */
  int numTargetLinksPerMirror; /**< The number of links per mirror requested for the network. */
  SimTime currentTimeStep; /**< The SimTime of the last timeStep(). */
  Effector* effector; /**< The Effector triggered at every timeStep(), if any. */
  History activeLinksHistory; /**< Active links over target links, in percent. */
  History bandwidthHistory; /**< Bandwidth of active links over the maximum for the target links, in percent. */
  History ttwHistory; /**< Relative time-to-write, 100 being a write reaching every mirror in one hop. */

  /**
   * Draws a delay uniformly from the range configured by minKey and maxKey.
   * @throw ConfigurationError if either key is missing or malformed.
   */
  SimTime drawDelay(const std::string& minKey, const std::string& maxKey);
  /**
   * Computes the relative time-to-write of the network, based on the number
   * of hops (over active links) needed to reach every mirror from the
   * oldest one.
   */
  int measureTimeToWrite() const;
  void recordHistories(SimTime time);

public:
  /**
   * Creates numMirrors Mirrors at time 0 and lets strategy connect them.
   * @param strategy The initial TopologyStrategy, may be empty.
   * @param numMirrors The initial number of Mirrors.
   * @param numLinksPerMirror The initial number of target links per mirror.
   * @param props The configuration of the network.
   * @throw ConfigurationError if a delay property is missing or malformed.
   */
  Network(StrategyPtr strategy, int numMirrors, int numLinksPerMirror,
          const Properties& props);
  virtual ~Network();

  /**
   * Advances mirrors and links to time, discards stopped mirrors and closed
   * links, triggers the Effector and records the histories.
   */
  void timeStep(SimTime time);

  /**
   * Grows or shrinks the network through the active strategy, then makes
   * newMirrors the target number of mirrors.
   */
  virtual void setNumMirrors(int newMirrors, SimTime time);
  /**
   * Replaces the active strategy. After time 0 the network is restarted
   * with the new topology.
   */
  virtual void setTopologyStrategy(StrategyPtr strategy, SimTime time);
  /**
   * Replaces the target links per mirror. After time 0 the network is
   * restarted to take the new value into account.
   */
  virtual void setNumTargetedLinksPerMirror(int numLinksPerMirror,
          SimTime time);

  // Execution layer primitives, used by the topology strategies
  /**
   * Starts a new Mirror with the specified id.
   * @throw ConfigurationError if the start-up or ready delays are not configured.
   */
  Mirror* createMirror(int id, SimTime time);
  /**
   * Creates a new Link between two running Mirrors.
   * @throw ConfigurationError if the activation delay or the maximum bandwidth are not configured.
   */
  Link* createLink(Mirror* source, Mirror* target, SimTime time);
  /**
   * Closes a Link; it is discarded at the next timeStep().
   */
  void closeLink(Link* link);
  /**
   * Shuts a Mirror down and closes its Links. The Mirror no longer counts
   * as part of the network and is discarded once stopped.
   */
  void shutdownMirror(Mirror* mirror, SimTime time);
  void closeAllLinks();
  /**
   * @return The running Mirror with the specified id, nullptr if there is none.
   */
  Mirror* getMirror(int id) const;

  // Metrics
  /**
   * Total bandwidth of the links that will be carrying traffic at time,
   * i.e., not closed and past their activation time.
   */
  virtual int getPredictedBandwidth(SimTime time) const;
  int getNumLinks() const;
  int getNumActiveLinks() const;
  int getNumReadyMirrors() const;
  int getNumTargetLinks() const;

  virtual int getNumMirrors() const {
    return mirrors.size();
  }

  virtual int getNumTargetMirrors() const {
    return numTargetMirrors;
  }

  virtual int getNumTargetLinksPerMirror() const {
    return numTargetLinksPerMirror;
  }

  virtual StrategyPtr getTopologyStrategy() const {
    return strategy;
  }

  virtual SimTime getCurrentTimeStep() const {
    return currentTimeStep;
  }

  const std::vector<Mirror*>& getMirrors() const {
    return mirrors;
  }

  const LinkSet& getLinks() const {
    return links;
  }

  const Properties& getProps() const {
    return props;
  }

  IdGenerator& getIdGenerator() {
    return idGenerator;
  }

  void setEffector(Effector* effector) {
    this->effector = effector;
  }

  Effector* getEffector() const {
    return effector;
  }

  const History& getActiveLinksHistory() const {
    return activeLinksHistory;
  }

  const History& getBandwidthHistory() const {
    return bandwidthHistory;
  }

  const History& getTtwHistory() const {
    return ttwHistory;
  }

private:
  Network(const Network&);
  Network& operator=(const Network&);
};

#endif	/* NETWORK_HPP */

