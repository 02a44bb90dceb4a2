/*
 * File:   Mirror.hpp
 * Author: emanuele
 *
 * Created on 10 March 2014, 11:02
 */

#ifndef MIRROR_HPP
#define	MIRROR_HPP

#include "Link.hpp"

/**
 * The lifecycle of a Mirror. A new Mirror goes through STARTING and UP before
 * becoming READY; a Mirror being shut down is STOPPING for one step and then
 * STOPPED, at which point the Network discards it.
 */
enum class MirrorState {STARTING, UP, READY, STOPPING, STOPPED};

/**
 * A physical replica endpoint of the simulated network. A Mirror does not own
 * its Links (the Network does), it only tracks the ones it takes part in.
 */
class Mirror {
protected:
  int id; /**< Unique identifier of the Mirror, shared with its structural node. */
  SimTime creationTime; /**< The SimTime at which the Mirror was started. */
  SimTime upTime; /**< The SimTime at which the Mirror switches from STARTING to UP. */
  SimTime readyTime; /**< The SimTime at which the Mirror switches from UP to READY. */
  SimTime stopTime; /**< The SimTime at which shutdown() was invoked, INF_TIME if never. */
  MirrorState state; /**< The current MirrorState. */
  LinkSet links; /**< The Links this Mirror takes part in, ordered by id. */

public:
  /**
   * Starts a new Mirror.
   * @param id The unique identifier of the Mirror.
   * @param creationTime The SimTime at which the Mirror is started.
   * @param startupDelay Number of steps required to go from STARTING to UP.
   * @param readyDelay Number of steps required to go from UP to READY.
   */
  Mirror(int id, SimTime creationTime, SimTime startupDelay, SimTime readyDelay);

  /**
   * Advances the lifecycle of the Mirror to the specified SimTime.
   */
  void timeStep(SimTime time);

  /**
   * Starts the shutdown of this Mirror. Every Link still attached to it is
   * closed and detached; the Network is in charge of discarding them.
   * @param time The SimTime at which the shutdown starts.
   */
  void shutdown(SimTime time);

  void addLink(Link* link) {
    links.insert(link);
  }

  void removeLink(Link* link) {
    links.erase(link);
  }

  /**
   * Checks whether there is at least one Link (in any non-closed state)
   * between this Mirror and other.
   */
  bool isLinkedWith(const Mirror* other) const;

  /**
   * Retrieves all the non-closed Links between this Mirror and other.
   */
  LinkSet getLinksTo(const Mirror* other) const;

  int getId() const {
    return id;
  }

  const LinkSet& getLinks() const {
    return links;
  }

  /**
   * @return The number of non-closed Links of this Mirror.
   */
  int getNumLinks() const;

  MirrorState getState() const {
    return state;
  }

  SimTime getCreationTime() const {
    return creationTime;
  }

  SimTime getReadyTime() const {
    return readyTime;
  }

  bool isReady() const {
    return state == MirrorState::READY;
  }

  /**
   * A Mirror is usable as long as it has not been asked to shut down.
   */
  bool isUsable() const {
    return state != MirrorState::STOPPING && state != MirrorState::STOPPED;
  }
};

#endif	/* MIRROR_HPP */

