/*
 * File:   Link.hpp
 * Author: emanuele
 *
 * Created on 10 March 2014, 11:20
 */

#ifndef LINK_HPP
#define	LINK_HPP

#include <set>
#include "MirrorPlan.hpp"

// forward declaration to avoid include circles
class Mirror;

/**
 * The lifecycle of a Link: it is created INACTIVE, becomes ACTIVE once its
 * activation delay has elapsed and both endpoints are READY, and is CLOSED
 * when either the topology drops it or one of its endpoints shuts down.
 */
enum class LinkState {INACTIVE, ACTIVE, CLOSED};

/**
 * A connection between two Mirrors. Links are owned by the Network; Mirrors
 * only keep (non-owning) pointers to the Links they take part in. Two Links are
 * equal only if they are the same object.
 */
class Link {
protected:
  int id; /**< Unique identifier of the Link. */
  Mirror* source; /**< The Mirror that initiated the connection. */
  Mirror* target; /**< The Mirror at the other end of the connection. */
  SimTime creationTime; /**< The SimTime at which the Link was created. */
  SimTime activationTime; /**< The earliest SimTime at which the Link can become ACTIVE. */
  int bandwidth; /**< The bandwidth available on this Link once it is active. */
  LinkState state; /**< The current LinkState. */

public:
  /**
   * Creates a new INACTIVE link and registers it with both endpoints.
   * @param id The unique identifier of the Link.
   * @param source The Mirror initiating the connection.
   * @param target The Mirror receiving the connection.
   * @param creationTime The SimTime at which the Link is being created.
   * @param activationDelay Number of SimTime steps required before the Link can become ACTIVE.
   * @param bandwidth The bandwidth that will be available on the Link.
   */
  Link(int id, Mirror* source, Mirror* target, SimTime creationTime,
          SimTime activationDelay, int bandwidth);

  /**
   * Advances the lifecycle of the Link to the specified SimTime.
   */
  void timeStep(SimTime time);

  /**
   * Closes the Link. A closed Link never becomes active again.
   */
  void shutdown() {
    state = LinkState::CLOSED;
  }

  /**
   * Checks whether this Link connects the two specified Mirrors, in either
   * direction.
   */
  bool connects(const Mirror* a, const Mirror* b) const {
    return (source == a && target == b) || (source == b && target == a);
  }

  /**
   * Retrieves the endpoint opposite to the specified one.
   * @return The other endpoint, or nullptr if mirror is not an endpoint of this Link.
   */
  Mirror* getOther(const Mirror* mirror) const;

  /**
   * Checks whether this Link will be carrying traffic at the specified time,
   * i.e., it is not closed and its activation time has been reached.
   */
  bool isActiveAt(SimTime time) const {
    return state != LinkState::CLOSED && time >= activationTime;
  }

  int getId() const {
    return id;
  }

  Mirror* getSource() const {
    return source;
  }

  Mirror* getTarget() const {
    return target;
  }

  SimTime getCreationTime() const {
    return creationTime;
  }

  SimTime getActivationTime() const {
    return activationTime;
  }

  int getBandwidth() const {
    return bandwidth;
  }

  LinkState getState() const {
    return state;
  }

  bool isActive() const {
    return state == LinkState::ACTIVE;
  }

  bool isClosed() const {
    return state == LinkState::CLOSED;
  }
};

/**
 * Orders Links by increasing identifier, so that iterating over the links of a
 * Mirror is deterministic across runs.
 */
struct CompareLinkPtr {
  bool operator()(const Link* x, const Link* y) const {
    return x->getId() < y->getId();
  }
};

typedef std::set<Link*, CompareLinkPtr> LinkSet;

#endif	/* LINK_HPP */

