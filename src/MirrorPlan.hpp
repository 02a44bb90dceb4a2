/*
 * File:   MirrorPlan.hpp
 * Author: emanuele
 *
 * Created on 10 March 2014, 09:12
 */

#ifndef MIRRORPLAN_HPP
#define	MIRRORPLAN_HPP
#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <vector>
#include <utility>
#include "boost/foreach.hpp"
#include "boost/program_options.hpp"
#include <boost/log/trivial.hpp>

namespace po = boost::program_options;
/**
 * Basic granularity of time in the simulator (1 discrete simulation step).
 */
typedef int SimTime;
/**
 * Identifier of a node in a StructureGraph. Nodes bound to a Mirror share the
 * Mirror's identifier.
 */
typedef int NodeId;

/**
 * NO_NODE is used as a placeholder for a node that does not exist, i.e., the
 * parent of a root or the head of a structure that has not been built yet.
 */
const NodeId NO_NODE = -1;

/**
 * INF_TIME represents a placeholder infinite SimTime, e.g., the activation
 * time of a link whose endpoints are not ready yet.
 */
const SimTime INF_TIME = std::numeric_limits<int>::max();

/**
 * The structural roles a node (or an edge between two nodes) can take. One
 * physical node may belong to several of these at the same time, each with its
 * own head node.
 */
enum class StructureType {
  DEFAULT,
  MIRROR,
  TREE,
  RING,
  LINE,
  STAR,
  FULLY_CONNECTED,
  N_CONNECTED
};

typedef std::set<NodeId> NodeSet;
typedef std::vector<NodeId> NodeVec;
typedef std::set<StructureType> TypeSet;
/** Associates each structure type of an edge with the id of its head node. */
typedef std::map<StructureType, NodeId> HeadIdMap;
/** An undirected pair of node ids, always stored as (lower id, higher id). */
typedef std::pair<NodeId, NodeId> LinkPair;
typedef std::set<LinkPair> LinkPairSet;

/**
 * Builds a normalized LinkPair, so that the connection between a and b and
 * the one between b and a compare equal.
 */
inline LinkPair makeLinkPair(NodeId a, NodeId b) {
  return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

/**
 * Human readable name of a StructureType, used in log messages.
 */
const char* structureTypeName(StructureType type);

// Error exit codes of the mirrorplan driver
#define ERR_CONFIGURATION 1
#define ERR_INPUT_PARAMETERS 2
#define ERR_OUTPUT_FILE 3

#endif	/* MIRRORPLAN_HPP */

