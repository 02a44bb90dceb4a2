/*
 * File:   BuildAsSubstructure.hpp
 * Author: emanuele
 *
 * Created on 13 March 2014, 15:22
 */

#ifndef BUILDASSUBSTRUCTURE_HPP
#define	BUILDASSUBSTRUCTURE_HPP

#include "TopologyStrategy.hpp"
#include "StructureGraph.hpp"

/**
 * The difference between two versions of a structure: what the execution
 * layer has to do on the Network to go from the first to the second.
 */
struct StructureDiff {
  NodeVec addedNodes; /**< Nodes that need a (new) Mirror. */
  NodeVec removedNodes; /**< Nodes whose Mirror has to be shut down. */
  LinkPairSet addedLinks; /**< Connections that need a new Link. */
  LinkPairSet removedLinks; /**< Connections whose Link has to be closed. */

  bool isEmpty() const {
    return addedNodes.empty() && removedNodes.empty() && addedLinks.empty()
            && removedLinks.empty();
  }
};

/**
 * The outcome of the planning layer: a candidate structure, its head, the
 * diff against the current structure and the number of nodes the request
 * actually managed to add or remove.
 */
struct StructurePlan {
  StructureGraph graph; /**< The planned structure. */
  NodeId head; /**< The head of the planned structure, NO_NODE if it is empty. */
  StructureDiff diff; /**< What changes with respect to the current structure. */
  int applied; /**< Number of nodes actually added (or removed). */
};

/**
 * Computes the nodes and connections that appear in, or disappear from,
 * after with respect to before.
 */
StructureDiff diffStructures(const StructureGraph& before,
        const StructureGraph& after);

/**
 * Base class of the strategies that model their topology as a StructureGraph.
 *
 * Every change goes through two separate steps. The planning layer works on a
 * copy of the structure only (no Mirror or Link is touched) and produces a
 * StructurePlan, which can be validated or simply discarded. The execution
 * layer commits a plan and realises its diff on the Network, starting and
 * shutting down Mirrors and opening and closing Links.
 *
 * Subclasses only provide the three planning primitives (build, grow,
 * shrink) for their topology.
 */
class BuildAsSubstructure : public TopologyStrategy {
protected:
  StructureGraph structure; /**< The committed structure. */
  NodeId headId; /**< The head of the committed structure, NO_NODE if empty. */
  int linksPerMirror; /**< Target links per mirror, refreshed from the Network before every plan. */

  /**
   * Builds a new structure over ids, on an empty graph.
   * @param graph The (empty) graph to build on.
   * @param head Set to the head of the new structure.
   * @param ids The nodes to place; the first one is the preferred head.
   * @return The number of nodes actually placed.
   */
  virtual int buildPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const = 0;
  /**
   * Adds the nodes in ids to an existing structure.
   * @return The number of nodes actually added.
   */
  virtual int growPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const = 0;
  /**
   * Removes up to count nodes from an existing structure, never breaking it.
   * @return The number of nodes actually removed.
   */
  virtual int shrinkPlannedStructure(StructureGraph& graph, NodeId& head,
          int count) const = 0;

  /**
   * Maximum number of children of a new node of this topology, negative for
   * unlimited.
   */
  virtual int getMaxChildren() const {
    return -1;
  }

  // Utility methods shared by the concrete strategies
  bool addPlannedNode(StructureGraph& graph, NodeId id) const {
    return graph.addNode(id, getNodeKind(), getMaxChildren());
  }
  bool connect(StructureGraph& graph, NodeId parent, NodeId child,
          NodeId head) const {
    return graph.addChild(parent, child, getStructureType(), head);
  }
  bool disconnect(StructureGraph& graph, NodeId parent, NodeId child) const;
  /**
   * Removes a node from the graph, unmarking it as head first.
   */
  void removePlannedNode(StructureGraph& graph, NodeId id) const;
  /**
   * Places the ids the graph can host, then builds or grows it.
   */
  int planGrowth(StructureGraph& graph, NodeId& head, const NodeVec& ids) const;
  /**
   * Logs and returns false if plan cannot be committed.
   */
  bool checkPlan(const StructurePlan& plan, const char* caller) const;

public:
  BuildAsSubstructure();
  virtual ~BuildAsSubstructure() {
  }

  /**
   * The structure type used to tag the edges of this topology.
   */
  virtual StructureType getStructureType() const = 0;
  /**
   * The NodeKind of the nodes of this topology.
   */
  virtual NodeKind getNodeKind() const = 0;

  // Planning layer: no side effect on the committed structure nor on Mirrors
  StructurePlan planBuild(const NodeVec& ids) const;
  StructurePlan planAddNodes(const NodeVec& ids) const;
  StructurePlan planRemoveNodes(int count) const;
  /**
   * Graph-only validation of a plan. An empty plan is valid; otherwise the
   * planned structure must satisfy the rules of its topology and hold every
   * node of the planned graph.
   */
  bool isValidPlan(const StructurePlan& plan) const;

  /**
   * Replaces the committed structure with the planned one. Mirror bindings
   * are refreshed by the following executeDiff().
   */
  void commitPlan(const StructurePlan& plan);
  /**
   * Realises a diff on the network: closes the Links of removed connections,
   * shuts down the Mirrors of removed nodes, starts Mirrors for added nodes
   * that have none, binds every node to its Mirror and creates the Links of
   * added connections.
   */
  void executeDiff(Network& network, const StructureDiff& diff, SimTime time);

  // Planning layer applied to the committed structure, invalid plans are
  // discarded and count as 0 nodes applied
  int buildStructure(const NodeVec& ids);
  int addNodesToStructure(const NodeVec& ids);
  int removeNodesFromStructure(int count);

  /**
   * Checks whether a node could leave the committed structure without
   * breaking it.
   */
  bool canBeRemovedFromStructure(NodeId id) const;
  /**
   * Graph-only validation of the committed structure.
   */
  bool isValidPlannedStructure() const;

  const StructureGraph& getStructure() const {
    return structure;
  }

  NodeId getHeadId() const {
    return headId;
  }

  int getLinksPerMirror() const {
    return linksPerMirror;
  }

  void setLinksPerMirror(int linksPerMirror) {
    this->linksPerMirror = linksPerMirror;
  }

  // TopologyStrategy
  virtual void initNetwork(Network& network, SimTime time);
  virtual void restartNetwork(Network& network, SimTime time);
  virtual int handleAddNewMirrors(Network& network, int newMirrors, SimTime time);
  virtual int handleRemoveMirrors(Network& network, int removeMirrors,
          SimTime time);
};

#endif	/* BUILDASSUBSTRUCTURE_HPP */

