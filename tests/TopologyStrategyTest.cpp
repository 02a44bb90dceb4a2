/*
 * File:   TopologyStrategyTest.cpp
 * Author: dipascae
 *
 * Created on 28-Mar-2014, 09:17:55
 */

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include "TopologyStrategyTest.hpp"
#include "TestUtils.hpp"
#include "TreeTopologyStrategy.hpp"
#include "BalancedTreeTopologyStrategy.hpp"
#include "DepthLimitTreeTopologyStrategy.hpp"
#include "RingTopologyStrategy.hpp"
#include "LineTopologyStrategy.hpp"
#include "StarTopologyStrategy.hpp"
#include "FullyConnectedTopology.hpp"
#include "NConnectedTopology.hpp"
#include "TreeRules.hpp"
#include "MirrorNode.hpp"
#include "Network.hpp"

CPPUNIT_TEST_SUITE_REGISTRATION(TopologyStrategyTest);

namespace {

const char* const TOPOLOGIES[] = {"tree", "balanced-tree", "depth-limit-tree",
  "ring", "line", "star", "fully-connected", "n-connected"};
const int NUM_TOPOLOGIES = 8;

/**
 * A tree whose new nodes are never attached to it.
 */
class DetachedTreeStrategy : public TreeTopologyStrategy {
protected:
  virtual int growPlannedStructure(StructureGraph& graph, NodeId& head,
          const NodeVec& ids) const {
    int added = 0;
    BOOST_FOREACH(NodeId id, ids) {
      if (addPlannedNode(graph, id))
        added++;
    }
    return added;
  }
};

}

TopologyStrategyTest::TopologyStrategyTest() {
}

TopologyStrategyTest::~TopologyStrategyTest() {
}

void TopologyStrategyTest::setUp() {
}

void TopologyStrategyTest::tearDown() {
}

int TopologyStrategyTest::getMinimumSize(const std::string& name) const {
  if (name == "ring" || name == "star")
    return 3;
  else if (name == "line")
    return 2;
  return 1;
}

NodeVec TopologyStrategyTest::makeIds(NodeId first, int count) const {
  NodeVec ids;
  for (int i = 0; i < count; i++)
    ids.push_back(first + i);
  return ids;
}

int TopologyStrategyTest::countNodes(const BuildAsSubstructure& strategy) const {
  return strategy.getStructure().getAllNodesInStructure(strategy.getHeadId(),
          strategy.getStructureType(), strategy.getHeadId()).size();
}

void TopologyStrategyTest::testFactory() {
  for (int i = 0; i < NUM_TOPOLOGIES; i++) {
    StrategyPtr strategy = makeTopologyStrategy(TOPOLOGIES[i]);
    CPPUNIT_ASSERT(strategy);
    CPPUNIT_ASSERT(strategy->getName() == TOPOLOGIES[i]);
  }
  CPPUNIT_ASSERT(!makeTopologyStrategy("hypercube"));
}

void TopologyStrategyTest::testTargetLinkFormulas() {
  CPPUNIT_ASSERT(TreeTopologyStrategy().computeNumTargetLinks(10, 2) == 9);
  CPPUNIT_ASSERT(TreeTopologyStrategy().computeNumTargetLinks(0, 2) == 0);
  CPPUNIT_ASSERT(RingTopologyStrategy().computeNumTargetLinks(5, 2) == 5);
  CPPUNIT_ASSERT(RingTopologyStrategy().computeNumTargetLinks(2, 2) == 0);
  CPPUNIT_ASSERT(RingTopologyStrategy(5).computeNumTargetLinks(4, 2) == 0);
  CPPUNIT_ASSERT(LineTopologyStrategy().computeNumTargetLinks(4, 7) == 3);
  CPPUNIT_ASSERT(StarTopologyStrategy().computeNumTargetLinks(6, 1) == 5);
  CPPUNIT_ASSERT(FullyConnectedTopology().computeNumTargetLinks(5, 2) == 10);
  CPPUNIT_ASSERT(FullyConnectedTopology().computeNumTargetLinks(1, 2) == 0);
  CPPUNIT_ASSERT(NConnectedTopology().computeNumTargetLinks(6, 2) == 6);
  CPPUNIT_ASSERT(NConnectedTopology().computeNumTargetLinks(4, 5) == 6);
  CPPUNIT_ASSERT(NConnectedTopology().computeNumTargetLinks(4, 0) == 0);
}

void TopologyStrategyTest::testRandomGrowAndShrink() {
  boost::random::mt19937 gen(TEST_SEED);
  boost::random::uniform_int_distribution<> sizeDist(3, 10);
  boost::random::uniform_int_distribution<> amountDist(1, 5);
  boost::random::uniform_int_distribution<> coin(0, 1);
  for (int i = 0; i < NUM_TOPOLOGIES; i++) {
    std::string name = TOPOLOGIES[i];
    int minSize = getMinimumSize(name);
    for (int run = 0; run < 10; run++) {
      std::shared_ptr<BuildAsSubstructure> strategy =
              std::dynamic_pointer_cast<BuildAsSubstructure>(makeTopologyStrategy(name));
      CPPUNIT_ASSERT(strategy);
      int size = sizeDist(gen);
      NodeId nextId = 0;
      CPPUNIT_ASSERT_EQUAL(size, strategy->buildStructure(makeIds(nextId, size)));
      nextId += size;
      CPPUNIT_ASSERT(strategy->isValidPlannedStructure());
      for (int step = 0; step < 10; step++) {
        int amount = amountDist(gen);
        if (coin(gen) == 0) {
          int added = strategy->addNodesToStructure(makeIds(nextId, amount));
          nextId += amount;
          CPPUNIT_ASSERT(added <= amount);
          if (name != "depth-limit-tree")
            CPPUNIT_ASSERT_EQUAL(amount, added);
          size += added;
        } else {
          int removed = strategy->removeNodesFromStructure(amount);
          CPPUNIT_ASSERT_EQUAL(std::min(amount, size - minSize), removed);
          size -= removed;
        }
        CPPUNIT_ASSERT_EQUAL(size, countNodes(*strategy));
        CPPUNIT_ASSERT_EQUAL(size, strategy->getStructure().getNumNodes());
        CPPUNIT_ASSERT(strategy->isValidPlannedStructure());
        CPPUNIT_ASSERT_EQUAL(strategy->computeNumTargetLinks(size,
                strategy->getLinksPerMirror()),
                strategy->getStructure().getNumEdges());
      }
    }
  }
}

void TopologyStrategyTest::testTree() {
  TreeTopologyStrategy strategy;
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 7)) == 7);
  const StructureGraph& tree = strategy.getStructure();
  CPPUNIT_ASSERT(strategy.getHeadId() == 1);
  CPPUNIT_ASSERT(tree.getNumEdges() == 6);
  CPPUNIT_ASSERT(tree.getParent(4) == 2 && tree.getParent(7) == 3);
  CPPUNIT_ASSERT(TreeRules::getMaxDepth(tree, StructureType::TREE, 1) == 2);
  CPPUNIT_ASSERT(strategy.canBeRemovedFromStructure(7));
  CPPUNIT_ASSERT(!strategy.canBeRemovedFromStructure(3));
  // the deepest leaf with the highest id goes first
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(1) == 1);
  CPPUNIT_ASSERT(!strategy.getStructure().hasNode(7));
  // the root always stays
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(10) == 5);
  CPPUNIT_ASSERT(strategy.getStructure().getNumNodes() == 1);
  CPPUNIT_ASSERT(strategy.getStructure().hasNode(1));
}

void TopologyStrategyTest::testBalancedTree() {
  BalancedTreeTopologyStrategy strategy;
  strategy.setLinksPerMirror(3);
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 5)) == 5);
  const StructureGraph& tree = strategy.getStructure();
  CPPUNIT_ASSERT(tree.getNumChildren(1) == 3);
  // the shallowest node with room and the fewest children, lowest id first
  CPPUNIT_ASSERT(tree.getParent(5) == 2);
  strategy.addNodesToStructure(makeIds(6, 2));
  CPPUNIT_ASSERT(strategy.getStructure().getParent(6) == 3);
  CPPUNIT_ASSERT(strategy.getStructure().getParent(7) == 4);
  CPPUNIT_ASSERT(strategy.isValidPlannedStructure());
}

void TopologyStrategyTest::testDepthLimitTree() {
  DepthLimitTreeTopologyStrategy shallow(1);
  shallow.setLinksPerMirror(2);
  // a root and its two children
  CPPUNIT_ASSERT(shallow.buildStructure(makeIds(1, 5)) == 3);
  CPPUNIT_ASSERT(shallow.addNodesToStructure(makeIds(6, 1)) == 0);
  CPPUNIT_ASSERT(shallow.isValidPlannedStructure());

  DepthLimitTreeTopologyStrategy deep(3, true);
  deep.setLinksPerMirror(2);
  CPPUNIT_ASSERT(deep.getMaxDepth() == 3);
  CPPUNIT_ASSERT(deep.isPreferDepthOverBreadth());
  CPPUNIT_ASSERT(deep.buildStructure(makeIds(1, 5)) == 5);
  const StructureGraph& tree = deep.getStructure();
  CPPUNIT_ASSERT(TreeRules::getDepth(tree, 4, StructureType::TREE, 1) == 3);
  // 4 is at the depth limit, 5 goes right above it
  CPPUNIT_ASSERT(tree.getParent(5) == 3);
  CPPUNIT_ASSERT(TreeRules::getMaxDepth(tree, StructureType::TREE, 1) == 3);
}

void TopologyStrategyTest::testRing() {
  RingTopologyStrategy strategy;
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 3)) == 3);
  CPPUNIT_ASSERT(strategy.addNodesToStructure(makeIds(4, 2)) == 2);
  const StructureGraph& ring = strategy.getStructure();
  // new nodes are spliced right after the head
  CPPUNIT_ASSERT(RingRules::getNext(ring, 1, StructureType::RING, 1) == 4);
  CPPUNIT_ASSERT(RingRules::getNext(ring, 4, StructureType::RING, 1) == 5);
  CPPUNIT_ASSERT(RingRules::getNext(ring, 5, StructureType::RING, 1) == 2);
  CPPUNIT_ASSERT(RingRules::getNext(ring, 3, StructureType::RING, 1) == 1);
  NodeSet nodes = ring.getAllNodesInStructure(1, StructureType::RING, 1);
  CPPUNIT_ASSERT(ring.hasClosedCycle(nodes, StructureType::RING, 1));
  // the predecessor of the head leaves and the ring is closed again
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(1) == 1);
  CPPUNIT_ASSERT(!strategy.getStructure().hasNode(3));
  CPPUNIT_ASSERT(RingRules::getPrevious(strategy.getStructure(), 1,
          StructureType::RING, 1) == 2);
  CPPUNIT_ASSERT(strategy.isValidPlannedStructure());
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(5) == 1);
  CPPUNIT_ASSERT(RingRules::getRingSize(strategy.getStructure(),
          StructureType::RING, 1) == 3);
}

void TopologyStrategyTest::testRingTooSmall() {
  RingTopologyStrategy strategy;
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 3)) == 3);
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(2) == 0);
  CPPUNIT_ASSERT(strategy.getStructure().getNumNodes() == 3);
  CPPUNIT_ASSERT(strategy.isValidPlannedStructure());
  RingTopologyStrategy empty;
  CPPUNIT_ASSERT(empty.buildStructure(makeIds(1, 2)) == 0);
  CPPUNIT_ASSERT(empty.getHeadId() == NO_NODE);
  CPPUNIT_ASSERT(empty.getStructure().getNumNodes() == 0);
  RingTopologyStrategy bigger(5);
  CPPUNIT_ASSERT(bigger.getMinRingSize() == 5);
  CPPUNIT_ASSERT(bigger.buildStructure(makeIds(1, 4)) == 0);
  CPPUNIT_ASSERT(bigger.buildStructure(makeIds(1, 6)) == 6);
  CPPUNIT_ASSERT(bigger.removeNodesFromStructure(3) == 1);
}

void TopologyStrategyTest::testLine() {
  LineTopologyStrategy strategy;
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 4)) == 4);
  CPPUNIT_ASSERT(strategy.addNodesToStructure(makeIds(5, 1)) == 1);
  const StructureGraph& line = strategy.getStructure();
  NodeSet endpoints = line.getEndpointsOfStructure(1, StructureType::LINE, 1);
  CPPUNIT_ASSERT(endpoints.size() == 2);
  CPPUNIT_ASSERT(endpoints.count(1) == 1 && endpoints.count(5) == 1);
  CPPUNIT_ASSERT(strategy.canBeRemovedFromStructure(5));
  CPPUNIT_ASSERT(!strategy.canBeRemovedFromStructure(3));
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(10) == 3);
  CPPUNIT_ASSERT(LineRules::getTail(strategy.getStructure(), StructureType::LINE, 1) == 2);
}

void TopologyStrategyTest::testLineTooSmall() {
  LineTopologyStrategy strategy;
  CPPUNIT_ASSERT_EQUAL(0, strategy.buildStructure(makeIds(1, 1)));
  CPPUNIT_ASSERT(strategy.getHeadId() == NO_NODE);
  CPPUNIT_ASSERT_EQUAL(0, strategy.getStructure().getNumNodes());
  // a single mirror waits for a second one before the line is built
  std::shared_ptr<LineTopologyStrategy> line(new LineTopologyStrategy());
  Network network(line, 1, 2, makeTestProperties());
  NodeId first = network.getMirrors().front()->getId();
  CPPUNIT_ASSERT_EQUAL(0, network.getNumLinks());
  CPPUNIT_ASSERT(line->getHeadId() == NO_NODE);
  network.setNumMirrors(3, 1);
  CPPUNIT_ASSERT_EQUAL(3, network.getNumMirrors());
  CPPUNIT_ASSERT_EQUAL(2, network.getNumLinks());
  CPPUNIT_ASSERT(line->getHeadId() == first);
  CPPUNIT_ASSERT(line->isValidPlannedStructure());
}

void TopologyStrategyTest::testStar() {
  StarTopologyStrategy strategy;
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 2)) == 0);
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 5)) == 5);
  CPPUNIT_ASSERT(strategy.getStructure().getNumChildren(1) == 4);
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(1) == 1);
  CPPUNIT_ASSERT(!strategy.getStructure().hasNode(5));
  // a center and two leaves is the smallest star
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(5) == 1);
  CPPUNIT_ASSERT(strategy.getStructure().getNumNodes() == 3);
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(1) == 0);
}

void TopologyStrategyTest::testFullyConnected() {
  FullyConnectedTopology strategy;
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 4)) == 4);
  CPPUNIT_ASSERT(strategy.getStructure().getNumEdges() == 6);
  CPPUNIT_ASSERT(strategy.addNodesToStructure(makeIds(5, 1)) == 1);
  CPPUNIT_ASSERT(strategy.getStructure().getNumEdges() == 10);
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(2) == 2);
  CPPUNIT_ASSERT(!strategy.getStructure().hasNode(5));
  CPPUNIT_ASSERT(!strategy.getStructure().hasNode(4));
  CPPUNIT_ASSERT(strategy.getStructure().getNumEdges() == 3);
}

void TopologyStrategyTest::testNConnected() {
  NConnectedTopology strategy;
  strategy.setLinksPerMirror(3);
  CPPUNIT_ASSERT(strategy.buildStructure(makeIds(1, 6)) == 6);
  const StructureGraph& graph = strategy.getStructure();
  CPPUNIT_ASSERT(graph.getNumEdges() == 9);
  // offset 1 closes a ring, offset 2 adds the remaining chords
  BOOST_FOREACH(NodeId id, graph.getNodeIds()) {
    CPPUNIT_ASSERT(graph.getConnectivityDegree(id, StructureType::N_CONNECTED, 1) >= 2);
  }
  CPPUNIT_ASSERT(graph.hasEdge(1, 3) && graph.hasEdge(3, 5));
  CPPUNIT_ASSERT(!graph.hasEdge(4, 6));
  CPPUNIT_ASSERT(strategy.addNodesToStructure(makeIds(7, 2)) == 2);
  CPPUNIT_ASSERT(strategy.getStructure().getNumEdges() == 12);
  CPPUNIT_ASSERT(strategy.getHeadId() == 1);
  CPPUNIT_ASSERT(strategy.removeNodesFromStructure(3) == 3);
  CPPUNIT_ASSERT(!strategy.getStructure().hasNode(8));
  CPPUNIT_ASSERT(strategy.getStructure().hasNode(5));
  CPPUNIT_ASSERT(strategy.getStructure().getNumEdges() == 7);
}

void TopologyStrategyTest::testPlanningHasNoSideEffects() {
  LineTopologyStrategy strategy;
  strategy.buildStructure(makeIds(1, 3));
  StructurePlan plan = strategy.planAddNodes(makeIds(4, 2));
  CPPUNIT_ASSERT(plan.applied == 2);
  CPPUNIT_ASSERT(plan.graph.getNumNodes() == 5);
  CPPUNIT_ASSERT(strategy.getStructure().getNumNodes() == 3);
  CPPUNIT_ASSERT(plan.diff.addedNodes.size() == 2);
  CPPUNIT_ASSERT(plan.diff.addedLinks.size() == 2);
  CPPUNIT_ASSERT(plan.diff.addedLinks.count(makeLinkPair(3, 4)) == 1);
  CPPUNIT_ASSERT(plan.diff.removedLinks.empty());
  StructurePlan removal = strategy.planRemoveNodes(1);
  CPPUNIT_ASSERT(removal.applied == 1);
  CPPUNIT_ASSERT(removal.diff.removedNodes.size() == 1);
  CPPUNIT_ASSERT(removal.diff.removedNodes.front() == 3);
  CPPUNIT_ASSERT(strategy.getStructure().hasNode(3));
  strategy.commitPlan(plan);
  CPPUNIT_ASSERT(strategy.getStructure().getNumNodes() == 5);
  CPPUNIT_ASSERT(strategy.isValidPlannedStructure());
}

void TopologyStrategyTest::testDiffStructures() {
  StructureGraph before, after;
  for (NodeId i = 1; i <= 3; i++) {
    before.addNode(i);
    after.addNode(i + 1);
  }
  before.addChild(1, 2, StructureType::DEFAULT, 1);
  before.addChild(2, 3, StructureType::DEFAULT, 1);
  after.addChild(3, 2, StructureType::DEFAULT, 2);
  after.addChild(3, 4, StructureType::DEFAULT, 2);
  StructureDiff diff = diffStructures(before, after);
  CPPUNIT_ASSERT(diff.addedNodes.size() == 1 && diff.addedNodes.front() == 4);
  CPPUNIT_ASSERT(diff.removedNodes.size() == 1 && diff.removedNodes.front() == 1);
  // links are undirected: 2-3 survives even though its direction changed
  CPPUNIT_ASSERT(diff.addedLinks.size() == 1);
  CPPUNIT_ASSERT(diff.addedLinks.count(makeLinkPair(3, 4)) == 1);
  CPPUNIT_ASSERT(diff.removedLinks.size() == 1);
  CPPUNIT_ASSERT(diff.removedLinks.count(makeLinkPair(1, 2)) == 1);
  CPPUNIT_ASSERT(diffStructures(after, after).isEmpty());
}

void TopologyStrategyTest::testExecuteOnNetwork() {
  std::shared_ptr<RingTopologyStrategy> strategy(new RingTopologyStrategy());
  Network network(strategy, 5, 2, makeTestProperties());
  CPPUNIT_ASSERT(network.getNumMirrors() == 5);
  CPPUNIT_ASSERT(network.getNumLinks() == 5);
  CPPUNIT_ASSERT(strategy->isValidPlannedStructure());
  network.setNumMirrors(7, 1);
  CPPUNIT_ASSERT(network.getNumMirrors() == 7);
  CPPUNIT_ASSERT(network.getNumLinks() == 7);
  network.setNumMirrors(4, 2);
  CPPUNIT_ASSERT(network.getNumMirrors() == 4);
  CPPUNIT_ASSERT(network.getNumTargetMirrors() == 4);
  CPPUNIT_ASSERT(network.getNumLinks() == 4);
  NodeId head = strategy->getHeadId();
  const StructureGraph& ring = strategy->getStructure();
  NodeSet nodes = ring.getAllNodesInStructure(head, StructureType::RING, head);
  CPPUNIT_ASSERT(nodes.size() == 4);
  BOOST_FOREACH(NodeId id, nodes) {
    CPPUNIT_ASSERT(ring.getMirror(id) == network.getMirror(id));
  }
  CPPUNIT_ASSERT(MirrorNode::isValidMirrorStructure(ring, nodes,
          StructureType::RING, head));
  // a ring cannot shrink below three mirrors
  network.setNumMirrors(1, 3);
  CPPUNIT_ASSERT(network.getNumMirrors() == 3);
}

void TopologyStrategyTest::testInvalidPlanDiscarded() {
  std::shared_ptr<DetachedTreeStrategy> strategy(new DetachedTreeStrategy());
  Network network(strategy, 1, 2, makeTestProperties());
  NodeId root = network.getMirrors().front()->getId();
  CPPUNIT_ASSERT(strategy->getHeadId() == root);
  StructurePlan plan = strategy->planAddNodes(makeIds(100, 2));
  CPPUNIT_ASSERT_EQUAL(2, plan.applied);
  CPPUNIT_ASSERT(!strategy->isValidPlan(plan));
  CPPUNIT_ASSERT_EQUAL(0, strategy->addNodesToStructure(makeIds(100, 2)));
  CPPUNIT_ASSERT_EQUAL(0, strategy->handleAddNewMirrors(network, 2, 1));
  network.setNumMirrors(4, 1);
  // neither the structure nor the network have changed
  CPPUNIT_ASSERT_EQUAL(1, strategy->getStructure().getNumNodes());
  CPPUNIT_ASSERT(strategy->getHeadId() == root);
  CPPUNIT_ASSERT(strategy->isValidPlannedStructure());
  CPPUNIT_ASSERT_EQUAL(1, network.getNumMirrors());
  CPPUNIT_ASSERT_EQUAL(0, network.getNumLinks());
  // an invalid initial plan leaves the mirrors unconnected
  std::shared_ptr<DetachedTreeStrategy> other(new DetachedTreeStrategy());
  Network unconnected(other, 3, 2, makeTestProperties());
  CPPUNIT_ASSERT_EQUAL(3, unconnected.getNumMirrors());
  CPPUNIT_ASSERT_EQUAL(0, unconnected.getNumLinks());
  CPPUNIT_ASSERT(other->getHeadId() == NO_NODE);
  CPPUNIT_ASSERT_EQUAL(0, other->getStructure().getNumNodes());
  // an empty plan is a valid one
  StructurePlan empty = RingTopologyStrategy().planBuild(makeIds(1, 2));
  CPPUNIT_ASSERT(empty.head == NO_NODE);
  CPPUNIT_ASSERT(RingTopologyStrategy().isValidPlan(empty));
}
