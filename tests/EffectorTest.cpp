/*
 * File:   EffectorTest.cpp
 * Author: dipascae
 *
 * Created on 01-Apr-2014, 15:02:44
 */

#include <string>
#include <vector>
#include <boost/lexical_cast.hpp>
#include "EffectorTest.hpp"
#include "TestUtils.hpp"
#include "Network.hpp"
#include "Effector.hpp"

CPPUNIT_TEST_SUITE_REGISTRATION(EffectorTest);

namespace {

/**
 * A Network with no mirrors that only records the changes it is asked for.
 */
class RecordingNetwork : public Network {
public:
  std::vector<std::string> calls;

  RecordingNetwork() : Network(StrategyPtr(), 0, 2, Properties()) {
  }

  virtual void setNumMirrors(int newMirrors, SimTime time) {
    calls.push_back("mirrors " + boost::lexical_cast<std::string>(newMirrors));
  }

  virtual void setTopologyStrategy(StrategyPtr strategy, SimTime time) {
    calls.push_back("topology " + strategy->getName());
  }

  virtual void setNumTargetedLinksPerMirror(int numLinksPerMirror,
          SimTime time) {
    calls.push_back("links " + boost::lexical_cast<std::string>(numLinksPerMirror));
  }
};

}

EffectorTest::EffectorTest() {
}

EffectorTest::~EffectorTest() {
}

void EffectorTest::setUp() {
}

void EffectorTest::tearDown() {
}

void EffectorTest::testApplicationOrder() {
  RecordingNetwork network;
  Effector effector(&network);
  effector.setTargetLinksPerMirror(4, 3);
  effector.setMirrors(8, 3);
  effector.setStrategy(makeTopologyStrategy("ring"), 3);
  CPPUNIT_ASSERT_EQUAL(3, effector.getNumPendingActions());
  effector.timeStep(3);
  CPPUNIT_ASSERT_EQUAL(3, (int) network.calls.size());
  CPPUNIT_ASSERT_EQUAL(std::string("topology ring"), network.calls[0]);
  CPPUNIT_ASSERT_EQUAL(std::string("mirrors 8"), network.calls[1]);
  CPPUNIT_ASSERT_EQUAL(std::string("links 4"), network.calls[2]);
}

void EffectorTest::testOnlyScheduledTime() {
  RecordingNetwork network;
  Effector effector(&network);
  effector.setMirrors(8, 5);
  effector.setTargetLinksPerMirror(3, 6);
  effector.timeStep(4);
  CPPUNIT_ASSERT(network.calls.empty());
  effector.timeStep(5);
  CPPUNIT_ASSERT_EQUAL(1, (int) network.calls.size());
  CPPUNIT_ASSERT_EQUAL(std::string("mirrors 8"), network.calls[0]);
  effector.timeStep(6);
  CPPUNIT_ASSERT_EQUAL(std::string("links 3"), network.calls.back());
}

void EffectorTest::testReplacement() {
  RecordingNetwork network;
  Effector effector(&network);
  MirrorChangePtr first = effector.setMirrors(5, 2);
  MirrorChangePtr second = effector.setMirrors(7, 2);
  CPPUNIT_ASSERT_EQUAL(1, effector.getNumPendingActions());
  // the replaced action cannot withdraw its successor
  effector.removeAction(first);
  CPPUNIT_ASSERT_EQUAL(1, effector.getNumPendingActions());
  effector.timeStep(2);
  CPPUNIT_ASSERT_EQUAL(1, (int) network.calls.size());
  CPPUNIT_ASSERT_EQUAL(std::string("mirrors 7"), network.calls[0]);
  CPPUNIT_ASSERT(second->getNewMirrors() == 7);
}

void EffectorTest::testRemoveAction() {
  RecordingNetwork network;
  Effector effector(&network);
  TopologyChangePtr topology = effector.setStrategy(makeTopologyStrategy("star"), 4);
  TargetLinkChangePtr links = effector.setTargetLinksPerMirror(2, 4);
  effector.removeAction(topology);
  CPPUNIT_ASSERT_EQUAL(1, effector.getNumPendingActions());
  // removing twice, or removing nothing, is harmless
  effector.removeAction(topology);
  effector.removeAction(ActionPtr());
  CPPUNIT_ASSERT_EQUAL(1, effector.getNumPendingActions());
  effector.timeStep(4);
  CPPUNIT_ASSERT_EQUAL(1, (int) network.calls.size());
  CPPUNIT_ASSERT_EQUAL(std::string("links 2"), network.calls[0]);
  CPPUNIT_ASSERT_EQUAL(0, effector.getNumPendingActions());
  // already applied
  effector.removeAction(links);
  CPPUNIT_ASSERT_EQUAL(0, effector.getNumPendingActions());
}

void EffectorTest::testAppliedActionsDropped() {
  RecordingNetwork network;
  Effector effector(&network);
  for (SimTime t = 1; t <= 50; t++)
    effector.setMirrors(t, t);
  effector.setTargetLinksPerMirror(3, 10);
  CPPUNIT_ASSERT_EQUAL(51, effector.getNumPendingActions());
  for (SimTime t = 1; t <= 10; t++)
    effector.timeStep(t);
  CPPUNIT_ASSERT_EQUAL(40, effector.getNumPendingActions());
  CPPUNIT_ASSERT_EQUAL(11, (int) network.calls.size());
  // a repeated time step applies nothing
  effector.timeStep(10);
  CPPUNIT_ASSERT_EQUAL(11, (int) network.calls.size());
  for (SimTime t = 11; t <= 50; t++)
    effector.timeStep(t);
  CPPUNIT_ASSERT_EQUAL(0, effector.getNumPendingActions());
  CPPUNIT_ASSERT_EQUAL(std::string("mirrors 50"), network.calls.back());
}

void EffectorTest::testPastTimesRejected() {
  Network network(makeTopologyStrategy("ring"), 4, 2, makeTestProperties());
  Effector effector(&network);
  network.setEffector(&effector);
  CPPUNIT_ASSERT(!effector.setMirrors(6, -1));
  CPPUNIT_ASSERT(!effector.setStrategy(makeTopologyStrategy("star"), 0));
  CPPUNIT_ASSERT(!effector.setTargetLinksPerMirror(3, 0));
  CPPUNIT_ASSERT_EQUAL(0, effector.getNumPendingActions());
  CPPUNIT_ASSERT(effector.setMirrors(6, 1));
  network.timeStep(1);
  CPPUNIT_ASSERT_EQUAL(6, network.getNumMirrors());
  CPPUNIT_ASSERT_EQUAL(0, effector.getNumPendingActions());
  // the current time step is over as well
  CPPUNIT_ASSERT(!effector.setMirrors(2, 1));
  TargetLinkChangePtr next = effector.setTargetLinksPerMirror(3, 2);
  CPPUNIT_ASSERT(next);
  CPPUNIT_ASSERT_EQUAL(1, effector.getNumPendingActions());
  network.timeStep(2);
  CPPUNIT_ASSERT_EQUAL(3, network.getNumTargetLinksPerMirror());
}

void EffectorTest::testActionIds() {
  RecordingNetwork network;
  Effector effector(&network);
  CPPUNIT_ASSERT(effector.getNetwork() == &network);
  MirrorChangePtr a = effector.setMirrors(3, 1);
  MirrorChangePtr b = effector.setMirrors(4, 2);
  TargetLinkChangePtr c = effector.setTargetLinksPerMirror(1, 2);
  CPPUNIT_ASSERT(a->getId() < b->getId() && b->getId() < c->getId());
  CPPUNIT_ASSERT(a->getTime() == 1 && b->getTime() == 2);
  CPPUNIT_ASSERT(a->getNetwork() == &network);
  CPPUNIT_ASSERT(c->getType() == ActionType::TARGET_LINK_CHANGE);
  CPPUNIT_ASSERT(!a->toString().empty());
}
