/*
 * File:   TopologyStrategyTest.hpp
 * Author: dipascae
 *
 * Created on 28-Mar-2014, 09:17:55
 */

#ifndef TOPOLOGYSTRATEGYTEST_HPP
#define	TOPOLOGYSTRATEGYTEST_HPP

#include <cppunit/extensions/HelperMacros.h>
#include "BuildAsSubstructure.hpp"

class TopologyStrategyTest : public CPPUNIT_NS::TestFixture {
  CPPUNIT_TEST_SUITE(TopologyStrategyTest);

  CPPUNIT_TEST(testFactory);
  CPPUNIT_TEST(testTargetLinkFormulas);
  CPPUNIT_TEST(testRandomGrowAndShrink);
  CPPUNIT_TEST(testTree);
  CPPUNIT_TEST(testBalancedTree);
  CPPUNIT_TEST(testDepthLimitTree);
  CPPUNIT_TEST(testRing);
  CPPUNIT_TEST(testRingTooSmall);
  CPPUNIT_TEST(testLine);
  CPPUNIT_TEST(testLineTooSmall);
  CPPUNIT_TEST(testStar);
  CPPUNIT_TEST(testFullyConnected);
  CPPUNIT_TEST(testNConnected);
  CPPUNIT_TEST(testPlanningHasNoSideEffects);
  CPPUNIT_TEST(testDiffStructures);
  CPPUNIT_TEST(testExecuteOnNetwork);
  CPPUNIT_TEST(testInvalidPlanDiscarded);

  CPPUNIT_TEST_SUITE_END();

public:
  TopologyStrategyTest();
  virtual ~TopologyStrategyTest();
  void setUp();
  void tearDown();

private:
  /**
   * Smallest structure the named topology can shrink to.
   */
  int getMinimumSize(const std::string& name) const;
  NodeVec makeIds(NodeId first, int count) const;
  int countNodes(const BuildAsSubstructure& strategy) const;

  void testFactory();
  void testTargetLinkFormulas();
  void testRandomGrowAndShrink();
  void testTree();
  void testBalancedTree();
  void testDepthLimitTree();
  void testRing();
  void testRingTooSmall();
  void testLine();
  void testLineTooSmall();
  void testStar();
  void testFullyConnected();
  void testNConnected();
  void testPlanningHasNoSideEffects();
  void testDiffStructures();
  void testExecuteOnNetwork();
  void testInvalidPlanDiscarded();

};

#endif	/* TOPOLOGYSTRATEGYTEST_HPP */

