/*
 * File:   NodeKindRulesTest.hpp
 * Author: dipascae
 *
 * Created on 27-Mar-2014, 11:05:32
 */

#ifndef NODEKINDRULESTEST_HPP
#define	NODEKINDRULESTEST_HPP

#include <cppunit/extensions/HelperMacros.h>

class NodeKindRulesTest : public CPPUNIT_NS::TestFixture {
  CPPUNIT_TEST_SUITE(NodeKindRulesTest);

  CPPUNIT_TEST(testRulesTable);
  CPPUNIT_TEST(testTree);
  CPPUNIT_TEST(testRing);
  CPPUNIT_TEST(testLine);
  CPPUNIT_TEST(testStar);
  CPPUNIT_TEST(testGeneric);
  CPPUNIT_TEST(testRealisedStructure);

  CPPUNIT_TEST_SUITE_END();

public:
  NodeKindRulesTest();
  virtual ~NodeKindRulesTest();
  void setUp();
  void tearDown();

private:
  void testRulesTable();
  void testTree();
  void testRing();
  void testLine();
  void testStar();
  void testGeneric();
  void testRealisedStructure();

};

#endif	/* NODEKINDRULESTEST_HPP */

