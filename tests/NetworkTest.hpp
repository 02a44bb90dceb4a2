/*
 * File:   NetworkTest.hpp
 * Author: dipascae
 *
 * Created on 31-Mar-2014, 10:32:16
 */

#ifndef NETWORKTEST_HPP
#define	NETWORKTEST_HPP

#include <cppunit/extensions/HelperMacros.h>

class NetworkTest : public CPPUNIT_NS::TestFixture {
  CPPUNIT_TEST_SUITE(NetworkTest);

  CPPUNIT_TEST(testInitialTopology);
  CPPUNIT_TEST(testActivation);
  CPPUNIT_TEST(testSingleMirror);
  CPPUNIT_TEST(testShrink);
  CPPUNIT_TEST(testCloseAllLinks);
  CPPUNIT_TEST(testTopologyChange);
  CPPUNIT_TEST(testTopologyChangeAtStart);
  CPPUNIT_TEST(testTargetLinksChange);
  CPPUNIT_TEST(testMissingProperties);
  CPPUNIT_TEST(testInvertedDelayRange);
  CPPUNIT_TEST(testSeededBandwidth);
  CPPUNIT_TEST(testPredictedBandwidth);
  CPPUNIT_TEST(testScheduledChange);
  CPPUNIT_TEST(testRandomReconfiguration);

  CPPUNIT_TEST_SUITE_END();

public:
  NetworkTest();
  virtual ~NetworkTest();
  void setUp();
  void tearDown();

private:
  void testInitialTopology();
  void testActivation();
  void testSingleMirror();
  void testShrink();
  void testCloseAllLinks();
  void testTopologyChange();
  void testTopologyChangeAtStart();
  void testTargetLinksChange();
  void testMissingProperties();
  void testInvertedDelayRange();
  void testSeededBandwidth();
  void testPredictedBandwidth();
  void testScheduledChange();
  void testRandomReconfiguration();

};

#endif	/* NETWORKTEST_HPP */

