/*
 * File:   MirrorNodeTest.cpp
 * Author: dipascae
 *
 * Created on 26-Mar-2014, 14:20:47
 */

#include "MirrorNodeTest.hpp"
#include "MirrorNode.hpp"

CPPUNIT_TEST_SUITE_REGISTRATION(MirrorNodeTest);

MirrorNodeTest::MirrorNodeTest() {
}

MirrorNodeTest::~MirrorNodeTest() {
}

void MirrorNodeTest::setUp() {
  // a line 1 -> 2 -> 3, where only 1-2 has been implemented
  graph = new StructureGraph();
  m1 = new Mirror(1, 0, 1, 1);
  m2 = new Mirror(2, 0, 1, 1);
  m3 = new Mirror(3, 0, 1, 1);
  external = new Mirror(9, 0, 1, 1);
  for (NodeId i = 1; i <= 3; i++)
    graph->addNode(i, NodeKind::LINE, 1);
  graph->setHead(1, StructureType::LINE);
  graph->addChild(1, 2, StructureType::LINE, 1);
  graph->addChild(2, 3, StructureType::LINE, 1);
  graph->setMirror(1, m1);
  graph->setMirror(2, m2);
  graph->setMirror(3, m3);
  connect(m1, m2);
}

void MirrorNodeTest::tearDown() {
  BOOST_FOREACH(Link* link, links) {
    delete link;
  }
  links.clear();
  delete m1;
  delete m2;
  delete m3;
  delete external;
  delete graph;
}

Link* MirrorNodeTest::connect(Mirror* a, Mirror* b) {
  Link* link = new Link(100 + links.size(), a, b, 0, 1, 10);
  links.push_back(link);
  return link;
}

void MirrorNodeTest::testPendingLinks() {
  MirrorNode n1(*graph, 1), n2(*graph, 2), n3(*graph, 3);
  CPPUNIT_ASSERT(n2.getType() == StructureType::LINE);
  CPPUNIT_ASSERT(n3.getHead() == 1);
  CPPUNIT_ASSERT(n1.getNumPlannedLinks() == 1);
  CPPUNIT_ASSERT(n2.getNumPlannedLinks() == 2);
  CPPUNIT_ASSERT(n3.getNumPlannedLinks() == 1);
  CPPUNIT_ASSERT(n1.getNumPendingLinks() == 0);
  CPPUNIT_ASSERT(n2.getNumPendingLinks() == 1);
  CPPUNIT_ASSERT(n3.getNumPendingLinks() == 1);
  CPPUNIT_ASSERT(n3.getNumImplementedLinks() == 0);
  // a node without mirror has nothing implemented
  graph->setMirror(3, nullptr);
  CPPUNIT_ASSERT(n3.getMirror() == nullptr);
  CPPUNIT_ASSERT(n3.getNumImplementedLinks() == 0);
  CPPUNIT_ASSERT(n3.getNumPendingLinks() == 1);
}

void MirrorNodeTest::testIsLinkedWith() {
  MirrorNode n1(*graph, 1), n2(*graph, 2), n3(*graph, 3);
  CPPUNIT_ASSERT(n1.isLinkedWith(n2));
  CPPUNIT_ASSERT(n2.isLinkedWith(n1));
  // planned but not implemented
  CPPUNIT_ASSERT(!n2.isLinkedWith(n3));
  // implemented but not planned
  connect(m1, m3);
  CPPUNIT_ASSERT(!n1.isLinkedWith(n3));
  // closed links do not count
  links.front()->shutdown();
  CPPUNIT_ASSERT(!n1.isLinkedWith(n2));
}

void MirrorNodeTest::testStructureMirrors() {
  MirrorNode n2(*graph, 2);
  NodeSet nodes = n2.getStructureNodes();
  CPPUNIT_ASSERT(nodes.size() == 3);
  MirrorVec mirrors = n2.getMirrorsOfStructure();
  CPPUNIT_ASSERT(mirrors.size() == 3);
  CPPUNIT_ASSERT(mirrors[0] == m1 && mirrors[2] == m3);
  MirrorVec endpoints = n2.getMirrorsOfEndpoints();
  CPPUNIT_ASSERT(endpoints.size() == 2);
  CPPUNIT_ASSERT(endpoints[0] == m1 && endpoints[1] == m3);
}

void MirrorNodeTest::testEdgeLinks() {
  MirrorNode n1(*graph, 1);
  Link* out = connect(m3, external);
  LinkSet internal = n1.getLinksOfStructure();
  CPPUNIT_ASSERT(internal.size() == 1);
  CPPUNIT_ASSERT(*internal.begin() == links.front());
  LinkSet edge = n1.getEdgeLinks();
  CPPUNIT_ASSERT(edge.size() == 1);
  CPPUNIT_ASSERT(*edge.begin() == out);
  CPPUNIT_ASSERT(n1.getNumEdgeLinks() == 1);
}

void MirrorNodeTest::testValidMirrorStructure() {
  NodeSet nodes = graph->getAllNodesInStructure(1, StructureType::LINE, 1);
  CPPUNIT_ASSERT(!MirrorNode::isValidMirrorStructure(*graph, nodes,
          StructureType::LINE, 1));
  connect(m2, m3);
  CPPUNIT_ASSERT(MirrorNode::isValidMirrorStructure(*graph, nodes,
          StructureType::LINE, 1));
  // a mirror being shut down invalidates the structure
  m3->shutdown(1);
  CPPUNIT_ASSERT(!MirrorNode::isValidMirrorStructure(*graph, nodes,
          StructureType::LINE, 1));
}

void MirrorNodeTest::testClosedLinks() {
  MirrorNode n1(*graph, 1), n2(*graph, 2);
  Link* out = connect(m1, external);
  CPPUNIT_ASSERT(n1.getNumImplementedLinks() == 2);
  CPPUNIT_ASSERT(n1.getNumEdgeLinks() == 1);
  // closed links stay attached to their mirrors until the next time step
  links.front()->shutdown();
  out->shutdown();
  CPPUNIT_ASSERT(m1->getLinks().size() == 2);
  CPPUNIT_ASSERT(m1->getNumLinks() == 0);
  CPPUNIT_ASSERT(n1.getNumImplementedLinks() == 0);
  CPPUNIT_ASSERT(n1.getNumPendingLinks() == 1);
  CPPUNIT_ASSERT(n2.getNumPendingLinks() == 2);
  CPPUNIT_ASSERT(n1.getLinksOfStructure().empty());
  CPPUNIT_ASSERT(n1.getEdgeLinks().empty());
}
