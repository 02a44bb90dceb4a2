#include "BuildAsSubstructure.hpp"
#include "NodeKindRules.hpp"
#include "Network.hpp"
#include <iterator>

StructureDiff diffStructures(const StructureGraph& before,
        const StructureGraph& after) {
  StructureDiff diff;
  NodeVec oldNodes = before.getNodeIds();
  NodeVec newNodes = after.getNodeIds();
  std::set_difference(newNodes.begin(), newNodes.end(), oldNodes.begin(),
          oldNodes.end(), std::back_inserter(diff.addedNodes));
  std::set_difference(oldNodes.begin(), oldNodes.end(), newNodes.begin(),
          newNodes.end(), std::back_inserter(diff.removedNodes));
  LinkPairSet oldLinks = before.getLinkPairs();
  LinkPairSet newLinks = after.getLinkPairs();
  std::set_difference(newLinks.begin(), newLinks.end(), oldLinks.begin(),
          oldLinks.end(), std::inserter(diff.addedLinks, diff.addedLinks.end()));
  std::set_difference(oldLinks.begin(), oldLinks.end(), newLinks.begin(),
          newLinks.end(), std::inserter(diff.removedLinks, diff.removedLinks.end()));
  return diff;
}

BuildAsSubstructure::BuildAsSubstructure() {
  headId = NO_NODE;
  linksPerMirror = 2;
}

bool BuildAsSubstructure::disconnect(StructureGraph& graph, NodeId parent,
        NodeId child) const {
  TypeSet types;
  types.insert(getStructureType());
  return graph.removeChild(parent, child, types);
}

void BuildAsSubstructure::removePlannedNode(StructureGraph& graph,
        NodeId id) const {
  graph.setHead(id, getStructureType(), false);
  graph.removeNode(id);
}

int BuildAsSubstructure::planGrowth(StructureGraph& graph, NodeId& head,
        const NodeVec& ids) const {
  if (head == NO_NODE || !graph.hasNode(head))
    return buildPlannedStructure(graph, head, ids);
  return growPlannedStructure(graph, head, ids);
}

StructurePlan BuildAsSubstructure::planBuild(const NodeVec& ids) const {
  StructurePlan plan;
  plan.head = NO_NODE;
  plan.applied = buildPlannedStructure(plan.graph, plan.head, ids);
  plan.diff = diffStructures(structure, plan.graph);
  BOOST_LOG_TRIVIAL(debug) << "BuildAsSubstructure::planBuild() - " << getName()
          << " placed " << plan.applied << "/" << ids.size() << " nodes, "
          << plan.diff.addedLinks.size() << " links to add";
  return plan;
}

StructurePlan BuildAsSubstructure::planAddNodes(const NodeVec& ids) const {
  StructurePlan plan;
  plan.graph = structure;
  plan.head = headId;
  plan.applied = planGrowth(plan.graph, plan.head, ids);
  plan.diff = diffStructures(structure, plan.graph);
  BOOST_LOG_TRIVIAL(debug) << "BuildAsSubstructure::planAddNodes() - "
          << getName() << " added " << plan.applied << "/" << ids.size()
          << " nodes, +" << plan.diff.addedLinks.size() << "/-"
          << plan.diff.removedLinks.size() << " links";
  return plan;
}

StructurePlan BuildAsSubstructure::planRemoveNodes(int count) const {
  StructurePlan plan;
  plan.graph = structure;
  plan.head = headId;
  plan.applied = 0;
  if (count > 0 && headId != NO_NODE)
    plan.applied = shrinkPlannedStructure(plan.graph, plan.head, count);
  plan.diff = diffStructures(structure, plan.graph);
  BOOST_LOG_TRIVIAL(debug) << "BuildAsSubstructure::planRemoveNodes() - "
          << getName() << " removed " << plan.applied << "/" << count
          << " nodes, +" << plan.diff.addedLinks.size() << "/-"
          << plan.diff.removedLinks.size() << " links";
  return plan;
}

bool BuildAsSubstructure::isValidPlan(const StructurePlan& plan) const {
  if (plan.head == NO_NODE)
    return plan.graph.getNumNodes() == 0;
  if (!::isValidPlannedStructure(plan.graph, getStructureType(), plan.head))
    return false;
  NodeSet nodes = plan.graph.getAllNodesInStructure(plan.head,
          getStructureType(), plan.head);
  return (int) nodes.size() == plan.graph.getNumNodes();
}

bool BuildAsSubstructure::checkPlan(const StructurePlan& plan,
        const char* caller) const {
  if (isValidPlan(plan))
    return true;
  BOOST_LOG_TRIVIAL(error) << "BuildAsSubstructure::" << caller << "() - "
          << getName() << " planned an invalid structure of "
          << plan.graph.getNumNodes() << " nodes, the plan is discarded";
  return false;
}

void BuildAsSubstructure::commitPlan(const StructurePlan& plan) {
  structure = plan.graph;
  headId = plan.head;
}

void BuildAsSubstructure::executeDiff(Network& network,
        const StructureDiff& diff, SimTime time) {
  BOOST_FOREACH(const LinkPair& pair, diff.removedLinks) {
    Mirror* a = network.getMirror(pair.first);
    Mirror* b = network.getMirror(pair.second);
    if (a == nullptr || b == nullptr)
      continue;
    BOOST_FOREACH(Link* link, a->getLinksTo(b)) {
      network.closeLink(link);
    }
  }
  BOOST_FOREACH(NodeId id, diff.removedNodes) {
    Mirror* mirror = network.getMirror(id);
    if (mirror != nullptr)
      network.shutdownMirror(mirror, time);
  }
  BOOST_FOREACH(NodeId id, diff.addedNodes) {
    if (network.getMirror(id) == nullptr)
      network.createMirror(id, time);
  }
  BOOST_FOREACH(NodeId id, structure.getNodeIds()) {
    structure.setMirror(id, network.getMirror(id));
  }
  BOOST_FOREACH(const LinkPair& pair, diff.addedLinks) {
    Mirror* a = network.getMirror(pair.first);
    Mirror* b = network.getMirror(pair.second);
    if (a == nullptr || b == nullptr) {
      BOOST_LOG_TRIVIAL(warning) << "BuildAsSubstructure::executeDiff() - no "
              "mirror for planned link " << pair.first << "-" << pair.second;
      continue;
    }
    if (!a->isLinkedWith(b))
      network.createLink(a, b, time);
  }
}

int BuildAsSubstructure::buildStructure(const NodeVec& ids) {
  StructurePlan plan = planBuild(ids);
  if (!checkPlan(plan, "buildStructure"))
    return 0;
  commitPlan(plan);
  return plan.applied;
}

int BuildAsSubstructure::addNodesToStructure(const NodeVec& ids) {
  StructurePlan plan = planAddNodes(ids);
  if (!checkPlan(plan, "addNodesToStructure"))
    return 0;
  commitPlan(plan);
  return plan.applied;
}

int BuildAsSubstructure::removeNodesFromStructure(int count) {
  StructurePlan plan = planRemoveNodes(count);
  if (!checkPlan(plan, "removeNodesFromStructure"))
    return 0;
  commitPlan(plan);
  return plan.applied;
}

bool BuildAsSubstructure::canBeRemovedFromStructure(NodeId id) const {
  if (headId == NO_NODE)
    return false;
  return ::canBeRemovedFromStructure(structure, id, getStructureType(), headId);
}

bool BuildAsSubstructure::isValidPlannedStructure() const {
  if (headId == NO_NODE)
    return false;
  return ::isValidPlannedStructure(structure, getStructureType(), headId);
}

void BuildAsSubstructure::initNetwork(Network& network, SimTime time) {
  linksPerMirror = network.getNumTargetLinksPerMirror();
  NodeVec ids;
  BOOST_FOREACH(Mirror* mirror, network.getMirrors()) {
    ids.push_back(mirror->getId());
  }
  StructurePlan plan = planBuild(ids);
  if (!checkPlan(plan, "initNetwork"))
    return;
  if (plan.applied < (int) ids.size()) {
    BOOST_LOG_TRIVIAL(warning) << "BuildAsSubstructure::initNetwork() - "
            << getName() << " could only place " << plan.applied << " of "
            << ids.size() << " mirrors";
  }
  // every Link is planned again, whatever was built before
  network.closeAllLinks();
  plan.diff = diffStructures(StructureGraph(), plan.graph);
  commitPlan(plan);
  executeDiff(network, plan.diff, time);
  BOOST_LOG_TRIVIAL(info) << "BuildAsSubstructure::initNetwork() - " << getName()
          << " over " << plan.applied << " mirrors, "
          << network.getNumLinks() << " links";
}

void BuildAsSubstructure::restartNetwork(Network& network, SimTime time) {
  BOOST_LOG_TRIVIAL(info) << "BuildAsSubstructure::restartNetwork() - "
          << getName() << " at " << time;
  initNetwork(network, time);
}

int BuildAsSubstructure::handleAddNewMirrors(Network& network, int newMirrors,
        SimTime time) {
  if (newMirrors <= 0)
    return 0;
  linksPerMirror = network.getNumTargetLinksPerMirror();
  NodeVec ids;
  int unplaced = 0;
  if (headId == NO_NODE) {
    // nothing built yet: the mirrors already there join the new ones
    BOOST_FOREACH(Mirror* mirror, network.getMirrors()) {
      ids.push_back(mirror->getId());
    }
    unplaced = ids.size();
  }
  for (int i = 0; i < newMirrors; i++) {
    ids.push_back(network.getIdGenerator().getNextId());
  }
  StructurePlan plan = planAddNodes(ids);
  if (!checkPlan(plan, "handleAddNewMirrors"))
    return 0;
  plan.applied = std::max(0, plan.applied - unplaced);
  if (plan.applied < newMirrors) {
    BOOST_LOG_TRIVIAL(warning) << "BuildAsSubstructure::handleAddNewMirrors() - "
            << getName() << " could only add " << plan.applied << " of "
            << newMirrors << " mirrors";
  }
  commitPlan(plan);
  executeDiff(network, plan.diff, time);
  return plan.applied;
}

int BuildAsSubstructure::handleRemoveMirrors(Network& network,
        int removeMirrors, SimTime time) {
  if (removeMirrors <= 0)
    return 0;
  linksPerMirror = network.getNumTargetLinksPerMirror();
  StructurePlan plan = planRemoveNodes(removeMirrors);
  if (!checkPlan(plan, "handleRemoveMirrors"))
    return 0;
  if (plan.applied < removeMirrors) {
    BOOST_LOG_TRIVIAL(warning) << "BuildAsSubstructure::handleRemoveMirrors() - "
            << getName() << " could only remove " << plan.applied << " of "
            << removeMirrors << " mirrors";
  }
  commitPlan(plan);
  executeDiff(network, plan.diff, time);
  return plan.applied;
}
