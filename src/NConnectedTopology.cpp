#include "NConnectedTopology.hpp"

int NConnectedTopology::buildPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  NodeVec layout;
  BOOST_FOREACH(NodeId id, ids) {
    if (addPlannedNode(graph, id))
      layout.push_back(id);
  }
  if (layout.empty())
    return 0;
  head = layout.front();
  graph.setHead(head, getStructureType());
  int n = layout.size();
  int target = computeNumTargetLinks(n, linksPerMirror);
  LinkPairSet planned;
  for (int d = 1; d <= n / 2 && (int) planned.size() < target; d++) {
    for (int i = 0; i < n && (int) planned.size() < target; i++) {
      NodeId a = layout[i];
      NodeId b = layout[(i + d) % n];
      if (planned.insert(makeLinkPair(a, b)).second)
        connect(graph, a, b, head);
    }
  }
  BOOST_LOG_TRIVIAL(trace) << "NConnectedTopology::buildPlannedStructure() - "
          << n << " nodes, " << planned.size() << " links";
  return n;
}

NodeVec NConnectedTopology::getLayout(const StructureGraph& graph,
        NodeId head) const {
  NodeVec layout;
  layout.push_back(head);
  BOOST_FOREACH(NodeId id, graph.getAllNodesInStructure(head, getStructureType(), head)) {
    if (id != head)
      layout.push_back(id);
  }
  return layout;
}

int NConnectedTopology::rebuild(StructureGraph& graph, NodeId& head,
        const NodeVec& ids) const {
  graph.clear();
  head = NO_NODE;
  return buildPlannedStructure(graph, head, ids);
}

int NConnectedTopology::growPlannedStructure(StructureGraph& graph,
        NodeId& head, const NodeVec& ids) const {
  NodeVec layout = getLayout(graph, head);
  NodeSet present(layout.begin(), layout.end());
  int added = 0;
  BOOST_FOREACH(NodeId id, ids) {
    if (present.insert(id).second) {
      layout.push_back(id);
      added++;
    }
  }
  rebuild(graph, head, layout);
  return added;
}

int NConnectedTopology::shrinkPlannedStructure(StructureGraph& graph,
        NodeId& head, int count) const {
  NodeVec layout = getLayout(graph, head);
  int removable = std::max(0, (int) layout.size() - 1);
  if (count > removable) {
    BOOST_LOG_TRIVIAL(debug) << "NConnectedTopology::shrinkPlannedStructure() - "
            "request to remove " << count << " nodes clamped to " << removable;
    count = removable;
  }
  // the head stays in front, the highest ids are at the back
  layout.resize(layout.size() - count);
  rebuild(graph, head, layout);
  return count;
}
