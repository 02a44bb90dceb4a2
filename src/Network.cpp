#include "Network.hpp"
#include "Effector.hpp"
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/breadth_first_search.hpp>
#include <boost/graph/visitors.hpp>
#include <boost/random/uniform_int_distribution.hpp>

// undirected view of the active links, used to measure the time-to-write
typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS> LinkGraph;

Network::Network(StrategyPtr strategy, int numMirrors, int numLinksPerMirror,
        const Properties& props) : props(props), strategy(strategy) {
  this->numTargetMirrors = numMirrors;
  this->numTargetLinksPerMirror = numLinksPerMirror;
  this->currentTimeStep = 0;
  this->effector = nullptr;
  gen.seed(static_cast<boost::uint32_t> (props.getInt("seed", 0)));
  for (int i = 0; i < numMirrors; i++) {
    createMirror(idGenerator.getNextId(), 0);
  }
  if (strategy)
    strategy->initNetwork(*this, 0);
  else
    BOOST_LOG_TRIVIAL(warning) << "Network::Network() - no topology strategy, "
          << numMirrors << " mirrors left unconnected";
}

Network::~Network() {
  BOOST_FOREACH(Link* link, links) {
    delete link;
  }
  BOOST_FOREACH(Mirror* mirror, mirrors) {
    delete mirror;
  }
  BOOST_FOREACH(Mirror* mirror, stoppingMirrors) {
    delete mirror;
  }
}

SimTime Network::drawDelay(const std::string& minKey,
        const std::string& maxKey) {
  SimTime minDelay = props.getInt(minKey);
  SimTime maxDelay = props.getInt(maxKey);
  if (maxDelay < minDelay) {
    BOOST_LOG_TRIVIAL(warning) << "Network::drawDelay() - " << maxKey << "="
            << maxDelay << " is lower than " << minKey << "=" << minDelay
            << ", using " << minDelay;
    return minDelay;
  }
  boost::random::uniform_int_distribution<SimTime> delayDist(minDelay, maxDelay);
  return delayDist(gen);
}

void Network::timeStep(SimTime time) {
  currentTimeStep = time;
  BOOST_FOREACH(Mirror* mirror, mirrors) {
    mirror->timeStep(time);
  }
  BOOST_FOREACH(Mirror* mirror, stoppingMirrors) {
    mirror->timeStep(time);
  }
  // closed links go first, their endpoints are still allocated at this point
  std::vector<Link*> closedLinks;
  BOOST_FOREACH(Link* link, links) {
    if (link->isClosed())
      closedLinks.push_back(link);
    else
      link->timeStep(time);
  }
  BOOST_FOREACH(Link* link, closedLinks) {
    link->getSource()->removeLink(link);
    link->getTarget()->removeLink(link);
    links.erase(link);
    delete link;
  }
  std::vector<Mirror*> stillStopping;
  BOOST_FOREACH(Mirror* mirror, stoppingMirrors) {
    if (mirror->getState() == MirrorState::STOPPED) {
      BOOST_LOG_TRIVIAL(trace) << "Network::timeStep() - mirror "
              << mirror->getId() << " stopped";
      delete mirror;
    } else {
      stillStopping.push_back(mirror);
    }
  }
  stoppingMirrors.swap(stillStopping);
  if (effector != nullptr)
    effector->timeStep(time);
  recordHistories(time);
  BOOST_LOG_TRIVIAL(info) << "Network::timeStep() - t=" << time << " mirrors="
          << getNumMirrors() << " ready=" << getNumReadyMirrors() << " links="
          << getNumLinks() << " active=" << getNumActiveLinks() << " AL="
          << activeLinksHistory[time] << "% BW=" << bandwidthHistory[time]
          << "% TTW=" << ttwHistory[time] << "%";
}

void Network::setNumMirrors(int newMirrors, SimTime time) {
  BOOST_LOG_TRIVIAL(info) << "Network::setNumMirrors() - " << getNumMirrors()
          << " -> " << newMirrors << " at " << time;
  if (!strategy) {
    BOOST_LOG_TRIVIAL(warning) << "Network::setNumMirrors() - no topology "
            "strategy, the number of mirrors is left unchanged";
  } else if (newMirrors > getNumMirrors()) {
    strategy->handleAddNewMirrors(*this, newMirrors - getNumMirrors(), time);
  } else if (newMirrors < getNumMirrors()) {
    strategy->handleRemoveMirrors(*this, getNumMirrors() - newMirrors, time);
  }
  numTargetMirrors = newMirrors;
}

void Network::setTopologyStrategy(StrategyPtr strategy, SimTime time) {
  BOOST_LOG_TRIVIAL(info) << "Network::setTopologyStrategy() - "
          << (strategy ? strategy->getName() : "none") << " at " << time;
  this->strategy = strategy;
  if (time > 0 && strategy)
    strategy->restartNetwork(*this, time);
}

void Network::setNumTargetedLinksPerMirror(int numLinksPerMirror,
        SimTime time) {
  BOOST_LOG_TRIVIAL(info) << "Network::setNumTargetedLinksPerMirror() - "
          << numTargetLinksPerMirror << " -> " << numLinksPerMirror << " at "
          << time;
  this->numTargetLinksPerMirror = numLinksPerMirror;
  if (time > 0 && strategy)
    strategy->restartNetwork(*this, time);
}

Mirror* Network::createMirror(int id, SimTime time) {
  SimTime startupDelay = drawDelay("startup_time_min", "startup_time_max");
  SimTime readyDelay = drawDelay("ready_time_min", "ready_time_max");
  Mirror* mirror = new Mirror(id, time, startupDelay, readyDelay);
  mirrors.push_back(mirror);
  idGenerator.reserveUpTo(id);
  BOOST_LOG_TRIVIAL(trace) << "Network::createMirror() - mirror " << id
          << " started at " << time << ", ready at " << mirror->getReadyTime();
  return mirror;
}

Link* Network::createLink(Mirror* source, Mirror* target, SimTime time) {
  SimTime activationDelay = drawDelay("link_activation_time_min",
          "link_activation_time_max");
  int maxBandwidth = props.getInt("max_bandwidth");
  int bandwidth = 0;
  if (maxBandwidth > 0) {
    boost::random::uniform_int_distribution<> bwDist((maxBandwidth + 1) / 2,
            maxBandwidth);
    bandwidth = bwDist(gen);
  }
  Link* link = new Link(idGenerator.getNextId(), source, target, time,
          activationDelay, bandwidth);
  links.insert(link);
  BOOST_LOG_TRIVIAL(trace) << "Network::createLink() - link " << link->getId()
          << " (" << source->getId() << "-" << target->getId() << ") bw="
          << bandwidth << " active from " << link->getActivationTime();
  return link;
}

void Network::closeLink(Link* link) {
  link->shutdown();
}

void Network::shutdownMirror(Mirror* mirror, SimTime time) {
  std::vector<Mirror*>::iterator it = std::find(mirrors.begin(),
          mirrors.end(), mirror);
  if (it == mirrors.end()) {
    BOOST_LOG_TRIVIAL(warning) << "Network::shutdownMirror() - mirror "
            << mirror->getId() << " is not running";
    return;
  }
  mirrors.erase(it);
  mirror->shutdown(time);
  stoppingMirrors.push_back(mirror);
}

void Network::closeAllLinks() {
  BOOST_FOREACH(Link* link, links) {
    link->shutdown();
  }
}

Mirror* Network::getMirror(int id) const {
  BOOST_FOREACH(Mirror* mirror, mirrors) {
    if (mirror->getId() == id)
      return mirror;
  }
  return nullptr;
}

int Network::getPredictedBandwidth(SimTime time) const {
  int total = 0;
  BOOST_FOREACH(Link* link, links) {
    if (link->isActiveAt(time))
      total += link->getBandwidth();
  }
  return total;
}

int Network::getNumLinks() const {
  int count = 0;
  BOOST_FOREACH(Link* link, links) {
    if (!link->isClosed())
      count++;
  }
  return count;
}

int Network::getNumActiveLinks() const {
  int count = 0;
  BOOST_FOREACH(Link* link, links) {
    if (link->isActive())
      count++;
  }
  return count;
}

int Network::getNumReadyMirrors() const {
  int count = 0;
  BOOST_FOREACH(Mirror* mirror, mirrors) {
    if (mirror->isReady())
      count++;
  }
  return count;
}

int Network::getNumTargetLinks() const {
  if (!strategy)
    return 0;
  return strategy->getNumTargetLinks(*this);
}

int Network::measureTimeToWrite() const {
  int m = mirrors.size();
  if (m == 0)
    return 0;
  if (m == 1)
    return 100;
  std::map<const Mirror*, int> index;
  int root = 0;
  for (int i = 0; i < m; i++) {
    index[mirrors[i]] = i;
    const Mirror* oldest = mirrors[root];
    if (mirrors[i]->getCreationTime() < oldest->getCreationTime()
            || (mirrors[i]->getCreationTime() == oldest->getCreationTime()
            && mirrors[i]->getId() < oldest->getId()))
      root = i;
  }
  LinkGraph graph(m);
  BOOST_FOREACH(Link* link, links) {
    if (!link->isActive())
      continue;
    std::map<const Mirror*, int>::const_iterator s = index.find(link->getSource());
    std::map<const Mirror*, int>::const_iterator t = index.find(link->getTarget());
    if (s != index.end() && t != index.end())
      boost::add_edge(s->second, t->second, graph);
  }
  std::vector<int> hops(m, -1);
  hops[root] = 0;
  boost::breadth_first_search(graph, boost::vertex(root, graph),
          boost::visitor(boost::make_bfs_visitor(
          boost::record_distances(&hops[0], boost::on_tree_edge()))));
  int maxHops = 0;
  BOOST_FOREACH(int h, hops) {
    // a write cannot reach every mirror yet
    if (h < 0)
      return 0;
    maxHops = std::max(maxHops, h);
  }
  int maxTTW = (m + 1) / 2;
  if (maxTTW <= 1)
    return 100;
  int ttw = 100 - 100 * (maxHops - 1) / (maxTTW - 1);
  return std::min(100, std::max(0, ttw));
}

void Network::recordHistories(SimTime time) {
  int targetLinks = getNumTargetLinks();
  int activeLinks = getNumActiveLinks();
  activeLinksHistory[time] = targetLinks > 0 ?
          std::min(100, 100 * activeLinks / targetLinks) : 0;
  int maxBandwidth = props.getInt("max_bandwidth");
  int activeBandwidth = 0;
  BOOST_FOREACH(Link* link, links) {
    if (link->isActive())
      activeBandwidth += link->getBandwidth();
  }
  int maxTotalBandwidth = targetLinks * maxBandwidth;
  bandwidthHistory[time] = maxTotalBandwidth > 0 ?
          std::min(100, 100 * activeBandwidth / maxTotalBandwidth) : 0;
  ttwHistory[time] = measureTimeToWrite();
}
