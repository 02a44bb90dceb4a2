#include "Action.hpp"
#include "Effect.hpp"
#include <boost/lexical_cast.hpp>

Action::Action(Network* network, int id, SimTime time) {
  this->network = network;
  this->id = id;
  this->time = time;
}

Effect Action::getEffect() const {
  return Effect(*this);
}

std::string Action::toString() const {
  return "id=" + boost::lexical_cast<std::string>(id) + ", t="
          + boost::lexical_cast<std::string>(time);
}

std::string MirrorChange::toString() const {
  return "MirrorChange{" + Action::toString() + ", mirrors="
          + boost::lexical_cast<std::string>(newMirrors) + "}";
}

std::string TargetLinkChange::toString() const {
  return "TargetLinkChange{" + Action::toString() + ", linksPerMirror="
          + boost::lexical_cast<std::string>(newLinksPerMirror) + "}";
}

std::string TopologyChange::toString() const {
  return "TopologyChange{" + Action::toString() + ", topology="
          + (newTopology ? newTopology->getName() : std::string("none")) + "}";
}
