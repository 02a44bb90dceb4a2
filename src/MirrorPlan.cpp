/*
 * File:   MirrorPlan.cpp
 * Author: emanuele
 *
 * Created on 24 March 2014, 10:02
 */

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "MirrorPlan.hpp"
#include "Properties.hpp"
#include "Network.hpp"
#include "Effector.hpp"
#include "Effect.hpp"
#include "boost/date_time/posix_time/posix_time.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions.hpp>

/* Splits a "time:value" schedule entry.
 */
bool parseScheduleEntry(const std::string& entry, SimTime& time,
        std::string& value) {
  size_t colon = entry.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == entry.size()) {
    BOOST_LOG_TRIVIAL(error) << "MirrorPlan::parseScheduleEntry() - malformed "
            "entry " << entry << ", expected time:value";
    return false;
  }
  try {
    time = boost::lexical_cast<SimTime>(entry.substr(0, colon));
  } catch (const boost::bad_lexical_cast& e) {
    BOOST_LOG_TRIVIAL(error) << "MirrorPlan::parseScheduleEntry() - invalid "
            "time in " << entry;
    return false;
  }
  if (time < 1) {
    BOOST_LOG_TRIVIAL(error) << "MirrorPlan::parseScheduleEntry() - time in "
            << entry << " is before the first time step";
    return false;
  }
  value = entry.substr(colon + 1);
  return true;
}

bool parseIntValue(const std::string& entry, const std::string& value,
        int& result) {
  try {
    result = boost::lexical_cast<int>(value);
  } catch (const boost::bad_lexical_cast& e) {
    BOOST_LOG_TRIVIAL(error) << "MirrorPlan::parseIntValue() - invalid "
            "value in " << entry;
    return false;
  }
  return true;
}

/* Logs the predicted impact of a freshly scheduled Action, false if the
 * Effector refused it.
 */
bool logEffect(const ActionPtr& action, const Properties& props) {
  if (!action)
    return false;
  Effect effect = action->getEffect();
  BOOST_LOG_TRIVIAL(info) << "MirrorPlan::logEffect() - " << action->toString()
          << ": latency=" << effect.getLatency()
          << " dAL=" << effect.getDeltaActiveLinks()
          << " dBW=" << effect.getDeltaBandwidth(props)
          << " dTTW=" << effect.getDeltaTimeToWrite();
  return true;
}

/* Schedules the actions given on the command line.
 */
bool scheduleActions(po::variables_map& vm, Effector& effector,
        const Properties& props) {
  typedef std::vector<std::string> EntryVec;
  SimTime time;
  std::string value;
  if (vm.count("topology-change")) {
    BOOST_FOREACH(const std::string& entry, vm["topology-change"].as<EntryVec>()) {
      if (!parseScheduleEntry(entry, time, value))
        return false;
      StrategyPtr strategy = makeTopologyStrategy(value);
      if (!strategy)
        return false;
      if (!logEffect(effector.setStrategy(strategy, time), props))
        return false;
    }
  }
  if (vm.count("mirror-change")) {
    BOOST_FOREACH(const std::string& entry, vm["mirror-change"].as<EntryVec>()) {
      int mirrors;
      if (!parseScheduleEntry(entry, time, value)
              || !parseIntValue(entry, value, mirrors))
        return false;
      if (!logEffect(effector.setMirrors(mirrors, time), props))
        return false;
    }
  }
  if (vm.count("link-change")) {
    BOOST_FOREACH(const std::string& entry, vm["link-change"].as<EntryVec>()) {
      int linksPerMirror;
      if (!parseScheduleEntry(entry, time, value)
              || !parseIntValue(entry, value, linksPerMirror))
        return false;
      if (!logEffect(effector.setTargetLinksPerMirror(linksPerMirror, time),
              props))
        return false;
    }
  }
  return true;
}

/* Output the histories collected during the simulation into a file
 */
bool printToFile(po::variables_map& vm, const Network& network) {
  using namespace std;
  using namespace boost::posix_time;
  string outFileName = vm["output"].as<string>();
  ptime now = second_clock::universal_time();
  ofstream outputF;
  outputF.open(outFileName.c_str(), ios::out | ios::app);
  if (!outputF.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "MirrorPlan::printToFile() - could not open "
            "output file " << outFileName;
    return false;
  }
  outputF << "% " << to_simple_string(now) << " - Simulation of a "
          << vm["topology"].as<string>() << " network" << endl;
  outputF << "% Parameters: -m " << vm["mirrors"].as<uint>()
          << " -l " << vm["links-per-mirror"].as<uint>()
          << " -T " << vm["sim-time"].as<uint>() << endl;
  outputF << "t AL% BW% TTW%" << endl;
  const History& activeLinks = network.getActiveLinksHistory();
  const History& bandwidth = network.getBandwidthHistory();
  const History& ttw = network.getTtwHistory();
  BOOST_FOREACH(const History::value_type& h, activeLinks) {
    History::const_iterator bw = bandwidth.find(h.first);
    History::const_iterator tw = ttw.find(h.first);
    outputF << h.first << " " << h.second << " "
            << (bw == bandwidth.end() ? 0 : bw->second) << " "
            << (tw == ttw.end() ? 0 : tw->second) << endl;
  }
  outputF << endl;
  outputF.close();
  return true;
}

/*
 *
 */
int main(int argc, char** argv) {
  namespace logging = boost::log;

  po::options_description clo("Command line options");
  clo.add_options()
          ("help", "show this help message")
          ("props,p", po::value<std::string>()->default_value("mirrorplan.properties"),
              "property file with delays and bandwidth of the network")
          ("topology,t", po::value<std::string>()->default_value("balanced-tree"),
              "initial topology [tree, balanced-tree, depth-limit-tree, ring, "
              "line, star, fully-connected, n-connected]")
          ("mirrors,m", po::value<uint>()->default_value(10),
              "initial number of mirrors")
          ("links-per-mirror,l", po::value<uint>()->default_value(2),
              "initial number of target links per mirror")
          ("sim-time,T", po::value<uint>()->default_value(100),
              "number of time steps to simulate")
          ("mirror-change,M", po::value< std::vector<std::string> >()->composing(),
              "schedule a change of the number of mirrors, as time:mirrors")
          ("link-change,L", po::value< std::vector<std::string> >()->composing(),
              "schedule a change of the target links per mirror, as time:links")
          ("topology-change,C", po::value< std::vector<std::string> >()->composing(),
              "schedule a change of topology, as time:topology")
          ("seed,S", po::value<unsigned long>(),
              "Seed to be used with the pseudo-random generator, overrides "
              "the seed property")
          ("output,o", po::value<std::string>()->default_value("mirrorplan.out"),
              "Name of the output file with the results")
          ("debug-verbose,d", po::value<uint>()->default_value(logging::trivial::warning),
              "minimal severity level displayed for the Boost.log filter")
          ;

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, clo), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "ERROR: MirrorPlan::main() - " << e.what() << std::endl;
    std::cerr << clo << std::endl;
    return ERR_INPUT_PARAMETERS;
  }

  if (vm.count("help")) {
    std::cout << clo << std::endl;
    return (0);
  }

  //initialize logging level
  logging::core::get()->set_filter
  (
    logging::trivial::severity >= (logging::trivial::severity_level) vm["debug-verbose"].as<uint>()
  );

  Properties props;
  if (!props.load(vm["props"].as<std::string>()))
    return ERR_CONFIGURATION;
  if (vm.count("seed"))
    props.set("seed", (int) vm["seed"].as<unsigned long>());

  StrategyPtr strategy = makeTopologyStrategy(vm["topology"].as<std::string>());
  if (!strategy) {
    std::cerr << "ERROR: MirrorPlan::main() - unknown topology "
            << vm["topology"].as<std::string>() << std::endl;
    return ERR_INPUT_PARAMETERS;
  }

  try {
    Network network(strategy, vm["mirrors"].as<uint>(),
            vm["links-per-mirror"].as<uint>(), props);
    Effector effector(&network);
    network.setEffector(&effector);
    if (!scheduleActions(vm, effector, props))
      return ERR_INPUT_PARAMETERS;
    std::cout << "Simulating " << vm["sim-time"].as<uint>() << " steps of a "
            << strategy->getName() << " network with "
            << network.getNumMirrors() << " mirrors" << std::endl;
    for (SimTime t = 1; t <= (SimTime) vm["sim-time"].as<uint>(); t++) {
      network.timeStep(t);
    }
    if (!printToFile(vm, network))
      return ERR_OUTPUT_FILE;
  } catch (const ConfigurationError& e) {
    BOOST_LOG_TRIVIAL(fatal) << "MirrorPlan::main() - configuration error on "
            << e.getKey() << ": " << e.what();
    return ERR_CONFIGURATION;
  }
  return 0;
}
