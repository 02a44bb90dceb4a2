#include "Properties.hpp"
#include <fstream>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/trim.hpp>

bool Properties::load(const std::string& fileName) {
  std::ifstream stream(fileName.c_str());
  if (!stream.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Properties::load() - could not open property "
            "file " << fileName;
    return false;
  }
  // no registered options: every key=value pair comes back as unregistered
  po::options_description empty;
  try {
    po::parsed_options parsed = po::parse_config_file(stream, empty, true);
    BOOST_FOREACH(const po::option& opt, parsed.options) {
      if (opt.value.empty())
        continue;
      std::string value = opt.value.front();
      boost::algorithm::trim(value);
      values[opt.string_key] = value;
    }
  } catch (const po::error& e) {
    BOOST_LOG_TRIVIAL(error) << "Properties::load() - malformed property file "
            << fileName << ": " << e.what();
    return false;
  }
  BOOST_LOG_TRIVIAL(debug) << "Properties::load() - read " << values.size()
          << " properties from " << fileName;
  return true;
}

void Properties::set(const std::string& key, int value) {
  values[key] = boost::lexical_cast<std::string>(value);
}

std::string Properties::getString(const std::string& key) const {
  std::map<std::string, std::string>::const_iterator it = values.find(key);
  if (it == values.end()) {
    BOOST_LOG_TRIVIAL(error) << "Properties::getString() - missing required "
            "property " << key;
    throw ConfigurationError(key, "missing required property '" + key + "'");
  }
  return it->second;
}

int Properties::getInt(const std::string& key) const {
  std::string raw = getString(key);
  try {
    return boost::lexical_cast<int>(raw);
  } catch (const boost::bad_lexical_cast&) {
    BOOST_LOG_TRIVIAL(error) << "Properties::getInt() - property " << key
            << " is not an integer: '" << raw << "'";
    throw ConfigurationError(key, "property '" + key + "' is not an integer: '"
            + raw + "'");
  }
}

int Properties::getInt(const std::string& key, int defaultValue) const {
  if (!has(key))
    return defaultValue;
  return getInt(key);
}
