/*
 * File:   Properties.hpp
 * Author: emanuele
 *
 * Created on 10 March 2014, 09:40
 */

#ifndef PROPERTIES_HPP
#define	PROPERTIES_HPP

#include <map>
#include <stdexcept>
#include <string>
#include "MirrorPlan.hpp"

/**
 * Raised when a required configuration property is missing or cannot be
 * interpreted. Quality predictions depend on these values, so they are never
 * replaced by a default.
 */
class ConfigurationError : public std::runtime_error {
protected:
  std::string key; /**< The property that caused the error. */
public:
  ConfigurationError(const std::string& key, const std::string& what) :
      std::runtime_error(what), key(key) {
  }

  std::string getKey() const {
    return key;
  }
};

/**
 * A string-keyed bag of simulation properties (max_bandwidth,
 * startup_time_min, ...), either loaded from a Java-style property file or set
 * programmatically. Values are stored as strings and converted at the point of
 * use.
 */
class Properties {
protected:
  std::map<std::string, std::string> values; /**< The raw key/value pairs. */

public:
  Properties() {
  }

  /**
   * Reads a property file with one "key=value" pair per line; lines starting
   * with '#' are comments. Keys already present are overwritten.
   * @param fileName The name of the property file.
   * @return True if the file could be opened and parsed, false otherwise.
   */
  bool load(const std::string& fileName);

  void set(const std::string& key, const std::string& value) {
    values[key] = value;
  }

  void set(const std::string& key, int value);

  bool has(const std::string& key) const {
    return values.find(key) != values.end();
  }

  void remove(const std::string& key) {
    values.erase(key);
  }

  /**
   * Retrieves the raw value of a property.
   * @throw ConfigurationError if the key is not present.
   */
  std::string getString(const std::string& key) const;

  /**
   * Retrieves a property as an integer.
   * @param key The name of the property.
   * @return The integer value of the property.
   * @throw ConfigurationError if the key is missing or its value is not an integer.
   */
  int getInt(const std::string& key) const;

  /**
   * Retrieves an optional property as an integer, falling back to
   * defaultValue only when the key is absent. A present but malformed value
   * still raises a ConfigurationError.
   */
  int getInt(const std::string& key, int defaultValue) const;

  size_t size() const {
    return values.size();
  }
};

#endif	/* PROPERTIES_HPP */

