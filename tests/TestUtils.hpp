/*
 * File:   TestUtils.hpp
 * Author: dipascae
 *
 * Created on 25-Mar-2014, 09:55:32
 */

#ifndef TESTUTILS_HPP
#define	TESTUTILS_HPP

#include "Properties.hpp"

/**
 * Seed of every random generator used by the tests.
 */
const unsigned int TEST_SEED = 42;

/**
 * A complete configuration: mirrors are ready two steps after they start and
 * links activate one step after creation.
 */
inline Properties makeTestProperties() {
  Properties props;
  props.set("startup_time_min", 1);
  props.set("startup_time_max", 1);
  props.set("ready_time_min", 1);
  props.set("ready_time_max", 1);
  props.set("link_activation_time_min", 1);
  props.set("link_activation_time_max", 1);
  props.set("max_bandwidth", 100);
  props.set("seed", (int) TEST_SEED);
  return props;
}

#endif	/* TESTUTILS_HPP */

