/*
 * File:   IdGenerator.hpp
 * Author: emanuele
 *
 * Created on 10 March 2014, 10:02
 */

#ifndef IDGENERATOR_HPP
#define	IDGENERATOR_HPP

/**
 * Source of unique, monotonically increasing integer identifiers for Mirrors,
 * Links, structural nodes and Actions. There is no global instance: the
 * Network owns one and hands it to whoever needs fresh ids, so that two
 * simulations (or two tests) never share state.
 */
class IdGenerator {
protected:
  int nextId; /**< The identifier that will be returned by the next call to getNextId(). */

public:
  explicit IdGenerator(int firstId = 0) : nextId(firstId) {
  }

  int getNextId() {
    return nextId++;
  }

  /**
   * Returns the identifier that getNextId() would return, without consuming it.
   */
  int peekNextId() const {
    return nextId;
  }

  /**
   * Makes sure that identifiers up to (and including) usedId are never
   * returned again, e.g., after mirrors were created with explicit ids.
   */
  void reserveUpTo(int usedId) {
    if (usedId >= nextId)
      nextId = usedId + 1;
  }
};

#endif	/* IDGENERATOR_HPP */

