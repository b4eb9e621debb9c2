#ifndef INVGEN_CANDIDATE_H
#define INVGEN_CANDIDATE_H

#include <z3++.h>

#include <cstdint>
#include <iostream>
#include <string>

namespace InvGen {

enum candidate_kind { CAND_FIXED_VALUE, CAND_BOOL_POLARITY, CAND_INTERVAL };

/*
 * A conjectured property of every solution of a formula: an integer
 * variable with a fixed value, a boolean variable with a fixed polarity, or
 * an integer variable inside a closed interval. Immutable; only the factory
 * functions construct one.
 */
class Candidate {
  candidate_kind kind;
  std::string variable;
  int64_t value = 0;
  bool polarity = false;
  int64_t low = 0;
  int64_t high = 0;

  Candidate(candidate_kind k, const std::string& var) : kind(k), variable(var) {}

 public:
  /* All factories throw ConfigurationError on an empty variable name. */
  static Candidate fixed_value(const std::string& var, int64_t value);
  static Candidate bool_polarity(const std::string& var, bool polarity);
  /* Throws ConfigurationError if low > high. */
  static Candidate interval(const std::string& var, int64_t low, int64_t high);

  [[nodiscard]] candidate_kind get_kind() const { return kind; }
  [[nodiscard]] const std::string& get_variable() const { return variable; }
  [[nodiscard]] int64_t get_value() const { return value; }
  [[nodiscard]] bool get_polarity() const { return polarity; }
  [[nodiscard]] int64_t get_low() const { return low; }
  [[nodiscard]] int64_t get_high() const { return high; }
  /*
   * Sort the variable must have in the formula for the candidate to make
   * sense.
   */
  [[nodiscard]] Z3_sort_kind required_sort() const;

  z3::expr variable_term(z3::context& c) const;
  /*
   * The property itself, e.g. x >= lo && x <= hi.
   */
  z3::expr assertion(z3::context& c) const;
  /*
   * The negation test formula:
   *   fixed value    v != c
   *   polarity       v == !polarity
   *   interval       v < lo || v > hi
   */
  z3::expr negate(z3::context& c) const;

  std::string to_string() const;
  friend std::ostream& operator<<(std::ostream& os, const Candidate& cand);
};

/*
 * Reads "x=5", "p=true", "p=false" or "x=[0,10]" (whitespace is ignored).
 * Throws ConfigurationError on anything else.
 */
Candidate parse_candidate(const std::string& text);

}  // namespace InvGen

#endif  // INVGEN_CANDIDATE_H
