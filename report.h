#ifndef INVGEN_REPORT_H
#define INVGEN_REPORT_H

#include <json/json.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "boolean_relations.h"
#include "candidate.h"
#include "interval_search.h"
#include "verifier.h"

namespace InvGen {

// "source = true implies all of targets = implied"
struct ImplicationGroup {
  std::string source;
  bool implied;
  std::vector<std::string> targets;
  bool sound;
};

/*
 * Everything one run learned about a formula, merged for presentation.
 */
class GeneralizationReport {
  std::string input_filename;
  std::optional<RelationReport> relations;
  std::optional<BoundReport> bounds;
  std::vector<VerificationOutcome> verdicts;

 public:
  explicit GeneralizationReport(const std::string& _input_filename)
      : input_filename(_input_filename) {}

  void add_relations(const RelationReport& report) { relations = report; }
  void add_bounds(const BoundReport& report) { bounds = report; }
  void add_verdicts(const std::vector<VerificationOutcome>& outcomes);

  /*
   * Classes of two or more variables that imply each other, from mutual
   * "= true implies = true" relations between variables that are not fixed.
   * Each class is sorted, and classes are ordered by their first member.
   */
  std::vector<std::vector<std::string>> equivalence_classes() const;
  /*
   * Implications grouped by source variable and implied polarity, in
   * relation order.
   */
  std::vector<ImplicationGroup> implication_groups() const;
  // Verdicts that did not hold or could not be decided.
  unsigned long num_failed_verdicts() const;

  void print(std::ostream& os) const;
  Json::Value to_json() const;
  /*
   * Throws ConfigurationError if path cannot be written.
   */
  void write_json(const std::string& path) const;
};

/*
 * Fixed truth values as polarity candidates.
 */
std::vector<Candidate> candidates_from(const RelationReport& report);
/*
 * Bounds that are exact on both sides as interval candidates, or as fixed
 * value candidates when both sides coincide.
 */
std::vector<Candidate> candidates_from(const BoundReport& report);

}  // namespace InvGen

#endif  // INVGEN_REPORT_H
