#ifndef INVGEN_BOOLEAN_RELATIONS_H
#define INVGEN_BOOLEAN_RELATIONS_H

#include <z3++.h>

#include <map>
#include <string>
#include <vector>

#include "assignment.h"
#include "generalizer_config.h"
#include "oracle.h"
#include "variables.h"

namespace InvGen {

enum relation_kind {
  REL_ALWAYS_TRUE,
  REL_ALWAYS_FALSE,
  REL_IMPLIES_TRUE,   // var1 = true implies var2 = true
  REL_IMPLIES_FALSE   // var1 = true implies var2 = false
};

struct Relation {
  relation_kind kind;
  std::string var1;
  std::string var2;  // empty for fixed values
  bool_strategy provenance;
  // false for conjectures drawn from a capped sample
  bool sound;

  bool is_fixed_value() const {
    return kind == REL_ALWAYS_TRUE || kind == REL_ALWAYS_FALSE;
  }
  std::string to_string() const;
};

struct RelationReport {
  report_status status = REPORT_OK;
  bool_strategy strategy;
  std::string status_reason;
  // the analyzed variables, sorted, followed by the compound terms
  std::vector<std::string> variables;
  // SMT-LIB text of the analyzed compound subterms, sorted
  std::vector<std::string> compound_terms;
  // fixed values in variable order, then implications by (var1, var2)
  std::vector<Relation> relations;
  // model sampling only
  std::vector<Assignment> samples;
  bool exhaustive = false;
  // variable -> reason it was skipped
  std::map<std::string, std::string> errors;
  // variable or "v1 => v2" -> reason the oracle could not decide it
  std::map<std::string, std::string> unresolved;
  unsigned long oracle_queries = 0;
  // seconds per timer category
  std::map<std::string, double> time_stats;

  explicit RelationReport(bool_strategy s) : strategy(s) {}
  std::vector<Relation> fixed_values() const;
  std::vector<Relation> implications() const;
  bool contains(relation_kind kind, const std::string& var1,
                const std::string& var2 = "") const;
  bool is_compound(const std::string& name) const;
};

/*
 * Discovers fixed truth values of boolean variables and implications
 * between them.
 *
 * BOOL_DIRECT_QUERY asks the oracle one question per fact and is exact:
 * O(n) queries for fixed values and O(n^2) for implications.
 *
 * BOOL_MODEL_SAMPLING enumerates up to config.max_samples distinct models
 * with blocking clauses and keeps what every sampled model agrees on. Unless
 * the oracle ran out of models before the cap, its facts are conjectures and
 * carry sound == false.
 */
class BooleanRelationEngine {
  z3::context& c;
  const GeneralizerConfig& config;
  const z3::expr formula;
  VariableTable table;
  Oracle oracle;

 public:
  BooleanRelationEngine(const z3::expr& _formula,
                        const GeneralizerConfig& _config);
  /*
   * An empty list analyzes every boolean variable of the formula. With
   * config.compound_terms the compound boolean subterms of the formula are
   * analyzed alongside the variables; an equivalence between two items then
   * shows as a pair of implications and a mutual exclusion as
   * REL_IMPLIES_FALSE. Throws ConfigurationError if compound terms are
   * combined with model sampling.
   */
  RelationReport run(const std::vector<std::string>& requested,
                     bool_strategy strategy);

 private:
  std::vector<z3::expr> resolve_items(
      const std::vector<std::string>& requested, RelationReport& report);
  void direct_query(const std::vector<z3::expr>& vars, RelationReport& report);
  void model_sampling(const z3::model& first, const std::vector<z3::expr>& vars,
                      RelationReport& report);
  void relations_from_samples(const std::vector<z3::expr>& vars,
                              RelationReport& report);
  bool budget_exhausted();
};

RelationReport discover_boolean_relations(
    const z3::expr& formula, const std::vector<std::string>& variables,
    bool_strategy strategy, const GeneralizerConfig& config);

}  // namespace InvGen

#endif  // INVGEN_BOOLEAN_RELATIONS_H
