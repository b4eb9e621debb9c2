#ifndef INVGEN_INTERVAL_SEARCH_H
#define INVGEN_INTERVAL_SEARCH_H

#include <z3++.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "bound.h"
#include "generalizer_config.h"
#include "oracle.h"
#include "variables.h"

namespace InvGen {

struct BoundReport {
  report_status status = REPORT_OK;
  int_strategy strategy;
  std::string status_reason;
  // analyzed and rejected variables alike; see Bound::get_status()
  std::map<std::string, Bound> bounds;
  unsigned long oracle_queries = 0;
  // seconds per timer category, one per analyzed variable
  std::map<std::string, double> time_stats;

  explicit BoundReport(int_strategy s) : strategy(s) {}
  // nullptr if name was not requested
  const Bound* find(const std::string& name) const;
};

/*
 * Per-model bounds of integer variables. One reference model is drawn from
 * the formula; for each variable the others are fixed to their reference
 * values and the satisfiable values of the variable are explored from its
 * reference value outwards.
 *
 * Both strategies assume the satisfiable values form one contiguous
 * interval. A formula such as x = 1 || x = 5 breaks that assumption: the
 * bisection then reports some boundary between a sat and an unsat value,
 * not necessarily the extreme one. The contiguity_probes option adds
 * diagnostics for this case but never changes a bound.
 */
class IntervalSearchEngine {
  z3::context& c;
  const GeneralizerConfig& config;
  const z3::expr formula;
  VariableTable table;
  Oracle oracle;
  // budget timer of the variable under search
  std::string budget_category;

 public:
  IntervalSearchEngine(const z3::expr& _formula,
                       const GeneralizerConfig& _config);
  /*
   * An empty list analyzes every integer variable of the formula.
   */
  BoundReport run(const std::vector<std::string>& requested,
                  int_strategy strategy);

 private:
  Bound search(const std::string& name, const z3::model& reference,
               int_strategy strategy);
  std::vector<z3::expr> fixes_except(const z3::model& reference,
                                     const std::string& name);
  /*
   * Throws OracleUnknown when the oracle gives up or the variable's time
   * budget is used up.
   */
  bool is_value_sat(const z3::expr& restricted, const z3::expr& var,
                    int64_t value);

  void linear_scan(const z3::expr& restricted, const z3::expr& var,
                   int64_t start, Bound& bound);
  void bracket_bisect(const z3::expr& restricted, const z3::expr& var,
                      int64_t start, Bound& bound);
  void bisect_lower(const z3::expr& restricted, const z3::expr& var,
                    int64_t unsat, int64_t sat, Bound& bound);
  void bisect_upper(const z3::expr& restricted, const z3::expr& var,
                    int64_t sat, int64_t unsat, Bound& bound);
  void check_contiguity(const z3::expr& restricted, const z3::expr& var,
                        Bound& bound);
};

BoundReport discover_integer_bounds(const z3::expr& formula,
                                    const std::vector<std::string>& variables,
                                    int_strategy strategy,
                                    const GeneralizerConfig& config);

}  // namespace InvGen

#endif  // INVGEN_INTERVAL_SEARCH_H
