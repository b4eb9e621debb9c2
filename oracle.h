#ifndef INVGEN_ORACLE_H
#define INVGEN_ORACLE_H

#include <time.h>
#include <z3++.h>

#include <map>
#include <optional>
#include <string>

#include "errors.h"
#include "generalizer_config.h"

namespace InvGen {

/*
 * One oracle session over a caller-owned z3 context. Every query runs on a
 * freshly created solver, so no assertion, push level or learned state leaks
 * from one query into the next. A session belongs to exactly one analysis
 * call and must not be queried from two call sites at once.
 */
class Oracle {
  z3::context& c;
  z3::params params;
  const GeneralizerConfig& config;
  unsigned long queries = 0;

  std::map<std::string, struct timespec> timer_start_times;
  std::map<std::string, bool> is_timer_on;
  std::map<std::string, double> accumulated_times;
  std::map<std::string, double> max_times;

 public:
  /*
   * Throws OracleUnavailable if the context cannot be configured.
   */
  Oracle(z3::context& _c, const GeneralizerConfig& _config);

  /*
   * All queries throw OracleUnknown if the solver gives up, ConfigurationError
   * if z3 rejects the formula and OracleUnavailable if no solver can be
   * created.
   */
  bool is_satisfiable(const z3::expr& formula);
  bool is_unsatisfiable(const z3::expr& formula);
  /*
   * A model of formula, or nullopt iff formula is unsat.
   */
  std::optional<z3::model> get_model(const z3::expr& formula);
  /*
   * Value of term in model, with model completion.
   */
  z3::expr evaluate(const z3::model& model, const z3::expr& term) const;

  z3::context& ctx() const { return c; }
  unsigned long num_queries() const { return queries; }

  void set_timer_on(const std::string& category);
  void accumulate_time(const std::string& category);
  void set_timer_max(const std::string& category, double limit);
  double elapsed_time(const std::string& category);
  /*
   * True iff a limit was set for category and the running timer exceeded it.
   */
  bool is_time_limit_reached(const std::string& category);
  const std::map<std::string, double>& get_accumulated_times() const {
    return accumulated_times;
  }

 private:
  z3::check_result solve(const z3::expr& formula,
                         std::optional<z3::model>* model);
  z3::solver make_solver();
  static double duration(struct timespec* a, struct timespec* b);
};

}  // namespace InvGen

#endif  // INVGEN_ORACLE_H
