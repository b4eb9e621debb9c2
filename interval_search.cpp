#include "interval_search.h"

#include <iostream>
#include <optional>

#include "z3_utils.h"

namespace InvGen {

static const char* BUDGET_EXHAUSTED = "time budget exhausted";

// Distance high - low for low <= high, which may exceed INT64_MAX.
static inline uint64_t span(int64_t low, int64_t high) {
  return static_cast<uint64_t>(high) - static_cast<uint64_t>(low);
}

const Bound* BoundReport::find(const std::string& name) const {
  const auto it = bounds.find(name);
  if (it == bounds.end()) return nullptr;
  return &it->second;
}

IntervalSearchEngine::IntervalSearchEngine(const z3::expr& _formula,
                                           const GeneralizerConfig& _config)
    : c(_formula.ctx()),
      config(_config),
      formula(_formula),
      table(_formula),
      oracle(_formula.ctx(), _config) {}

BoundReport IntervalSearchEngine::run(
    const std::vector<std::string>& requested, int_strategy strategy) {
  BoundReport report(strategy);
  const unsigned long queries_before = oracle.num_queries();
  std::vector<std::string> names =
      requested.empty() ? table.int_variables() : normalize_names(requested);
  std::vector<std::string> analyzed;
  for (const std::string& name : names) {
    const Z3_sort_kind sort = table.sort_of(name);
    if (sort == Z3_UNKNOWN_SORT) {
      report.bounds.emplace(
          name, Bound::error(name, "variable " + name +
                                       " does not occur in the formula"));
    } else if (sort != Z3_INT_SORT) {
      report.bounds.emplace(
          name, Bound::error(name, "variable " + name + " is declared " +
                                       sort_kind_to_string(sort) +
                                       ", not Int"));
    } else {
      analyzed.push_back(name);
    }
  }
  if (analyzed.empty()) {
    report.status = REPORT_NO_VARIABLES;
    return report;
  }

  std::optional<z3::model> reference;
  try {
    reference = oracle.get_model(formula);
  } catch (const OracleUnknown& except) {
    report.status = REPORT_UNRESOLVED;
    report.status_reason = except.what();
    report.oracle_queries = oracle.num_queries() - queries_before;
    return report;
  }
  if (!reference) {
    report.status = REPORT_NO_SOLUTION;
    report.oracle_queries = oracle.num_queries() - queries_before;
    return report;
  }

  for (const std::string& name : analyzed) {
    report.bounds.emplace(name, search(name, *reference, strategy));
    if (config.debug)
      std::cout << "Bound of " << name << ": " << report.bounds.at(name)
                << "\n";
  }
  report.oracle_queries = oracle.num_queries() - queries_before;
  report.time_stats = oracle.get_accumulated_times();
  return report;
}

std::vector<z3::expr> IntervalSearchEngine::fixes_except(
    const z3::model& reference, const std::string& name) {
  std::vector<z3::expr> fixes;
  for (const auto& other : table.bool_variables()) {
    const z3::expr v = table.constant(other);
    fixes.push_back(v == oracle.evaluate(reference, v));
  }
  for (const auto& other : table.int_variables()) {
    if (other == name) continue;
    const z3::expr v = table.constant(other);
    fixes.push_back(v == oracle.evaluate(reference, v));
  }
  // reals, bit-vectors, ...
  for (const auto& other : table.other_variables()) {
    const z3::expr v = table.constant(other);
    fixes.push_back(v == oracle.evaluate(reference, v));
  }
  return fixes;
}

Bound IntervalSearchEngine::search(const std::string& name,
                                   const z3::model& reference,
                                   int_strategy strategy) {
  const unsigned long queries_before = oracle.num_queries();
  const z3::expr var = table.constant(name);
  Bound bound(name);

  int64_t start;
  std::optional<z3::expr> restricted;
  try {
    if (!oracle.evaluate(reference, var).is_numeral_i64(start))
      return Bound::error(name, "reference value of " + name +
                                    " does not fit in 64 bits");
    restricted = conjoin(formula, fixes_except(reference, name));
  } catch (const ConfigurationError& except) {
    return Bound::error(name, except.what());
  }
  bound.set_reference(start);

  budget_category = "bound " + name;
  oracle.set_timer_max(budget_category, config.variable_time_budget);
  oracle.set_timer_on(budget_category);
  try {
    switch (strategy) {
      case INT_LINEAR_SCAN:
        linear_scan(*restricted, var, start, bound);
        break;
      case INT_BRACKET_BISECT:
        bracket_bisect(*restricted, var, start, bound);
        break;
    }
  } catch (const OracleUnknown& except) {
    bound = Bound::unresolved(name, except.what());
    bound.set_reference(start);
  } catch (const ConfigurationError& except) {
    bound = Bound::error(name, except.what());
  }
  if (config.contiguity_probes > 0 && bound.is_exact()) {
    // diagnostics never change a proven bound
    try {
      check_contiguity(*restricted, var, bound);
    } catch (const OracleUnknown& except) {
      bound.set_contiguity_unresolved(except.what());
    } catch (const ConfigurationError& except) {
      bound.set_contiguity_unresolved(except.what());
    }
  }
  oracle.accumulate_time(budget_category);
  bound.set_oracle_queries(oracle.num_queries() - queries_before);
  return bound;
}

bool IntervalSearchEngine::is_value_sat(const z3::expr& restricted,
                                        const z3::expr& var, int64_t value) {
  if (oracle.is_time_limit_reached(budget_category))
    throw OracleUnknown(BUDGET_EXHAUSTED);
  return oracle.is_satisfiable(restricted && var == c.int_val(value));
}

void IntervalSearchEngine::linear_scan(const z3::expr& restricted,
                                       const z3::expr& var, int64_t start,
                                       Bound& bound) {
  int64_t last_sat = start;
  bound_kind kind = BOUND_HORIZON;
  for (unsigned long step = 0; step < config.search_horizon; ++step) {
    if (last_sat == INT64_MIN) break;
    if (!is_value_sat(restricted, var, last_sat - 1)) {
      kind = BOUND_EXACT;
      break;
    }
    last_sat--;
  }
  bound.set_lower_bound(last_sat, kind);

  last_sat = start;
  kind = BOUND_HORIZON;
  for (unsigned long step = 0; step < config.search_horizon; ++step) {
    if (last_sat == INT64_MAX) break;
    if (!is_value_sat(restricted, var, last_sat + 1)) {
      kind = BOUND_EXACT;
      break;
    }
    last_sat++;
  }
  bound.set_upper_bound(last_sat, kind);
}

void IntervalSearchEngine::bracket_bisect(const z3::expr& restricted,
                                          const z3::expr& var, int64_t start,
                                          Bound& bound) {
  const int64_t initial_step =
      config.initial_step > static_cast<unsigned long>(INT64_MAX)
          ? INT64_MAX
          : static_cast<int64_t>(config.initial_step);

  // downwards
  int64_t last_sat = start;
  int64_t step = initial_step;
  while (true) {
    if (last_sat == INT64_MIN) {
      bound.set_lower_bound(INT64_MIN, BOUND_HORIZON);
      break;
    }
    int64_t probe = safe_sub(start, step);
    // step saturated without reaching the edge
    if (probe >= last_sat) probe = INT64_MIN;
    if (!is_value_sat(restricted, var, probe)) {
      bisect_lower(restricted, var, probe, last_sat, bound);
      break;
    }
    last_sat = probe;
    step = safe_add(step, step);
  }

  // upwards
  last_sat = start;
  step = initial_step;
  while (true) {
    if (last_sat == INT64_MAX) {
      bound.set_upper_bound(INT64_MAX, BOUND_HORIZON);
      break;
    }
    int64_t probe = safe_add(start, step);
    if (probe <= last_sat) probe = INT64_MAX;
    if (!is_value_sat(restricted, var, probe)) {
      bisect_upper(restricted, var, last_sat, probe, bound);
      break;
    }
    last_sat = probe;
    step = safe_add(step, step);
  }
}

// Least sat value in (unsat, sat].
void IntervalSearchEngine::bisect_lower(const z3::expr& restricted,
                                        const z3::expr& var, int64_t unsat,
                                        int64_t sat, Bound& bound) {
  int64_t low = unsat;
  int64_t high = sat;
  while (span(low, high) > 1) {
    const int64_t mid = midpoint(low, high, false);
    if (is_value_sat(restricted, var, mid)) {
      high = mid;
    } else {
      low = mid;
    }
  }
  bound.set_lower_bound(high, BOUND_EXACT);
}

// Greatest sat value in [sat, unsat).
void IntervalSearchEngine::bisect_upper(const z3::expr& restricted,
                                        const z3::expr& var, int64_t sat,
                                        int64_t unsat, Bound& bound) {
  int64_t low = sat;
  int64_t high = unsat;
  while (span(low, high) > 1) {
    const int64_t mid = midpoint(low, high, true);
    if (is_value_sat(restricted, var, mid)) {
      low = mid;
    } else {
      high = mid;
    }
  }
  bound.set_upper_bound(low, BOUND_EXACT);
}

void IntervalSearchEngine::check_contiguity(const z3::expr& restricted,
                                            const z3::expr& var,
                                            Bound& bound) {
  const int64_t low = bound.get_low();
  const int64_t high = bound.get_high();
  if (oracle.is_time_limit_reached(budget_category))
    throw OracleUnknown(BUDGET_EXHAUSTED);
  const bool outside = oracle.is_satisfiable(
      restricted && (var < c.int_val(low) || var > c.int_val(high)));

  bool gap = false;
  const uint64_t width = span(low, high);
  const uint64_t parts = config.contiguity_probes + 1;
  int64_t previous = low;
  for (uint64_t k = 1; k < parts && !gap; ++k) {
    const int64_t point =
        static_cast<int64_t>(static_cast<uint64_t>(low) + width / parts * k);
    if (point <= previous || point >= high) continue;
    previous = point;
    if (!is_value_sat(restricted, var, point)) gap = true;
  }
  bound.set_contiguity(outside, gap);
}

BoundReport discover_integer_bounds(const z3::expr& formula,
                                    const std::vector<std::string>& variables,
                                    int_strategy strategy,
                                    const GeneralizerConfig& config) {
  config.validate();
  IntervalSearchEngine engine(formula, config);
  return engine.run(variables, strategy);
}

}  // namespace InvGen
