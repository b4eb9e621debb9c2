#include "oracle.h"

#include <iostream>

namespace InvGen {

Oracle::Oracle(z3::context& _c, const GeneralizerConfig& _config)
    : c(_c), params(_c), config(_config) {
  try {
    if (config.query_timeout_ms > 0)
      params.set("timeout", static_cast<unsigned>(config.query_timeout_ms));
  } catch (const z3::exception& except) {
    throw OracleUnavailable(except.msg());
  }
}

z3::solver Oracle::make_solver() {
  try {
    z3::solver solver(c);
    solver.set(params);
    return solver;
  } catch (const z3::exception& except) {
    throw OracleUnavailable(except.msg());
  }
}

z3::check_result Oracle::solve(const z3::expr& formula,
                               std::optional<z3::model>* model) {
  if (!formula.is_bool())
    throw ConfigurationError("query is not a formula: " + formula.to_string());
  z3::solver solver = make_solver();
  z3::check_result res = z3::unknown;
  std::string reason;
  queries++;
  try {
    solver.add(formula);
    res = solver.check();
    if (res == z3::sat && model) model->emplace(solver.get_model());
    if (res == z3::unknown) reason = solver.reason_unknown();
  } catch (const z3::exception& except) {
    throw ConfigurationError(std::string("oracle rejected query: ") +
                             except.msg());
  }
  if (config.debug)
    std::cout << "Oracle query " << queries << ": " << res << "\n";
  if (res == z3::unknown) throw OracleUnknown(reason);
  return res;
}

bool Oracle::is_satisfiable(const z3::expr& formula) {
  return solve(formula, nullptr) == z3::sat;
}

bool Oracle::is_unsatisfiable(const z3::expr& formula) {
  return solve(formula, nullptr) == z3::unsat;
}

std::optional<z3::model> Oracle::get_model(const z3::expr& formula) {
  std::optional<z3::model> res;
  solve(formula, &res);
  return res;
}

z3::expr Oracle::evaluate(const z3::model& model, const z3::expr& term) const {
  try {
    return model.eval(term, true);
  } catch (const z3::exception& except) {
    throw ConfigurationError("cannot evaluate " + term.to_string() + ": " +
                             except.msg());
  }
}

double Oracle::duration(struct timespec* a, struct timespec* b) {
  return (b->tv_sec - a->tv_sec) + 1.0e-9 * (b->tv_nsec - a->tv_nsec);
}

void Oracle::set_timer_on(const std::string& category) {
  if (is_timer_on.find(category) != is_timer_on.end() &&
      is_timer_on[category]) {
    std::cerr << "WARNING: starting timer twice for category " << category
              << std::endl;
  }
  struct timespec now;
  clock_gettime(CLOCK_REALTIME, &now);
  timer_start_times[category] = now;
  is_timer_on[category] = true;
}

void Oracle::accumulate_time(const std::string& category) {
  if (is_timer_on.find(category) == is_timer_on.end() ||
      is_timer_on[category] == false) {  // timer never went on
    std::cerr << "WARNING: cannot stop timer for category: " << category
              << ". Timer was never started." << std::endl;
    return;
  }
  struct timespec now;
  clock_gettime(CLOCK_REALTIME, &now);
  accumulated_times[category] += duration(&timer_start_times[category], &now);
  is_timer_on[category] = false;
}

void Oracle::set_timer_max(const std::string& category, double limit) {
  max_times[category] = limit;
}

double Oracle::elapsed_time(const std::string& category) {
  const auto it = timer_start_times.find(category);
  if (it == timer_start_times.end()) return 0.0;
  struct timespec now;
  clock_gettime(CLOCK_REALTIME, &now);
  return duration(&it->second, &now);
}

bool Oracle::is_time_limit_reached(const std::string& category) {
  const auto it = max_times.find(category);
  if (it == max_times.end() || it->second <= 0.0) return false;
  return elapsed_time(category) >= it->second;
}

}  // namespace InvGen
