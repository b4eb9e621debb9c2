/* -*-c++-*- */

#ifndef GENERALIZER_CONFIG_H
#define GENERALIZER_CONFIG_H

#include <string>

#include "errors.h"

namespace InvGen {

enum mode { MODE_UNSET = 0, MODE_BOOL, MODE_INT, MODE_VERIFY };
enum bool_strategy { BOOL_DIRECT_QUERY = 0, BOOL_MODEL_SAMPLING };
enum int_strategy { INT_LINEAR_SCAN = 0, INT_BRACKET_BISECT };
enum report_status {
  REPORT_OK = 0,
  REPORT_NO_VARIABLES,
  REPORT_NO_SOLUTION,
  REPORT_UNRESOLVED
};

struct GeneralizerConfig {
  GeneralizerConfig(bool debug = false, bool json = false,
                    unsigned long max_samples = 10,
                    unsigned long search_horizon = 1000,
                    unsigned long initial_step = 1,
                    unsigned long query_timeout_ms = 0,
                    double variable_time_budget = 0.0,
                    unsigned long contiguity_probes = 0,
                    bool compound_terms = false)
      : debug(debug),
        json(json),
        max_samples(max_samples),
        search_horizon(search_horizon),
        initial_step(initial_step),
        query_timeout_ms(query_timeout_ms),
        variable_time_budget(variable_time_budget),
        contiguity_probes(contiguity_probes),
        compound_terms(compound_terms) {}

  /*
   * Throws ConfigurationError if a bound that the engines rely on for
   * termination is zero.
   */
  void validate() const {
    if (max_samples == 0)
      throw ConfigurationError("sample cap must be at least 1");
    if (search_horizon == 0)
      throw ConfigurationError("search horizon must be at least 1");
    if (initial_step == 0)
      throw ConfigurationError("initial bracket step must be at least 1");
    if (variable_time_budget < 0.0)
      throw ConfigurationError("time budget must not be negative");
  }

  const bool debug;
  const bool json;
  // Model sampling stops after this many distinct models. A capped sample
  // only yields conjectures; see BooleanRelationEngine.
  const unsigned long max_samples;
  // Maximal number of unit steps the linear scan takes in each direction.
  const unsigned long search_horizon;
  const unsigned long initial_step;
  // 0 means no timeout.
  const unsigned long query_timeout_ms;
  // Seconds per variable (interval engine) or per analysis (relation
  // engine). 0 means no budget.
  const double variable_time_budget;
  // 0 disables the contiguity diagnostics of the interval engine.
  const unsigned long contiguity_probes;
  // Also relate the compound boolean subterms of the formula (direct query
  // only).
  const bool compound_terms;
};

std::string to_string(bool_strategy strategy);
std::string to_string(int_strategy strategy);
std::string to_string(report_status status);

}  // namespace InvGen

#endif
