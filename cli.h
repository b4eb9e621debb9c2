#ifndef INVGEN_CLI_H
#define INVGEN_CLI_H

#include <filesystem>
#include <string>
#include <vector>

#include "generalizer_config.h"

namespace InvGen {

enum strategy_choice { STRAT_DEFAULT, STRAT_DIRECT, STRAT_SAMPLING,
                       STRAT_LINEAR, STRAT_BRACKET };

struct args {
  char *input = nullptr;
  std::string output_dir{std::filesystem::current_path().string()};
  enum mode mode = MODE_UNSET;
  enum strategy_choice strategy = STRAT_DEFAULT;
  std::vector<std::string> variables;
  std::vector<std::string> candidates;
  unsigned long max_samples = 10, search_horizon = 1000, initial_step = 1,
                query_timeout_ms = 0, contiguity_probes = 0;
  double variable_time_budget = 0.0;
  bool json = false, debug = false, confirm = false, compound = false;
};

/*
 * Fills args from the command line. A missing mode or input, a strategy of
 * the wrong analysis, or a verify run without candidates prints a usage
 * error and exits with status 1 before any input is read.
 */
void parse_args(int argc, char *argv[], struct args &args);

GeneralizerConfig configFromArgs(const struct args &args);

}  // namespace InvGen

#endif  // INVGEN_CLI_H
