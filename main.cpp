#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "boolean_relations.h"
#include "candidate.h"
#include "cli.h"
#include "errors.h"
#include "generalizer_config.h"
#include "interval_search.h"
#include "report.h"
#include "verifier.h"

const char *argp_program_version = "invgen 0.1";

namespace InvGen {

/*
 * Conjunction of all assertions of an SMT-LIB2 file. Throws
 * ConfigurationError if the file cannot be parsed.
 */
z3::expr parse_formula(z3::context &c, const std::string &input) {
  std::cout << "Parsing input file: " << input << '\n';
  try {
    z3::expr_vector formulas = c.parse_file(input.c_str());
    std::cout << "Number of formulas in file: " << formulas.size() << '\n';
    return z3::mk_and(formulas);
  } catch (const z3::exception &except) {
    throw ConfigurationError("could not read input formula: " +
                             std::string(except.msg()));
  }
}

int run(z3::context &c, const struct args &args) {
  const GeneralizerConfig config = configFromArgs(args);
  config.validate();
  const z3::expr formula = parse_formula(c, args.input);
  GeneralizationReport report(args.input);

  switch (args.mode) {
    case MODE_UNSET:
      // rejected by parse_args
      throw ConfigurationError("no mode selected");
    case MODE_BOOL: {
      const bool_strategy strategy = args.strategy == STRAT_SAMPLING
                                         ? BOOL_MODEL_SAMPLING
                                         : BOOL_DIRECT_QUERY;
      const RelationReport relations =
          discover_boolean_relations(formula, args.variables, strategy, config);
      report.add_relations(relations);
      if (args.confirm)
        report.add_verdicts(
            verify_all(formula, candidates_from(relations), config));
      break;
    }
    case MODE_INT: {
      const int_strategy strategy = args.strategy == STRAT_LINEAR
                                        ? INT_LINEAR_SCAN
                                        : INT_BRACKET_BISECT;
      const BoundReport bounds =
          discover_integer_bounds(formula, args.variables, strategy, config);
      report.add_bounds(bounds);
      if (args.confirm)
        report.add_verdicts(
            verify_all(formula, candidates_from(bounds), config));
      break;
    }
    case MODE_VERIFY: {
      std::vector<Candidate> candidates;
      for (const auto &text : args.candidates)
        candidates.push_back(parse_candidate(text));
      report.add_verdicts(verify_all(formula, candidates, config));
      break;
    }
  }

  report.print(std::cout);

  if (config.json) {
    const std::filesystem::path input_path = args.input;
    const std::filesystem::path output_path = args.output_dir;
    if (!std::filesystem::exists(output_path))
      std::filesystem::create_directories(output_path);
    report.write_json(
        (output_path / input_path.filename()).string() + ".json");
  }
  return 0;
}
}  // namespace InvGen

int main(int argc, char *argv[]) {
  struct InvGen::args args;
  InvGen::parse_args(argc, argv, args);

  z3::context c;
  try {
    return InvGen::run(c, args);
  } catch (const InvGen::OracleUnavailable &except) {
    std::cerr << except.what() << std::endl;
    return 2;
  } catch (const InvGen::GeneralizerError &except) {
    std::cerr << except.what() << std::endl;
    return 1;
  } catch (const std::filesystem::filesystem_error &except) {
    std::cerr << except.what() << std::endl;
    return 1;
  }
}
