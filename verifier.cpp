#include "verifier.h"

#include <iostream>

#include "z3_utils.h"

namespace InvGen {

std::string verdict_to_string(verdict v) {
  switch (v) {
    case VERIFY_HOLDS:
      return "holds";
    case VERIFY_VIOLATED:
      return "violated";
    case VERIFY_ERROR:
      return "error";
  }
  return "unknown";
}

VerificationOutcome verify(Oracle& oracle, const VariableTable& table,
                           const z3::expr& formula,
                           const Candidate& candidate) {
  const std::string& var = candidate.get_variable();
  const Z3_sort_kind declared = table.sort_of(var);
  if (declared != Z3_UNKNOWN_SORT && declared != candidate.required_sort()) {
    VerificationOutcome outcome(candidate, VERIFY_ERROR);
    outcome.reason = "variable " + var + " is declared " +
                     sort_kind_to_string(declared) + " but the candidate needs " +
                     sort_kind_to_string(candidate.required_sort());
    return outcome;
  }

  const unsigned long queries_before = oracle.num_queries();
  z3::context& c = oracle.ctx();
  try {
    const z3::expr test = formula && candidate.negate(c);
    std::optional<z3::model> cex = oracle.get_model(test);
    VerificationOutcome outcome(candidate,
                                cex ? VERIFY_VIOLATED : VERIFY_HOLDS);
    outcome.counterexample = std::move(cex);
    outcome.oracle_queries = oracle.num_queries() - queries_before;
    return outcome;
  } catch (const OracleUnknown& except) {
    VerificationOutcome outcome(candidate, VERIFY_ERROR);
    outcome.reason = except.what();
    outcome.oracle_queries = oracle.num_queries() - queries_before;
    return outcome;
  } catch (const ConfigurationError& except) {
    VerificationOutcome outcome(candidate, VERIFY_ERROR);
    outcome.reason = except.what();
    outcome.oracle_queries = oracle.num_queries() - queries_before;
    return outcome;
  }
}

VerificationOutcome verify(const z3::expr& formula, const Candidate& candidate,
                           const GeneralizerConfig& config) {
  Oracle oracle(formula.ctx(), config);
  VariableTable table(formula);
  return verify(oracle, table, formula, candidate);
}

std::vector<VerificationOutcome> verify_all(
    const z3::expr& formula, const std::vector<Candidate>& candidates,
    const GeneralizerConfig& config) {
  Oracle oracle(formula.ctx(), config);
  VariableTable table(formula);
  std::vector<VerificationOutcome> res;
  res.reserve(candidates.size());
  for (const auto& cand : candidates) {
    res.push_back(verify(oracle, table, formula, cand));
    if (config.debug)
      std::cout << "Verified " << cand << ": "
                << verdict_to_string(res.back().result) << "\n";
  }
  return res;
}

}  // namespace InvGen
