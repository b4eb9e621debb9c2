#ifndef INVGEN_VERIFIER_H
#define INVGEN_VERIFIER_H

#include <z3++.h>

#include <optional>
#include <string>
#include <vector>

#include "candidate.h"
#include "generalizer_config.h"
#include "oracle.h"
#include "variables.h"

namespace InvGen {

enum verdict { VERIFY_HOLDS, VERIFY_VIOLATED, VERIFY_ERROR };

struct VerificationOutcome {
  Candidate candidate;
  verdict result;
  // set iff result == VERIFY_VIOLATED
  std::optional<z3::model> counterexample;
  // set iff result == VERIFY_ERROR
  std::string reason;
  unsigned long oracle_queries = 0;

  VerificationOutcome(const Candidate& cand, verdict res)
      : candidate(cand), result(res) {}
  bool holds() const { return result == VERIFY_HOLDS; }
};

std::string verdict_to_string(verdict v);

/*
 * The negation test: candidate holds for every model of formula iff
 * formula && candidate.negate() is unsat. One oracle query, none if the
 * candidate's variable has the wrong sort in formula. Oracle errors and
 * unknown answers become VERIFY_ERROR; OracleUnavailable propagates.
 */
VerificationOutcome verify(const z3::expr& formula, const Candidate& candidate,
                           const GeneralizerConfig& config);
/*
 * Same, on an existing session and variable table of formula.
 */
VerificationOutcome verify(Oracle& oracle, const VariableTable& table,
                           const z3::expr& formula, const Candidate& candidate);
/*
 * Verifies each candidate on one session. A failing candidate does not stop
 * the others.
 */
std::vector<VerificationOutcome> verify_all(
    const z3::expr& formula, const std::vector<Candidate>& candidates,
    const GeneralizerConfig& config);

}  // namespace InvGen

#endif  // INVGEN_VERIFIER_H
