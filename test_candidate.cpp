#include <gtest/gtest.h>

#include "candidate.h"
#include "errors.h"

namespace InvGen {
namespace {

TEST(CandidateParse, FixedValue) {
  const Candidate cand = parse_candidate("x = 5");
  EXPECT_EQ(cand.get_kind(), CAND_FIXED_VALUE);
  EXPECT_EQ(cand.get_variable(), "x");
  EXPECT_EQ(cand.get_value(), 5);
}

TEST(CandidateParse, NegativeValue) {
  const Candidate cand = parse_candidate("y=-7");
  EXPECT_EQ(cand.get_kind(), CAND_FIXED_VALUE);
  EXPECT_EQ(cand.get_value(), -7);
}

TEST(CandidateParse, Polarity) {
  const Candidate t = parse_candidate("p=true");
  EXPECT_EQ(t.get_kind(), CAND_BOOL_POLARITY);
  EXPECT_TRUE(t.get_polarity());
  const Candidate f = parse_candidate(" p = false ");
  EXPECT_EQ(f.get_kind(), CAND_BOOL_POLARITY);
  EXPECT_FALSE(f.get_polarity());
}

TEST(CandidateParse, Interval) {
  const Candidate cand = parse_candidate("x=[-3, 10]");
  EXPECT_EQ(cand.get_kind(), CAND_INTERVAL);
  EXPECT_EQ(cand.get_low(), -3);
  EXPECT_EQ(cand.get_high(), 10);
}

TEST(CandidateParse, RejectsMalformedText) {
  EXPECT_THROW(parse_candidate("x"), ConfigurationError);
  EXPECT_THROW(parse_candidate("=5"), ConfigurationError);
  EXPECT_THROW(parse_candidate("x="), ConfigurationError);
  EXPECT_THROW(parse_candidate("x=abc"), ConfigurationError);
  EXPECT_THROW(parse_candidate("x=5x"), ConfigurationError);
  EXPECT_THROW(parse_candidate("x=[1,2"), ConfigurationError);
  EXPECT_THROW(parse_candidate("x=[1]"), ConfigurationError);
  EXPECT_THROW(parse_candidate("x=99999999999999999999"), ConfigurationError);
}

TEST(CandidateParse, RejectsEmptyInterval) {
  EXPECT_THROW(parse_candidate("x=[5,1]"), ConfigurationError);
}

TEST(Candidate, FactoriesCheckArguments) {
  EXPECT_THROW(Candidate::fixed_value("", 1), ConfigurationError);
  EXPECT_THROW(Candidate::bool_polarity("", true), ConfigurationError);
  EXPECT_THROW(Candidate::interval("x", 2, 1), ConfigurationError);
  EXPECT_NO_THROW(Candidate::interval("x", 4, 4));
}

TEST(Candidate, ToString) {
  EXPECT_EQ(Candidate::fixed_value("x", 5).to_string(), "x = 5");
  EXPECT_EQ(Candidate::bool_polarity("p", true).to_string(),
            "p is always true");
  EXPECT_EQ(Candidate::interval("x", 0, 10).to_string(), "x in [0, 10]");
}

TEST(Candidate, RequiredSort) {
  EXPECT_EQ(Candidate::fixed_value("x", 5).required_sort(), Z3_INT_SORT);
  EXPECT_EQ(Candidate::interval("x", 0, 1).required_sort(), Z3_INT_SORT);
  EXPECT_EQ(Candidate::bool_polarity("p", false).required_sort(),
            Z3_BOOL_SORT);
}

// The negation must be exactly the complement of the assertion.
TEST(Candidate, NegationComplementsAssertion) {
  z3::context c;
  const Candidate cands[] = {Candidate::fixed_value("x", 5),
                             Candidate::bool_polarity("p", true),
                             Candidate::bool_polarity("p", false),
                             Candidate::interval("x", -2, 7)};
  for (const auto& cand : cands) {
    z3::solver both(c);
    both.add(cand.assertion(c) && cand.negate(c));
    EXPECT_EQ(both.check(), z3::unsat) << cand;
    z3::solver neither(c);
    neither.add(!cand.assertion(c) && !cand.negate(c));
    EXPECT_EQ(neither.check(), z3::unsat) << cand;
  }
}

TEST(Candidate, IntervalNegationMembers) {
  z3::context c;
  const Candidate cand = Candidate::interval("x", 0, 10);
  const z3::expr x = c.int_const("x");
  const int64_t inside[] = {0, 5, 10};
  const int64_t outside[] = {-1, 11};
  for (int64_t v : inside) {
    z3::solver s(c);
    s.add(cand.negate(c) && x == c.int_val(v));
    EXPECT_EQ(s.check(), z3::unsat) << v;
  }
  for (int64_t v : outside) {
    z3::solver s(c);
    s.add(cand.negate(c) && x == c.int_val(v));
    EXPECT_EQ(s.check(), z3::sat) << v;
  }
}

}  // namespace
}  // namespace InvGen
