#include <gtest/gtest.h>

#include "interval_search.h"

namespace InvGen {
namespace {

class IntervalSearchTest : public ::testing::TestWithParam<int_strategy> {
 protected:
  z3::context c;
  GeneralizerConfig config;
  z3::expr x = c.int_const("x");
  z3::expr y = c.int_const("y");
  z3::expr p = c.bool_const("p");
};

TEST_P(IntervalSearchTest, ClosedInterval) {
  const BoundReport report =
      discover_integer_bounds(x >= 0 && x <= 10, {}, GetParam(), config);
  ASSERT_EQ(report.status, REPORT_OK);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  ASSERT_TRUE(bound->is_ok());
  EXPECT_EQ(bound->get_low(), 0);
  EXPECT_EQ(bound->get_high(), 10);
  EXPECT_TRUE(bound->is_exact());
  EXPECT_TRUE(bound->is_in_range(bound->get_reference()));
  EXPECT_EQ(bound->to_string(), "[0,10]");
}

TEST_P(IntervalSearchTest, SingleValue) {
  const BoundReport report =
      discover_integer_bounds(x == 5, {}, GetParam(), config);
  ASSERT_EQ(report.status, REPORT_OK);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  EXPECT_EQ(bound->get_low(), 5);
  EXPECT_EQ(bound->get_high(), 5);
  EXPECT_TRUE(bound->is_exact());
  EXPECT_EQ(bound->get_reference(), 5);
}

TEST_P(IntervalSearchTest, DependentVariables) {
  const BoundReport report =
      discover_integer_bounds(y > x && x >= 0, {}, GetParam(), config);
  ASSERT_EQ(report.status, REPORT_OK);
  const Bound* bx = report.find("x");
  const Bound* by = report.find("y");
  ASSERT_NE(bx, nullptr);
  ASSERT_NE(by, nullptr);
  EXPECT_EQ(bx->get_low(), 0);
  EXPECT_EQ(bx->get_low_kind(), BOUND_EXACT);
  // x is also bounded by the reference value of y
  EXPECT_EQ(bx->get_high_kind(), BOUND_EXACT);
  EXPECT_EQ(by->get_low_kind(), BOUND_EXACT);
  EXPECT_EQ(by->get_high_kind(), BOUND_HORIZON);
  EXPECT_FALSE(by->is_exact());
}

TEST_P(IntervalSearchTest, UnsatFormulaUsesOneQuery) {
  const BoundReport report =
      discover_integer_bounds(x > 0 && x < 0, {}, GetParam(), config);
  EXPECT_EQ(report.status, REPORT_NO_SOLUTION);
  EXPECT_EQ(report.oracle_queries, 1u);
  EXPECT_TRUE(report.bounds.empty());
}

TEST_P(IntervalSearchTest, NoIntegerVariables) {
  const BoundReport report =
      discover_integer_bounds(p, {}, GetParam(), config);
  EXPECT_EQ(report.status, REPORT_NO_VARIABLES);
  EXPECT_EQ(report.oracle_queries, 0u);
}

TEST_P(IntervalSearchTest, RejectedNamesAreErrors) {
  const z3::expr f = p && x >= 0 && x <= 3;
  const BoundReport report =
      discover_integer_bounds(f, {"p", "x", "nope"}, GetParam(), config);
  ASSERT_EQ(report.status, REPORT_OK);
  ASSERT_EQ(report.bounds.size(), 3u);
  EXPECT_EQ(report.find("p")->get_status(), BOUND_ERROR);
  EXPECT_EQ(report.find("nope")->get_status(), BOUND_ERROR);
  EXPECT_FALSE(report.find("nope")->get_reason().empty());
  EXPECT_TRUE(report.find("x")->is_exact());
  EXPECT_EQ(report.find("missing"), nullptr);

  const BoundReport only_bad =
      discover_integer_bounds(f, {"p"}, GetParam(), config);
  EXPECT_EQ(only_bad.status, REPORT_NO_VARIABLES);
  EXPECT_EQ(only_bad.bounds.size(), 1u);
}

TEST_P(IntervalSearchTest, BooleanContextIsFixed) {
  // with p fixed to its reference value x has one of two ranges
  const z3::expr f = z3::ite(p, x >= 0 && x <= 4, x >= 10 && x <= 20);
  const BoundReport report =
      discover_integer_bounds(f, {}, GetParam(), config);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  ASSERT_TRUE(bound->is_exact());
  if (bound->get_reference() <= 4) {
    EXPECT_EQ(bound->get_low(), 0);
    EXPECT_EQ(bound->get_high(), 4);
  } else {
    EXPECT_EQ(bound->get_low(), 10);
    EXPECT_EQ(bound->get_high(), 20);
  }
}

TEST_P(IntervalSearchTest, ContiguityDiagnostics) {
  const GeneralizerConfig probing(false, false, 10, 1000, 1, 0, 0.0, 3);
  const BoundReport split =
      discover_integer_bounds(x == 1 || x == 5, {}, GetParam(), probing);
  const Bound* bound = split.find("x");
  ASSERT_NE(bound, nullptr);
  ASSERT_TRUE(bound->is_exact());
  EXPECT_EQ(bound->get_low(), bound->get_high());
  EXPECT_TRUE(bound->is_contiguity_checked());
  EXPECT_TRUE(bound->has_outside_solutions());
  EXPECT_FALSE(bound->has_gap());

  const BoundReport whole =
      discover_integer_bounds(x >= 0 && x <= 10, {}, GetParam(), probing);
  bound = whole.find("x");
  ASSERT_NE(bound, nullptr);
  EXPECT_TRUE(bound->is_contiguity_checked());
  EXPECT_FALSE(bound->has_outside_solutions());
  EXPECT_FALSE(bound->has_gap());
  EXPECT_EQ(bound->get_low(), 0);
  EXPECT_EQ(bound->get_high(), 10);
}

TEST_P(IntervalSearchTest, RealContextIsFixed) {
  // with r fixed x has exactly one value
  const z3::expr r = c.real_const("r");
  const z3::expr f = x >= 0 && x <= 10 && z3::to_real(x) == r;
  const BoundReport report =
      discover_integer_bounds(f, {"x"}, GetParam(), config);
  ASSERT_EQ(report.status, REPORT_OK);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  ASSERT_TRUE(bound->is_exact());
  EXPECT_EQ(bound->get_low(), bound->get_high());
  EXPECT_EQ(bound->get_low(), bound->get_reference());
  EXPECT_EQ(report.find("r"), nullptr);
}

TEST_P(IntervalSearchTest, UndecidedContiguityKeepsBound) {
  // Only values of x above 100 reach the sum of cubes, which the oracle
  // cannot settle within the query timeout. Every value the search itself
  // asks about stays below it.
  const z3::expr a = c.int_const("a");
  const z3::expr b = c.int_const("b");
  const z3::expr d = c.int_const("d");
  const z3::expr cubes = z3::exists(
      a, b, d, a * a * a + b * b * b + d * d * d == c.int_val(33));
  const z3::expr f = (x >= 0 && x <= 10) || (x > 100 && cubes);
  const GeneralizerConfig probing(false, false, 10, 1000, 1, 200, 0.0, 1);
  const BoundReport report =
      discover_integer_bounds(f, {"x"}, GetParam(), probing);
  ASSERT_EQ(report.status, REPORT_OK);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  EXPECT_EQ(bound->get_status(), BOUND_OK);
  EXPECT_TRUE(bound->is_exact());
  EXPECT_EQ(bound->get_low(), 0);
  EXPECT_EQ(bound->get_high(), 10);
  EXPECT_FALSE(bound->is_contiguity_checked());
  EXPECT_FALSE(bound->get_contiguity_reason().empty());
}

INSTANTIATE_TEST_SUITE_P(Strategies, IntervalSearchTest,
                         ::testing::Values(INT_LINEAR_SCAN,
                                           INT_BRACKET_BISECT));

TEST(LinearScan, StopsAtHorizon) {
  z3::context c;
  const z3::expr x = c.int_const("x");
  const GeneralizerConfig config(false, false, 10, 50);
  const BoundReport report =
      discover_integer_bounds(x >= 0, {}, INT_LINEAR_SCAN, config);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  EXPECT_EQ(bound->get_low(), 0);
  EXPECT_EQ(bound->get_low_kind(), BOUND_EXACT);
  EXPECT_EQ(bound->get_high(), bound->get_reference() + 50);
  EXPECT_EQ(bound->get_high_kind(), BOUND_HORIZON);
}

TEST(BracketBisect, UnboundedSideReachesInfinity) {
  z3::context c;
  const z3::expr x = c.int_const("x");
  const GeneralizerConfig config;
  const BoundReport report =
      discover_integer_bounds(x <= 7, {}, INT_BRACKET_BISECT, config);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  EXPECT_TRUE(bound->is_low_minf());
  EXPECT_EQ(bound->get_low_kind(), BOUND_HORIZON);
  EXPECT_EQ(bound->get_high(), 7);
  EXPECT_EQ(bound->get_high_kind(), BOUND_EXACT);
  EXPECT_EQ(bound->to_string(), "[~MINF,7]");
}

TEST(BracketBisect, LogarithmicQueries) {
  z3::context c;
  const z3::expr x = c.int_const("x");
  const GeneralizerConfig config;
  const BoundReport report = discover_integer_bounds(
      x >= -1000000 && x <= 1000000, {}, INT_BRACKET_BISECT, config);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  EXPECT_EQ(bound->get_low(), -1000000);
  EXPECT_EQ(bound->get_high(), 1000000);
  EXPECT_LT(report.oracle_queries, 200u);
}

TEST(BracketBisect, LargeInitialStep) {
  z3::context c;
  const z3::expr x = c.int_const("x");
  const GeneralizerConfig config(false, false, 10, 1000, 1000);
  const BoundReport report = discover_integer_bounds(
      x >= 3 && x <= 17, {}, INT_BRACKET_BISECT, config);
  const Bound* bound = report.find("x");
  ASSERT_NE(bound, nullptr);
  EXPECT_EQ(bound->get_low(), 3);
  EXPECT_EQ(bound->get_high(), 17);
}

TEST(Bound, Printing) {
  Bound bound("x");
  EXPECT_EQ(bound.to_string(), "[~MINF,~INF]");
  bound.set_lower_bound(-4, BOUND_EXACT);
  bound.set_upper_bound(12, BOUND_HORIZON);
  EXPECT_EQ(bound.to_string(), "[-4,~12]");
  EXPECT_FALSE(bound.is_exact());
  EXPECT_EQ(Bound::error("x", "bad").to_string(), "error");
  EXPECT_EQ(Bound::unresolved("x", "slow").get_reason(), "slow");
}

}  // namespace
}  // namespace InvGen
