#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli.h"

namespace InvGen {
namespace {

// argp wants a mutable argv; words must outlive the call.
void parse_words(std::vector<std::string> words, struct args &args) {
  std::vector<char *> argv;
  for (auto &word : words) argv.push_back(&word[0]);
  argv.push_back(nullptr);
  parse_args(static_cast<int>(words.size()), argv.data(), args);
}

TEST(Cli, ParsesOptions) {
  struct args args;
  parse_words({"invgen", "-m", "int", "-s", "linear", "-v", "x", "-v", "y",
               "-H", "25", "-g", "3", "-C", "input.smt2"},
              args);
  EXPECT_EQ(args.mode, MODE_INT);
  EXPECT_EQ(args.strategy, STRAT_LINEAR);
  EXPECT_EQ(args.variables, (std::vector<std::string>{"x", "y"}));
  EXPECT_STREQ(args.input, "input.smt2");
  EXPECT_TRUE(args.confirm);

  const GeneralizerConfig config = configFromArgs(args);
  EXPECT_EQ(config.search_horizon, 25u);
  EXPECT_EQ(config.contiguity_probes, 3u);
  EXPECT_FALSE(config.compound_terms);
}

TEST(Cli, CompoundOption) {
  struct args args;
  parse_words({"invgen", "--mode=bool", "--compound", "input.smt2"}, args);
  EXPECT_EQ(args.mode, MODE_BOOL);
  EXPECT_TRUE(configFromArgs(args).compound_terms);
}

// The input files below do not exist: every rejection happens before any
// file is opened.
TEST(CliDeathTest, MissingModeIsRejected) {
  struct args args;
  EXPECT_EXIT(parse_words({"invgen", "no-such-file.smt2"}, args),
              ::testing::ExitedWithCode(1), "no mode selected");
}

TEST(CliDeathTest, StrategyOfOtherAnalysisIsRejected) {
  struct args args;
  EXPECT_EXIT(
      parse_words({"invgen", "-m", "bool", "-s", "bracket", "none.smt2"},
                  args),
      ::testing::ExitedWithCode(1), "not applicable to boolean relations");
  EXPECT_EXIT(
      parse_words({"invgen", "-m", "int", "-s", "sampling", "none.smt2"},
                  args),
      ::testing::ExitedWithCode(1), "not applicable to integer bounds");
  EXPECT_EXIT(parse_words({"invgen", "-m", "bool", "-s", "sampling", "-x",
                           "none.smt2"},
                          args),
              ::testing::ExitedWithCode(1), "direct strategy");
}

TEST(CliDeathTest, VerifyNeedsCandidates) {
  struct args args;
  EXPECT_EXIT(parse_words({"invgen", "-m", "verify", "none.smt2"}, args),
              ::testing::ExitedWithCode(1), "no candidate given");
}

TEST(CliDeathTest, MalformedCountIsRejected) {
  struct args args;
  EXPECT_EXIT(
      parse_words({"invgen", "-m", "bool", "-k", "-3", "none.smt2"}, args),
      ::testing::ExitedWithCode(1), "not a non-negative number");
}

}  // namespace
}  // namespace InvGen
