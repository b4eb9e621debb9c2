#include "cli.h"

#include <argp.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace InvGen {

static const char *argp_doc =
    "invgen -- Generalize a satisfiable SMT formula into candidate invariants";

static const char *argp_args_doc = "INPUT";

static struct argp_option options[] = {
    {"mode", 'm', "MODE", 0,
     "Analysis to run {bool, int, verify}", 0},
    {"strategy", 's', "STRAT", 0,
     "Strategy: {direct, sampling} for bool, {linear, bracket} for int", 0},
    {"var", 'v', "NAME", 0,
     "Analyze only this variable (repeatable; default: all of the sort)", 0},
    {"compound", 'x', 0, 0,
     "Also relate compound boolean subterms (bool mode, direct strategy)", 0},
    {"candidate", 'c', "TEXT", 0,
     "Candidate to verify, e.g. x=5, p=true, x=[0,10] (repeatable)", 0},
    {"samples", 'k', "NUM", 0, "Maximal number of sampled models", 0},
    {"horizon", 'H', "NUM", 0, "Linear scan horizon in each direction", 0},
    {"initial-step", 'S', "NUM", 0, "First bracket step", 0},
    {"timeout", 't', "MS", 0, "Per-query oracle timeout in milliseconds", 0},
    {"budget", 'b', "SECONDS", 0,
     "Time budget per variable (int) or per analysis (bool)", 0},
    {"gap-probes", 'g', "NUM", 0,
     "Check each exact bound for gaps with NUM interior probes", 0},
    {"confirm", 'C', 0, 0,
     "Verify the discovered facts on the whole formula", 0},
    {"debug", 'd', 0, 0, "Show debug messages (can be very verbose)", 0},
    {"json", 'j', 0, 0, "Write JSON output", 0},
    {"output-dir", 'o', "DIRECTORY", 0, "Output directory for JSON output", 0},
    {0, 0, 0, 0, 0, 0}};

static unsigned long parse_count(const char *arg, struct argp_state *state) {
  char *end = nullptr;
  errno = 0;
  const unsigned long res = strtoul(arg, &end, 10);
  if (errno != 0 || end == arg || *end != '\0' || arg[0] == '-')
    argp_error(state, "not a non-negative number: %s", arg);
  return res;
}

static void check_args(const struct args *args, struct argp_state *state) {
  switch (args->mode) {
    case MODE_UNSET:
      argp_error(state, "no mode selected");
      break;
    case MODE_BOOL:
      if (args->strategy == STRAT_LINEAR || args->strategy == STRAT_BRACKET)
        argp_error(state, "strategy not applicable to boolean relations");
      if (args->compound && args->strategy == STRAT_SAMPLING)
        argp_error(state, "compound terms need the direct strategy");
      break;
    case MODE_INT:
      if (args->strategy == STRAT_DIRECT || args->strategy == STRAT_SAMPLING)
        argp_error(state, "strategy not applicable to integer bounds");
      if (args->compound)
        argp_error(state, "compound terms apply to boolean relations only");
      break;
    case MODE_VERIFY:
      if (args->candidates.empty())
        argp_error(state, "no candidate given");
      break;
  }
}

static error_t parse_opt(int key, char *arg, struct argp_state *state) {
  struct args *args = (struct args *)state->input;

  switch (key) {
    case 'm':
      if (0 == strncasecmp("bool", arg, 5))
        args->mode = MODE_BOOL;
      else if (0 == strncasecmp("int", arg, 4))
        args->mode = MODE_INT;
      else if (0 == strncasecmp("verify", arg, 7))
        args->mode = MODE_VERIFY;
      else
        argp_usage(state);
      break;
    case 's':
      if (0 == strncasecmp("direct", arg, 7)) {
        args->strategy = STRAT_DIRECT;
      } else if (0 == strncasecmp("sampling", arg, 9)) {
        args->strategy = STRAT_SAMPLING;
      } else if (0 == strncasecmp("linear", arg, 7)) {
        args->strategy = STRAT_LINEAR;
      } else if (0 == strncasecmp("bracket", arg, 8)) {
        args->strategy = STRAT_BRACKET;
      } else {
        argp_usage(state);
      }
      break;
    case 'v':
      args->variables.push_back(arg);
      break;
    case 'x':
      args->compound = true;
      break;
    case 'c':
      args->candidates.push_back(arg);
      break;
    case 'k':
      args->max_samples = parse_count(arg, state);
      break;
    case 'H':
      args->search_horizon = parse_count(arg, state);
      break;
    case 'S':
      args->initial_step = parse_count(arg, state);
      break;
    case 't':
      args->query_timeout_ms = parse_count(arg, state);
      break;
    case 'b':
      args->variable_time_budget = atof(arg);
      break;
    case 'g':
      args->contiguity_probes = parse_count(arg, state);
      break;
    case 'C':
      args->confirm = true;
      break;
    case 'd':
      args->debug = true;
      break;
    case 'j':
      args->json = true;
      break;
    case 'o':
      args->output_dir = arg;
      break;
    case ARGP_KEY_END:
      if (state->arg_num < 1) argp_usage(state);
      check_args(args, state);
      break;
    case ARGP_KEY_ARG:
      if (state->arg_num >= 1) argp_usage(state);

      args->input = arg;
      break;
    default:
      return ARGP_ERR_UNKNOWN;
  }
  return 0;
}

static struct argp argp = {options, parse_opt, argp_args_doc, argp_doc,
                           0,       0,         0};

void parse_args(int argc, char *argv[], struct args &args) {
  argp_err_exit_status = 1;
  argp_parse(&argp, argc, argv, 0, 0, &args);
}

GeneralizerConfig configFromArgs(const struct args &args) {
  return GeneralizerConfig(args.debug, args.json, args.max_samples,
                           args.search_horizon, args.initial_step,
                           args.query_timeout_ms, args.variable_time_budget,
                           args.contiguity_probes, args.compound);
}

}  // namespace InvGen
