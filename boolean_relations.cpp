#include "boolean_relations.h"

#include <algorithm>
#include <iostream>
#include <optional>

#include "z3_utils.h"

namespace InvGen {

static const std::string BUDGET_CATEGORY = "relations";

std::string Relation::to_string() const {
  switch (kind) {
    case REL_ALWAYS_TRUE:
      return var1 + " is always true";
    case REL_ALWAYS_FALSE:
      return var1 + " is always false";
    case REL_IMPLIES_TRUE:
      return var1 + " = true implies " + var2 + " = true";
    case REL_IMPLIES_FALSE:
      return var1 + " = true implies " + var2 + " = false";
  }
  return "";
}

std::vector<Relation> RelationReport::fixed_values() const {
  std::vector<Relation> res;
  for (const auto& rel : relations) {
    if (rel.is_fixed_value()) res.push_back(rel);
  }
  return res;
}

std::vector<Relation> RelationReport::implications() const {
  std::vector<Relation> res;
  for (const auto& rel : relations) {
    if (!rel.is_fixed_value()) res.push_back(rel);
  }
  return res;
}

bool RelationReport::is_compound(const std::string& name) const {
  return std::binary_search(compound_terms.begin(), compound_terms.end(),
                            name);
}

bool RelationReport::contains(relation_kind kind, const std::string& var1,
                              const std::string& var2) const {
  for (const auto& rel : relations) {
    if (rel.kind == kind && rel.var1 == var1 && rel.var2 == var2) return true;
  }
  return false;
}

BooleanRelationEngine::BooleanRelationEngine(const z3::expr& _formula,
                                             const GeneralizerConfig& _config)
    : c(_formula.ctx()),
      config(_config),
      formula(_formula),
      table(_formula),
      oracle(_formula.ctx(), _config) {}

std::vector<z3::expr> BooleanRelationEngine::resolve_items(
    const std::vector<std::string>& requested, RelationReport& report) {
  std::vector<std::string> names =
      requested.empty() ? table.bool_variables() : normalize_names(requested);
  std::vector<z3::expr> vars;
  for (const std::string& name : names) {
    const Z3_sort_kind sort = table.sort_of(name);
    if (sort == Z3_UNKNOWN_SORT) {
      // not mentioned by the formula: an unconstrained boolean
      vars.push_back(c.bool_const(name.c_str()));
    } else if (sort == Z3_BOOL_SORT) {
      vars.push_back(table.constant(name));
    } else {
      report.errors[name] = "variable " + name + " is declared " +
                            sort_kind_to_string(sort) + ", not Bool";
      continue;
    }
    report.variables.push_back(name);
  }
  if (config.compound_terms) {
    for (const z3::expr& term : compound_bool_subterms(formula)) {
      const std::string text = term.to_string();
      vars.push_back(term);
      report.variables.push_back(text);
      report.compound_terms.push_back(text);
    }
  }
  return vars;
}

bool BooleanRelationEngine::budget_exhausted() {
  return oracle.is_time_limit_reached(BUDGET_CATEGORY);
}

RelationReport BooleanRelationEngine::run(
    const std::vector<std::string>& requested, bool_strategy strategy) {
  if (config.compound_terms && strategy != BOOL_DIRECT_QUERY)
    throw ConfigurationError("compound terms need the " +
                             to_string(BOOL_DIRECT_QUERY) + " strategy");
  RelationReport report(strategy);
  const unsigned long queries_before = oracle.num_queries();
  std::vector<z3::expr> vars = resolve_items(requested, report);
  if (vars.empty()) {
    report.status = REPORT_NO_VARIABLES;
    return report;
  }

  oracle.set_timer_max(BUDGET_CATEGORY, config.variable_time_budget);
  oracle.set_timer_on(BUDGET_CATEGORY);
  std::optional<z3::model> base;
  try {
    base = oracle.get_model(formula);
  } catch (const OracleUnknown& except) {
    report.status = REPORT_UNRESOLVED;
    report.status_reason = except.what();
  }
  if (report.status == REPORT_OK && !base) {
    report.status = REPORT_NO_SOLUTION;
  }
  if (report.status == REPORT_OK) {
    if (config.debug)
      std::cout << "Analyzing " << vars.size() << " boolean items, "
                << report.compound_terms.size() << " of them compound ("
                << to_string(strategy) << ")\n";
    switch (strategy) {
      case BOOL_DIRECT_QUERY:
        direct_query(vars, report);
        break;
      case BOOL_MODEL_SAMPLING:
        model_sampling(*base, vars, report);
        break;
    }
  }
  oracle.accumulate_time(BUDGET_CATEGORY);
  report.oracle_queries = oracle.num_queries() - queries_before;
  report.time_stats = oracle.get_accumulated_times();
  return report;
}

void BooleanRelationEngine::direct_query(const std::vector<z3::expr>& vars,
                                         RelationReport& report) {
  const size_t n = vars.size();
  std::vector<bool> always_false(n, false);

  for (size_t i = 0; i < n; ++i) {
    const std::string& name = report.variables[i];
    if (budget_exhausted()) {
      report.unresolved[name] = "time budget exhausted";
      continue;
    }
    try {
      if (oracle.is_unsatisfiable(formula && !vars[i])) {
        report.relations.push_back(
            {REL_ALWAYS_TRUE, name, "", BOOL_DIRECT_QUERY, true});
      } else if (oracle.is_unsatisfiable(formula && vars[i])) {
        report.relations.push_back(
            {REL_ALWAYS_FALSE, name, "", BOOL_DIRECT_QUERY, true});
        always_false[i] = true;
      }
    } catch (const OracleUnknown& except) {
      report.unresolved[name] = except.what();
    } catch (const ConfigurationError& except) {
      report.errors[name] = except.what();
    }
  }

  for (size_t i = 0; i < n; ++i) {
    // v1 never holds: every implication from it is vacuous
    if (always_false[i]) continue;
    for (size_t j = 0; j < n; ++j) {
      if (i == j) continue;
      const std::string& v1 = report.variables[i];
      const std::string& v2 = report.variables[j];
      const std::string pair = v1 + " => " + v2;
      if (budget_exhausted()) {
        report.unresolved[pair] = "time budget exhausted";
        continue;
      }
      try {
        if (oracle.is_unsatisfiable(formula && vars[i] && !vars[j])) {
          report.relations.push_back(
              {REL_IMPLIES_TRUE, v1, v2, BOOL_DIRECT_QUERY, true});
        } else if (oracle.is_unsatisfiable(formula && vars[i] && vars[j])) {
          report.relations.push_back(
              {REL_IMPLIES_FALSE, v1, v2, BOOL_DIRECT_QUERY, true});
        }
      } catch (const OracleUnknown& except) {
        report.unresolved[pair] = except.what();
      } catch (const ConfigurationError& except) {
        report.errors[pair] = except.what();
      }
    }
  }
}

void BooleanRelationEngine::model_sampling(const z3::model& first,
                                           const std::vector<z3::expr>& vars,
                                           RelationReport& report) {
  z3::expr blocked = formula;
  std::optional<z3::model> current = first;
  while (true) {
    Assignment sample = Assignment::from_model(*current, vars);
    if (config.debug)
      std::cout << "Sample " << report.samples.size() + 1 << ": "
                << sample.toString() << "\n";
    report.samples.push_back(sample);
    if (report.samples.size() >= config.max_samples) break;
    if (budget_exhausted()) {
      report.unresolved["sampling"] = "time budget exhausted";
      break;
    }
    blocked = blocked && sample.blocking_clause(c);
    try {
      current = oracle.get_model(blocked);
    } catch (const OracleUnknown& except) {
      report.unresolved["sampling"] = except.what();
      break;
    }
    if (!current) {
      report.exhaustive = true;
      break;
    }
  }
  relations_from_samples(vars, report);
}

void BooleanRelationEngine::relations_from_samples(
    const std::vector<z3::expr>& vars, RelationReport& report) {
  const size_t n = vars.size();
  const bool sound = report.exhaustive;
  // may_be_true[i]: some sample has variable i true or leaves it free
  std::vector<bool> may_be_true(n, false);

  for (size_t i = 0; i < n; ++i) {
    const std::string& name = report.variables[i];
    bool fixed = true;
    bool fixed_value = false;
    bool first = true;
    for (const Assignment& sample : report.samples) {
      const std::pair<bool, bool> val = sample.evalBoolVar(name);
      if (!val.second || val.first) may_be_true[i] = true;
      if (!val.second) {
        fixed = false;
      } else if (first) {
        fixed_value = val.first;
        first = false;
      } else if (val.first != fixed_value) {
        fixed = false;
      }
    }
    if (fixed && !first) {
      report.relations.push_back({fixed_value ? REL_ALWAYS_TRUE
                                              : REL_ALWAYS_FALSE,
                                  name, "", BOOL_MODEL_SAMPLING, sound});
    }
  }

  for (size_t i = 0; i < n; ++i) {
    if (!may_be_true[i]) continue;
    for (size_t j = 0; j < n; ++j) {
      if (i == j) continue;
      const std::string& v1 = report.variables[i];
      const std::string& v2 = report.variables[j];
      bool refutes_true = false;
      bool refutes_false = false;
      for (const Assignment& sample : report.samples) {
        const std::pair<bool, bool> a = sample.evalBoolVar(v1);
        if (a.second && !a.first) continue;
        const std::pair<bool, bool> b = sample.evalBoolVar(v2);
        if (!b.second || !b.first) refutes_true = true;
        if (!b.second || b.first) refutes_false = true;
      }
      if (!refutes_true) {
        report.relations.push_back(
            {REL_IMPLIES_TRUE, v1, v2, BOOL_MODEL_SAMPLING, sound});
      } else if (!refutes_false) {
        report.relations.push_back(
            {REL_IMPLIES_FALSE, v1, v2, BOOL_MODEL_SAMPLING, sound});
      }
    }
  }
}

RelationReport discover_boolean_relations(
    const z3::expr& formula, const std::vector<std::string>& variables,
    bool_strategy strategy, const GeneralizerConfig& config) {
  config.validate();
  BooleanRelationEngine engine(formula, config);
  return engine.run(variables, strategy);
}

}  // namespace InvGen
