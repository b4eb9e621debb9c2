#include "report.h"

#include <algorithm>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>

#include "errors.h"

namespace InvGen {

static std::string model_to_string(const z3::model& model) {
  std::stringstream ss;
  ss << model;
  return ss.str();
}

static std::string join(const std::vector<std::string>& names) {
  std::string res;
  for (const auto& name : names) {
    if (!res.empty()) res += ", ";
    res += name;
  }
  return res;
}

static std::string find_root(std::map<std::string, std::string>& parent,
                             const std::string& name) {
  std::string root = name;
  while (parent[root] != root) root = parent[root];
  // path compression
  std::string cur = name;
  while (parent[cur] != root) {
    std::string next = parent[cur];
    parent[cur] = root;
    cur = next;
  }
  return root;
}

void GeneralizationReport::add_verdicts(
    const std::vector<VerificationOutcome>& outcomes) {
  verdicts.insert(verdicts.end(), outcomes.begin(), outcomes.end());
}

std::vector<std::vector<std::string>>
GeneralizationReport::equivalence_classes() const {
  std::vector<std::vector<std::string>> res;
  if (!relations) return res;

  std::map<std::string, std::string> parent;
  for (const auto& name : relations->variables) {
    if (relations->contains(REL_ALWAYS_TRUE, name) ||
        relations->contains(REL_ALWAYS_FALSE, name))
      continue;
    parent[name] = name;
  }
  for (const auto& rel : relations->relations) {
    if (rel.kind != REL_IMPLIES_TRUE) continue;
    if (parent.count(rel.var1) == 0 || parent.count(rel.var2) == 0) continue;
    if (!relations->contains(REL_IMPLIES_TRUE, rel.var2, rel.var1)) continue;
    const std::string a = find_root(parent, rel.var1);
    const std::string b = find_root(parent, rel.var2);
    if (a != b) parent[std::max(a, b)] = std::min(a, b);
  }

  std::map<std::string, std::vector<std::string>> classes;
  std::vector<std::string> names;
  for (const auto& entry : parent) names.push_back(entry.first);
  for (const auto& name : names)
    classes[find_root(parent, name)].push_back(name);
  for (auto& entry : classes) {
    if (entry.second.size() < 2) continue;
    std::sort(entry.second.begin(), entry.second.end());
    res.push_back(entry.second);
  }
  return res;
}

std::vector<ImplicationGroup> GeneralizationReport::implication_groups()
    const {
  std::vector<ImplicationGroup> res;
  if (!relations) return res;
  for (const auto& rel : relations->relations) {
    if (rel.is_fixed_value()) continue;
    const bool implied = rel.kind == REL_IMPLIES_TRUE;
    auto it = std::find_if(res.begin(), res.end(),
                           [&](const ImplicationGroup& group) {
                             return group.source == rel.var1 &&
                                    group.implied == implied;
                           });
    if (it == res.end()) {
      res.push_back({rel.var1, implied, {rel.var2}, rel.sound});
    } else {
      it->targets.push_back(rel.var2);
      it->sound = it->sound && rel.sound;
    }
  }
  return res;
}

unsigned long GeneralizationReport::num_failed_verdicts() const {
  return std::count_if(
      verdicts.begin(), verdicts.end(),
      [](const VerificationOutcome& outcome) { return !outcome.holds(); });
}

void GeneralizationReport::print(std::ostream& os) const {
  os << "Input: " << input_filename << "\n";

  if (relations) {
    os << "Boolean relations (" << to_string(relations->strategy)
       << "): " << to_string(relations->status);
    if (!relations->status_reason.empty())
      os << " (" << relations->status_reason << ")";
    os << "\n";
    if (!relations->compound_terms.empty())
      os << "  Compound terms: " << relations->compound_terms.size() << "\n";
    const std::vector<Relation> fixed = relations->fixed_values();
    if (!fixed.empty()) {
      os << "  Fixed values:\n";
      for (const auto& rel : fixed) {
        os << "    " << rel.to_string();
        if (!rel.sound) os << " (conjecture)";
        os << "\n";
      }
    }
    const std::vector<ImplicationGroup> groups = implication_groups();
    if (!groups.empty()) {
      os << "  Implications:\n";
      for (const auto& group : groups) {
        os << "    " << group.source << " = true implies ";
        if (group.targets.size() == 1)
          os << group.targets.front();
        else
          os << "all of {" << join(group.targets) << "}";
        os << " = " << (group.implied ? "true" : "false");
        if (!group.sound) os << " (conjecture)";
        os << "\n";
      }
    }
    const auto classes = equivalence_classes();
    if (!classes.empty()) {
      os << "  Equivalences:\n";
      for (const auto& cls : classes) os << "    {" << join(cls) << "}\n";
    }
    if (relations->strategy == BOOL_MODEL_SAMPLING &&
        relations->status == REPORT_OK) {
      os << "  Samples: " << relations->samples.size()
         << (relations->exhaustive ? " (exhaustive)" : " (capped)") << "\n";
    }
    for (const auto& entry : relations->unresolved)
      os << "  Unresolved " << entry.first << ": " << entry.second << "\n";
    for (const auto& entry : relations->errors)
      os << "  Error " << entry.first << ": " << entry.second << "\n";
    os << "  Oracle queries: " << relations->oracle_queries << "\n";
  }

  if (bounds) {
    os << "Integer bounds (" << to_string(bounds->strategy)
       << "): " << to_string(bounds->status);
    if (!bounds->status_reason.empty())
      os << " (" << bounds->status_reason << ")";
    os << "\n";
    for (const auto& entry : bounds->bounds) {
      const Bound& bound = entry.second;
      os << "  " << entry.first << " in " << bound;
      if (bound.is_ok()) {
        os << " (reference " << bound.get_reference() << ")";
        if (bound.has_outside_solutions())
          os << " WARNING: solutions outside the bound";
        if (bound.has_gap()) os << " WARNING: gap inside the bound";
        if (!bound.get_contiguity_reason().empty())
          os << " (contiguity unchecked: " << bound.get_contiguity_reason()
             << ")";
      } else {
        os << ": " << bound.get_reason();
      }
      os << "\n";
    }
    os << "  Oracle queries: " << bounds->oracle_queries << "\n";
  }

  if (!verdicts.empty()) {
    os << "Verification:\n";
    for (const auto& outcome : verdicts) {
      os << "  " << outcome.candidate << ": "
         << verdict_to_string(outcome.result);
      if (!outcome.reason.empty()) os << " (" << outcome.reason << ")";
      os << "\n";
      if (outcome.counterexample)
        os << "    counterexample:\n"
           << model_to_string(*outcome.counterexample) << "\n";
    }
  }
}

Json::Value GeneralizationReport::to_json() const {
  Json::Value json_output;
  json_output["filename"] = input_filename;

  if (relations) {
    Json::Value& rel_json = json_output["boolean relations"];
    rel_json["strategy"] = to_string(relations->strategy);
    rel_json["status"] = to_string(relations->status);
    rel_json["status reason"] = relations->status_reason;
    rel_json["fixed values"] = Json::Value(Json::arrayValue);
    rel_json["implications"] = Json::Value(Json::arrayValue);
    rel_json["equivalences"] = Json::Value(Json::arrayValue);
    for (const auto& term : relations->compound_terms)
      rel_json["compound terms"].append(term);
    for (const auto& rel : relations->relations) {
      Json::Value entry;
      if (rel.is_fixed_value()) {
        entry["variable"] = rel.var1;
        entry["value"] = rel.kind == REL_ALWAYS_TRUE;
        entry["sound"] = rel.sound;
        rel_json["fixed values"].append(entry);
      } else {
        entry["source"] = rel.var1;
        entry["target"] = rel.var2;
        entry["implied"] = rel.kind == REL_IMPLIES_TRUE;
        entry["sound"] = rel.sound;
        rel_json["implications"].append(entry);
      }
    }
    for (const auto& cls : equivalence_classes()) {
      Json::Value members(Json::arrayValue);
      for (const auto& name : cls) members.append(name);
      rel_json["equivalences"].append(members);
    }
    rel_json["samples"] = (Json::UInt64)relations->samples.size();
    rel_json["exhaustive"] = relations->exhaustive;
    for (const auto& entry : relations->unresolved)
      rel_json["unresolved"][entry.first] = entry.second;
    for (const auto& entry : relations->errors)
      rel_json["errors"][entry.first] = entry.second;
    rel_json["oracle queries"] = (Json::UInt64)relations->oracle_queries;
    for (auto it = relations->time_stats.cbegin();
         it != relations->time_stats.cend(); ++it) {
      rel_json["time stats"][it->first] = it->second;
    }
  }

  if (bounds) {
    Json::Value& bound_json = json_output["integer bounds"];
    bound_json["strategy"] = to_string(bounds->strategy);
    bound_json["status"] = to_string(bounds->status);
    bound_json["status reason"] = bounds->status_reason;
    bound_json["bounds"] = Json::Value(Json::objectValue);
    for (const auto& entry : bounds->bounds) {
      const Bound& bound = entry.second;
      Json::Value& b = bound_json["bounds"][entry.first];
      b["status"] = bound_status_to_string(bound.get_status());
      if (bound.is_ok()) {
        b["low"] = (Json::Int64)bound.get_low();
        b["high"] = (Json::Int64)bound.get_high();
        b["low kind"] = bound_kind_to_string(bound.get_low_kind());
        b["high kind"] = bound_kind_to_string(bound.get_high_kind());
        b["reference"] = (Json::Int64)bound.get_reference();
        if (bound.is_contiguity_checked()) {
          b["contiguity"]["outside solutions"] = bound.has_outside_solutions();
          b["contiguity"]["gap detected"] = bound.has_gap();
        } else if (!bound.get_contiguity_reason().empty()) {
          b["contiguity"]["unresolved"] = bound.get_contiguity_reason();
        }
      } else {
        b["reason"] = bound.get_reason();
      }
      b["oracle queries"] = (Json::UInt64)bound.get_oracle_queries();
    }
    bound_json["oracle queries"] = (Json::UInt64)bounds->oracle_queries;
    for (auto it = bounds->time_stats.cbegin(); it != bounds->time_stats.cend();
         ++it) {
      bound_json["time stats"][it->first] = it->second;
    }
  }

  if (!verdicts.empty()) {
    Json::Value& ver_json = json_output["verification"];
    for (const auto& outcome : verdicts) {
      Json::Value entry;
      entry["candidate"] = outcome.candidate.to_string();
      entry["verdict"] = verdict_to_string(outcome.result);
      if (!outcome.reason.empty()) entry["reason"] = outcome.reason;
      if (outcome.counterexample)
        entry["counterexample"] = model_to_string(*outcome.counterexample);
      entry["oracle queries"] = (Json::UInt64)outcome.oracle_queries;
      ver_json.append(entry);
    }
  }
  return json_output;
}

void GeneralizationReport::write_json(const std::string& path) const {
  std::ofstream json_file;
  std::cout << "Writing to json file: " << path << "\n";
  json_file.open(path);
  if (!json_file.is_open())
    throw ConfigurationError("cannot open " + path + " for writing");

  Json::StreamWriterBuilder builder;
  builder["indentation"] = " ";
  std::unique_ptr<Json::StreamWriter> streamWriter(builder.newStreamWriter());
  streamWriter->write(to_json(), &json_file);

  json_file.close();
}

std::vector<Candidate> candidates_from(const RelationReport& report) {
  std::vector<Candidate> res;
  for (const auto& rel : report.fixed_values()) {
    if (report.is_compound(rel.var1)) continue;
    res.push_back(
        Candidate::bool_polarity(rel.var1, rel.kind == REL_ALWAYS_TRUE));
  }
  return res;
}

std::vector<Candidate> candidates_from(const BoundReport& report) {
  std::vector<Candidate> res;
  for (const auto& entry : report.bounds) {
    const Bound& bound = entry.second;
    if (!bound.is_exact()) continue;
    if (bound.get_low() == bound.get_high())
      res.push_back(Candidate::fixed_value(entry.first, bound.get_low()));
    else
      res.push_back(
          Candidate::interval(entry.first, bound.get_low(), bound.get_high()));
  }
  return res;
}

}  // namespace InvGen
