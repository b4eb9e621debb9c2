#include "assignment.h"

#include <cassert>

#include "z3_utils.h"

namespace InvGen {

Assignment Assignment::from_model(const z3::model& model,
                                  const std::vector<z3::expr>& variables) {
  std::vector<std::string> names;
  names.reserve(variables.size());
  for (const auto& v : variables) names.push_back(v.decl().name().str());
  Assignment res(names);
  for (const auto& v : variables) {
    assert(v.is_const());
    if (!model.has_interp(v.decl())) continue;
    const std::string name = v.decl().name().str();
    if (v.is_bool()) {
      res.addBoolAssignment(name, model_eval_to_bool(model, v));
    } else if (v.is_int()) {
      int64_t value;
      if (model_eval_to_int64(model, v, value))
        res.addIntAssignment(name, value);
    }
  }
  return res;
}

bool Assignment::addBoolAssignment(const std::string& var, bool value) {
  auto ret = bool_map.insert(std::pair(var, value));
  return ret.second;
}

bool Assignment::addIntAssignment(const std::string& var, int64_t value) {
  auto ret = int_map.insert(std::pair(var, value));
  return ret.second;
}

std::pair<bool, bool> Assignment::evalBoolVar(const std::string& var) const {
  auto it = bool_map.find(var);
  if (it == bool_map.end()) {
    return std::pair<bool, bool>(false, false);
  } else {
    return std::pair<bool, bool>(it->second, true);
  }
}

z3::expr Assignment::blocking_clause(z3::context& c) const {
  z3::expr_vector literals(c);
  for (const auto& entry : bool_map) {
    z3::expr v = c.bool_const(entry.first.c_str());
    literals.push_back(entry.second ? !v : v);
  }
  if (literals.empty()) return c.bool_val(false);
  return z3::mk_or(literals);
}

std::string Assignment::toString() const {
  std::string res;
  // lets estimate the string size to prevent reallocation
  res.reserve(10 + var_names.size() * 10);
  for (const auto& name : var_names) {
    res += name;
    res += ':';
    const auto b = bool_map.find(name);
    const auto i = int_map.find(name);
    if (b != bool_map.end()) {
      res += b->second ? "true" : "false";
    } else if (i != int_map.end()) {
      res += std::to_string(i->second);
    } else {
      res += '*';  // outside the model support
    }
    res += ';';
  }
  return res;
}

}  // namespace InvGen
