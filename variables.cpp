#include "variables.h"

#include <algorithm>
#include <cassert>

#include "z3_utils.h"

namespace InvGen {

VariableTable::VariableTable(const z3::expr& formula) {
  collect(formula);
  for (const auto& entry : decls) {
    switch (entry.second.range().sort_kind()) {
      case Z3_BOOL_SORT:
        bool_names.push_back(entry.first);
        break;
      case Z3_INT_SORT:
        int_names.push_back(entry.first);
        break;
      default:
        other_names.push_back(entry.first);
        break;
    }
  }
  // std::map iteration order already is lexicographic
  assert(std::is_sorted(bool_names.begin(), bool_names.end()));
  assert(std::is_sorted(int_names.begin(), int_names.end()));
}

void VariableTable::collect(const z3::expr& e) {
  if (!visited.insert(e.id()).second) return;
  if (e.is_quantifier()) {
    collect(e.body());
    return;
  }
  if (!e.is_app()) return;  // bound variable
  if (is_free_constant(e)) {
    z3::func_decl fd = e.decl();
    // same name declared with two sorts: the first occurrence wins
    decls.emplace(fd.name().str(), fd);
    return;
  }
  for (unsigned i = 0; i < e.num_args(); ++i) {
    collect(e.arg(i));
  }
}

Z3_sort_kind VariableTable::sort_of(const std::string& name) const {
  const auto it = decls.find(name);
  if (it == decls.end()) return Z3_UNKNOWN_SORT;
  return it->second.range().sort_kind();
}

z3::expr VariableTable::constant(const std::string& name) const {
  const auto it = decls.find(name);
  assert(it != decls.end());
  return it->second();
}

std::vector<std::string> normalize_names(
    const std::vector<std::string>& names) {
  std::vector<std::string> res(names);
  std::sort(res.begin(), res.end());
  res.erase(std::unique(res.begin(), res.end()), res.end());
  return res;
}

}  // namespace InvGen
