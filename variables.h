#ifndef INVGEN_VARIABLES_H
#define INVGEN_VARIABLES_H

#include <z3++.h>

#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace InvGen {

/*
 * The free variables (0-arity uninterpreted constants) of one formula, with
 * their declarations. Built by a single walk over the formula DAG that visits
 * every AST node once; keep the table around instead of re-walking the
 * formula for every query.
 */
class VariableTable {
  std::map<std::string, z3::func_decl> decls;
  std::vector<std::string> bool_names;
  std::vector<std::string> int_names;
  std::vector<std::string> other_names;
  std::unordered_set<unsigned> visited;

 public:
  explicit VariableTable(const z3::expr& formula);

  // All three lists are sorted lexicographically.
  const std::vector<std::string>& bool_variables() const {
    return bool_names;
  }
  const std::vector<std::string>& int_variables() const { return int_names; }
  const std::vector<std::string>& other_variables() const {
    return other_names;
  }
  /*
   * Sort of the named variable, or Z3_UNKNOWN_SORT if the formula does not
   * mention it.
   */
  Z3_sort_kind sort_of(const std::string& name) const;
  /*
   * The variable as a term. The name must be contained in the table.
   */
  z3::expr constant(const std::string& name) const;

 private:
  void collect(const z3::expr& e);
};

/*
 * Sorted, de-duplicated copy of a caller-supplied name list.
 */
std::vector<std::string> normalize_names(const std::vector<std::string>& names);

}  // namespace InvGen

#endif  // INVGEN_VARIABLES_H
