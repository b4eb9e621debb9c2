#ifndef INVGEN_ASSIGNMENT_H
#define INVGEN_ASSIGNMENT_H

#include <z3++.h>

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace InvGen {

/*
 * A snapshot of one oracle model restricted to the variables under analysis.
 * Variables the model leaves uninterpreted are outside its support and are
 * simply not assigned here.
 */
class Assignment {
  std::vector<std::string> var_names;
  std::map<std::string, bool> bool_map;
  std::map<std::string, int64_t> int_map;

 public:
  explicit Assignment(const std::vector<std::string>& _var_names)
      : var_names(_var_names), bool_map(), int_map() {}

  /*
   * Reads every listed variable that has an interpretation in the model.
   * Integer values that do not fit in 64 bits are left unassigned.
   */
  static Assignment from_model(const z3::model& model,
                               const std::vector<z3::expr>& variables);

  /* Returns true iff assignment was successful (i.e, var was not previously
   * assigned).
   */
  bool addBoolAssignment(const std::string& var, bool value);
  bool addIntAssignment(const std::string& var, int64_t value);
  /*
   * If var is assigned - returns its value and true. Else - returns false and
   * false.
   */
  std::pair<bool, bool> evalBoolVar(const std::string& var) const;
  /*
   * Disjunction of the negated literals of all assigned boolean variables.
   * Conjoining it with a formula excludes exactly this boolean assignment.
   * Empty support yields false.
   */
  z3::expr blocking_clause(z3::context& c) const;
  std::string toString() const;
};

}  // namespace InvGen

#endif  // INVGEN_ASSIGNMENT_H
