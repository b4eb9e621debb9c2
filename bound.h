#ifndef INVGEN_BOUND_H
#define INVGEN_BOUND_H

#include <cstdint>
#include <iostream>
#include <string>

namespace InvGen {

// How a side of a bound was established.
enum bound_kind {
  BOUND_EXACT,   // the next value beyond it is unsat
  BOUND_HORIZON  // search stopped while still sat; the true bound lies beyond
};
enum bound_status { BOUND_OK, BOUND_UNRESOLVED, BOUND_ERROR };

/*
 * Bounds of one integer variable with all other variables fixed to a
 * reference model. A side at INT64_MIN / INT64_MAX prints as MINF / INF.
 */
class Bound {
  std::string variable;
  bound_status status = BOUND_OK;
  std::string reason;
  int64_t low = INT64_MIN;
  int64_t high = INT64_MAX;
  bound_kind low_kind = BOUND_HORIZON;
  bound_kind high_kind = BOUND_HORIZON;
  int64_t reference = 0;
  unsigned long oracle_queries = 0;
  bool contiguity_checked = false;
  bool outside_solutions = false;
  bool gap_detected = false;
  // why the contiguity diagnostics could not finish
  std::string contiguity_reason;

 public:
  explicit Bound(const std::string& var) : variable(var) {}
  static Bound error(const std::string& var, const std::string& why);
  static Bound unresolved(const std::string& var, const std::string& why);

  void set_lower_bound(int64_t l_bound, bound_kind kind);
  void set_upper_bound(int64_t u_bound, bound_kind kind);
  void set_reference(int64_t value) { reference = value; }
  void set_oracle_queries(unsigned long n) { oracle_queries = n; }
  void set_contiguity(bool outside, bool gap);
  void set_contiguity_unresolved(const std::string& why);

  [[nodiscard]] const std::string& get_variable() const { return variable; }
  [[nodiscard]] bound_status get_status() const { return status; }
  [[nodiscard]] const std::string& get_reason() const { return reason; }
  [[nodiscard]] int64_t get_low() const { return low; }
  [[nodiscard]] int64_t get_high() const { return high; }
  [[nodiscard]] bound_kind get_low_kind() const { return low_kind; }
  [[nodiscard]] bound_kind get_high_kind() const { return high_kind; }
  [[nodiscard]] int64_t get_reference() const { return reference; }
  [[nodiscard]] unsigned long get_oracle_queries() const {
    return oracle_queries;
  }
  [[nodiscard]] bool is_contiguity_checked() const {
    return contiguity_checked;
  }
  [[nodiscard]] bool has_outside_solutions() const {
    return outside_solutions;
  }
  [[nodiscard]] bool has_gap() const { return gap_detected; }
  [[nodiscard]] const std::string& get_contiguity_reason() const {
    return contiguity_reason;
  }

  [[nodiscard]] bool is_ok() const { return status == BOUND_OK; }
  // Both sides exact.
  [[nodiscard]] bool is_exact() const;
  [[nodiscard]] bool is_high_inf() const;
  [[nodiscard]] bool is_low_minf() const;
  [[nodiscard]] bool is_in_range(int64_t val) const;

  std::string to_string() const;
  friend std::ostream& operator<<(std::ostream& os, const Bound& bound);
};

std::string bound_kind_to_string(bound_kind kind);
std::string bound_status_to_string(bound_status status);

}  // namespace InvGen

#endif  // INVGEN_BOUND_H
