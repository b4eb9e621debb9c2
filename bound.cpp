#include "bound.h"

#include <sstream>

namespace InvGen {

Bound Bound::error(const std::string& var, const std::string& why) {
  Bound res(var);
  res.status = BOUND_ERROR;
  res.reason = why;
  return res;
}

Bound Bound::unresolved(const std::string& var, const std::string& why) {
  Bound res(var);
  res.status = BOUND_UNRESOLVED;
  res.reason = why;
  return res;
}

void Bound::set_lower_bound(int64_t l_bound, bound_kind kind) {
  low = l_bound;
  low_kind = kind;
}

void Bound::set_upper_bound(int64_t u_bound, bound_kind kind) {
  high = u_bound;
  high_kind = kind;
}

void Bound::set_contiguity(bool outside, bool gap) {
  contiguity_checked = true;
  outside_solutions = outside;
  gap_detected = gap;
}

void Bound::set_contiguity_unresolved(const std::string& why) {
  contiguity_checked = false;
  contiguity_reason = why;
}

bool Bound::is_exact() const {
  return status == BOUND_OK && low_kind == BOUND_EXACT &&
         high_kind == BOUND_EXACT;
}

bool Bound::is_high_inf() const { return high == INT64_MAX; }

bool Bound::is_low_minf() const { return low == INT64_MIN; }

bool Bound::is_in_range(int64_t val) const {
  return (val >= low && val <= high);
}

std::ostream& operator<<(std::ostream& os, const Bound& bound) {
  if (bound.status != BOUND_OK) {
    os << bound_status_to_string(bound.status);
    return os;
  }
  // '~' marks a side the search gave up on
  os << "[";
  if (bound.low_kind == BOUND_HORIZON) os << "~";
  if (bound.is_low_minf()) {
    os << "MINF";
  } else {
    os << bound.low;
  }
  os << ",";
  if (bound.high_kind == BOUND_HORIZON) os << "~";
  if (bound.is_high_inf()) {
    os << "INF";
  } else {
    os << bound.high;
  }
  os << "]";
  return os;
}

std::string Bound::to_string() const {
  std::stringstream ss;
  ss << *this;
  return ss.str();
}

std::string bound_kind_to_string(bound_kind kind) {
  return kind == BOUND_EXACT ? "exact" : "horizon";
}

std::string bound_status_to_string(bound_status status) {
  switch (status) {
    case BOUND_OK:
      return "ok";
    case BOUND_UNRESOLVED:
      return "unresolved";
    case BOUND_ERROR:
      return "error";
  }
  return "unknown";
}

}  // namespace InvGen
