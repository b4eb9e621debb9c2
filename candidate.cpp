#include "candidate.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

#include "errors.h"

namespace InvGen {

static inline void check_variable_name(const std::string& var) {
  if (var.empty()) throw ConfigurationError("candidate without a variable");
}

Candidate Candidate::fixed_value(const std::string& var, int64_t value) {
  check_variable_name(var);
  Candidate res(CAND_FIXED_VALUE, var);
  res.value = value;
  return res;
}

Candidate Candidate::bool_polarity(const std::string& var, bool polarity) {
  check_variable_name(var);
  Candidate res(CAND_BOOL_POLARITY, var);
  res.polarity = polarity;
  return res;
}

Candidate Candidate::interval(const std::string& var, int64_t low,
                              int64_t high) {
  check_variable_name(var);
  if (low > high)
    throw ConfigurationError("empty interval [" + std::to_string(low) + ", " +
                             std::to_string(high) + "] for " + var);
  Candidate res(CAND_INTERVAL, var);
  res.low = low;
  res.high = high;
  return res;
}

Z3_sort_kind Candidate::required_sort() const {
  return (kind == CAND_BOOL_POLARITY) ? Z3_BOOL_SORT : Z3_INT_SORT;
}

z3::expr Candidate::variable_term(z3::context& c) const {
  if (kind == CAND_BOOL_POLARITY) return c.bool_const(variable.c_str());
  return c.int_const(variable.c_str());
}

z3::expr Candidate::assertion(z3::context& c) const {
  const z3::expr v = variable_term(c);
  switch (kind) {
    case CAND_FIXED_VALUE:
      return v == c.int_val(value);
    case CAND_BOOL_POLARITY:
      return v == c.bool_val(polarity);
    case CAND_INTERVAL:
      return v >= c.int_val(low) && v <= c.int_val(high);
  }
  throw ConfigurationError("unsupported candidate kind");
}

z3::expr Candidate::negate(z3::context& c) const {
  const z3::expr v = variable_term(c);
  switch (kind) {
    case CAND_FIXED_VALUE:
      return v != c.int_val(value);
    case CAND_BOOL_POLARITY:
      return v == c.bool_val(!polarity);
    case CAND_INTERVAL:
      return v < c.int_val(low) || v > c.int_val(high);
  }
  throw ConfigurationError("unsupported candidate kind");
}

std::string Candidate::to_string() const {
  switch (kind) {
    case CAND_FIXED_VALUE:
      return variable + " = " + std::to_string(value);
    case CAND_BOOL_POLARITY:
      return variable + " is always " + (polarity ? "true" : "false");
    case CAND_INTERVAL:
      return variable + " in [" + std::to_string(low) + ", " +
             std::to_string(high) + "]";
  }
  return "unknown candidate";
}

std::ostream& operator<<(std::ostream& os, const Candidate& cand) {
  os << cand.to_string();
  return os;
}

static int64_t parse_int64(const std::string& text, const std::string& whole) {
  size_t pos = 0;
  int64_t res;
  try {
    res = std::stoll(text, &pos);
  } catch (const std::invalid_argument&) {
    throw ConfigurationError("not an integer in candidate '" + whole +
                             "': " + text);
  } catch (const std::out_of_range&) {
    throw ConfigurationError("integer out of range in candidate '" + whole +
                             "': " + text);
  }
  if (pos != text.size())
    throw ConfigurationError("trailing characters in candidate '" + whole +
                             "': " + text);
  return res;
}

Candidate parse_candidate(const std::string& text) {
  std::string s;
  std::remove_copy_if(text.begin(), text.end(), std::back_inserter(s),
                      [](unsigned char ch) { return std::isspace(ch); });
  const size_t eq = s.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == s.size())
    throw ConfigurationError("expected VAR=VALUE in candidate '" + text + "'");
  const std::string var = s.substr(0, eq);
  const std::string rhs = s.substr(eq + 1);
  if (rhs == "true") return Candidate::bool_polarity(var, true);
  if (rhs == "false") return Candidate::bool_polarity(var, false);
  if (rhs.front() == '[') {
    const size_t comma = rhs.find(',');
    if (rhs.back() != ']' || comma == std::string::npos)
      throw ConfigurationError("expected [LOW,HIGH] in candidate '" + text +
                               "'");
    const int64_t lo = parse_int64(rhs.substr(1, comma - 1), text);
    const int64_t hi =
        parse_int64(rhs.substr(comma + 1, rhs.size() - comma - 2), text);
    return Candidate::interval(var, lo, hi);
  }
  return Candidate::fixed_value(var, parse_int64(rhs, text));
}

}  // namespace InvGen
