//
// Helpers over the z3 C++ API shared by the engines.
//

#include "z3_utils.h"

#include <cassert>
#include <limits>
#include <map>
#include <unordered_set>

namespace InvGen {

bool is_op_uninterpreted(Z3_decl_kind op) {
  return op == Z3_OP_UNINTERPRETED;
}

Z3_decl_kind get_op(const z3::expr& expr) {
  assert(expr.is_app());
  return expr.decl().decl_kind();
}

bool is_free_constant(const z3::expr& expr) {
  return expr.is_app() && expr.is_const() && !expr.is_numeral() &&
         is_op_uninterpreted(get_op(expr));
}

bool model_eval_to_bool(const z3::model& model, const z3::expr& bool_expr) {
  assert(bool_expr.is_bool());
  return model.eval(bool_expr, true).is_true();
}

bool model_eval_to_int64(const z3::model& model, const z3::expr& int_expr,
                         int64_t& value) {
  assert(int_expr.is_int());
  return model.eval(int_expr, true).is_numeral_i64(value);
}

static void collect_compound(const z3::expr& e,
                             std::unordered_set<unsigned>& visited,
                             std::map<std::string, z3::expr>& found) {
  if (!visited.insert(e.id()).second) return;
  if (!e.is_app()) return;  // quantifier or bound variable
  if (e.is_bool() && e.num_args() > 0 && !e.is_not())
    found.emplace(e.to_string(), e);
  for (unsigned i = 0; i < e.num_args(); ++i)
    collect_compound(e.arg(i), visited, found);
}

std::vector<z3::expr> compound_bool_subterms(const z3::expr& formula) {
  std::unordered_set<unsigned> visited;
  std::map<std::string, z3::expr> found;
  std::vector<z3::expr> conjuncts{formula};
  while (!conjuncts.empty()) {
    const z3::expr e = conjuncts.back();
    conjuncts.pop_back();
    if (!visited.insert(e.id()).second || !e.is_app()) continue;
    for (unsigned i = 0; i < e.num_args(); ++i) {
      if (e.is_and())
        conjuncts.push_back(e.arg(i));
      else
        collect_compound(e.arg(i), visited, found);
    }
  }
  std::vector<z3::expr> res;
  for (const auto& entry : found) res.push_back(entry.second);
  return res;
}

std::string sort_kind_to_string(Z3_sort_kind kind) {
  switch (kind) {
    case Z3_BOOL_SORT:
      return "Bool";
    case Z3_INT_SORT:
      return "Int";
    case Z3_REAL_SORT:
      return "Real";
    case Z3_BV_SORT:
      return "BitVec";
    case Z3_ARRAY_SORT:
      return "Array";
    default:
      return "unsupported sort";
  }
}

z3::expr conjoin(const z3::expr& base, const std::vector<z3::expr>& extras) {
  if (extras.empty()) return base;
  z3::expr_vector conjuncts(base.ctx());
  conjuncts.push_back(base);
  for (const auto& e : extras) conjuncts.push_back(e);
  return z3::mk_and(conjuncts);
}

int64_t safe_add(int64_t a, int64_t b) {
  int64_t ret;
  if (!__builtin_add_overflow(a, b, &ret)) return ret;
  return (b > 0) ? std::numeric_limits<int64_t>::max()
                 : std::numeric_limits<int64_t>::min();
}

int64_t safe_sub(int64_t a, int64_t b) {
  int64_t ret;
  if (!__builtin_sub_overflow(a, b, &ret)) return ret;
  return (b < 0) ? std::numeric_limits<int64_t>::max()
                 : std::numeric_limits<int64_t>::min();
}

int64_t midpoint(int64_t low, int64_t high, bool round_up) {
  assert(low <= high);
  // unsigned difference cannot overflow for low <= high
  const uint64_t span =
      static_cast<uint64_t>(high) - static_cast<uint64_t>(low);
  const uint64_t half = span / 2 + (round_up ? (span & 1) : 0);
  return static_cast<int64_t>(static_cast<uint64_t>(low) + half);
}

}  // namespace InvGen
