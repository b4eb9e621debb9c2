//
// Helpers over the z3 C++ API shared by the engines.
//

#ifndef INVGEN_Z3_UTILS_H
#define INVGEN_Z3_UTILS_H

#include <z3++.h>

#include <cstdint>
#include <string>
#include <vector>

namespace InvGen {

bool is_op_uninterpreted(Z3_decl_kind op);

Z3_decl_kind get_op(const z3::expr& expr);
/*
 * True for 0-arity uninterpreted constants (the free variables of a
 * formula); false for numerals, true/false and applications.
 */
bool is_free_constant(const z3::expr& expr);
bool model_eval_to_bool(const z3::model& model, const z3::expr& bool_expr);
/*
 * Evaluates with model completion. Returns false if the value is not a
 * numeral that fits in 64 bits.
 */
bool model_eval_to_int64(const z3::model& model, const z3::expr& int_expr,
                         int64_t& value);
std::string sort_kind_to_string(Z3_sort_kind kind);

/*
 * Boolean subterms of formula that are neither free constants nor negations,
 * sorted by their SMT-LIB text and de-duplicated. The asserted conjuncts of
 * formula and everything below a quantifier are left out.
 */
std::vector<z3::expr> compound_bool_subterms(const z3::expr& formula);

/*
 * Conjunction of base and all extras; base alone if extras is empty.
 */
z3::expr conjoin(const z3::expr& base, const std::vector<z3::expr>& extras);

int64_t safe_add(int64_t a, int64_t b);
int64_t safe_sub(int64_t a, int64_t b);
/*
 * Midpoint of [low, high] (low <= high) without overflow. Rounds toward low
 * unless round_up is set.
 */
int64_t midpoint(int64_t low, int64_t high, bool round_up);

}  // namespace InvGen

#endif  // INVGEN_Z3_UTILS_H
