#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "tacit/array.h"
#include "tacit/diagnostics.h"

namespace tacit {

// Conversions. Each validates its input and raises TypeMismatch with the
// given requirement message.
double as_number(const Array& value, const char* requirement);
long long as_integer(const Array& value, const char* requirement);
std::size_t as_natural(const Array& value, const char* requirement);
bool as_bool(const Array& value, const char* requirement);
std::vector<long long> as_integer_list(const Array& value, const char* requirement);
std::vector<std::size_t> as_natural_list(const Array& value, const char* requirement);

OperandInfo operand_info(const Array& value);

// Total order over arrays: kind, then shape, then elements. NaN sorts after
// every other number. Bytes and numbers compare as numbers.
int compare_arrays(const Array& a, const Array& b);
bool arrays_match(const Array& a, const Array& b);

// Assembles rows (first element is row 0) into one array. Bytes and numbers
// unify; a non-box row meeting box rows is boxed. Ragged rows are padded with
// the active fill or rejected with ShapeMismatch.
Array from_rows(std::vector<Array> rows, const FillContext& fill);
Array from_rows_boxed(std::vector<Array> rows);

// Monadic structure. Argument names follow the primitive's stack order.
Array length_of(const Array& a);
Array shape_of(const Array& a);
Array rank_of(const Array& a);
Array range(const Array& a);
Array first(const Array& a, const FillContext& fill);
Array reverse(const Array& a);
Array deshape(const Array& a);
Array transpose(const Array& a);
Array rise(const Array& a);
Array fall(const Array& a);
Array where(const Array& a);
Array classify(const Array& a);
Array deduplicate(const Array& a);
Array box(const Array& a);
Array unbox(const Array& a);
Array random_scalar(std::mt19937_64& rng);

// Dyadic structure: `a` is the top of the stack, `b` the value beneath it.
Array match(const Array& a, const Array& b);
Array couple(const Array& a, const Array& b, const FillContext& fill);
Array join(const Array& a, const Array& b, const FillContext& fill);
Array select(const Array& indices, const Array& b, const FillContext& fill);
Array pick(const Array& index, const Array& b, const FillContext& fill);
Array reshape(const Array& shape, const Array& b, const FillContext& fill);
Array take(const Array& count, const Array& b, const FillContext& fill);
Array drop(const Array& count, const Array& b);
Array rotate(const Array& count, const Array& b);
Array keep(const Array& counts, const Array& b);
Array member(const Array& a, const Array& b);
Array index_of(const Array& a, const Array& b);
Array find(const Array& pattern, const Array& b);

// Grouping helpers used by ⊕ and ⊜: each returns the groups in output order.
std::vector<Array> group_rows(const Array& indices, const Array& values);
std::vector<Array> partition_rows(const Array& markers, const Array& values);

}  // namespace tacit
