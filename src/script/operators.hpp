#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "script/value.hpp"

namespace warden::script {

// Arithmetic on script values. Results that would need more than
// max_bytes of storage throw ResourceExhausted; int overflow raises
// OverflowError.
Value BinaryOp(std::string_view op, const Value& left, const Value& right, std::size_t max_bytes);
Value UnaryOp(std::string_view op, const Value& operand);

// Ordering used by "<" and by sorted/min/max. Raises TypeError for
// unordered kinds.
bool LessThan(const Value& left, const Value& right);

bool Contains(const Value& container, const Value& item);
bool Identical(const Value& left, const Value& right);

std::int64_t CheckedAdd(std::int64_t a, std::int64_t b);
std::int64_t CheckedMul(std::int64_t a, std::int64_t b);

// Python's floor division and modulo for integers.
std::int64_t FloorDiv(std::int64_t a, std::int64_t b);
std::int64_t FloorMod(std::int64_t a, std::int64_t b);

}  // namespace warden::script
