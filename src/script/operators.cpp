#include "script/operators.hpp"

#include <algorithm>
#include <cstdint>
#include <cmath>
#include <string>

#include "script/errors.hpp"

namespace warden::script {
namespace {

[[noreturn]] void Unsupported(std::string_view op, const Value& left, const Value& right) {
    throw ScriptError("TypeError", "unsupported operand type(s) for " + std::string(op) + ": '" +
                                       TypeName(left) + "' and '" + TypeName(right) + "'");
}

bool IsIntLike(const Value& value) {
    return value.is(ValueKind::kInt) || value.is(ValueKind::kBool);
}

void CheckSize(std::size_t count, std::size_t element_size, std::size_t max_bytes) {
    if (element_size != 0 && count > max_bytes / element_size) {
        throw ResourceExhausted("sequence would exceed the memory limit");
    }
}

Value Repeat(const Value& sequence, std::int64_t times, std::size_t max_bytes) {
    if (times < 0) {
        times = 0;
    }
    const auto count = static_cast<std::size_t>(times);
    if (sequence.is(ValueKind::kStr)) {
        const std::string& text = sequence.AsStr();
        if (!text.empty()) {
            CheckSize(count, text.size(), max_bytes);
        }
        std::string out;
        out.reserve(text.size() * count);
        for (std::size_t i = 0; i < count; ++i) {
            out += text;
        }
        return Value::Str(std::move(out));
    }
    const auto& items = sequence.Items();
    if (!items.empty()) {
        CheckSize(count, items.size() * sizeof(Value), max_bytes);
    }
    std::vector<Value> out;
    out.reserve(items.size() * count);
    for (std::size_t i = 0; i < count; ++i) {
        out.insert(out.end(), items.begin(), items.end());
    }
    return sequence.is(ValueKind::kList) ? Value::List(std::move(out)) : Value::Tuple(std::move(out));
}

Value IntPower(std::int64_t base, std::int64_t exponent) {
    if (exponent < 0) {
        if (base == 0) {
            throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        }
        return Value::Float(std::pow(static_cast<double>(base), static_cast<double>(exponent)));
    }
    std::int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            result = CheckedMul(result, base);
        }
        exponent >>= 1;
        if (exponent > 0) {
            base = CheckedMul(base, base);
        }
    }
    return Value::Int(result);
}

bool SequenceLess(const std::vector<Value>& left, const std::vector<Value>& right) {
    const std::size_t n = std::min(left.size(), right.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (!Equals(left[i], right[i])) {
            return LessThan(left[i], right[i]);
        }
    }
    return left.size() < right.size();
}

}  // namespace

std::int64_t CheckedAdd(std::int64_t a, std::int64_t b) {
    std::int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        throw ScriptError("OverflowError", "integer overflow");
    }
    return result;
}

std::int64_t CheckedMul(std::int64_t a, std::int64_t b) {
    std::int64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw ScriptError("OverflowError", "integer overflow");
    }
    return result;
}

std::int64_t FloorDiv(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    }
    if (a == INT64_MIN && b == -1) {
        throw ScriptError("OverflowError", "integer overflow");
    }
    std::int64_t quotient = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --quotient;
    }
    return quotient;
}

std::int64_t FloorMod(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        throw ScriptError("ZeroDivisionError", "integer division or modulo by zero");
    }
    if (b == -1) {
        return 0;
    }
    std::int64_t remainder = a % b;
    if (remainder != 0 && ((remainder < 0) != (b < 0))) {
        remainder += b;
    }
    return remainder;
}

Value BinaryOp(std::string_view op, const Value& left, const Value& right, std::size_t max_bytes) {
    if (left.IsNumber() && right.IsNumber()) {
        const bool ints = IsIntLike(left) && IsIntLike(right);
        if (op == "+") {
            return ints ? Value::Int(CheckedAdd(left.AsInt(), right.AsInt()))
                        : Value::Float(left.AsDouble() + right.AsDouble());
        }
        if (op == "-") {
            if (ints) {
                std::int64_t result = 0;
                if (__builtin_sub_overflow(left.AsInt(), right.AsInt(), &result)) {
                    throw ScriptError("OverflowError", "integer overflow");
                }
                return Value::Int(result);
            }
            return Value::Float(left.AsDouble() - right.AsDouble());
        }
        if (op == "*") {
            return ints ? Value::Int(CheckedMul(left.AsInt(), right.AsInt()))
                        : Value::Float(left.AsDouble() * right.AsDouble());
        }
        if (op == "/") {
            if (right.AsDouble() == 0.0) {
                throw ScriptError("ZeroDivisionError", ints ? "division by zero" : "float division by zero");
            }
            return Value::Float(left.AsDouble() / right.AsDouble());
        }
        if (op == "//") {
            if (ints) {
                return Value::Int(FloorDiv(left.AsInt(), right.AsInt()));
            }
            if (right.AsDouble() == 0.0) {
                throw ScriptError("ZeroDivisionError", "float floor division by zero");
            }
            return Value::Float(std::floor(left.AsDouble() / right.AsDouble()));
        }
        if (op == "%") {
            if (ints) {
                return Value::Int(FloorMod(left.AsInt(), right.AsInt()));
            }
            const double divisor = right.AsDouble();
            if (divisor == 0.0) {
                throw ScriptError("ZeroDivisionError", "float modulo");
            }
            double remainder = std::fmod(left.AsDouble(), divisor);
            if (remainder != 0.0 && ((remainder < 0) != (divisor < 0))) {
                remainder += divisor;
            }
            return Value::Float(remainder);
        }
        if (op == "**") {
            if (ints) {
                return IntPower(left.AsInt(), right.AsInt());
            }
            if (left.AsDouble() == 0.0 && right.AsDouble() < 0) {
                throw ScriptError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
            }
            const double result = std::pow(left.AsDouble(), right.AsDouble());
            if (std::isnan(result) && !std::isnan(left.AsDouble()) && !std::isnan(right.AsDouble())) {
                throw ScriptError("ValueError", "math domain error");
            }
            if (std::isinf(result) && std::isfinite(left.AsDouble()) && std::isfinite(right.AsDouble())) {
                throw ScriptError("OverflowError", "numerical result out of range");
            }
            return Value::Float(result);
        }
        Unsupported(op, left, right);
    }
    if (op == "+") {
        if (left.is(ValueKind::kStr) && right.is(ValueKind::kStr)) {
            CheckSize(left.AsStr().size() + right.AsStr().size(), 1, max_bytes);
            return Value::Str(left.AsStr() + right.AsStr());
        }
        if (left.IsSequence() && left.kind() == right.kind()) {
            CheckSize(left.Items().size() + right.Items().size(), sizeof(Value), max_bytes);
            std::vector<Value> items = left.Items();
            items.insert(items.end(), right.Items().begin(), right.Items().end());
            return left.is(ValueKind::kList) ? Value::List(std::move(items)) : Value::Tuple(std::move(items));
        }
    }
    if (op == "*") {
        if ((left.is(ValueKind::kStr) || left.IsSequence()) && IsIntLike(right)) {
            return Repeat(left, right.AsInt(), max_bytes);
        }
        if (IsIntLike(left) && (right.is(ValueKind::kStr) || right.IsSequence())) {
            return Repeat(right, left.AsInt(), max_bytes);
        }
    }
    if (op == "%" && left.is(ValueKind::kStr)) {
        throw ScriptError("TypeError", "printf-style formatting is not supported; use str.format");
    }
    Unsupported(op, left, right);
}

Value UnaryOp(std::string_view op, const Value& operand) {
    if (op == "not") {
        return Value::Bool(!Truthy(operand));
    }
    if (!operand.IsNumber()) {
        throw ScriptError("TypeError", "bad operand type for unary " + std::string(op) + ": '" +
                                           TypeName(operand) + "'");
    }
    if (op == "+") {
        return operand.is(ValueKind::kFloat) ? operand : Value::Int(operand.AsInt());
    }
    if (operand.is(ValueKind::kFloat)) {
        return Value::Float(-operand.AsDouble());
    }
    if (operand.AsInt() == INT64_MIN) {
        throw ScriptError("OverflowError", "integer overflow");
    }
    return Value::Int(-operand.AsInt());
}

bool LessThan(const Value& left, const Value& right) {
    if (left.IsNumber() && right.IsNumber()) {
        if (IsIntLike(left) && IsIntLike(right)) {
            return left.AsInt() < right.AsInt();
        }
        return left.AsDouble() < right.AsDouble();
    }
    if (left.is(ValueKind::kStr) && right.is(ValueKind::kStr)) {
        return left.AsStr() < right.AsStr();
    }
    if (left.IsSequence() && left.kind() == right.kind()) {
        return SequenceLess(left.Items(), right.Items());
    }
    throw ScriptError("TypeError", std::string("'<' not supported between instances of '") + TypeName(left) +
                                       "' and '" + TypeName(right) + "'");
}

bool Contains(const Value& container, const Value& item) {
    switch (container.kind()) {
        case ValueKind::kStr:
            if (!item.is(ValueKind::kStr)) {
                throw ScriptError("TypeError", std::string("'in <string>' requires string as left operand, not ") +
                                                   TypeName(item));
            }
            return container.AsStr().find(item.AsStr()) != std::string::npos;
        case ValueKind::kList:
        case ValueKind::kTuple:
            for (const auto& element : container.Items()) {
                if (Equals(element, item)) {
                    return true;
                }
            }
            return false;
        case ValueKind::kDict:
            return IsHashable(item) && container.AsDict().Find(item) != nullptr;
        case ValueKind::kSet:
        case ValueKind::kFrozenSet:
            return IsHashable(item) && container.AsSet().Find(item) != nullptr;
        case ValueKind::kRange: {
            if (!IsIntLike(item) && !(item.is(ValueKind::kFloat) && std::trunc(item.AsDouble()) == item.AsDouble())) {
                return false;
            }
            const auto& range = container.AsRange();
            const auto value = IsIntLike(item) ? item.AsInt() : static_cast<std::int64_t>(item.AsDouble());
            if (range.step > 0 ? (value < range.start || value >= range.stop)
                               : (value > range.start || value <= range.stop)) {
                return false;
            }
            return (static_cast<__int128>(value) - range.start) % range.step == 0;
        }
        default:
            throw ScriptError("TypeError", std::string("argument of type '") + TypeName(container) +
                                               "' is not iterable");
    }
}

bool Identical(const Value& left, const Value& right) {
    if (left.kind() != right.kind()) {
        return false;
    }
    switch (left.kind()) {
        case ValueKind::kNone:
            return true;
        case ValueKind::kBool:
            return left.AsBool() == right.AsBool();
        case ValueKind::kInt:
            return left.AsInt() == right.AsInt();
        case ValueKind::kFloat:
            return left.AsDouble() == right.AsDouble();
        case ValueKind::kRange:
            return Equals(left, right);
        case ValueKind::kExceptionType:
            return left.AsExceptionType() == right.AsExceptionType();
        default:
            return left.Identity() == right.Identity();
    }
}

}  // namespace warden::script
