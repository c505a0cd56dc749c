#include "script/builtins.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string_view>
#include <utility>

#include "script/errors.hpp"
#include "script/interpreter.hpp"
#include "script/operators.hpp"

namespace warden::script {
namespace {

struct ExceptionType {
    std::string_view name;
    std::string_view parent;
};

constexpr std::array<ExceptionType, 15> kExceptionTypes = {{
    {"Exception", ""},
    {"ArithmeticError", "Exception"},
    {"LookupError", "Exception"},
    {"ValueError", "Exception"},
    {"TypeError", "Exception"},
    {"NameError", "Exception"},
    {"AttributeError", "Exception"},
    {"ImportError", "Exception"},
    {"RuntimeError", "Exception"},
    {"SyntaxError", "Exception"},
    {"KeyError", "LookupError"},
    {"IndexError", "LookupError"},
    {"ZeroDivisionError", "ArithmeticError"},
    {"OverflowError", "ArithmeticError"},
    {"RecursionError", "RuntimeError"},
}};

std::string_view ParentOf(std::string_view name) {
    for (const auto& type : kExceptionTypes) {
        if (type.name == name) {
            return type.parent;
        }
    }
    return "Exception";
}

std::string Strip(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string_view::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\n\r\f\v");
    return std::string(text.substr(first, last - first + 1));
}

std::int64_t ParseInt(const std::string& raw, int base) {
    const std::string text = Strip(raw);
    auto invalid = [&]() {
        return ScriptError("ValueError", "invalid literal for int() with base " + std::to_string(base) + ": " +
                                             Repr(Value::Str(raw)));
    };
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (base == 16 || base == 8 || base == 2) {
        if (pos + 1 < text.size() && text[pos] == '0') {
            const char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(text[pos + 1])));
            if ((base == 16 && marker == 'x') || (base == 8 && marker == 'o') || (base == 2 && marker == 'b')) {
                pos += 2;
            }
        }
    }
    if (pos >= text.size()) {
        throw invalid();
    }
    std::int64_t value = 0;
    bool previous_underscore = true;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (c == '_') {
            if (previous_underscore) {
                throw invalid();
            }
            previous_underscore = true;
            continue;
        }
        int digit = 0;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'z') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'Z') {
            digit = c - 'A' + 10;
        } else {
            throw invalid();
        }
        if (digit >= base) {
            throw invalid();
        }
        previous_underscore = false;
        value = CheckedAdd(CheckedMul(value, base), negative ? -digit : digit);
    }
    if (previous_underscore) {
        throw invalid();
    }
    return value;
}

double ParseFloat(const std::string& raw) {
    std::string text = Strip(raw);
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const bool negative = !lowered.empty() && lowered[0] == '-';
    const std::string_view unsigned_part =
        !lowered.empty() && (lowered[0] == '-' || lowered[0] == '+') ? std::string_view(lowered).substr(1)
                                                                     : std::string_view(lowered);
    if (unsigned_part == "inf" || unsigned_part == "infinity") {
        return negative ? -HUGE_VAL : HUGE_VAL;
    }
    if (unsigned_part == "nan") {
        return std::nan("");
    }
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
    const bool hex = lowered.find('x') != std::string::npos;
    if (text.empty() || hex) {
        throw ScriptError("ValueError", "could not convert string to float: " + Repr(Value::Str(raw)));
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        throw ScriptError("ValueError", "could not convert string to float: " + Repr(Value::Str(raw)));
    }
    return value;
}

std::int64_t FloatToInt(double value) {
    if (std::isnan(value)) {
        throw ScriptError("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(value)) {
        throw ScriptError("OverflowError", "cannot convert float infinity to integer");
    }
    const double truncated = std::trunc(value);
    if (truncated >= 9223372036854775808.0 || truncated < -9223372036854775808.0) {
        throw ScriptError("OverflowError", "integer overflow");
    }
    return static_cast<std::int64_t>(truncated);
}

Value Builtin(std::string name, BuiltinFn fn) {
    return Value::Builtin(std::move(name), std::move(fn));
}

Value Print(Interpreter& interp, CallArgs& args) {
    std::string sep = " ";
    std::string end = "\n";
    if (auto value = PopKeyword(args, "sep"); value && !value->is(ValueKind::kNone)) {
        sep = StrArg(*value, "print");
    }
    if (auto value = PopKeyword(args, "end"); value && !value->is(ValueKind::kNone)) {
        end = StrArg(*value, "print");
    }
    NoKeywords(args, "print");
    for (std::size_t i = 0; i < args.positional.size(); ++i) {
        if (i > 0) {
            interp.out().Append(sep);
        }
        interp.out().Append(ToStr(args.positional[i]));
    }
    interp.out().Append(end);
    return Value::None();
}

Value Len(Interpreter&, CallArgs& args) {
    NoKeywords(args, "len");
    CheckArity(args, "len", 1, 1);
    const Value& value = args.positional[0];
    switch (value.kind()) {
        case ValueKind::kStr: return Value::Int(static_cast<std::int64_t>(value.AsStr().size()));
        case ValueKind::kList:
        case ValueKind::kTuple: return Value::Int(static_cast<std::int64_t>(value.Items().size()));
        case ValueKind::kDict: return Value::Int(static_cast<std::int64_t>(value.AsDict().size()));
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: return Value::Int(static_cast<std::int64_t>(value.AsSet().size()));
        case ValueKind::kRange: return Value::Int(value.AsRange().Length());
        default:
            throw ScriptError("TypeError", std::string("object of type '") + TypeName(value) + "' has no len()");
    }
}

Value Range(Interpreter&, CallArgs& args) {
    NoKeywords(args, "range");
    CheckArity(args, "range", 1, 3);
    std::int64_t start = 0;
    std::int64_t stop = 0;
    std::int64_t step = 1;
    if (args.positional.size() == 1) {
        stop = IntArg(args.positional[0], "range");
    } else {
        start = IntArg(args.positional[0], "range");
        stop = IntArg(args.positional[1], "range");
        if (args.positional.size() == 3) {
            step = IntArg(args.positional[2], "range");
        }
    }
    if (step == 0) {
        throw ScriptError("ValueError", "range() arg 3 must not be zero");
    }
    return Value::Range(start, stop, step);
}

Value Str(Interpreter&, CallArgs& args) {
    NoKeywords(args, "str");
    CheckArity(args, "str", 0, 1);
    return args.positional.empty() ? Value::Str("") : Value::Str(ToStr(args.positional[0]));
}

Value ReprOf(Interpreter&, CallArgs& args) {
    NoKeywords(args, "repr");
    CheckArity(args, "repr", 1, 1);
    return Value::Str(Repr(args.positional[0]));
}

Value Int(Interpreter&, CallArgs& args) {
    std::optional<Value> base_kw = PopKeyword(args, "base");
    NoKeywords(args, "int");
    CheckArity(args, "int", 0, 2);
    if (args.positional.empty()) {
        return Value::Int(0);
    }
    const Value& value = args.positional[0];
    std::optional<Value> base_value = base_kw;
    if (args.positional.size() == 2) {
        base_value = args.positional[1];
    }
    if (base_value) {
        if (!value.is(ValueKind::kStr)) {
            throw ScriptError("TypeError", "int() can't convert non-string with explicit base");
        }
        const std::int64_t base = IntArg(*base_value, "int");
        if (base < 2 || base > 36) {
            throw ScriptError("ValueError", "int() base must be >= 2 and <= 36");
        }
        return Value::Int(ParseInt(value.AsStr(), static_cast<int>(base)));
    }
    switch (value.kind()) {
        case ValueKind::kBool:
        case ValueKind::kInt: return Value::Int(value.AsInt());
        case ValueKind::kFloat: return Value::Int(FloatToInt(value.AsDouble()));
        case ValueKind::kStr: return Value::Int(ParseInt(value.AsStr(), 10));
        default:
            throw ScriptError("TypeError", std::string("int() argument must be a string or a number, not '") +
                                               TypeName(value) + "'");
    }
}

Value Float(Interpreter&, CallArgs& args) {
    NoKeywords(args, "float");
    CheckArity(args, "float", 0, 1);
    if (args.positional.empty()) {
        return Value::Float(0.0);
    }
    const Value& value = args.positional[0];
    if (value.IsNumber()) {
        return Value::Float(value.AsDouble());
    }
    if (value.is(ValueKind::kStr)) {
        return Value::Float(ParseFloat(value.AsStr()));
    }
    throw ScriptError("TypeError", std::string("float() argument must be a string or a number, not '") +
                                       TypeName(value) + "'");
}

Value Bool(Interpreter&, CallArgs& args) {
    NoKeywords(args, "bool");
    CheckArity(args, "bool", 0, 1);
    return Value::Bool(!args.positional.empty() && Truthy(args.positional[0]));
}

Value List(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "list");
    CheckArity(args, "list", 0, 1);
    return Value::List(args.positional.empty() ? std::vector<Value>{} : interp.Materialize(args.positional[0]));
}

Value Tuple(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "tuple");
    CheckArity(args, "tuple", 0, 1);
    if (!args.positional.empty() && args.positional[0].is(ValueKind::kTuple)) {
        return args.positional[0];
    }
    return Value::Tuple(args.positional.empty() ? std::vector<Value>{} : interp.Materialize(args.positional[0]));
}

void UpdateDict(Interpreter& interp, DictData& target, const Value& source) {
    if (source.is(ValueKind::kDict)) {
        for (const auto& [key, value] : source.AsDict().Items()) {
            target.Set(key, value);
        }
        return;
    }
    interp.ForEach(source, [&](const Value& pair) {
        const std::vector<Value> items = interp.Materialize(pair);
        if (items.size() != 2) {
            throw ScriptError("ValueError", "dictionary update sequence element has length " +
                                                std::to_string(items.size()) + "; 2 is required");
        }
        target.Set(items[0], items[1]);
        return true;
    });
}

Value Dict(Interpreter& interp, CallArgs& args) {
    CheckArity(args, "dict", 0, 1);
    Value dict = Value::Dict();
    if (!args.positional.empty()) {
        UpdateDict(interp, dict.AsDict(), args.positional[0]);
    }
    for (auto& [key, value] : args.keywords) {
        dict.AsDict().Set(Value::Str(key), value);
    }
    return dict;
}

Value Set(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "set");
    CheckArity(args, "set", 0, 1);
    return args.positional.empty() ? Value::Set() : MakeSet(interp, args.positional[0], false);
}

Value FrozenSet(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "frozenset");
    CheckArity(args, "frozenset", 0, 1);
    if (args.positional.empty()) {
        return Value::Set(true);
    }
    if (args.positional[0].is(ValueKind::kFrozenSet)) {
        return args.positional[0];
    }
    return MakeSet(interp, args.positional[0], true);
}

// Eager: the result is a list rather than a lazy iterator.
Value Map(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "map");
    if (args.positional.size() < 2) {
        throw ScriptError("TypeError", "map() must have at least two arguments.");
    }
    const Value fn = args.positional[0];
    std::vector<std::vector<Value>> columns;
    std::size_t length = SIZE_MAX;
    for (std::size_t i = 1; i < args.positional.size(); ++i) {
        columns.push_back(interp.Materialize(args.positional[i]));
        length = std::min(length, columns.back().size());
    }
    std::vector<Value> out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        CallArgs call;
        call.line = args.line;
        for (const auto& column : columns) {
            call.positional.push_back(column[i]);
        }
        out.push_back(interp.Call(fn, call));
    }
    return Value::List(std::move(out));
}

Value Filter(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "filter");
    CheckArity(args, "filter", 2, 2);
    const Value fn = args.positional[0];
    std::vector<Value> out;
    for (auto& item : interp.Materialize(args.positional[1])) {
        bool keep = false;
        if (fn.is(ValueKind::kNone)) {
            keep = Truthy(item);
        } else {
            CallArgs call;
            call.line = args.line;
            call.positional.push_back(item);
            keep = Truthy(interp.Call(fn, call));
        }
        if (keep) {
            out.push_back(std::move(item));
        }
    }
    return Value::List(std::move(out));
}

Value Extreme(Interpreter& interp, CallArgs& args, const std::string& fn, bool want_max) {
    std::optional<Value> key = PopKeyword(args, "key");
    std::optional<Value> fallback = PopKeyword(args, "default");
    NoKeywords(args, fn);
    if (args.positional.empty()) {
        throw ScriptError("TypeError", fn + " expected at least 1 argument, got 0");
    }
    std::vector<Value> items;
    if (args.positional.size() == 1) {
        items = interp.Materialize(args.positional[0]);
    } else {
        if (fallback) {
            throw ScriptError("TypeError", "Cannot specify a default for " + fn + "() with multiple positional arguments");
        }
        items = args.positional;
    }
    if (items.empty()) {
        if (fallback) {
            return *fallback;
        }
        throw ScriptError("ValueError", fn + "() arg is an empty sequence");
    }
    const bool keyed = key && !key->is(ValueKind::kNone);
    auto key_of = [&](const Value& item) {
        if (!keyed) {
            return item;
        }
        CallArgs call;
        call.positional.push_back(item);
        return interp.Call(*key, call);
    };
    Value best = items[0];
    Value best_key = key_of(best);
    for (std::size_t i = 1; i < items.size(); ++i) {
        Value candidate_key = key_of(items[i]);
        const bool better = want_max ? LessThan(best_key, candidate_key) : LessThan(candidate_key, best_key);
        if (better) {
            best = items[i];
            best_key = std::move(candidate_key);
        }
    }
    return best;
}

Value Min(Interpreter& interp, CallArgs& args) {
    return Extreme(interp, args, "min", false);
}

Value Max(Interpreter& interp, CallArgs& args) {
    return Extreme(interp, args, "max", true);
}

Value Sum(Interpreter& interp, CallArgs& args) {
    std::optional<Value> start_kw = PopKeyword(args, "start");
    NoKeywords(args, "sum");
    CheckArity(args, "sum", 1, 2);
    Value total = args.positional.size() == 2 ? args.positional[1] : start_kw.value_or(Value::Int(0));
    if (total.is(ValueKind::kStr)) {
        throw ScriptError("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
    }
    interp.ForEach(args.positional[0], [&](const Value& item) {
        total = BinaryOp("+", total, item, interp.options().max_memory_bytes);
        return true;
    });
    return total;
}

Value Sorted(Interpreter& interp, CallArgs& args) {
    std::optional<Value> key = PopKeyword(args, "key");
    std::optional<Value> reverse = PopKeyword(args, "reverse");
    NoKeywords(args, "sorted");
    CheckArity(args, "sorted", 1, 1);
    return Value::List(SortValues(interp, interp.Materialize(args.positional[0]), key,
                                  reverse && Truthy(*reverse)));
}

Value Enumerate(Interpreter& interp, CallArgs& args) {
    std::optional<Value> start_kw = PopKeyword(args, "start");
    NoKeywords(args, "enumerate");
    CheckArity(args, "enumerate", 1, 2);
    std::int64_t index = 0;
    if (args.positional.size() == 2) {
        index = IntArg(args.positional[1], "enumerate");
    } else if (start_kw) {
        index = IntArg(*start_kw, "enumerate");
    }
    std::vector<Value> out;
    interp.ForEach(args.positional[0], [&](const Value& item) {
        interp.CheckAllocation(out.size() + 1, sizeof(Value) * 3);
        out.push_back(Value::Tuple({Value::Int(index), item}));
        index = CheckedAdd(index, 1);
        return true;
    });
    return Value::List(std::move(out));
}

Value Zip(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "zip");
    std::vector<std::vector<Value>> columns;
    std::size_t length = args.positional.empty() ? 0 : SIZE_MAX;
    for (const auto& iterable : args.positional) {
        columns.push_back(interp.Materialize(iterable));
        length = std::min(length, columns.back().size());
    }
    std::vector<Value> out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        std::vector<Value> row;
        row.reserve(columns.size());
        for (const auto& column : columns) {
            row.push_back(column[i]);
        }
        out.push_back(Value::Tuple(std::move(row)));
    }
    return Value::List(std::move(out));
}

Value AnyAll(Interpreter& interp, CallArgs& args, const std::string& fn, bool want) {
    NoKeywords(args, fn);
    CheckArity(args, fn, 1, 1);
    bool found = false;
    interp.ForEach(args.positional[0], [&](const Value& item) {
        if (Truthy(item) == want) {
            found = true;
            return false;
        }
        return true;
    });
    return Value::Bool(want ? found : !found);
}

Value Abs(Interpreter&, CallArgs& args) {
    NoKeywords(args, "abs");
    CheckArity(args, "abs", 1, 1);
    const Value& value = args.positional[0];
    if (value.is(ValueKind::kFloat)) {
        return Value::Float(std::fabs(value.AsDouble()));
    }
    if (value.IsNumber()) {
        return value.AsInt() < 0 ? UnaryOp("-", value) : Value::Int(value.AsInt());
    }
    throw ScriptError("TypeError", std::string("bad operand type for abs(): '") + TypeName(value) + "'");
}

Value Round(Interpreter&, CallArgs& args) {
    std::optional<Value> ndigits_kw = PopKeyword(args, "ndigits");
    NoKeywords(args, "round");
    CheckArity(args, "round", 1, 2);
    const Value& value = args.positional[0];
    const std::optional<Value> ndigits = args.positional.size() == 2 ? std::optional<Value>(args.positional[1])
                                                                      : ndigits_kw;
    if (!value.IsNumber()) {
        throw ScriptError("TypeError", std::string("type ") + TypeName(value) + " doesn't define __round__ method");
    }
    if (!ndigits || ndigits->is(ValueKind::kNone)) {
        if (!value.is(ValueKind::kFloat)) {
            return Value::Int(value.AsInt());
        }
        return Value::Int(FloatToInt(std::nearbyint(value.AsDouble())));
    }
    const std::int64_t digits = IntArg(*ndigits, "round");
    if (!value.is(ValueKind::kFloat)) {
        if (digits >= 0) {
            return Value::Int(value.AsInt());
        }
        if (digits < -18) {
            return Value::Int(0);
        }
        std::int64_t scale = 1;
        for (std::int64_t i = 0; i < -digits; ++i) {
            scale *= 10;
        }
        const std::int64_t n = value.AsInt();
        std::int64_t quotient = FloorDiv(n, scale);
        const std::int64_t remainder = n - quotient * scale;
        if (remainder * 2 > scale || (remainder * 2 == scale && quotient % 2 != 0)) {
            ++quotient;
        }
        return Value::Int(CheckedMul(quotient, scale));
    }
    const double x = value.AsDouble();
    if (!std::isfinite(x) || digits > 300) {
        return Value::Float(x);
    }
    if (digits < -308) {
        return Value::Float(0.0 * x);
    }
    if (digits >= 0) {
        char buffer[512];
        std::snprintf(buffer, sizeof(buffer), "%.*f", static_cast<int>(digits), x);
        return Value::Float(std::strtod(buffer, nullptr));
    }
    const double scale = std::pow(10.0, static_cast<double>(-digits));
    return Value::Float(std::nearbyint(x / scale) * scale);
}

Value Pow(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "pow");
    CheckArity(args, "pow", 2, 3);
    if (args.positional.size() == 2 || args.positional[2].is(ValueKind::kNone)) {
        return BinaryOp("**", args.positional[0], args.positional[1], interp.options().max_memory_bytes);
    }
    std::int64_t base = IntArg(args.positional[0], "pow");
    std::int64_t exponent = IntArg(args.positional[1], "pow");
    const std::int64_t modulus = IntArg(args.positional[2], "pow");
    if (modulus == 0) {
        throw ScriptError("ValueError", "pow() 3rd argument cannot be 0");
    }
    if (exponent < 0) {
        throw ScriptError("ValueError", "pow() 2nd argument cannot be negative when 3rd argument specified");
    }
    __int128 result = 1;
    __int128 factor = FloorMod(base, modulus);
    while (exponent > 0) {
        if (exponent & 1) {
            result = (result * factor) % modulus;
        }
        factor = (factor * factor) % modulus;
        exponent >>= 1;
    }
    return Value::Int(FloorMod(static_cast<std::int64_t>(result), modulus));
}

Value Reversed(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "reversed");
    CheckArity(args, "reversed", 1, 1);
    const Value& value = args.positional[0];
    if (value.is(ValueKind::kDict) || value.IsSet()) {
        throw ScriptError("TypeError", std::string("'") + TypeName(value) + "' object is not reversible");
    }
    std::vector<Value> items = interp.Materialize(value);
    std::reverse(items.begin(), items.end());
    return Value::List(std::move(items));
}

bool MatchesType(const Value& value, const Value& type) {
    if (type.is(ValueKind::kExceptionType)) {
        return value.is(ValueKind::kException) &&
               ExceptionMatches(value.AsException().type_name, type.AsExceptionType());
    }
    if (!type.is(ValueKind::kBuiltin)) {
        throw ScriptError("TypeError", "isinstance() arg 2 must be a type or tuple of types");
    }
    const std::string& name = type.AsBuiltin().name;
    if (name == "int") {
        return value.is(ValueKind::kInt) || value.is(ValueKind::kBool);
    }
    if (name == "float") return value.is(ValueKind::kFloat);
    if (name == "str") return value.is(ValueKind::kStr);
    if (name == "bool") return value.is(ValueKind::kBool);
    if (name == "list") return value.is(ValueKind::kList);
    if (name == "tuple") return value.is(ValueKind::kTuple);
    if (name == "dict") return value.is(ValueKind::kDict);
    if (name == "set") return value.is(ValueKind::kSet);
    if (name == "frozenset") return value.is(ValueKind::kFrozenSet);
    if (name == "range") return value.is(ValueKind::kRange);
    throw ScriptError("TypeError", "isinstance() arg 2 must be a type or tuple of types");
}

Value IsInstance(Interpreter&, CallArgs& args) {
    NoKeywords(args, "isinstance");
    CheckArity(args, "isinstance", 2, 2);
    const Value& type = args.positional[1];
    if (type.is(ValueKind::kTuple)) {
        for (const auto& candidate : type.Items()) {
            if (MatchesType(args.positional[0], candidate)) {
                return Value::Bool(true);
            }
        }
        return Value::Bool(false);
    }
    return Value::Bool(MatchesType(args.positional[0], type));
}

Value Chr(Interpreter&, CallArgs& args) {
    NoKeywords(args, "chr");
    CheckArity(args, "chr", 1, 1);
    const std::int64_t code = IntArg(args.positional[0], "chr");
    if (code < 0 || code > 0x10FFFF) {
        throw ScriptError("ValueError", "chr() arg not in range(0x110000)");
    }
    std::string out;
    const auto cp = static_cast<std::uint32_t>(code);
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return Value::Str(std::move(out));
}

Value Ord(Interpreter&, CallArgs& args) {
    NoKeywords(args, "ord");
    CheckArity(args, "ord", 1, 1);
    const std::string& text = StrArg(args.positional[0], "ord");
    if (text.size() != 1) {
        throw ScriptError("TypeError", "ord() expected a character, but string of length " +
                                           std::to_string(text.size()) + " found");
    }
    return Value::Int(static_cast<unsigned char>(text[0]));
}

Value DivMod(Interpreter& interp, CallArgs& args) {
    NoKeywords(args, "divmod");
    CheckArity(args, "divmod", 2, 2);
    const std::size_t limit = interp.options().max_memory_bytes;
    return Value::Tuple({BinaryOp("//", args.positional[0], args.positional[1], limit),
                         BinaryOp("%", args.positional[0], args.positional[1], limit)});
}

}  // namespace

Value MakeSet(Interpreter& interp, const Value& iterable, bool frozen) {
    Value set = Value::Set(frozen);
    DictData& items = set.AsSet();
    interp.ForEach(iterable, [&](const Value& item) {
        interp.CheckAllocation(items.size() + 1, sizeof(Value) * 2);
        items.Set(item, Value::None());
        return true;
    });
    return set;
}

std::vector<Value> SortValues(Interpreter& interp, std::vector<Value> items, const std::optional<Value>& key,
                              bool reverse) {
    std::vector<std::pair<Value, std::size_t>> keyed;
    keyed.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (key && !key->is(ValueKind::kNone)) {
            CallArgs call;
            call.positional.push_back(items[i]);
            keyed.emplace_back(interp.Call(*key, call), i);
        } else {
            keyed.emplace_back(items[i], i);
        }
    }
    std::stable_sort(keyed.begin(), keyed.end(), [reverse](const auto& a, const auto& b) {
        return reverse ? LessThan(b.first, a.first) : LessThan(a.first, b.first);
    });
    std::vector<Value> sorted;
    sorted.reserve(items.size());
    for (const auto& entry : keyed) {
        sorted.push_back(std::move(items[entry.second]));
    }
    return sorted;
}

std::unordered_map<std::string, Value> MakeBuiltins() {
    std::unordered_map<std::string, Value> builtins;
    auto add = [&](const std::string& name, BuiltinFn fn) { builtins.emplace(name, Builtin(name, std::move(fn))); };
    add("print", Print);
    add("len", Len);
    add("range", Range);
    add("str", Str);
    add("repr", ReprOf);
    add("int", Int);
    add("float", Float);
    add("bool", Bool);
    add("list", List);
    add("tuple", Tuple);
    add("dict", Dict);
    add("set", Set);
    add("frozenset", FrozenSet);
    add("map", Map);
    add("filter", Filter);
    add("min", Min);
    add("max", Max);
    add("sum", Sum);
    add("sorted", Sorted);
    add("enumerate", Enumerate);
    add("zip", Zip);
    add("any", [](Interpreter& interp, CallArgs& args) { return AnyAll(interp, args, "any", true); });
    add("all", [](Interpreter& interp, CallArgs& args) { return AnyAll(interp, args, "all", false); });
    add("abs", Abs);
    add("round", Round);
    add("pow", Pow);
    add("reversed", Reversed);
    add("isinstance", IsInstance);
    add("chr", Chr);
    add("ord", Ord);
    add("divmod", DivMod);
    for (const auto& type : kExceptionTypes) {
        if (type.name == "SyntaxError") {
            continue;
        }
        builtins.emplace(std::string(type.name), Value::ExceptionType(std::string(type.name)));
    }
    return builtins;
}

bool IsExceptionTypeName(const std::string& name) {
    return std::any_of(kExceptionTypes.begin(), kExceptionTypes.end(),
                       [&](const ExceptionType& type) { return type.name == name; });
}

bool ExceptionMatches(const std::string& raised, const std::string& handler) {
    std::string_view current = raised;
    while (!current.empty()) {
        if (current == handler) {
            return true;
        }
        current = ParentOf(current);
    }
    return false;
}

void CheckArity(const CallArgs& args, const std::string& fn, std::size_t min, std::size_t max) {
    const std::size_t count = args.positional.size();
    if (count >= min && count <= max) {
        return;
    }
    if (min == max) {
        throw ScriptError("TypeError", fn + "() takes exactly " + std::to_string(min) + " argument" +
                                           (min == 1 ? "" : "s") + " (" + std::to_string(count) + " given)");
    }
    if (count < min) {
        throw ScriptError("TypeError", fn + "() expected at least " + std::to_string(min) + " arguments, got " +
                                           std::to_string(count));
    }
    throw ScriptError("TypeError", fn + "() expected at most " + std::to_string(max) + " arguments, got " +
                                       std::to_string(count));
}

void NoKeywords(const CallArgs& args, const std::string& fn) {
    if (!args.keywords.empty()) {
        throw ScriptError("TypeError", fn + "() got an unexpected keyword argument '" + args.keywords[0].first + "'");
    }
}

std::optional<Value> PopKeyword(CallArgs& args, const std::string& name) {
    for (auto it = args.keywords.begin(); it != args.keywords.end(); ++it) {
        if (it->first == name) {
            Value value = std::move(it->second);
            args.keywords.erase(it);
            return value;
        }
    }
    return std::nullopt;
}

std::int64_t IntArg(const Value& value, const std::string& fn) {
    if (value.is(ValueKind::kInt) || value.is(ValueKind::kBool)) {
        return value.AsInt();
    }
    throw ScriptError("TypeError", fn + "(): '" + TypeName(value) + "' object cannot be interpreted as an integer");
}

double NumberArg(const Value& value, const std::string& fn) {
    if (value.IsNumber()) {
        return value.AsDouble();
    }
    throw ScriptError("TypeError", fn + "(): must be real number, not " + TypeName(value));
}

const std::string& StrArg(const Value& value, const std::string& fn) {
    if (value.is(ValueKind::kStr)) {
        return value.AsStr();
    }
    throw ScriptError("TypeError", fn + "(): argument must be str, not " + TypeName(value));
}

}  // namespace warden::script
