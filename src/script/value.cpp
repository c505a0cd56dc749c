#include "script/value.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "script/errors.hpp"
#include "script/operators.hpp"

namespace warden::script {
namespace {

constexpr int kMaxReprDepth = 64;

std::string HashKey(const Value& key, int depth = 0) {
    if (depth > kMaxReprDepth) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded while hashing");
    }
    switch (key.kind()) {
        case ValueKind::kNone:
            return "n";
        case ValueKind::kBool:
        case ValueKind::kInt:
            return "i:" + std::to_string(key.AsInt());
        case ValueKind::kFloat: {
            const double value = key.AsDouble();
            if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) < 9.2e18) {
                return "i:" + std::to_string(static_cast<std::int64_t>(value));
            }
            return "f:" + FormatFloat(value);
        }
        case ValueKind::kStr:
            return "s:" + key.AsStr();
        case ValueKind::kTuple: {
            std::string out = "t(";
            for (const auto& item : key.Items()) {
                out += HashKey(item, depth + 1);
                out += '\x1f';
            }
            out += ")";
            return out;
        }
        case ValueKind::kFrozenSet: {
            // Element order must not change the key.
            std::vector<std::string> parts;
            for (const auto& item : key.AsSet().Keys()) {
                parts.push_back(HashKey(item, depth + 1));
            }
            std::sort(parts.begin(), parts.end());
            std::string out = "z(";
            for (const auto& part : parts) {
                out += part;
                out += '\x1f';
            }
            out += ")";
            return out;
        }
        case ValueKind::kExceptionType:
            return "c:" + key.AsExceptionType();
        default:
            throw ScriptError("TypeError", std::string("unhashable type: '") + TypeName(key) + "'");
    }
}

std::string QuoteString(const std::string& text) {
    const bool has_single = text.find('\'') != std::string::npos;
    const bool has_double = text.find('"') != std::string::npos;
    const char quote = has_single && !has_double ? '"' : '\'';
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back(quote);
    for (const char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c == quote) {
                    out.push_back('\\');
                    out.push_back(c);
                } else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\x%02x", static_cast<unsigned char>(c));
                    out += buffer;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back(quote);
    return out;
}

std::string ReprImpl(const Value& value, int depth);

std::string JoinRepr(const std::vector<Value>& items, int depth) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += ReprImpl(items[i], depth + 1);
    }
    return out;
}

std::string ReprImpl(const Value& value, int depth) {
    if (depth > kMaxReprDepth) {
        return "...";
    }
    switch (value.kind()) {
        case ValueKind::kStr:
            return QuoteString(value.AsStr());
        case ValueKind::kList:
            return "[" + JoinRepr(value.Items(), depth) + "]";
        case ValueKind::kTuple:
            if (value.Items().size() == 1) {
                return "(" + ReprImpl(value.Items()[0], depth + 1) + ",)";
            }
            return "(" + JoinRepr(value.Items(), depth) + ")";
        case ValueKind::kDict: {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, item] : value.AsDict().Items()) {
                if (!first) {
                    out += ", ";
                }
                first = false;
                out += ReprImpl(key, depth + 1);
                out += ": ";
                out += ReprImpl(item, depth + 1);
            }
            return out + "}";
        }
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: {
            const bool frozen = value.is(ValueKind::kFrozenSet);
            const auto items = value.AsSet().Keys();
            if (items.empty()) {
                return frozen ? "frozenset()" : "set()";
            }
            const std::string body = "{" + JoinRepr(items, depth) + "}";
            return frozen ? "frozenset(" + body + ")" : body;
        }
        case ValueKind::kException: {
            const auto& exception = value.AsException();
            return exception.type_name + "(" + QuoteString(exception.message) + ")";
        }
        case ValueKind::kMatch: {
            const auto& match = value.AsMatch();
            return "<re.Match object; span=(" + std::to_string(match.start) + ", " + std::to_string(match.end) +
                   "), match=" + QuoteString(match.groups.empty() || !match.groups[0] ? "" : *match.groups[0]) + ">";
        }
        default:
            return ToStr(value);
    }
}

bool EqualsImpl(const Value& a, const Value& b, int depth) {
    if (depth > kMaxReprDepth) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded in comparison");
    }
    if (a.IsNumber() && b.IsNumber()) {
        if (a.is(ValueKind::kFloat) || b.is(ValueKind::kFloat)) {
            return a.AsDouble() == b.AsDouble();
        }
        return a.AsInt() == b.AsInt();
    }
    if (a.IsSet() && b.IsSet()) {
        const auto& left = a.AsSet();
        const auto& right = b.AsSet();
        if (&left == &right) {
            return true;
        }
        if (left.size() != right.size()) {
            return false;
        }
        for (const auto& item : left.Keys()) {
            if (!right.Find(item)) {
                return false;
            }
        }
        return true;
    }
    if (a.kind() != b.kind()) {
        return false;
    }
    switch (a.kind()) {
        case ValueKind::kNone:
            return true;
        case ValueKind::kStr:
            return a.AsStr() == b.AsStr();
        case ValueKind::kList:
        case ValueKind::kTuple: {
            const auto& left = a.Items();
            const auto& right = b.Items();
            if (&left == &right) {
                return true;
            }
            if (left.size() != right.size()) {
                return false;
            }
            for (std::size_t i = 0; i < left.size(); ++i) {
                if (!EqualsImpl(left[i], right[i], depth + 1)) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::kDict: {
            const auto& left = a.AsDict();
            const auto& right = b.AsDict();
            if (&left == &right) {
                return true;
            }
            if (left.size() != right.size()) {
                return false;
            }
            for (const auto& [key, item] : left.Items()) {
                const Value* other = right.Find(key);
                if (!other || !EqualsImpl(item, *other, depth + 1)) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::kRange: {
            const auto& left = a.AsRange();
            const auto& right = b.AsRange();
            const auto length = left.Length();
            if (length != right.Length()) {
                return false;
            }
            if (length == 0) {
                return true;
            }
            return left.start == right.start && (length == 1 || left.step == right.step);
        }
        case ValueKind::kExceptionType:
            return a.AsExceptionType() == b.AsExceptionType();
        default:
            return a.Identity() == b.Identity();
    }
}

std::optional<utils::Json> ToJsonImpl(const Value& value, int depth, int max_depth) {
    if (depth > max_depth) {
        return std::nullopt;
    }
    switch (value.kind()) {
        case ValueKind::kNone:
            return utils::Json(nullptr);
        case ValueKind::kBool:
            return utils::Json(value.AsBool());
        case ValueKind::kInt:
            return utils::Json(value.AsInt());
        case ValueKind::kFloat:
            if (!std::isfinite(value.AsDouble())) {
                return std::nullopt;
            }
            return utils::Json(value.AsDouble());
        case ValueKind::kStr:
            return utils::Json(value.AsStr());
        case ValueKind::kList:
        case ValueKind::kTuple: {
            utils::Json array = utils::Json::array();
            for (const auto& item : value.Items()) {
                auto converted = ToJsonImpl(item, depth + 1, max_depth);
                if (!converted) {
                    return std::nullopt;
                }
                array.push_back(std::move(*converted));
            }
            return array;
        }
        case ValueKind::kDict: {
            utils::Json object = utils::Json::object();
            for (const auto& [key, item] : value.AsDict().Items()) {
                std::string name;
                switch (key.kind()) {
                    case ValueKind::kStr: name = key.AsStr(); break;
                    case ValueKind::kNone: name = "null"; break;
                    case ValueKind::kBool: name = key.AsBool() ? "true" : "false"; break;
                    case ValueKind::kInt: name = std::to_string(key.AsInt()); break;
                    case ValueKind::kFloat: name = FormatFloat(key.AsDouble()); break;
                    default: return std::nullopt;
                }
                auto converted = ToJsonImpl(item, depth + 1, max_depth);
                if (!converted) {
                    return std::nullopt;
                }
                object[name] = std::move(*converted);
            }
            return object;
        }
        default:
            return std::nullopt;
    }
}

}  // namespace

std::size_t DictData::size() const {
    return size_;
}

const Value* DictData::Find(const Value& key) const {
    const auto it = index_.find(HashKey(key));
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

void DictData::Set(const Value& key, Value value) {
    auto hash = HashKey(key);
    const auto it = index_.find(hash);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(value);
        return;
    }
    index_.emplace(std::move(hash), entries_.size());
    entries_.emplace_back(key, std::move(value));
    live_.push_back(true);
    ++size_;
}

bool DictData::Erase(const Value& key) {
    const auto it = index_.find(HashKey(key));
    if (it == index_.end()) {
        return false;
    }
    live_[it->second] = false;
    entries_[it->second] = {Value(), Value()};
    index_.erase(it);
    --size_;
    return true;
}

void DictData::Clear() {
    entries_.clear();
    live_.clear();
    index_.clear();
    size_ = 0;
}

std::vector<std::pair<Value, Value>> DictData::Items() const {
    std::vector<std::pair<Value, Value>> items;
    items.reserve(size_);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (live_[i]) {
            items.push_back(entries_[i]);
        }
    }
    return items;
}

std::vector<Value> DictData::Keys() const {
    std::vector<Value> keys;
    keys.reserve(size_);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (live_[i]) {
            keys.push_back(entries_[i].first);
        }
    }
    return keys;
}

std::int64_t RangeData::Length() const {
    const __int128 first = start;
    const __int128 last = stop;
    const __int128 stride = step;
    __int128 length = 0;
    if (stride > 0 && first < last) {
        length = (last - first - 1) / stride + 1;
    } else if (stride < 0 && first > last) {
        length = (first - last - 1) / (-stride) + 1;
    }
    if (length > std::numeric_limits<std::int64_t>::max()) {
        throw ScriptError("OverflowError", "range has too many items");
    }
    return static_cast<std::int64_t>(length);
}

std::int64_t RangeData::At(std::int64_t index) const {
    return CheckedAdd(start, CheckedMul(index, step));
}

Value Value::Bool(bool value) {
    return Value(ValueKind::kBool, value);
}

Value Value::Int(std::int64_t value) {
    return Value(ValueKind::kInt, value);
}

Value Value::Float(double value) {
    return Value(ValueKind::kFloat, value);
}

Value Value::Str(std::string value) {
    return Value(ValueKind::kStr, std::make_shared<const std::string>(std::move(value)));
}

Value Value::List(std::vector<Value> items) {
    auto data = std::make_shared<ListData>();
    data->items = std::move(items);
    return Value(ValueKind::kList, std::move(data));
}

Value Value::Tuple(std::vector<Value> items) {
    auto data = std::make_shared<ListData>();
    data->items = std::move(items);
    return Value(ValueKind::kTuple, std::move(data));
}

Value Value::Dict() {
    return Value(ValueKind::kDict, std::make_shared<DictData>());
}

Value Value::Set(bool frozen) {
    return Value(frozen ? ValueKind::kFrozenSet : ValueKind::kSet, std::make_shared<DictData>());
}

Value Value::Range(std::int64_t start, std::int64_t stop, std::int64_t step) {
    return Value(ValueKind::kRange, RangeData{start, stop, step});
}

Value Value::Builtin(std::string name, BuiltinFn fn) {
    auto data = std::make_shared<BuiltinData>();
    data->name = std::move(name);
    data->fn = std::move(fn);
    return Value(ValueKind::kBuiltin, std::move(data));
}

Value Value::Function(std::shared_ptr<FunctionData> function) {
    return Value(ValueKind::kFunction, std::move(function));
}

Value Value::BoundMethod(Value receiver, std::string name) {
    auto data = std::make_shared<BoundMethodData>();
    data->receiver = std::move(receiver);
    data->name = std::move(name);
    return Value(ValueKind::kBoundMethod, std::move(data));
}

Value Value::Module(std::shared_ptr<ModuleData> module) {
    return Value(ValueKind::kModule, std::move(module));
}

Value Value::ExceptionType(std::string name) {
    return Value(ValueKind::kExceptionType, std::make_shared<const std::string>(std::move(name)));
}

Value Value::Exception(std::string type_name, std::string message) {
    auto data = std::make_shared<ExceptionData>();
    data->type_name = std::move(type_name);
    data->message = std::move(message);
    return Value(ValueKind::kException, std::move(data));
}

Value Value::Match(std::shared_ptr<MatchData> match) {
    return Value(ValueKind::kMatch, std::move(match));
}

std::int64_t Value::AsInt() const {
    if (kind_ == ValueKind::kBool) {
        return std::get<bool>(data_) ? 1 : 0;
    }
    return std::get<std::int64_t>(data_);
}

double Value::AsDouble() const {
    if (kind_ == ValueKind::kFloat) {
        return std::get<double>(data_);
    }
    return static_cast<double>(AsInt());
}

const void* Value::Identity() const {
    return std::visit(
        [](const auto& data) -> const void* {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, bool> ||
                          std::is_same_v<T, std::int64_t> || std::is_same_v<T, double> ||
                          std::is_same_v<T, RangeData>) {
                return nullptr;
            } else {
                return data.get();
            }
        },
        data_);
}

const char* TypeName(ValueKind kind) {
    switch (kind) {
        case ValueKind::kNone: return "NoneType";
        case ValueKind::kBool: return "bool";
        case ValueKind::kInt: return "int";
        case ValueKind::kFloat: return "float";
        case ValueKind::kStr: return "str";
        case ValueKind::kList: return "list";
        case ValueKind::kTuple: return "tuple";
        case ValueKind::kDict: return "dict";
        case ValueKind::kSet: return "set";
        case ValueKind::kFrozenSet: return "frozenset";
        case ValueKind::kRange: return "range";
        case ValueKind::kFunction: return "function";
        case ValueKind::kBuiltin: return "builtin_function_or_method";
        case ValueKind::kBoundMethod: return "builtin_function_or_method";
        case ValueKind::kModule: return "module";
        case ValueKind::kExceptionType: return "type";
        case ValueKind::kException: return "exception";
        case ValueKind::kMatch: return "re.Match";
    }
    return "object";
}

const char* TypeName(const Value& value) {
    if (value.is(ValueKind::kException)) {
        return value.AsException().type_name.c_str();
    }
    return TypeName(value.kind());
}

bool Truthy(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNone: return false;
        case ValueKind::kBool: return value.AsBool();
        case ValueKind::kInt: return value.AsInt() != 0;
        case ValueKind::kFloat: return value.AsDouble() != 0.0;
        case ValueKind::kStr: return !value.AsStr().empty();
        case ValueKind::kList:
        case ValueKind::kTuple: return !value.Items().empty();
        case ValueKind::kDict: return value.AsDict().size() != 0;
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: return value.AsSet().size() != 0;
        case ValueKind::kRange: return !value.AsRange().Empty();
        default: return true;
    }
}

bool IsHashable(const Value& value) {
    try {
        HashKey(value);
        return true;
    } catch (const ScriptError&) {
        return false;
    }
}

bool Equals(const Value& a, const Value& b) {
    return EqualsImpl(a, b, 0);
}

std::string FormatFloat(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    if (value == 0.0) {
        return std::signbit(value) ? "-0.0" : "0.0";
    }
    // Shortest round-trip digits, laid out the way Python's repr does.
    char buffer[64];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::scientific);
    std::string scientific(buffer, result.ptr);
    const auto e_pos = scientific.find('e');
    std::string mantissa = scientific.substr(0, e_pos);
    const int exponent = std::atoi(scientific.c_str() + e_pos + 1);
    const bool negative = !mantissa.empty() && mantissa[0] == '-';
    if (negative) {
        mantissa.erase(0, 1);
    }
    std::string digits;
    for (const char c : mantissa) {
        if (c != '.') {
            digits.push_back(c);
        }
    }
    std::string out = negative ? "-" : "";
    if (exponent >= -5 && exponent < 16) {
        if (exponent < 0) {
            out += "0.";
            out.append(static_cast<std::size_t>(-exponent - 1), '0');
            out += digits;
        } else if (static_cast<std::size_t>(exponent) + 1 >= digits.size()) {
            out += digits;
            out.append(static_cast<std::size_t>(exponent) + 1 - digits.size(), '0');
            out += ".0";
        } else {
            out += digits.substr(0, static_cast<std::size_t>(exponent) + 1);
            out += ".";
            out += digits.substr(static_cast<std::size_t>(exponent) + 1);
        }
        return out;
    }
    out += digits.substr(0, 1);
    if (digits.size() > 1) {
        out += ".";
        out += digits.substr(1);
    }
    char exp_buffer[16];
    std::snprintf(exp_buffer, sizeof(exp_buffer), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
    out += exp_buffer;
    return out;
}

std::string ToStr(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNone: return "None";
        case ValueKind::kBool: return value.AsBool() ? "True" : "False";
        case ValueKind::kInt: return std::to_string(value.AsInt());
        case ValueKind::kFloat: return FormatFloat(value.AsDouble());
        case ValueKind::kStr: return value.AsStr();
        case ValueKind::kRange: {
            const auto& range = value.AsRange();
            std::string out = "range(" + std::to_string(range.start) + ", " + std::to_string(range.stop);
            if (range.step != 1) {
                out += ", " + std::to_string(range.step);
            }
            return out + ")";
        }
        case ValueKind::kFunction: return "<function " + value.AsFunction().name + ">";
        case ValueKind::kBuiltin: return "<built-in function " + value.AsBuiltin().name + ">";
        case ValueKind::kBoundMethod: {
            const auto& method = value.AsBoundMethod();
            return "<built-in method " + method.name + " of " + TypeName(method.receiver) + " object>";
        }
        case ValueKind::kModule: return "<module '" + value.AsModule().name + "'>";
        case ValueKind::kExceptionType: return "<class '" + value.AsExceptionType() + "'>";
        case ValueKind::kException: return value.AsException().message;
        default: return ReprImpl(value, 0);
    }
}

std::string Repr(const Value& value) {
    return ReprImpl(value, 0);
}

std::optional<utils::Json> ToJson(const Value& value, int max_depth) {
    return ToJsonImpl(value, 0, max_depth);
}

Value FromJson(const utils::Json& json) {
    switch (json.type()) {
        case utils::Json::value_t::null:
            return Value::None();
        case utils::Json::value_t::boolean:
            return Value::Bool(json.get<bool>());
        case utils::Json::value_t::number_integer:
            return Value::Int(json.get<std::int64_t>());
        case utils::Json::value_t::number_unsigned: {
            const auto value = json.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(INT64_MAX)) {
                return Value::Float(static_cast<double>(value));
            }
            return Value::Int(static_cast<std::int64_t>(value));
        }
        case utils::Json::value_t::number_float:
            return Value::Float(json.get<double>());
        case utils::Json::value_t::string:
            return Value::Str(json.get<std::string>());
        case utils::Json::value_t::array: {
            std::vector<Value> items;
            items.reserve(json.size());
            for (const auto& item : json) {
                items.push_back(FromJson(item));
            }
            return Value::List(std::move(items));
        }
        case utils::Json::value_t::object: {
            Value dict = Value::Dict();
            for (const auto& [key, item] : json.items()) {
                dict.AsDict().Set(Value::Str(key), FromJson(item));
            }
            return dict;
        }
        default:
            return Value::None();
    }
}

}  // namespace warden::script
