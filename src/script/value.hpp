#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "utils/json.hpp"

namespace warden::script {

class Interpreter;
class Value;
struct FunctionDef;

enum class ValueKind {
    kNone,
    kBool,
    kInt,
    kFloat,
    kStr,
    kList,
    kTuple,
    kDict,
    kSet,
    kFrozenSet,
    kRange,
    kFunction,
    kBuiltin,
    kBoundMethod,
    kModule,
    kExceptionType,
    kException,
    kMatch
};

struct ListData {
    std::vector<Value> items;
};

// Insertion-ordered dictionary keyed by hashable primitives.
class DictData {
public:
    std::size_t size() const;
    const Value* Find(const Value& key) const;
    void Set(const Value& key, Value value);
    bool Erase(const Value& key);
    void Clear();
    std::vector<std::pair<Value, Value>> Items() const;
    std::vector<Value> Keys() const;

private:
    std::vector<std::pair<Value, Value>> entries_;
    std::vector<bool> live_;
    std::unordered_map<std::string, std::size_t> index_;
    std::size_t size_ = 0;
};

struct RangeData {
    std::int64_t start = 0;
    std::int64_t stop = 0;
    std::int64_t step = 1;

    // Throws OverflowError when the element count does not fit in 64 bits.
    std::int64_t Length() const;
    bool Empty() const { return step > 0 ? start >= stop : start <= stop; }
    std::int64_t At(std::int64_t index) const;
};

struct CallArgs {
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;
    int line = 0;
};

using BuiltinFn = std::function<Value(Interpreter&, CallArgs&)>;

struct BuiltinData {
    std::string name;
    BuiltinFn fn;
};

struct FunctionData {
    std::string name;
    const FunctionDef* def = nullptr;
    std::vector<Value> defaults;
};

struct BoundMethodData;
struct ModuleData;
struct ExceptionData;
struct MatchData;

class Value {
public:
    Value() = default;

    static Value None() { return Value(); }
    static Value Bool(bool value);
    static Value Int(std::int64_t value);
    static Value Float(double value);
    static Value Str(std::string value);
    static Value List(std::vector<Value> items = {});
    static Value Tuple(std::vector<Value> items = {});
    static Value Dict();
    // Sets reuse DictData with None values; frozen sets are never mutated.
    static Value Set(bool frozen = false);
    static Value Range(std::int64_t start, std::int64_t stop, std::int64_t step);
    static Value Builtin(std::string name, BuiltinFn fn);
    static Value Function(std::shared_ptr<FunctionData> function);
    static Value BoundMethod(Value receiver, std::string name);
    static Value Module(std::shared_ptr<ModuleData> module);
    static Value ExceptionType(std::string name);
    static Value Exception(std::string type_name, std::string message);
    static Value Match(std::shared_ptr<MatchData> match);

    ValueKind kind() const { return kind_; }
    bool is(ValueKind kind) const { return kind_ == kind; }
    bool IsNumber() const { return kind_ == ValueKind::kBool || kind_ == ValueKind::kInt || kind_ == ValueKind::kFloat; }
    bool IsSequence() const { return kind_ == ValueKind::kList || kind_ == ValueKind::kTuple; }
    bool IsSet() const { return kind_ == ValueKind::kSet || kind_ == ValueKind::kFrozenSet; }

    bool AsBool() const { return std::get<bool>(data_); }
    std::int64_t AsInt() const;  // bool or int
    double AsDouble() const;     // bool, int or float
    const std::string& AsStr() const { return *std::get<std::shared_ptr<const std::string>>(data_); }
    // Shared by tuples and lists; tuples are never mutated.
    std::vector<Value>& Items() const { return std::get<std::shared_ptr<ListData>>(data_)->items; }
    DictData& AsDict() const { return *std::get<std::shared_ptr<DictData>>(data_); }
    DictData& AsSet() const { return *std::get<std::shared_ptr<DictData>>(data_); }
    const RangeData& AsRange() const { return std::get<RangeData>(data_); }
    const BuiltinData& AsBuiltin() const { return *std::get<std::shared_ptr<BuiltinData>>(data_); }
    const FunctionData& AsFunction() const { return *std::get<std::shared_ptr<FunctionData>>(data_); }
    const BoundMethodData& AsBoundMethod() const;
    const ModuleData& AsModule() const;
    const std::string& AsExceptionType() const { return *std::get<std::shared_ptr<const std::string>>(data_); }
    const ExceptionData& AsException() const;
    const MatchData& AsMatch() const;

    // Identity for reference kinds, used by "is".
    const void* Identity() const;

private:
    using Data = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::shared_ptr<const std::string>,
        std::shared_ptr<ListData>,
        std::shared_ptr<DictData>,
        RangeData,
        std::shared_ptr<BuiltinData>,
        std::shared_ptr<FunctionData>,
        std::shared_ptr<BoundMethodData>,
        std::shared_ptr<ModuleData>,
        std::shared_ptr<ExceptionData>,
        std::shared_ptr<MatchData>>;

    Value(ValueKind kind, Data data) : kind_(kind), data_(std::move(data)) {}

    ValueKind kind_ = ValueKind::kNone;
    Data data_;
};

struct BoundMethodData {
    Value receiver;
    std::string name;
};

struct ModuleData {
    std::string name;
    std::unordered_map<std::string, Value> members;
};

struct ExceptionData {
    std::string type_name;
    std::string message;
};

struct MatchData {
    std::vector<std::optional<std::string>> groups;
    std::int64_t start = 0;
    std::int64_t end = 0;
};

inline const BoundMethodData& Value::AsBoundMethod() const {
    return *std::get<std::shared_ptr<BoundMethodData>>(data_);
}

inline const ModuleData& Value::AsModule() const {
    return *std::get<std::shared_ptr<ModuleData>>(data_);
}

inline const ExceptionData& Value::AsException() const {
    return *std::get<std::shared_ptr<ExceptionData>>(data_);
}

inline const MatchData& Value::AsMatch() const {
    return *std::get<std::shared_ptr<MatchData>>(data_);
}

const char* TypeName(ValueKind kind);
const char* TypeName(const Value& value);

bool Truthy(const Value& value);
bool IsHashable(const Value& value);

// Python-style equality. Bounded recursion; throws ScriptError on cycles.
bool Equals(const Value& a, const Value& b);

// Python-style str() and repr().
std::string ToStr(const Value& value);
std::string Repr(const Value& value);
std::string FormatFloat(double value);

// Representable values are None, bool, int, finite float, str, list, tuple
// and dict; dict keys become strings. Returns nullopt for anything else or
// for structures deeper than max_depth.
std::optional<utils::Json> ToJson(const Value& value, int max_depth = 32);
Value FromJson(const utils::Json& json);

}  // namespace warden::script
