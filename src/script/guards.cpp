#include "script/guards.hpp"

#include <algorithm>
#include <array>

#include "script/errors.hpp"

namespace warden::script {
namespace {

constexpr std::array<std::string_view, 18> kStrAttributes = {
    "upper", "lower", "strip", "lstrip", "rstrip", "split", "join", "replace", "startswith",
    "endswith", "find", "count", "format", "isdigit", "isalpha", "title", "capitalize", "splitlines"};

constexpr std::array<std::string_view, 11> kListAttributes = {
    "append", "extend", "pop", "insert", "remove", "index", "count", "reverse", "sort", "copy", "clear"};

constexpr std::array<std::string_view, 9> kDictAttributes = {
    "get", "keys", "values", "items", "pop", "update", "setdefault", "copy", "clear"};

constexpr std::array<std::string_view, 14> kSetAttributes = {
    "add", "discard", "remove", "pop", "update", "clear", "copy", "union", "intersection", "difference",
    "symmetric_difference", "issubset", "issuperset", "isdisjoint"};

constexpr std::array<std::string_view, 8> kFrozenSetAttributes = {
    "copy", "union", "intersection", "difference", "symmetric_difference", "issubset", "issuperset", "isdisjoint"};

constexpr std::array<std::string_view, 2> kTupleAttributes = {"index", "count"};

constexpr std::array<std::string_view, 5> kMatchAttributes = {"group", "groups", "start", "end", "span"};

constexpr std::array<std::string_view, 1> kExceptionAttributes = {"args"};

constexpr std::array<std::string_view, 6> kInplaceOps = {"+", "-", "*", "/", "//", "%"};

template <std::size_t N>
bool Contains(const std::array<std::string_view, N>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool IsOpaque(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kFunction:
        case ValueKind::kBuiltin:
        case ValueKind::kBoundMethod:
        case ValueKind::kModule:
        case ValueKind::kExceptionType:
            return true;
        default:
            return false;
    }
}

bool IsReserved(const std::string& prefix, const std::string& name) {
    return !prefix.empty() && name.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

void RequireComplete(const GuardHooks& hooks) {
    if (!hooks.getattr) {
        throw GuardConfigurationError("guard hook 'getattr' is not installed");
    }
    if (!hooks.getitem) {
        throw GuardConfigurationError("guard hook 'getitem' is not installed");
    }
    if (!hooks.setitem) {
        throw GuardConfigurationError("guard hook 'setitem' is not installed");
    }
    if (!hooks.getiter) {
        throw GuardConfigurationError("guard hook 'getiter' is not installed");
    }
    if (!hooks.inplace) {
        throw GuardConfigurationError("guard hook 'inplace' is not installed");
    }
    if (!hooks.name) {
        throw GuardConfigurationError("guard hook 'name' is not installed");
    }
}

GuardHooks MakeDefaultGuards(std::string reserved_prefix) {
    GuardHooks hooks;
    hooks.getattr = [reserved_prefix](const Value& object, const std::string& attr) {
        if (IsReserved(reserved_prefix, attr)) {
            throw SecurityViolation("access to attribute '" + attr + "' of '" + TypeName(object) +
                                    "' is not allowed");
        }
    };
    hooks.getitem = [](const Value& container, const Value&) {
        if (IsOpaque(container)) {
            throw SecurityViolation(std::string("subscript of '") + TypeName(container) + "' is not allowed");
        }
    };
    hooks.setitem = [](const Value& container, const Value&) {
        if (IsOpaque(container)) {
            throw SecurityViolation(std::string("item assignment on '") + TypeName(container) +
                                    "' is not allowed");
        }
    };
    hooks.getiter = [](const Value& iterable) {
        if (IsOpaque(iterable)) {
            throw SecurityViolation(std::string("iteration over '") + TypeName(iterable) + "' is not allowed");
        }
    };
    hooks.inplace = [](const std::string& op, const Value& target) {
        if (!Contains(kInplaceOps, op)) {
            throw SecurityViolation("in-place operator '" + op + "=' is not allowed");
        }
        if (IsOpaque(target)) {
            throw SecurityViolation(std::string("in-place update of '") + TypeName(target) + "' is not allowed");
        }
    };
    hooks.name = [reserved_prefix](const std::string& name) {
        if (IsReserved(reserved_prefix, name)) {
            throw SecurityViolation("name '" + name + "' is not allowed");
        }
    };
    return hooks;
}

bool IsAttributeAllowed(ValueKind kind, std::string_view attr) {
    switch (kind) {
        case ValueKind::kStr: return Contains(kStrAttributes, attr);
        case ValueKind::kList: return Contains(kListAttributes, attr);
        case ValueKind::kDict: return Contains(kDictAttributes, attr);
        case ValueKind::kSet: return Contains(kSetAttributes, attr);
        case ValueKind::kFrozenSet: return Contains(kFrozenSetAttributes, attr);
        case ValueKind::kTuple: return Contains(kTupleAttributes, attr);
        case ValueKind::kMatch: return Contains(kMatchAttributes, attr);
        case ValueKind::kException: return Contains(kExceptionAttributes, attr);
        default: return false;
    }
}

}  // namespace warden::script
