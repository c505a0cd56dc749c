#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "script/value.hpp"

namespace warden::script {

// Checks the interpreter runs before every sensitive operation. Each hook
// throws SecurityViolation to refuse. All hooks are mandatory.
struct GuardHooks {
    std::function<void(const Value& object, const std::string& attr)> getattr;
    std::function<void(const Value& container, const Value& key)> getitem;
    std::function<void(const Value& container, const Value& key)> setitem;
    std::function<void(const Value& iterable)> getiter;
    std::function<void(const std::string& op, const Value& target)> inplace;
    std::function<void(const std::string& name)> name;
};

// Throws GuardConfigurationError naming the first missing hook.
void RequireComplete(const GuardHooks& hooks);

// Hooks that refuse reserved-prefix names and any item, iteration or
// in-place access on functions, modules and types.
GuardHooks MakeDefaultGuards(std::string reserved_prefix);

// Whether attr is on the allow-list for values of the given kind.
bool IsAttributeAllowed(ValueKind kind, std::string_view attr);

}  // namespace warden::script
