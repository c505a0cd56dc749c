#include "sandbox/context_sanitizer.hpp"

#include <cctype>
#include <string>

#include "sandbox/types.hpp"
#include "script/builtins.hpp"
#include "utils/common.hpp"

namespace warden::sandbox {
namespace {

// Rough per-scalar charge, matching what a serialized number or literal costs.
constexpr std::size_t kScalarBytes = 16;

bool IsIdentifier(const std::string& key) {
    if (key.empty() || !(std::isalpha(static_cast<unsigned char>(key[0])) || key[0] == '_')) {
        return false;
    }
    for (const char c : key) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
            return false;
        }
    }
    return true;
}

class Sanitizer {
public:
    explicit Sanitizer(const ContextLimits& limits) : limits_(limits) {}

    void CheckKey(const std::string& key) {
        if (utils::StartsWith(key, kReservedPrefix)) {
            throw InvalidRequestError("context key '" + key + "' is reserved");
        }
        Charge(key.size());
    }

    void CheckValue(const utils::Json& value, int depth) {
        if (depth > limits_.max_depth) {
            throw InvalidRequestError("context nesting exceeds allowed depth");
        }
        switch (value.type()) {
            case utils::Json::value_t::null:
            case utils::Json::value_t::boolean:
            case utils::Json::value_t::number_integer:
            case utils::Json::value_t::number_unsigned:
            case utils::Json::value_t::number_float:
                Charge(kScalarBytes);
                return;
            case utils::Json::value_t::string:
                Charge(value.get_ref<const std::string&>().size());
                return;
            case utils::Json::value_t::array:
                for (const auto& item : value) {
                    CheckValue(item, depth + 1);
                }
                return;
            case utils::Json::value_t::object:
                for (const auto& [key, item] : value.items()) {
                    CheckKey(key);
                    CheckValue(item, depth + 1);
                }
                return;
            default:
                throw InvalidRequestError("only JSON primitive context values are permitted");
        }
    }

private:
    void Charge(std::size_t bytes) {
        used_ += bytes;
        if (used_ > limits_.max_bytes) {
            throw InvalidRequestError("context size exceeds " + std::to_string(limits_.max_bytes) + " bytes");
        }
    }

    const ContextLimits& limits_;
    std::size_t used_ = 0;
};

}  // namespace

utils::Json SanitizeContext(const utils::Json& context, const ContextLimits& limits) {
    if (context.is_null()) {
        return utils::Json::object();
    }
    if (!context.is_object()) {
        throw InvalidRequestError("context must be an object");
    }
    const auto builtins = script::MakeBuiltins();
    Sanitizer sanitizer(limits);
    for (const auto& [key, value] : context.items()) {
        sanitizer.CheckKey(key);
        if (!IsIdentifier(key)) {
            throw InvalidRequestError("context key '" + key + "' is not an identifier");
        }
        if (builtins.count(key) > 0) {
            throw InvalidRequestError("context key '" + key + "' shadows a builtin");
        }
        sanitizer.CheckValue(value, 0);
    }
    return context;
}

}  // namespace warden::sandbox
