#pragma once

#include <cstddef>

#include "utils/json.hpp"

namespace warden::sandbox {

struct ContextLimits {
    int max_depth = 4;
    std::size_t max_bytes = 1024 * 1024;
};

// Checks caller-supplied context before it crosses into a worker. Only
// null, booleans, numbers, strings and arrays/objects of them pass. Top-level
// keys must be identifiers that shadow no builtin; no key at any depth may
// use the reserved prefix. Throws InvalidRequestError.
utils::Json SanitizeContext(const utils::Json& context, const ContextLimits& limits);

}  // namespace warden::sandbox
