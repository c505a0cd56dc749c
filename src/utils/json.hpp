#pragma once

#include "nlohmann/json.hpp"

namespace warden::utils {

// Insertion-ordered so script dicts and wire documents keep their key order.
using Json = nlohmann::ordered_json;

}  // namespace warden::utils
