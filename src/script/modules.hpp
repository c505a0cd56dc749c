#pragma once

#include <memory>
#include <string>
#include <vector>

#include "script/value.hpp"

namespace warden::script {

// Builds a fresh instance of a pure module (math, json, re, string,
// functools, itertools).
// Returns nullptr for names with no implementation.
std::shared_ptr<ModuleData> LoadModule(const std::string& name);

std::vector<std::string> AvailableModules();

}  // namespace warden::script
