#pragma once

#include <memory>
#include <string_view>

#include "script/ast.hpp"

namespace warden::script {

struct ParseOptions {
    // Bounds recursion in the parser and in every later tree walk.
    int max_nesting_depth = 200;
};

// Parses a whole script. Throws SyntaxError.
std::unique_ptr<Module> Parse(std::string_view source, const ParseOptions& options = {});

}  // namespace warden::script
