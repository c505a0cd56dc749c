#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "script/errors.hpp"

namespace warden::script {

enum class TokenKind {
    kName,
    kKeyword,
    kInt,
    kFloat,
    kString,
    kOp,
    kNewline,
    kIndent,
    kDedent,
    kEnd
};

struct Token {
    TokenKind kind = TokenKind::kEnd;
    std::string text;
    std::int64_t int_value = 0;
    double float_value = 0.0;
    SourcePos pos;
};

const char* ToString(TokenKind kind);

bool IsKeyword(std::string_view word);

// Splits source text into tokens, producing INDENT/DEDENT tokens for block
// structure. Throws SyntaxError.
std::vector<Token> Tokenize(std::string_view source);

}  // namespace warden::script
