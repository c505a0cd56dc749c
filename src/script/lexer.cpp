#include "script/lexer.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace warden::script {
namespace {

constexpr std::array<std::string_view, 35> kKeywords = {
    "and", "as", "assert", "async", "await", "break", "class", "continue",
    "def", "del", "elif", "else", "except", "finally", "for", "from",
    "global", "if", "import", "in", "is", "lambda", "nonlocal", "not",
    "or", "pass", "raise", "return", "try", "while", "with", "yield",
    "True", "False", "None"};

// Longest operators first so that "**=" wins over "**" and "*".
constexpr std::array<std::string_view, 40> kOperators = {
    "**=", "//=", ">>=", "<<=",
    "**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "->",
    "<<", ">>", "&=", "|=", "^=",
    "+", "-", "*", "/", "%", "<", ">", "=", "(", ")", "[", "]", "{", "}",
    ",", ":", ".", ";", "@"};

class Lexer {
public:
    explicit Lexer(std::string_view source) : source_(source) {}

    std::vector<Token> Run() {
        indents_.push_back(0);
        while (pos_ < source_.size()) {
            if (at_line_start_) {
                if (HandleIndentation()) {
                    continue;
                }
            }
            const char c = source_[pos_];
            if (c == '\n') {
                NewlineChar();
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
                Advance();
                continue;
            }
            if (c == '#') {
                SkipComment();
                continue;
            }
            if (c == '\\') {
                Continuation();
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(c)) ||
                (c == '.' && pos_ + 1 < source_.size() &&
                 std::isdigit(static_cast<unsigned char>(source_[pos_ + 1])))) {
                Number();
                continue;
            }
            if (IsStringStart()) {
                String();
                continue;
            }
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                Word();
                continue;
            }
            Operator();
        }
        if (!tokens_.empty() && tokens_.back().kind != TokenKind::kNewline &&
            tokens_.back().kind != TokenKind::kDedent) {
            Emit(TokenKind::kNewline, "", Here());
        }
        while (indents_.size() > 1) {
            indents_.pop_back();
            Emit(TokenKind::kDedent, "", Here());
        }
        Emit(TokenKind::kEnd, "", Here());
        return std::move(tokens_);
    }

private:
    SourcePos Here() const { return SourcePos{line_, column_}; }

    void Advance() {
        if (source_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }

    void Emit(TokenKind kind, std::string text, SourcePos pos) {
        Token token;
        token.kind = kind;
        token.text = std::move(text);
        token.pos = pos;
        tokens_.push_back(std::move(token));
    }

    // Measures the indentation of a logical line. Returns true when the line
    // was blank or a comment and has been consumed.
    bool HandleIndentation() {
        int width = 0;
        std::size_t scan = pos_;
        while (scan < source_.size() && (source_[scan] == ' ' || source_[scan] == '\t' || source_[scan] == '\f')) {
            width = source_[scan] == '\t' ? (width / 8 + 1) * 8 : width + 1;
            ++scan;
        }
        const bool blank = scan >= source_.size() || source_[scan] == '\n' || source_[scan] == '#' ||
                           (source_[scan] == '\r' && scan + 1 < source_.size() && source_[scan + 1] == '\n');
        while (pos_ < scan) {
            Advance();
        }
        if (blank) {
            if (pos_ < source_.size() && source_[pos_] == '#') {
                SkipComment();
            }
            if (pos_ < source_.size() && source_[pos_] == '\r') {
                Advance();
            }
            if (pos_ < source_.size()) {
                Advance();  // newline
            }
            return true;
        }
        at_line_start_ = false;
        const SourcePos pos = Here();
        if (width > indents_.back()) {
            indents_.push_back(width);
            Emit(TokenKind::kIndent, "", pos);
        } else {
            while (width < indents_.back()) {
                indents_.pop_back();
                Emit(TokenKind::kDedent, "", pos);
            }
            if (width != indents_.back()) {
                throw SyntaxError("unindent does not match any outer indentation level", pos);
            }
        }
        return false;
    }

    void NewlineChar() {
        const SourcePos pos = Here();
        Advance();
        if (depth_ > 0) {
            return;
        }
        if (!tokens_.empty() && tokens_.back().kind != TokenKind::kNewline &&
            tokens_.back().kind != TokenKind::kIndent && tokens_.back().kind != TokenKind::kDedent) {
            Emit(TokenKind::kNewline, "", pos);
        }
        at_line_start_ = true;
    }

    void SkipComment() {
        while (pos_ < source_.size() && source_[pos_] != '\n') {
            Advance();
        }
    }

    void Continuation() {
        const SourcePos pos = Here();
        Advance();
        if (pos_ < source_.size() && source_[pos_] == '\r') {
            Advance();
        }
        if (pos_ >= source_.size() || source_[pos_] != '\n') {
            throw SyntaxError("unexpected character after line continuation character", pos);
        }
        Advance();
    }

    void Number() {
        const SourcePos pos = Here();
        const std::size_t start = pos_;
        std::string digits;
        int base = 10;
        bool is_float = false;
        if (source_[pos_] == '0' && pos_ + 1 < source_.size()) {
            const char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(source_[pos_ + 1])));
            if (prefix == 'x' || prefix == 'o' || prefix == 'b') {
                base = prefix == 'x' ? 16 : (prefix == 'o' ? 8 : 2);
                Advance();
                Advance();
            }
        }
        auto take_digits = [&](bool allow_hex) {
            bool last_underscore = false;
            while (pos_ < source_.size()) {
                const char c = source_[pos_];
                if (c == '_') {
                    if (last_underscore || digits.empty()) {
                        throw SyntaxError("invalid decimal literal", pos);
                    }
                    last_underscore = true;
                    Advance();
                    continue;
                }
                const bool ok = allow_hex ? std::isxdigit(static_cast<unsigned char>(c))
                                          : std::isdigit(static_cast<unsigned char>(c));
                if (!ok) {
                    break;
                }
                last_underscore = false;
                digits.push_back(c);
                Advance();
            }
            if (last_underscore) {
                throw SyntaxError("invalid decimal literal", pos);
            }
        };
        if (base != 10) {
            take_digits(base == 16);
            if (digits.empty()) {
                throw SyntaxError("invalid numeric literal", pos);
            }
        } else {
            take_digits(false);
            if (pos_ < source_.size() && source_[pos_] == '.' &&
                !(pos_ + 1 < source_.size() && std::isalpha(static_cast<unsigned char>(source_[pos_ + 1])) &&
                  source_[pos_ + 1] != 'e' && source_[pos_ + 1] != 'E')) {
                is_float = true;
                digits.push_back('.');
                Advance();
                const std::size_t before = digits.size();
                take_digits(false);
                if (digits.size() == before) {
                    digits.push_back('0');
                }
            }
            if (pos_ < source_.size() && (source_[pos_] == 'e' || source_[pos_] == 'E')) {
                is_float = true;
                digits.push_back('e');
                Advance();
                if (pos_ < source_.size() && (source_[pos_] == '+' || source_[pos_] == '-')) {
                    digits.push_back(source_[pos_]);
                    Advance();
                }
                const std::size_t before = digits.size();
                take_digits(false);
                if (digits.size() == before) {
                    throw SyntaxError("invalid float literal", pos);
                }
            }
        }
        if (pos_ < source_.size() &&
            (std::isalpha(static_cast<unsigned char>(source_[pos_])) || source_[pos_] == '_')) {
            throw SyntaxError("invalid numeric literal", pos);
        }
        Token token;
        token.pos = pos;
        token.text = std::string(source_.substr(start, pos_ - start));
        if (is_float) {
            token.kind = TokenKind::kFloat;
            char* end = nullptr;
            token.float_value = std::strtod(digits.c_str(), &end);
        } else {
            token.kind = TokenKind::kInt;
            std::int64_t value = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
            if (ec != std::errc() || ptr != digits.data() + digits.size()) {
                throw SyntaxError("integer literal too large", pos);
            }
            token.int_value = value;
        }
        tokens_.push_back(std::move(token));
    }

    bool IsStringStart() const {
        const char c = source_[pos_];
        if (c == '\'' || c == '"') {
            return true;
        }
        if ((c == 'r' || c == 'R' || c == 'f' || c == 'F' || c == 'b' || c == 'B') &&
            pos_ + 1 < source_.size() && (source_[pos_ + 1] == '\'' || source_[pos_ + 1] == '"')) {
            return true;
        }
        return false;
    }

    static void AppendUtf8(std::string& out, std::uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::uint32_t HexEscape(int count, SourcePos pos) {
        std::uint32_t value = 0;
        for (int i = 0; i < count; ++i) {
            if (pos_ >= source_.size() || !std::isxdigit(static_cast<unsigned char>(source_[pos_]))) {
                throw SyntaxError("truncated escape sequence", pos);
            }
            const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(source_[pos_])));
            value = value * 16 + static_cast<std::uint32_t>(std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : c - 'a' + 10);
            Advance();
        }
        return value;
    }

    void String() {
        const SourcePos pos = Here();
        bool raw = false;
        const char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(source_[pos_])));
        if (prefix == 'f' || prefix == 'b') {
            throw SyntaxError(prefix == 'f' ? "f-strings are not supported" : "bytes literals are not supported", pos);
        }
        if (prefix == 'r') {
            raw = true;
            Advance();
        }
        const char quote = source_[pos_];
        const bool triple = pos_ + 2 < source_.size() && source_[pos_ + 1] == quote && source_[pos_ + 2] == quote;
        Advance();
        if (triple) {
            Advance();
            Advance();
        }
        std::string value;
        while (true) {
            if (pos_ >= source_.size()) {
                throw SyntaxError("unterminated string literal", pos);
            }
            const char c = source_[pos_];
            if (c == quote) {
                if (!triple) {
                    Advance();
                    break;
                }
                if (pos_ + 2 < source_.size() && source_[pos_ + 1] == quote && source_[pos_ + 2] == quote) {
                    Advance();
                    Advance();
                    Advance();
                    break;
                }
            }
            if (c == '\n' && !triple) {
                throw SyntaxError("unterminated string literal", pos);
            }
            if (c == '\\' && !raw) {
                Advance();
                if (pos_ >= source_.size()) {
                    throw SyntaxError("unterminated string literal", pos);
                }
                const char e = source_[pos_];
                Advance();
                switch (e) {
                    case 'n': value.push_back('\n'); break;
                    case 't': value.push_back('\t'); break;
                    case 'r': value.push_back('\r'); break;
                    case '0': value.push_back('\0'); break;
                    case 'a': value.push_back('\a'); break;
                    case 'b': value.push_back('\b'); break;
                    case 'f': value.push_back('\f'); break;
                    case 'v': value.push_back('\v'); break;
                    case '\\': value.push_back('\\'); break;
                    case '\'': value.push_back('\''); break;
                    case '"': value.push_back('"'); break;
                    case '\n': break;
                    case 'x': AppendUtf8(value, HexEscape(2, pos)); break;
                    case 'u': AppendUtf8(value, HexEscape(4, pos)); break;
                    case 'U': {
                        const auto cp = HexEscape(8, pos);
                        if (cp > 0x10FFFF) {
                            throw SyntaxError("illegal Unicode character", pos);
                        }
                        AppendUtf8(value, cp);
                        break;
                    }
                    default:
                        value.push_back('\\');
                        value.push_back(e);
                        break;
                }
                continue;
            }
            value.push_back(c);
            Advance();
        }
        Token token;
        token.kind = TokenKind::kString;
        token.text = std::move(value);
        token.pos = pos;
        tokens_.push_back(std::move(token));
    }

    void Word() {
        const SourcePos pos = Here();
        const std::size_t start = pos_;
        while (pos_ < source_.size() &&
               (std::isalnum(static_cast<unsigned char>(source_[pos_])) || source_[pos_] == '_')) {
            Advance();
        }
        std::string word(source_.substr(start, pos_ - start));
        const auto kind = IsKeyword(word) ? TokenKind::kKeyword : TokenKind::kName;
        Emit(kind, std::move(word), pos);
    }

    void Operator() {
        const SourcePos pos = Here();
        for (const auto op : kOperators) {
            if (source_.substr(pos_, op.size()) == op) {
                for (std::size_t i = 0; i < op.size(); ++i) {
                    Advance();
                }
                if (op == "(" || op == "[" || op == "{") {
                    ++depth_;
                } else if (op == ")" || op == "]" || op == "}") {
                    if (depth_ == 0) {
                        throw SyntaxError("unmatched '" + std::string(op) + "'", pos);
                    }
                    --depth_;
                }
                Emit(TokenKind::kOp, std::string(op), pos);
                return;
            }
        }
        const unsigned char c = static_cast<unsigned char>(source_[pos_]);
        if (c >= 0x80) {
            throw SyntaxError("non-ASCII character outside a string literal", pos);
        }
        throw SyntaxError(std::string("invalid character '") + source_[pos_] + "'", pos);
    }

    std::string_view source_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
    int depth_ = 0;
    bool at_line_start_ = true;
    std::vector<int> indents_;
    std::vector<Token> tokens_;
};

}  // namespace

const char* ToString(TokenKind kind) {
    switch (kind) {
        case TokenKind::kName: return "name";
        case TokenKind::kKeyword: return "keyword";
        case TokenKind::kInt: return "integer";
        case TokenKind::kFloat: return "float";
        case TokenKind::kString: return "string";
        case TokenKind::kOp: return "operator";
        case TokenKind::kNewline: return "newline";
        case TokenKind::kIndent: return "indent";
        case TokenKind::kDedent: return "dedent";
        case TokenKind::kEnd: return "end of input";
    }
    return "token";
}

bool IsKeyword(std::string_view word) {
    for (const auto keyword : kKeywords) {
        if (keyword == word) {
            return true;
        }
    }
    return false;
}

std::vector<Token> Tokenize(std::string_view source) {
    return Lexer(source).Run();
}

}  // namespace warden::script
