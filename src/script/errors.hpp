#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace warden::script {

struct SourcePos {
    int line = 1;
    int column = 1;
};

// Malformed source text. Raised by the lexer and parser.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, SourcePos pos)
        : std::runtime_error(message), pos_(pos) {}

    SourcePos pos() const { return pos_; }

private:
    SourcePos pos_;
};

// An exception raised by running script code. Script try/except can observe it.
class ScriptError : public std::runtime_error {
public:
    ScriptError(std::string type_name, const std::string& message, int line = 0)
        : std::runtime_error(message), type_name_(std::move(type_name)), line_(line) {}

    const std::string& type_name() const { return type_name_; }
    int line() const { return line_; }
    void set_line(int line) { line_ = line; }

private:
    std::string type_name_;
    int line_;
};

// A guard hook refused an access. Never catchable from script code.
class SecurityViolation : public std::runtime_error {
public:
    explicit SecurityViolation(const std::string& message, int line = 0)
        : std::runtime_error(message), line_(line) {}

    int line() const { return line_; }
    void set_line(int line) { line_ = line; }

private:
    int line_;
};

// A script asked for more memory than the sandbox allows.
class ResourceExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The runtime was constructed without one of its mandatory guard hooks.
class GuardConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace warden::script
