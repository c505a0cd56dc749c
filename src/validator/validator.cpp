#include "validator/validator.hpp"

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "script/ast.hpp"
#include "script/errors.hpp"
#include "script/parser.hpp"
#include "utils/common.hpp"

namespace warden::validator {
namespace {

using script::Node;
using script::NodeKind;
using script::SourcePos;

class TreeScanner {
public:
    TreeScanner(const ValidatorOptions& options, std::vector<ValidationIssue>& issues)
        : options_(options), issues_(issues) {}

    void Scan(const Node& root) {
        script::Walk(root, [this](const Node& node) { Visit(node); });
    }

private:
    void Visit(const Node& node) {
        switch (node.kind) {
            case NodeKind::kName: {
                const auto& name = static_cast<const script::NameExpr&>(node);
                CheckName(name.id, node.pos);
                CheckDynamic(name.id, node.pos);
                break;
            }
            case NodeKind::kAttribute:
                CheckName(static_cast<const script::AttributeExpr&>(node).attr, node.pos);
                break;
            case NodeKind::kCall:
                for (const auto& keyword : static_cast<const script::CallExpr&>(node).keywords) {
                    CheckName(keyword.name, keyword.pos);
                }
                break;
            case NodeKind::kFunctionDef: {
                const auto& def = static_cast<const script::FunctionDef&>(node);
                CheckName(def.name, node.pos);
                CheckDynamic(def.name, node.pos);
                for (const auto& param : def.params) {
                    CheckName(param.name, param.pos);
                }
                break;
            }
            case NodeKind::kImport:
                for (const auto& alias : static_cast<const script::ImportStmt&>(node).names) {
                    CheckModule(alias.name, alias.pos);
                    CheckAlias(alias);
                }
                break;
            case NodeKind::kImportFrom: {
                const auto& stmt = static_cast<const script::ImportFromStmt&>(node);
                if (stmt.level > 0) {
                    Report(node.pos, "relative import not allowed");
                } else {
                    CheckModule(stmt.module, node.pos);
                }
                for (const auto& alias : stmt.names) {
                    CheckName(alias.name, alias.pos);
                    CheckAlias(alias);
                }
                break;
            }
            case NodeKind::kTry:
                for (const auto& handler : static_cast<const script::TryStmt&>(node).handlers) {
                    if (!handler.type_name.empty()) {
                        CheckName(handler.type_name, handler.pos);
                    }
                    if (!handler.binding.empty()) {
                        CheckName(handler.binding, handler.pos);
                    }
                }
                break;
            default:
                break;
        }
    }

    void CheckName(const std::string& name, SourcePos pos) {
        if (utils::StartsWith(name, options_.reserved_prefix)) {
            Report(pos, "name '" + name + "' uses reserved prefix '" + options_.reserved_prefix + "'");
        }
    }

    void CheckDynamic(const std::string& name, SourcePos pos) {
        const auto& names = DynamicBuiltinNames();
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            Report(pos, "use of '" + name + "' not allowed");
        }
    }

    void CheckAlias(const script::ImportAlias& alias) {
        if (!alias.asname.empty()) {
            CheckName(alias.asname, alias.pos);
        }
    }

    // Dotted names pass only when spelled out in full in the allow-list.
    void CheckModule(const std::string& module, SourcePos pos) {
        std::stringstream parts(module);
        std::string part;
        while (std::getline(parts, part, '.')) {
            CheckName(part, pos);
        }
        const auto& allowed = options_.allowed_imports;
        if (std::find(allowed.begin(), allowed.end(), module) == allowed.end()) {
            Report(pos, "import of '" + module + "' not allowed");
        }
    }

    void Report(SourcePos pos, std::string message) {
        issues_.push_back(ValidationIssue{pos.line, pos.column, std::move(message)});
    }

    const ValidatorOptions& options_;
    std::vector<ValidationIssue>& issues_;
};

}  // namespace

std::vector<std::string> ValidationResult::Messages() const {
    std::vector<std::string> messages;
    messages.reserve(errors.size());
    for (const auto& issue : errors) {
        messages.push_back(issue.message);
    }
    return messages;
}

const std::vector<std::string>& DynamicBuiltinNames() {
    static const std::vector<std::string> kNames = {
        "eval", "exec", "compile", "getattr", "setattr", "delattr", "globals",
        "locals", "vars", "open", "type", "dir", "__import__", "importlib",
        "input", "breakpoint", "memoryview", "object", "super", "help"
    };
    return kNames;
}

Validator::Validator(ValidatorOptions options) : options_(std::move(options)) {}

ValidationResult Validator::Validate(std::string_view code) const {
    ValidationResult result;
    if (code.size() > options_.max_code_bytes) {
        result.valid = false;
        result.errors.push_back(ValidationIssue{
            0, 0,
            "code size " + std::to_string(code.size()) + " bytes exceeds limit of " +
                std::to_string(options_.max_code_bytes) + " bytes"});
        return result;
    }

    std::unique_ptr<script::Module> module;
    try {
        script::ParseOptions parse_options;
        parse_options.max_nesting_depth = options_.max_nesting_depth;
        module = script::Parse(code, parse_options);
    } catch (const script::SyntaxError& ex) {
        result.valid = false;
        result.errors.push_back(ValidationIssue{
            ex.pos().line, ex.pos().column, std::string("syntax error: ") + ex.what()});
        return result;
    }

    // The module node itself is not counted.
    const auto nodes = script::CountNodes(*module) - 1;
    if (nodes > options_.max_ast_nodes) {
        result.errors.push_back(ValidationIssue{
            0, 0,
            "syntax tree has " + std::to_string(nodes) + " nodes, limit is " +
                std::to_string(options_.max_ast_nodes)});
    }

    TreeScanner scanner(options_, result.errors);
    scanner.Scan(*module);

    std::stable_sort(result.errors.begin(), result.errors.end(),
                     [](const ValidationIssue& a, const ValidationIssue& b) {
                         if (a.line != b.line) {
                             return a.line < b.line;
                         }
                         return a.column < b.column;
                     });
    result.valid = result.errors.empty();
    return result;
}

}  // namespace warden::validator
