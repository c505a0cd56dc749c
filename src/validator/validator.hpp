#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace warden::validator {

struct ValidationIssue {
    // 0 when the issue concerns the submission as a whole.
    int line = 0;
    int column = 0;
    std::string message;
};

struct ValidationResult {
    bool valid = true;
    std::vector<ValidationIssue> errors;

    std::vector<std::string> Messages() const;
};

struct ValidatorOptions {
    std::vector<std::string> allowed_imports;
    std::size_t max_code_bytes = 64 * 1024;
    std::size_t max_ast_nodes = 5000;
    std::string reserved_prefix = "_";
    int max_nesting_depth = 200;
};

// Names that give scripts dynamic evaluation or introspection in general
// purpose runtimes. None of them exist in the sandbox, but a submission that
// reaches for them is rejected up front.
const std::vector<std::string>& DynamicBuiltinNames();

// Static gate run before any worker is spawned. Stateless and free of I/O.
class Validator {
public:
    explicit Validator(ValidatorOptions options);

    ValidationResult Validate(std::string_view code) const;

    const ValidatorOptions& options() const { return options_; }

private:
    ValidatorOptions options_;
};

}  // namespace warden::validator
