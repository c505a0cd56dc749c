#include "validator/validator.hpp"

#include <algorithm>
#include <string>

#include <gtest/gtest.h>

namespace warden::validator {
namespace {

ValidatorOptions DefaultOptions() {
    ValidatorOptions options;
    options.allowed_imports = {"json", "math", "re", "string"};
    return options;
}

bool HasMessage(const ValidationResult& result, const std::string& message) {
    const auto messages = result.Messages();
    return std::find(messages.begin(), messages.end(), message) != messages.end();
}

TEST(ValidatorTest, AcceptsPlainScript) {
    Validator validator(DefaultOptions());
    const auto result = validator.Validate("import json\nresult = json.dumps({'a': 1})\n");
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST(ValidatorTest, RejectsImportOutsideAllowList) {
    Validator validator(DefaultOptions());
    const auto result = validator.Validate("import os\n");
    ASSERT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "import of 'os' not allowed");
    EXPECT_EQ(result.errors[0].line, 1);
}

TEST(ValidatorTest, RequiresFullDottedNameInAllowList) {
    Validator validator(DefaultOptions());
    EXPECT_TRUE(HasMessage(validator.Validate("import json.decoder\n"), "import of 'json.decoder' not allowed"));
    EXPECT_TRUE(HasMessage(validator.Validate("from os import path\n"), "import of 'os' not allowed"));
}

TEST(ValidatorTest, RejectsRelativeImport) {
    Validator validator(DefaultOptions());
    EXPECT_TRUE(HasMessage(validator.Validate("from . import json\n"), "relative import not allowed"));
}

TEST(ValidatorTest, RejectsReservedPrefix) {
    Validator validator(DefaultOptions());
    const auto result = validator.Validate("x = ().__class__.__bases__\n");
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(HasMessage(result, "name '__class__' uses reserved prefix '_'"));
    EXPECT_TRUE(HasMessage(result, "name '__bases__' uses reserved prefix '_'"));
}

TEST(ValidatorTest, RejectsReservedNamesInEveryBindingPosition) {
    Validator validator(DefaultOptions());
    EXPECT_FALSE(validator.Validate("def _helper():\n    pass\n").valid);
    EXPECT_FALSE(validator.Validate("def f(_x):\n    pass\n").valid);
    EXPECT_FALSE(validator.Validate("print(1, _sep=' ')\n").valid);
    EXPECT_FALSE(validator.Validate("import json as _j\n").valid);
    EXPECT_FALSE(validator.Validate("try:\n    pass\nexcept Exception as _e:\n    pass\n").valid);
}

TEST(ValidatorTest, RejectsDynamicBuiltins) {
    Validator validator(DefaultOptions());
    for (const auto& name : DynamicBuiltinNames()) {
        if (name.front() == '_') {
            continue;
        }
        const auto result = validator.Validate("x = " + name + "\n");
        EXPECT_TRUE(HasMessage(result, "use of '" + name + "' not allowed")) << name;
    }
}

TEST(ValidatorTest, ReportsSyntaxErrorPosition) {
    Validator validator(DefaultOptions());
    const auto result = validator.Validate("x = 1\nif x\n    pass\n");
    ASSERT_FALSE(result.valid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].line, 2);
    EXPECT_EQ(result.errors[0].message.rfind("syntax error: ", 0), 0u);
}

TEST(ValidatorTest, RejectsOversizedCodeBeforeParsing) {
    auto options = DefaultOptions();
    options.max_code_bytes = 16;
    Validator validator(options);
    // Would also be a syntax error; size is checked first.
    const auto result = validator.Validate("x = (((((((((((((((\n");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].message, "code size 20 bytes exceeds limit of 16 bytes");
    EXPECT_EQ(result.errors[0].line, 0);
}

TEST(ValidatorTest, AcceptsCodeExactlyAtSizeLimit) {
    auto options = DefaultOptions();
    options.max_code_bytes = 6;
    Validator validator(options);
    EXPECT_TRUE(validator.Validate("x = 1\n").valid);
}

TEST(ValidatorTest, BoundsSyntaxTreeSize) {
    auto options = DefaultOptions();
    options.max_ast_nodes = 4;
    Validator validator(options);
    // assign, name, binary, constant, constant
    const auto result = validator.Validate("x = 1 + 2\n");
    ASSERT_FALSE(result.valid);
    EXPECT_TRUE(HasMessage(result, "syntax tree has 5 nodes, limit is 4"));

    options.max_ast_nodes = 5;
    EXPECT_TRUE(Validator(options).Validate("x = 1 + 2\n").valid);
}

TEST(ValidatorTest, OrdersIssuesBySourcePosition) {
    Validator validator(DefaultOptions());
    const auto result = validator.Validate("import os\nx = eval\nimport sys\n");
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].line, 1);
    EXPECT_EQ(result.errors[1].line, 2);
    EXPECT_EQ(result.errors[2].line, 3);
    EXPECT_EQ(result.errors[2].message, "import of 'sys' not allowed");
}

TEST(ValidatorTest, IsDeterministic) {
    Validator validator(DefaultOptions());
    const std::string code = "import os\nx = _y\n";
    EXPECT_EQ(validator.Validate(code).Messages(), validator.Validate(code).Messages());
}

}  // namespace
}  // namespace warden::validator
