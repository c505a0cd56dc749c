#include "script/parser.hpp"

#include <string>

#include <gtest/gtest.h>

namespace warden::script {
namespace {

SourcePos ErrorPosition(const std::string& source) {
    try {
        Parse(source);
    } catch (const SyntaxError& ex) {
        return ex.pos();
    }
    ADD_FAILURE() << "no syntax error for: " << source;
    return {};
}

TEST(ParserTest, ParsesFunctionWithDefaults) {
    const auto module = Parse("def add(a, b=2):\n    return a + b\n");
    ASSERT_EQ(module->body.size(), 1u);
    ASSERT_EQ(module->body[0]->kind, NodeKind::kFunctionDef);
    const auto& def = static_cast<const FunctionDef&>(*module->body[0]);
    EXPECT_EQ(def.name, "add");
    ASSERT_EQ(def.params.size(), 2u);
    EXPECT_EQ(def.params[0].default_value, nullptr);
    EXPECT_NE(def.params[1].default_value, nullptr);
    ASSERT_EQ(def.body.size(), 1u);
    EXPECT_EQ(def.body[0]->kind, NodeKind::kReturn);
}

TEST(ParserTest, ParsesChainedAssignmentAndComparison) {
    const auto module = Parse("a = b = 1 < 2 < 3\n");
    ASSERT_EQ(module->body.size(), 1u);
    const auto& assign = static_cast<const AssignStmt&>(*module->body[0]);
    EXPECT_EQ(assign.targets.size(), 2u);
    ASSERT_EQ(assign.value->kind, NodeKind::kCompare);
    EXPECT_EQ(static_cast<const CompareExpr&>(*assign.value).ops.size(), 2u);
}

TEST(ParserTest, RecordsRelativeImportLevel) {
    const auto module = Parse("from .. import helpers\n");
    const auto& stmt = static_cast<const ImportFromStmt&>(*module->body[0]);
    EXPECT_EQ(stmt.level, 2);
    EXPECT_TRUE(stmt.module.empty());
    ASSERT_EQ(stmt.names.size(), 1u);
    EXPECT_EQ(stmt.names[0].name, "helpers");
}

TEST(ParserTest, KeepsDottedImportNames) {
    const auto module = Parse("import os.path as p\n");
    const auto& stmt = static_cast<const ImportStmt&>(*module->body[0]);
    ASSERT_EQ(stmt.names.size(), 1u);
    EXPECT_EQ(stmt.names[0].name, "os.path");
    EXPECT_EQ(stmt.names[0].asname, "p");
}

TEST(ParserTest, ParsesTryWithHandlers) {
    const auto module = Parse(
        "try:\n"
        "    x = 1\n"
        "except ValueError as e:\n"
        "    x = 2\n"
        "except:\n"
        "    x = 3\n"
        "else:\n"
        "    x = 4\n");
    const auto& stmt = static_cast<const TryStmt&>(*module->body[0]);
    ASSERT_EQ(stmt.handlers.size(), 2u);
    EXPECT_EQ(stmt.handlers[0].type_name, "ValueError");
    EXPECT_EQ(stmt.handlers[0].binding, "e");
    EXPECT_TRUE(stmt.handlers[1].type_name.empty());
    EXPECT_EQ(stmt.orelse.size(), 1u);
}

TEST(ParserTest, CountsEveryNode) {
    // module, assign, name, binary, constant, constant
    const auto module = Parse("x = 1 + 2\n");
    EXPECT_EQ(CountNodes(*module), 6u);
}

TEST(ParserTest, RejectsUnsupportedConstructs) {
    EXPECT_THROW(Parse("class A:\n    pass\n"), SyntaxError);
    EXPECT_THROW(Parse("f = lambda x: x\n"), SyntaxError);
    EXPECT_THROW(Parse("with x:\n    pass\n"), SyntaxError);
    EXPECT_THROW(Parse("from json import *\n"), SyntaxError);
    EXPECT_THROW(Parse("def f(*args):\n    pass\n"), SyntaxError);
}

TEST(ParserTest, RejectsMisplacedControlFlow) {
    EXPECT_THROW(Parse("break\n"), SyntaxError);
    EXPECT_THROW(Parse("return 1\n"), SyntaxError);
}

TEST(ParserTest, ReportsErrorPosition) {
    const auto pos = ErrorPosition("x = 1\ny = (2 +\n");
    EXPECT_EQ(pos.line, 3);
    const auto bad = ErrorPosition("x = 1\ny = 2 3\n");
    EXPECT_EQ(bad.line, 2);
    EXPECT_EQ(bad.column, 7);
}

TEST(ParserTest, BoundsNesting) {
    std::string deep = "x = ";
    for (int i = 0; i < 50; ++i) {
        deep += "[";
    }
    for (int i = 0; i < 50; ++i) {
        deep += "]";
    }
    deep += "\n";
    ParseOptions options;
    options.max_nesting_depth = 20;
    EXPECT_THROW(Parse(deep, options), SyntaxError);
    EXPECT_NO_THROW(Parse(deep));
}

}  // namespace
}  // namespace warden::script
