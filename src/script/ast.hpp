#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "script/errors.hpp"

namespace warden::script {

enum class NodeKind {
    // expressions
    kName,
    kConstant,
    kList,
    kTuple,
    kDict,
    kUnary,
    kBinary,
    kBoolOp,
    kCompare,
    kCall,
    kAttribute,
    kSubscript,
    kSlice,
    kConditional,
    kListComp,
    // statements
    kExprStmt,
    kAssign,
    kAugAssign,
    kIf,
    kWhile,
    kFor,
    kBreak,
    kContinue,
    kPass,
    kFunctionDef,
    kReturn,
    kImport,
    kImportFrom,
    kRaise,
    kTry,
    kModule
};

const char* ToString(NodeKind kind);

struct Node {
    explicit Node(NodeKind k, SourcePos p) : kind(k), pos(p) {}
    virtual ~Node() = default;

    NodeKind kind;
    SourcePos pos;
};

using NodePtr = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;

using Constant = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

struct NameExpr : Node {
    NameExpr(SourcePos p, std::string n) : Node(NodeKind::kName, p), id(std::move(n)) {}
    std::string id;
};

struct ConstantExpr : Node {
    ConstantExpr(SourcePos p, Constant v) : Node(NodeKind::kConstant, p), value(std::move(v)) {}
    Constant value;
};

// kList and kTuple share a representation.
struct SequenceExpr : Node {
    using Node::Node;
    NodeList elements;
};

struct DictExpr : Node {
    explicit DictExpr(SourcePos p) : Node(NodeKind::kDict, p) {}
    NodeList keys;
    NodeList values;
};

struct UnaryExpr : Node {
    UnaryExpr(SourcePos p, std::string o, NodePtr v)
        : Node(NodeKind::kUnary, p), op(std::move(o)), operand(std::move(v)) {}
    std::string op;
    NodePtr operand;
};

struct BinaryExpr : Node {
    BinaryExpr(SourcePos p, std::string o, NodePtr l, NodePtr r)
        : Node(NodeKind::kBinary, p), op(std::move(o)), left(std::move(l)), right(std::move(r)) {}
    std::string op;
    NodePtr left;
    NodePtr right;
};

struct BoolOpExpr : Node {
    BoolOpExpr(SourcePos p, std::string o) : Node(NodeKind::kBoolOp, p), op(std::move(o)) {}
    std::string op;
    NodeList values;
};

struct CompareExpr : Node {
    CompareExpr(SourcePos p, NodePtr l) : Node(NodeKind::kCompare, p), left(std::move(l)) {}
    NodePtr left;
    std::vector<std::string> ops;
    NodeList comparators;
};

struct Keyword {
    std::string name;
    SourcePos pos;
    NodePtr value;
};

struct CallExpr : Node {
    CallExpr(SourcePos p, NodePtr f) : Node(NodeKind::kCall, p), func(std::move(f)) {}
    NodePtr func;
    NodeList args;
    std::vector<Keyword> keywords;
};

struct AttributeExpr : Node {
    AttributeExpr(SourcePos p, NodePtr v, std::string a)
        : Node(NodeKind::kAttribute, p), value(std::move(v)), attr(std::move(a)) {}
    NodePtr value;
    std::string attr;
};

struct SubscriptExpr : Node {
    SubscriptExpr(SourcePos p, NodePtr v, NodePtr i)
        : Node(NodeKind::kSubscript, p), value(std::move(v)), index(std::move(i)) {}
    NodePtr value;
    NodePtr index;
};

// Any bound may be null.
struct SliceExpr : Node {
    explicit SliceExpr(SourcePos p) : Node(NodeKind::kSlice, p) {}
    NodePtr lower;
    NodePtr upper;
    NodePtr step;
};

struct ConditionalExpr : Node {
    explicit ConditionalExpr(SourcePos p) : Node(NodeKind::kConditional, p) {}
    NodePtr test;
    NodePtr body;
    NodePtr orelse;
};

struct ListCompExpr : Node {
    explicit ListCompExpr(SourcePos p) : Node(NodeKind::kListComp, p) {}
    NodePtr element;
    NodePtr target;
    NodePtr iter;
    NodeList conditions;
};

struct ExprStmt : Node {
    ExprStmt(SourcePos p, NodePtr v) : Node(NodeKind::kExprStmt, p), value(std::move(v)) {}
    NodePtr value;
};

// a = b = value
struct AssignStmt : Node {
    explicit AssignStmt(SourcePos p) : Node(NodeKind::kAssign, p) {}
    NodeList targets;
    NodePtr value;
};

struct AugAssignStmt : Node {
    AugAssignStmt(SourcePos p, NodePtr t, std::string o, NodePtr v)
        : Node(NodeKind::kAugAssign, p), target(std::move(t)), op(std::move(o)), value(std::move(v)) {}
    NodePtr target;
    std::string op;  // binary operator without '='
    NodePtr value;
};

struct IfStmt : Node {
    explicit IfStmt(SourcePos p) : Node(NodeKind::kIf, p) {}
    NodePtr test;
    NodeList body;
    NodeList orelse;
};

struct WhileStmt : Node {
    explicit WhileStmt(SourcePos p) : Node(NodeKind::kWhile, p) {}
    NodePtr test;
    NodeList body;
};

struct ForStmt : Node {
    explicit ForStmt(SourcePos p) : Node(NodeKind::kFor, p) {}
    NodePtr target;
    NodePtr iter;
    NodeList body;
};

struct Parameter {
    std::string name;
    SourcePos pos;
    NodePtr default_value;
};

struct FunctionDef : Node {
    FunctionDef(SourcePos p, std::string n) : Node(NodeKind::kFunctionDef, p), name(std::move(n)) {}
    std::string name;
    std::vector<Parameter> params;
    NodeList body;
};

struct ReturnStmt : Node {
    explicit ReturnStmt(SourcePos p) : Node(NodeKind::kReturn, p) {}
    NodePtr value;
};

struct ImportAlias {
    std::string name;    // dotted module name or imported member
    std::string asname;  // empty when not aliased
    SourcePos pos;
};

struct ImportStmt : Node {
    explicit ImportStmt(SourcePos p) : Node(NodeKind::kImport, p) {}
    std::vector<ImportAlias> names;
};

struct ImportFromStmt : Node {
    explicit ImportFromStmt(SourcePos p) : Node(NodeKind::kImportFrom, p) {}
    std::string module;
    int level = 0;  // leading dots
    std::vector<ImportAlias> names;
};

struct RaiseStmt : Node {
    explicit RaiseStmt(SourcePos p) : Node(NodeKind::kRaise, p) {}
    NodePtr exception;
};

struct ExceptHandler {
    SourcePos pos;
    std::string type_name;  // empty catches everything
    std::string binding;
    NodeList body;
};

struct TryStmt : Node {
    explicit TryStmt(SourcePos p) : Node(NodeKind::kTry, p) {}
    NodeList body;
    std::vector<ExceptHandler> handlers;
    NodeList orelse;
};

struct Module : Node {
    Module() : Node(NodeKind::kModule, SourcePos{}) {}
    NodeList body;
};

// Calls visit for node and every node beneath it, parents first.
void Walk(const Node& node, const std::function<void(const Node&)>& visit);

std::size_t CountNodes(const Node& node);

}  // namespace warden::script
