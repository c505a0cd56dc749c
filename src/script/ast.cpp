#include "script/ast.hpp"

namespace warden::script {
namespace {

void WalkList(const NodeList& nodes, const std::function<void(const Node&)>& visit) {
    for (const auto& child : nodes) {
        if (child) {
            Walk(*child, visit);
        }
    }
}

void WalkOptional(const NodePtr& node, const std::function<void(const Node&)>& visit) {
    if (node) {
        Walk(*node, visit);
    }
}

}  // namespace

const char* ToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::kName: return "Name";
        case NodeKind::kConstant: return "Constant";
        case NodeKind::kList: return "List";
        case NodeKind::kTuple: return "Tuple";
        case NodeKind::kDict: return "Dict";
        case NodeKind::kUnary: return "UnaryOp";
        case NodeKind::kBinary: return "BinOp";
        case NodeKind::kBoolOp: return "BoolOp";
        case NodeKind::kCompare: return "Compare";
        case NodeKind::kCall: return "Call";
        case NodeKind::kAttribute: return "Attribute";
        case NodeKind::kSubscript: return "Subscript";
        case NodeKind::kSlice: return "Slice";
        case NodeKind::kConditional: return "IfExp";
        case NodeKind::kListComp: return "ListComp";
        case NodeKind::kExprStmt: return "Expr";
        case NodeKind::kAssign: return "Assign";
        case NodeKind::kAugAssign: return "AugAssign";
        case NodeKind::kIf: return "If";
        case NodeKind::kWhile: return "While";
        case NodeKind::kFor: return "For";
        case NodeKind::kBreak: return "Break";
        case NodeKind::kContinue: return "Continue";
        case NodeKind::kPass: return "Pass";
        case NodeKind::kFunctionDef: return "FunctionDef";
        case NodeKind::kReturn: return "Return";
        case NodeKind::kImport: return "Import";
        case NodeKind::kImportFrom: return "ImportFrom";
        case NodeKind::kRaise: return "Raise";
        case NodeKind::kTry: return "Try";
        case NodeKind::kModule: return "Module";
    }
    return "Node";
}

void Walk(const Node& node, const std::function<void(const Node&)>& visit) {
    visit(node);
    switch (node.kind) {
        case NodeKind::kName:
        case NodeKind::kConstant:
        case NodeKind::kBreak:
        case NodeKind::kContinue:
        case NodeKind::kPass:
        case NodeKind::kImport:
        case NodeKind::kImportFrom:
            break;
        case NodeKind::kList:
        case NodeKind::kTuple:
            WalkList(static_cast<const SequenceExpr&>(node).elements, visit);
            break;
        case NodeKind::kDict: {
            const auto& dict = static_cast<const DictExpr&>(node);
            for (std::size_t i = 0; i < dict.keys.size(); ++i) {
                WalkOptional(dict.keys[i], visit);
                WalkOptional(dict.values[i], visit);
            }
            break;
        }
        case NodeKind::kUnary:
            WalkOptional(static_cast<const UnaryExpr&>(node).operand, visit);
            break;
        case NodeKind::kBinary: {
            const auto& binary = static_cast<const BinaryExpr&>(node);
            WalkOptional(binary.left, visit);
            WalkOptional(binary.right, visit);
            break;
        }
        case NodeKind::kBoolOp:
            WalkList(static_cast<const BoolOpExpr&>(node).values, visit);
            break;
        case NodeKind::kCompare: {
            const auto& compare = static_cast<const CompareExpr&>(node);
            WalkOptional(compare.left, visit);
            WalkList(compare.comparators, visit);
            break;
        }
        case NodeKind::kCall: {
            const auto& call = static_cast<const CallExpr&>(node);
            WalkOptional(call.func, visit);
            WalkList(call.args, visit);
            for (const auto& keyword : call.keywords) {
                WalkOptional(keyword.value, visit);
            }
            break;
        }
        case NodeKind::kAttribute:
            WalkOptional(static_cast<const AttributeExpr&>(node).value, visit);
            break;
        case NodeKind::kSubscript: {
            const auto& subscript = static_cast<const SubscriptExpr&>(node);
            WalkOptional(subscript.value, visit);
            WalkOptional(subscript.index, visit);
            break;
        }
        case NodeKind::kSlice: {
            const auto& slice = static_cast<const SliceExpr&>(node);
            WalkOptional(slice.lower, visit);
            WalkOptional(slice.upper, visit);
            WalkOptional(slice.step, visit);
            break;
        }
        case NodeKind::kConditional: {
            const auto& conditional = static_cast<const ConditionalExpr&>(node);
            WalkOptional(conditional.test, visit);
            WalkOptional(conditional.body, visit);
            WalkOptional(conditional.orelse, visit);
            break;
        }
        case NodeKind::kListComp: {
            const auto& comp = static_cast<const ListCompExpr&>(node);
            WalkOptional(comp.element, visit);
            WalkOptional(comp.target, visit);
            WalkOptional(comp.iter, visit);
            WalkList(comp.conditions, visit);
            break;
        }
        case NodeKind::kExprStmt:
            WalkOptional(static_cast<const ExprStmt&>(node).value, visit);
            break;
        case NodeKind::kAssign: {
            const auto& assign = static_cast<const AssignStmt&>(node);
            WalkList(assign.targets, visit);
            WalkOptional(assign.value, visit);
            break;
        }
        case NodeKind::kAugAssign: {
            const auto& assign = static_cast<const AugAssignStmt&>(node);
            WalkOptional(assign.target, visit);
            WalkOptional(assign.value, visit);
            break;
        }
        case NodeKind::kIf: {
            const auto& stmt = static_cast<const IfStmt&>(node);
            WalkOptional(stmt.test, visit);
            WalkList(stmt.body, visit);
            WalkList(stmt.orelse, visit);
            break;
        }
        case NodeKind::kWhile: {
            const auto& stmt = static_cast<const WhileStmt&>(node);
            WalkOptional(stmt.test, visit);
            WalkList(stmt.body, visit);
            break;
        }
        case NodeKind::kFor: {
            const auto& stmt = static_cast<const ForStmt&>(node);
            WalkOptional(stmt.target, visit);
            WalkOptional(stmt.iter, visit);
            WalkList(stmt.body, visit);
            break;
        }
        case NodeKind::kFunctionDef: {
            const auto& def = static_cast<const FunctionDef&>(node);
            for (const auto& param : def.params) {
                WalkOptional(param.default_value, visit);
            }
            WalkList(def.body, visit);
            break;
        }
        case NodeKind::kReturn:
            WalkOptional(static_cast<const ReturnStmt&>(node).value, visit);
            break;
        case NodeKind::kRaise:
            WalkOptional(static_cast<const RaiseStmt&>(node).exception, visit);
            break;
        case NodeKind::kTry: {
            const auto& stmt = static_cast<const TryStmt&>(node);
            WalkList(stmt.body, visit);
            for (const auto& handler : stmt.handlers) {
                WalkList(handler.body, visit);
            }
            WalkList(stmt.orelse, visit);
            break;
        }
        case NodeKind::kModule:
            WalkList(static_cast<const Module&>(node).body, visit);
            break;
    }
}

std::size_t CountNodes(const Node& node) {
    std::size_t count = 0;
    Walk(node, [&count](const Node&) { ++count; });
    return count;
}

}  // namespace warden::script
