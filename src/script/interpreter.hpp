#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "script/ast.hpp"
#include "script/errors.hpp"
#include "script/guards.hpp"
#include "script/output_buffer.hpp"
#include "script/value.hpp"

namespace warden::script {

struct InterpreterOptions {
    std::vector<std::string> allowed_imports;
    std::size_t max_output_bytes = 64 * 1024;
    // Upper bound for any single string or sequence a script builds.
    std::size_t max_memory_bytes = 256u * 1024 * 1024;
    int max_call_depth = 64;
    int max_eval_depth = 2000;
};

// Tree-walking evaluator for parsed scripts. Globals live apart from the
// builtins table; every name, attribute, item, iteration and in-place access
// passes through the guard hooks.
//
// Function values keep pointers into the Module passed to Run, which must
// outlive the interpreter.
class Interpreter {
public:
    Interpreter(GuardHooks guards, InterpreterOptions options);

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    void SetGlobal(const std::string& name, Value value);
    const Value* FindGlobal(const std::string& name) const;

    // Throws ScriptError, SecurityViolation or ResourceExhausted.
    void Run(const Module& module);

    BoundedBuffer& out() { return out_; }
    BoundedBuffer& err() { return err_; }
    const InterpreterOptions& options() const { return options_; }

    Value Call(const Value& callee, CallArgs& args);
    Value GetAttribute(const Value& object, const std::string& attr);
    Value GetItem(const Value& container, const Value& key);
    // Visits every element; stops early when visit returns false.
    void ForEach(const Value& iterable, const std::function<bool(const Value&)>& visit);
    std::vector<Value> Materialize(const Value& iterable);
    // Throws ResourceExhausted when count elements of element_size bytes
    // would exceed the memory bound.
    void CheckAllocation(std::size_t count, std::size_t element_size) const;

private:
    enum class Flow { kNormal, kBreak, kContinue, kReturn };

    using Scope = std::unordered_map<std::string, Value>;

    struct Frame {
        Scope* locals = nullptr;
        std::vector<std::unique_ptr<Scope>> comprehensions;
    };

    class DepthGuard;

    Flow ExecBlock(const NodeList& body);
    Flow Exec(const Node& node);
    Flow ExecStatement(const Node& node);
    Flow ExecIf(const IfStmt& stmt);
    Flow ExecWhile(const WhileStmt& stmt);
    Flow ExecFor(const ForStmt& stmt);
    Flow ExecTry(const TryStmt& stmt);
    void ExecAssign(const AssignStmt& stmt);
    void ExecAugAssign(const AugAssignStmt& stmt);
    void ExecFunctionDef(const FunctionDef& def);
    void ExecImport(const ImportStmt& stmt);
    void ExecImportFrom(const ImportFromStmt& stmt);
    [[noreturn]] void ExecRaise(const RaiseStmt& stmt);

    Value Eval(const Node& node);
    Value EvalConstant(const ConstantExpr& expr);
    Value EvalBoolOp(const BoolOpExpr& expr);
    Value EvalCompare(const CompareExpr& expr);
    Value EvalCall(const CallExpr& expr);
    Value EvalSubscript(const SubscriptExpr& expr);
    Value EvalSlice(const Value& container, const SliceExpr& slice);
    Value EvalListComp(const ListCompExpr& expr);
    Value EvalDict(const DictExpr& expr);

    Value LookupName(const std::string& name);
    void StoreName(const std::string& name, Value value);
    void AssignTarget(const Node& target, const Value& value, Scope* comprehension = nullptr);
    void SetItem(const Value& container, const Value& key, const Value& value);
    Value CallFunction(const FunctionData& function, CallArgs& args);
    std::string ResolveExceptionType(const std::string& name);
    Value ImportModule(const std::string& name);

    Frame& frame() { return frames_.back(); }

    GuardHooks guards_;
    InterpreterOptions options_;
    Scope builtins_;
    Scope globals_;
    std::vector<Frame> frames_;
    std::vector<ScriptError> handling_;
    std::unordered_map<std::string, Value> modules_;
    BoundedBuffer out_;
    BoundedBuffer err_;
    Value return_value_;
    int eval_depth_ = 0;
};

}  // namespace warden::script
