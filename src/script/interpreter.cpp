#include "script/interpreter.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "script/builtins.hpp"
#include "script/modules.hpp"
#include "script/operators.hpp"

namespace warden::script {

class Interpreter::DepthGuard {
public:
    explicit DepthGuard(Interpreter& interp) : interp_(interp) {
        if (++interp_.eval_depth_ > interp_.options_.max_eval_depth) {
            --interp_.eval_depth_;
            throw ScriptError("RecursionError", "maximum recursion depth exceeded");
        }
    }
    ~DepthGuard() { --interp_.eval_depth_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    Interpreter& interp_;
};

namespace {

GuardHooks Checked(GuardHooks hooks) {
    RequireComplete(hooks);
    return hooks;
}

std::int64_t IndexValue(const Value& key, const char* type) {
    if (key.is(ValueKind::kInt) || key.is(ValueKind::kBool)) {
        return key.AsInt();
    }
    throw ScriptError("TypeError", std::string(type) + " indices must be integers, not '" + TypeName(key) + "'");
}

std::size_t NormalizeIndex(std::int64_t index, std::size_t size, const char* what) {
    const auto length = static_cast<std::int64_t>(size);
    if (index < 0) {
        index += length;
    }
    if (index < 0 || index >= length) {
        throw ScriptError("IndexError", std::string(what) + " index out of range");
    }
    return static_cast<std::size_t>(index);
}

struct SliceBounds {
    std::int64_t start = 0;
    std::int64_t step = 1;
    std::int64_t count = 0;
};

SliceBounds AdjustSlice(const Value& lower, const Value& upper, const Value& step_value, std::int64_t length) {
    auto bound = [](const Value& value) -> std::optional<std::int64_t> {
        if (value.is(ValueKind::kNone)) {
            return std::nullopt;
        }
        if (value.is(ValueKind::kInt) || value.is(ValueKind::kBool)) {
            return value.AsInt();
        }
        throw ScriptError("TypeError", "slice indices must be integers or None");
    };
    SliceBounds bounds;
    bounds.step = bound(step_value).value_or(1);
    if (bounds.step == 0) {
        throw ScriptError("ValueError", "slice step cannot be zero");
    }
    if (bounds.step == INT64_MIN) {
        bounds.step = -INT64_MAX;
    }
    auto clamp = [&](std::optional<std::int64_t> value, std::int64_t fallback) {
        if (!value) {
            return fallback;
        }
        std::int64_t index = *value;
        if (index < 0) {
            index += length;
            if (index < 0) {
                index = bounds.step < 0 ? -1 : 0;
            }
        } else if (index >= length) {
            index = bounds.step < 0 ? length - 1 : length;
        }
        return index;
    };
    std::int64_t stop = 0;
    if (bounds.step > 0) {
        bounds.start = clamp(bound(lower), 0);
        stop = clamp(bound(upper), length);
        bounds.count = bounds.start < stop ? (stop - bounds.start - 1) / bounds.step + 1 : 0;
    } else {
        bounds.start = clamp(bound(lower), length - 1);
        stop = clamp(bound(upper), -1);
        bounds.count = bounds.start > stop ? (bounds.start - stop - 1) / (-bounds.step) + 1 : 0;
    }
    return bounds;
}

Value ConstantValue(const Constant& constant) {
    return std::visit(
        [](const auto& value) -> Value {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return Value::None();
            } else if constexpr (std::is_same_v<T, bool>) {
                return Value::Bool(value);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return Value::Int(value);
            } else if constexpr (std::is_same_v<T, double>) {
                return Value::Float(value);
            } else {
                return Value::Str(value);
            }
        },
        constant);
}

}  // namespace

Interpreter::Interpreter(GuardHooks guards, InterpreterOptions options)
    : guards_(Checked(std::move(guards))),
      options_(std::move(options)),
      builtins_(MakeBuiltins()),
      out_(options_.max_output_bytes),
      err_(options_.max_output_bytes) {}

void Interpreter::SetGlobal(const std::string& name, Value value) {
    guards_.name(name);
    globals_[name] = std::move(value);
}

const Value* Interpreter::FindGlobal(const std::string& name) const {
    const auto it = globals_.find(name);
    return it == globals_.end() ? nullptr : &it->second;
}

void Interpreter::Run(const Module& module) {
    frames_.clear();
    handling_.clear();
    eval_depth_ = 0;
    frames_.emplace_back();
    frames_.back().locals = &globals_;
    ExecBlock(module.body);
    frames_.clear();
}

Interpreter::Flow Interpreter::ExecBlock(const NodeList& body) {
    for (const auto& stmt : body) {
        const Flow flow = Exec(*stmt);
        if (flow != Flow::kNormal) {
            return flow;
        }
    }
    return Flow::kNormal;
}

Interpreter::Flow Interpreter::Exec(const Node& node) {
    DepthGuard guard(*this);
    try {
        return ExecStatement(node);
    } catch (ScriptError& error) {
        if (error.line() == 0) {
            error.set_line(node.pos.line);
        }
        throw;
    } catch (SecurityViolation& violation) {
        if (violation.line() == 0) {
            violation.set_line(node.pos.line);
        }
        throw;
    }
}

Interpreter::Flow Interpreter::ExecStatement(const Node& node) {
    switch (node.kind) {
        case NodeKind::kExprStmt:
            Eval(*static_cast<const ExprStmt&>(node).value);
            return Flow::kNormal;
        case NodeKind::kAssign:
            ExecAssign(static_cast<const AssignStmt&>(node));
            return Flow::kNormal;
        case NodeKind::kAugAssign:
            ExecAugAssign(static_cast<const AugAssignStmt&>(node));
            return Flow::kNormal;
        case NodeKind::kIf:
            return ExecIf(static_cast<const IfStmt&>(node));
        case NodeKind::kWhile:
            return ExecWhile(static_cast<const WhileStmt&>(node));
        case NodeKind::kFor:
            return ExecFor(static_cast<const ForStmt&>(node));
        case NodeKind::kTry:
            return ExecTry(static_cast<const TryStmt&>(node));
        case NodeKind::kBreak:
            return Flow::kBreak;
        case NodeKind::kContinue:
            return Flow::kContinue;
        case NodeKind::kPass:
            return Flow::kNormal;
        case NodeKind::kFunctionDef:
            ExecFunctionDef(static_cast<const FunctionDef&>(node));
            return Flow::kNormal;
        case NodeKind::kReturn: {
            const auto& stmt = static_cast<const ReturnStmt&>(node);
            return_value_ = stmt.value ? Eval(*stmt.value) : Value::None();
            return Flow::kReturn;
        }
        case NodeKind::kImport:
            ExecImport(static_cast<const ImportStmt&>(node));
            return Flow::kNormal;
        case NodeKind::kImportFrom:
            ExecImportFrom(static_cast<const ImportFromStmt&>(node));
            return Flow::kNormal;
        case NodeKind::kRaise:
            ExecRaise(static_cast<const RaiseStmt&>(node));
        default:
            throw std::logic_error(std::string("unexpected statement node ") + ToString(node.kind));
    }
}

Interpreter::Flow Interpreter::ExecIf(const IfStmt& stmt) {
    if (Truthy(Eval(*stmt.test))) {
        return ExecBlock(stmt.body);
    }
    return ExecBlock(stmt.orelse);
}

Interpreter::Flow Interpreter::ExecWhile(const WhileStmt& stmt) {
    while (Truthy(Eval(*stmt.test))) {
        const Flow flow = ExecBlock(stmt.body);
        if (flow == Flow::kBreak) {
            break;
        }
        if (flow == Flow::kReturn) {
            return flow;
        }
    }
    return Flow::kNormal;
}

Interpreter::Flow Interpreter::ExecFor(const ForStmt& stmt) {
    const Value iterable = Eval(*stmt.iter);
    Flow result = Flow::kNormal;
    ForEach(iterable, [&](const Value& item) {
        AssignTarget(*stmt.target, item);
        const Flow flow = ExecBlock(stmt.body);
        if (flow == Flow::kBreak) {
            return false;
        }
        if (flow == Flow::kReturn) {
            result = flow;
            return false;
        }
        return true;
    });
    return result;
}

Interpreter::Flow Interpreter::ExecTry(const TryStmt& stmt) {
    std::optional<ScriptError> caught;
    Flow flow = Flow::kNormal;
    try {
        flow = ExecBlock(stmt.body);
    } catch (const ScriptError& error) {
        caught = error;
    }
    if (!caught) {
        if (flow != Flow::kNormal) {
            return flow;
        }
        return ExecBlock(stmt.orelse);
    }
    for (const auto& handler : stmt.handlers) {
        if (!handler.type_name.empty() &&
            !ExceptionMatches(caught->type_name(), ResolveExceptionType(handler.type_name))) {
            continue;
        }
        if (!handler.binding.empty()) {
            StoreName(handler.binding, Value::Exception(caught->type_name(), caught->what()));
        }
        struct Handling {
            std::vector<ScriptError>& stack;
            ~Handling() { stack.pop_back(); }
        };
        handling_.push_back(*caught);
        Handling handling{handling_};
        return ExecBlock(handler.body);
    }
    throw *caught;
}

std::string Interpreter::ResolveExceptionType(const std::string& name) {
    const Value value = LookupName(name);
    if (!value.is(ValueKind::kExceptionType)) {
        throw ScriptError("TypeError", "catching classes that do not inherit from BaseException is not allowed");
    }
    return value.AsExceptionType();
}

void Interpreter::ExecAssign(const AssignStmt& stmt) {
    const Value value = Eval(*stmt.value);
    for (const auto& target : stmt.targets) {
        AssignTarget(*target, value);
    }
}

void Interpreter::ExecAugAssign(const AugAssignStmt& stmt) {
    auto apply = [&](const Value& current, const Value& operand) {
        guards_.inplace(stmt.op, current);
        if (stmt.op == "+" && current.is(ValueKind::kList)) {
            std::vector<Value> extra = Materialize(operand);
            auto& items = current.Items();
            CheckAllocation(items.size() + extra.size(), sizeof(Value));
            items.insert(items.end(), extra.begin(), extra.end());
            return current;
        }
        return BinaryOp(stmt.op, current, operand, options_.max_memory_bytes);
    };
    switch (stmt.target->kind) {
        case NodeKind::kName: {
            const auto& name = static_cast<const NameExpr&>(*stmt.target).id;
            const Value current = LookupName(name);
            const Value operand = Eval(*stmt.value);
            StoreName(name, apply(current, operand));
            return;
        }
        case NodeKind::kSubscript: {
            const auto& target = static_cast<const SubscriptExpr&>(*stmt.target);
            if (target.index->kind == NodeKind::kSlice) {
                throw ScriptError("TypeError", "slice assignment is not supported");
            }
            const Value container = Eval(*target.value);
            const Value key = Eval(*target.index);
            const Value current = GetItem(container, key);
            const Value operand = Eval(*stmt.value);
            SetItem(container, key, apply(current, operand));
            return;
        }
        case NodeKind::kAttribute: {
            const auto& target = static_cast<const AttributeExpr&>(*stmt.target);
            const Value object = Eval(*target.value);
            guards_.getattr(object, target.attr);
            throw ScriptError("AttributeError", std::string("'") + TypeName(object) + "' object attribute '" +
                                                    target.attr + "' is read-only");
        }
        default:
            throw ScriptError("SyntaxError", "illegal expression for augmented assignment");
    }
}

void Interpreter::ExecFunctionDef(const FunctionDef& def) {
    auto function = std::make_shared<FunctionData>();
    function->name = def.name;
    function->def = &def;
    for (const auto& param : def.params) {
        guards_.name(param.name);
        if (param.default_value) {
            function->defaults.push_back(Eval(*param.default_value));
        }
    }
    StoreName(def.name, Value::Function(std::move(function)));
}

Value Interpreter::ImportModule(const std::string& name) {
    const auto& allowed = options_.allowed_imports;
    if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
        throw SecurityViolation("import of '" + name + "' not allowed");
    }
    const auto cached = modules_.find(name);
    if (cached != modules_.end()) {
        return cached->second;
    }
    auto module = LoadModule(name);
    if (!module) {
        throw ScriptError("ImportError", "No module named '" + name + "'");
    }
    Value value = Value::Module(std::move(module));
    modules_.emplace(name, value);
    return value;
}

void Interpreter::ExecImport(const ImportStmt& stmt) {
    for (const auto& alias : stmt.names) {
        Value module = ImportModule(alias.name);
        StoreName(alias.asname.empty() ? alias.name : alias.asname, std::move(module));
    }
}

void Interpreter::ExecImportFrom(const ImportFromStmt& stmt) {
    if (stmt.level > 0) {
        throw SecurityViolation("relative import not allowed");
    }
    const Value module = ImportModule(stmt.module);
    const auto& members = module.AsModule().members;
    for (const auto& alias : stmt.names) {
        guards_.name(alias.name);
        const auto it = members.find(alias.name);
        if (it == members.end()) {
            throw ScriptError("ImportError", "cannot import name '" + alias.name + "' from '" + stmt.module + "'");
        }
        StoreName(alias.asname.empty() ? alias.name : alias.asname, it->second);
    }
}

void Interpreter::ExecRaise(const RaiseStmt& stmt) {
    if (!stmt.exception) {
        if (handling_.empty()) {
            throw ScriptError("RuntimeError", "No active exception to reraise");
        }
        throw handling_.back();
    }
    const Value value = Eval(*stmt.exception);
    if (value.is(ValueKind::kException)) {
        throw ScriptError(value.AsException().type_name, value.AsException().message);
    }
    if (value.is(ValueKind::kExceptionType)) {
        throw ScriptError(value.AsExceptionType(), "");
    }
    throw ScriptError("TypeError", "exceptions must derive from BaseException");
}

Value Interpreter::Eval(const Node& node) {
    DepthGuard guard(*this);
    switch (node.kind) {
        case NodeKind::kName:
            return LookupName(static_cast<const NameExpr&>(node).id);
        case NodeKind::kConstant:
            return EvalConstant(static_cast<const ConstantExpr&>(node));
        case NodeKind::kList:
        case NodeKind::kTuple: {
            const auto& seq = static_cast<const SequenceExpr&>(node);
            std::vector<Value> items;
            items.reserve(seq.elements.size());
            for (const auto& element : seq.elements) {
                items.push_back(Eval(*element));
            }
            return node.kind == NodeKind::kList ? Value::List(std::move(items)) : Value::Tuple(std::move(items));
        }
        case NodeKind::kDict:
            return EvalDict(static_cast<const DictExpr&>(node));
        case NodeKind::kUnary: {
            const auto& expr = static_cast<const UnaryExpr&>(node);
            return UnaryOp(expr.op, Eval(*expr.operand));
        }
        case NodeKind::kBinary: {
            const auto& expr = static_cast<const BinaryExpr&>(node);
            const Value left = Eval(*expr.left);
            const Value right = Eval(*expr.right);
            return BinaryOp(expr.op, left, right, options_.max_memory_bytes);
        }
        case NodeKind::kBoolOp:
            return EvalBoolOp(static_cast<const BoolOpExpr&>(node));
        case NodeKind::kCompare:
            return EvalCompare(static_cast<const CompareExpr&>(node));
        case NodeKind::kCall:
            return EvalCall(static_cast<const CallExpr&>(node));
        case NodeKind::kAttribute: {
            const auto& expr = static_cast<const AttributeExpr&>(node);
            return GetAttribute(Eval(*expr.value), expr.attr);
        }
        case NodeKind::kSubscript:
            return EvalSubscript(static_cast<const SubscriptExpr&>(node));
        case NodeKind::kConditional: {
            const auto& expr = static_cast<const ConditionalExpr&>(node);
            return Truthy(Eval(*expr.test)) ? Eval(*expr.body) : Eval(*expr.orelse);
        }
        case NodeKind::kListComp:
            return EvalListComp(static_cast<const ListCompExpr&>(node));
        default:
            throw std::logic_error(std::string("unexpected expression node ") + ToString(node.kind));
    }
}

Value Interpreter::EvalConstant(const ConstantExpr& expr) {
    return ConstantValue(expr.value);
}

Value Interpreter::EvalBoolOp(const BoolOpExpr& expr) {
    Value value;
    for (const auto& operand : expr.values) {
        value = Eval(*operand);
        const bool truthy = Truthy(value);
        if ((expr.op == "or" && truthy) || (expr.op == "and" && !truthy)) {
            return value;
        }
    }
    return value;
}

Value Interpreter::EvalCompare(const CompareExpr& expr) {
    Value left = Eval(*expr.left);
    for (std::size_t i = 0; i < expr.ops.size(); ++i) {
        Value right = Eval(*expr.comparators[i]);
        const std::string& op = expr.ops[i];
        bool holds = false;
        if (op == "==") {
            holds = Equals(left, right);
        } else if (op == "!=") {
            holds = !Equals(left, right);
        } else if (op == "<") {
            holds = LessThan(left, right);
        } else if (op == ">") {
            holds = LessThan(right, left);
        } else if (op == "<=") {
            holds = LessThan(left, right) || Equals(left, right);
        } else if (op == ">=") {
            holds = LessThan(right, left) || Equals(left, right);
        } else if (op == "in" || op == "not in") {
            guards_.getiter(right);
            holds = Contains(right, left) == (op == "in");
        } else if (op == "is") {
            holds = Identical(left, right);
        } else if (op == "is not") {
            holds = !Identical(left, right);
        } else {
            throw std::logic_error("unknown comparison " + op);
        }
        if (!holds) {
            return Value::Bool(false);
        }
        left = std::move(right);
    }
    return Value::Bool(true);
}

Value Interpreter::EvalCall(const CallExpr& expr) {
    const Value callee = Eval(*expr.func);
    CallArgs args;
    args.line = expr.pos.line;
    args.positional.reserve(expr.args.size());
    for (const auto& arg : expr.args) {
        args.positional.push_back(Eval(*arg));
    }
    for (const auto& keyword : expr.keywords) {
        guards_.name(keyword.name);
        args.keywords.emplace_back(keyword.name, Eval(*keyword.value));
    }
    return Call(callee, args);
}

Value Interpreter::Call(const Value& callee, CallArgs& args) {
    switch (callee.kind()) {
        case ValueKind::kBuiltin:
            return callee.AsBuiltin().fn(*this, args);
        case ValueKind::kFunction:
            return CallFunction(callee.AsFunction(), args);
        case ValueKind::kBoundMethod: {
            const auto& method = callee.AsBoundMethod();
            return CallMethod(*this, method.receiver, method.name, args);
        }
        case ValueKind::kExceptionType: {
            const std::string& type = callee.AsExceptionType();
            NoKeywords(args, type);
            CheckArity(args, type, 0, 1);
            return Value::Exception(type, args.positional.empty() ? "" : ToStr(args.positional[0]));
        }
        default:
            throw ScriptError("TypeError", std::string("'") + TypeName(callee) + "' object is not callable");
    }
}

Value Interpreter::CallFunction(const FunctionData& function, CallArgs& args) {
    if (static_cast<int>(frames_.size()) > options_.max_call_depth) {
        throw ScriptError("RecursionError", "maximum recursion depth exceeded");
    }
    const FunctionDef& def = *function.def;
    const std::size_t count = def.params.size();
    if (args.positional.size() > count) {
        throw ScriptError("TypeError", function.name + "() takes " + std::to_string(count) +
                                           " positional arguments but " + std::to_string(args.positional.size()) +
                                           " were given");
    }
    Scope locals;
    std::vector<bool> bound(count, false);
    for (std::size_t i = 0; i < args.positional.size(); ++i) {
        locals[def.params[i].name] = args.positional[i];
        bound[i] = true;
    }
    for (auto& [name, value] : args.keywords) {
        std::size_t index = 0;
        while (index < count && def.params[index].name != name) {
            ++index;
        }
        if (index == count) {
            throw ScriptError("TypeError", function.name + "() got an unexpected keyword argument '" + name + "'");
        }
        if (bound[index]) {
            throw ScriptError("TypeError", function.name + "() got multiple values for argument '" + name + "'");
        }
        locals[name] = std::move(value);
        bound[index] = true;
    }
    const std::size_t first_default = count - function.defaults.size();
    for (std::size_t i = 0; i < count; ++i) {
        if (bound[i]) {
            continue;
        }
        if (i < first_default) {
            throw ScriptError("TypeError", function.name + "() missing required argument: '" +
                                               def.params[i].name + "'");
        }
        locals[def.params[i].name] = function.defaults[i - first_default];
    }

    struct FramePop {
        std::vector<Frame>& frames;
        ~FramePop() { frames.pop_back(); }
    };
    frames_.emplace_back();
    frames_.back().locals = &locals;
    FramePop pop{frames_};

    Value result;
    if (ExecBlock(def.body) == Flow::kReturn) {
        result = std::move(return_value_);
        return_value_ = Value::None();
    }
    return result;
}

Value Interpreter::EvalSubscript(const SubscriptExpr& expr) {
    const Value container = Eval(*expr.value);
    if (expr.index->kind == NodeKind::kSlice) {
        return EvalSlice(container, static_cast<const SliceExpr&>(*expr.index));
    }
    return GetItem(container, Eval(*expr.index));
}

Value Interpreter::EvalSlice(const Value& container, const SliceExpr& slice) {
    const Value lower = slice.lower ? Eval(*slice.lower) : Value::None();
    const Value upper = slice.upper ? Eval(*slice.upper) : Value::None();
    const Value step = slice.step ? Eval(*slice.step) : Value::None();
    guards_.getitem(container, Value::None());
    switch (container.kind()) {
        case ValueKind::kStr: {
            const std::string& text = container.AsStr();
            const auto bounds = AdjustSlice(lower, upper, step, static_cast<std::int64_t>(text.size()));
            std::string out;
            out.reserve(static_cast<std::size_t>(bounds.count));
            for (std::int64_t i = 0; i < bounds.count; ++i) {
                out.push_back(text[static_cast<std::size_t>(bounds.start + i * bounds.step)]);
            }
            return Value::Str(std::move(out));
        }
        case ValueKind::kList:
        case ValueKind::kTuple: {
            const auto& items = container.Items();
            const auto bounds = AdjustSlice(lower, upper, step, static_cast<std::int64_t>(items.size()));
            std::vector<Value> out;
            out.reserve(static_cast<std::size_t>(bounds.count));
            for (std::int64_t i = 0; i < bounds.count; ++i) {
                out.push_back(items[static_cast<std::size_t>(bounds.start + i * bounds.step)]);
            }
            return container.is(ValueKind::kList) ? Value::List(std::move(out)) : Value::Tuple(std::move(out));
        }
        case ValueKind::kRange: {
            const auto& range = container.AsRange();
            const auto bounds = AdjustSlice(lower, upper, step, range.Length());
            const std::int64_t new_step = CheckedMul(range.step, bounds.step);
            const std::int64_t start = range.At(bounds.start);
            return Value::Range(start, CheckedAdd(start, CheckedMul(bounds.count, new_step)), new_step);
        }
        default:
            throw ScriptError("TypeError", std::string("'") + TypeName(container) + "' object is not subscriptable");
    }
}

Value Interpreter::EvalListComp(const ListCompExpr& expr) {
    const Value iterable = Eval(*expr.iter);
    frame().comprehensions.push_back(std::make_unique<Scope>());
    Scope* scope = frame().comprehensions.back().get();
    struct ScopePop {
        Interpreter& interp;
        ~ScopePop() { interp.frame().comprehensions.pop_back(); }
    };
    ScopePop pop{*this};

    std::vector<Value> items;
    ForEach(iterable, [&](const Value& item) {
        AssignTarget(*expr.target, item, scope);
        for (const auto& condition : expr.conditions) {
            if (!Truthy(Eval(*condition))) {
                return true;
            }
        }
        CheckAllocation(items.size() + 1, sizeof(Value));
        items.push_back(Eval(*expr.element));
        return true;
    });
    return Value::List(std::move(items));
}

Value Interpreter::EvalDict(const DictExpr& expr) {
    Value dict = Value::Dict();
    for (std::size_t i = 0; i < expr.keys.size(); ++i) {
        const Value key = Eval(*expr.keys[i]);
        dict.AsDict().Set(key, Eval(*expr.values[i]));
    }
    return dict;
}

Value Interpreter::LookupName(const std::string& name) {
    guards_.name(name);
    Frame& current = frame();
    for (auto it = current.comprehensions.rbegin(); it != current.comprehensions.rend(); ++it) {
        const auto found = (*it)->find(name);
        if (found != (*it)->end()) {
            return found->second;
        }
    }
    if (const auto found = current.locals->find(name); found != current.locals->end()) {
        return found->second;
    }
    if (current.locals != &globals_) {
        if (const auto found = globals_.find(name); found != globals_.end()) {
            return found->second;
        }
    }
    if (const auto found = builtins_.find(name); found != builtins_.end()) {
        return found->second;
    }
    throw ScriptError("NameError", "name '" + name + "' is not defined");
}

void Interpreter::StoreName(const std::string& name, Value value) {
    guards_.name(name);
    (*frame().locals)[name] = std::move(value);
}

void Interpreter::AssignTarget(const Node& target, const Value& value, Scope* comprehension) {
    switch (target.kind) {
        case NodeKind::kName: {
            const auto& name = static_cast<const NameExpr&>(target).id;
            if (comprehension) {
                guards_.name(name);
                (*comprehension)[name] = value;
            } else {
                StoreName(name, value);
            }
            return;
        }
        case NodeKind::kTuple:
        case NodeKind::kList: {
            const auto& seq = static_cast<const SequenceExpr&>(target);
            const std::vector<Value> items = Materialize(value);
            if (items.size() < seq.elements.size()) {
                throw ScriptError("ValueError", "not enough values to unpack (expected " +
                                                    std::to_string(seq.elements.size()) + ", got " +
                                                    std::to_string(items.size()) + ")");
            }
            if (items.size() > seq.elements.size()) {
                throw ScriptError("ValueError", "too many values to unpack (expected " +
                                                    std::to_string(seq.elements.size()) + ")");
            }
            for (std::size_t i = 0; i < items.size(); ++i) {
                AssignTarget(*seq.elements[i], items[i], comprehension);
            }
            return;
        }
        case NodeKind::kSubscript: {
            const auto& expr = static_cast<const SubscriptExpr&>(target);
            if (expr.index->kind == NodeKind::kSlice) {
                throw ScriptError("TypeError", "slice assignment is not supported");
            }
            const Value container = Eval(*expr.value);
            SetItem(container, Eval(*expr.index), value);
            return;
        }
        case NodeKind::kAttribute: {
            const auto& expr = static_cast<const AttributeExpr&>(target);
            const Value object = Eval(*expr.value);
            guards_.getattr(object, expr.attr);
            throw ScriptError("AttributeError", std::string("'") + TypeName(object) + "' object attribute '" +
                                                    expr.attr + "' is read-only");
        }
        default:
            throw std::logic_error(std::string("cannot assign to ") + ToString(target.kind));
    }
}

void Interpreter::SetItem(const Value& container, const Value& key, const Value& value) {
    guards_.setitem(container, key);
    switch (container.kind()) {
        case ValueKind::kList: {
            auto& items = container.Items();
            items[NormalizeIndex(IndexValue(key, "list"), items.size(), "list assignment")] = value;
            return;
        }
        case ValueKind::kDict:
            container.AsDict().Set(key, value);
            return;
        default:
            throw ScriptError("TypeError", std::string("'") + TypeName(container) +
                                               "' object does not support item assignment");
    }
}

Value Interpreter::GetAttribute(const Value& object, const std::string& attr) {
    guards_.getattr(object, attr);
    if (object.is(ValueKind::kModule)) {
        const auto& module = object.AsModule();
        const auto it = module.members.find(attr);
        if (it == module.members.end()) {
            throw ScriptError("AttributeError", "module '" + module.name + "' has no attribute '" + attr + "'");
        }
        return it->second;
    }
    if (object.is(ValueKind::kException) && attr == "args") {
        const auto& message = object.AsException().message;
        return message.empty() ? Value::Tuple() : Value::Tuple({Value::Str(message)});
    }
    if (IsAttributeAllowed(object.kind(), attr)) {
        return Value::BoundMethod(object, attr);
    }
    throw ScriptError("AttributeError", std::string("'") + TypeName(object) + "' object has no attribute '" +
                                            attr + "'");
}

Value Interpreter::GetItem(const Value& container, const Value& key) {
    guards_.getitem(container, key);
    switch (container.kind()) {
        case ValueKind::kList:
        case ValueKind::kTuple: {
            const char* type = container.is(ValueKind::kList) ? "list" : "tuple";
            const auto& items = container.Items();
            return items[NormalizeIndex(IndexValue(key, type), items.size(), type)];
        }
        case ValueKind::kStr: {
            const std::string& text = container.AsStr();
            return Value::Str(std::string(1, text[NormalizeIndex(IndexValue(key, "string"), text.size(), "string")]));
        }
        case ValueKind::kDict: {
            const Value* found = container.AsDict().Find(key);
            if (!found) {
                throw ScriptError("KeyError", Repr(key));
            }
            return *found;
        }
        case ValueKind::kRange: {
            const auto& range = container.AsRange();
            const auto length = static_cast<std::size_t>(range.Length());
            return Value::Int(range.At(static_cast<std::int64_t>(NormalizeIndex(IndexValue(key, "range"), length, "range object"))));
        }
        case ValueKind::kMatch: {
            const auto& groups = container.AsMatch().groups;
            const auto index = IndexValue(key, "group");
            if (index < 0 || static_cast<std::size_t>(index) >= groups.size()) {
                throw ScriptError("IndexError", "no such group");
            }
            const auto& group = groups[static_cast<std::size_t>(index)];
            return group ? Value::Str(*group) : Value::None();
        }
        default:
            throw ScriptError("TypeError", std::string("'") + TypeName(container) + "' object is not subscriptable");
    }
}

void Interpreter::ForEach(const Value& iterable, const std::function<bool(const Value&)>& visit) {
    guards_.getiter(iterable);
    switch (iterable.kind()) {
        case ValueKind::kList:
        case ValueKind::kTuple: {
            const auto& items = iterable.Items();
            for (std::size_t i = 0; i < items.size(); ++i) {
                const Value item = items[i];
                if (!visit(item)) {
                    return;
                }
            }
            return;
        }
        case ValueKind::kStr: {
            const std::string& text = iterable.AsStr();
            for (const char c : text) {
                if (!visit(Value::Str(std::string(1, c)))) {
                    return;
                }
            }
            return;
        }
        case ValueKind::kDict:
            for (const auto& entry : iterable.AsDict().Items()) {
                if (!visit(entry.first)) {
                    return;
                }
            }
            return;
        case ValueKind::kSet:
        case ValueKind::kFrozenSet:
            for (const auto& item : iterable.AsSet().Keys()) {
                if (!visit(item)) {
                    return;
                }
            }
            return;
        case ValueKind::kRange: {
            const auto& range = iterable.AsRange();
            const std::int64_t length = range.Length();
            for (std::int64_t i = 0; i < length; ++i) {
                if (!visit(Value::Int(range.At(i)))) {
                    return;
                }
            }
            return;
        }
        default:
            throw ScriptError("TypeError", std::string("'") + TypeName(iterable) + "' object is not iterable");
    }
}

std::vector<Value> Interpreter::Materialize(const Value& iterable) {
    if (iterable.is(ValueKind::kRange)) {
        CheckAllocation(static_cast<std::size_t>(iterable.AsRange().Length()), sizeof(Value));
    }
    std::vector<Value> items;
    ForEach(iterable, [&](const Value& item) {
        CheckAllocation(items.size() + 1, sizeof(Value));
        items.push_back(item);
        return true;
    });
    return items;
}

void Interpreter::CheckAllocation(std::size_t count, std::size_t element_size) const {
    if (element_size != 0 && count > options_.max_memory_bytes / element_size) {
        throw ResourceExhausted("allocation would exceed the memory limit");
    }
}

}  // namespace warden::script
