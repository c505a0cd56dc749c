#include "script/parser.hpp"

#include <algorithm>
#include <array>

#include "script/lexer.hpp"

namespace warden::script {
namespace {

constexpr std::array<std::string_view, 11> kUnsupportedKeywords = {
    "class", "with", "lambda", "yield", "global", "nonlocal",
    "del", "assert", "async", "await", "finally"};

constexpr std::array<std::string_view, 6> kAugmentedOps = {"+=", "-=", "*=", "/=", "//=", "%="};

class Parser {
public:
    Parser(std::vector<Token> tokens, const ParseOptions& options)
        : tokens_(std::move(tokens)), options_(options) {}

    std::unique_ptr<Module> ParseModule() {
        auto module = std::make_unique<Module>();
        while (!Check(TokenKind::kEnd)) {
            if (Match(TokenKind::kNewline)) {
                continue;
            }
            ParseStatement(module->body);
        }
        return module;
    }

private:
    class DepthGuard {
    public:
        DepthGuard(Parser& parser, SourcePos pos) : parser_(parser) {
            if (++parser_.depth_ > parser_.options_.max_nesting_depth) {
                throw SyntaxError("too many nested parentheses or blocks", pos);
            }
        }
        ~DepthGuard() { --parser_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& parser_;
    };

    // Left-deep operator chains and trailer chains grow the tree without
    // recursing in the parser; they are charged against the same depth budget.
    class ChainDepth {
    public:
        explicit ChainDepth(Parser& parser) : parser_(parser) {}
        ~ChainDepth() { parser_.depth_ -= added_; }
        ChainDepth(const ChainDepth&) = delete;
        ChainDepth& operator=(const ChainDepth&) = delete;

        void Extend(SourcePos pos) {
            ++added_;
            if (++parser_.depth_ > parser_.options_.max_nesting_depth) {
                throw SyntaxError("expression is too deeply nested", pos);
            }
        }

    private:
        Parser& parser_;
        int added_ = 0;
    };

    const Token& Peek(std::size_t offset = 0) const {
        const auto index = std::min(pos_ + offset, tokens_.size() - 1);
        return tokens_[index];
    }

    const Token& Next() {
        const Token& token = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return token;
    }

    bool Check(TokenKind kind) const { return Peek().kind == kind; }

    bool CheckOp(std::string_view op) const {
        return Peek().kind == TokenKind::kOp && Peek().text == op;
    }

    bool CheckKeyword(std::string_view word) const {
        return Peek().kind == TokenKind::kKeyword && Peek().text == word;
    }

    bool Match(TokenKind kind) {
        if (Check(kind)) {
            Next();
            return true;
        }
        return false;
    }

    bool MatchOp(std::string_view op) {
        if (CheckOp(op)) {
            Next();
            return true;
        }
        return false;
    }

    bool MatchKeyword(std::string_view word) {
        if (CheckKeyword(word)) {
            Next();
            return true;
        }
        return false;
    }

    [[noreturn]] void Fail(const std::string& message) const {
        throw SyntaxError(message, Peek().pos);
    }

    [[noreturn]] void Unexpected() const {
        const Token& token = Peek();
        switch (token.kind) {
            case TokenKind::kIndent: Fail("unexpected indent");
            case TokenKind::kDedent: Fail("unexpected unindent");
            case TokenKind::kNewline: Fail("invalid syntax: unexpected end of line");
            case TokenKind::kEnd: Fail("invalid syntax: unexpected end of input");
            default: break;
        }
        Fail("invalid syntax near '" + token.text + "'");
    }

    void ExpectOp(std::string_view op) {
        if (!MatchOp(op)) {
            Fail("expected '" + std::string(op) + "'");
        }
    }

    std::string ExpectName() {
        if (!Check(TokenKind::kName)) {
            if (Check(TokenKind::kKeyword)) {
                Fail("'" + Peek().text + "' is a reserved word");
            }
            Fail("expected a name");
        }
        return Next().text;
    }

    void RejectUnsupported() const {
        if (Peek().kind != TokenKind::kKeyword) {
            return;
        }
        for (const auto word : kUnsupportedKeywords) {
            if (Peek().text == word) {
                Fail("'" + Peek().text + "' is not supported");
            }
        }
    }

    // statements

    void ParseStatement(NodeList& out) {
        RejectUnsupported();
        if (CheckKeyword("if")) {
            out.push_back(ParseIf());
        } else if (CheckKeyword("while")) {
            out.push_back(ParseWhile());
        } else if (CheckKeyword("for")) {
            out.push_back(ParseFor());
        } else if (CheckKeyword("def")) {
            out.push_back(ParseDef());
        } else if (CheckKeyword("try")) {
            out.push_back(ParseTry());
        } else {
            ParseSimpleStatements(out);
        }
    }

    void ParseSimpleStatements(NodeList& out) {
        out.push_back(ParseSmallStatement());
        while (MatchOp(";")) {
            if (Check(TokenKind::kNewline) || Check(TokenKind::kEnd)) {
                break;
            }
            out.push_back(ParseSmallStatement());
        }
        if (!Match(TokenKind::kNewline) && !Check(TokenKind::kEnd)) {
            Unexpected();
        }
    }

    NodeList ParseSuite() {
        const SourcePos pos = Peek().pos;
        ExpectOp(":");
        DepthGuard guard(*this, pos);
        NodeList body;
        if (!Match(TokenKind::kNewline)) {
            ParseSimpleStatements(body);
            return body;
        }
        while (Match(TokenKind::kNewline)) {
        }
        if (!Match(TokenKind::kIndent)) {
            Fail("expected an indented block");
        }
        while (!Check(TokenKind::kDedent) && !Check(TokenKind::kEnd)) {
            if (Match(TokenKind::kNewline)) {
                continue;
            }
            ParseStatement(body);
        }
        Match(TokenKind::kDedent);
        return body;
    }

    NodePtr ParseSmallStatement() {
        RejectUnsupported();
        const SourcePos pos = Peek().pos;
        if (MatchKeyword("pass")) {
            return std::make_unique<Node>(NodeKind::kPass, pos);
        }
        if (MatchKeyword("break")) {
            if (loop_depth_ == 0) {
                throw SyntaxError("'break' outside loop", pos);
            }
            return std::make_unique<Node>(NodeKind::kBreak, pos);
        }
        if (MatchKeyword("continue")) {
            if (loop_depth_ == 0) {
                throw SyntaxError("'continue' not properly in loop", pos);
            }
            return std::make_unique<Node>(NodeKind::kContinue, pos);
        }
        if (MatchKeyword("return")) {
            if (function_depth_ == 0) {
                throw SyntaxError("'return' outside function", pos);
            }
            auto stmt = std::make_unique<ReturnStmt>(pos);
            if (!AtStatementEnd()) {
                stmt->value = ParseTestList();
            }
            return stmt;
        }
        if (MatchKeyword("raise")) {
            auto stmt = std::make_unique<RaiseStmt>(pos);
            if (!AtStatementEnd()) {
                stmt->exception = ParseTest();
            }
            if (CheckKeyword("from")) {
                Fail("'raise ... from' is not supported");
            }
            return stmt;
        }
        if (MatchKeyword("import")) {
            return ParseImport(pos);
        }
        if (MatchKeyword("from")) {
            return ParseImportFrom(pos);
        }
        return ParseExpressionStatement();
    }

    bool AtStatementEnd() const {
        return Check(TokenKind::kNewline) || Check(TokenKind::kEnd) || CheckOp(";");
    }

    std::string ParseDottedName() {
        std::string name = ExpectName();
        while (MatchOp(".")) {
            name += ".";
            name += ExpectName();
        }
        return name;
    }

    NodePtr ParseImport(SourcePos pos) {
        auto stmt = std::make_unique<ImportStmt>(pos);
        do {
            ImportAlias alias;
            alias.pos = Peek().pos;
            alias.name = ParseDottedName();
            if (MatchKeyword("as")) {
                alias.asname = ExpectName();
            }
            stmt->names.push_back(std::move(alias));
        } while (MatchOp(","));
        return stmt;
    }

    NodePtr ParseImportFrom(SourcePos pos) {
        auto stmt = std::make_unique<ImportFromStmt>(pos);
        while (CheckOp(".")) {
            Next();
            ++stmt->level;
        }
        if (!CheckKeyword("import")) {
            stmt->module = ParseDottedName();
        }
        if (!MatchKeyword("import")) {
            Fail("expected 'import'");
        }
        if (CheckOp("*")) {
            Fail("wildcard imports are not supported");
        }
        const bool parenthesized = MatchOp("(");
        do {
            if (parenthesized && CheckOp(")")) {
                break;
            }
            ImportAlias alias;
            alias.pos = Peek().pos;
            alias.name = ExpectName();
            if (MatchKeyword("as")) {
                alias.asname = ExpectName();
            }
            stmt->names.push_back(std::move(alias));
        } while (MatchOp(","));
        if (parenthesized) {
            ExpectOp(")");
        }
        return stmt;
    }

    static bool IsAssignable(const Node& node) {
        switch (node.kind) {
            case NodeKind::kName:
            case NodeKind::kAttribute:
            case NodeKind::kSubscript:
                return true;
            case NodeKind::kTuple:
            case NodeKind::kList: {
                const auto& seq = static_cast<const SequenceExpr&>(node);
                for (const auto& element : seq.elements) {
                    if (!IsAssignable(*element)) {
                        return false;
                    }
                }
                return !seq.elements.empty();
            }
            default:
                return false;
        }
    }

    NodePtr ParseExpressionStatement() {
        const SourcePos pos = Peek().pos;
        NodePtr first = ParseTestList();
        for (const auto op : kAugmentedOps) {
            if (CheckOp(op)) {
                Next();
                if (first->kind != NodeKind::kName && first->kind != NodeKind::kSubscript &&
                    first->kind != NodeKind::kAttribute) {
                    throw SyntaxError("illegal expression for augmented assignment", pos);
                }
                std::string binary(op.substr(0, op.size() - 1));
                return std::make_unique<AugAssignStmt>(pos, std::move(first), std::move(binary), ParseTestList());
            }
        }
        if (Peek().kind == TokenKind::kOp && Peek().text.size() >= 2 && Peek().text.back() == '=' &&
            Peek().text != "==" && Peek().text != "!=" && Peek().text != "<=" && Peek().text != ">=") {
            Fail("unsupported operator '" + Peek().text + "'");
        }
        if (!CheckOp("=")) {
            return std::make_unique<ExprStmt>(pos, std::move(first));
        }
        auto assign = std::make_unique<AssignStmt>(pos);
        NodePtr current = std::move(first);
        while (MatchOp("=")) {
            if (!IsAssignable(*current)) {
                throw SyntaxError("cannot assign to " + std::string(ToString(current->kind)), current->pos);
            }
            assign->targets.push_back(std::move(current));
            current = ParseTestList();
        }
        assign->value = std::move(current);
        return assign;
    }

    NodePtr ParseIf() {
        const SourcePos pos = Next().pos;  // 'if' or 'elif'
        DepthGuard guard(*this, pos);
        auto stmt = std::make_unique<IfStmt>(pos);
        stmt->test = ParseTest();
        stmt->body = ParseSuite();
        if (CheckKeyword("elif")) {
            stmt->orelse.push_back(ParseIf());
        } else if (MatchKeyword("else")) {
            stmt->orelse = ParseSuite();
        }
        return stmt;
    }

    NodePtr ParseWhile() {
        const SourcePos pos = Next().pos;
        auto stmt = std::make_unique<WhileStmt>(pos);
        stmt->test = ParseTest();
        ++loop_depth_;
        stmt->body = ParseSuite();
        --loop_depth_;
        if (CheckKeyword("else")) {
            Fail("'while ... else' is not supported");
        }
        return stmt;
    }

    NodePtr ParseTargetList() {
        const SourcePos pos = Peek().pos;
        NodePtr first = ParseArith();
        if (!CheckOp(",")) {
            return first;
        }
        auto tuple = std::make_unique<SequenceExpr>(NodeKind::kTuple, pos);
        tuple->elements.push_back(std::move(first));
        while (MatchOp(",")) {
            if (CheckKeyword("in")) {
                break;
            }
            tuple->elements.push_back(ParseArith());
        }
        return tuple;
    }

    NodePtr ParseFor() {
        const SourcePos pos = Next().pos;
        auto stmt = std::make_unique<ForStmt>(pos);
        stmt->target = ParseTargetList();
        if (!IsAssignable(*stmt->target)) {
            throw SyntaxError("cannot assign to " + std::string(ToString(stmt->target->kind)), stmt->target->pos);
        }
        if (!MatchKeyword("in")) {
            Fail("expected 'in'");
        }
        stmt->iter = ParseTestList();
        ++loop_depth_;
        stmt->body = ParseSuite();
        --loop_depth_;
        if (CheckKeyword("else")) {
            Fail("'for ... else' is not supported");
        }
        return stmt;
    }

    NodePtr ParseDef() {
        const SourcePos pos = Next().pos;
        const SourcePos name_pos = Peek().pos;
        auto def = std::make_unique<FunctionDef>(pos, ExpectName());
        def->pos = name_pos;
        ExpectOp("(");
        bool seen_default = false;
        while (!CheckOp(")")) {
            if (CheckOp("*") || CheckOp("**")) {
                Fail("variadic parameters are not supported");
            }
            Parameter param;
            param.pos = Peek().pos;
            param.name = ExpectName();
            for (const auto& existing : def->params) {
                if (existing.name == param.name) {
                    throw SyntaxError("duplicate argument '" + param.name + "' in function definition", param.pos);
                }
            }
            if (MatchOp("=")) {
                param.default_value = ParseTest();
                seen_default = true;
            } else if (seen_default) {
                throw SyntaxError("non-default argument follows default argument", param.pos);
            }
            def->params.push_back(std::move(param));
            if (!MatchOp(",")) {
                break;
            }
        }
        ExpectOp(")");
        if (CheckOp("->")) {
            Fail("annotations are not supported");
        }
        const int enclosing_loops = loop_depth_;
        loop_depth_ = 0;
        ++function_depth_;
        def->body = ParseSuite();
        --function_depth_;
        loop_depth_ = enclosing_loops;
        return def;
    }

    NodePtr ParseTry() {
        const SourcePos pos = Next().pos;
        auto stmt = std::make_unique<TryStmt>(pos);
        stmt->body = ParseSuite();
        while (CheckKeyword("except")) {
            ExceptHandler handler;
            handler.pos = Next().pos;
            if (Check(TokenKind::kName)) {
                handler.type_name = ExpectName();
                if (MatchKeyword("as")) {
                    handler.binding = ExpectName();
                }
            } else if (CheckOp("(")) {
                Fail("exception tuples are not supported");
            }
            handler.body = ParseSuite();
            stmt->handlers.push_back(std::move(handler));
        }
        if (stmt->handlers.empty()) {
            if (CheckKeyword("finally")) {
                Fail("'finally' is not supported");
            }
            Fail("expected 'except'");
        }
        if (MatchKeyword("else")) {
            stmt->orelse = ParseSuite();
        }
        if (CheckKeyword("finally")) {
            Fail("'finally' is not supported");
        }
        return stmt;
    }

    // expressions

    NodePtr ParseTestList() {
        const SourcePos pos = Peek().pos;
        NodePtr first = ParseTest();
        if (!CheckOp(",")) {
            return first;
        }
        auto tuple = std::make_unique<SequenceExpr>(NodeKind::kTuple, pos);
        tuple->elements.push_back(std::move(first));
        while (MatchOp(",")) {
            if (AtStatementEnd() || CheckOp("=") || CheckOp(")")) {
                break;
            }
            tuple->elements.push_back(ParseTest());
        }
        return tuple;
    }

    NodePtr ParseTest() {
        const SourcePos pos = Peek().pos;
        DepthGuard guard(*this, pos);
        RejectUnsupported();
        NodePtr body = ParseOr();
        if (!CheckKeyword("if")) {
            return body;
        }
        Next();
        auto conditional = std::make_unique<ConditionalExpr>(pos);
        conditional->body = std::move(body);
        conditional->test = ParseOr();
        if (!MatchKeyword("else")) {
            Fail("expected 'else' in conditional expression");
        }
        conditional->orelse = ParseTest();
        return conditional;
    }

    NodePtr ParseOr() {
        const SourcePos pos = Peek().pos;
        NodePtr first = ParseAnd();
        if (!CheckKeyword("or")) {
            return first;
        }
        auto op = std::make_unique<BoolOpExpr>(pos, "or");
        op->values.push_back(std::move(first));
        while (MatchKeyword("or")) {
            op->values.push_back(ParseAnd());
        }
        return op;
    }

    NodePtr ParseAnd() {
        const SourcePos pos = Peek().pos;
        NodePtr first = ParseNot();
        if (!CheckKeyword("and")) {
            return first;
        }
        auto op = std::make_unique<BoolOpExpr>(pos, "and");
        op->values.push_back(std::move(first));
        while (MatchKeyword("and")) {
            op->values.push_back(ParseNot());
        }
        return op;
    }

    NodePtr ParseNot() {
        const SourcePos pos = Peek().pos;
        if (MatchKeyword("not")) {
            DepthGuard guard(*this, pos);
            return std::make_unique<UnaryExpr>(pos, "not", ParseNot());
        }
        return ParseComparison();
    }

    bool MatchComparisonOp(std::string& op) {
        static constexpr std::array<std::string_view, 6> kOps = {"==", "!=", "<=", ">=", "<", ">"};
        for (const auto candidate : kOps) {
            if (MatchOp(candidate)) {
                op = std::string(candidate);
                return true;
            }
        }
        if (MatchKeyword("in")) {
            op = "in";
            return true;
        }
        if (CheckKeyword("not") && Peek(1).kind == TokenKind::kKeyword && Peek(1).text == "in") {
            Next();
            Next();
            op = "not in";
            return true;
        }
        if (MatchKeyword("is")) {
            op = MatchKeyword("not") ? "is not" : "is";
            return true;
        }
        return false;
    }

    NodePtr ParseComparison() {
        const SourcePos pos = Peek().pos;
        NodePtr left = ParseArith();
        std::string op;
        if (!MatchComparisonOp(op)) {
            return left;
        }
        auto compare = std::make_unique<CompareExpr>(pos, std::move(left));
        do {
            compare->ops.push_back(op);
            compare->comparators.push_back(ParseArith());
        } while (MatchComparisonOp(op));
        return compare;
    }

    NodePtr ParseArith() {
        ChainDepth chain(*this);
        NodePtr left = ParseTerm();
        while (CheckOp("+") || CheckOp("-")) {
            const Token& op = Next();
            chain.Extend(op.pos);
            left = std::make_unique<BinaryExpr>(op.pos, op.text, std::move(left), ParseTerm());
        }
        if (CheckOp("|") || CheckOp("&") || CheckOp("^") || CheckOp("<<") || CheckOp(">>") || CheckOp("@")) {
            Fail("unsupported operator '" + Peek().text + "'");
        }
        return left;
    }

    NodePtr ParseTerm() {
        ChainDepth chain(*this);
        NodePtr left = ParseFactor();
        while (CheckOp("*") || CheckOp("/") || CheckOp("//") || CheckOp("%")) {
            const Token& op = Next();
            chain.Extend(op.pos);
            left = std::make_unique<BinaryExpr>(op.pos, op.text, std::move(left), ParseFactor());
        }
        return left;
    }

    NodePtr ParseFactor() {
        const SourcePos pos = Peek().pos;
        if (CheckOp("-") || CheckOp("+")) {
            const std::string op = Next().text;
            DepthGuard guard(*this, pos);
            return std::make_unique<UnaryExpr>(pos, op, ParseFactor());
        }
        if (CheckOp("~")) {
            Fail("unsupported operator '~'");
        }
        return ParsePower();
    }

    NodePtr ParsePower() {
        NodePtr base = ParsePostfix();
        if (CheckOp("**")) {
            const Token& op = Next();
            DepthGuard guard(*this, op.pos);
            return std::make_unique<BinaryExpr>(op.pos, "**", std::move(base), ParseFactor());
        }
        return base;
    }

    NodePtr ParsePostfix() {
        ChainDepth chain(*this);
        NodePtr node = ParseAtom();
        while (true) {
            const SourcePos pos = Peek().pos;
            if (CheckOp("(") || CheckOp("[") || CheckOp(".")) {
                chain.Extend(pos);
            }
            if (MatchOp("(")) {
                node = ParseCall(std::move(node), pos);
            } else if (MatchOp("[")) {
                auto subscript = std::make_unique<SubscriptExpr>(pos, std::move(node), ParseSubscript());
                ExpectOp("]");
                node = std::move(subscript);
            } else if (MatchOp(".")) {
                const SourcePos attr_pos = Peek().pos;
                node = std::make_unique<AttributeExpr>(attr_pos, std::move(node), ExpectName());
            } else {
                return node;
            }
        }
    }

    NodePtr ParseCall(NodePtr func, SourcePos pos) {
        auto call = std::make_unique<CallExpr>(pos, std::move(func));
        while (!CheckOp(")")) {
            if (CheckOp("*") || CheckOp("**")) {
                Fail("argument unpacking is not supported");
            }
            if (Check(TokenKind::kName) && Peek(1).kind == TokenKind::kOp && Peek(1).text == "=") {
                Keyword keyword;
                keyword.pos = Peek().pos;
                keyword.name = Next().text;
                Next();
                for (const auto& existing : call->keywords) {
                    if (existing.name == keyword.name) {
                        throw SyntaxError("keyword argument repeated: " + keyword.name, keyword.pos);
                    }
                }
                keyword.value = ParseTest();
                call->keywords.push_back(std::move(keyword));
            } else {
                if (!call->keywords.empty()) {
                    Fail("positional argument follows keyword argument");
                }
                const SourcePos arg_pos = Peek().pos;
                NodePtr arg = ParseTest();
                if (CheckKeyword("for")) {
                    arg = ParseComprehensionTail(std::move(arg), arg_pos);
                }
                call->args.push_back(std::move(arg));
            }
            if (!MatchOp(",")) {
                break;
            }
        }
        ExpectOp(")");
        return call;
    }

    NodePtr ParseSliceBound() {
        if (CheckOp(":") || CheckOp("]")) {
            return nullptr;
        }
        return ParseTest();
    }

    NodePtr ParseSubscript() {
        const SourcePos pos = Peek().pos;
        NodePtr lower = ParseSliceBound();
        if (!CheckOp(":")) {
            if (!lower) {
                Fail("expected an index");
            }
            if (CheckOp(",")) {
                auto tuple = std::make_unique<SequenceExpr>(NodeKind::kTuple, pos);
                tuple->elements.push_back(std::move(lower));
                while (MatchOp(",")) {
                    if (CheckOp("]")) {
                        break;
                    }
                    tuple->elements.push_back(ParseTest());
                }
                return tuple;
            }
            return lower;
        }
        auto slice = std::make_unique<SliceExpr>(pos);
        slice->lower = std::move(lower);
        ExpectOp(":");
        slice->upper = ParseSliceBound();
        if (MatchOp(":")) {
            slice->step = ParseSliceBound();
        }
        return slice;
    }

    NodePtr ParseComprehensionTail(NodePtr element, SourcePos pos) {
        auto comp = std::make_unique<ListCompExpr>(pos);
        comp->element = std::move(element);
        if (!MatchKeyword("for")) {
            Fail("expected 'for'");
        }
        comp->target = ParseTargetList();
        if (!IsAssignable(*comp->target)) {
            throw SyntaxError("cannot assign to " + std::string(ToString(comp->target->kind)), comp->target->pos);
        }
        if (!MatchKeyword("in")) {
            Fail("expected 'in'");
        }
        comp->iter = ParseOr();
        while (MatchKeyword("if")) {
            comp->conditions.push_back(ParseOr());
        }
        if (CheckKeyword("for")) {
            Fail("nested comprehension loops are not supported");
        }
        return comp;
    }

    NodePtr ParseAtom() {
        const Token& token = Peek();
        const SourcePos pos = token.pos;
        switch (token.kind) {
            case TokenKind::kInt:
                Next();
                return std::make_unique<ConstantExpr>(pos, Constant{token.int_value});
            case TokenKind::kFloat:
                Next();
                return std::make_unique<ConstantExpr>(pos, Constant{token.float_value});
            case TokenKind::kString: {
                std::string text = Next().text;
                while (Check(TokenKind::kString)) {
                    text += Next().text;
                }
                return std::make_unique<ConstantExpr>(pos, Constant{std::move(text)});
            }
            case TokenKind::kName: {
                std::string name = Next().text;
                if (name == "true") {
                    return std::make_unique<ConstantExpr>(pos, Constant{true});
                }
                if (name == "false") {
                    return std::make_unique<ConstantExpr>(pos, Constant{false});
                }
                if (name == "null") {
                    return std::make_unique<ConstantExpr>(pos, Constant{});
                }
                return std::make_unique<NameExpr>(pos, std::move(name));
            }
            case TokenKind::kKeyword:
                if (token.text == "True" || token.text == "False") {
                    const bool value = token.text == "True";
                    Next();
                    return std::make_unique<ConstantExpr>(pos, Constant{value});
                }
                if (token.text == "None") {
                    Next();
                    return std::make_unique<ConstantExpr>(pos, Constant{});
                }
                RejectUnsupported();
                Unexpected();
            case TokenKind::kOp:
                if (token.text == "(") {
                    Next();
                    DepthGuard guard(*this, pos);
                    return ParseParenthesized(pos);
                }
                if (token.text == "[") {
                    Next();
                    DepthGuard guard(*this, pos);
                    return ParseListDisplay(pos);
                }
                if (token.text == "{") {
                    Next();
                    DepthGuard guard(*this, pos);
                    return ParseDictDisplay(pos);
                }
                Unexpected();
            default:
                Unexpected();
        }
    }

    NodePtr ParseParenthesized(SourcePos pos) {
        if (MatchOp(")")) {
            return std::make_unique<SequenceExpr>(NodeKind::kTuple, pos);
        }
        NodePtr first = ParseTest();
        if (CheckKeyword("for")) {
            Fail("generator expressions are not supported");
        }
        if (MatchOp(")")) {
            return first;
        }
        auto tuple = std::make_unique<SequenceExpr>(NodeKind::kTuple, pos);
        tuple->elements.push_back(std::move(first));
        while (MatchOp(",")) {
            if (CheckOp(")")) {
                break;
            }
            tuple->elements.push_back(ParseTest());
        }
        ExpectOp(")");
        return tuple;
    }

    NodePtr ParseListDisplay(SourcePos pos) {
        auto list = std::make_unique<SequenceExpr>(NodeKind::kList, pos);
        if (MatchOp("]")) {
            return list;
        }
        NodePtr first = ParseTest();
        if (CheckKeyword("for")) {
            NodePtr comp = ParseComprehensionTail(std::move(first), pos);
            ExpectOp("]");
            return comp;
        }
        list->elements.push_back(std::move(first));
        while (MatchOp(",")) {
            if (CheckOp("]")) {
                break;
            }
            list->elements.push_back(ParseTest());
        }
        ExpectOp("]");
        return list;
    }

    NodePtr ParseDictDisplay(SourcePos pos) {
        auto dict = std::make_unique<DictExpr>(pos);
        while (!CheckOp("}")) {
            if (CheckOp("**")) {
                Fail("dict unpacking is not supported");
            }
            dict->keys.push_back(ParseTest());
            if (!MatchOp(":")) {
                Fail(dict->keys.size() == 1 ? "set literals are not supported" : "expected ':'");
            }
            dict->values.push_back(ParseTest());
            if (CheckKeyword("for")) {
                Fail("dict comprehensions are not supported");
            }
            if (!MatchOp(",")) {
                break;
            }
        }
        ExpectOp("}");
        return dict;
    }

    std::vector<Token> tokens_;
    ParseOptions options_;
    std::size_t pos_ = 0;
    int depth_ = 0;
    int loop_depth_ = 0;
    int function_depth_ = 0;
};

}  // namespace

std::unique_ptr<Module> Parse(std::string_view source, const ParseOptions& options) {
    return Parser(Tokenize(source), options).ParseModule();
}

}  // namespace warden::script
