#include "script/interpreter.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "script/parser.hpp"

namespace warden::script {
namespace {

class InterpreterTest : public ::testing::Test {
protected:
    InterpreterOptions Options() const {
        InterpreterOptions options;
        options.allowed_imports = {"functools", "itertools", "json", "math", "re", "string"};
        options.max_output_bytes = 4096;
        options.max_memory_bytes = 16u * 1024 * 1024;
        return options;
    }

    Interpreter& Runtime() {
        if (!interp_) {
            interp_ = std::make_unique<Interpreter>(MakeDefaultGuards("_"), Options());
        }
        return *interp_;
    }

    void Run(const std::string& source) {
        modules_.push_back(Parse(source));
        Runtime().Run(*modules_.back());
    }

    utils::Json Result() {
        const Value* value = Runtime().FindGlobal("result");
        if (value == nullptr) {
            ADD_FAILURE() << "result is not bound";
            return nullptr;
        }
        auto json = ToJson(*value);
        if (!json) {
            ADD_FAILURE() << "result is not representable";
            return nullptr;
        }
        return *json;
    }

    utils::Json Eval(const std::string& source) {
        Run(source);
        return Result();
    }

    ScriptError ExpectScriptError(const std::string& source) {
        try {
            Run(source);
        } catch (const ScriptError& ex) {
            return ex;
        }
        ADD_FAILURE() << "no script error for: " << source;
        return ScriptError("None", "");
    }

    // Parsed trees outlive the interpreter that points into them.
    std::vector<std::unique_ptr<Module>> modules_;
    std::unique_ptr<Interpreter> interp_;
};

TEST_F(InterpreterTest, EvaluatesArithmetic) {
    EXPECT_EQ(Eval("result = 2 + 2"), 4);
    EXPECT_EQ(Eval("result = 7 // 2 + 7 % 3"), 4);
    EXPECT_EQ(Eval("result = -7 // 2"), -4);
    EXPECT_EQ(Eval("result = 2 ** 10"), 1024);
    EXPECT_DOUBLE_EQ(Eval("result = 7 / 2").get<double>(), 3.5);
}

TEST_F(InterpreterTest, ReportsIntegerOverflow) {
    EXPECT_EQ(ExpectScriptError("x = 9223372036854775807 + 1").type_name(), "OverflowError");
}

TEST_F(InterpreterTest, RefusesRangesLongerThanSixtyFourBits) {
    Run("lo = -9223372036854775807 - 1\nhi = 9223372036854775807\n");
    EXPECT_EQ(ExpectScriptError("n = len(range(lo, hi))").type_name(), "OverflowError");
    EXPECT_EQ(ExpectScriptError("r = range(lo, hi)[1:]").type_name(), "OverflowError");
    EXPECT_EQ(ExpectScriptError("for i in range(lo, hi):\n    pass\n").type_name(), "OverflowError");
    EXPECT_EQ(Eval("result = bool(range(lo, hi))"), true);
    EXPECT_EQ(Eval("result = len(range(lo, -1))"), INT64_MAX);
    EXPECT_EQ(Eval("result = range(lo, -1)[-1]"), -2);
}

TEST_F(InterpreterTest, RunsFunctionsAndRecursion) {
    const auto value = Eval(
        "def fact(n):\n"
        "    if n <= 1:\n"
        "        return 1\n"
        "    return n * fact(n - 1)\n"
        "result = fact(10)\n");
    EXPECT_EQ(value, 3628800);
}

TEST_F(InterpreterTest, BindsKeywordAndDefaultArguments) {
    const auto value = Eval(
        "def greet(name, greeting='hi'):\n"
        "    return greeting + ' ' + name\n"
        "result = [greet('a'), greet('b', greeting='yo')]\n");
    EXPECT_EQ(value, utils::Json::parse(R"(["hi a", "yo b"])"));
}

TEST_F(InterpreterTest, StopsRunawayRecursion) {
    const auto error = ExpectScriptError(
        "def f(n):\n"
        "    return f(n + 1)\n"
        "f(0)\n");
    EXPECT_EQ(error.type_name(), "RecursionError");
}

TEST_F(InterpreterTest, BuildsCollections) {
    EXPECT_EQ(Eval("result = [x * x for x in range(5) if x % 2 == 0]"), utils::Json::parse("[0, 4, 16]"));
    EXPECT_EQ(Eval("d = {'a': 1}\nd['b'] = 2\nresult = sorted(d.keys())"), utils::Json::parse(R"(["a", "b"])"));
    EXPECT_EQ(Eval("result = 'hello'[1:4]"), "ell");
    EXPECT_EQ(Eval("result = [1, 2, 3, 4][::-1]"), utils::Json::parse("[4, 3, 2, 1]"));
    EXPECT_EQ(Eval("a, b = 1, 2\nresult = b - a"), 1);
}

TEST_F(InterpreterTest, BuildsSets) {
    Run("s = set([3, 1, 3, 2])\ns.add(4)\ns.discard(1)\n");
    EXPECT_EQ(Eval("result = sorted(s)"), utils::Json::parse("[2, 3, 4]"));
    EXPECT_EQ(Eval("result = [len(s), 3 in s, 1 in s]"), utils::Json::parse("[3, true, false]"));
    EXPECT_EQ(Eval("result = sorted(s.union([9], (8,)))"), utils::Json::parse("[2, 3, 4, 8, 9]"));
    EXPECT_EQ(Eval("result = sorted(s.intersection(range(3, 10)))"), utils::Json::parse("[3, 4]"));
    EXPECT_EQ(Eval("result = sorted(s.difference([2]))"), utils::Json::parse("[3, 4]"));
    EXPECT_EQ(Eval("result = sorted(s.symmetric_difference([4, 5]))"), utils::Json::parse("[2, 3, 5]"));
    EXPECT_EQ(Eval("result = [set([2]).issubset(s), s.issuperset([2, 3]), s.isdisjoint([7])]"),
              utils::Json::parse("[true, true, true]"));
    EXPECT_EQ(Eval("result = set([1, 2]) == frozenset([2, 1])"), true);
    EXPECT_EQ(Eval("result = [repr(set()), str(frozenset([1])), repr(set(['a']))]"),
              utils::Json::parse(R"j(["set()", "frozenset({1})", "{'a'}"])j"));
    EXPECT_EQ(Eval("result = isinstance(s, set) and not isinstance(s, frozenset)"), true);
    EXPECT_EQ(Eval("d = {frozenset([1, 2]): 'pair'}\nresult = d[frozenset([2, 1])]"), "pair");
    EXPECT_EQ(ExpectScriptError("s.remove(42)").type_name(), "KeyError");
    EXPECT_EQ(ExpectScriptError("t = set([[1]])").type_name(), "TypeError");
    EXPECT_EQ(ExpectScriptError("t = {s: 1}").type_name(), "TypeError");
    EXPECT_EQ(ExpectScriptError("x = s[0]").type_name(), "TypeError");
    EXPECT_EQ(ExpectScriptError("frozenset([1]).add(2)").type_name(), "AttributeError");
}

TEST_F(InterpreterTest, MapsAndFiltersEagerly) {
    Run("def double(x):\n    return x * 2\n");
    EXPECT_EQ(Eval("result = map(double, [1, 2, 3])"), utils::Json::parse("[2, 4, 6]"));
    EXPECT_EQ(Eval("result = list(map(pow, [2, 3], [3, 2, 99]))"), utils::Json::parse("[8, 9]"));
    EXPECT_EQ(Eval("result = filter(None, [0, 1, '', 'a'])"), utils::Json::parse(R"([1, "a"])"));
    EXPECT_EQ(Eval("def odd(n):\n    return n % 2\nresult = filter(odd, range(6))"), utils::Json::parse("[1, 3, 5]"));
    EXPECT_EQ(ExpectScriptError("x = map(double)").type_name(), "TypeError");
    EXPECT_EQ(ExpectScriptError("x = map(1, [1])").type_name(), "TypeError");
}

TEST_F(InterpreterTest, GuardsSetsAndMapArguments) {
    EXPECT_THROW(Run("x = map(abs, len)\n"), SecurityViolation);
    EXPECT_THROW(Run("x = filter(None, print)\n"), SecurityViolation);
    EXPECT_THROW(Run("x = set(len)\n"), SecurityViolation);
    EXPECT_THROW(Run("x = set().__class__\n"), SecurityViolation);
    EXPECT_THROW(Run("x = frozenset().__hash__\n"), SecurityViolation);
}

TEST_F(InterpreterTest, ControlsLoops) {
    const auto value = Eval(
        "total = 0\n"
        "for i in range(10):\n"
        "    if i == 7:\n"
        "        break\n"
        "    if i % 2:\n"
        "        continue\n"
        "    total += i\n"
        "result = total\n");
    EXPECT_EQ(value, 0 + 2 + 4 + 6);
}

TEST_F(InterpreterTest, CallsStringMethods) {
    EXPECT_EQ(Eval("result = ','.join(['a', 'b'])"), "a,b");
    EXPECT_EQ(Eval("result = '  Hi '.strip().upper()"), "HI");
    EXPECT_EQ(Eval("result = 'a-b-c'.split('-')"), utils::Json::parse(R"(["a", "b", "c"])"));
    EXPECT_EQ(Eval("result = 'x={}'.format(3)"), "x=3");
}

TEST_F(InterpreterTest, PrintsToCapturedOutput) {
    Run("print('a', 1, sep='-')\nprint('b', end='')\n");
    EXPECT_EQ(Runtime().out().contents(), "a-1\nb");
    EXPECT_FALSE(Runtime().out().truncated());
}

TEST_F(InterpreterTest, TruncatesOutputAtCapacity) {
    Run("print('x' * 10000)\n");
    EXPECT_EQ(Runtime().out().contents().size(), 4096u);
    EXPECT_TRUE(Runtime().out().truncated());
}

TEST_F(InterpreterTest, CatchesScriptExceptions) {
    const auto value = Eval(
        "try:\n"
        "    x = 1 // 0\n"
        "except ArithmeticError as e:\n"
        "    result = str(e)\n");
    EXPECT_EQ(value, "integer division or modulo by zero");
    EXPECT_EQ(Eval("try:\n    raise ValueError('bad')\nexcept Exception:\n    result = 'caught'\n"), "caught");
}

TEST_F(InterpreterTest, ReportsUncaughtErrorsWithLine) {
    const auto error = ExpectScriptError("x = 1\ny = 2\nz = missing\n");
    EXPECT_EQ(error.type_name(), "NameError");
    EXPECT_EQ(error.line(), 3);
}

TEST_F(InterpreterTest, ImportsAllowedModules) {
    EXPECT_EQ(Eval("import json\nresult = json.dumps({'a': [1, 2]})"), R"({"a":[1,2]})");
    EXPECT_EQ(Eval("import json\nresult = json.loads('[1, true, null]')"), utils::Json::parse("[1, true, null]"));
    EXPECT_EQ(Eval("from math import sqrt\nresult = sqrt(16)"), 4.0);
    EXPECT_EQ(Eval("import re\nresult = re.findall('[0-9]+', 'a1b22c333')"),
              utils::Json::parse(R"(["1", "22", "333"])"));
}

TEST_F(InterpreterTest, ImportsFunctoolsAndItertools) {
    EXPECT_EQ(Eval("from functools import reduce\nresult = reduce(pow, [2, 3, 2])"), 64);
    EXPECT_EQ(Eval("result = reduce(max, [], 'empty')"), "empty");
    EXPECT_EQ(ExpectScriptError("x = reduce(max, [])").type_name(), "TypeError");

    Run("import itertools\n");
    EXPECT_EQ(Eval("result = itertools.chain([1], (2, 3), 'a')"), utils::Json::parse(R"([1, 2, 3, "a"])"));
    EXPECT_EQ(Eval("result = itertools.product('ab', [0, 1])"),
              utils::Json::parse(R"([["a", 0], ["a", 1], ["b", 0], ["b", 1]])"));
    EXPECT_EQ(Eval("result = len(itertools.product([0, 1], repeat=3))"), 8);
    EXPECT_EQ(Eval("result = itertools.product()"), utils::Json::parse("[[]]"));
    EXPECT_EQ(Eval("result = itertools.permutations([1, 2, 3], 2)"),
              utils::Json::parse("[[1, 2], [1, 3], [2, 1], [2, 3], [3, 1], [3, 2]]"));
    EXPECT_EQ(Eval("result = len(itertools.permutations(range(5)))"), 120);
    EXPECT_EQ(Eval("result = itertools.combinations('abcd', 2)"),
              utils::Json::parse(R"([["a","b"],["a","c"],["a","d"],["b","c"],["b","d"],["c","d"]])"));
    EXPECT_EQ(Eval("result = itertools.combinations([1, 2], 3)"), utils::Json::parse("[]"));
    EXPECT_EQ(Eval("result = itertools.accumulate([1, 2, 3, 4])"), utils::Json::parse("[1, 3, 6, 10]"));
    EXPECT_EQ(Eval("result = itertools.accumulate([3, 1, 4], max, initial=2)"), utils::Json::parse("[2, 3, 3, 4]"));
    EXPECT_THROW(Run("x = itertools.chain(len)\n"), SecurityViolation);
    EXPECT_THROW(Run("x = itertools.permutations(range(12))\n"), ResourceExhausted);
}

TEST_F(InterpreterTest, RefusesImportsOutsideAllowList) {
    EXPECT_THROW(Run("import os\n"), SecurityViolation);
    EXPECT_THROW(Run("from subprocess import run\n"), SecurityViolation);
}

TEST_F(InterpreterTest, RefusesReservedNamesAndAttributes) {
    EXPECT_THROW(Run("x = 'a'.__class__\n"), SecurityViolation);
    EXPECT_THROW(Run("x = __builtins__\n"), SecurityViolation);
    EXPECT_THROW(Run("_hidden = 1\n"), SecurityViolation);
}

TEST_F(InterpreterTest, SecurityViolationsAreNotCatchable) {
    EXPECT_THROW(Run("try:\n    x = __import__\nexcept Exception:\n    result = 1\n"), SecurityViolation);
    EXPECT_EQ(Runtime().FindGlobal("result"), nullptr);
}

TEST_F(InterpreterTest, RefusesSubscriptOfFunctions) {
    EXPECT_THROW(Run("def f():\n    return 1\nx = f[0]\n"), SecurityViolation);
    EXPECT_THROW(Run("for x in len:\n    pass\n"), SecurityViolation);
}

TEST_F(InterpreterTest, HasNoDynamicEvaluationBuiltins) {
    for (const char* name : {"eval", "exec", "open", "getattr", "compile", "globals", "type"}) {
        const auto error = ExpectScriptError(std::string("x = ") + name + "\n");
        EXPECT_EQ(error.type_name(), "NameError") << name;
    }
}

TEST_F(InterpreterTest, BoundsAllocations) {
    EXPECT_THROW(Run("s = 'x' * 100000000\n"), ResourceExhausted);
    EXPECT_THROW(Run("items = list(range(100000000))\n"), ResourceExhausted);
}

TEST_F(InterpreterTest, ExposesInjectedContext) {
    Runtime().SetGlobal("data", FromJson(utils::Json::parse(R"({"n": [1, 2, 3], "label": "sum"})")));
    EXPECT_EQ(Eval("result = data['label'] + '=' + str(sum(data['n']))"), "sum=6");
}

TEST_F(InterpreterTest, RejectsIncompleteGuards) {
    GuardHooks hooks = MakeDefaultGuards("_");
    hooks.getiter = nullptr;
    EXPECT_THROW(Interpreter(hooks, Options()), GuardConfigurationError);
}

TEST(GuardsTest, AttributeAllowList) {
    EXPECT_TRUE(IsAttributeAllowed(ValueKind::kStr, "upper"));
    EXPECT_TRUE(IsAttributeAllowed(ValueKind::kDict, "items"));
    EXPECT_FALSE(IsAttributeAllowed(ValueKind::kStr, "__class__"));
    EXPECT_FALSE(IsAttributeAllowed(ValueKind::kFunction, "name"));
}

TEST(GuardsTest, InplaceGuardRefusesUnknownOperators) {
    const auto hooks = MakeDefaultGuards("_");
    EXPECT_NO_THROW(hooks.inplace("+", Value::Int(1)));
    EXPECT_THROW(hooks.inplace("**", Value::Int(1)), SecurityViolation);
    EXPECT_THROW(hooks.inplace("+", Value::ExceptionType("ValueError")), SecurityViolation);
}

TEST(OutputBufferTest, DropsWritesPastCapacity) {
    BoundedBuffer buffer(5);
    buffer.Append("abc");
    buffer.Append("defg");
    EXPECT_EQ(buffer.contents(), "abcde");
    EXPECT_TRUE(buffer.truncated());
}

}  // namespace
}  // namespace warden::script
