#include "script/modules.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <optional>
#include <regex>
#include <string_view>

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/interpreter.hpp"
#include "script/operators.hpp"

namespace warden::script {
namespace {

constexpr std::size_t kMaxJsonDepth = 64;
constexpr std::size_t kMaxPatternBytes = 1024;
constexpr std::size_t kMaxSubjectBytes = 64 * 1024;

constexpr std::int64_t kIgnoreCase = 2;
constexpr std::int64_t kMultiline = 8;

using UnaryMath = double (*)(double);

void AddFunction(ModuleData& module, const std::string& name, BuiltinFn fn) {
    module.members.emplace(name, Value::Builtin(module.name + "." + name, std::move(fn)));
}

double CheckedResult(double result, double input) {
    if (std::isnan(result) && !std::isnan(input)) {
        throw ScriptError("ValueError", "math domain error");
    }
    if (std::isinf(result) && std::isfinite(input)) {
        throw ScriptError("OverflowError", "math range error");
    }
    return result;
}

void AddUnary(ModuleData& module, const std::string& name, UnaryMath fn) {
    AddFunction(module, name, [name, fn](Interpreter&, CallArgs& args) {
        NoKeywords(args, name);
        CheckArity(args, name, 1, 1);
        const double x = NumberArg(args.positional[0], name);
        return Value::Float(CheckedResult(fn(x), x));
    });
}

Value Rounding(CallArgs& args, const std::string& name, double (*fn)(double)) {
    NoKeywords(args, name);
    CheckArity(args, name, 1, 1);
    const Value& value = args.positional[0];
    if (value.is(ValueKind::kInt) || value.is(ValueKind::kBool)) {
        return Value::Int(value.AsInt());
    }
    const double x = fn(NumberArg(value, name));
    if (std::isnan(x)) {
        throw ScriptError("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(x) || x >= 9223372036854775808.0 || x < -9223372036854775808.0) {
        throw ScriptError("OverflowError", "cannot convert float infinity to integer");
    }
    return Value::Int(static_cast<std::int64_t>(x));
}

std::shared_ptr<ModuleData> MakeMath() {
    auto module = std::make_shared<ModuleData>();
    module->name = "math";
    auto& m = *module;
    m.members.emplace("pi", Value::Float(M_PI));
    m.members.emplace("e", Value::Float(M_E));
    m.members.emplace("tau", Value::Float(2 * M_PI));
    m.members.emplace("inf", Value::Float(HUGE_VAL));
    m.members.emplace("nan", Value::Float(std::nan("")));
    AddUnary(m, "sqrt", [](double x) { return x < 0 ? std::nan("") : std::sqrt(x); });
    AddUnary(m, "exp", [](double x) { return std::exp(x); });
    AddUnary(m, "log10", [](double x) { return x <= 0 ? std::nan("") : std::log10(x); });
    AddUnary(m, "log2", [](double x) { return x <= 0 ? std::nan("") : std::log2(x); });
    AddUnary(m, "sin", [](double x) { return std::sin(x); });
    AddUnary(m, "cos", [](double x) { return std::cos(x); });
    AddUnary(m, "tan", [](double x) { return std::tan(x); });
    AddUnary(m, "asin", [](double x) { return std::asin(x); });
    AddUnary(m, "acos", [](double x) { return std::acos(x); });
    AddUnary(m, "atan", [](double x) { return std::atan(x); });
    AddUnary(m, "fabs", [](double x) { return std::fabs(x); });
    AddUnary(m, "degrees", [](double x) { return x * 180.0 / M_PI; });
    AddUnary(m, "radians", [](double x) { return x * M_PI / 180.0; });
    AddFunction(m, "floor", [](Interpreter&, CallArgs& args) {
        return Rounding(args, "floor", [](double x) { return std::floor(x); });
    });
    AddFunction(m, "ceil", [](Interpreter&, CallArgs& args) {
        return Rounding(args, "ceil", [](double x) { return std::ceil(x); });
    });
    AddFunction(m, "trunc", [](Interpreter&, CallArgs& args) {
        return Rounding(args, "trunc", [](double x) { return std::trunc(x); });
    });
    AddFunction(m, "log", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "log");
        CheckArity(args, "log", 1, 2);
        const double x = NumberArg(args.positional[0], "log");
        if (x <= 0) {
            throw ScriptError("ValueError", "math domain error");
        }
        if (args.positional.size() == 1) {
            return Value::Float(std::log(x));
        }
        const double base = NumberArg(args.positional[1], "log");
        if (base <= 0 || base == 1.0) {
            throw ScriptError(base == 1.0 ? "ZeroDivisionError" : "ValueError",
                              base == 1.0 ? "float division by zero" : "math domain error");
        }
        return Value::Float(std::log(x) / std::log(base));
    });
    AddFunction(m, "pow", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "pow");
        CheckArity(args, "pow", 2, 2);
        const double x = NumberArg(args.positional[0], "pow");
        const double y = NumberArg(args.positional[1], "pow");
        return Value::Float(CheckedResult(std::pow(x, y), x + y));
    });
    AddFunction(m, "atan2", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "atan2");
        CheckArity(args, "atan2", 2, 2);
        return Value::Float(std::atan2(NumberArg(args.positional[0], "atan2"), NumberArg(args.positional[1], "atan2")));
    });
    AddFunction(m, "hypot", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "hypot");
        double total = 0.0;
        for (const auto& value : args.positional) {
            const double x = NumberArg(value, "hypot");
            total += x * x;
        }
        return Value::Float(std::sqrt(total));
    });
    AddFunction(m, "isfinite", [](Interpreter&, CallArgs& args) {
        CheckArity(args, "isfinite", 1, 1);
        return Value::Bool(std::isfinite(NumberArg(args.positional[0], "isfinite")));
    });
    AddFunction(m, "isinf", [](Interpreter&, CallArgs& args) {
        CheckArity(args, "isinf", 1, 1);
        return Value::Bool(std::isinf(NumberArg(args.positional[0], "isinf")));
    });
    AddFunction(m, "isnan", [](Interpreter&, CallArgs& args) {
        CheckArity(args, "isnan", 1, 1);
        return Value::Bool(std::isnan(NumberArg(args.positional[0], "isnan")));
    });
    AddFunction(m, "factorial", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "factorial");
        CheckArity(args, "factorial", 1, 1);
        const std::int64_t n = IntArg(args.positional[0], "factorial");
        if (n < 0) {
            throw ScriptError("ValueError", "factorial() not defined for negative values");
        }
        std::int64_t result = 1;
        for (std::int64_t i = 2; i <= n; ++i) {
            result = CheckedMul(result, i);
        }
        return Value::Int(result);
    });
    AddFunction(m, "gcd", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "gcd");
        std::int64_t result = 0;
        for (const auto& value : args.positional) {
            const std::int64_t n = IntArg(value, "gcd");
            if (n == INT64_MIN) {
                throw ScriptError("OverflowError", "integer overflow");
            }
            result = std::gcd(result, n);
        }
        return Value::Int(result);
    });
    AddFunction(m, "fsum", [](Interpreter& interp, CallArgs& args) {
        NoKeywords(args, "fsum");
        CheckArity(args, "fsum", 1, 1);
        // Kahan summation.
        double sum = 0.0;
        double compensation = 0.0;
        interp.ForEach(args.positional[0], [&](const Value& item) {
            const double y = NumberArg(item, "fsum") - compensation;
            const double t = sum + y;
            compensation = (t - sum) - y;
            sum = t;
            return true;
        });
        return Value::Float(sum);
    });
    return module;
}

std::size_t NestingDepth(std::string_view text) {
    std::size_t depth = 0;
    std::size_t deepest = 0;
    bool in_string = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '[' || c == '{') {
            deepest = std::max(deepest, ++depth);
        } else if ((c == ']' || c == '}') && depth > 0) {
            --depth;
        }
    }
    return deepest;
}

std::shared_ptr<ModuleData> MakeJson() {
    auto module = std::make_shared<ModuleData>();
    module->name = "json";
    AddFunction(*module, "dumps", [](Interpreter& interp, CallArgs& args) {
        std::optional<Value> indent = PopKeyword(args, "indent");
        std::optional<Value> sort_keys = PopKeyword(args, "sort_keys");
        NoKeywords(args, "dumps");
        CheckArity(args, "dumps", 1, 1);
        auto json = ToJson(args.positional[0], static_cast<int>(kMaxJsonDepth));
        if (!json) {
            throw ScriptError("TypeError", std::string("Object of type ") + TypeName(args.positional[0]) +
                                               " is not JSON serializable");
        }
        const int width = indent && !indent->is(ValueKind::kNone) ? static_cast<int>(IntArg(*indent, "dumps")) : -1;
        std::string text;
        if (sort_keys && Truthy(*sort_keys)) {
            text = nlohmann::json(*json).dump(width);
        } else {
            text = json->dump(width);
        }
        interp.CheckAllocation(text.size(), 1);
        return Value::Str(std::move(text));
    });
    AddFunction(*module, "loads", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "loads");
        CheckArity(args, "loads", 1, 1);
        const std::string& text = StrArg(args.positional[0], "loads");
        if (NestingDepth(text) > kMaxJsonDepth) {
            throw ScriptError("ValueError", "JSON document is nested too deeply");
        }
        const auto json = utils::Json::parse(text, nullptr, false);
        if (json.is_discarded()) {
            throw ScriptError("ValueError", "invalid JSON document");
        }
        return FromJson(json);
    });
    return module;
}

std::regex CompilePattern(const Value& pattern_value, std::int64_t flags, const std::string& fn) {
    const std::string& pattern = StrArg(pattern_value, fn);
    if (pattern.size() > kMaxPatternBytes) {
        throw ScriptError("ValueError", "pattern is too long");
    }
    auto options = std::regex::ECMAScript;
    if (flags & kIgnoreCase) {
        options |= std::regex::icase;
    }
    if (flags & kMultiline) {
        options |= std::regex::multiline;
    }
    try {
        return std::regex(pattern, options);
    } catch (const std::regex_error& error) {
        throw ScriptError("ValueError", "invalid regular expression: " + std::string(error.what()));
    }
}

const std::string& Subject(const Value& value, const std::string& fn) {
    const std::string& subject = StrArg(value, fn);
    if (subject.size() > kMaxSubjectBytes) {
        throw ScriptError("ValueError", "string is too long for regular expression matching");
    }
    return subject;
}

std::int64_t Flags(CallArgs& args, std::size_t position, const std::string& fn) {
    std::optional<Value> flags = PopKeyword(args, "flags");
    if (args.positional.size() > position) {
        flags = args.positional[position];
    }
    return flags ? IntArg(*flags, fn) : 0;
}

Value MakeMatch(const std::smatch& match) {
    auto data = std::make_shared<MatchData>();
    for (std::size_t i = 0; i < match.size(); ++i) {
        if (match[i].matched) {
            data->groups.emplace_back(match[i].str());
        } else {
            data->groups.emplace_back(std::nullopt);
        }
    }
    data->start = static_cast<std::int64_t>(match.position(0));
    data->end = data->start + static_cast<std::int64_t>(match.length(0));
    return Value::Match(std::move(data));
}

[[noreturn]] void RegexError(const std::regex_error& error) {
    throw ScriptError("RuntimeError", "regular expression matching failed: " + std::string(error.what()));
}

enum class MatchMode { kSearch, kMatch, kFullMatch };

Value Find(CallArgs& args, const std::string& fn, MatchMode mode) {
    const std::int64_t flags = Flags(args, 2, fn);
    NoKeywords(args, fn);
    CheckArity(args, fn, 2, 3);
    const std::regex re = CompilePattern(args.positional[0], flags, fn);
    const std::string& subject = Subject(args.positional[1], fn);
    std::smatch match;
    try {
        bool found = false;
        switch (mode) {
            case MatchMode::kSearch:
                found = std::regex_search(subject, match, re);
                break;
            case MatchMode::kMatch:
                found = std::regex_search(subject, match, re, std::regex_constants::match_continuous);
                break;
            case MatchMode::kFullMatch:
                found = std::regex_match(subject, match, re);
                break;
        }
        return found ? MakeMatch(match) : Value::None();
    } catch (const std::regex_error& error) {
        RegexError(error);
    }
}

std::shared_ptr<ModuleData> MakeRe() {
    auto module = std::make_shared<ModuleData>();
    module->name = "re";
    module->members.emplace("IGNORECASE", Value::Int(kIgnoreCase));
    module->members.emplace("I", Value::Int(kIgnoreCase));
    module->members.emplace("MULTILINE", Value::Int(kMultiline));
    module->members.emplace("M", Value::Int(kMultiline));
    AddFunction(*module, "search",
                [](Interpreter&, CallArgs& args) { return Find(args, "search", MatchMode::kSearch); });
    AddFunction(*module, "match", [](Interpreter&, CallArgs& args) { return Find(args, "match", MatchMode::kMatch); });
    AddFunction(*module, "fullmatch",
                [](Interpreter&, CallArgs& args) { return Find(args, "fullmatch", MatchMode::kFullMatch); });
    AddFunction(*module, "findall", [](Interpreter& interp, CallArgs& args) {
        const std::int64_t flags = Flags(args, 2, "findall");
        NoKeywords(args, "findall");
        CheckArity(args, "findall", 2, 3);
        const std::regex re = CompilePattern(args.positional[0], flags, "findall");
        const std::string& subject = Subject(args.positional[1], "findall");
        std::vector<Value> out;
        try {
            for (auto it = std::sregex_iterator(subject.begin(), subject.end(), re); it != std::sregex_iterator();
                 ++it) {
                const std::smatch& match = *it;
                interp.CheckAllocation(out.size() + 1, sizeof(Value));
                if (match.size() == 1) {
                    out.push_back(Value::Str(match.str(0)));
                } else if (match.size() == 2) {
                    out.push_back(Value::Str(match.str(1)));
                } else {
                    std::vector<Value> groups;
                    for (std::size_t i = 1; i < match.size(); ++i) {
                        groups.push_back(Value::Str(match.str(i)));
                    }
                    out.push_back(Value::Tuple(std::move(groups)));
                }
            }
        } catch (const std::regex_error& error) {
            RegexError(error);
        }
        return Value::List(std::move(out));
    });
    AddFunction(*module, "sub", [](Interpreter& interp, CallArgs& args) {
        std::optional<Value> count_kw = PopKeyword(args, "count");
        const std::int64_t flags = Flags(args, 4, "sub");
        NoKeywords(args, "sub");
        CheckArity(args, "sub", 3, 5);
        const std::regex re = CompilePattern(args.positional[0], flags, "sub");
        const std::string& replacement = StrArg(args.positional[1], "sub");
        const std::string& subject = Subject(args.positional[2], "sub");
        std::int64_t count = 0;
        if (args.positional.size() >= 4) {
            count = IntArg(args.positional[3], "sub");
        } else if (count_kw) {
            count = IntArg(*count_kw, "sub");
        }
        // Python's \1 group references become ECMAScript's $1.
        std::string format;
        for (std::size_t i = 0; i < replacement.size(); ++i) {
            if (replacement[i] == '\\' && i + 1 < replacement.size() &&
                std::isdigit(static_cast<unsigned char>(replacement[i + 1]))) {
                format += '$';
            } else if (replacement[i] == '$') {
                format += "$$";
            } else {
                format += replacement[i];
            }
        }
        try {
            std::string out;
            auto last = subject.cbegin();
            std::int64_t replaced = 0;
            for (auto it = std::sregex_iterator(subject.begin(), subject.end(), re); it != std::sregex_iterator();
                 ++it) {
                if (count > 0 && replaced == count) {
                    break;
                }
                const std::smatch& match = *it;
                out.append(last, match[0].first);
                out += match.format(format);
                interp.CheckAllocation(out.size(), 1);
                last = match[0].second;
                ++replaced;
            }
            out.append(last, subject.cend());
            return Value::Str(std::move(out));
        } catch (const std::regex_error& error) {
            RegexError(error);
        }
    });
    AddFunction(*module, "split", [](Interpreter&, CallArgs& args) {
        std::optional<Value> maxsplit_kw = PopKeyword(args, "maxsplit");
        const std::int64_t flags = Flags(args, 3, "split");
        NoKeywords(args, "split");
        CheckArity(args, "split", 2, 4);
        const std::regex re = CompilePattern(args.positional[0], flags, "split");
        const std::string& subject = Subject(args.positional[1], "split");
        std::int64_t maxsplit = 0;
        if (args.positional.size() >= 3) {
            maxsplit = IntArg(args.positional[2], "split");
        } else if (maxsplit_kw) {
            maxsplit = IntArg(*maxsplit_kw, "split");
        }
        std::vector<Value> out;
        try {
            auto last = subject.cbegin();
            std::int64_t splits = 0;
            for (auto it = std::sregex_iterator(subject.begin(), subject.end(), re); it != std::sregex_iterator();
                 ++it) {
                if (maxsplit > 0 && splits == maxsplit) {
                    break;
                }
                const std::smatch& match = *it;
                if (match.length(0) == 0) {
                    continue;
                }
                out.push_back(Value::Str(std::string(last, match[0].first)));
                for (std::size_t i = 1; i < match.size(); ++i) {
                    out.push_back(match[i].matched ? Value::Str(match.str(i)) : Value::None());
                }
                last = match[0].second;
                ++splits;
            }
            out.push_back(Value::Str(std::string(last, subject.cend())));
        } catch (const std::regex_error& error) {
            RegexError(error);
        }
        return Value::List(std::move(out));
    });
    AddFunction(*module, "escape", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "escape");
        CheckArity(args, "escape", 1, 1);
        const std::string& text = StrArg(args.positional[0], "escape");
        std::string out;
        for (const char c : text) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && static_cast<unsigned char>(c) < 0x80) {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        return Value::Str(std::move(out));
    });
    return module;
}

std::shared_ptr<ModuleData> MakeString() {
    auto module = std::make_shared<ModuleData>();
    module->name = "string";
    auto& members = module->members;
    members.emplace("ascii_lowercase", Value::Str("abcdefghijklmnopqrstuvwxyz"));
    members.emplace("ascii_uppercase", Value::Str("ABCDEFGHIJKLMNOPQRSTUVWXYZ"));
    members.emplace("ascii_letters", Value::Str("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"));
    members.emplace("digits", Value::Str("0123456789"));
    members.emplace("hexdigits", Value::Str("0123456789abcdefABCDEF"));
    members.emplace("octdigits", Value::Str("01234567"));
    members.emplace("punctuation", Value::Str("!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~"));
    members.emplace("whitespace", Value::Str(" \t\n\r\x0b\x0c"));
    AddFunction(*module, "capwords", [](Interpreter&, CallArgs& args) {
        NoKeywords(args, "capwords");
        CheckArity(args, "capwords", 1, 1);
        const std::string& text = StrArg(args.positional[0], "capwords");
        std::string out;
        std::size_t pos = 0;
        while (true) {
            pos = text.find_first_not_of(" \t\n\r\f\v", pos);
            if (pos == std::string::npos) {
                break;
            }
            std::size_t end = text.find_first_of(" \t\n\r\f\v", pos);
            std::string word = text.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
            for (std::size_t i = 0; i < word.size(); ++i) {
                const auto c = static_cast<unsigned char>(word[i]);
                word[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
            }
            if (!out.empty()) {
                out.push_back(' ');
            }
            out += word;
            if (end == std::string::npos) {
                break;
            }
            pos = end;
        }
        return Value::Str(std::move(out));
    });
    return module;
}

Value CallWith(Interpreter& interp, const Value& fn, std::vector<Value> positional, int line) {
    CallArgs call;
    call.positional = std::move(positional);
    call.line = line;
    return interp.Call(fn, call);
}

std::shared_ptr<ModuleData> MakeFunctools() {
    auto module = std::make_shared<ModuleData>();
    module->name = "functools";
    AddFunction(*module, "reduce", [](Interpreter& interp, CallArgs& args) {
        NoKeywords(args, "reduce");
        CheckArity(args, "reduce", 2, 3);
        const Value fn = args.positional[0];
        std::vector<Value> items = interp.Materialize(args.positional[1]);
        std::size_t next = 0;
        Value total;
        if (args.positional.size() == 3) {
            total = args.positional[2];
        } else if (items.empty()) {
            throw ScriptError("TypeError", "reduce() of empty iterable with no initial value");
        } else {
            total = items[next++];
        }
        for (; next < items.size(); ++next) {
            total = CallWith(interp, fn, {total, items[next]}, args.line);
        }
        return total;
    });
    return module;
}

// Every itertools function here is eager and returns a list; infinite
// iterators (count, cycle, repeat without times) are left out.
std::shared_ptr<ModuleData> MakeItertools() {
    auto module = std::make_shared<ModuleData>();
    module->name = "itertools";
    auto& m = *module;
    AddFunction(m, "chain", [](Interpreter& interp, CallArgs& args) {
        NoKeywords(args, "chain");
        std::vector<Value> out;
        for (const auto& iterable : args.positional) {
            interp.ForEach(iterable, [&](const Value& item) {
                interp.CheckAllocation(out.size() + 1, sizeof(Value));
                out.push_back(item);
                return true;
            });
        }
        return Value::List(std::move(out));
    });
    AddFunction(m, "product", [](Interpreter& interp, CallArgs& args) {
        std::int64_t repeat = 1;
        if (auto value = PopKeyword(args, "repeat")) {
            repeat = IntArg(*value, "product");
        }
        NoKeywords(args, "product");
        if (repeat < 0) {
            throw ScriptError("ValueError", "repeat argument cannot be negative");
        }
        std::vector<std::vector<Value>> pools;
        for (const auto& iterable : args.positional) {
            pools.push_back(interp.Materialize(iterable));
        }
        interp.CheckAllocation(static_cast<std::size_t>(repeat), sizeof(Value) * std::max<std::size_t>(pools.size(), 1));
        std::vector<std::vector<Value>> columns;
        for (std::int64_t r = 0; r < repeat; ++r) {
            columns.insert(columns.end(), pools.begin(), pools.end());
        }
        std::vector<Value> out;
        for (const auto& column : columns) {
            if (column.empty()) {
                return Value::List(std::move(out));
            }
        }
        std::vector<std::size_t> index(columns.size(), 0);
        while (true) {
            interp.CheckAllocation(out.size() + 1, sizeof(Value) * (columns.size() + 1));
            std::vector<Value> row;
            row.reserve(columns.size());
            for (std::size_t i = 0; i < columns.size(); ++i) {
                row.push_back(columns[i][index[i]]);
            }
            out.push_back(Value::Tuple(std::move(row)));
            std::size_t pos = columns.size();
            while (pos > 0) {
                --pos;
                if (++index[pos] < columns[pos].size()) {
                    break;
                }
                index[pos] = 0;
                if (pos == 0) {
                    return Value::List(std::move(out));
                }
            }
            if (columns.empty()) {
                return Value::List(std::move(out));
            }
        }
    });
    AddFunction(m, "permutations", [](Interpreter& interp, CallArgs& args) {
        std::optional<Value> r_kw = PopKeyword(args, "r");
        NoKeywords(args, "permutations");
        CheckArity(args, "permutations", 1, 2);
        const std::vector<Value> pool = interp.Materialize(args.positional[0]);
        const std::optional<Value> r_value = args.positional.size() == 2 ? std::optional<Value>(args.positional[1]) : r_kw;
        std::int64_t r = static_cast<std::int64_t>(pool.size());
        if (r_value && !r_value->is(ValueKind::kNone)) {
            r = IntArg(*r_value, "permutations");
        }
        if (r < 0) {
            throw ScriptError("ValueError", "r must be non-negative");
        }
        std::vector<Value> out;
        if (static_cast<std::size_t>(r) > pool.size()) {
            return Value::List(std::move(out));
        }
        const std::size_t n = pool.size();
        const auto width = static_cast<std::size_t>(r);
        std::vector<std::size_t> indices(n);
        std::iota(indices.begin(), indices.end(), 0);
        std::vector<std::size_t> cycles(width);
        for (std::size_t i = 0; i < width; ++i) {
            cycles[i] = n - i;
        }
        auto emit = [&]() {
            interp.CheckAllocation(out.size() + 1, sizeof(Value) * (width + 1));
            std::vector<Value> row;
            row.reserve(width);
            for (std::size_t i = 0; i < width; ++i) {
                row.push_back(pool[indices[i]]);
            }
            out.push_back(Value::Tuple(std::move(row)));
        };
        // Emits in lexicographic index order.
        emit();
        bool more = n > 0;
        while (more) {
            more = false;
            for (std::size_t i = width; i-- > 0;) {
                if (--cycles[i] == 0) {
                    std::rotate(indices.begin() + static_cast<std::ptrdiff_t>(i),
                                indices.begin() + static_cast<std::ptrdiff_t>(i) + 1, indices.end());
                    cycles[i] = n - i;
                } else {
                    std::swap(indices[i], indices[n - cycles[i]]);
                    emit();
                    more = true;
                    break;
                }
            }
        }
        return Value::List(std::move(out));
    });
    AddFunction(m, "combinations", [](Interpreter& interp, CallArgs& args) {
        std::optional<Value> r_kw = PopKeyword(args, "r");
        NoKeywords(args, "combinations");
        const std::optional<Value> r_value = args.positional.size() == 2 ? std::optional<Value>(args.positional[1]) : r_kw;
        if (args.positional.empty() || args.positional.size() > 2 || !r_value) {
            throw ScriptError("TypeError", "combinations() takes exactly 2 arguments");
        }
        const std::vector<Value> pool = interp.Materialize(args.positional[0]);
        const std::int64_t r = IntArg(*r_value, "combinations");
        if (r < 0) {
            throw ScriptError("ValueError", "r must be non-negative");
        }
        std::vector<Value> out;
        if (static_cast<std::size_t>(r) > pool.size()) {
            return Value::List(std::move(out));
        }
        const std::size_t n = pool.size();
        const auto width = static_cast<std::size_t>(r);
        std::vector<std::size_t> indices(width);
        std::iota(indices.begin(), indices.end(), 0);
        while (true) {
            interp.CheckAllocation(out.size() + 1, sizeof(Value) * (width + 1));
            std::vector<Value> row;
            row.reserve(width);
            for (const auto i : indices) {
                row.push_back(pool[i]);
            }
            out.push_back(Value::Tuple(std::move(row)));
            std::size_t i = width;
            while (i > 0 && indices[i - 1] == i - 1 + n - width) {
                --i;
            }
            if (i == 0) {
                break;
            }
            ++indices[i - 1];
            for (std::size_t j = i; j < width; ++j) {
                indices[j] = indices[j - 1] + 1;
            }
        }
        return Value::List(std::move(out));
    });
    AddFunction(m, "accumulate", [](Interpreter& interp, CallArgs& args) {
        std::optional<Value> fn_kw = PopKeyword(args, "func");
        std::optional<Value> initial = PopKeyword(args, "initial");
        NoKeywords(args, "accumulate");
        CheckArity(args, "accumulate", 1, 2);
        const std::optional<Value> fn = args.positional.size() == 2 ? std::optional<Value>(args.positional[1]) : fn_kw;
        const bool custom = fn && !fn->is(ValueKind::kNone);
        std::vector<Value> out;
        std::optional<Value> total;
        if (initial && !initial->is(ValueKind::kNone)) {
            total = *initial;
            out.push_back(*total);
        }
        interp.ForEach(args.positional[0], [&](const Value& item) {
            if (!total) {
                total = item;
            } else if (custom) {
                total = CallWith(interp, *fn, {*total, item}, args.line);
            } else {
                total = BinaryOp("+", *total, item, interp.options().max_memory_bytes);
            }
            interp.CheckAllocation(out.size() + 1, sizeof(Value));
            out.push_back(*total);
            return true;
        });
        return Value::List(std::move(out));
    });
    return module;
}

}  // namespace

std::shared_ptr<ModuleData> LoadModule(const std::string& name) {
    if (name == "math") {
        return MakeMath();
    }
    if (name == "json") {
        return MakeJson();
    }
    if (name == "re") {
        return MakeRe();
    }
    if (name == "string") {
        return MakeString();
    }
    if (name == "functools") {
        return MakeFunctools();
    }
    if (name == "itertools") {
        return MakeItertools();
    }
    return nullptr;
}

std::vector<std::string> AvailableModules() {
    return {"functools", "itertools", "json", "math", "re", "string"};
}

}  // namespace warden::script
