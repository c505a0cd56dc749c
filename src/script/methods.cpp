#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string_view>

#include "script/builtins.hpp"
#include "script/errors.hpp"
#include "script/interpreter.hpp"
#include "script/operators.hpp"

namespace warden::script {
namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string QualifiedName(const Value& receiver, const std::string& name) {
    return std::string(TypeName(receiver)) + "." + name;
}

std::string StripChars(const std::string& text, std::string_view chars, bool left, bool right) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    if (left) {
        while (begin < end && chars.find(text[begin]) != std::string_view::npos) {
            ++begin;
        }
    }
    if (right) {
        while (end > begin && chars.find(text[end - 1]) != std::string_view::npos) {
            --end;
        }
    }
    return text.substr(begin, end - begin);
}

std::vector<Value> Split(const std::string& text, const Value& sep, std::int64_t maxsplit) {
    std::vector<Value> parts;
    if (sep.is(ValueKind::kNone)) {
        std::size_t pos = 0;
        while (true) {
            pos = text.find_first_not_of(kWhitespace, pos);
            if (pos == std::string::npos) {
                break;
            }
            if (maxsplit >= 0 && static_cast<std::int64_t>(parts.size()) == maxsplit) {
                parts.push_back(Value::Str(StripChars(text.substr(pos), kWhitespace, false, true)));
                break;
            }
            const std::size_t end = text.find_first_of(kWhitespace, pos);
            parts.push_back(Value::Str(text.substr(pos, end == std::string::npos ? std::string::npos : end - pos)));
            if (end == std::string::npos) {
                break;
            }
            pos = end;
        }
        return parts;
    }
    const std::string& delimiter = StrArg(sep, "split");
    if (delimiter.empty()) {
        throw ScriptError("ValueError", "empty separator");
    }
    std::size_t start = 0;
    while (maxsplit < 0 || static_cast<std::int64_t>(parts.size()) < maxsplit) {
        const std::size_t found = text.find(delimiter, start);
        if (found == std::string::npos) {
            break;
        }
        parts.push_back(Value::Str(text.substr(start, found - start)));
        start = found + delimiter.size();
    }
    parts.push_back(Value::Str(text.substr(start)));
    return parts;
}

std::size_t ClampIndex(std::int64_t index, std::size_t size) {
    const auto length = static_cast<std::int64_t>(size);
    if (index < 0) {
        index = std::max<std::int64_t>(0, index + length);
    }
    return static_cast<std::size_t>(std::min(index, length));
}

struct FormatSpec {
    char fill = ' ';
    char align = 0;
    char sign = '-';
    bool zero = false;
    std::size_t width = 0;
    bool grouping = false;
    int precision = -1;
    char type = 0;
};

FormatSpec ParseFormatSpec(const std::string& spec) {
    FormatSpec out;
    std::size_t pos = 0;
    auto is_align = [](char c) { return c == '<' || c == '>' || c == '^' || c == '='; };
    if (spec.size() >= 2 && is_align(spec[1])) {
        out.fill = spec[0];
        out.align = spec[1];
        pos = 2;
    } else if (!spec.empty() && is_align(spec[0])) {
        out.align = spec[0];
        pos = 1;
    }
    if (pos < spec.size() && (spec[pos] == '+' || spec[pos] == '-' || spec[pos] == ' ')) {
        out.sign = spec[pos++];
    }
    if (pos < spec.size() && spec[pos] == '0') {
        out.zero = true;
        ++pos;
    }
    while (pos < spec.size() && std::isdigit(static_cast<unsigned char>(spec[pos]))) {
        out.width = out.width * 10 + static_cast<std::size_t>(spec[pos++] - '0');
        if (out.width > 4096) {
            throw ScriptError("ValueError", "format width too large");
        }
    }
    if (pos < spec.size() && spec[pos] == ',') {
        out.grouping = true;
        ++pos;
    }
    if (pos < spec.size() && spec[pos] == '.') {
        ++pos;
        int precision = 0;
        bool digits = false;
        while (pos < spec.size() && std::isdigit(static_cast<unsigned char>(spec[pos]))) {
            precision = precision * 10 + (spec[pos++] - '0');
            digits = true;
            if (precision > 100) {
                throw ScriptError("ValueError", "format precision too large");
            }
        }
        if (!digits) {
            throw ScriptError("ValueError", "Format specifier missing precision");
        }
        out.precision = precision;
    }
    if (pos < spec.size()) {
        out.type = spec[pos++];
    }
    if (pos != spec.size()) {
        throw ScriptError("ValueError", "Invalid format specifier '" + spec + "'");
    }
    return out;
}

std::string GroupThousands(const std::string& digits) {
    const std::size_t dot = digits.find_first_of(".eE");
    const std::string integral = digits.substr(0, dot);
    const std::string rest = dot == std::string::npos ? "" : digits.substr(dot);
    std::string out;
    for (std::size_t i = 0; i < integral.size(); ++i) {
        if (i > 0 && (integral.size() - i) % 3 == 0) {
            out.push_back(',');
        }
        out.push_back(integral[i]);
    }
    return out + rest;
}

std::string FormatValue(const Value& value, const std::string& spec_text) {
    if (spec_text.empty()) {
        return ToStr(value);
    }
    const FormatSpec spec = ParseFormatSpec(spec_text);
    std::string body;
    bool negative = false;
    bool numeric = false;
    const char type = spec.type;
    if (type == 0 || type == 's') {
        if (type == 's' && !value.is(ValueKind::kStr)) {
            throw ScriptError("ValueError", std::string("Unknown format code 's' for object of type '") +
                                                TypeName(value) + "'");
        }
        if (value.IsNumber() && type == 0 && !value.is(ValueKind::kBool)) {
            numeric = true;
            if (value.is(ValueKind::kFloat)) {
                const double x = value.AsDouble();
                negative = std::signbit(x);
                if (spec.precision >= 0) {
                    char buffer[160];
                    std::snprintf(buffer, sizeof(buffer), "%.*g", spec.precision, std::fabs(x));
                    body = buffer;
                } else {
                    body = FormatFloat(std::fabs(x));
                }
            } else {
                negative = value.AsInt() < 0;
                body = std::to_string(value.AsInt());
                if (negative) {
                    body.erase(0, 1);
                }
            }
        } else {
            body = ToStr(value);
            if (spec.precision >= 0 && body.size() > static_cast<std::size_t>(spec.precision)) {
                body.resize(static_cast<std::size_t>(spec.precision));
            }
        }
    } else if (type == 'd' || type == 'x' || type == 'X' || type == 'o' || type == 'b') {
        if (!value.is(ValueKind::kInt) && !value.is(ValueKind::kBool)) {
            throw ScriptError("ValueError", std::string("Unknown format code '") + type + "' for object of type '" +
                                                TypeName(value) + "'");
        }
        numeric = true;
        const std::int64_t n = value.AsInt();
        negative = n < 0;
        std::uint64_t magnitude = negative ? 0 - static_cast<std::uint64_t>(n) : static_cast<std::uint64_t>(n);
        if (type == 'd') {
            body = std::to_string(magnitude);
        } else {
            const int base = type == 'o' ? 8 : type == 'b' ? 2 : 16;
            const char* digits = type == 'X' ? "0123456789ABCDEF" : "0123456789abcdef";
            do {
                body.insert(body.begin(), digits[magnitude % static_cast<std::uint64_t>(base)]);
                magnitude /= static_cast<std::uint64_t>(base);
            } while (magnitude > 0);
        }
    } else if (type == 'f' || type == 'F' || type == 'e' || type == 'E' || type == 'g' || type == 'G' ||
               type == '%') {
        if (!value.IsNumber()) {
            throw ScriptError("ValueError", std::string("Unknown format code '") + type + "' for object of type '" +
                                                TypeName(value) + "'");
        }
        numeric = true;
        double x = value.AsDouble();
        if (type == '%') {
            x *= 100.0;
        }
        negative = std::signbit(x);
        const int precision = spec.precision < 0 ? 6 : spec.precision;
        const char conversion = type == '%' ? 'f' : type;
        const std::string format = std::string("%.*") + conversion;
        char buffer[512];
        std::snprintf(buffer, sizeof(buffer), format.c_str(), precision, std::fabs(x));
        body = buffer;
        if (type == '%') {
            body += "%";
        }
    } else {
        throw ScriptError("ValueError", std::string("Unknown format code '") + type + "' for object of type '" +
                                            TypeName(value) + "'");
    }
    if (numeric && spec.grouping) {
        body = GroupThousands(body);
    }
    std::string sign;
    if (numeric) {
        if (negative) {
            sign = "-";
        } else if (spec.sign == '+') {
            sign = "+";
        } else if (spec.sign == ' ') {
            sign = " ";
        }
    }
    char align = spec.align;
    char fill = spec.fill;
    if (spec.zero && align == 0) {
        align = '=';
        fill = '0';
    }
    if (align == 0) {
        align = numeric ? '>' : '<';
    }
    const std::size_t length = sign.size() + body.size();
    if (length >= spec.width) {
        return sign + body;
    }
    const std::size_t padding = spec.width - length;
    switch (align) {
        case '<': return sign + body + std::string(padding, fill);
        case '^': return std::string(padding / 2, fill) + sign + body + std::string(padding - padding / 2, fill);
        case '=': return sign + std::string(padding, fill) + body;
        default: return std::string(padding, fill) + sign + body;
    }
}

std::string Format(const std::string& pattern, const CallArgs& args) {
    std::string out;
    std::size_t auto_index = 0;
    bool used_auto = false;
    bool used_manual = false;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '}') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '}') {
                out.push_back('}');
                ++i;
                continue;
            }
            throw ScriptError("ValueError", "Single '}' encountered in format string");
        }
        if (c != '{') {
            out.push_back(c);
            continue;
        }
        if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
            out.push_back('{');
            ++i;
            continue;
        }
        const std::size_t close = pattern.find('}', i + 1);
        if (close == std::string::npos) {
            throw ScriptError("ValueError", "Single '{' encountered in format string");
        }
        std::string field = pattern.substr(i + 1, close - i - 1);
        i = close;
        std::string spec;
        if (const auto colon = field.find(':'); colon != std::string::npos) {
            spec = field.substr(colon + 1);
            field.resize(colon);
        }
        char conversion = 0;
        if (const auto bang = field.find('!'); bang != std::string::npos) {
            if (bang + 2 != field.size() || (field[bang + 1] != 'r' && field[bang + 1] != 's')) {
                throw ScriptError("ValueError", "invalid conversion in format string");
            }
            conversion = field[bang + 1];
            field.resize(bang);
        }
        const Value* argument = nullptr;
        if (field.empty()) {
            if (used_manual) {
                throw ScriptError("ValueError",
                                  "cannot switch from manual field specification to automatic field numbering");
            }
            used_auto = true;
            if (auto_index >= args.positional.size()) {
                throw ScriptError("IndexError", "Replacement index " + std::to_string(auto_index) +
                                                    " out of range for positional args tuple");
            }
            argument = &args.positional[auto_index++];
        } else if (std::all_of(field.begin(), field.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
            if (used_auto) {
                throw ScriptError("ValueError",
                                  "cannot switch from automatic field numbering to manual field specification");
            }
            used_manual = true;
            if (field.size() > 6) {
                throw ScriptError("IndexError", "Replacement index " + field + " out of range for positional args tuple");
            }
            const std::size_t index = std::stoul(field);
            if (index >= args.positional.size()) {
                throw ScriptError("IndexError", "Replacement index " + field + " out of range for positional args tuple");
            }
            argument = &args.positional[index];
        } else {
            for (const auto& [name, value] : args.keywords) {
                if (name == field) {
                    argument = &value;
                    break;
                }
            }
            if (!argument) {
                throw ScriptError("KeyError", Repr(Value::Str(field)));
            }
        }
        if (conversion == 'r') {
            out += FormatValue(Value::Str(Repr(*argument)), spec);
        } else if (conversion == 's') {
            out += FormatValue(Value::Str(ToStr(*argument)), spec);
        } else {
            out += FormatValue(*argument, spec);
        }
    }
    return out;
}

Value StrMethod(Interpreter& interp, const Value& receiver, const std::string& name, CallArgs& args) {
    const std::string& text = receiver.AsStr();
    const std::string fn = QualifiedName(receiver, name);
    if (name == "format") {
        return Value::Str(Format(text, args));
    }
    if (name == "split") {
        std::optional<Value> sep = PopKeyword(args, "sep");
        std::optional<Value> maxsplit = PopKeyword(args, "maxsplit");
        NoKeywords(args, fn);
        CheckArity(args, fn, 0, 2);
        if (!args.positional.empty()) {
            sep = args.positional[0];
        }
        if (args.positional.size() == 2) {
            maxsplit = args.positional[1];
        }
        return Value::List(Split(text, sep.value_or(Value::None()),
                                 maxsplit ? IntArg(*maxsplit, fn) : -1));
    }
    NoKeywords(args, fn);
    if (name == "upper" || name == "lower") {
        CheckArity(args, fn, 0, 0);
        std::string out = text;
        std::transform(out.begin(), out.end(), out.begin(), [&](unsigned char c) {
            return static_cast<char>(name == "upper" ? std::toupper(c) : std::tolower(c));
        });
        return Value::Str(std::move(out));
    }
    if (name == "strip" || name == "lstrip" || name == "rstrip") {
        CheckArity(args, fn, 0, 1);
        std::string_view chars = kWhitespace;
        if (!args.positional.empty() && !args.positional[0].is(ValueKind::kNone)) {
            chars = StrArg(args.positional[0], fn);
        }
        return Value::Str(StripChars(text, chars, name != "rstrip", name != "lstrip"));
    }
    if (name == "join") {
        CheckArity(args, fn, 1, 1);
        std::string out;
        bool first = true;
        interp.ForEach(args.positional[0], [&](const Value& item) {
            if (!item.is(ValueKind::kStr)) {
                throw ScriptError("TypeError", std::string("sequence item: expected str instance, ") +
                                                   TypeName(item) + " found");
            }
            if (!first) {
                out += text;
            }
            first = false;
            interp.CheckAllocation(out.size() + item.AsStr().size(), 1);
            out += item.AsStr();
            return true;
        });
        return Value::Str(std::move(out));
    }
    if (name == "replace") {
        CheckArity(args, fn, 2, 3);
        const std::string& old_text = StrArg(args.positional[0], fn);
        const std::string& new_text = StrArg(args.positional[1], fn);
        std::int64_t count = args.positional.size() == 3 ? IntArg(args.positional[2], fn) : -1;
        std::string out;
        std::size_t pos = 0;
        if (old_text.empty()) {
            for (std::size_t i = 0; i <= text.size(); ++i) {
                if (count != 0) {
                    out += new_text;
                    --count;
                }
                if (i < text.size()) {
                    out.push_back(text[i]);
                }
                interp.CheckAllocation(out.size(), 1);
            }
            return Value::Str(std::move(out));
        }
        while (count != 0) {
            const std::size_t found = text.find(old_text, pos);
            if (found == std::string::npos) {
                break;
            }
            out.append(text, pos, found - pos);
            out += new_text;
            interp.CheckAllocation(out.size(), 1);
            pos = found + old_text.size();
            --count;
        }
        out.append(text, pos, std::string::npos);
        return Value::Str(std::move(out));
    }
    if (name == "startswith" || name == "endswith") {
        CheckArity(args, fn, 1, 2);
        const std::size_t start =
            args.positional.size() == 2 ? ClampIndex(IntArg(args.positional[1], fn), text.size()) : 0;
        const std::string_view subject = std::string_view(text).substr(start);
        auto test = [&](const Value& candidate) {
            const std::string& affix = StrArg(candidate, fn);
            if (affix.size() > subject.size()) {
                return false;
            }
            return name == "startswith" ? subject.compare(0, affix.size(), affix) == 0
                                        : subject.compare(subject.size() - affix.size(), affix.size(), affix) == 0;
        };
        const Value& candidate = args.positional[0];
        if (candidate.is(ValueKind::kTuple)) {
            return Value::Bool(std::any_of(candidate.Items().begin(), candidate.Items().end(), test));
        }
        return Value::Bool(test(candidate));
    }
    if (name == "find" || name == "count") {
        CheckArity(args, fn, 1, 3);
        const std::string& needle = StrArg(args.positional[0], fn);
        const std::size_t start =
            args.positional.size() >= 2 ? ClampIndex(IntArg(args.positional[1], fn), text.size()) : 0;
        const std::size_t end =
            args.positional.size() == 3 ? ClampIndex(IntArg(args.positional[2], fn), text.size()) : text.size();
        if (start > end) {
            return Value::Int(name == "find" ? -1 : 0);
        }
        const std::string_view window = std::string_view(text).substr(start, end - start);
        if (name == "find") {
            const std::size_t found = window.find(needle);
            return Value::Int(found == std::string_view::npos ? -1 : static_cast<std::int64_t>(start + found));
        }
        if (needle.empty()) {
            return Value::Int(static_cast<std::int64_t>(window.size() + 1));
        }
        std::int64_t count = 0;
        for (std::size_t pos = window.find(needle); pos != std::string_view::npos;
             pos = window.find(needle, pos + needle.size())) {
            ++count;
        }
        return Value::Int(count);
    }
    if (name == "isdigit" || name == "isalpha") {
        CheckArity(args, fn, 0, 0);
        const bool digits = name == "isdigit";
        return Value::Bool(!text.empty() && std::all_of(text.begin(), text.end(), [&](unsigned char c) {
            return digits ? std::isdigit(c) != 0 : std::isalpha(c) != 0;
        }));
    }
    if (name == "title" || name == "capitalize") {
        CheckArity(args, fn, 0, 0);
        std::string out = text;
        bool boundary = true;
        for (std::size_t i = 0; i < out.size(); ++i) {
            const auto c = static_cast<unsigned char>(out[i]);
            if (name == "capitalize") {
                out[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
                continue;
            }
            out[i] = static_cast<char>(boundary ? std::toupper(c) : std::tolower(c));
            boundary = !std::isalpha(c);
        }
        return Value::Str(std::move(out));
    }
    if (name == "splitlines") {
        CheckArity(args, fn, 0, 0);
        std::vector<Value> lines;
        std::size_t start = 0;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\n' || text[i] == '\r') {
                lines.push_back(Value::Str(text.substr(start, i - start)));
                if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                start = i + 1;
            }
        }
        if (start < text.size()) {
            lines.push_back(Value::Str(text.substr(start)));
        }
        return Value::List(std::move(lines));
    }
    throw ScriptError("AttributeError", "'str' object has no attribute '" + name + "'");
}

std::size_t IndexOf(const std::vector<Value>& items, const Value& item, const std::string& type) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (Equals(items[i], item)) {
            return i;
        }
    }
    throw ScriptError("ValueError", Repr(item) + " is not in " + type);
}

std::int64_t CountOf(const std::vector<Value>& items, const Value& item) {
    return static_cast<std::int64_t>(
        std::count_if(items.begin(), items.end(), [&](const Value& candidate) { return Equals(candidate, item); }));
}

Value ListMethod(Interpreter& interp, const Value& receiver, const std::string& name, CallArgs& args) {
    auto& items = receiver.Items();
    const std::string fn = QualifiedName(receiver, name);
    if (name == "sort") {
        std::optional<Value> key = PopKeyword(args, "key");
        std::optional<Value> reverse = PopKeyword(args, "reverse");
        NoKeywords(args, fn);
        CheckArity(args, fn, 0, 0);
        std::vector<Value> sorted = SortValues(interp, items, key, reverse && Truthy(*reverse));
        items = std::move(sorted);
        return Value::None();
    }
    NoKeywords(args, fn);
    if (name == "append") {
        CheckArity(args, fn, 1, 1);
        interp.CheckAllocation(items.size() + 1, sizeof(Value));
        items.push_back(args.positional[0]);
        return Value::None();
    }
    if (name == "extend") {
        CheckArity(args, fn, 1, 1);
        std::vector<Value> extra = interp.Materialize(args.positional[0]);
        interp.CheckAllocation(items.size() + extra.size(), sizeof(Value));
        items.insert(items.end(), extra.begin(), extra.end());
        return Value::None();
    }
    if (name == "pop") {
        CheckArity(args, fn, 0, 1);
        if (items.empty()) {
            throw ScriptError("IndexError", "pop from empty list");
        }
        std::int64_t index = args.positional.empty() ? -1 : IntArg(args.positional[0], fn);
        if (index < 0) {
            index += static_cast<std::int64_t>(items.size());
        }
        if (index < 0 || index >= static_cast<std::int64_t>(items.size())) {
            throw ScriptError("IndexError", "pop index out of range");
        }
        Value value = items[static_cast<std::size_t>(index)];
        items.erase(items.begin() + index);
        return value;
    }
    if (name == "insert") {
        CheckArity(args, fn, 2, 2);
        interp.CheckAllocation(items.size() + 1, sizeof(Value));
        const std::size_t index = ClampIndex(IntArg(args.positional[0], fn), items.size());
        items.insert(items.begin() + static_cast<std::ptrdiff_t>(index), args.positional[1]);
        return Value::None();
    }
    if (name == "remove") {
        CheckArity(args, fn, 1, 1);
        for (auto it = items.begin(); it != items.end(); ++it) {
            if (Equals(*it, args.positional[0])) {
                items.erase(it);
                return Value::None();
            }
        }
        throw ScriptError("ValueError", "list.remove(x): x not in list");
    }
    if (name == "index") {
        CheckArity(args, fn, 1, 1);
        return Value::Int(static_cast<std::int64_t>(IndexOf(items, args.positional[0], "list")));
    }
    if (name == "count") {
        CheckArity(args, fn, 1, 1);
        return Value::Int(CountOf(items, args.positional[0]));
    }
    if (name == "reverse") {
        CheckArity(args, fn, 0, 0);
        std::reverse(items.begin(), items.end());
        return Value::None();
    }
    if (name == "copy") {
        CheckArity(args, fn, 0, 0);
        return Value::List(items);
    }
    if (name == "clear") {
        CheckArity(args, fn, 0, 0);
        items.clear();
        return Value::None();
    }
    throw ScriptError("AttributeError", "'list' object has no attribute '" + name + "'");
}

Value TupleMethod(const Value& receiver, const std::string& name, CallArgs& args) {
    const auto& items = receiver.Items();
    const std::string fn = QualifiedName(receiver, name);
    NoKeywords(args, fn);
    CheckArity(args, fn, 1, 1);
    if (name == "index") {
        return Value::Int(static_cast<std::int64_t>(IndexOf(items, args.positional[0], "tuple")));
    }
    if (name == "count") {
        return Value::Int(CountOf(items, args.positional[0]));
    }
    throw ScriptError("AttributeError", "'tuple' object has no attribute '" + name + "'");
}

Value DictMethod(Interpreter& interp, const Value& receiver, const std::string& name, CallArgs& args) {
    DictData& dict = receiver.AsDict();
    const std::string fn = QualifiedName(receiver, name);
    if (name == "update") {
        CheckArity(args, fn, 0, 1);
        if (!args.positional.empty()) {
            const Value& source = args.positional[0];
            if (source.is(ValueKind::kDict)) {
                for (const auto& [key, value] : source.AsDict().Items()) {
                    dict.Set(key, value);
                }
            } else {
                interp.ForEach(source, [&](const Value& pair) {
                    const std::vector<Value> entry = interp.Materialize(pair);
                    if (entry.size() != 2) {
                        throw ScriptError("ValueError", "dictionary update sequence element has length " +
                                                            std::to_string(entry.size()) + "; 2 is required");
                    }
                    dict.Set(entry[0], entry[1]);
                    return true;
                });
            }
        }
        for (const auto& [key, value] : args.keywords) {
            dict.Set(Value::Str(key), value);
        }
        return Value::None();
    }
    NoKeywords(args, fn);
    if (name == "get") {
        CheckArity(args, fn, 1, 2);
        const Value* found = dict.Find(args.positional[0]);
        if (found) {
            return *found;
        }
        return args.positional.size() == 2 ? args.positional[1] : Value::None();
    }
    if (name == "keys" || name == "values" || name == "items") {
        CheckArity(args, fn, 0, 0);
        std::vector<Value> out;
        out.reserve(dict.size());
        for (const auto& [key, value] : dict.Items()) {
            if (name == "keys") {
                out.push_back(key);
            } else if (name == "values") {
                out.push_back(value);
            } else {
                out.push_back(Value::Tuple({key, value}));
            }
        }
        return Value::List(std::move(out));
    }
    if (name == "pop") {
        CheckArity(args, fn, 1, 2);
        const Value* found = dict.Find(args.positional[0]);
        if (!found) {
            if (args.positional.size() == 2) {
                return args.positional[1];
            }
            throw ScriptError("KeyError", Repr(args.positional[0]));
        }
        Value value = *found;
        dict.Erase(args.positional[0]);
        return value;
    }
    if (name == "setdefault") {
        CheckArity(args, fn, 1, 2);
        if (const Value* found = dict.Find(args.positional[0])) {
            return *found;
        }
        Value fallback = args.positional.size() == 2 ? args.positional[1] : Value::None();
        dict.Set(args.positional[0], fallback);
        return fallback;
    }
    if (name == "copy") {
        CheckArity(args, fn, 0, 0);
        Value copy = Value::Dict();
        for (const auto& [key, value] : dict.Items()) {
            copy.AsDict().Set(key, value);
        }
        return copy;
    }
    if (name == "clear") {
        CheckArity(args, fn, 0, 0);
        dict.Clear();
        return Value::None();
    }
    throw ScriptError("AttributeError", "'dict' object has no attribute '" + name + "'");
}

Value SetMethod(Interpreter& interp, const Value& receiver, const std::string& name, CallArgs& args) {
    DictData& items = receiver.AsSet();
    const bool frozen = receiver.is(ValueKind::kFrozenSet);
    const std::string fn = QualifiedName(receiver, name);
    NoKeywords(args, fn);
    auto insert = [&](DictData& target, const Value& item) {
        interp.CheckAllocation(target.size() + 1, sizeof(Value) * 2);
        target.Set(item, Value::None());
    };
    auto copy = [&]() {
        Value out = Value::Set(frozen);
        for (const auto& item : items.Keys()) {
            out.AsSet().Set(item, Value::None());
        }
        return out;
    };
    if (name == "add") {
        CheckArity(args, fn, 1, 1);
        insert(items, args.positional[0]);
        return Value::None();
    }
    if (name == "discard" || name == "remove") {
        CheckArity(args, fn, 1, 1);
        if (!items.Erase(args.positional[0]) && name == "remove") {
            throw ScriptError("KeyError", Repr(args.positional[0]));
        }
        return Value::None();
    }
    if (name == "pop") {
        CheckArity(args, fn, 0, 0);
        const auto keys = items.Keys();
        if (keys.empty()) {
            throw ScriptError("KeyError", "'pop from an empty set'");
        }
        items.Erase(keys.front());
        return keys.front();
    }
    if (name == "clear") {
        CheckArity(args, fn, 0, 0);
        items.Clear();
        return Value::None();
    }
    if (name == "copy") {
        CheckArity(args, fn, 0, 0);
        return frozen ? receiver : copy();
    }
    if (name == "update") {
        for (const auto& source : args.positional) {
            interp.ForEach(source, [&](const Value& item) {
                insert(items, item);
                return true;
            });
        }
        return Value::None();
    }
    if (name == "union") {
        Value out = copy();
        for (const auto& source : args.positional) {
            interp.ForEach(source, [&](const Value& item) {
                insert(out.AsSet(), item);
                return true;
            });
        }
        return out;
    }
    if (name == "intersection" || name == "difference") {
        std::vector<Value> others;
        for (const auto& source : args.positional) {
            others.push_back(source.IsSet() ? source : MakeSet(interp, source, true));
        }
        const bool keep_shared = name == "intersection";
        Value out = Value::Set(frozen);
        for (const auto& item : items.Keys()) {
            bool keep = true;
            for (const auto& other : others) {
                if ((other.AsSet().Find(item) != nullptr) != keep_shared) {
                    keep = false;
                    break;
                }
            }
            if (keep) {
                out.AsSet().Set(item, Value::None());
            }
        }
        return out;
    }
    CheckArity(args, fn, 1, 1);
    const Value other = args.positional[0].IsSet() ? args.positional[0] : MakeSet(interp, args.positional[0], true);
    const DictData& right = other.AsSet();
    if (name == "symmetric_difference") {
        Value out = Value::Set(frozen);
        for (const auto& item : items.Keys()) {
            if (!right.Find(item)) {
                out.AsSet().Set(item, Value::None());
            }
        }
        for (const auto& item : right.Keys()) {
            if (!items.Find(item)) {
                out.AsSet().Set(item, Value::None());
            }
        }
        return out;
    }
    auto all_in = [](const DictData& inner, const DictData& outer) {
        for (const auto& item : inner.Keys()) {
            if (!outer.Find(item)) {
                return false;
            }
        }
        return true;
    };
    if (name == "issubset") {
        return Value::Bool(all_in(items, right));
    }
    if (name == "issuperset") {
        return Value::Bool(all_in(right, items));
    }
    if (name == "isdisjoint") {
        for (const auto& item : items.Keys()) {
            if (right.Find(item)) {
                return Value::Bool(false);
            }
        }
        return Value::Bool(true);
    }
    throw ScriptError("AttributeError", std::string("'") + TypeName(receiver) + "' object has no attribute '" +
                                            name + "'");
}

Value MatchMethod(const Value& receiver, const std::string& name, CallArgs& args) {
    const MatchData& match = receiver.AsMatch();
    const std::string fn = "Match." + name;
    NoKeywords(args, fn);
    auto group = [&](const Value& index_value) {
        const std::int64_t index = IntArg(index_value, fn);
        if (index < 0 || static_cast<std::size_t>(index) >= match.groups.size()) {
            throw ScriptError("IndexError", "no such group");
        }
        const auto& text = match.groups[static_cast<std::size_t>(index)];
        return text ? Value::Str(*text) : Value::None();
    };
    if (name == "group") {
        if (args.positional.empty()) {
            return group(Value::Int(0));
        }
        if (args.positional.size() == 1) {
            return group(args.positional[0]);
        }
        std::vector<Value> out;
        for (const auto& index : args.positional) {
            out.push_back(group(index));
        }
        return Value::Tuple(std::move(out));
    }
    if (name == "groups") {
        CheckArity(args, fn, 0, 1);
        const Value fallback = args.positional.empty() ? Value::None() : args.positional[0];
        std::vector<Value> out;
        for (std::size_t i = 1; i < match.groups.size(); ++i) {
            out.push_back(match.groups[i] ? Value::Str(*match.groups[i]) : fallback);
        }
        return Value::Tuple(std::move(out));
    }
    CheckArity(args, fn, 0, 0);
    if (name == "start") {
        return Value::Int(match.start);
    }
    if (name == "end") {
        return Value::Int(match.end);
    }
    if (name == "span") {
        return Value::Tuple({Value::Int(match.start), Value::Int(match.end)});
    }
    throw ScriptError("AttributeError", "'re.Match' object has no attribute '" + name + "'");
}

}  // namespace

Value CallMethod(Interpreter& interp, const Value& receiver, const std::string& name, CallArgs& args) {
    switch (receiver.kind()) {
        case ValueKind::kStr: return StrMethod(interp, receiver, name, args);
        case ValueKind::kList: return ListMethod(interp, receiver, name, args);
        case ValueKind::kTuple: return TupleMethod(receiver, name, args);
        case ValueKind::kDict: return DictMethod(interp, receiver, name, args);
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: return SetMethod(interp, receiver, name, args);
        case ValueKind::kMatch: return MatchMethod(receiver, name, args);
        default:
            throw ScriptError("AttributeError", std::string("'") + TypeName(receiver) + "' object has no attribute '" +
                                                    name + "'");
    }
}

}  // namespace warden::script
