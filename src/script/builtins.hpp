#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "script/value.hpp"

namespace warden::script {

class Interpreter;

// The builtins table handed to every interpreter. Contains no reflection,
// file, process or network primitives.
std::unordered_map<std::string, Value> MakeBuiltins();

// Calls an allow-listed method on a str, list, dict, set, tuple, match or
// exception value.
Value CallMethod(Interpreter& interp, const Value& receiver, const std::string& name, CallArgs& args);

// Builds a set (or frozenset) from any iterable. Elements must be hashable.
Value MakeSet(Interpreter& interp, const Value& iterable, bool frozen);

// Stable sort by LessThan, optionally on key(item).
std::vector<Value> SortValues(Interpreter& interp, std::vector<Value> items, const std::optional<Value>& key,
                              bool reverse);

bool IsExceptionTypeName(const std::string& name);
// Whether an exception of type raised is caught by a handler for handler.
bool ExceptionMatches(const std::string& raised, const std::string& handler);

// Argument helpers shared by builtins, methods and modules. All raise
// TypeError on mismatch.
void CheckArity(const CallArgs& args, const std::string& fn, std::size_t min, std::size_t max);
void NoKeywords(const CallArgs& args, const std::string& fn);
std::optional<Value> PopKeyword(CallArgs& args, const std::string& name);
std::int64_t IntArg(const Value& value, const std::string& fn);
double NumberArg(const Value& value, const std::string& fn);
const std::string& StrArg(const Value& value, const std::string& fn);

}  // namespace warden::script
