#include "sandbox/script_executor.hpp"

#include <memory>
#include <regex>
#include <stdexcept>
#include <utility>

#include "script/errors.hpp"
#include "script/guards.hpp"
#include "script/interpreter.hpp"
#include "script/parser.hpp"
#include "script/value.hpp"
#include "utils/common.hpp"

namespace warden::sandbox {
namespace {

constexpr std::size_t kMaxMessageBytes = 512;
constexpr char kResultBinding[] = "result";

std::unique_ptr<script::Interpreter> BuildRuntime(const WorkerRequest& request, std::size_t memory_bound) {
    script::InterpreterOptions options;
    options.allowed_imports = request.allowed_imports;
    options.max_output_bytes = request.max_output_bytes;
    options.max_memory_bytes = memory_bound;
    return std::make_unique<script::Interpreter>(script::MakeDefaultGuards(kReservedPrefix), std::move(options));
}

std::string WithLine(std::string message, int line) {
    if (line > 0) {
        message += " (line " + std::to_string(line) + ")";
    }
    return message;
}

void Capture(ExecutionResult& result, script::Interpreter& interp) {
    result.out.text = interp.out().contents();
    result.out.truncated = interp.out().truncated();
    result.err.text = interp.err().contents();
    result.err.truncated = interp.err().truncated();
}

void Fail(ExecutionResult& result, script::Interpreter& interp, ErrorKind kind, const std::string& message) {
    const auto text = SanitizeMessage(message);
    interp.err().Append(text);
    interp.err().Append("\n");
    result.success = false;
    result.error = ExecutionError{kind, text};
}

void CaptureReturnValue(ExecutionResult& result, const script::Interpreter& interp, std::size_t max_bytes) {
    const auto* value = interp.FindGlobal(kResultBinding);
    if (value == nullptr) {
        result.return_value = nullptr;
        return;
    }
    auto json = script::ToJson(*value);
    if (json && Dump(*json).size() <= max_bytes) {
        result.return_value = std::move(*json);
        return;
    }
    result.return_value = kTruncationMarker;
    result.return_value_truncated = true;
}

}  // namespace

ExecutionResult ScriptExecutor::Run(const WorkerRequest& request, std::size_t memory_bound) {
    const auto started = utils::SteadyNow();
    ExecutionResult result;
    // Declared first: function values in the runtime point into the tree.
    std::unique_ptr<script::Module> module;
    auto runtime = BuildRuntime(request, memory_bound);
    try {
        module = script::Parse(request.code);
    } catch (const script::SyntaxError& ex) {
        Fail(result, *runtime, ErrorKind::kRuntimeError,
             WithLine(std::string("SyntaxError: ") + ex.what(), ex.pos().line));
        Capture(result, *runtime);
        result.execution_time_ms = utils::ElapsedMs(started);
        return result;
    }

    try {
        for (const auto& [key, value] : request.context.items()) {
            runtime->SetGlobal(key, script::FromJson(value));
        }
        runtime->Run(*module);
        result.success = true;
        CaptureReturnValue(result, *runtime, request.max_output_bytes);
    } catch (const script::ScriptError& ex) {
        Fail(result, *runtime, ErrorKind::kRuntimeError, WithLine(ex.type_name() + ": " + ex.what(), ex.line()));
    } catch (const script::SecurityViolation& ex) {
        Fail(result, *runtime, ErrorKind::kSecurityViolation, WithLine(ex.what(), ex.line()));
    }
    Capture(result, *runtime);
    result.execution_time_ms = utils::ElapsedMs(started);
    return result;
}

void ScriptExecutor::SelfCheck(std::size_t memory_bound) {
    WorkerRequest request;
    request.code = "result = len([1, 2, 3])\n";
    const auto result = Run(request, memory_bound);
    if (!result.success || result.return_value != 3) {
        throw std::runtime_error("runtime self-check failed");
    }
}

std::string SanitizeMessage(const std::string& message) {
    static const std::regex kHostPath(R"((/[A-Za-z0-9_.+-]+){2,})");
    auto text = std::regex_replace(message, kHostPath, "<path>");
    if (text.size() > kMaxMessageBytes) {
        text.resize(kMaxMessageBytes);
        text += "...";
    }
    return text;
}

}  // namespace warden::sandbox
