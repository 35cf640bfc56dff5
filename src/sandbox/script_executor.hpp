#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/call_result.hpp"
#include "sandbox/driver_resources.hpp"
#include "sandbox/json_codec.hpp"
#include "sandbox/payload_codec.hpp"
#include "sandbox/result_interpreter.hpp"

namespace scriptbox::sandbox {

// Read at the start of every call; the executor never caches it.
using ConfigSource = std::function<config::Config()>;

// Runs untrusted scripts in a short-lived interpreter process, one private
// temp directory per call. Holds no mutable state, so a single instance can
// serve any number of threads.
class ScriptExecutor {
public:
    ScriptExecutor(ConfigSource config_source,
                   std::shared_ptr<const DriverResourceProvider> resources,
                   std::shared_ptr<const JsonCodec> codec = SharedJsonCodec());

    CallResult<ExecutionOutput> Execute(const ScriptRequest& request) const;

    // request.context gains the accessed-resources set on success.
    CallResult<EvaluationOutput> Evaluate(EvaluationRequest& request) const;

private:
    ConfigSource config_source_;
    std::shared_ptr<const DriverResourceProvider> resources_;
    std::shared_ptr<const JsonCodec> codec_;
    PayloadCodec payloads_;
    ExecutionResultInterpreter execution_interpreter_;
    EvaluationResultInterpreter evaluation_interpreter_;
};

// Non-empty and present on disk; nullopt otherwise.
std::optional<std::string> ValidateInterpreterPath(const config::InterpreterConfig& interpreter);

}  // namespace scriptbox::sandbox
