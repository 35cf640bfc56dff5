#include "sandbox/script_executor.hpp"

#include <chrono>
#include <filesystem>
#include <utility>
#include <variant>

#include "sandbox/process_launcher.hpp"
#include "sandbox/temp_environment.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {
namespace {

InfrastructureFault Fail(const char* tag,
                         InfrastructureError kind,
                         std::string message,
                         std::string diagnostics = {}) {
    utils::Log(utils::LogLevel::kError, tag, message);
    return InfrastructureFault{kind, std::move(message), std::move(diagnostics)};
}

ProcessSpec BuildProcessSpec(const config::Config& config,
                             const std::string& interpreter_dir,
                             const TempEnvironment& env) {
    ProcessSpec spec{};
    spec.executable = std::filesystem::path(interpreter_dir) / config.interpreter.executable;
    spec.args = {std::filesystem::absolute(env.DriverPath()).string()};
    spec.working_dir = env.directory;
    spec.timeout = std::chrono::seconds(config.sandbox.timeout_s);
    return spec;
}

// nullopt when the process finished cleanly and its output is worth decoding.
std::optional<InfrastructureFault> ClassifyProcess(const char* tag, const ProcessResult& process) {
    if (!process.launched) {
        return Fail(tag, InfrastructureError::kLaunch, "Failed to run script.", process.launch_error);
    }
    if (process.timed_out) {
        return Fail(tag, InfrastructureError::kTimeout, "Execution timed out", process.error);
    }
    if (process.exit_code != 0) {
        utils::Log(utils::LogLevel::kError, tag,
                   "exit code " + std::to_string(process.exit_code) + ", stderr\n" + process.error);
        return Fail(tag, InfrastructureError::kNonZeroExit, "Execution returned non 0 result", process.error);
    }
    return std::nullopt;
}

// Launch failures that escape the launcher itself (path resolution, thread
// or descriptor exhaustion) are reported as kLaunch rather than thrown.
std::variant<ProcessResult, InfrastructureFault> Launch(const char* tag,
                                                        const config::Config& config,
                                                        const std::string& interpreter_dir,
                                                        const TempEnvironment& env,
                                                        const std::string& payload) {
    try {
        return ProcessLauncher::Run(BuildProcessSpec(config, interpreter_dir, env), payload);
    } catch (const std::exception& ex) {
        return Fail(tag, InfrastructureError::kLaunch, "Failed to run script.", ex.what());
    }
}

}  // namespace

std::optional<std::string> ValidateInterpreterPath(const config::InterpreterConfig& interpreter) {
    if (interpreter.path.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!std::filesystem::exists(interpreter.path, ec) || ec) {
        return std::nullopt;
    }
    return interpreter.path;
}

ScriptExecutor::ScriptExecutor(ConfigSource config_source,
                               std::shared_ptr<const DriverResourceProvider> resources,
                               std::shared_ptr<const JsonCodec> codec)
    : config_source_(std::move(config_source)),
      resources_(std::move(resources)),
      codec_(std::move(codec)),
      payloads_(codec_),
      execution_interpreter_(codec_),
      evaluation_interpreter_(codec_) {}

CallResult<ExecutionOutput> ScriptExecutor::Execute(const ScriptRequest& request) const {
    const auto config = config_source_();
    const auto interpreter_dir = ValidateInterpreterPath(config.interpreter);
    if (!interpreter_dir) {
        return Fail("exec", InfrastructureError::kConfiguration, "Missing or invalid interpreter path");
    }

    std::optional<TempEnvironmentGuard> guard;
    std::string payload;
    try {
        const auto driver = resources_->LoadExecutionDriver(config.sandbox);
        guard.emplace(CreateExecutionEnvironment(config.sandbox.temp_root, request.script, driver));
        const auto& scripts = std::get<ExecutionScripts>(guard->env().kind);
        payload = payloads_.EncodeExecution(scripts.user_script_name, request.inputs);
        HardenEnvironment(guard->env());
    } catch (const std::exception& ex) {
        return Fail("exec", InfrastructureError::kSetup, "Failed to generate execution resources", ex.what());
    }

    utils::Log(utils::LogLevel::kDebug, "exec", "running script in " + guard->env().directory.string());
    auto launched = Launch("exec", config, *interpreter_dir, guard->env(), payload);
    if (auto* fault = std::get_if<InfrastructureFault>(&launched)) {
        return std::move(*fault);
    }
    const auto& process = std::get<ProcessResult>(launched);
    if (auto fault = ClassifyProcess("exec", process)) {
        return *std::move(fault);
    }
    return execution_interpreter_.Interpret(process.output);
}

CallResult<EvaluationOutput> ScriptExecutor::Evaluate(EvaluationRequest& request) const {
    const auto config = config_source_();
    const auto interpreter_dir = ValidateInterpreterPath(config.interpreter);
    if (!interpreter_dir) {
        return Fail("eval", InfrastructureError::kConfiguration, "Missing or invalid interpreter path");
    }

    std::optional<TempEnvironmentGuard> guard;
    std::string payload;
    try {
        const auto driver = resources_->LoadEvaluationDriver(config.sandbox);
        guard.emplace(CreateEvaluationEnvironment(config.sandbox.temp_root, driver));
        payload = payloads_.EncodeEvaluation(request);
        HardenEnvironment(guard->env());
    } catch (const std::exception& ex) {
        return Fail("eval", InfrastructureError::kSetup, "Failed to generate execution resources", ex.what());
    }

    utils::Log(utils::LogLevel::kDebug, "eval", "evaluating expression in " + guard->env().directory.string());
    auto launched = Launch("eval", config, *interpreter_dir, guard->env(), payload);
    if (auto* fault = std::get_if<InfrastructureFault>(&launched)) {
        return std::move(*fault);
    }
    const auto& process = std::get<ProcessResult>(launched);
    if (auto fault = ClassifyProcess("eval", process)) {
        return *std::move(fault);
    }
    return evaluation_interpreter_.Interpret(process.output, request.context);
}

}  // namespace scriptbox::sandbox
