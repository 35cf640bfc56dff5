#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <variant>

#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/driver_resources.hpp"
#include "sandbox/script_executor.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitScriptFault = 1;
constexpr int kExitInfrastructureFault = 2;
constexpr int kExitUsage = 64;

void PrintUsage() {
    std::cout << "Usage: scriptbox_cli exec <script-file> [name=value ...]\n"
              << "       scriptbox_cli eval <expression> [--setup <file>] [name=value ...]" << std::endl;
}

bool ReadFile(const std::string& path, std::string& content) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    content = buffer.str();
    return true;
}

// "name=value"; values that parse as JSON keep their type, others stay strings.
bool ParseAssignment(const std::string& arg, std::string& name, nlohmann::json& value) {
    const auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    name = arg.substr(0, eq);
    const auto raw = arg.substr(eq + 1);
    value = nlohmann::json::parse(raw, nullptr, false);
    if (value.is_discarded()) {
        value = raw;
    }
    return true;
}

template <typename T>
int Report(const scriptbox::sandbox::CallResult<T>& result, const std::function<void(const T&)>& on_success) {
    if (const auto* output = std::get_if<T>(&result)) {
        on_success(*output);
        return 0;
    }
    if (const auto* fault = std::get_if<scriptbox::sandbox::ScriptFault>(&result)) {
        std::cout << "script error: " << fault->message << std::endl;
        return kExitScriptFault;
    }
    const auto& fault = std::get<scriptbox::sandbox::InfrastructureFault>(result);
    std::cout << scriptbox::sandbox::ToString(fault.kind) << " error: " << fault.message << std::endl;
    if (!fault.diagnostics.empty()) {
        std::cout << fault.diagnostics << std::endl;
    }
    return kExitInfrastructureFault;
}

int RunExec(const scriptbox::sandbox::ScriptExecutor& executor, int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return kExitUsage;
    }
    scriptbox::sandbox::ScriptRequest request{};
    if (!ReadFile(argv[2], request.script)) {
        std::cout << "Failed to read script " << argv[2] << std::endl;
        return kExitUsage;
    }
    for (int i = 3; i < argc; ++i) {
        std::string name;
        nlohmann::json value;
        if (!ParseAssignment(argv[i], name, value)) {
            PrintUsage();
            return kExitUsage;
        }
        request.inputs[name] = value;
    }

    const auto result = executor.Execute(request);
    return Report<scriptbox::sandbox::ExecutionOutput>(result, [](const auto& output) {
        std::cout << output.value.dump(2) << std::endl;
    });
}

int RunEval(const scriptbox::sandbox::ScriptExecutor& executor, int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return kExitUsage;
    }
    scriptbox::sandbox::EvaluationRequest request{};
    request.expression = argv[2];
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--setup") {
            std::string setup;
            if (i + 1 >= argc || !ReadFile(argv[i + 1], setup)) {
                PrintUsage();
                return kExitUsage;
            }
            request.env_setup = setup;
            ++i;
            continue;
        }
        std::string name;
        nlohmann::json value;
        if (!ParseAssignment(arg, name, value)) {
            PrintUsage();
            return kExitUsage;
        }
        request.context[name] = value;
    }

    const auto result = executor.Evaluate(request);
    return Report<scriptbox::sandbox::EvaluationOutput>(result, [](const auto& output) {
        nlohmann::json context(output.context);
        std::cout << nlohmann::json{{"value", output.value}, {"context", context}}.dump(2) << std::endl;
    });
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    if (command != "exec" && command != "eval") {
        PrintUsage();
        return kExitUsage;
    }

    auto config = scriptbox::config::LoadConfig();
    scriptbox::utils::LogConfig log_config{};
    log_config.min_level = scriptbox::utils::ParseLogLevel(config.logging.level);
    scriptbox::utils::SetLogConfig(log_config);

    auto resources = std::make_shared<const scriptbox::sandbox::DirectoryResourceProvider>();
    scriptbox::sandbox::ScriptExecutor executor(
        [] { return scriptbox::config::LoadConfig(); },
        resources);

    if (command == "exec") {
        return RunExec(executor, argc, argv);
    }
    return RunEval(executor, argc, argv);
}
