#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace scriptbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".scriptbox" / "config.json";
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("interpreter") && data["interpreter"].is_object()) {
        const auto& interpreter = data["interpreter"];
        ApplyString(config.interpreter.path, interpreter, "path");
        ApplyString(config.interpreter.executable, interpreter, "executable");
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("timeoutS") && sandbox["timeoutS"].is_number_integer()) {
            config.sandbox.timeout_s = sandbox["timeoutS"].get<int>();
        }
        ApplyString(config.sandbox.temp_root, sandbox, "tempRoot");
        ApplyString(config.sandbox.resources_dir, sandbox, "resourcesDir");
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-integer value: " + value);
        return fallback;
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto interpreter_path = GetEnvFallback(
        "SCRIPTBOX_INTERPRETER__PATH",
        "SCRIPTBOX_PYTHON_PATH");
    if (!interpreter_path.empty()) {
        config.interpreter.path = interpreter_path;
    }

    const auto executable = GetEnv("SCRIPTBOX_INTERPRETER__EXECUTABLE");
    if (!executable.empty()) {
        config.interpreter.executable = executable;
    }

    const auto timeout = GetEnvFallback(
        "SCRIPTBOX_SANDBOX__TIMEOUT_S",
        "SCRIPTBOX_PYTHON_TIMEOUT_S");
    if (!timeout.empty()) {
        config.sandbox.timeout_s = ParseInt(timeout, config.sandbox.timeout_s);
    }

    const auto temp_root = GetEnv("SCRIPTBOX_SANDBOX__TEMP_ROOT");
    if (!temp_root.empty()) {
        config.sandbox.temp_root = temp_root;
    }

    const auto resources_dir = GetEnv("SCRIPTBOX_SANDBOX__RESOURCES_DIR");
    if (!resources_dir.empty()) {
        config.sandbox.resources_dir = resources_dir;
    }

    const auto log_level = GetEnv("SCRIPTBOX_LOGGING__LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

}  // namespace

Config LoadConfigFromFile(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config",
                       "keeping defaults, failed to parse " + config_path.string() + ": " + ex.what());
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFromFile(GetConfigPath());
}

}  // namespace scriptbox::config
