#include "sandbox/temp_environment.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "utils/logging.hpp"

namespace scriptbox::sandbox {
namespace {

constexpr const char* kExecutionDirPrefix = "python_execution";
constexpr const char* kEvaluationDirPrefix = "python_expression";
constexpr const char* kUserScriptPrefix = "script";
constexpr const char* kUserScriptSuffix = ".py";
constexpr int kMaxNameAttempts = 100;

std::string RandomSuffix() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << engine();
    return oss.str();
}

std::filesystem::path ResolveRoot(const std::filesystem::path& root) {
    return root.empty() ? std::filesystem::temp_directory_path() : root;
}

std::filesystem::path CreateUniqueDirectory(const std::filesystem::path& root, const std::string& prefix) {
    const auto base = ResolveRoot(root);
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        const auto candidate = base / (prefix + RandomSuffix());
        // create_directory reports false when the name is already taken.
        if (std::filesystem::create_directory(candidate)) {
            std::filesystem::permissions(candidate, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace);
            return candidate;
        }
    }
    throw std::runtime_error("unable to allocate a unique directory under " + base.string());
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("failed to open " + path.string());
    }
    output << content;
    output.close();
    if (!output) {
        throw std::runtime_error("failed to write " + path.string());
    }
}

std::string CreateUserScript(const std::filesystem::path& directory, const std::string& source) {
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        const auto name = std::string(kUserScriptPrefix) + RandomSuffix() + kUserScriptSuffix;
        const auto path = directory / name;
        if (std::filesystem::exists(path)) {
            continue;
        }
        WriteFile(path, source);
        return name;
    }
    throw std::runtime_error("unable to allocate a unique script name in " + directory.string());
}

}  // namespace

TempEnvironment CreateExecutionEnvironment(const std::filesystem::path& root,
                                           const std::string& script_source,
                                           const std::string& driver_source) {
    TempEnvironment env{};
    env.directory = CreateUniqueDirectory(root, kExecutionDirPrefix);
    env.driver_name = kExecutionDriverName;
    try {
        const auto user_script_name = CreateUserScript(env.directory, script_source);
        WriteFile(env.DriverPath(), driver_source);
        env.kind = ExecutionScripts{user_script_name};
    } catch (const std::exception&) {
        DestroyEnvironment(env);
        throw;
    }
    return env;
}

TempEnvironment CreateEvaluationEnvironment(const std::filesystem::path& root,
                                            const std::string& driver_source) {
    TempEnvironment env{};
    env.directory = CreateUniqueDirectory(root, kEvaluationDirPrefix);
    env.driver_name = kEvaluationDriverName;
    env.kind = EvaluationScripts{};
    try {
        WriteFile(env.DriverPath(), driver_source);
    } catch (const std::exception&) {
        DestroyEnvironment(env);
        throw;
    }
    return env;
}

void HardenEnvironment(const TempEnvironment& env) {
    for (const auto& entry : std::filesystem::directory_iterator(env.directory)) {
#if defined(_WIN32)
        // Clearing the write bits sets the read-only attribute.
        std::filesystem::permissions(entry.path(),
                                     std::filesystem::perms::owner_write |
                                         std::filesystem::perms::group_write |
                                         std::filesystem::perms::others_write,
                                     std::filesystem::perm_options::remove);
#else
        std::filesystem::permissions(entry.path(), std::filesystem::perms::owner_read,
                                     std::filesystem::perm_options::replace);
#endif
    }
}

bool DestroyEnvironment(const TempEnvironment& env) {
    if (env.directory.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::remove_all(env.directory, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "sandbox",
                   "failed to cleanup execution resources {" + env.directory.string() + "}: " + ec.message());
        return false;
    }
    return true;
}

TempEnvironmentGuard::TempEnvironmentGuard(TempEnvironment env)
    : env_(std::move(env)) {}

TempEnvironmentGuard::~TempEnvironmentGuard() {
    DestroyEnvironment(env_);
}

}  // namespace scriptbox::sandbox
