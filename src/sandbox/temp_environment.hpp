#pragma once

#include <filesystem>
#include <string>
#include <variant>

namespace scriptbox::sandbox {

inline constexpr const char* kExecutionDriverName = "main.py";
inline constexpr const char* kEvaluationDriverName = "eval.py";

struct ExecutionScripts {
    std::string user_script_name;
};

struct EvaluationScripts {};

struct TempEnvironment {
    std::filesystem::path directory;
    std::string driver_name;
    std::variant<ExecutionScripts, EvaluationScripts> kind;

    std::filesystem::path DriverPath() const { return directory / driver_name; }
};

// Creates <root>/python_execution<random> holding the user script and main.py.
// Throws std::filesystem::filesystem_error or std::runtime_error.
TempEnvironment CreateExecutionEnvironment(const std::filesystem::path& root,
                                           const std::string& script_source,
                                           const std::string& driver_source);

// Creates <root>/python_expression<random> holding eval.py.
TempEnvironment CreateEvaluationEnvironment(const std::filesystem::path& root,
                                            const std::string& driver_source);

// Makes every file directly inside the environment owner-read-only.
void HardenEnvironment(const TempEnvironment& env);

// Recursive removal; failures are logged, never thrown. Returns true when nothing is left.
bool DestroyEnvironment(const TempEnvironment& env);

// Destroys the environment when the owning call unwinds.
class TempEnvironmentGuard {
public:
    explicit TempEnvironmentGuard(TempEnvironment env);
    ~TempEnvironmentGuard();

    TempEnvironmentGuard(const TempEnvironmentGuard&) = delete;
    TempEnvironmentGuard& operator=(const TempEnvironmentGuard&) = delete;

    const TempEnvironment& env() const { return env_; }

private:
    TempEnvironment env_;
};

}  // namespace scriptbox::sandbox
