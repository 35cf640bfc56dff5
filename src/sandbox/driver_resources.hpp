#pragma once

#include <filesystem>
#include <string>

#include "config/config_schema.hpp"

namespace scriptbox::sandbox {

// Source of the two driver scripts materialized into every sandbox directory.
// Receives the sandbox section of the configuration read for the current call.
class DriverResourceProvider {
public:
    virtual ~DriverResourceProvider() = default;

    virtual std::string LoadExecutionDriver(const config::SandboxConfig& sandbox) const = 0;
    virtual std::string LoadEvaluationDriver(const config::SandboxConfig& sandbox) const = 0;
};

// Reads main.py and eval.py from sandbox.resources_dir on every call.
class DirectoryResourceProvider : public DriverResourceProvider {
public:
    std::string LoadExecutionDriver(const config::SandboxConfig& sandbox) const override;
    std::string LoadEvaluationDriver(const config::SandboxConfig& sandbox) const override;

private:
    static std::string Load(const std::filesystem::path& directory, const char* name);
};

}  // namespace scriptbox::sandbox
