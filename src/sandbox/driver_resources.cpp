#include "sandbox/driver_resources.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "sandbox/temp_environment.hpp"

namespace scriptbox::sandbox {

std::string DirectoryResourceProvider::LoadExecutionDriver(const config::SandboxConfig& sandbox) const {
    return Load(sandbox.resources_dir, kExecutionDriverName);
}

std::string DirectoryResourceProvider::LoadEvaluationDriver(const config::SandboxConfig& sandbox) const {
    return Load(sandbox.resources_dir, kEvaluationDriverName);
}

std::string DirectoryResourceProvider::Load(const std::filesystem::path& directory, const char* name) {
    if (directory.empty()) {
        throw std::runtime_error("driver resource directory is not configured");
    }
    const auto path = directory / name;
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("failed to open driver resource " + path.string());
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace scriptbox::sandbox
