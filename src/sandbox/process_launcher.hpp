#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace scriptbox::sandbox {

struct ProcessSpec {
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::filesystem::path working_dir;
    std::chrono::milliseconds timeout{30 * 60 * 1000};
};

struct ProcessResult {
    bool launched = false;
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
    std::string launch_error;
};

class ProcessLauncher {
public:
    // Spawns spec.executable with an empty environment, sends payload as one
    // line on stdin and collects stdout (line breaks dropped) and stderr.
    // The deadline covers the whole exchange: a child that stalls while
    // writing or never exits has its process group killed.
    static ProcessResult Run(const ProcessSpec& spec, const std::string& payload);
};

}  // namespace scriptbox::sandbox
