#pragma once

#include <string>

namespace scriptbox::config {

struct InterpreterConfig {
    // Directory holding the interpreter binary. Validated before every call.
    std::string path;
    std::string executable = "python";
};

struct SandboxConfig {
    int timeout_s = 30 * 60;
    // Empty means the system temp directory.
    std::string temp_root;
    // Directory holding the main.py and eval.py driver scripts.
    std::string resources_dir;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    InterpreterConfig interpreter;
    SandboxConfig sandbox;
    LoggingConfig logging;
};

}  // namespace scriptbox::config
