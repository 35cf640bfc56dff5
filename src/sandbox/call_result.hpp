#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace scriptbox::sandbox {

using ValueMap = std::map<std::string, nlohmann::json>;

// Key under which an evaluation publishes the context entries it touched.
inline constexpr const char* kAccessedResourcesKey = "accessed_resources_set";

struct ScriptRequest {
    std::string script;
    ValueMap inputs;
};

struct EvaluationRequest {
    std::string expression;
    std::optional<std::string> env_setup;
    // Mutated by a successful evaluation, see kAccessedResourcesKey.
    ValueMap context;
};

enum class ReturnType {
    kBoolean,
    kInteger,
    kList,
    kString
};

// Decoded response of the execution driver.
struct ScriptResult {
    nlohmann::json return_result;
    std::string exception;
    std::vector<std::string> traceback;
};

// Decoded response of the evaluation driver.
struct EvaluationResult {
    std::string return_result;
    std::optional<ReturnType> return_type;
    std::string exception;
    std::set<std::string> accessed_resources;
};

struct ExecutionOutput {
    nlohmann::json value;
};

struct EvaluationOutput {
    nlohmann::json value;
    ValueMap context;
};

enum class InfrastructureError {
    kConfiguration,
    kSetup,
    kLaunch,
    kTimeout,
    kNonZeroExit,
    kProtocol
};

inline const char* ToString(InfrastructureError error) {
    switch (error) {
        case InfrastructureError::kConfiguration: return "configuration";
        case InfrastructureError::kSetup: return "setup";
        case InfrastructureError::kLaunch: return "launch";
        case InfrastructureError::kTimeout: return "timeout";
        case InfrastructureError::kNonZeroExit: return "non_zero_exit";
        case InfrastructureError::kProtocol: return "protocol";
    }
    return "unknown";
}

// The sandboxed code itself reported a fault.
struct ScriptFault {
    std::string message;
};

// The sandbox broke: the script never ran, or its answer could not be trusted.
struct InfrastructureFault {
    InfrastructureError kind = InfrastructureError::kSetup;
    std::string message;
    std::string diagnostics;
};

template <typename T>
using CallResult = std::variant<T, ScriptFault, InfrastructureFault>;

}  // namespace scriptbox::sandbox
