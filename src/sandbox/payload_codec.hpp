#pragma once

#include <memory>
#include <string>

#include "sandbox/call_result.hpp"
#include "sandbox/json_codec.hpp"

namespace scriptbox::sandbox {

// Builds the single-line request each driver reads from stdin.
class PayloadCodec {
public:
    explicit PayloadCodec(std::shared_ptr<const JsonCodec> codec);

    // {"script_name": <file name without extension>, "inputs": {name: string}}
    std::string EncodeExecution(const std::string& script_file_name, const ValueMap& inputs) const;

    // {"expression": ..., "envSetup": ..., "context": {...}}
    std::string EncodeEvaluation(const EvaluationRequest& request) const;

private:
    std::shared_ptr<const JsonCodec> codec_;
};

// Strings pass through as their contents, everything else as compact JSON text.
std::string StringifyInput(const nlohmann::json& value);

}  // namespace scriptbox::sandbox
