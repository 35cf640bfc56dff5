#include "sandbox/payload_codec.hpp"

#include <filesystem>
#include <utility>

namespace scriptbox::sandbox {

PayloadCodec::PayloadCodec(std::shared_ptr<const JsonCodec> codec)
    : codec_(std::move(codec)) {}

std::string StringifyInput(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string PayloadCodec::EncodeExecution(const std::string& script_file_name,
                                          const ValueMap& inputs) const {
    nlohmann::json parsed_inputs = nlohmann::json::object();
    for (const auto& [name, value] : inputs) {
        parsed_inputs[name] = StringifyInput(value);
    }
    nlohmann::json payload = {
        {"script_name", std::filesystem::path(script_file_name).stem().string()},
        {"inputs", parsed_inputs}
    };
    return codec_->Serialize(payload);
}

std::string PayloadCodec::EncodeEvaluation(const EvaluationRequest& request) const {
    nlohmann::json context = nlohmann::json::object();
    for (const auto& [name, value] : request.context) {
        context[name] = value;
    }
    nlohmann::json payload = {
        {"expression", request.expression},
        {"envSetup", request.env_setup.has_value() ? nlohmann::json(*request.env_setup)
                                                   : nlohmann::json(nullptr)},
        {"context", context}
    };
    return codec_->Serialize(payload);
}

}  // namespace scriptbox::sandbox
