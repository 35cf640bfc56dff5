#include "sandbox/result_interpreter.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "sandbox/error_classifier.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {
namespace pt = boost::property_tree;

namespace {

constexpr const char* kResultElement = "result";

class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

InfrastructureFault MakeProtocolFault(const char* tag, const std::string& message) {
    utils::Log(utils::LogLevel::kError, tag, "Failed to decode driver response: " + message);
    return InfrastructureFault{InfrastructureError::kProtocol, message, {}};
}

// First <result> in document order, like a DOM getElementsByTagName lookup.
const pt::ptree* FindElement(const pt::ptree& node, const std::string& name) {
    for (const auto& [key, child] : node) {
        if (key == name) {
            return &child;
        }
        if (key == "<xmlattr>" || key == "<xmlcomment>") {
            continue;
        }
        if (const auto* found = FindElement(child, name)) {
            return found;
        }
    }
    return nullptr;
}

std::string ExtractResultText(const std::string& output) {
    pt::ptree tree;
    std::istringstream stream(output);
    pt::read_xml(stream, tree);
    const auto* result = FindElement(tree, kResultElement);
    if (result == nullptr) {
        throw ProtocolError("missing <result> element");
    }
    return result->data();
}

std::string ReadOptionalString(const nlohmann::json& data, const char* key) {
    const auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw ProtocolError(std::string("field ") + key + " is not a string");
    }
    return it->get<std::string>();
}

std::vector<std::string> ReadStringList(const nlohmann::json& data, const char* key) {
    std::vector<std::string> items;
    const auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return items;
    }
    if (!it->is_array()) {
        throw ProtocolError(std::string("field ") + key + " is not a list");
    }
    for (const auto& item : *it) {
        items.push_back(item.is_string() ? item.get<std::string>() : item.dump());
    }
    return items;
}

ScriptResult DecodeScriptResult(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ProtocolError("script result is not an object");
    }
    ScriptResult result{};
    const auto it = data.find("returnResult");
    if (it != data.end()) {
        result.return_result = *it;
    }
    result.exception = ReadOptionalString(data, "exception");
    result.traceback = ReadStringList(data, "traceback");
    return result;
}

EvaluationResult DecodeEvaluationResult(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ProtocolError("evaluation result is not an object");
    }
    EvaluationResult result{};
    const auto it = data.find("returnResult");
    if (it != data.end() && !it->is_null()) {
        result.return_result = it->is_string() ? it->get<std::string>() : it->dump();
    }
    const auto type_tag = ReadOptionalString(data, "returnType");
    if (!type_tag.empty()) {
        result.return_type = ParseReturnType(type_tag);
    }
    result.exception = ReadOptionalString(data, "exception");
    for (auto& resource : ReadStringList(data, "accessedResources")) {
        result.accessed_resources.insert(std::move(resource));
    }
    return result;
}

bool EqualsIgnoreCase(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

long long ParseInteger(const std::string& raw) {
    if (raw.empty() || std::isspace(static_cast<unsigned char>(raw.front()))) {
        throw ProtocolError("invalid integer return result: '" + raw + "'");
    }
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &consumed);
    } catch (const std::logic_error&) {
        throw ProtocolError("invalid integer return result: '" + raw + "'");
    }
    if (consumed != raw.size()) {
        throw ProtocolError("invalid integer return result: '" + raw + "'");
    }
    return value;
}

nlohmann::json CoerceReturnResult(const EvaluationResult& result, const JsonCodec& codec) {
    switch (*result.return_type) {
        case ReturnType::kBoolean:
            return EqualsIgnoreCase(result.return_result, "true");
        case ReturnType::kInteger:
            return ParseInteger(result.return_result);
        case ReturnType::kList: {
            auto list = codec.Parse(result.return_result);
            if (!list.is_array()) {
                throw ProtocolError("LIST return result is not an array");
            }
            return list;
        }
        case ReturnType::kString:
            break;
    }
    return result.return_result;
}

}  // namespace

ReturnType ParseReturnType(const std::string& tag) {
    if (tag == "BOOLEAN") {
        return ReturnType::kBoolean;
    }
    if (tag == "INTEGER") {
        return ReturnType::kInteger;
    }
    if (tag == "LIST") {
        return ReturnType::kList;
    }
    return ReturnType::kString;
}

ExecutionResultInterpreter::ExecutionResultInterpreter(std::shared_ptr<const JsonCodec> codec)
    : codec_(std::move(codec)) {}

CallResult<ExecutionOutput> ExecutionResultInterpreter::Interpret(const std::string& output) const {
    ScriptResult result{};
    try {
        result = DecodeScriptResult(codec_->Parse(ExtractResultText(output)));
    } catch (const pt::ptree_error& ex) {
        return MakeProtocolFault("exec", std::string("malformed XML envelope: ") + ex.what());
    } catch (const nlohmann::json::exception& ex) {
        return MakeProtocolFault("exec", std::string("malformed script result: ") + ex.what());
    } catch (const ProtocolError& ex) {
        return MakeProtocolFault("exec", ex.what());
    }

    if (!result.exception.empty()) {
        auto message = FormatException(result.exception, result.traceback);
        utils::Log(utils::LogLevel::kError, "exec", "Failed to execute user script: " + message);
        return ScriptFault{std::move(message)};
    }
    return ExecutionOutput{std::move(result.return_result)};
}

EvaluationResultInterpreter::EvaluationResultInterpreter(std::shared_ptr<const JsonCodec> codec)
    : codec_(std::move(codec)) {}

CallResult<EvaluationOutput> EvaluationResultInterpreter::Interpret(const std::string& output,
                                                                    ValueMap& context) const {
    try {
        auto result = DecodeEvaluationResult(codec_->Parse(output));
        if (!result.exception.empty()) {
            utils::Log(utils::LogLevel::kError, "eval", "Failed to evaluate expression: " + result.exception);
            return ScriptFault{std::move(result.exception)};
        }
        if (!result.return_type.has_value()) {
            return MakeProtocolFault("eval", "Missing return type for return result.");
        }
        auto value = CoerceReturnResult(result, *codec_);
        context[kAccessedResourcesKey] = nlohmann::json(result.accessed_resources);
        return EvaluationOutput{std::move(value), context};
    } catch (const nlohmann::json::exception& ex) {
        return MakeProtocolFault("eval", std::string("malformed evaluation result: ") + ex.what());
    } catch (const ProtocolError& ex) {
        return MakeProtocolFault("eval", ex.what());
    }
}

}  // namespace scriptbox::sandbox
