#pragma once

#include <memory>
#include <optional>
#include <string>

#include "sandbox/call_result.hpp"
#include "sandbox/json_codec.hpp"

namespace scriptbox::sandbox {

// Decodes the execution driver's answer: an XML document whose single
// <result> element carries {returnResult, exception, traceback} as JSON.
class ExecutionResultInterpreter {
public:
    explicit ExecutionResultInterpreter(std::shared_ptr<const JsonCodec> codec);

    CallResult<ExecutionOutput> Interpret(const std::string& output) const;

private:
    std::shared_ptr<const JsonCodec> codec_;
};

// Decodes the evaluation driver's answer, a bare JSON record
// {returnResult, returnType, exception, accessedResources}.
class EvaluationResultInterpreter {
public:
    explicit EvaluationResultInterpreter(std::shared_ptr<const JsonCodec> codec);

    // On success the accessed resources are published into context under
    // kAccessedResourcesKey.
    CallResult<EvaluationOutput> Interpret(const std::string& output, ValueMap& context) const;

private:
    std::shared_ptr<const JsonCodec> codec_;
};

// Tags other than BOOLEAN, INTEGER and LIST read as kString.
ReturnType ParseReturnType(const std::string& tag);

}  // namespace scriptbox::sandbox
