#include <gtest/gtest.h>

#include <variant>

#include "sandbox/result_interpreter.hpp"

using scriptbox::sandbox::EvaluationOutput;
using scriptbox::sandbox::EvaluationResultInterpreter;
using scriptbox::sandbox::ExecutionOutput;
using scriptbox::sandbox::ExecutionResultInterpreter;
using scriptbox::sandbox::InfrastructureError;
using scriptbox::sandbox::InfrastructureFault;
using scriptbox::sandbox::ReturnType;
using scriptbox::sandbox::ScriptFault;
using scriptbox::sandbox::SharedJsonCodec;
using scriptbox::sandbox::ValueMap;

namespace {

std::string Envelope(const std::string& record) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?><result>" + record + "</result>";
}

}  // namespace

TEST(ExecutionResultInterpreter, ReturnsDecodedReturnResult) {
    ExecutionResultInterpreter interpreter(SharedJsonCodec());
    const auto result = interpreter.Interpret(
        Envelope(R"({"returnResult": {"a": [1, 2]}, "exception": null, "traceback": []})"));
    const auto* output = std::get_if<ExecutionOutput>(&result);
    ASSERT_NE(nullptr, output);
    EXPECT_EQ(nlohmann::json({{"a", {1, 2}}}), output->value);
}

TEST(ExecutionResultInterpreter, FindsNestedResultElement) {
    ExecutionResultInterpreter interpreter(SharedJsonCodec());
    const auto result = interpreter.Interpret(
        "<response><meta>x</meta><result>{'returnResult': 'ok'}</result></response>");
    const auto* output = std::get_if<ExecutionOutput>(&result);
    ASSERT_NE(nullptr, output);
    EXPECT_EQ("ok", output->value.get<std::string>());
}

TEST(ExecutionResultInterpreter, DecodesEscapedXmlText) {
    ExecutionResultInterpreter interpreter(SharedJsonCodec());
    const auto result = interpreter.Interpret(Envelope(R"({"returnResult": "a &lt; b &amp; c"})"));
    const auto* output = std::get_if<ExecutionOutput>(&result);
    ASSERT_NE(nullptr, output);
    EXPECT_EQ("a < b & c", output->value.get<std::string>());
}

TEST(ExecutionResultInterpreter, ScriptExceptionBecomesScriptFault) {
    ExecutionResultInterpreter interpreter(SharedJsonCodec());
    const auto result = interpreter.Interpret(Envelope(
        R"({"returnResult": null, "exception": "boom", "traceback": ["  File \"/tmp/x.py\", line 3, in f"]})"));
    const auto* fault = std::get_if<ScriptFault>(&result);
    ASSERT_NE(nullptr, fault);
    EXPECT_EQ("line 3, in f, boom", fault->message);
}

TEST(ExecutionResultInterpreter, ExceptionWithoutTracebackIsVerbatim) {
    ExecutionResultInterpreter interpreter(SharedJsonCodec());
    const auto result = interpreter.Interpret(Envelope(R"({"exception": "boom", "traceback": []})"));
    const auto* fault = std::get_if<ScriptFault>(&result);
    ASSERT_NE(nullptr, fault);
    EXPECT_EQ("boom", fault->message);
}

TEST(ExecutionResultInterpreter, MalformedResponsesAreProtocolErrors) {
    ExecutionResultInterpreter interpreter(SharedJsonCodec());
    const std::vector<std::string> responses = {
        "",
        "plain text",
        "<other>{}</other>",
        Envelope("not json"),
        Envelope("[1, 2]"),
        Envelope(R"({"traceback": "not a list"})")
    };
    for (const auto& response : responses) {
        const auto result = interpreter.Interpret(response);
        const auto* fault = std::get_if<InfrastructureFault>(&result);
        ASSERT_NE(nullptr, fault) << response;
        EXPECT_EQ(InfrastructureError::kProtocol, fault->kind) << response;
    }
}

TEST(EvaluationResultInterpreter, CoercesBoolean) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    const auto result = interpreter.Interpret(
        R"({"returnResult": "true", "returnType": "BOOLEAN", "exception": null, "accessedResources": []})", context);
    const auto* output = std::get_if<EvaluationOutput>(&result);
    ASSERT_NE(nullptr, output);
    EXPECT_EQ(nlohmann::json(true), output->value);
}

TEST(EvaluationResultInterpreter, BooleanComparisonIgnoresCase) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    const auto truthy = interpreter.Interpret(R"({"returnResult": "True", "returnType": "BOOLEAN"})", context);
    const auto falsy = interpreter.Interpret(R"({"returnResult": "False", "returnType": "BOOLEAN"})", context);
    EXPECT_EQ(nlohmann::json(true), std::get<EvaluationOutput>(truthy).value);
    EXPECT_EQ(nlohmann::json(false), std::get<EvaluationOutput>(falsy).value);
}

TEST(EvaluationResultInterpreter, CoercesInteger) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    const auto result = interpreter.Interpret(R"({"returnResult": "42", "returnType": "INTEGER"})", context);
    const auto* output = std::get_if<EvaluationOutput>(&result);
    ASSERT_NE(nullptr, output);
    ASSERT_TRUE(output->value.is_number_integer());
    EXPECT_EQ(42, output->value.get<long long>());

    const auto negative = interpreter.Interpret(R"({"returnResult": "-7", "returnType": "INTEGER"})", context);
    EXPECT_EQ(-7, std::get<EvaluationOutput>(negative).value.get<long long>());
}

TEST(EvaluationResultInterpreter, MalformedIntegerIsProtocolError) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    for (const auto* raw : {"4x2", "", " 1", "99999999999999999999999"}) {
        const auto response = nlohmann::json{{"returnResult", raw}, {"returnType", "INTEGER"}}.dump();
        const auto result = interpreter.Interpret(response, context);
        const auto* fault = std::get_if<InfrastructureFault>(&result);
        ASSERT_NE(nullptr, fault) << raw;
        EXPECT_EQ(InfrastructureError::kProtocol, fault->kind);
    }
}

TEST(EvaluationResultInterpreter, CoercesList) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    const auto result = interpreter.Interpret(R"({"returnResult": "[\"a\",\"b\"]", "returnType": "LIST"})", context);
    const auto* output = std::get_if<EvaluationOutput>(&result);
    ASSERT_NE(nullptr, output);
    EXPECT_EQ(nlohmann::json::array({"a", "b"}), output->value);
}

TEST(EvaluationResultInterpreter, ListAcceptsSingleQuotedItems) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    const auto result = interpreter.Interpret(R"({"returnResult": "['a', 1]", "returnType": "LIST"})", context);
    EXPECT_EQ(nlohmann::json::array({"a", 1}), std::get<EvaluationOutput>(result).value);
}

TEST(EvaluationResultInterpreter, OtherTagsPassRawString) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    for (const auto* tag : {"STRING", "DICT", "unknown"}) {
        const auto response = nlohmann::json{{"returnResult", "hi"}, {"returnType", tag}}.dump();
        const auto result = interpreter.Interpret(response, context);
        const auto* output = std::get_if<EvaluationOutput>(&result);
        ASSERT_NE(nullptr, output) << tag;
        EXPECT_EQ(nlohmann::json("hi"), output->value);
    }
}

TEST(EvaluationResultInterpreter, MissingReturnTypeIsProtocolError) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    for (const auto* response : {R"({"returnResult": "hi"})", R"({"returnResult": "hi", "returnType": null})"}) {
        const auto result = interpreter.Interpret(response, context);
        const auto* fault = std::get_if<InfrastructureFault>(&result);
        ASSERT_NE(nullptr, fault);
        EXPECT_EQ(InfrastructureError::kProtocol, fault->kind);
        EXPECT_EQ("Missing return type for return result.", fault->message);
    }
    EXPECT_EQ(0u, context.count(scriptbox::sandbox::kAccessedResourcesKey));
}

TEST(EvaluationResultInterpreter, ExceptionIsPassedThroughUnmodified) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    const auto result = interpreter.Interpret(
        R"({"returnResult": null, "exception": "File \"/tmp/x.py\", line 1, NameError", "returnType": null})", context);
    const auto* fault = std::get_if<ScriptFault>(&result);
    ASSERT_NE(nullptr, fault);
    EXPECT_EQ("File \"/tmp/x.py\", line 1, NameError", fault->message);
}

TEST(EvaluationResultInterpreter, PublishesAccessedResourcesIntoContext) {
    EvaluationResultInterpreter interpreter(SharedJsonCodec());
    ValueMap context;
    context["x"] = 1;
    context["y"] = 2;
    const auto result = interpreter.Interpret(
        R"({"returnResult": "3", "returnType": "INTEGER", "accessedResources": ["y", "x", "x"]})", context);
    const auto* output = std::get_if<EvaluationOutput>(&result);
    ASSERT_NE(nullptr, output);

    const auto expected = nlohmann::json::array({"x", "y"});
    ASSERT_EQ(1u, context.count(scriptbox::sandbox::kAccessedResourcesKey));
    EXPECT_EQ(expected, context[scriptbox::sandbox::kAccessedResourcesKey]);
    EXPECT_EQ(expected, output->context.at(scriptbox::sandbox::kAccessedResourcesKey));
    EXPECT_EQ(nlohmann::json(1), output->context.at("x"));
}

TEST(EvaluationResultInterpreter, ParseReturnTypeMatchesExactTags) {
    EXPECT_EQ(ReturnType::kBoolean, scriptbox::sandbox::ParseReturnType("BOOLEAN"));
    EXPECT_EQ(ReturnType::kInteger, scriptbox::sandbox::ParseReturnType("INTEGER"));
    EXPECT_EQ(ReturnType::kList, scriptbox::sandbox::ParseReturnType("LIST"));
    EXPECT_EQ(ReturnType::kString, scriptbox::sandbox::ParseReturnType("STRING"));
    EXPECT_EQ(ReturnType::kString, scriptbox::sandbox::ParseReturnType("list"));
}
