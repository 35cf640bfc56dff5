#pragma once

#include <memory>
#include <string>

#include "nlohmann/json.hpp"

namespace scriptbox::sandbox {

struct JsonCodecOptions {
    // Accept 'single quoted' string literals when parsing.
    bool allow_single_quotes = true;
};

// Immutable JSON configuration shared by every call.
class JsonCodec {
public:
    explicit JsonCodec(JsonCodecOptions options = {});

    // Throws nlohmann::json::parse_error on malformed input.
    nlohmann::json Parse(const std::string& text) const;

    // Single-line output; invalid UTF-8 is replaced rather than thrown.
    std::string Serialize(const nlohmann::json& value) const;

    const JsonCodecOptions& options() const { return options_; }

private:
    JsonCodecOptions options_;
};

// Rewrites single-quoted string literals as double-quoted JSON literals.
std::string NormalizeSingleQuotes(const std::string& text);

// Process-wide codec, built once on first use.
std::shared_ptr<const JsonCodec> SharedJsonCodec();

}  // namespace scriptbox::sandbox
