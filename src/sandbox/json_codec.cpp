#include "sandbox/json_codec.hpp"

namespace scriptbox::sandbox {

JsonCodec::JsonCodec(JsonCodecOptions options)
    : options_(options) {}

nlohmann::json JsonCodec::Parse(const std::string& text) const {
    if (options_.allow_single_quotes && text.find('\'') != std::string::npos) {
        return nlohmann::json::parse(NormalizeSingleQuotes(text));
    }
    return nlohmann::json::parse(text);
}

std::string JsonCodec::Serialize(const nlohmann::json& value) const {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string NormalizeSingleQuotes(const std::string& text) {
    enum class State { kOutside, kDouble, kSingle };
    std::string out;
    out.reserve(text.size());
    State state = State::kOutside;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (state) {
            case State::kOutside:
                if (c == '"') {
                    state = State::kDouble;
                    out += c;
                } else if (c == '\'') {
                    state = State::kSingle;
                    out += '"';
                } else {
                    out += c;
                }
                break;
            case State::kDouble:
                out += c;
                if (c == '\\' && i + 1 < text.size()) {
                    out += text[++i];
                } else if (c == '"') {
                    state = State::kOutside;
                }
                break;
            case State::kSingle:
                if (c == '\\' && i + 1 < text.size()) {
                    const char next = text[++i];
                    if (next == '\'') {
                        out += '\'';
                    } else {
                        out += '\\';
                        out += next;
                    }
                } else if (c == '"') {
                    out += "\\\"";
                } else if (c == '\'') {
                    state = State::kOutside;
                    out += '"';
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::shared_ptr<const JsonCodec> SharedJsonCodec() {
    static const auto codec = std::make_shared<const JsonCodec>();
    return codec;
}

}  // namespace scriptbox::sandbox
