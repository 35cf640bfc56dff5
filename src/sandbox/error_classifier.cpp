#include "sandbox/error_classifier.hpp"

#include <algorithm>

namespace scriptbox::sandbox {
namespace {

constexpr const char* kScriptFileMarker = ".py\"";
// The marker itself plus the ", " that follows it.
constexpr std::size_t kScriptFileDelimiters = 6;

}  // namespace

std::string StripScriptPath(const std::string& frame) {
    const auto marker = frame.find(kScriptFileMarker);
    if (marker == std::string::npos) {
        return frame;
    }
    const auto start = std::min(marker + kScriptFileDelimiters, frame.size());
    return frame.substr(start);
}

std::string FormatException(const std::string& exception, const std::vector<std::string>& traceback) {
    if (traceback.empty()) {
        return exception;
    }
    return StripScriptPath(traceback.back()) + ", " + exception;
}

}  // namespace scriptbox::sandbox
