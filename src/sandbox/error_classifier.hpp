#pragma once

#include <string>
#include <vector>

namespace scriptbox::sandbox {

// "<innermost frame without its script path>, <exception>", or the bare
// exception when there is no traceback.
std::string FormatException(const std::string& exception, const std::vector<std::string>& traceback);

// Drops the host path from a frame such as
//   File "/tmp/python_execution1f/script9a.py", line 3, in f
// leaving "line 3, in f". Frames without a quoted .py path come back unchanged.
std::string StripScriptPath(const std::string& frame);

}  // namespace scriptbox::sandbox
