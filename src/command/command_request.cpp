#include "command/command_request.h"

#include <cmath>
#include <cstdlib>

namespace pyremote {

const char* to_string(ExecMode mode) {
    switch (mode) {
    case ExecMode::ExecuteFile:
        return "ExecuteFile";
    case ExecMode::ExecuteStatement:
        return "ExecuteStatement";
    case ExecMode::EvaluateStatement:
        return "EvaluateStatement";
    }
    return "EvaluateStatement";
}

std::optional<ExecMode> exec_mode_from_string(std::string_view text) {
    if (text == "ExecuteFile")
        return ExecMode::ExecuteFile;
    if (text == "ExecuteStatement")
        return ExecMode::ExecuteStatement;
    if (text == "EvaluateStatement")
        return ExecMode::EvaluateStatement;
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> timeout_from_seconds(const std::string& text) {
    if (text.empty())
        return std::nullopt;

    char* end = nullptr;
    const double seconds = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(seconds) || seconds <= 0.0
        || seconds > kMaxTimeoutSeconds)
        return std::nullopt;

    const std::chrono::milliseconds timeout(static_cast<long long>(seconds * 1000.0));
    if (timeout.count() == 0)
        return std::nullopt;
    return timeout;
}

} // namespace pyremote
