#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace pyremote {

/**
 * How the peer runs the command text.
 *
 *   ExecuteFile       : a literal script with several statements, or a file
 *                       path followed by optional arguments.
 *   ExecuteStatement  : a single statement; its result is printed.
 *   EvaluateStatement : a single expression; its result is returned.
 */
enum class ExecMode {
    ExecuteFile,
    ExecuteStatement,
    EvaluateStatement,
};

/// Wire spelling, e.g. "EvaluateStatement".
const char* to_string(ExecMode mode);

std::optional<ExecMode> exec_mode_from_string(std::string_view text);

/// Longest timeout accepted from the command line, in seconds.
constexpr double kMaxTimeoutSeconds = 86'400.0;

/// Parse a timeout given in (fractional) seconds, e.g. "2.5". Empty unless
/// the text is a finite number of at least one millisecond and at most
/// kMaxTimeoutSeconds.
std::optional<std::chrono::milliseconds> timeout_from_seconds(const std::string& text);

struct CommandRequest {
    std::string command;
    bool unattended = true;
    ExecMode exec_mode = ExecMode::EvaluateStatement;
};

} // namespace pyremote
