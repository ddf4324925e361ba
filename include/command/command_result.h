#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "protocol/message.h"

namespace pyremote {

/// One line of output captured while the command ran, e.g. {"Info", "hello"}.
struct OutputEntry {
    std::string kind;
    std::string text;
};

/**
 * Outcome of one remote command, built from the peer's command_result
 * payload. Immutable once constructed.
 */
class CommandResult {
public:
    /// Build from the `data` payload of a command_result.
    explicit CommandResult(const nlohmann::json& data);

    /// Build from a full command_result envelope.
    static CommandResult from_message(const Message& message);

    /// Result of a command whose reply never arrived.
    static CommandResult timeout();

    [[nodiscard]] bool success() const { return success_; }
    [[nodiscard]] const std::string& result() const { return result_; }
    [[nodiscard]] const std::vector<OutputEntry>& output() const { return output_; }
    [[nodiscard]] bool timed_out() const { return timed_out_; }
    [[nodiscard]] const std::optional<std::string>& source() const { return source_; }
    [[nodiscard]] const std::optional<std::string>& dest() const { return dest_; }

    /// "kind: text" per output entry, newline separated.
    [[nodiscard]] std::string output_str() const;

    /// output_str() on success, result() otherwise.
    [[nodiscard]] std::string to_string() const;

    /// Throws CommandError carrying result() unless success().
    void raise_if_failed() const;

    explicit operator bool() const { return success_; }

private:
    bool success_ = false;
    std::string result_;
    std::vector<OutputEntry> output_;
    bool timed_out_ = false;
    std::optional<std::string> source_;
    std::optional<std::string> dest_;
};

} // namespace pyremote
