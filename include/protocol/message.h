#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "command/command_request.h"
#include "config/remote_execution_config.h"

namespace pyremote {

constexpr int kProtocolVersion = 1;
constexpr const char* kProtocolMagic = "ue_py";

/**
 * Every message kind the protocol knows. Ping, OpenConnection,
 * CloseConnection and Command are sent by the controller; Pong and
 * CommandResult are the peer's replies.
 */
enum class MessageType {
    Ping,
    Pong,
    OpenConnection,
    CloseConnection,
    Command,
    CommandResult,
};

const char* to_string(MessageType type);
std::optional<MessageType> message_type_from_string(std::string_view text);

/**
 * The JSON envelope shared by all message kinds.
 */
struct Message {
    MessageType type = MessageType::Ping;
    int version = kProtocolVersion;
    std::string magic = kProtocolMagic;
    std::string source;
    std::optional<std::string> dest;
    nlohmann::json data = nlohmann::json::object();
};

enum class DecodeStatus {
    Complete,   ///< a valid envelope was decoded
    Incomplete, ///< the bytes end before the JSON document does
    Invalid,    ///< malformed JSON or an envelope that fails validation
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::Invalid;
    std::optional<Message> message;
    std::string error;
};

/// Serialize to compact JSON. `dest` and an empty `data` are omitted.
/// Throws MessageEncodingError on strings that are not valid UTF-8.
std::string encode(const Message& message);

/// Parse and validate an envelope, including the payload schema of its type.
DecodeResult decode(std::string_view bytes);

Message make_ping(const std::string& source);
Message make_open_connection(const std::string& source, const std::string& dest, const Endpoint& command_address);
Message make_close_connection(const std::string& source, const std::string& dest);
Message make_command(const std::string& source, const std::string& dest, const CommandRequest& request);

} // namespace pyremote
