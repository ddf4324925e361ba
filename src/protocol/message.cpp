/**
 * Message — JSON envelope codec for the remote execution protocol.
 *
 * Decoding distinguishes a truncated document (more bytes may still arrive
 * on the socket) from a malformed one, and validates the payload of each
 * message kind before handing it out.
 */

#include "protocol/message.h"

#include "errors.h"

#include <array>
#include <utility>

namespace pyremote {

namespace {

using json = nlohmann::json;

struct TypeName {
    MessageType type;
    const char* name;
};

constexpr std::array<TypeName, 6> kTypeNames{{
    {MessageType::Ping, "ping"},
    {MessageType::Pong, "pong"},
    {MessageType::OpenConnection, "open_connection"},
    {MessageType::CloseConnection, "close_connection"},
    {MessageType::Command, "command"},
    {MessageType::CommandResult, "command_result"},
}};

bool has_string(const json& data, const char* key) {
    return data.is_object() && data.contains(key) && data.at(key).is_string();
}

// Empty string when the payload matches the schema of its message kind.
std::string validate_payload(MessageType type, const json& data) {
    switch (type) {
    case MessageType::Pong:
        if (!has_string(data, "project_name"))
            return "pong without data.project_name";
        break;
    case MessageType::OpenConnection:
        if (!has_string(data, "command_ip"))
            return "open_connection without data.command_ip";
        if (!data.contains("command_port") || !data.at("command_port").is_number_integer())
            return "open_connection without integer data.command_port";
        break;
    case MessageType::Command:
        if (!has_string(data, "command") || !has_string(data, "exec_mode"))
            return "command without data.command or data.exec_mode";
        break;
    case MessageType::Ping:
    case MessageType::CloseConnection:
    case MessageType::CommandResult:
        break;
    }
    return {};
}

DecodeResult invalid(std::string error) {
    return DecodeResult{DecodeStatus::Invalid, std::nullopt, std::move(error)};
}

Message make_envelope(MessageType type, const std::string& source) {
    Message message;
    message.type = type;
    message.source = source;
    return message;
}

} // namespace

const char* to_string(MessageType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type)
            return entry.name;
    }
    return "unknown";
}

std::optional<MessageType> message_type_from_string(std::string_view text) {
    for (const auto& entry : kTypeNames) {
        if (text == entry.name)
            return entry.type;
    }
    return std::nullopt;
}

std::string encode(const Message& message) {
    json envelope = {
        {"type", to_string(message.type)},
        {"version", message.version},
        {"magic", message.magic},
        {"source", message.source},
    };
    if (message.dest)
        envelope["dest"] = *message.dest;
    if (!message.data.is_null() && !message.data.empty())
        envelope["data"] = message.data;
    try {
        return envelope.dump();
    } catch (const json::type_error& e) {
        throw MessageEncodingError(std::string("Cannot encode '") + to_string(message.type)
                                   + "' message: " + e.what());
    }
}

DecodeResult decode(std::string_view bytes) {
    json envelope;
    try {
        envelope = json::parse(bytes.begin(), bytes.end());
    } catch (const json::parse_error& e) {
        // The parser reports one past the last byte when it ran out of input.
        if (e.byte > bytes.size())
            return DecodeResult{DecodeStatus::Incomplete, std::nullopt, e.what()};
        return invalid(e.what());
    }

    if (!envelope.is_object())
        return invalid("envelope is not an object");
    if (!has_string(envelope, "type"))
        return invalid("envelope without type");

    const auto type = message_type_from_string(envelope.at("type").get<std::string>());
    if (!type)
        return invalid("unknown message type '" + envelope.at("type").get<std::string>() + "'");

    if (!envelope.contains("version") || !envelope.at("version").is_number_integer()
        || envelope.at("version").get<int>() != kProtocolVersion)
        return invalid("unsupported protocol version");
    if (!has_string(envelope, "magic") || envelope.at("magic").get<std::string>() != kProtocolMagic)
        return invalid("bad magic");
    if (!has_string(envelope, "source"))
        return invalid("envelope without source");

    Message message;
    message.type = *type;
    message.version = kProtocolVersion;
    message.magic = kProtocolMagic;
    message.source = envelope.at("source").get<std::string>();

    if (envelope.contains("dest") && !envelope.at("dest").is_null()) {
        if (!envelope.at("dest").is_string())
            return invalid("dest is not a string");
        message.dest = envelope.at("dest").get<std::string>();
    }

    if (envelope.contains("data") && !envelope.at("data").is_null()) {
        if (!envelope.at("data").is_object())
            return invalid("data is not an object");
        message.data = envelope.at("data");
    }

    if (auto error = validate_payload(message.type, message.data); !error.empty())
        return invalid(std::move(error));

    return DecodeResult{DecodeStatus::Complete, std::move(message), {}};
}

Message make_ping(const std::string& source) {
    return make_envelope(MessageType::Ping, source);
}

Message make_open_connection(const std::string& source, const std::string& dest, const Endpoint& command_address) {
    auto message = make_envelope(MessageType::OpenConnection, source);
    message.dest = dest;
    message.data = {
        {"command_ip", command_address.ip},
        {"command_port", command_address.port},
    };
    return message;
}

Message make_close_connection(const std::string& source, const std::string& dest) {
    auto message = make_envelope(MessageType::CloseConnection, source);
    message.dest = dest;
    return message;
}

Message make_command(const std::string& source, const std::string& dest, const CommandRequest& request) {
    auto message = make_envelope(MessageType::Command, source);
    message.dest = dest;
    message.data = {
        {"command", request.command},
        {"unattended", request.unattended},
        {"exec_mode", to_string(request.exec_mode)},
    };
    return message;
}

} // namespace pyremote
