#include "protocol/message_reader.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace pyremote {

MessageReader::MessageReader(MessageType own_type, std::string local_id)
    : own_type_(own_type), local_id_(std::move(local_id)) {}

std::optional<Message> MessageReader::feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());

    auto decoded = decode(buffer_);
    switch (decoded.status) {
    case DecodeStatus::Incomplete:
        spdlog::debug("Partial message, {} bytes buffered", buffer_.size());
        return std::nullopt;
    case DecodeStatus::Invalid:
        spdlog::debug("Dropping invalid message ({} bytes): {}", buffer_.size(), decoded.error);
        buffer_.clear();
        return std::nullopt;
    case DecodeStatus::Complete:
        break;
    }

    buffer_.clear();
    if (is_echo(*decoded.message)) {
        spdlog::debug("Ignoring echo of own '{}' message", to_string(own_type_));
        return std::nullopt;
    }
    return std::move(decoded.message);
}

bool MessageReader::is_echo(const Message& message) const {
    return message.type == own_type_ && message.source == local_id_;
}

} // namespace pyremote
