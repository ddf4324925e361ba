#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "protocol/message.h"

namespace pyremote {

/**
 * Reassembles envelopes from bytes received in arbitrary pieces and drops
 * the reader's own messages reflected back by multicast loopback.
 */
class MessageReader {
public:
    /// `own_type` is the kind of message last sent on the socket being read.
    MessageReader(MessageType own_type, std::string local_id);

    /// Append received bytes. Returns a message once a complete, non-echo
    /// envelope has been decoded; the accumulator is emptied in that case.
    std::optional<Message> feed(std::string_view bytes);

    /// True for a message this process sent itself.
    [[nodiscard]] bool is_echo(const Message& message) const;

    void reset() { buffer_.clear(); }

    /// Bytes waiting for the rest of their document.
    [[nodiscard]] std::size_t pending() const { return buffer_.size(); }

private:
    MessageType own_type_;
    std::string local_id_;
    std::string buffer_;
};

} // namespace pyremote
