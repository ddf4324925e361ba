#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "config/remote_execution_config.h"
#include "protocol/message.h"

namespace pyremote {

/**
 * A peer that answered our ping, as described by its reply.
 */
struct PeerDescriptor {
    std::string node_id;
    std::string project_name;
    std::string engine_version;
    std::string command_ip;
    int command_port = 0;
    nlohmann::json metadata; ///< the full reply payload

    static PeerDescriptor from_message(const Message& reply);
};

/// Whether `message` is a ping reply this config should connect to.
bool accepts_pong(const Message& message, const RemoteExecutionConfig& config);

/**
 * UDP multicast socket used to find a peer and to open or close its
 * command connection.
 */
class DiscoveryChannel {
public:
    /// Joins the multicast group. Throws asio::system_error on socket failure.
    explicit DiscoveryChannel(const RemoteExecutionConfig& config);
    ~DiscoveryChannel();

    DiscoveryChannel(const DiscoveryChannel&) = delete;
    DiscoveryChannel& operator=(const DiscoveryChannel&) = delete;

    void send_ping();

    /// Wait for a matching reply. Empty when none arrived before the timeout.
    std::optional<PeerDescriptor> receive_pong(std::chrono::milliseconds timeout);

    /// Ask the peer to connect to our command address.
    void send_open_connection(const std::string& peer_id);

    /// Tell the peer to drop its command connection. No-op unless
    /// send_open_connection() was called for that peer.
    void send_close_connection(const std::string& peer_id);

    void close();

    [[nodiscard]] bool is_open() const { return socket_.is_open(); }
    [[nodiscard]] bool connection_opened() const { return !opened_peer_.empty(); }

private:
    void send(const Message& message);

    RemoteExecutionConfig config_;
    asio::io_context io_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint group_endpoint_;
    MessageType last_sent_ = MessageType::Ping;
    std::string opened_peer_;
    std::vector<char> buffer_;
};

} // namespace pyremote
