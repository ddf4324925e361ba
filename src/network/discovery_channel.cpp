/**
 * DiscoveryChannel — multicast handshake with remote editor nodes.
 *
 * A ping goes out to the multicast group; every node listening on the group
 * answers with its project name, engine version and node id. Once a node is
 * picked, open_connection tells it where our command listener is, and
 * close_connection tells it to hang up.
 */

#include "network/discovery_channel.h"

#include "network/timed_io.h"
#include "protocol/message_reader.h"

#include <spdlog/spdlog.h>

namespace pyremote {

namespace {

std::string string_field(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data.at(key).is_string())
        return data.at(key).get<std::string>();
    return {};
}

} // namespace

PeerDescriptor PeerDescriptor::from_message(const Message& reply) {
    const auto& data = reply.data;

    PeerDescriptor peer;
    peer.node_id = reply.source;
    peer.project_name = string_field(data, "project_name");
    peer.engine_version = string_field(data, "engine_version");
    peer.command_ip = string_field(data, "command_ip");
    if (data.contains("command_port") && data.at("command_port").is_number_integer())
        peer.command_port = data.at("command_port").get<int>();
    peer.metadata = data;
    return peer;
}

bool accepts_pong(const Message& message, const RemoteExecutionConfig& config) {
    if (message.source == config.local_id())
        return false;

    // Nodes may answer with the request's own type; a bare ping from another
    // controller carries no project name and is not an answer.
    const bool is_reply = message.type == MessageType::Pong
        || (message.type == MessageType::Ping && message.data.contains("project_name")
            && message.data.at("project_name").is_string());
    if (!is_reply)
        return false;

    if (!config.has_target_name())
        return true;
    return message.data.at("project_name").get<std::string>() == config.target_name();
}

DiscoveryChannel::DiscoveryChannel(const RemoteExecutionConfig& config)
    : config_(config),
      socket_(io_),
      buffer_(config.buffer_size()) {
    const auto group = asio::ip::make_address_v4(config_.multicast_group().ip);
    const auto bind_address = asio::ip::make_address_v4(config_.multicast_bind_address());
    group_endpoint_ = asio::ip::udp::endpoint(group, config_.multicast_group().port);

    socket_.open(asio::ip::udp::v4());
    socket_.set_option(asio::ip::udp::socket::reuse_address(true));
    socket_.set_option(asio::ip::multicast::hops(static_cast<int>(config_.multicast_ttl())));
    socket_.set_option(asio::ip::multicast::enable_loopback(true));
    socket_.bind(asio::ip::udp::endpoint(bind_address, group_endpoint_.port()));
    socket_.set_option(asio::ip::multicast::join_group(group, bind_address));

    spdlog::debug("Joined multicast group {} on {}", config_.multicast_group().to_string(),
                  config_.multicast_bind_address());
}

DiscoveryChannel::~DiscoveryChannel() {
    close();
}

void DiscoveryChannel::send_ping() {
    send(make_ping(config_.local_id()));
}

std::optional<PeerDescriptor> DiscoveryChannel::receive_pong(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    MessageReader reader(last_sent_, config_.local_id());

    while (true) {
        const auto io = receive_some_until(io_, socket_, asio::buffer(buffer_), deadline);
        if (io.timed_out()) {
            spdlog::debug("No matching node answered within {} ms", timeout.count());
            return std::nullopt;
        }
        if (io.ec)
            throw asio::system_error(io.ec, "multicast receive");

        auto message = reader.feed({buffer_.data(), io.bytes});
        if (!message)
            continue;

        if (!accepts_pong(*message, config_)) {
            spdlog::debug("Skipping '{}' from {}", to_string(message->type), message->source);
            continue;
        }

        auto peer = PeerDescriptor::from_message(*message);
        spdlog::debug("Found node {} (project {}, engine {})", peer.node_id, peer.project_name,
                      peer.engine_version);
        return peer;
    }
}

void DiscoveryChannel::send_open_connection(const std::string& peer_id) {
    send(make_open_connection(config_.local_id(), peer_id, config_.command_address()));
    opened_peer_ = peer_id;
}

void DiscoveryChannel::send_close_connection(const std::string& peer_id) {
    if (opened_peer_.empty() || opened_peer_ != peer_id)
        return;
    send(make_close_connection(config_.local_id(), peer_id));
    opened_peer_.clear();
}

void DiscoveryChannel::close() {
    if (!socket_.is_open())
        return;
    asio::error_code ec;
    const auto bind_address = asio::ip::make_address_v4(config_.multicast_bind_address(), ec);
    if (!ec)
        socket_.set_option(asio::ip::multicast::leave_group(group_endpoint_.address().to_v4(), bind_address), ec);
    if (ec)
        spdlog::debug("Leaving multicast group: {}", ec.message());
    socket_.close(ec);
    if (ec)
        spdlog::warn("Closing multicast socket: {}", ec.message());
}

void DiscoveryChannel::send(const Message& message) {
    const auto bytes = encode(message);
    spdlog::debug("Sending '{}' message ({} bytes)", to_string(message.type), bytes.size());
    socket_.send_to(asio::buffer(bytes), group_endpoint_);
    last_sent_ = message.type;
}

} // namespace pyremote
