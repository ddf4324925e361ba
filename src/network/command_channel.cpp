/**
 * CommandChannel — point-to-point command socket with the remote node.
 *
 * The node connects back to our listener after open_connection. Commands go
 * out as JSON envelopes; results come back as JSON documents that may be
 * split across any number of reads, so bytes are accumulated until they
 * form a complete document.
 */

#include "network/command_channel.h"

#include "errors.h"
#include "network/timed_io.h"
#include "protocol/message_reader.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace pyremote {

CommandChannel::CommandChannel(const RemoteExecutionConfig& config, std::string peer_id)
    : config_(config),
      peer_id_(std::move(peer_id)),
      acceptor_(io_),
      socket_(io_),
      buffer_(config.buffer_size()) {}

CommandChannel::~CommandChannel() {
    close();
}

void CommandChannel::listen() {
    const auto& address = config_.command_address();
    const asio::ip::tcp::endpoint endpoint(asio::ip::make_address_v4(address.ip), address.port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    spdlog::debug("Command listener bound to {}", address.to_string());
}

void CommandChannel::accept(std::chrono::milliseconds timeout) {
    if (!acceptor_.is_open())
        throw ConnectionEstablishmentError("Command listener is not open");

    const auto io = accept_until(io_, acceptor_, socket_, Clock::now() + timeout);
    if (io.timed_out()) {
        throw ConnectionEstablishmentError("Node " + peer_id_ + " did not connect to "
                                           + config_.command_address().to_string() + " within "
                                           + std::to_string(timeout.count()) + " ms");
    }
    if (io.ec)
        throw ConnectionEstablishmentError("Accepting command connection failed: " + io.ec.message());

    spdlog::debug("Command connection accepted from node {}", peer_id_);
}

CommandResult CommandChannel::send(const CommandRequest& request,
                                   std::chrono::milliseconds timeout,
                                   bool raise_on_failure) {
    if (!socket_.is_open())
        throw ConnectionError("Command connection is not established");

    const auto bytes = encode(make_command(config_.local_id(), peer_id_, request));
    spdlog::debug("Sending command ({}, {} bytes)", to_string(request.exec_mode), bytes.size());

    asio::error_code ec;
    asio::write(socket_, asio::buffer(bytes), ec);
    if (ec) {
        const auto reason = ec.message();
        drop_connection();
        throw ConnectionError("Sending command failed: " + reason);
    }

    const auto reply = receive_result(timeout);
    auto result = reply ? CommandResult::from_message(*reply) : CommandResult::timeout();
    spdlog::debug("Command {}", reply ? (result.success() ? "succeeded" : "failed") : "timed out");

    if (raise_on_failure)
        result.raise_if_failed();
    return result;
}

void CommandChannel::close() {
    drop_connection();
    if (acceptor_.is_open()) {
        asio::error_code ec;
        acceptor_.close(ec);
        if (ec)
            spdlog::warn("Closing command listener: {}", ec.message());
    }
}

void CommandChannel::drop_connection() {
    if (!socket_.is_open())
        return;
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected)
        spdlog::debug("Command socket shutdown: {}", ec.message());
    socket_.close(ec);
    if (ec)
        spdlog::warn("Closing command socket: {}", ec.message());
}

std::optional<Message> CommandChannel::receive_result(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    MessageReader reader(MessageType::Command, config_.local_id());

    while (true) {
        const auto io = receive_some_until(io_, socket_, asio::buffer(buffer_), deadline);
        if (io.timed_out()) {
            if (reader.pending() > 0)
                spdlog::warn("Command timed out with {} bytes of an unfinished reply", reader.pending());
            return std::nullopt;
        }
        if (io.ec) {
            drop_connection();
            throw ConnectionError("Command connection lost: " + io.ec.message());
        }

        auto message = reader.feed({buffer_.data(), io.bytes});
        if (!message)
            continue;

        // The node answers a command only with command_result; any other kind
        // on this socket is stray traffic, not the reply.
        if (message->type != MessageType::CommandResult) {
            spdlog::debug("Skipping '{}' on command socket", to_string(message->type));
            continue;
        }
        return message;
    }
}

} // namespace pyremote
