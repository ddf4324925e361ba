#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>

#include "command/command_request.h"
#include "command/command_result.h"
#include "config/remote_execution_config.h"
#include "protocol/message.h"

namespace pyremote {

/**
 * TCP channel carrying one command and its result at a time.
 *
 * We listen on the config's command address; the peer connects to it after
 * receiving open_connection. Exchanges are strictly half-duplex.
 */
class CommandChannel {
public:
    static constexpr std::chrono::milliseconds kAcceptTimeout{2000};

    CommandChannel(const RemoteExecutionConfig& config, std::string peer_id);
    ~CommandChannel();

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    /// Bind and listen on the command address. Must precede open_connection.
    void listen();

    /// Accept the peer's connection. Throws ConnectionEstablishmentError.
    void accept(std::chrono::milliseconds timeout = kAcceptTimeout);

    /**
     * Send one command and wait up to `timeout` for its result.
     *
     * A timeout yields a failed result rather than an exception. With
     * `raise_on_failure` any failed result throws CommandError instead.
     * Throws ConnectionError if the peer dropped the connection.
     */
    CommandResult send(const CommandRequest& request,
                       std::chrono::milliseconds timeout,
                       bool raise_on_failure = false);

    /// Close the accepted socket and the listener. Safe to call repeatedly.
    void close();

    [[nodiscard]] bool is_listening() const { return acceptor_.is_open(); }
    [[nodiscard]] bool is_connected() const { return socket_.is_open(); }
    [[nodiscard]] const std::string& peer_id() const { return peer_id_; }

private:
    std::optional<Message> receive_result(std::chrono::milliseconds timeout);
    void drop_connection();

    RemoteExecutionConfig config_;
    std::string peer_id_;
    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    asio::ip::tcp::socket socket_;
    std::vector<char> buffer_;
};

} // namespace pyremote
