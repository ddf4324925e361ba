#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "command/command_request.h"
#include "command/command_result.h"
#include "config/remote_execution_config.h"
#include "network/discovery_channel.h"

namespace pyremote {

class CommandChannel;
class JsonOutputPipe;

enum class SessionState {
    Closed,
    Discovering,
    Open,
};

const char* to_string(SessionState state);

/**
 * Session with one remote node: discovers it, opens the command connection,
 * runs commands and tears everything down again.
 *
 * Usage:
 *   RemoteConnection conn(RemoteExecutionConfig::from_uproject_path(path));
 *   conn.open();
 *   auto result = conn.execute("1 + 2");
 *   conn.close();
 *
 * No socket exists while the session is Closed. The destructor closes an
 * open session.
 */
class RemoteConnection {
public:
    static constexpr std::chrono::milliseconds kDiscoveryTimeout{500};
    static constexpr std::chrono::milliseconds kDefaultCommandTimeout{5000};

    /// `output_pipe`, if given, must outlive the connection.
    explicit RemoteConnection(RemoteExecutionConfig config = RemoteExecutionConfig(),
                              JsonOutputPipe* output_pipe = nullptr);
    ~RemoteConnection();

    RemoteConnection(const RemoteConnection&) = delete;
    RemoteConnection& operator=(const RemoteConnection&) = delete;

    /// Find a node and open the command connection.
    /// Throws DiscoveryTimeoutError, ConnectionEstablishmentError or ConnectionError.
    void open();

    /// Run a command. Throws NotConnectedError unless the session is open.
    CommandResult execute(const std::string& command,
                          ExecMode exec_mode = ExecMode::EvaluateStatement,
                          bool unattended = true,
                          std::chrono::milliseconds timeout = kDefaultCommandTimeout,
                          bool raise_on_failure = false);

    CommandResult execute(const CommandRequest& request,
                          std::chrono::milliseconds timeout = kDefaultCommandTimeout,
                          bool raise_on_failure = false);

    /// Notify the node and release the sockets. No-op when already closed.
    void close();

    /// Override the discovery deadline used by open().
    void set_discovery_timeout(std::chrono::milliseconds timeout) { discovery_timeout_ = timeout; }

    [[nodiscard]] SessionState state() const { return state_; }
    [[nodiscard]] bool is_open() const { return state_ == SessionState::Open; }
    [[nodiscard]] const std::optional<PeerDescriptor>& peer() const { return peer_; }
    [[nodiscard]] const RemoteExecutionConfig& config() const { return config_; }
    [[nodiscard]] JsonOutputPipe* output_pipe() const { return output_pipe_; }

private:
    void release();

    RemoteExecutionConfig config_;
    JsonOutputPipe* output_pipe_;
    std::chrono::milliseconds discovery_timeout_ = kDiscoveryTimeout;
    SessionState state_ = SessionState::Closed;
    std::unique_ptr<DiscoveryChannel> discovery_;
    std::unique_ptr<CommandChannel> command_;
    std::optional<PeerDescriptor> peer_;
};

} // namespace pyremote
