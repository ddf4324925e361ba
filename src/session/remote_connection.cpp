/**
 * RemoteConnection — open / execute / close lifecycle for one remote node.
 *
 *   Closed ──open()──▶ Discovering ──▶ Open ──close()──▶ Closed
 *
 * open() pings the multicast group and picks the first node that matches the
 * configured project, binds the command listener, sends open_connection and
 * waits for the node to connect back. Any failure on the way tears the
 * partial session down, so a caller only ever sees Closed or Open.
 */

#include "session/remote_connection.h"

#include "errors.h"
#include "network/command_channel.h"
#include "pipe/json_output_pipe.h"

#include <utility>

#include <spdlog/spdlog.h>

namespace pyremote {

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Closed:
        return "closed";
    case SessionState::Discovering:
        return "discovering";
    case SessionState::Open:
        return "open";
    }
    return "unknown";
}

RemoteConnection::RemoteConnection(RemoteExecutionConfig config, JsonOutputPipe* output_pipe)
    : config_(std::move(config)), output_pipe_(output_pipe) {
    spdlog::debug("Config: {}", config_.to_string());
}

RemoteConnection::~RemoteConnection() {
    close();
}

void RemoteConnection::open() {
    if (state_ != SessionState::Closed)
        throw ConnectionError(std::string("Connection is already ") + to_string(state_));

    try {
        discovery_ = std::make_unique<DiscoveryChannel>(config_);
        state_ = SessionState::Discovering;

        discovery_->send_ping();
        peer_ = discovery_->receive_pong(discovery_timeout_);
        if (!peer_) {
            throw DiscoveryTimeoutError(
                config_.has_target_name()
                    ? "No node running project '" + config_.target_name() + "' answered"
                    : std::string("No node answered the ping"));
        }

        command_ = std::make_unique<CommandChannel>(config_, peer_->node_id);
        command_->listen();
        discovery_->send_open_connection(peer_->node_id);
        command_->accept();

        if (output_pipe_ != nullptr)
            output_pipe_->flush();
    } catch (const Error&) {
        release();
        throw;
    } catch (const asio::system_error& e) {
        release();
        throw ConnectionError(std::string("Connection failed: ") + e.what());
    }

    state_ = SessionState::Open;

    spdlog::info("Connection established: project {} (engine {})", peer_->project_name,
                 peer_->engine_version);
}

CommandResult RemoteConnection::execute(const std::string& command,
                                        ExecMode exec_mode,
                                        bool unattended,
                                        std::chrono::milliseconds timeout,
                                        bool raise_on_failure) {
    CommandRequest request;
    request.command = command;
    request.exec_mode = exec_mode;
    request.unattended = unattended;
    return execute(request, timeout, raise_on_failure);
}

CommandResult RemoteConnection::execute(const CommandRequest& request,
                                        std::chrono::milliseconds timeout,
                                        bool raise_on_failure) {
    if (state_ != SessionState::Open)
        throw NotConnectedError("Connection was not opened");

    try {
        return command_->send(request, timeout, raise_on_failure);
    } catch (const ConnectionError&) {
        release();
        throw;
    }
}

void RemoteConnection::close() {
    if (state_ == SessionState::Closed)
        return;
    release();
    spdlog::info("Connection closed");
}

void RemoteConnection::release() {
    if (discovery_ && peer_) {
        try {
            discovery_->send_close_connection(peer_->node_id);
        } catch (const asio::system_error& e) {
            spdlog::warn("Could not send close_connection to {}: {}", peer_->node_id, e.what());
        }
    }
    if (command_)
        command_->close();
    if (discovery_)
        discovery_->close();

    command_.reset();
    discovery_.reset();
    peer_.reset();
    state_ = SessionState::Closed;
}

} // namespace pyremote
