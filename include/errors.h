#pragma once

#include <stdexcept>
#include <string>

namespace pyremote {

/**
 * Root of every exception thrown by pyremote.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The uproject path does not point to a project with a Config/DefaultEngine.ini.
class InvalidUprojectPathError : public Error {
public:
    using Error::Error;
};

/// Settings are missing, malformed, or remote execution is disabled.
class InvalidConfigError : public Error {
public:
    using Error::Error;
};

/// A session could not be opened or lost its command socket.
class ConnectionError : public Error {
public:
    using Error::Error;
};

/// No matching peer answered the ping before the deadline.
class DiscoveryTimeoutError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

/// The peer never connected back to the command listener.
class ConnectionEstablishmentError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

/// execute() was called on a session that is not open.
class NotConnectedError : public Error {
public:
    using Error::Error;
};

/// A message holds text that is not valid UTF-8 and cannot be serialized.
class MessageEncodingError : public Error {
public:
    using Error::Error;
};

/// The remote command reported failure and the caller asked for an exception.
class CommandError : public Error {
public:
    using Error::Error;
};

} // namespace pyremote
