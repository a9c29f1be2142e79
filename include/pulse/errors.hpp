#ifndef PULSE_ERRORS_HPP
#define PULSE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Pulse {

/**
 * @brief Base class for all Pulse exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

// --- Transport ---

/**
 * @brief The underlying connection failed, was closed, or could not be opened.
 */
class TransportError : public RuntimeError {
public:
    explicit TransportError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief A read deadline expired before a frame arrived.
 */
class TimeoutError : public TransportError {
public:
    explicit TimeoutError(const std::string& message) : TransportError(message) {}
};

/**
 * @brief All connection attempts to the relay were exhausted.
 */
class ConnectionError : public RuntimeError {
public:
    ConnectionError(const std::string& message, std::string cause)
        : RuntimeError(message + ": " + cause), cause_(std::move(cause)) {}

    /// Description of the last underlying failure.
    const std::string& cause() const noexcept { return cause_; }

private:
    std::string cause_;
};

/**
 * @brief Rejected by the relay because the session already has two participants.
 */
class RoomFullError : public TransportError {
public:
    explicit RoomFullError(const std::string& message) : TransportError(message) {}
};

// --- Protocol ---

/**
 * @brief The receiver did not announce itself within the allowed time.
 */
class ReceiverTimeoutError : public RuntimeError {
public:
    explicit ReceiverTimeoutError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief A frame failed to decrypt: wrong key or tampered ciphertext.
 */
class AuthenticationError : public RuntimeError {
public:
    explicit AuthenticationError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief A decrypted frame does not decode to a well-formed message.
 */
class MalformedMessageError : public RuntimeError {
public:
    explicit MalformedMessageError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief A well-formed message arrived in a state that does not accept it.
 */
class ProtocolViolationError : public RuntimeError {
public:
    explicit ProtocolViolationError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief The received content does not match the checksum declared in its metadata.
 */
class ChecksumMismatchError : public RuntimeError {
public:
    ChecksumMismatchError(const std::string& expected, const std::string& actual)
        : RuntimeError("checksum mismatch: expected " + expected + ", got " + actual),
          expected_(expected),
          actual_(actual) {}

    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Common base for both sides of a cancelled transfer.
 */
class CancelledError : public RuntimeError {
public:
    explicit CancelledError(const std::string& message) : RuntimeError(message) {}
};

/**
 * @brief The local cancellation token was raised.
 */
class UserCancelledError : public CancelledError {
public:
    explicit UserCancelledError(const std::string& message) : CancelledError(message) {}
};

/**
 * @brief The peer sent a Cancel message.
 */
class PeerCancelledError : public CancelledError {
public:
    explicit PeerCancelledError(const std::string& message) : CancelledError(message) {}
};

/**
 * @brief The peer sent an Error message.
 */
class PeerReportedError : public RuntimeError {
public:
    explicit PeerReportedError(const std::string& message) : RuntimeError(message) {}
};

} // namespace Pulse

#endif // PULSE_ERRORS_HPP
