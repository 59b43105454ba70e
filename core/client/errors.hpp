#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace tether {
namespace client {

/**
 * @brief Failure categories for remote calls and process supervision
 *
 * - CONNECTION              -> process could not be spawned or handshake failed
 * - PROCESS_SPAWN           -> executable could not be launched (a CONNECTION failure)
 * - CONNECTION_LOST         -> transport died mid-session
 * - TIMEOUT                 -> a single call exceeded its deadline
 * - PROTOCOL                -> malformed or unexpected message shape
 * - REMOTE                  -> server answered with a JSON-RPC error member
 * - CIRCUIT_OPEN            -> fast-fail, the operation body was not invoked
 * - RESTART_LIMIT_EXCEEDED  -> supervisor gave up on the server
 * - NOT_FOUND               -> unknown server name
 * - INVALID_ARGUMENT        -> caller supplied unusable input
 */
enum class ErrorCode {
    OK,
    CONNECTION,
    PROCESS_SPAWN,
    CONNECTION_LOST,
    TIMEOUT,
    PROTOCOL,
    REMOTE,
    CIRCUIT_OPEN,
    RESTART_LIMIT_EXCEEDED,
    NOT_FOUND,
    INVALID_ARGUMENT,
    INTERNAL
};

const char *error_code_to_string(ErrorCode code);

class ClientError : public std::runtime_error {
public:
    ClientError(ErrorCode code, const std::string &message) : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class ConnectionError : public ClientError {
public:
    explicit ConnectionError(const std::string &message) : ClientError(ErrorCode::CONNECTION, message) {}

protected:
    ConnectionError(ErrorCode code, const std::string &message) : ClientError(code, message) {}
};

// Launch failure (executable missing, not executable, fork failure)
class ProcessSpawnError : public ConnectionError {
public:
    explicit ProcessSpawnError(const std::string &message) : ConnectionError(ErrorCode::PROCESS_SPAWN, message) {}
};

class ConnectionLostError : public ClientError {
public:
    explicit ConnectionLostError(const std::string &message) : ClientError(ErrorCode::CONNECTION_LOST, message) {}
};

class TimeoutError : public ClientError {
public:
    explicit TimeoutError(const std::string &message) : ClientError(ErrorCode::TIMEOUT, message) {}
};

class ProtocolError : public ClientError {
public:
    explicit ProtocolError(const std::string &message) : ClientError(ErrorCode::PROTOCOL, message) {}
};

// JSON-RPC error object returned by the server
class RemoteError : public ClientError {
public:
    RemoteError(int rpc_code, const std::string &message, nlohmann::json data = nullptr)
        : ClientError(ErrorCode::REMOTE, message), rpc_code_(rpc_code), data_(std::move(data)) {}

    int rpc_code() const noexcept { return rpc_code_; }
    const nlohmann::json &data() const noexcept { return data_; }

private:
    int rpc_code_;
    nlohmann::json data_;
};

class CircuitBreakerOpenError : public ClientError {
public:
    explicit CircuitBreakerOpenError(const std::string &message) : ClientError(ErrorCode::CIRCUIT_OPEN, message) {}
};

class RestartLimitExceededError : public ClientError {
public:
    explicit RestartLimitExceededError(const std::string &message)
        : ClientError(ErrorCode::RESTART_LIMIT_EXCEEDED, message) {}
};

class NotFoundError : public ClientError {
public:
    explicit NotFoundError(const std::string &message) : ClientError(ErrorCode::NOT_FOUND, message) {}
};

class InvalidArgumentError : public ClientError {
public:
    explicit InvalidArgumentError(const std::string &message) : ClientError(ErrorCode::INVALID_ARGUMENT, message) {}
};

// Throws the exception class that matches code. INTERNAL/OK map to ClientError.
[[noreturn]] void throw_client_error(ErrorCode code, const std::string &message);

/**
 * @brief Outcome of an administrative supervisor operation
 *
 * Batch shutdown and restart paths inspect this instead of catching.
 */
struct OperationResult {
    bool success = true;
    ErrorCode code = ErrorCode::OK;
    std::string error_message;

    static OperationResult ok() { return OperationResult{}; }
    static OperationResult failure(ErrorCode code, const std::string &message) {
        return OperationResult{false, code, message};
    }

    // Converts a failed result into the matching exception
    void throw_if_error() const {
        if (!success) {
            throw_client_error(code, error_message);
        }
    }
};

}  // namespace client
}  // namespace tether
