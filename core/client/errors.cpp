#include "errors.hpp"

namespace tether {
namespace client {

const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::CONNECTION:
            return "CONNECTION";
        case ErrorCode::PROCESS_SPAWN:
            return "PROCESS_SPAWN";
        case ErrorCode::CONNECTION_LOST:
            return "CONNECTION_LOST";
        case ErrorCode::TIMEOUT:
            return "TIMEOUT";
        case ErrorCode::PROTOCOL:
            return "PROTOCOL";
        case ErrorCode::REMOTE:
            return "REMOTE";
        case ErrorCode::CIRCUIT_OPEN:
            return "CIRCUIT_OPEN";
        case ErrorCode::RESTART_LIMIT_EXCEEDED:
            return "RESTART_LIMIT_EXCEEDED";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::INTERNAL:
            return "INTERNAL";
    }
    return "INTERNAL";
}

void throw_client_error(ErrorCode code, const std::string &message) {
    switch (code) {
        case ErrorCode::CONNECTION:
            throw ConnectionError(message);
        case ErrorCode::PROCESS_SPAWN:
            throw ProcessSpawnError(message);
        case ErrorCode::CONNECTION_LOST:
            throw ConnectionLostError(message);
        case ErrorCode::TIMEOUT:
            throw TimeoutError(message);
        case ErrorCode::PROTOCOL:
            throw ProtocolError(message);
        case ErrorCode::REMOTE:
            throw RemoteError(0, message);
        case ErrorCode::CIRCUIT_OPEN:
            throw CircuitBreakerOpenError(message);
        case ErrorCode::RESTART_LIMIT_EXCEEDED:
            throw RestartLimitExceededError(message);
        case ErrorCode::NOT_FOUND:
            throw NotFoundError(message);
        case ErrorCode::INVALID_ARGUMENT:
            throw InvalidArgumentError(message);
        case ErrorCode::OK:
        case ErrorCode::INTERNAL:
            break;
    }
    throw ClientError(ErrorCode::INTERNAL, message);
}

}  // namespace client
}  // namespace tether
