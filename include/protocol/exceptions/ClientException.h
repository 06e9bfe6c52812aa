#ifndef UAI_CLIENT_EXCEPTION_H
#define UAI_CLIENT_EXCEPTION_H

#include <nlohmann/json.hpp>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace uai::protocol {

/**
 * @brief Closed set of failure conditions reported by the client.
 */
enum class ErrorKind {
    ConnectionFailed,   // connect() could not establish the stream
    Timeout,            // transport-level deadline expired
    Transport,          // socket error while reading or writing
    InvalidUser,        // user prompt repeated during login
    InvalidPassword,    // password prompt repeated during login
    ProtocolViolation,  // handshake order broken, or malformed reply
    ConnectionClosed,   // session ended (EOF or read loop failure)
    ErrorResponse,      // controller answered a request with "error"
    NotReady            // request issued before login completed
};

inline const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::ConnectionFailed: return "Connection Error";
    case ErrorKind::Timeout: return "Timeout Error";
    case ErrorKind::Transport: return "Transport Error";
    case ErrorKind::InvalidUser: return "Invalid User";
    case ErrorKind::InvalidPassword: return "Invalid Password";
    case ErrorKind::ProtocolViolation: return "Protocol Error";
    case ErrorKind::ConnectionClosed: return "Connection Closed";
    case ErrorKind::ErrorResponse: return "Error Response";
    case ErrorKind::NotReady: return "Not Ready";
    }
    return "Unknown Error";
}

/**
 * @brief Exception type for every client failure.
 *
 * The kind tells callers what happened; the optional cause holds the
 * underlying exception (e.g. the transport error that ended a session).
 * Error responses additionally carry the request id, method and payload.
 */
class ClientException : public std::runtime_error {
public:
    ClientException(ErrorKind kind, const std::string& message, std::exception_ptr cause = nullptr)
        : std::runtime_error(std::string(toString(kind)) + ": " + message),
          kind_(kind),
          cause_(std::move(cause)) {}

    ErrorKind kind() const noexcept { return kind_; }
    std::exception_ptr cause() const noexcept { return cause_; }

    std::optional<int> requestId() const noexcept { return requestId_; }
    const std::string& method() const noexcept { return method_; }
    const nlohmann::json& payload() const noexcept { return payload_; }

    static ClientException errorResponse(int id, const std::string& method, nlohmann::json payload) {
        std::string msg = "request " + std::to_string(id);
        if (!method.empty()) msg += " (" + method + ")";
        msg += " failed: " + payload.dump();
        ClientException ex(ErrorKind::ErrorResponse, msg);
        ex.requestId_ = id;
        ex.method_ = method;
        ex.payload_ = std::move(payload);
        return ex;
    }

private:
    ErrorKind kind_;
    std::exception_ptr cause_;
    std::optional<int> requestId_;
    std::string method_;
    nlohmann::json payload_;
};

/// what() of the exception held by ep, for logging.
inline std::string describe(const std::exception_ptr& ep) {
    if (!ep) return "no error";
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace uai::protocol

#endif // UAI_CLIENT_EXCEPTION_H
