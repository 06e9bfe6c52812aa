#pragma once
/**
 * Connection.hpp
 *
 * One telnet session with a UAI+ controller.
 *
 * Responsibilities:
 *  - open the transport (bounded by ConnectionSettings::connectTimeout)
 *  - run the read loop: bytes -> FrameReassembler -> Negotiator (login) or RequestCorrelator (replies)
 *  - sendRequestAndAwait(): issue id, write {"id","method","params"}, block until the reply
 *  - unwind everything when the stream ends: every waiter gets the termination cause
 *
 * Threading:
 *  - connect() starts one read-loop thread per session.
 *  - sendRequestAndAwait() may be called from any number of threads.
 *  - The ready / disconnected handlers run on the read-loop thread. They must not
 *    call sendRequestAndAwait() (the reply could never be read); disconnect() is fine.
 *  - connect() must not race with other calls on the same instance.
 *
 * A Connection can be reconnected: connect() resets ids, pending requests and login state.
 */

#include "comm/IStreamTransport.hpp"
#include "config/Config.hpp"
#include "protocol/Negotiator.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace uai::client {

class Connection {
public:
    using ReadyHandler = std::function<void()>;
    using DisconnectedHandler = std::function<void(std::exception_ptr cause)>;
    using TransportFactory =
        std::function<std::unique_ptr<uai::comm::IStreamTransport>(const uai::config::ConnectionSettings&)>;

    // transportFactory == nullptr: AsioTcpTransport
    explicit Connection(uai::config::ConnectionSettings settings,
                        ReadyHandler onReady = nullptr,
                        DisconnectedHandler onDisconnected = nullptr,
                        TransportFactory transportFactory = nullptr);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // opens the stream and starts the read loop; throws ClientException(ConnectionFailed)
    void connect();

    // blocks until login completed; rethrows the termination cause if the session ended first
    void awaitReady();
    // false if neither happened within timeout
    bool awaitReady(std::chrono::milliseconds timeout);

    // closes the stream and waits for the read loop to finish; safe to call repeatedly.
    // From a handler it only closes the stream and returns.
    void disconnect();

    // throws ClientException: NotReady, ErrorResponse, ConnectionClosed, Transport
    nlohmann::json sendRequestAndAwait(const std::string& method, const nlohmann::json& params);

    bool isReady() const noexcept;
    uai::protocol::NegotiationState state() const noexcept;
    const uai::config::ConnectionSettings& settings() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace uai::client
