// src/client/Connection.cpp
#include "client/Connection.hpp"
#include "comm/AsioTcpTransport.hpp"
#include "protocol/FrameReassembler.hpp"
#include "protocol/MessageCodec.hpp"
#include "protocol/RequestCorrelator.hpp"
#include "protocol/exceptions/ClientException.h"
#include "spdlog/spdlog.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>

namespace uai::client {

using uai::protocol::ClientException;
using uai::protocol::ErrorKind;
using uai::protocol::Frame;

namespace {
    const char* const CLOSED_MESSAGE = "Connection to the server was closed.";

    // handshake failures keep their own kind as the session's termination cause
    bool isHandshakeFailure(const std::exception_ptr& ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const ClientException& e) {
            return e.kind() == ErrorKind::InvalidUser ||
                   e.kind() == ErrorKind::InvalidPassword ||
                   e.kind() == ErrorKind::ProtocolViolation;
        } catch (...) {
            return false;
        }
    }
} // namespace

struct Connection::Impl {
    Impl(uai::config::ConnectionSettings s,
         ReadyHandler ready,
         DisconnectedHandler disconnected,
         TransportFactory factory)
        : settings(std::move(s)),
          onReady(std::move(ready)),
          onDisconnected(std::move(disconnected)),
          transportFactory(std::move(factory)),
          negotiator(settings.user, settings.password) {
        if (!transportFactory) {
            transportFactory = [](const uai::config::ConnectionSettings& cfg) {
                return std::make_unique<uai::comm::AsioTcpTransport>(cfg.telnet);
            };
        }
        // nothing to wait for until the first connect()
        terminationCause = std::make_exception_ptr(ClientException(ErrorKind::ConnectionClosed, "not connected"));
    }

    uai::config::ConnectionSettings settings;
    ReadyHandler onReady;
    DisconnectedHandler onDisconnected;
    TransportFactory transportFactory;

    std::unique_ptr<uai::comm::IStreamTransport> transport;
    std::mutex writeMtx;        // one line on the wire at a time
    std::mutex lifecycleMtx;    // connect / join of the read thread
    std::thread readThread;
    std::atomic<bool> closing{false};   // local close requested for the current session

    uai::protocol::Negotiator negotiator;
    uai::protocol::RequestCorrelator correlator;
    uai::protocol::FrameReassembler reassembler;   // read loop only

    std::mutex stateMtx;
    std::condition_variable stateCv;
    bool readySignalled{true};       // login finished or session over
    bool readLoopFinished{true};
    std::exception_ptr terminationCause;

    void transmit(const std::string& text, bool logText) {
        std::lock_guard<std::mutex> lk(writeMtx);
        if (!transport) {
            throw ClientException(ErrorKind::NotReady, "no transport");
        }
        transport->write(text + uai::config::REQUEST_TERMINATOR);
        transport->flush();
        if (logText) spdlog::debug("Sent: {}", text);
    }

    void closeTransport() noexcept {
        if (!transport) return;
        closing.store(true);
        try {
            transport->close();
        } catch (const std::exception& e) {
            spdlog::warn("[Connection] closing transport: {}", e.what());
        }
    }

    void waitReadLoopFinished() {
        std::unique_lock<std::mutex> lk(stateMtx);
        stateCv.wait(lk, [this]() { return readLoopFinished; });
    }

    void joinReadThread() {
        if (readThread.joinable() && readThread.get_id() != std::this_thread::get_id()) {
            readThread.join();
        }
    }

    void notifyReady() {
        spdlog::info("Connection to {} negotiated", settings.host);
        if (onReady) onReady();
        {
            std::lock_guard<std::mutex> lk(stateMtx);
            readySignalled = true;
        }
        stateCv.notify_all();
    }

    void readLoop() {
        std::exception_ptr error;
        try {
            for (;;) {
                std::string chunk = transport->read(uai::config::DEFAULT_READ_CHUNK);
                if (chunk.empty()) {
                    spdlog::info("Server closed the connection");
                    break;
                }

                reassembler.append(chunk);
                while (auto frame = reassembler.next(negotiator.isOperational())) {
                    if (frame->type == Frame::Type::Line) {
                        spdlog::debug("Received: {}", frame->text);
                        correlator.dispatch(frame->text);
                        continue;
                    }
                    auto step = negotiator.onFrame(frame->type);
                    if (step.transmit) transmit(*step.transmit, false);
                    if (step.ready) notifyReady();
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("Read loop failed: {}", e.what());
            error = std::current_exception();
            // don't leave a half-open socket behind
            closeTransport();
        } catch (...) {
            spdlog::error("Read loop failed: non-standard exception");
            error = std::current_exception();
            closeTransport();
        }
        finishSession(error);
    }

    void finishSession(const std::exception_ptr& error) {
        negotiator.terminate();

        std::exception_ptr cause;
        if (!error) {
            cause = std::make_exception_ptr(ClientException(ErrorKind::ConnectionClosed, CLOSED_MESSAGE));
        } else if (isHandshakeFailure(error)) {
            cause = error;
        } else {
            cause = std::make_exception_ptr(ClientException(
                ErrorKind::ConnectionClosed,
                std::string(CLOSED_MESSAGE) + " " + uai::protocol::describe(error),
                error));
        }

        {
            std::lock_guard<std::mutex> lk(stateMtx);
            terminationCause = cause;
            readLoopFinished = true;
        }
        stateCv.notify_all();

        if (onDisconnected) {
            try {
                onDisconnected(cause);
            } catch (const std::exception& e) {
                spdlog::error("[Connection] disconnected handler threw: {}", e.what());
            } catch (...) {
                spdlog::error("[Connection] disconnected handler threw a non-standard exception");
            }
        }
        {
            std::lock_guard<std::mutex> lk(stateMtx);
            readySignalled = true;
        }
        stateCv.notify_all();

        correlator.terminate(cause);
    }
};

Connection::Connection(uai::config::ConnectionSettings settings,
                       ReadyHandler onReady,
                       DisconnectedHandler onDisconnected,
                       TransportFactory transportFactory)
    : impl_(std::make_unique<Impl>(std::move(settings),
                                   std::move(onReady),
                                   std::move(onDisconnected),
                                   std::move(transportFactory))) {}

Connection::~Connection() {
    try {
        disconnect();
    } catch (const std::exception& e) {
        spdlog::error("[Connection::~] disconnect error: {}", e.what());
    }
}

void Connection::connect() {
    std::lock_guard<std::mutex> lk(impl_->lifecycleMtx);

    // a previous session must be fully gone before its state is reset
    impl_->closeTransport();
    impl_->waitReadLoopFinished();
    impl_->joinReadThread();

    impl_->negotiator.reset();
    impl_->correlator.reset();
    impl_->reassembler.reset();
    impl_->closing.store(false);
    {
        std::lock_guard<std::mutex> sl(impl_->stateMtx);
        impl_->terminationCause = nullptr;
        impl_->readySignalled = false;
    }

    const auto& s = impl_->settings;
    spdlog::info("Connecting to {}:{}", s.host, s.port);
    try {
        auto transport = impl_->transportFactory(s);
        transport->open(s.host, s.port, s.connectTimeout);
        std::lock_guard<std::mutex> wl(impl_->writeMtx);
        impl_->transport = std::move(transport);
    } catch (const std::exception& e) {
        auto failure = ClientException(ErrorKind::ConnectionFailed,
                                       "cannot connect to " + s.host + ": " + e.what(),
                                       std::current_exception());
        {
            std::lock_guard<std::mutex> sl(impl_->stateMtx);
            impl_->terminationCause = std::make_exception_ptr(failure);
            impl_->readySignalled = true;
        }
        impl_->stateCv.notify_all();
        impl_->correlator.terminate(impl_->terminationCause);
        throw failure;
    }

    {
        std::lock_guard<std::mutex> sl(impl_->stateMtx);
        impl_->readLoopFinished = false;
    }
    impl_->readThread = std::thread([this]() { impl_->readLoop(); });
}

void Connection::awaitReady() {
    std::unique_lock<std::mutex> lk(impl_->stateMtx);
    impl_->stateCv.wait(lk, [this]() { return impl_->readySignalled; });
    if (impl_->terminationCause) std::rethrow_exception(impl_->terminationCause);
}

bool Connection::awaitReady(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(impl_->stateMtx);
    if (!impl_->stateCv.wait_for(lk, timeout, [this]() { return impl_->readySignalled; })) {
        return false;
    }
    if (impl_->terminationCause) std::rethrow_exception(impl_->terminationCause);
    return true;
}

void Connection::disconnect() {
    impl_->closeTransport();

    // called from a handler on the read thread: the loop unwinds on the EOF that follows
    if (impl_->readThread.get_id() == std::this_thread::get_id()) return;

    impl_->waitReadLoopFinished();
    std::lock_guard<std::mutex> lk(impl_->lifecycleMtx);
    impl_->joinReadThread();
}

nlohmann::json Connection::sendRequestAndAwait(const std::string& method, const nlohmann::json& params) {
    if (!impl_->negotiator.isOperational()) {
        throw ClientException(ErrorKind::NotReady,
                              "cannot send " + method + ": connection has not been successfully negotiated yet");
    }

    const int id = impl_->correlator.issue(method);
    try {
        impl_->transmit(uai::protocol::MessageCodec::makeRequest(id, method, params), true);
    } catch (const std::exception& e) {
        spdlog::warn("Request {} ({}) not sent: {}", id, method, e.what());
        if (impl_->closing.load()) {
            // session is being torn down; the read loop fails this id with the termination cause
            return impl_->correlator.await(id);
        }
        impl_->correlator.forget(id);
        throw;
    }
    return impl_->correlator.await(id);
}

bool Connection::isReady() const noexcept {
    return impl_->negotiator.isOperational();
}

uai::protocol::NegotiationState Connection::state() const noexcept {
    return impl_->negotiator.state();
}

const uai::config::ConnectionSettings& Connection::settings() const noexcept {
    return impl_->settings;
}

} // namespace uai::client
