#include "comm/AsioTcpTransport.hpp"
#include "comm/TelnetFilter.hpp"
#include "protocol/exceptions/ClientException.h"
#include "spdlog/spdlog.h"

#include <boost/asio.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

namespace uai::comm {

using uai::protocol::ClientException;
using uai::protocol::ErrorKind;

struct AsioTcpTransport::Impl {
    explicit Impl(bool telnet)
        : ioContext_(),
          workGuard_(boost::asio::make_work_guard(ioContext_)),
          resolver_(ioContext_),
          socket_(ioContext_),
          telnetEnabled_(telnet) {}

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::ip::tcp::socket socket_;

    std::thread thread_;
    std::mutex stateMtx_;   // open/close
    std::mutex writeMtx_;   // outBuffer_ and every socket write
    std::atomic<bool> open_{false};
    std::string outBuffer_;

    bool telnetEnabled_;
    TelnetFilter telnet_;   // only touched by the reading thread

    void startIoThread() {
        if (thread_.joinable()) return;
        thread_ = std::thread([this]() {
            try {
                ioContext_.run();
            } catch (const std::exception& ex) {
                spdlog::error("[AsioTcpTransport] io_context.run() threw: {}", ex.what());
            }
        });
    }

    void stopIoThread() {
        workGuard_.reset();
        ioContext_.stop();
        if (thread_.joinable()) thread_.join();
    }

    // run fn on the io thread and wait for it; used to touch the socket while async ops may be pending
    template <typename Fn>
    void runOnIoThread(Fn fn) {
        std::promise<void> done;
        auto fut = done.get_future();
        boost::asio::post(ioContext_, [&fn, &done]() {
            fn();
            done.set_value();
        });
        fut.wait();
    }

    void sendRaw(const std::string& bytes) {
        boost::system::error_code ec;
        boost::asio::write(socket_, boost::asio::buffer(bytes), ec);
        if (ec) {
            throw ClientException(ErrorKind::Transport, "write failed: " + ec.message());
        }
    }
};

AsioTcpTransport::AsioTcpTransport(bool telnet)
    : impl_(std::make_unique<Impl>(telnet)) {}

AsioTcpTransport::~AsioTcpTransport() {
    close();
    impl_->stopIoThread();
    boost::system::error_code ec;
    impl_->socket_.close(ec);
}

void AsioTcpTransport::open(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lk(impl_->stateMtx_);
    impl_->startIoThread();

    // drop whatever is left of a previous session
    impl_->runOnIoThread([this]() {
        boost::system::error_code ec;
        impl_->socket_.close(ec);
    });
    impl_->telnet_.reset();
    {
        std::lock_guard<std::mutex> wl(impl_->writeMtx_);
        impl_->outBuffer_.clear();
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::string target = host + ":" + std::to_string(port);

    try {
        auto resolveFut = impl_->resolver_.async_resolve(host, std::to_string(port), boost::asio::use_future);
        if (resolveFut.wait_until(deadline) != std::future_status::ready) {
            boost::asio::post(impl_->ioContext_, [this]() { impl_->resolver_.cancel(); });
            throw ClientException(ErrorKind::Timeout, "resolving " + target + " timed out");
        }
        auto endpoints = resolveFut.get();

        auto connectFut = boost::asio::async_connect(impl_->socket_, endpoints, boost::asio::use_future);
        if (connectFut.wait_until(deadline) != std::future_status::ready) {
            impl_->runOnIoThread([this]() {
                boost::system::error_code ec;
                impl_->socket_.close(ec);
            });
            connectFut.wait();
            throw ClientException(ErrorKind::Timeout, "connecting to " + target + " timed out");
        }
        connectFut.get();
    } catch (const boost::system::system_error& e) {
        throw ClientException(ErrorKind::Transport, "connect to " + target + " failed: " + e.what());
    }

    boost::system::error_code ec;
    impl_->socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    impl_->open_.store(true);
    spdlog::info("Connected to {}", target);
}

std::string AsioTcpTransport::read(std::size_t maxBytes) {
    std::string buf;
    for (;;) {
        buf.assign(maxBytes, '\0');
        boost::system::error_code ec;
        const std::size_t n = impl_->socket_.read_some(boost::asio::buffer(buf), ec);
        if (ec == boost::asio::error::eof || (ec && !impl_->open_.load())) {
            return {};
        }
        if (ec) {
            throw ClientException(ErrorKind::Transport, "read failed: " + ec.message());
        }
        buf.resize(n);

        if (!impl_->telnetEnabled_) return buf;

        std::string data = impl_->telnet_.filterIncoming(buf);
        std::string replies = impl_->telnet_.takeReplies();
        if (!replies.empty()) {
            spdlog::debug("[AsioTcpTransport] refusing {} telnet option(s)", replies.size() / 3);
            std::lock_guard<std::mutex> lk(impl_->writeMtx_);
            impl_->sendRaw(replies);
        }
        // a chunk of pure negotiation is not EOF; keep reading
        if (!data.empty()) return data;
    }
}

void AsioTcpTransport::write(const std::string& data) {
    std::lock_guard<std::mutex> lk(impl_->writeMtx_);
    if (!impl_->open_.load()) {
        throw ClientException(ErrorKind::Transport, "write on closed stream");
    }
    impl_->outBuffer_ += impl_->telnetEnabled_ ? TelnetFilter::escapeOutgoing(data) : data;
}

void AsioTcpTransport::flush() {
    std::lock_guard<std::mutex> lk(impl_->writeMtx_);
    if (impl_->outBuffer_.empty()) return;
    std::string out;
    out.swap(impl_->outBuffer_);
    impl_->sendRaw(out);
}

void AsioTcpTransport::close() {
    std::lock_guard<std::mutex> lk(impl_->stateMtx_);
    if (!impl_->open_.exchange(false)) return;
    boost::system::error_code ec;
    impl_->socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        spdlog::warn("[AsioTcpTransport] shutdown: {}", ec.message());
    }
}

bool AsioTcpTransport::isOpen() const noexcept {
    return impl_->open_.load();
}

} // namespace uai::comm
