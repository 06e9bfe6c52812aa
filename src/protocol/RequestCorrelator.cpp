#include "protocol/RequestCorrelator.hpp"
#include "protocol/MessageCodec.hpp"
#include "protocol/exceptions/ClientException.h"
#include "spdlog/spdlog.h"

#include <stdexcept>
#include <utility>
#include <vector>

namespace uai::protocol {

RequestCorrelator::~RequestCorrelator() {
    terminate(std::make_exception_ptr(
        ClientException(ErrorKind::ConnectionClosed, "request correlator destroyed")));
}

int RequestCorrelator::issue(const std::string& method) {
    std::lock_guard<std::mutex> lk(mtx_);
    const int id = ++nextId_;

    PendingRequest req;
    req.method = method;
    waiters_.emplace(id, req.promise.get_future());

    if (terminatedCause_) {
        // session already over: nothing would ever answer this id
        req.promise.set_exception(terminatedCause_);
    } else {
        pending_.emplace(id, std::move(req));
    }
    return id;
}

nlohmann::json RequestCorrelator::await(int id) {
    std::future<nlohmann::json> fut;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = waiters_.find(id);
        if (it == waiters_.end()) {
            throw std::logic_error("await on request id " + std::to_string(id) +
                                   " that was not issued or is already awaited");
        }
        fut = std::move(it->second);
        waiters_.erase(it);
    }
    return fut.get();
}

bool RequestCorrelator::resolve(int id, nlohmann::json result) {
    std::promise<nlohmann::json> prom;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;
        prom = std::move(it->second.promise);
        pending_.erase(it);
    }
    prom.set_value(std::move(result));
    return true;
}

bool RequestCorrelator::reject(int id, nlohmann::json error) {
    PendingRequest req;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return false;
        req = std::move(it->second);
        pending_.erase(it);
    }
    req.promise.set_exception(std::make_exception_ptr(
        ClientException::errorResponse(id, req.method, std::move(error))));
    return true;
}

void RequestCorrelator::forget(int id) {
    std::lock_guard<std::mutex> lk(mtx_);
    pending_.erase(id);
    waiters_.erase(id);
}

bool RequestCorrelator::dispatch(const std::string& line) {
    Response resp = MessageCodec::parse(line);
    if (!resp.valid) {
        spdlog::warn("Ignoring unrecognized line: {}", line);
        return false;
    }

    const bool matched = resp.isError ? reject(resp.id, std::move(resp.payload))
                                      : resolve(resp.id, std::move(resp.payload));
    if (!matched) {
        // late reply, or a reply to a request we never made
        spdlog::warn("No pending request for id {}: {}", resp.id, line);
    }
    return matched;
}

void RequestCorrelator::terminate(std::exception_ptr cause) {
    if (!cause) {
        cause = std::make_exception_ptr(
            ClientException(ErrorKind::ConnectionClosed, "Connection to the server was closed."));
    }

    std::vector<std::promise<nlohmann::json>> moved;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        terminatedCause_ = cause;
        moved.reserve(pending_.size());
        for (auto& kv : pending_) {
            moved.push_back(std::move(kv.second.promise));
        }
        pending_.clear();
    }

    if (!moved.empty()) {
        spdlog::debug("Failing {} pending request(s): {}", moved.size(), describe(cause));
    }
    for (auto& p : moved) {
        p.set_exception(cause);
    }
}

void RequestCorrelator::reset() {
    // anything still pending belongs to the previous session
    terminate(std::make_exception_ptr(
        ClientException(ErrorKind::ConnectionClosed, "session reset")));

    std::lock_guard<std::mutex> lk(mtx_);
    waiters_.clear();
    nextId_ = 0;
    terminatedCause_ = nullptr;
}

std::size_t RequestCorrelator::pendingCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pending_.size();
}

bool RequestCorrelator::isTerminated() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return terminatedCause_ != nullptr;
}

} // namespace uai::protocol
