#pragma once
/**
 * RequestCorrelator.hpp
 *
 * Matches controller replies to outstanding requests by their integer id.
 *
 * - Every issued request owns a promise; the caller blocks on its own future,
 *   so a reply wakes exactly one waiter.
 * - The pending table and the waiter table are separate: a reply may arrive
 *   (and remove the pending entry) before the caller gets to await().
 * - terminate() fails every pending request with the session's cause. After
 *   it, issue() hands out requests that are already failed with that cause.
 *
 * 사용:
 *   int id = correlator.issue("move.up");
 *   // ... write request
 *   auto result = correlator.await(id); // throws ClientException on error / close
 */

#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace uai::protocol {

class RequestCorrelator {
public:
    RequestCorrelator() = default;
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    // allocate the next id (first is 1) and register it as pending
    int issue(const std::string& method = {});

    /**
     * Blocks until the request is answered or the session ends.
     * - returns the "result" payload
     * - throws ClientException(ErrorResponse) for an "error" reply
     * - rethrows the termination cause (ClientException(ConnectionClosed) or a handshake failure)
     * - throws std::logic_error for an id that was not issued or was already awaited
     */
    nlohmann::json await(int id);

    // deliver an outcome; false if id is not pending (late or unknown reply)
    bool resolve(int id, nlohmann::json result);
    bool reject(int id, nlohmann::json error);

    // drop an id whose request never reached the wire; its outcome is never delivered
    void forget(int id);

    // parse one operational line and resolve/reject accordingly; false on a miss
    bool dispatch(const std::string& line);

    // fail every pending request with cause; later issue() calls fail immediately
    void terminate(std::exception_ptr cause);

    // start a new session: counter back to 0, tables emptied
    void reset();

    std::size_t pendingCount() const;
    bool isTerminated() const;

private:
    struct PendingRequest {
        std::string method;
        std::promise<nlohmann::json> promise;
    };

    std::unordered_map<int, PendingRequest> pending_;
    std::unordered_map<int, std::future<nlohmann::json>> waiters_;
    int nextId_{0};
    std::exception_ptr terminatedCause_;
    mutable std::mutex mtx_; // protects all of the above
};

} // namespace uai::protocol
