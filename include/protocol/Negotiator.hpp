#pragma once
/**
 * Negotiator.hpp
 *
 * Login handshake of the UAI+ telnet console.
 *
 *   Idle --User:--> AwaitingUser --Password:--> AwaitingPassword --Connected--> Operational
 *
 * Any violation moves to Failed and throws a ClientException tagged
 * InvalidUser, InvalidPassword or ProtocolViolation. The class performs no
 * I/O: the credential to transmit is returned in the step and the caller
 * writes it.
 */

#include "protocol/FrameReassembler.hpp"
#include "protocol/exceptions/ClientException.h"

#include <atomic>
#include <optional>
#include <string>

namespace uai::protocol {

enum class NegotiationState {
    Idle,
    AwaitingUser,
    AwaitingPassword,
    Operational,
    Failed,
    Closed      // was operational, session has ended
};

const char* toString(NegotiationState state) noexcept;

struct NegotiationStep {
    std::optional<std::string> transmit;   // credential to send right away
    bool ready{false};                     // true exactly once, on the banner
};

class Negotiator {
public:
    Negotiator(std::string user, std::string password);

    NegotiationStep onFrame(Frame::Type type);

    NegotiationState state() const noexcept { return state_.load(); }
    bool isOperational() const noexcept { return state_.load() == NegotiationState::Operational; }

    // session ended: Operational -> Closed, any other non-terminal state -> Failed
    void terminate() noexcept;

    void reset();

private:
    // moves to Failed and returns the exception to throw
    ClientException fail(ErrorKind kind, const std::string& what);

    std::string user_;
    std::string password_;

    std::atomic<NegotiationState> state_{NegotiationState::Idle};
    bool userPromptSeen_{false};
    bool passwordPromptSeen_{false};
};

} // namespace uai::protocol
