#include "protocol/Negotiator.hpp"
#include "spdlog/spdlog.h"

#include <utility>

namespace uai::protocol {

const char* toString(NegotiationState state) noexcept {
    switch (state) {
    case NegotiationState::Idle: return "Idle";
    case NegotiationState::AwaitingUser: return "AwaitingUser";
    case NegotiationState::AwaitingPassword: return "AwaitingPassword";
    case NegotiationState::Operational: return "Operational";
    case NegotiationState::Failed: return "Failed";
    case NegotiationState::Closed: return "Closed";
    }
    return "?";
}

Negotiator::Negotiator(std::string user, std::string password)
    : user_(std::move(user)),
      password_(std::move(password)) {}

NegotiationStep Negotiator::onFrame(Frame::Type type) {
    const NegotiationState current = state_.load();
    if (current == NegotiationState::Operational) {
        return {};
    }
    if (current == NegotiationState::Failed || current == NegotiationState::Closed) {
        throw ClientException(ErrorKind::ProtocolViolation,
                              std::string("frame ") + protocol::toString(type) + " after session end");
    }

    NegotiationStep step;
    switch (type) {
    case Frame::Type::UserPrompt:
        if (userPromptSeen_) {
            throw fail(ErrorKind::InvalidUser, "user prompt repeated, user name rejected");
        }
        userPromptSeen_ = true;
        state_.store(NegotiationState::AwaitingUser);
        spdlog::debug("User prompt received, sending user name");
        step.transmit = user_;
        break;

    case Frame::Type::PasswordPrompt:
        if (!userPromptSeen_) {
            throw fail(ErrorKind::ProtocolViolation, "received Password prompt without User prompt");
        }
        if (passwordPromptSeen_) {
            throw fail(ErrorKind::InvalidPassword, "password prompt repeated, password rejected");
        }
        passwordPromptSeen_ = true;
        state_.store(NegotiationState::AwaitingPassword);
        spdlog::debug("Password prompt received, sending password");
        step.transmit = password_;
        break;

    case Frame::Type::ConnectedBanner:
        state_.store(NegotiationState::Operational);
        spdlog::debug("Connected banner received");
        step.ready = true;
        break;

    case Frame::Type::Line:
        throw fail(ErrorKind::ProtocolViolation, "unexpected line during login");
    }
    return step;
}

void Negotiator::terminate() noexcept {
    const NegotiationState current = state_.load();
    if (current == NegotiationState::Operational) {
        state_.store(NegotiationState::Closed);
    } else if (current != NegotiationState::Closed) {
        state_.store(NegotiationState::Failed);
    }
}

void Negotiator::reset() {
    state_.store(NegotiationState::Idle);
    userPromptSeen_ = false;
    passwordPromptSeen_ = false;
}

ClientException Negotiator::fail(ErrorKind kind, const std::string& what) {
    state_.store(NegotiationState::Failed);
    spdlog::warn("Login failed: {}", what);
    return ClientException(kind, what);
}

} // namespace uai::protocol
