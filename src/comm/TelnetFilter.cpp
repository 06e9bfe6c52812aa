#include "comm/TelnetFilter.hpp"

namespace uai::comm {

std::string TelnetFilter::filterIncoming(const std::string& in) {
    std::string out;
    out.reserve(in.size());

    for (char ch : in) {
        const auto b = static_cast<std::uint8_t>(ch);
        switch (state_) {
        case State::Data:
            if (b == IAC) {
                state_ = State::Command;
            } else {
                out.push_back(ch);
            }
            break;

        case State::Command:
            if (b == IAC) {
                // escaped 0xFF data byte
                out.push_back(ch);
                state_ = State::Data;
            } else if (b == DO || b == DONT || b == WILL || b == WONT) {
                pendingVerb_ = b;
                state_ = State::Option;
            } else if (b == SB) {
                state_ = State::Sub;
            } else {
                // NOP, GA, AYT, ... carry no option byte; ignore
                state_ = State::Data;
            }
            break;

        case State::Option: {
            std::uint8_t reply = 0;
            if (pendingVerb_ == DO) reply = WONT;
            else if (pendingVerb_ == WILL) reply = DONT;
            // DONT / WONT are acknowledgements of our refusal; no answer
            if (reply != 0) {
                replies_.push_back(static_cast<char>(IAC));
                replies_.push_back(static_cast<char>(reply));
                replies_.push_back(ch);
            }
            pendingVerb_ = 0;
            state_ = State::Data;
            break;
        }

        case State::Sub:
            if (b == IAC) state_ = State::SubCommand;
            break;

        case State::SubCommand:
            // IAC SE ends the subnegotiation, IAC IAC is an escaped byte inside it
            state_ = (b == SE) ? State::Data : State::Sub;
            break;
        }
    }
    return out;
}

std::string TelnetFilter::takeReplies() {
    std::string r;
    r.swap(replies_);
    return r;
}

std::string TelnetFilter::escapeOutgoing(const std::string& out) {
    std::string escaped;
    escaped.reserve(out.size());
    for (char ch : out) {
        escaped.push_back(ch);
        if (static_cast<std::uint8_t>(ch) == IAC) escaped.push_back(ch);
    }
    return escaped;
}

void TelnetFilter::reset() {
    state_ = State::Data;
    pendingVerb_ = 0;
    replies_.clear();
}

} // namespace uai::comm
