#pragma once
/**
 * TelnetFilter.hpp
 *
 * Minimal telnet (RFC 854) layer for the UAI+ console port.
 *
 * - filterIncoming(): removes IAC sequences from received bytes and returns the
 *   application data. Every option the server offers or requests is refused
 *   (DO -> WONT, WILL -> DONT); the replies are collected and fetched with
 *   takeReplies().
 * - Subnegotiations (IAC SB ... IAC SE) are dropped.
 * - State is kept between calls, so a sequence split over two reads is handled.
 * - escapeOutgoing(): doubles 0xFF bytes.
 */

#include <cstdint>
#include <string>

namespace uai::comm {

class TelnetFilter {
public:
    static constexpr std::uint8_t IAC = 255;
    static constexpr std::uint8_t DONT = 254;
    static constexpr std::uint8_t DO = 253;
    static constexpr std::uint8_t WONT = 252;
    static constexpr std::uint8_t WILL = 251;
    static constexpr std::uint8_t SB = 250;
    static constexpr std::uint8_t SE = 240;

    std::string filterIncoming(const std::string& in);

    // negotiation replies produced by filterIncoming(), cleared on return
    std::string takeReplies();

    static std::string escapeOutgoing(const std::string& out);

    void reset();

private:
    enum class State {
        Data,
        Command,      // after IAC
        Option,       // after IAC DO/DONT/WILL/WONT
        Sub,          // inside IAC SB ...
        SubCommand    // IAC seen inside subnegotiation
    };

    State state_{State::Data};
    std::uint8_t pendingVerb_{0};
    std::string replies_;
};

} // namespace uai::comm
