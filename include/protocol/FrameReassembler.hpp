#pragma once
#include <optional>
#include <string>

namespace uai::protocol {

/**
 * Frame: one logical unit cut out of the byte stream.
 * - login phase: one of the three fixed tokens (text empty)
 * - operational phase: one line, without "\n" and a trailing "\r"
 */
struct Frame {
    enum class Type {
        UserPrompt,
        PasswordPrompt,
        ConnectedBanner,
        Line
    };

    Type type{Type::Line};
    std::string text;
};

const char* toString(Frame::Type type) noexcept;

/**
 * FrameReassembler
 *
 * Buffers raw chunks and hands out complete frames in arrival order.
 * The caller passes the current phase to next(), so a single chunk holding a
 * login token followed by JSON lines is cut correctly once the token has
 * switched the session to operational.
 *
 *   reassembler.append(chunk);
 *   while (auto f = reassembler.next(negotiator.isOperational())) handle(*f);
 */
class FrameReassembler {
public:
    void append(const std::string& chunk);

    // next complete frame for the given phase, or nullopt if more bytes are needed
    std::optional<Frame> next(bool operational);

    // bytes received but not yet returned as a frame
    const std::string& pending() const noexcept { return buffer_; }

    void reset();

private:
    std::optional<Frame> nextToken();
    std::optional<Frame> nextLine();

    std::string buffer_;
};

} // namespace uai::protocol
