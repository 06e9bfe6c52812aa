#include "protocol/FrameReassembler.hpp"
#include "config/Config.hpp"

#include <cstring>

namespace uai::protocol {

namespace {
    bool startsWith(const std::string& s, const char* token, std::size_t len) {
        return s.size() >= len && s.compare(0, len, token, len) == 0;
    }
} // namespace

const char* toString(Frame::Type type) noexcept {
    switch (type) {
    case Frame::Type::UserPrompt: return "UserPrompt";
    case Frame::Type::PasswordPrompt: return "PasswordPrompt";
    case Frame::Type::ConnectedBanner: return "ConnectedBanner";
    case Frame::Type::Line: return "Line";
    }
    return "?";
}

void FrameReassembler::append(const std::string& chunk) {
    buffer_ += chunk;
}

std::optional<Frame> FrameReassembler::next(bool operational) {
    return operational ? nextLine() : nextToken();
}

std::optional<Frame> FrameReassembler::nextToken() {
    struct Token {
        const char* text;
        std::size_t len;
        Frame::Type type;
    };
    static const Token tokens[] = {
        {config::USER_PROMPT, std::strlen(config::USER_PROMPT), Frame::Type::UserPrompt},
        {config::PASSWORD_PROMPT, std::strlen(config::PASSWORD_PROMPT), Frame::Type::PasswordPrompt},
        {config::CONNECTED_BANNER, config::CONNECTED_BANNER_SIZE, Frame::Type::ConnectedBanner},
    };

    for (const auto& t : tokens) {
        if (startsWith(buffer_, t.text, t.len)) {
            buffer_.erase(0, t.len);
            return Frame{t.type, {}};
        }
    }
    return std::nullopt;
}

std::optional<Frame> FrameReassembler::nextLine() {
    const auto pos = buffer_.find('\n');
    if (pos == std::string::npos) return std::nullopt;

    Frame f;
    f.type = Frame::Type::Line;
    f.text = buffer_.substr(0, pos);
    if (!f.text.empty() && f.text.back() == '\r') f.text.pop_back();
    buffer_.erase(0, pos + 1);
    return f;
}

void FrameReassembler::reset() {
    buffer_.clear();
}

} // namespace uai::protocol
