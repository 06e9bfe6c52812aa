#include "protocol/FrameReassembler.hpp"
#include "protocol/Negotiator.hpp"
#include "FakeTransport.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using uai::protocol::Frame;
using uai::protocol::FrameReassembler;
using uai::protocol::Negotiator;

namespace {

struct Seen {
    Frame::Type type;
    std::string text;

    bool operator==(const Seen& o) const { return type == o.type && text == o.text; }
};

// Feeds chunks the way the read loop does and records every frame.
std::vector<Seen> drive(const std::vector<std::string>& chunks) {
    FrameReassembler r;
    Negotiator n("admin", "secret");
    std::vector<Seen> out;
    for (const auto& c : chunks) {
        r.append(c);
        while (auto f = r.next(n.isOperational())) {
            out.push_back({f->type, f->text});
            if (f->type != Frame::Type::Line) n.onFrame(f->type);
        }
    }
    return out;
}

const std::string kStream = std::string("User:Password:") + uai::test::kBanner +
                            "{\"id\":1,\"result\":5}\r\n{\"id\":2,\"error\":\"busy\"}\n{\"id\":3,";

const std::vector<Seen> kExpected = {
    {Frame::Type::UserPrompt, ""},
    {Frame::Type::PasswordPrompt, ""},
    {Frame::Type::ConnectedBanner, ""},
    {Frame::Type::Line, "{\"id\":1,\"result\":5}"},
    {Frame::Type::Line, "{\"id\":2,\"error\":\"busy\"}"},
};

} // namespace

TEST(FrameReassemblerTest, TokensNeedTheWholePrefix) {
    FrameReassembler r;
    r.append("Use");
    EXPECT_FALSE(r.next(false).has_value());
    r.append("r:");
    auto f = r.next(false);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->type, Frame::Type::UserPrompt);
    EXPECT_TRUE(r.pending().empty());
}

TEST(FrameReassemblerTest, BannerIncludesTrailingNul) {
    FrameReassembler r;
    r.append("Connected:\n");
    EXPECT_FALSE(r.next(false).has_value());
    r.append(std::string("\0{\"id\":1}\n", 10));
    auto f = r.next(false);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->type, Frame::Type::ConnectedBanner);
    EXPECT_EQ(r.pending(), "{\"id\":1}\n");
}

TEST(FrameReassemblerTest, LinesKeepPartialRemainder) {
    FrameReassembler r;
    r.append("one\ntwo\r\nthr");
    EXPECT_EQ(r.next(true)->text, "one");
    EXPECT_EQ(r.next(true)->text, "two");
    EXPECT_FALSE(r.next(true).has_value());
    EXPECT_EQ(r.pending(), "thr");
    r.append("ee\n");
    EXPECT_EQ(r.next(true)->text, "three");
}

TEST(FrameReassemblerTest, EmptyLineIsStillAFrame) {
    FrameReassembler r;
    r.append("\n");
    auto f = r.next(true);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->text, "");
}

TEST(FrameReassemblerTest, UnknownLoginTextIsNotConsumed) {
    FrameReassembler r;
    r.append("Welcome");
    EXPECT_FALSE(r.next(false).has_value());
    EXPECT_EQ(r.pending(), "Welcome");
}

TEST(FrameReassemblerTest, SingleChunkHoldsTokenAndLines) {
    EXPECT_EQ(drive({kStream}), kExpected);
}

TEST(FrameReassemblerTest, SameFramesForEveryTwoWaySplit) {
    for (std::size_t i = 0; i <= kStream.size(); ++i) {
        SCOPED_TRACE("split at " + std::to_string(i));
        EXPECT_EQ(drive({kStream.substr(0, i), kStream.substr(i)}), kExpected);
    }
}

TEST(FrameReassemblerTest, SameFramesByteByByte) {
    std::vector<std::string> chunks;
    for (char c : kStream) chunks.emplace_back(1, c);
    EXPECT_EQ(drive(chunks), kExpected);
}
