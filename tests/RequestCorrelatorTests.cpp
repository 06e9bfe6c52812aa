#include "protocol/RequestCorrelator.hpp"
#include "protocol/FrameReassembler.hpp"
#include "protocol/Negotiator.hpp"
#include "protocol/exceptions/ClientException.h"
#include "FakeTransport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using uai::protocol::ClientException;
using uai::protocol::ErrorKind;
using uai::protocol::Frame;
using uai::protocol::FrameReassembler;
using uai::protocol::Negotiator;
using uai::protocol::RequestCorrelator;

namespace {

std::exception_ptr closedCause() {
    return std::make_exception_ptr(ClientException(ErrorKind::ConnectionClosed, "gone"));
}

ClientException awaitFailure(RequestCorrelator& c, int id) {
    try {
        c.await(id);
    } catch (const ClientException& e) {
        return e;
    }
    ADD_FAILURE() << "await(" << id << ") did not throw";
    return ClientException(ErrorKind::Transport, "none");
}

} // namespace

TEST(RequestCorrelatorTest, IdsStartAtOneAndIncrease) {
    RequestCorrelator c;
    EXPECT_EQ(c.issue(), 1);
    EXPECT_EQ(c.issue(), 2);
    EXPECT_EQ(c.issue(), 3);
    EXPECT_EQ(c.pendingCount(), 3u);
}

TEST(RequestCorrelatorTest, ResetStartsIdsOver) {
    RequestCorrelator c;
    c.issue();
    c.issue();
    c.reset();
    EXPECT_EQ(c.issue(), 1);
    EXPECT_EQ(c.pendingCount(), 1u);
}

TEST(RequestCorrelatorTest, ResolveBeforeAwaitIsKept) {
    RequestCorrelator c;
    int id = c.issue("status.position");
    EXPECT_TRUE(c.resolve(id, 42));
    EXPECT_EQ(c.pendingCount(), 0u);
    EXPECT_EQ(c.await(id), 42);
}

TEST(RequestCorrelatorTest, AwaitBlocksUntilResolved) {
    RequestCorrelator c;
    int id = c.issue();
    auto fut = std::async(std::launch::async, [&]() { return c.await(id); });
    EXPECT_EQ(fut.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);
    c.resolve(id, "done");
    EXPECT_EQ(fut.get(), "done");
}

TEST(RequestCorrelatorTest, RejectCarriesPayloadIdAndMethod) {
    RequestCorrelator c;
    int id = c.issue("move.up");
    EXPECT_TRUE(c.reject(id, "busy"));

    auto e = awaitFailure(c, id);
    EXPECT_EQ(e.kind(), ErrorKind::ErrorResponse);
    ASSERT_TRUE(e.requestId().has_value());
    EXPECT_EQ(*e.requestId(), id);
    EXPECT_EQ(e.method(), "move.up");
    EXPECT_EQ(e.payload(), "busy");
}

TEST(RequestCorrelatorTest, UnknownIdsAreMisses) {
    RequestCorrelator c;
    int id = c.issue();
    EXPECT_FALSE(c.resolve(id + 1, 1));
    EXPECT_FALSE(c.reject(99, "x"));
    EXPECT_TRUE(c.resolve(id, 1));
    // second reply for the same id
    EXPECT_FALSE(c.resolve(id, 2));
    EXPECT_EQ(c.await(id), 1);
}

TEST(RequestCorrelatorTest, AwaitingUnissuedIdIsALogicError) {
    RequestCorrelator c;
    EXPECT_THROW(c.await(5), std::logic_error);
    int id = c.issue();
    c.resolve(id, 0);
    c.await(id);
    EXPECT_THROW(c.await(id), std::logic_error);
}

TEST(RequestCorrelatorTest, TerminateDrainsEveryPendingRequest) {
    RequestCorrelator c;
    std::vector<int> ids = {c.issue(), c.issue(), c.issue()};
    c.resolve(ids[1], "answered");

    c.terminate(closedCause());
    EXPECT_EQ(c.pendingCount(), 0u);
    EXPECT_TRUE(c.isTerminated());

    EXPECT_EQ(awaitFailure(c, ids[0]).kind(), ErrorKind::ConnectionClosed);
    EXPECT_EQ(c.await(ids[1]), "answered");
    EXPECT_EQ(awaitFailure(c, ids[2]).kind(), ErrorKind::ConnectionClosed);

    // late replies are no-ops
    EXPECT_FALSE(c.resolve(ids[0], 1));
    EXPECT_FALSE(c.reject(ids[2], "late"));
}

TEST(RequestCorrelatorTest, IssueAfterTerminateFailsImmediately) {
    RequestCorrelator c;
    c.terminate(closedCause());
    int id = c.issue();
    EXPECT_EQ(c.pendingCount(), 0u);
    EXPECT_EQ(awaitFailure(c, id).kind(), ErrorKind::ConnectionClosed);
}

TEST(RequestCorrelatorTest, ForgetDropsBothEntries) {
    RequestCorrelator c;
    int id = c.issue();
    c.forget(id);
    EXPECT_EQ(c.pendingCount(), 0u);
    EXPECT_FALSE(c.resolve(id, 1));
    EXPECT_THROW(c.await(id), std::logic_error);
}

TEST(RequestCorrelatorTest, DispatchRoutesResultAndError) {
    RequestCorrelator c;
    int a = c.issue();
    int b = c.issue();
    EXPECT_TRUE(c.dispatch("{\"id\":2,\"error\":{\"code\":3}}"));
    EXPECT_TRUE(c.dispatch("{\"id\":1,\"result\":[\"g1\",\"g2\"]}"));
    EXPECT_EQ(c.await(a), nlohmann::json::array({"g1", "g2"}));
    EXPECT_EQ(awaitFailure(c, b).payload()["code"], 3);
}

TEST(RequestCorrelatorTest, DispatchIgnoresUnknownIdAndGarbage) {
    RequestCorrelator c;
    int id = c.issue();
    EXPECT_FALSE(c.dispatch("{\"id\":7,\"error\":\"busy\"}"));
    EXPECT_FALSE(c.dispatch("hello"));
    EXPECT_FALSE(c.dispatch(""));
    EXPECT_EQ(c.pendingCount(), 1u);
    EXPECT_TRUE(c.dispatch("{\"id\":1,\"result\":true}"));
    EXPECT_EQ(c.await(id), true);
}

// Read loop pipeline on one chunk holding the banner and the first reply.
TEST(RequestCorrelatorTest, BannerAndFirstReplyInOneChunk) {
    FrameReassembler reassembler;
    Negotiator negotiator("admin", "secret");
    RequestCorrelator correlator;
    std::vector<std::string> sent;
    std::vector<std::string> events;

    auto feed = [&](const std::string& chunk) {
        reassembler.append(chunk);
        while (auto f = reassembler.next(negotiator.isOperational())) {
            if (f->type == Frame::Type::Line) {
                if (correlator.dispatch(f->text)) events.push_back("resolved");
                continue;
            }
            auto step = negotiator.onFrame(f->type);
            if (step.transmit) sent.push_back(*step.transmit);
            if (step.ready) events.push_back("ready");
        }
    };

    const int id = correlator.issue();
    ASSERT_EQ(id, 1);

    feed("User:");
    ASSERT_EQ(sent, std::vector<std::string>({"admin"}));
    feed("Password:");
    ASSERT_EQ(sent, std::vector<std::string>({"admin", "secret"}));
    feed(uai::test::kBanner + "{\"id\":1,\"result\":5}\n");

    EXPECT_EQ(events, std::vector<std::string>({"ready", "resolved"}));
    EXPECT_EQ(correlator.await(id), 5);
}
