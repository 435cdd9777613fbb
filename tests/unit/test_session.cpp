#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "protocol/delta_snapshot.hpp"
#include "protocol/operation_contract.hpp"
#include "scripted_operation.hpp"
#include "session/session.hpp"

namespace {

using xcdelta::protocol::DeltaCursor;
using xcdelta::protocol::OperationOutcome;
using xcdelta::protocol::OperationStatus;
using xcdelta::protocol::SessionState;
using xcdelta::session::Clock;
using xcdelta::session::Session;
using xcdelta::testing::ScriptedOperation;
using xcdelta::testing::ScriptedRequest;

OperationOutcome succeeded() {
    return OperationOutcome{OperationStatus::Succeeded, std::nullopt};
}

TEST(SessionTest, NewSessionIsPending) {
    Session<std::string> session("s-pending", Clock::now());
    EXPECT_EQ(session.state(), SessionState::Pending);
    EXPECT_FALSE(session.is_terminal());
    EXPECT_EQ(session.fragment_count(), 0u);
    EXPECT_FALSE(session.terminated_at().has_value());
}

TEST(SessionTest, FirstFragmentPromotesToRunning) {
    Session<std::string> session("s-running", Clock::now());
    session.append_fragment("a");
    EXPECT_EQ(session.state(), SessionState::Running);
    EXPECT_FALSE(session.mark_running());
}

TEST(SessionTest, SnapshotReturnsFragmentsAfterCursor) {
    Session<std::string> session("s-cursor", Clock::now());
    session.append_fragment("a");
    session.append_fragment("b");
    session.append_fragment("c");

    const auto delta = session.snapshot(DeltaCursor(1));
    EXPECT_EQ(delta.identifier, "s-cursor");
    EXPECT_EQ(delta.results, (std::vector<std::string>{"b", "c"}));
    EXPECT_EQ(delta.next.fragments, 3u);
}

TEST(SessionTest, CursorBeyondEndIsClamped) {
    Session<std::string> session("s-clamp", Clock::now());
    session.append_fragment("a");
    session.append_log("hello\n");

    const auto delta = session.snapshot(DeltaCursor(10, 100));
    EXPECT_TRUE(delta.results.empty());
    EXPECT_TRUE(delta.log_output.empty());
    EXPECT_EQ(delta.next.fragments, 1u);
    EXPECT_EQ(delta.next.log_offset, 6u);
}

TEST(SessionTest, LogOutputIsIncrementalSinceCursor) {
    Session<std::string> session("s-log", Clock::now());
    session.append_log("first\n");

    const auto first = session.snapshot(DeltaCursor{});
    EXPECT_EQ(first.log_output, "first\n");

    session.append_log("second\n");
    const auto second = session.snapshot(first.next);
    EXPECT_EQ(second.log_output, "second\n");

    const auto third = session.snapshot(second.next);
    EXPECT_TRUE(third.log_output.empty());
}

TEST(SessionTest, TerminalSessionIsFrozen) {
    Session<std::string> session("s-frozen", Clock::now());
    session.append_fragment("a");
    ASSERT_TRUE(session.finish(succeeded()));
    EXPECT_EQ(session.state(), SessionState::Completed);
    EXPECT_TRUE(session.terminated_at().has_value());

    session.append_fragment("late");
    session.append_log("late\n");
    EXPECT_FALSE(session.finish(OperationOutcome{OperationStatus::Failed, std::nullopt}));
    EXPECT_FALSE(session.mark_running());

    const auto delta = session.snapshot(DeltaCursor{});
    EXPECT_EQ(delta.state, SessionState::Completed);
    EXPECT_EQ(delta.results, (std::vector<std::string>{"a"}));
    EXPECT_TRUE(delta.log_output.empty());
    EXPECT_FALSE(delta.error.has_value());
}

TEST(SessionTest, FailureWithoutPayloadGetsOperationFailedError) {
    Session<std::string> session("s-failed", Clock::now());
    ASSERT_TRUE(session.finish(OperationOutcome{OperationStatus::Failed, std::nullopt}));

    const auto delta = session.snapshot(DeltaCursor{});
    EXPECT_EQ(delta.state, SessionState::Failed);
    ASSERT_TRUE(delta.error.has_value());
    EXPECT_EQ(delta.error->category,
              xcdelta::core::errors::ErrorCategory::OperationFailed);
    EXPECT_EQ(delta.error->code, "operation_failed");
}

TEST(SessionTest, RequestCancelSignalsOperationAndFinishReleasesIt) {
    Session<std::string> session("s-cancel", Clock::now());
    auto runs = std::make_shared<std::atomic<int>>(0);
    auto operation = std::make_shared<ScriptedOperation>(ScriptedRequest{}, runs);
    session.attach(operation);
    ASSERT_TRUE(session.has_operation());

    EXPECT_TRUE(session.request_cancel());
    EXPECT_TRUE(session.cancel_requested());
    EXPECT_TRUE(operation->cancelled());
    EXPECT_FALSE(session.is_terminal());

    ASSERT_TRUE(session.finish(OperationOutcome{OperationStatus::Cancelled, std::nullopt}));
    EXPECT_EQ(session.state(), SessionState::Cancelled);
    EXPECT_FALSE(session.has_operation());
    EXPECT_FALSE(session.request_cancel());
}

TEST(SessionTest, ConcurrentReadersSeePrefixConsistentSnapshots) {
    constexpr int kFragments = 2000;
    Session<std::string> session("s-concurrent", Clock::now());

    std::thread writer([&session]() {
        for (int i = 0; i < kFragments; ++i) {
            session.append_fragment(std::to_string(i));
        }
        session.finish(OperationOutcome{OperationStatus::Succeeded, std::nullopt});
    });

    std::vector<std::thread> readers;
    std::atomic<int> violations{0};
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&session, &violations]() {
            DeltaCursor cursor;
            int expected = 0;
            while (true) {
                const auto delta = session.snapshot(cursor);
                for (const auto& fragment : delta.results) {
                    if (fragment != std::to_string(expected)) {
                        violations.fetch_add(1);
                    }
                    ++expected;
                }
                cursor = delta.next;
                if (xcdelta::protocol::is_terminal(delta.state)) {
                    if (expected != kFragments) {
                        violations.fetch_add(1);
                    }
                    break;
                }
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(violations.load(), 0);
}

}  // namespace
