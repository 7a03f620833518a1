#include <gtest/gtest.h>

#include "request_correlator.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <thread>

using namespace dombridge;

TEST(RequestCorrelator, DirectMatchResolvesWaiter) {
    RequestCorrelator correlator;
    PendingWaiter waiter = correlator.track("X", "click_element");
    ASSERT_TRUE(correlator.mark_sent("X"));
    EXPECT_EQ(correlator.state_of("X"), RequestState::Sent);

    EXPECT_EQ(correlator.resolve(make_result("X", "mcp", {{"success", true}})), ResolveOutcome::Direct);

    auto resolution = waiter.wait_for(std::chrono::milliseconds(0));
    ASSERT_TRUE(resolution.has_value());
    EXPECT_EQ(resolution->state, RequestState::Matched);
    EXPECT_EQ(resolution->envelope["result"]["success"], true);
    EXPECT_EQ(correlator.pending_count(), 0u);
}

TEST(RequestCorrelator, DuplicateOrEmptyIdIsRejected) {
    RequestCorrelator correlator;
    PendingWaiter waiter = correlator.track("dup", "send_key");
    EXPECT_THROW(correlator.track("dup", "send_key"), std::logic_error);
    EXPECT_THROW(correlator.track("", "send_key"), std::logic_error);
}

TEST(RequestCorrelator, UnknownIdIsNeverMatchedByFifo) {
    RequestCorrelator correlator;
    PendingWaiter waiter = correlator.track("A", "get_page_info");

    EXPECT_EQ(correlator.resolve(make_result("stale", "mcp", {{"url", "u"}, {"title", "t"}})),
              ResolveOutcome::Unmatched);
    EXPECT_EQ(correlator.unmatched_count(), 1u);
    EXPECT_EQ(correlator.pending_count(), 1u);
}

TEST(RequestCorrelator, FifoMatchesOldestWhenShapeFits) {
    RequestCorrelator correlator;
    PendingWaiter first = correlator.track("A", "get_page_info");
    PendingWaiter second = correlator.track("B", "get_page_info");

    EXPECT_EQ(correlator.resolve(make_result("", "", {{"url", "https://a"}, {"title", "A"}})), ResolveOutcome::Fifo);

    auto resolution = first.wait_for(std::chrono::milliseconds(0));
    ASSERT_TRUE(resolution.has_value());
    EXPECT_EQ(resolution->envelope["result"]["title"], "A");
    EXPECT_FALSE(second.wait_for(std::chrono::milliseconds(0)).has_value());
}

TEST(RequestCorrelator, FifoRejectsShapeMismatch) {
    RequestCorrelator correlator;
    PendingWaiter waiter = correlator.track("A", "get_last_clicked_element");

    EXPECT_EQ(correlator.resolve(make_result("", "", {{"url", "https://a"}})), ResolveOutcome::Unmatched);
    EXPECT_EQ(correlator.pending_count(), 1u);
}

TEST(RequestCorrelator, FifoWithNothingPendingIsUnmatched) {
    RequestCorrelator correlator;
    EXPECT_EQ(correlator.resolve(make_result("", "", {{"success", true}})), ResolveOutcome::Unmatched);
    EXPECT_EQ(correlator.unmatched_count(), 1u);
}

TEST(RequestCorrelator, ExpiredRequestDropsLateResult) {
    RequestCorrelator correlator;
    PendingWaiter waiter = correlator.track("T", "find_element");
    correlator.mark_sent("T");

    EXPECT_TRUE(correlator.expire("T"));
    EXPECT_EQ(waiter.get().state, RequestState::TimedOut);

    EXPECT_EQ(correlator.resolve(make_result("T", "mcp", {{"found", true}})), ResolveOutcome::Unmatched);
    EXPECT_FALSE(correlator.expire("T"));
}

TEST(RequestCorrelator, CancelCarriesReason) {
    RequestCorrelator correlator;
    PendingWaiter waiter = correlator.track("C", "input_text");

    EXPECT_TRUE(correlator.cancel("C", "no clients"));
    Resolution resolution = waiter.get();
    EXPECT_EQ(resolution.state, RequestState::Cancelled);
    EXPECT_EQ(resolution.reason, "no clients");
    EXPECT_FALSE(correlator.state_of("C").has_value());
}

TEST(RequestCorrelator, SweepRemovesOnlyStaleEntries) {
    RequestCorrelator correlator;
    PendingWaiter old_waiter = correlator.track("old", "get_page_info");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    PendingWaiter new_waiter = correlator.track("new", "get_page_info");

    EXPECT_EQ(correlator.sweep(std::chrono::milliseconds(25)), 1u);
    EXPECT_EQ(old_waiter.get().state, RequestState::Cancelled);
    EXPECT_EQ(correlator.state_of("new"), RequestState::Created);
}

TEST(RequestCorrelator, ResultShapeRules) {
    EXPECT_TRUE(result_fits_tool(make_result("", "", {{"title", "t"}}), "get_page_info"));
    EXPECT_TRUE(result_fits_tool(make_result("", "", {{"elementInfo", nlohmann::json::object()}}), "get_element_text"));
    EXPECT_TRUE(result_fits_tool(make_result("", "", {{"count", 2}}), "find_element"));
    EXPECT_TRUE(result_fits_tool(make_result("", "", {{"success", true}}), "send_key"));
    EXPECT_FALSE(result_fits_tool(make_result("", "", {{"success", true}}), "get_page_info"));
    EXPECT_FALSE(result_fits_tool(make_result("", "", {{"success", true}}), "list_saved_selectors"));
}

TEST(RequestCorrelator, SweepLeavesEntriesInsideTheirCallerDeadline) {
    RequestCorrelator correlator;
    PendingWaiter waiter = correlator.track("long", "get_page_info", std::chrono::milliseconds(400));
    correlator.mark_sent("long");
    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    EXPECT_EQ(correlator.sweep(std::chrono::milliseconds(100)), 0u);
    EXPECT_EQ(correlator.state_of("long"), RequestState::Sent);

    EXPECT_EQ(correlator.resolve(make_result("long", "mcp", {{"url", "u"}})), ResolveOutcome::Direct);
    EXPECT_EQ(waiter.get().state, RequestState::Matched);
}

TEST(RequestCorrelator, SweepTakesEntriesPastDeadlineAndGrace) {
    RequestCorrelator correlator(std::chrono::milliseconds(10));
    PendingWaiter waiter = correlator.track("abandoned", "find_element", std::chrono::milliseconds(20));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    EXPECT_EQ(correlator.sweep(std::chrono::milliseconds(1)), 1u);
    Resolution resolution = waiter.get();
    EXPECT_EQ(resolution.state, RequestState::Cancelled);
    EXPECT_EQ(resolution.reason, "stale request swept");
}
