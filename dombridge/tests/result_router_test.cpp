#include <gtest/gtest.h>

#include "request_correlator.hpp"
#include "result_router.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <string>

using namespace dombridge;

namespace {

class ResultRouterTest : public ::testing::Test {
protected:
    ResultRouterTest() : ui_results(4), router(correlator, ui_results) {}

    RequestCorrelator correlator;
    UiResultBuffer ui_results;
    ResultRouter router;
};

} // namespace

TEST_F(ResultRouterTest, UnsourcedResultResolvesPendingCall) {
    PendingWaiter waiter = correlator.track("A", "get_page_info");
    ASSERT_TRUE(correlator.mark_sent("A"));

    router.route(make_result("", "", {{"url", "https://a"}, {"title", "A"}}));

    auto resolution = waiter.wait_for(std::chrono::milliseconds(0));
    ASSERT_TRUE(resolution.has_value());
    EXPECT_EQ(resolution->state, RequestState::Matched);
    EXPECT_EQ(resolution->envelope["result"]["title"], "A");
    EXPECT_EQ(ui_results.size(), 0u);
}

TEST_F(ResultRouterTest, UiResultIsBufferedNotCorrelated) {
    PendingWaiter waiter = correlator.track("A", "click_element");

    router.route(make_result("A", "ui", {{"success", true}}));

    EXPECT_FALSE(waiter.wait_for(std::chrono::milliseconds(0)).has_value());
    EXPECT_EQ(correlator.pending_count(), 1u);
    auto drained = ui_results.drain();
    ASSERT_EQ(drained.size(), 1u);
    EXPECT_EQ(drained[0]["command"]["request_id"], "A");
}

TEST_F(ResultRouterTest, UnknownSourceGoesToCorrelator) {
    PendingWaiter waiter = correlator.track("B", "send_key");

    router.route(make_result("B", "sidebar", {{"success", true}}));

    auto resolution = waiter.wait_for(std::chrono::milliseconds(0));
    ASSERT_TRUE(resolution.has_value());
    EXPECT_EQ(resolution->state, RequestState::Matched);
    EXPECT_EQ(ui_results.size(), 0u);
}

TEST_F(ResultRouterTest, UiBufferDropsOldestWhenFull) {
    for (int i = 0; i < 6; ++i) {
        router.route(make_result("ui-" + std::to_string(i), "ui", {{"success", true}}));
    }

    auto drained = ui_results.drain();
    ASSERT_EQ(drained.size(), 4u);
    EXPECT_EQ(drained.front()["command"]["request_id"], "ui-2");
    EXPECT_EQ(drained.back()["command"]["request_id"], "ui-5");
}
