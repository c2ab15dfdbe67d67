#include <gtest/gtest.h>
#include <keygate/events.hpp>
#include <keygate/keygate.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace keygate {
namespace {

// ==================== EventBus Tests ====================

class EventBusTest : public ::testing::Test {
  protected:
    EventBus bus;
};

TEST_F(EventBusTest, DeliversVerdictPayload) {
    std::vector<Verdict> verdicts;
    auto sub = bus.on(events::VERDICT_CHANGED,
                      [&](const EventData& data) { verdicts.push_back(std::any_cast<Verdict>(data)); });

    bus.emit(events::VERDICT_CHANGED, Verdict::Active);
    bus.emit(events::VERDICT_CHANGED, Verdict::Tampered);

    ASSERT_EQ(verdicts.size(), 2u);
    EXPECT_EQ(verdicts[0], Verdict::Active);
    EXPECT_EQ(verdicts[1], Verdict::Tampered);
}

TEST_F(EventBusTest, EmitWithoutPayloadSendsEmptyData) {
    bool empty = false;
    auto sub = bus.on(events::ENGINE_FORGOTTEN, [&](const EventData& data) { empty = !data.has_value(); });

    bus.emit(events::ENGINE_FORGOTTEN);

    EXPECT_TRUE(empty);
}

TEST_F(EventBusTest, CancelledSubscriptionStopsDelivery) {
    int tampers = 0;
    auto sub = bus.on(events::TAMPER_DETECTED, [&](const EventData&) { tampers++; });

    bus.emit(events::TAMPER_DETECTED);
    EXPECT_TRUE(sub.is_active());
    sub.cancel();
    bus.emit(events::TAMPER_DETECTED);

    EXPECT_EQ(tampers, 1);
    EXPECT_FALSE(sub.is_active());

    // A second cancel is harmless
    sub.cancel();
}

TEST_F(EventBusTest, CancelOnlyRemovesItsOwnHandler) {
    int first = 0;
    int second = 0;
    auto a = bus.on(events::RECORD_CHANGED, [&](const EventData&) { first++; });
    auto b = bus.on(events::RECORD_CHANGED, [&](const EventData&) { second++; });

    a.cancel();
    bus.emit(events::RECORD_CHANGED);

    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST_F(EventBusTest, EventsOnlyReachTheirOwnSubscribers) {
    int successes = 0;
    int errors = 0;
    auto ok = bus.on(events::ACTIVATION_SUCCESS, [&](const EventData&) { successes++; });
    auto err = bus.on(events::ACTIVATION_ERROR, [&](const EventData&) { errors++; });

    bus.emit(events::ACTIVATION_ERROR,
             std::map<std::string, std::string>{{"code", "YSK-1-AAAA"}, {"error", "ALREADY_USED"}});

    EXPECT_EQ(successes, 0);
    EXPECT_EQ(errors, 1);
}

TEST_F(EventBusTest, DefaultSubscriptionIsInactive) {
    EventSubscription sub;

    EXPECT_FALSE(sub.is_active());
    sub.cancel();
}

TEST_F(EventBusTest, ThrowingHandlerGoesToSinkAndOthersStillRun) {
    int delivered = 0;
    std::string failed_event;
    std::string failure;

    bus.set_error_sink([&](const std::string& event, const std::exception& error) {
        failed_event = event;
        failure = error.what();
    });
    auto bad = bus.on(events::STORE_UNAVAILABLE, [](const EventData&) { throw std::runtime_error("toast failed"); });
    auto good = bus.on(events::STORE_UNAVAILABLE, [&](const EventData&) { delivered++; });

    bus.emit(events::STORE_UNAVAILABLE);

    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(failed_event, events::STORE_UNAVAILABLE);
    EXPECT_EQ(failure, "toast failed");
}

TEST_F(EventBusTest, ThrowingHandlerWithoutSinkIsContained) {
    int delivered = 0;
    auto bad = bus.on(events::ISSUE_ERROR, [](const EventData&) { throw std::logic_error("bad"); });
    auto good = bus.on(events::ISSUE_ERROR, [&](const EventData&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(events::ISSUE_ERROR));
    EXPECT_EQ(delivered, 1);
}

TEST_F(EventBusTest, HandlerMaySubscribeDuringEmit) {
    int late = 0;
    EventSubscription inner;
    auto outer = bus.on(events::RESET_SUCCESS, [&](const EventData&) {
        if (!inner.is_active()) {
            inner = bus.on(events::RESET_SUCCESS, [&](const EventData&) { late++; });
        }
    });

    bus.emit(events::RESET_SUCCESS);
    EXPECT_EQ(late, 0);
    bus.emit(events::RESET_SUCCESS);
    EXPECT_EQ(late, 1);
}

TEST_F(EventBusTest, ConcurrentEmittersAllDeliver) {
    std::atomic<int> count{0};
    auto sub = bus.on(events::VERDICT_CHANGED, [&](const EventData&) { count++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 125; ++j) {
                bus.emit(events::VERDICT_CHANGED, Verdict::Active);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 1000);
}

// ==================== Event Name Tests ====================

TEST(EventNamesTest, NamesAreDistinct) {
    std::vector<std::string> names = {
        events::ISSUE_SUCCESS,      events::ISSUE_ERROR,        events::RESET_SUCCESS,
        events::RESET_ERROR,        events::REMOVE_SUCCESS,     events::REMOVE_ERROR,
        events::ACTIVATION_START,   events::ACTIVATION_SUCCESS, events::ACTIVATION_ERROR,
        events::VERDICT_CHANGED,    events::TAMPER_DETECTED,    events::RECORD_CHANGED,
        events::RECORD_REMOVED,     events::STORE_UNAVAILABLE,  events::ENGINE_FORGOTTEN,
    };
    std::sort(names.begin(), names.end());

    EXPECT_EQ(std::adjacent_find(names.begin(), names.end()), names.end());
    EXPECT_STREQ(events::VERDICT_CHANGED, "verdict:changed");
    EXPECT_STREQ(events::TAMPER_DETECTED, "tamper:detected");
}

}  // namespace
}  // namespace keygate
