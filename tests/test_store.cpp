#include <gtest/gtest.h>
#include <keygate/store.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace keygate {
namespace {

class MemoryStoreTest : public ::testing::Test {
  protected:
    Timestamp store_now = Timestamp{} + std::chrono::hours(24 * 365 * 54);
    MemoryStore store{[this]() { return store_now; }};

    ActivationKey make_key(const std::string& code, int days = 30) {
        return ActivationKey(code, {"Acme", "", ""}, days, KeyStatus::Unused, Timestamp{}, std::nullopt);
    }
};

TEST_F(MemoryStoreTest, GetMissingReturnsEmpty) {
    auto result = store.get("YSK-1-AAAA");

    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().has_value());
}

TEST_F(MemoryStoreTest, SetStampsCreatedAtWithStoreClock) {
    auto result = store.set(make_key("YSK-1-AAAA"));

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().created_at(), store_now);

    auto fetched = store.get("YSK-1-AAAA");
    ASSERT_TRUE(fetched.is_ok());
    ASSERT_TRUE(fetched.value().has_value());
    EXPECT_EQ(*fetched.value(), result.value());
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(MemoryStoreTest, UpdateOnMissingIsNotFound) {
    auto result = store.update("YSK-1-AAAA", KeyUpdate::clear());

    EXPECT_EQ(result.error_code(), ErrorCode::NotFound);
}

TEST_F(MemoryStoreTest, ConditionalUpdateFailsWithCurrentRecord) {
    ASSERT_TRUE(store.set(make_key("YSK-1-AAAA")).is_ok());
    Binding first{"device-1", store_now, store_now + DAY * 30};
    Binding second{"device-2", store_now, store_now + DAY * 30};

    ASSERT_TRUE(store.update("YSK-1-AAAA", KeyUpdate::bind(first)).is_ok());
    auto result = store.update("YSK-1-AAAA", KeyUpdate::bind(second));

    EXPECT_EQ(result.error_code(), ErrorCode::Conflict);
    ASSERT_TRUE(result.error_state().has_value());
    EXPECT_EQ(result.error_state()->binding()->device_id, "device-1");
}

TEST_F(MemoryStoreTest, RemoveIsIdempotent) {
    ASSERT_TRUE(store.set(make_key("YSK-1-AAAA")).is_ok());

    EXPECT_TRUE(store.remove("YSK-1-AAAA").is_ok());
    EXPECT_TRUE(store.remove("YSK-1-AAAA").is_ok());
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(MemoryStoreTest, ListReturnsEveryRecord) {
    ASSERT_TRUE(store.set(make_key("YSK-1-AAAA")).is_ok());
    ASSERT_TRUE(store.set(make_key("YSK-2-BBBB")).is_ok());

    auto result = store.list();

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 2u);
}

TEST_F(MemoryStoreTest, UnavailableStoreFailsEveryOperation) {
    store.set_available(false);

    EXPECT_EQ(store.get("YSK-1-AAAA").error_code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(store.set(make_key("YSK-1-AAAA")).error_code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(store.update("YSK-1-AAAA", KeyUpdate::clear()).error_code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(store.remove("YSK-1-AAAA").error_code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(store.list().error_code(), ErrorCode::StoreUnavailable);

    store.set_available(true);
    EXPECT_TRUE(store.get("YSK-1-AAAA").is_ok());
}

TEST_F(MemoryStoreTest, RecordSubscribersSeeChangesAndRemoval) {
    std::vector<std::optional<ActivationKey>> seen;
    auto sub = store.on_change("YSK-1-AAAA", [&](const std::optional<ActivationKey>& record) {
        seen.push_back(record);
    });

    ASSERT_TRUE(store.set(make_key("YSK-1-AAAA")).is_ok());
    ASSERT_TRUE(store.set(make_key("YSK-9-ZZZZ")).is_ok());
    ASSERT_TRUE(store.remove("YSK-1-AAAA").is_ok());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[0].has_value());
    EXPECT_FALSE(seen[1].has_value());

    sub.cancel();
    ASSERT_TRUE(store.set(make_key("YSK-1-AAAA")).is_ok());
    EXPECT_EQ(seen.size(), 2u);
}

TEST_F(MemoryStoreTest, UnchangedUpdateDoesNotNotify) {
    ASSERT_TRUE(store.set(make_key("YSK-1-AAAA")).is_ok());
    int notifications = 0;
    auto sub = store.on_any_change([&](const std::string&, const std::optional<ActivationKey>&) {
        notifications++;
    });

    ASSERT_TRUE(store.update("YSK-1-AAAA", KeyUpdate::clear()).is_ok());

    EXPECT_EQ(notifications, 0);
    sub.cancel();
}

TEST_F(MemoryStoreTest, HandlersMayCallBackIntoTheStore) {
    std::optional<ActivationKey> observed;
    auto sub = store.on_change("YSK-1-AAAA", [&](const std::optional<ActivationKey>&) {
        auto fetched = store.get("YSK-1-AAAA");
        if (fetched.is_ok()) {
            observed = fetched.value();
        }
    });

    ASSERT_TRUE(store.set(make_key("YSK-1-AAAA")).is_ok());

    EXPECT_TRUE(observed.has_value());
    sub.cancel();
}

TEST_F(MemoryStoreTest, CompareAndSwapHasExactlyOneWinner) {
    ASSERT_TRUE(store.set(make_key("YSK-1-AAAA")).is_ok());

    std::atomic<int> wins{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&, i]() {
            Binding binding{"device-" + std::to_string(i), store_now, store_now + DAY * 30};
            auto result = store.update("YSK-1-AAAA", KeyUpdate::bind(binding));
            if (result.is_ok()) {
                wins++;
            } else if (result.error_code() == ErrorCode::Conflict) {
                conflicts++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(wins, 1);
    EXPECT_EQ(conflicts, 15);
}

}  // namespace
}  // namespace keygate
