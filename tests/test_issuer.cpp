#include <gtest/gtest.h>
#include <keygate/code.hpp>
#include <keygate/issuer.hpp>
#include <keygate/json.hpp>

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace keygate {
namespace {

using std::chrono::milliseconds;

/// Waits for one async callback
template <typename T> class Pending {
  public:
    void set(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(value);
        cv_.notify_all();
    }

    std::optional<T> wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(5), [this]() { return value_.has_value(); });
        return value_;
    }

  private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> value_;
};

class IssuerTest : public ::testing::Test {
  protected:
    Timestamp issuer_now = json::from_millis(1700000000000);
    Timestamp store_now = json::from_millis(1700000000500);
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>([this]() { return store_now; });

    IssuerConfig make_config() {
        IssuerConfig config;
        config.clock = [this]() { return issuer_now; };
        return config;
    }

    Issuer issuer{store, make_config()};
    ClientInfo acme{"Acme", "+20 100 000", "first customer"};

    std::string issue_at(Timestamp at, int days = 30) {
        store_now = at;
        issuer_now = at;
        return issuer.issue(acme, days).value();
    }

    void bind(const std::string& code, const std::string& device, Timestamp at) {
        auto key = store->get(code).value();
        ASSERT_TRUE(key.has_value());
        auto bound = key->bound(device, at);
        ASSERT_TRUE(store->update(code, KeyUpdate::bind(*bound.binding())).is_ok());
    }
};

// ==================== Issue Tests ====================

TEST_F(IssuerTest, IssueCreatesUnusedRecord) {
    auto result = issuer.issue(acme, 30);

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_TRUE(code::is_well_formed(result.value()));
    EXPECT_EQ(result.value().rfind("YSK-1700000000000-", 0), 0u);

    auto stored = store->get(result.value());
    ASSERT_TRUE(stored.is_ok());
    ASSERT_TRUE(stored.value().has_value());
    const auto& key = *stored.value();
    EXPECT_TRUE(key.is_unused());
    EXPECT_FALSE(key.binding().has_value());
    EXPECT_EQ(key.client(), acme);
    EXPECT_EQ(key.duration_days(), 30);
    // Issuance time comes from the store clock, not the issuer's
    EXPECT_EQ(key.created_at(), store_now);
}

TEST_F(IssuerTest, IssueRejectsOutOfRangeDuration) {
    EXPECT_EQ(issuer.issue(acme, 0).error_code(), ErrorCode::ValidationError);
    EXPECT_EQ(issuer.issue(acme, -5).error_code(), ErrorCode::ValidationError);
    EXPECT_EQ(issuer.issue(acme, MAX_DURATION_DAYS + 1).error_code(), ErrorCode::ValidationError);
    EXPECT_TRUE(issuer.issue(acme, MAX_DURATION_DAYS).is_ok());
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(IssuerTest, IssueAcceptsEmptyClientInfo) {
    EXPECT_TRUE(issuer.issue(ClientInfo{}, 1).is_ok());
}

TEST_F(IssuerTest, CustomPrefixAndSuffixLength) {
    auto config = make_config();
    config.code_prefix = "ACME";
    config.suffix_length = 6;
    Issuer custom(store, config);

    auto result = custom.issue(acme, 7);

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(code::is_well_formed(result.value(), "ACME", 6));
}

TEST_F(IssuerTest, ShortSuffixIsValidationError) {
    auto config = make_config();
    config.suffix_length = 3;
    Issuer custom(store, config);

    EXPECT_EQ(custom.issue(acme, 7).error_code(), ErrorCode::ValidationError);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(IssuerTest, InvalidPrefixIsValidationError) {
    auto config = make_config();
    config.code_prefix = "bad prefix";
    Issuer custom(store, config);

    EXPECT_EQ(custom.issue(acme, 7).error_code(), ErrorCode::ValidationError);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(IssuerTest, IssueDuringOutageWritesNothing) {
    store->set_available(false);
    bool outage_reported = false;
    auto sub = issuer.on(events::STORE_UNAVAILABLE, [&](const EventData&) { outage_reported = true; });

    auto result = issuer.issue(acme, 30);

    EXPECT_EQ(result.error_code(), ErrorCode::StoreUnavailable);
    EXPECT_TRUE(outage_reported);
    store->set_available(true);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(IssuerTest, MissingStoreIsStoreUnavailable) {
    Issuer orphan(nullptr);

    EXPECT_EQ(orphan.issue(acme, 30).error_code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(orphan.reset("YSK-1-AAAA").error_code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(orphan.list_all().error_code(), ErrorCode::StoreUnavailable);
}

// ==================== Reset Tests ====================

TEST_F(IssuerTest, ResetClearsBindingAndKeepsIdentity) {
    auto code = issuer.issue(acme, 30).value();
    auto created = store->get(code).value()->created_at();
    bind(code, "device-1", store_now);

    auto result = issuer.reset(code);

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_TRUE(result.value().is_unused());
    EXPECT_FALSE(result.value().binding().has_value());
    EXPECT_EQ(result.value().created_at(), created);
    EXPECT_EQ(result.value().duration_days(), 30);
    EXPECT_EQ(*store->get(code).value(), result.value());
}

TEST_F(IssuerTest, ResetIsIdempotent) {
    auto code = issuer.issue(acme, 30).value();
    bind(code, "device-1", store_now);

    auto first = issuer.reset(code);
    auto second = issuer.reset(code);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST_F(IssuerTest, ResetMissingCodeIsNotFound) {
    EXPECT_EQ(issuer.reset("YSK-1-AAAA").error_code(), ErrorCode::NotFound);
    EXPECT_EQ(issuer.reset("").error_code(), ErrorCode::ValidationError);
}

// ==================== Remove Tests ====================

TEST_F(IssuerTest, RemoveIsIdempotent) {
    auto code = issuer.issue(acme, 30).value();

    EXPECT_TRUE(issuer.remove(code).is_ok());
    EXPECT_TRUE(issuer.remove(code).is_ok());
    EXPECT_FALSE(store->get(code).value().has_value());
    EXPECT_EQ(issuer.remove("").error_code(), ErrorCode::ValidationError);
}

// ==================== List Tests ====================

TEST_F(IssuerTest, ListAllIsNewestFirst) {
    auto oldest = issue_at(json::from_millis(1000));
    auto newest = issue_at(json::from_millis(3000));
    auto middle = issue_at(json::from_millis(2000));

    auto result = issuer.list_all();

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_EQ(result.value()[0].code(), newest);
    EXPECT_EQ(result.value()[1].code(), middle);
    EXPECT_EQ(result.value()[2].code(), oldest);
}

TEST_F(IssuerTest, ListFiltersByDisplayStatus) {
    Timestamp t0 = json::from_millis(1700000000000);
    auto unused = issue_at(t0);
    auto active = issue_at(t0 + milliseconds(1), 30);
    auto lapsed = issue_at(t0 + milliseconds(2), 1);
    bind(active, "device-1", t0);
    bind(lapsed, "device-2", t0);

    Timestamp later = t0 + DAY * 2;
    auto unused_list = issuer.list(KeyStatus::Unused, later).value();
    auto active_list = issuer.list(KeyStatus::Activated, later).value();
    auto expired_list = issuer.list(KeyStatus::Expired, later).value();
    auto everything = issuer.list(std::nullopt, later).value();

    ASSERT_EQ(unused_list.size(), 1u);
    EXPECT_EQ(unused_list[0].code(), unused);
    ASSERT_EQ(active_list.size(), 1u);
    EXPECT_EQ(active_list[0].code(), active);
    ASSERT_EQ(expired_list.size(), 1u);
    EXPECT_EQ(expired_list[0].code(), lapsed);
    // The stored status is untouched by the display filter
    EXPECT_EQ(expired_list[0].status(), KeyStatus::Activated);
    EXPECT_EQ(everything.size(), 3u);
}

// ==================== Async Tests ====================

TEST_F(IssuerTest, AsyncOperationsReportThroughCallbacks) {
    Pending<Result<std::string>> issued;
    issuer.issue_async(acme, 30, [&](Result<std::string> result) { issued.set(std::move(result)); });
    auto code_result = issued.wait();
    ASSERT_TRUE(code_result.has_value());
    ASSERT_TRUE(code_result->is_ok());
    auto code = code_result->value();

    Pending<Result<ActivationKey>> reset;
    issuer.reset_async(code, [&](Result<ActivationKey> result) { reset.set(std::move(result)); });
    auto reset_result = reset.wait();
    ASSERT_TRUE(reset_result.has_value());
    EXPECT_TRUE(reset_result->is_ok());

    Pending<Result<void>> removed;
    issuer.remove_async(code, [&](Result<void> result) { removed.set(std::move(result)); });
    auto remove_result = removed.wait();
    ASSERT_TRUE(remove_result.has_value());
    EXPECT_TRUE(remove_result->is_ok());
    EXPECT_EQ(store->size(), 0u);
}

// ==================== Event Tests ====================

TEST_F(IssuerTest, EmitsSuccessAndErrorEvents) {
    std::vector<std::string> seen;
    std::map<std::string, std::string> error_payload;
    auto s1 = issuer.on(events::ISSUE_SUCCESS, [&](const EventData& data) {
        seen.push_back(std::any_cast<ActivationKey>(data).code());
    });
    auto s2 = issuer.on(events::RESET_ERROR, [&](const EventData& data) {
        error_payload = std::any_cast<std::map<std::string, std::string>>(data);
    });
    auto s3 = issuer.on(events::REMOVE_SUCCESS, [&](const EventData& data) {
        seen.push_back("removed " + std::any_cast<std::map<std::string, std::string>>(data).at("code"));
    });

    auto code = issuer.issue(acme, 30).value();
    (void)issuer.reset("YSK-404-NONE");
    ASSERT_TRUE(issuer.remove(code).is_ok());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], code);
    EXPECT_EQ(seen[1], "removed " + code);
    EXPECT_EQ(error_payload["code"], "YSK-404-NONE");
    EXPECT_EQ(error_payload["error"], error_code_to_string(ErrorCode::NotFound));
}

TEST_F(IssuerTest, WatchFollowsTheCollection) {
    std::vector<std::string> changed;
    auto sub = issuer.watch([&](const std::string& code, const std::optional<ActivationKey>&) {
        changed.push_back(code);
    });

    auto code = issuer.issue(acme, 30).value();
    ASSERT_TRUE(issuer.remove(code).is_ok());
    sub.cancel();

    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], code);
    EXPECT_EQ(changed[1], code);
}

}  // namespace
}  // namespace keygate
