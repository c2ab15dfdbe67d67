#include <gtest/gtest.h>
#include <keygate/config.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace keygate {
namespace {

const char* kConsoleSnippet = R"(
// Import the functions you need from the SDKs you need
const firebaseConfig = {
  apiKey: "AIzaSyExampleKey",
  authDomain: "keys-demo.firebaseapp.com",
  databaseURL: "https://keys-demo-default-rtdb.firebaseio.com",
  projectId: "keys-demo",
  storageBucket: "keys-demo.appspot.com",
  messagingSenderId: "123456789",
  appId: "1:123456789:web:abcdef"
};
)";

StoreConfig valid_config() {
    StoreConfig config;
    config.api_key = "key";
    config.database_url = "https://keys-demo-default-rtdb.firebaseio.com";
    config.project_id = "keys-demo";
    return config;
}

// ==================== Snippet Parsing Tests ====================

TEST(ParseSnippetTest, ReadsConsoleObject) {
    auto result = parse_store_config_snippet(kConsoleSnippet);

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    const auto& config = result.value();
    EXPECT_EQ(config.api_key, "AIzaSyExampleKey");
    EXPECT_EQ(config.auth_domain, "keys-demo.firebaseapp.com");
    EXPECT_EQ(config.database_url, "https://keys-demo-default-rtdb.firebaseio.com");
    EXPECT_EQ(config.project_id, "keys-demo");
    EXPECT_EQ(config.messaging_sender_id, "123456789");
    EXPECT_EQ(config.app_id, "1:123456789:web:abcdef");
    EXPECT_TRUE(config.measurement_id.empty());
    EXPECT_EQ(config.root, "activation_keys");
    EXPECT_TRUE(config.validate().is_ok());
}

TEST(ParseSnippetTest, AcceptsQuotedKeys) {
    auto result = parse_store_config_snippet(
        R"({"apiKey": "k", "databaseURL": "http://localhost:9000", "projectId": "p"})");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().api_key, "k");
    EXPECT_EQ(result.value().database_url, "http://localhost:9000");
    EXPECT_EQ(result.value().project_id, "p");
}

TEST(ParseSnippetTest, NothingRecognizedIsValidationError) {
    auto result = parse_store_config_snippet("hello world");

    EXPECT_EQ(result.error_code(), ErrorCode::ValidationError);
}

TEST(ParseSnippetTest, PartialSnippetFailsValidation) {
    auto result = parse_store_config_snippet(R"(apiKey: "k")");

    ASSERT_TRUE(result.is_ok());
    auto validation = result.value().validate();
    EXPECT_EQ(validation.error_code(), ErrorCode::ValidationError);
    EXPECT_NE(validation.error_message().find("databaseURL"), std::string::npos);
    EXPECT_NE(validation.error_message().find("projectId"), std::string::npos);
}

// ==================== Validation Tests ====================

TEST(StoreConfigValidateTest, RequiresHttpUrl) {
    auto config = valid_config();
    config.database_url = "keys-demo.firebaseio.com";

    EXPECT_EQ(config.validate().error_code(), ErrorCode::ValidationError);
}

TEST(StoreConfigValidateTest, RequiresRoot) {
    auto config = valid_config();
    config.root.clear();

    EXPECT_EQ(config.validate().error_code(), ErrorCode::ValidationError);
}

// ==================== File Tests ====================

class StoreConfigFileTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("keygate_config_" +
                std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

TEST_F(StoreConfigFileTest, SaveAndLoad) {
    auto config = valid_config();
    config.root = "licenses";
    config.auth_token = "token";
    auto path = (dir_ / "nested" / "store.json").string();

    ASSERT_TRUE(save_store_config(config, path).is_ok());
    auto loaded = load_store_config(path);

    ASSERT_TRUE(loaded.is_ok()) << loaded.error_message();
    EXPECT_EQ(loaded.value().api_key, "key");
    EXPECT_EQ(loaded.value().database_url, config.database_url);
    EXPECT_EQ(loaded.value().project_id, "keys-demo");
    EXPECT_EQ(loaded.value().root, "licenses");
    EXPECT_EQ(loaded.value().auth_token, "token");
}

TEST_F(StoreConfigFileTest, MissingFileIsFileError) {
    auto loaded = load_store_config((dir_ / "absent.json").string());

    EXPECT_EQ(loaded.error_code(), ErrorCode::FileError);
}

TEST_F(StoreConfigFileTest, InvalidJsonIsParseError) {
    std::filesystem::create_directories(dir_);
    auto path = dir_ / "store.json";
    std::ofstream(path) << "{apiKey: nope";

    auto loaded = load_store_config(path.string());

    EXPECT_EQ(loaded.error_code(), ErrorCode::ParseError);
}

}  // namespace
}  // namespace keygate
