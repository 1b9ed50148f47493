#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>

#include "cas/core/result.hpp"
#include "cas/foundation/auth_error.hpp"
#include "cas/foundation/auth_result.hpp"
#include "cas/foundation/config_manager.hpp"
#include "cas/foundation/error_code.hpp"
#include "cas/foundation/types.hpp"

using namespace cas::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::Conflict), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::Unavailable), "Storage");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidCredentials), "Credential");
    EXPECT_EQ(errorSubsystem(ErrorCode::TokenExpired), "Token");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, ClientFacingNames) {
    EXPECT_EQ(errorCodeName(ErrorCode::MalformedToken), "Malformed");
    EXPECT_EQ(errorCodeName(ErrorCode::InvalidSignature), "InvalidSignature");
    EXPECT_EQ(errorCodeName(ErrorCode::TokenExpired), "Expired");
    EXPECT_EQ(errorCodeName(ErrorCode::InvalidCredentials), "InvalidCredentials");
    EXPECT_EQ(errorCodeName(ErrorCode::AccountNotFound), "AccountNotFound");
    EXPECT_EQ(errorCodeName(ErrorCode::Unavailable), "Unavailable");
    EXPECT_EQ(errorCodeName(ErrorCode::ConfigurationError), "ConfigurationError");
}

// --- AuthError tests ---

TEST(AuthErrorTest, DefaultConstruction) {
    AuthError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
}

TEST(AuthErrorTest, CodeAndMessage) {
    AuthError err(ErrorCode::Conflict, "login name taken");
    EXPECT_EQ(err.code(), ErrorCode::Conflict);
    EXPECT_EQ(err.message(), "login name taken");
}

// --- AuthResult tests ---

TEST(AuthResultTest, OkValue) {
    auto result = AuthResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(AuthResultTest, ErrorValue) {
    auto result = AuthResult<int>::err(AuthError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(AuthResultTest, ValueOr) {
    auto ok = AuthResult<int>::ok(7);
    auto bad = AuthResult<int>::err(AuthError(ErrorCode::NotFound));
    EXPECT_EQ(ok.valueOr(0), 7);
    EXPECT_EQ(bad.valueOr(-1), -1);
}

TEST(AuthResultTest, MoveOutValue) {
    auto result = AuthResult<std::string>::ok("token");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "token");
}

TEST(AuthResultTest, SameValueAndErrorType) {
    auto ok = cas::Result<std::string, std::string>::ok("value");
    auto bad = cas::Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error(), "error");
}

TEST(AuthResultTest, VoidOk) {
    auto result = AuthResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(AuthResultTest, VoidError) {
    auto result = AuthResult<void>::err(AuthError(ErrorCode::Unavailable, "down"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::Unavailable);
}

// --- StrongId / Types tests ---

TEST(StrongIdTest, DefaultInvalid) {
    UserId id;
    EXPECT_FALSE(id.isValid());
    EXPECT_EQ(id.value(), 0u);
}

TEST(StrongIdTest, ExplicitConstruction) {
    UserId id(100);
    EXPECT_TRUE(id.isValid());
    EXPECT_EQ(id.value(), 100u);
}

TEST(StrongIdTest, EqualityAndOrdering) {
    UserId a(1), b(1), c(2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
    EXPECT_GT(c, a);
}

TEST(StrongIdTest, HashWorks) {
    std::unordered_map<UserId, std::string> map;
    map[UserId(1)] = "alice";
    EXPECT_EQ(map[UserId(1)], "alice");
    EXPECT_EQ(map.count(UserId(2)), 0u);
}

// --- ConfigManager tests ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use unique directory per test to avoid races under ctest --parallel
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto dirname = std::string("cas_test_") + info->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& filename,
                                    const std::string& content) {
        auto path = tmpDir_ / filename;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGet) {
    auto path = writeYaml("test.yaml", R"(
auth:
  token_ttl_seconds: 900
  algorithm: "HS256"
  warm_cache_on_login: true
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto ttl = config.get<int>("auth.token_ttl_seconds");
    ASSERT_TRUE(ttl.hasValue());
    EXPECT_EQ(ttl.value(), 900);

    auto alg = config.get<std::string>("auth.algorithm");
    ASSERT_TRUE(alg.hasValue());
    EXPECT_EQ(alg.value(), "HS256");

    auto warm = config.get<bool>("auth.warm_cache_on_login");
    ASSERT_TRUE(warm.hasValue());
    EXPECT_TRUE(warm.value());
}

TEST_F(ConfigManagerTest, LoadString) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("auth:\n  hash_iterations: 1000\n").hasValue());
    auto iterations = config.get<uint32_t>("auth.hash_iterations");
    ASSERT_TRUE(iterations.hasValue());
    EXPECT_EQ(iterations.value(), 1000u);
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("a: 1\nb: 2\n").hasValue());
    ASSERT_TRUE(config.loadString("a: 3\n").hasValue());
    EXPECT_EQ(config.get<int>("a").value(), 3);
    EXPECT_FALSE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    auto path = writeYaml("empty.yaml", "{}");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("nonexistent.key");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    auto path = writeYaml("types.yaml", "value: hello");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    auto result = config.get<int>("value");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load("/nonexistent/path.yaml");
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, LoadMalformedYaml) {
    auto path = writeYaml("broken.yaml", "auth: [unterminated\n");
    ConfigManager config;
    auto result = config.load(path);
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, HasKey) {
    auto path = writeYaml("check.yaml", "key: value");
    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_TRUE(config.hasKey("key"));
    EXPECT_FALSE(config.hasKey("missing"));
}
