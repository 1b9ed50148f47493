#include <gtest/gtest.h>

#include "cas/service/auth_types.hpp"
#include "cas/service/credential_hasher.hpp"
#include "cas/service/token_codec.hpp"

#include "claims_json.hpp"
#include "crypto_utils.hpp"
#include "test_clock.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

using namespace cas::service;
using cas::foundation::ErrorCode;
using cas::test::ManualClock;

namespace {

constexpr const char* kTestSigningKey = "test-key-must-be-at-least-32-bytes-long!!";

/// Low work factor so the suite stays fast.
constexpr uint32_t kTestIterations = 1000;

AuthConfig makeHs256Config() {
    AuthConfig config;
    config.signingKey = kTestSigningKey;
    return config;
}

/// Build and HS256-sign a token from raw header and payload JSON.
std::string forgeToken(std::string_view headerJson, std::string_view payloadJson,
                       std::string_view key = kTestSigningKey) {
    auto signingInput = detail::base64urlEncode(headerJson) + "." +
                        detail::base64urlEncode(payloadJson);
    auto mac = detail::hmacSha256(key, signingInput);
    return signingInput + "." + detail::base64urlEncode(*mac);
}

constexpr std::string_view kHs256Header = R"({"alg":"HS256","typ":"JWT"})";

} // namespace

// =============================================================================
// AuthTypes tests
// =============================================================================

TEST(AuthTypesTest, DefaultAuthConfig) {
    AuthConfig config;
    EXPECT_TRUE(config.signingKey.empty());
    EXPECT_EQ(config.algorithm, TokenAlgorithm::HS256);
    EXPECT_EQ(config.tokenTtl, std::chrono::seconds{900});
    ASSERT_TRUE(config.cacheTtl.has_value());
    EXPECT_EQ(*config.cacheTtl, std::chrono::seconds{300});
    EXPECT_EQ(config.clockSkewGrace, std::chrono::seconds{0});
    EXPECT_EQ(config.hashIterations, 600000u);
    EXPECT_EQ(config.minPasswordLength, 8u);
    EXPECT_FALSE(config.warmCacheOnLogin);
}

TEST(AuthTypesTest, AlgorithmNamesRoundTrip) {
    EXPECT_EQ(tokenAlgorithmName(TokenAlgorithm::HS256), "HS256");
    EXPECT_EQ(tokenAlgorithmName(TokenAlgorithm::RS256), "RS256");
    EXPECT_EQ(parseTokenAlgorithm("RS256"), TokenAlgorithm::RS256);
    EXPECT_FALSE(parseTokenAlgorithm("none").has_value());
    EXPECT_FALSE(parseTokenAlgorithm("hs256").has_value());
}

TEST(AuthTypesTest, DefaultLoginResponse) {
    LoginResponse response;
    EXPECT_TRUE(response.token.empty());
    EXPECT_EQ(response.tokenType, "bearer");
    EXPECT_EQ(response.expiresIn, std::chrono::seconds{0});
}

// =============================================================================
// Crypto helper tests
// =============================================================================

TEST(CryptoUtilsTest, Base64urlKnownVector) {
    EXPECT_EQ(detail::base64urlEncode(std::string_view("foobar")), "Zm9vYmFy");
    EXPECT_EQ(detail::base64urlEncode(std::string_view("fo")), "Zm8");
    EXPECT_EQ(detail::base64urlEncode(std::string_view("\xfb\xff")), "-_8");
}

TEST(CryptoUtilsTest, Base64urlDecodeIsStrict) {
    EXPECT_EQ(detail::base64urlDecodeString("Zm8"), std::optional<std::string>("fo"));
    EXPECT_FALSE(detail::base64urlDecode("Zm9=").has_value());   // padding
    EXPECT_FALSE(detail::base64urlDecode("Zm+v").has_value());   // standard alphabet
    EXPECT_FALSE(detail::base64urlDecode("Zm9vY").has_value());  // 4n+1 length
    EXPECT_FALSE(detail::base64urlDecode("Zm9").has_value());    // non-zero trailing bits
    EXPECT_TRUE(detail::base64urlDecode("").has_value());
}

TEST(CryptoUtilsTest, SecureRandomHexIsUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto hex = detail::secureRandomHex(16);
        ASSERT_TRUE(hex.has_value());
        EXPECT_EQ(hex->size(), 32u);
        seen.insert(*hex);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(CryptoUtilsTest, ConstantTimeEqual) {
    EXPECT_TRUE(detail::constantTimeEqual("abc", "abc"));
    EXPECT_FALSE(detail::constantTimeEqual("abc", "abd"));
    EXPECT_FALSE(detail::constantTimeEqual("abc", "abcd"));
    EXPECT_TRUE(detail::constantTimeEqual("", ""));
}

// =============================================================================
// Claims JSON tests
// =============================================================================

TEST(ClaimsJsonTest, ParsesFlatObject) {
    auto obj = detail::parseFlatObject(R"( {"s":"a\"bé","n":-42,"t":true,"f":false} )");
    ASSERT_TRUE(obj.has_value());
    EXPECT_EQ(std::get<std::string>(obj->at("s")), "a\"b\xc3\xa9");
    EXPECT_EQ(std::get<int64_t>(obj->at("n")), -42);
    EXPECT_TRUE(std::get<bool>(obj->at("t")));
    EXPECT_FALSE(std::get<bool>(obj->at("f")));
}

TEST(ClaimsJsonTest, RejectsUnsupportedShapes) {
    EXPECT_FALSE(detail::parseFlatObject(R"({"a":{"b":1}})").has_value());
    EXPECT_FALSE(detail::parseFlatObject(R"({"a":[1]})").has_value());
    EXPECT_FALSE(detail::parseFlatObject(R"({"a":null})").has_value());
    EXPECT_FALSE(detail::parseFlatObject(R"({"a":1.5})").has_value());
    EXPECT_FALSE(detail::parseFlatObject(R"({"a":01})").has_value());
    EXPECT_FALSE(detail::parseFlatObject(R"({"a":1,"a":2})").has_value());
    EXPECT_FALSE(detail::parseFlatObject(R"({"a":1} x)").has_value());
    EXPECT_FALSE(detail::parseFlatObject(R"({"a":1,})").has_value());
    EXPECT_FALSE(detail::parseFlatObject(R"("a")").has_value());
    EXPECT_FALSE(detail::parseFlatObject("").has_value());
}

TEST(ClaimsJsonTest, QuoteEscapesControlCharacters) {
    EXPECT_EQ(detail::jsonQuote("a\"b\\c\n\x01"), R"("a\"b\\c\n\u0001")");
}

// =============================================================================
// CredentialHasher tests
// =============================================================================

class CredentialHasherTest : public ::testing::Test {
protected:
    CredentialHasher hasher{kTestIterations};
};

TEST_F(CredentialHasherTest, HashIsTaggedAndSelfDescribing) {
    auto result = hasher.hash("CorrectHorse1");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().rfind("$pbkdf2-sha256$1000$", 0), 0u);

    // $tag$iterations$salt$key
    std::size_t dollars = 0;
    for (char c : result.value()) {
        dollars += (c == '$') ? 1 : 0;
    }
    EXPECT_EQ(dollars, 4u);
}

TEST_F(CredentialHasherTest, HashDoesNotContainPlaintext) {
    auto result = hasher.hash("CorrectHorse1");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().find("CorrectHorse1"), std::string::npos);
}

TEST_F(CredentialHasherTest, SameInputDifferentHashes) {
    auto a = hasher.hash("CorrectHorse1");
    auto b = hasher.hash("CorrectHorse1");
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value(), b.value());
}

TEST_F(CredentialHasherTest, VerifyCorrectSecret) {
    auto stored = hasher.hash("CorrectHorse1");
    ASSERT_TRUE(stored.hasValue());
    EXPECT_TRUE(hasher.verify("CorrectHorse1", stored.value()));
}

TEST_F(CredentialHasherTest, VerifyWrongSecret) {
    auto stored = hasher.hash("CorrectHorse1");
    ASSERT_TRUE(stored.hasValue());
    EXPECT_FALSE(hasher.verify("wrong", stored.value()));
    EXPECT_FALSE(hasher.verify("CorrectHorse2", stored.value()));
    EXPECT_FALSE(hasher.verify("", stored.value()));
}

TEST_F(CredentialHasherTest, EmptySecretStillHashes) {
    auto stored = hasher.hash("");
    ASSERT_TRUE(stored.hasValue());
    EXPECT_TRUE(hasher.verify("", stored.value()));
    EXPECT_FALSE(hasher.verify(" ", stored.value()));
}

TEST_F(CredentialHasherTest, VerifyReadsWorkFactorFromHash) {
    CredentialHasher stronger(kTestIterations * 2);
    auto stored = stronger.hash("CorrectHorse1");
    ASSERT_TRUE(stored.hasValue());
    EXPECT_TRUE(hasher.verify("CorrectHorse1", stored.value()));
}

TEST_F(CredentialHasherTest, MalformedHashesNeverVerify) {
    const std::vector<std::string> malformed = {
        "",
        "plaintext",
        "$pbkdf2-sha256$1000$c2FsdA",
        "$bcrypt$1000$c2FsdHNhbHRzYWx0c2FsdA$a2V5a2V5a2V5a2V5a2V5a2V5a2V5a2V5",
        "$pbkdf2-sha256$abc$c2FsdHNhbHRzYWx0c2FsdA$a2V5a2V5a2V5a2V5a2V5a2V5a2V5a2V5",
        "$pbkdf2-sha256$0$c2FsdHNhbHRzYWx0c2FsdA$a2V5a2V5a2V5a2V5a2V5a2V5a2V5a2V5",
        "$pbkdf2-sha256$99999999999$c2FsdHNhbHRzYWx0c2FsdA$a2V5a2V5a2V5a2V5a2V5a2V5a2V5a2V5",
        "$pbkdf2-sha256$1000$!!!$a2V5a2V5a2V5a2V5a2V5a2V5a2V5a2V5",
        "$pbkdf2-sha256$1000$c2FsdHNhbHRzYWx0c2FsdA$",
        "$pbkdf2-sha256$1000$c2FsdHNhbHRzYWx0c2FsdA$a2V5$extra",
    };
    for (const auto& value : malformed) {
        EXPECT_FALSE(hasher.verify("CorrectHorse1", value)) << value;
    }
}

TEST_F(CredentialHasherTest, TamperedKeyFailsVerify) {
    auto stored = hasher.hash("CorrectHorse1");
    ASSERT_TRUE(stored.hasValue());
    auto tampered = stored.value();
    auto pos = tampered.rfind('$') + 1;
    tampered[pos] = (tampered[pos] == 'A') ? 'B' : 'A';
    EXPECT_FALSE(hasher.verify("CorrectHorse1", tampered));
}

TEST_F(CredentialHasherTest, ConcurrentHashing) {
    std::vector<std::future<bool>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(std::async(std::launch::async, [this, i] {
            auto secret = "Secret" + std::to_string(i) + "x";
            auto stored = hasher.hash(secret);
            return stored.hasValue() && hasher.verify(secret, stored.value());
        }));
    }
    for (auto& f : futures) {
        EXPECT_TRUE(f.get());
    }
}

// =============================================================================
// TokenCodec tests: HS256
// =============================================================================

class TokenCodecTest : public ::testing::Test {
protected:
    TokenCodecTest() : codec(makeHs256Config(), clock.source()) {}

    TokenClaims makeClaims(std::string subject = "42") {
        TokenClaims claims;
        claims.subject = std::move(subject);
        return claims;
    }

    std::string issueOrFail(const TokenClaims& claims, std::chrono::seconds ttl) {
        auto token = codec.issue(claims, ttl);
        EXPECT_TRUE(token.hasValue());
        return token.hasValue() ? token.value() : std::string{};
    }

    ManualClock clock;
    TokenCodec codec;
};

TEST_F(TokenCodecTest, IssueProducesThreeSegments) {
    auto token = issueOrFail(makeClaims(), std::chrono::seconds{60});
    EXPECT_EQ(std::count(token.begin(), token.end(), '.'), 2);
    EXPECT_EQ(token.find('='), std::string::npos);
}

TEST_F(TokenCodecTest, IssueThenValidateReturnsClaims) {
    auto claims = makeClaims();
    claims.extensions["role"] = std::string("admin");
    claims.extensions["level"] = int64_t{7};
    claims.extensions["verified"] = true;

    auto token = issueOrFail(claims, std::chrono::seconds{900});
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasValue());

    const auto& decoded = result.value();
    EXPECT_EQ(decoded.subject, "42");
    EXPECT_EQ(decoded.algorithm, "HS256");
    EXPECT_EQ(decoded.issuedAt, clock.now());
    EXPECT_EQ(decoded.expiresAt, clock.now() + std::chrono::seconds{900});
    EXPECT_EQ(decoded.tokenId.size(), 32u);
    EXPECT_EQ(decoded.extensions, claims.extensions);
}

TEST_F(TokenCodecTest, ExplicitFieldsArePreserved) {
    auto claims = makeClaims();
    claims.issuedAt = clock.now() - std::chrono::seconds{10} + std::chrono::milliseconds{750};
    claims.tokenId = "my-token-id";

    auto token = issueOrFail(claims, std::chrono::seconds{60});
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasValue());
    // Timestamps are whole seconds.
    EXPECT_EQ(result.value().issuedAt, clock.now() - std::chrono::seconds{10});
    EXPECT_EQ(result.value().expiresAt, clock.now() + std::chrono::seconds{50});
    EXPECT_EQ(result.value().tokenId, "my-token-id");
}

TEST_F(TokenCodecTest, UniqueTokenIds) {
    auto a = codec.validate(issueOrFail(makeClaims(), std::chrono::seconds{60}));
    auto b = codec.validate(issueOrFail(makeClaims(), std::chrono::seconds{60}));
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value().tokenId, b.value().tokenId);
}

TEST_F(TokenCodecTest, IssueRejectsNonPositiveTtl) {
    auto zero = codec.issue(makeClaims(), std::chrono::seconds{0});
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::InvalidArgument);

    auto negative = codec.issue(makeClaims(), std::chrono::seconds{-5});
    ASSERT_TRUE(negative.hasError());
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(TokenCodecTest, IssueRejectsEmptySubject) {
    auto result = codec.issue(makeClaims(""), std::chrono::seconds{60});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(TokenCodecTest, IssueRejectsRegisteredExtensionNames) {
    for (const char* name : {"sub", "iat", "exp", "jti"}) {
        auto claims = makeClaims();
        claims.extensions[name] = std::string("x");
        auto result = codec.issue(claims, std::chrono::seconds{60});
        ASSERT_TRUE(result.hasError()) << name;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    }
}

TEST_F(TokenCodecTest, IssueWithoutKeyIsConfigurationError) {
    TokenCodec unkeyed(AuthConfig{}, clock.source());
    auto result = unkeyed.issue(makeClaims(), std::chrono::seconds{60});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigurationError);
}

TEST_F(TokenCodecTest, ValidUntilJustBeforeExpiry) {
    auto token = issueOrFail(makeClaims(), std::chrono::seconds{60});

    clock.advance(std::chrono::seconds{59});
    EXPECT_TRUE(codec.validate(token).hasValue());

    clock.advance(std::chrono::milliseconds{999});
    EXPECT_TRUE(codec.validate(token).hasValue());
}

TEST_F(TokenCodecTest, ExpiredAtExactExpiry) {
    auto token = issueOrFail(makeClaims(), std::chrono::seconds{60});
    clock.advance(std::chrono::seconds{60});
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenExpired);
}

TEST_F(TokenCodecTest, ExpiredLongAfterExpiry) {
    auto token = issueOrFail(makeClaims(), std::chrono::seconds{60});
    clock.advance(std::chrono::hours{24});
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenExpired);
}

TEST_F(TokenCodecTest, GraceWindowIsExplicit) {
    auto config = makeHs256Config();
    config.clockSkewGrace = std::chrono::seconds{30};
    TokenCodec lenient(config, clock.source());

    auto token = lenient.issue(makeClaims(), std::chrono::seconds{60});
    ASSERT_TRUE(token.hasValue());

    clock.advance(std::chrono::seconds{70});
    EXPECT_TRUE(lenient.validate(token.value()).hasValue());
    EXPECT_EQ(codec.validate(token.value()).error().code(), ErrorCode::TokenExpired);

    clock.advance(std::chrono::seconds{20});
    auto late = lenient.validate(token.value());
    ASSERT_TRUE(late.hasError());
    EXPECT_EQ(late.error().code(), ErrorCode::TokenExpired);
}

TEST_F(TokenCodecTest, LongestRepresentableLifetimeValidates) {
    auto nowEpoch = std::chrono::floor<std::chrono::seconds>(
                        clock.now().time_since_epoch()).count();
    std::chrono::seconds longest{kMaxTokenEpochSeconds - nowEpoch};

    auto token = issueOrFail(makeClaims(), longest);
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_EQ(result.value().expiresAt.time_since_epoch(),
              std::chrono::seconds{kMaxTokenEpochSeconds});

    clock.advance(std::chrono::hours{24 * 365});
    EXPECT_TRUE(codec.validate(token).hasValue());

    auto tooLong = codec.issue(makeClaims(), longest + std::chrono::seconds{1});
    ASSERT_TRUE(tooLong.hasError());
    EXPECT_EQ(tooLong.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(TokenCodecTest, LifetimePastClockRangeIsRejectedAtIssue) {
    auto result = codec.issue(makeClaims(), std::chrono::hours{24 * 365 * 300});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(TokenCodecTest, HugeGraceDoesNotWrapExpiry) {
    auto config = makeHs256Config();
    config.clockSkewGrace = std::chrono::seconds{kMaxTokenEpochSeconds};
    TokenCodec lenient(config, clock.source());

    auto token = lenient.issue(makeClaims(), std::chrono::seconds{60});
    ASSERT_TRUE(token.hasValue());

    clock.advance(std::chrono::hours{24 * 365});
    EXPECT_TRUE(lenient.validate(token.value()).hasValue());
}

TEST_F(TokenCodecTest, EverySingleCharacterMutationIsRejected) {
    auto claims = makeClaims();
    claims.extensions["role"] = std::string("user");
    auto token = issueOrFail(claims, std::chrono::seconds{900});
    ASSERT_FALSE(token.empty());

    for (std::size_t i = 0; i < token.size(); ++i) {
        for (char replacement : {'A', 'B', 'z', '-', '.'}) {
            if (token[i] == replacement) {
                continue;
            }
            auto mutated = token;
            mutated[i] = replacement;
            auto result = codec.validate(mutated);
            EXPECT_TRUE(result.hasError()) << "position " << i << " -> " << replacement;
        }
    }
}

TEST_F(TokenCodecTest, TruncatedAndExtendedTokensAreRejected) {
    auto token = issueOrFail(makeClaims(), std::chrono::seconds{900});
    EXPECT_TRUE(codec.validate(token.substr(0, token.size() - 1)).hasError());
    EXPECT_TRUE(codec.validate(token + "A").hasError());
    EXPECT_TRUE(codec.validate(token + ".").hasError());
}

TEST_F(TokenCodecTest, StructuralGarbageIsMalformed) {
    for (const char* garbage : {"", "abc", "a.b", "a..c", ".b.c", "a.b.", "a.b.c.d", "!!.??.**"}) {
        auto result = codec.validate(garbage);
        ASSERT_TRUE(result.hasError()) << garbage;
        EXPECT_EQ(result.error().code(), ErrorCode::MalformedToken) << garbage;
    }
}

TEST_F(TokenCodecTest, HeaderWithoutAlgorithmIsMalformed) {
    auto token = forgeToken(R"({"typ":"JWT"})", R"({"sub":"42","iat":1,"exp":2})");
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MalformedToken);
}

TEST_F(TokenCodecTest, HeaderThatIsNotJsonIsMalformed) {
    auto token = forgeToken("not json", R"({"sub":"42","iat":1,"exp":2})");
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MalformedToken);
}

TEST_F(TokenCodecTest, AlgorithmNoneIsInvalidSignature) {
    auto now = std::chrono::floor<std::chrono::seconds>(clock.now().time_since_epoch()).count();
    auto payload = R"({"sub":"42","iat":)" + std::to_string(now) +
                   R"(,"exp":)" + std::to_string(now + 60) + "}";
    auto token = detail::base64urlEncode(std::string_view(R"({"alg":"none","typ":"JWT"})")) +
                 "." + detail::base64urlEncode(payload) + ".AAAA";
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidSignature);
}

TEST_F(TokenCodecTest, WrongKeyIsInvalidSignature) {
    auto config = makeHs256Config();
    config.signingKey = "another-key-that-is-also-32-bytes-long!!";
    TokenCodec other(config, clock.source());

    auto token = other.issue(makeClaims(), std::chrono::seconds{60});
    ASSERT_TRUE(token.hasValue());
    auto result = codec.validate(token.value());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidSignature);
}

TEST_F(TokenCodecTest, SignedPayloadWithBadClaimsIsMalformed) {
    const std::vector<std::string> payloads = {
        R"({"iat":1700000000,"exp":1700000060})",                    // no sub
        R"({"sub":"","iat":1700000000,"exp":1700000060})",           // empty sub
        R"({"sub":42,"iat":1700000000,"exp":1700000060})",           // numeric sub
        R"({"sub":"42","exp":1700000060})",                          // no iat
        R"({"sub":"42","iat":"1700000000","exp":1700000060})",       // string iat
        R"({"sub":"42","iat":1700000060,"exp":1700000060})",         // exp == iat
        R"({"sub":"42","iat":1700000060,"exp":1700000000})",         // exp < iat
        R"({"sub":"42","iat":1700000000,"exp":1700000060,"jti":1})", // numeric jti
        R"({"sub":"42","iat":1700000000,"exp":1700000060,"x":{}})",  // nested
        R"(["sub"])",
    };
    for (const auto& payload : payloads) {
        auto result = codec.validate(forgeToken(kHs256Header, payload));
        ASSERT_TRUE(result.hasError()) << payload;
        EXPECT_EQ(result.error().code(), ErrorCode::MalformedToken) << payload;
    }
}

TEST_F(TokenCodecTest, ForgedButWellFormedTokenValidates) {
    auto token = forgeToken(kHs256Header,
                            R"({"sub":"7","iat":1699999990,"exp":1700000100,"tier":"gold"})");
    auto result = codec.validate(token);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().subject, "7");
    EXPECT_TRUE(result.value().tokenId.empty());
    EXPECT_EQ(std::get<std::string>(result.value().extensions.at("tier")), "gold");
}

TEST_F(TokenCodecTest, ConcurrentValidation) {
    auto token = issueOrFail(makeClaims(), std::chrono::seconds{900});
    std::vector<std::thread> threads;
    std::atomic<int> successes{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (codec.validate(token).hasValue()) {
                    successes.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(successes.load(), 8 * 50);
}

// =============================================================================
// TokenCodec tests: RS256
// =============================================================================

namespace {

/// Helper to extract a PEM string from an EVP_PKEY using a BIO.
std::string evpPkeyToPem(EVP_PKEY* pkey, bool isPrivate) {
    BIO* bio = BIO_new(BIO_s_mem());
    if (isPrivate) {
        PEM_write_bio_PrivateKey(bio, pkey, nullptr, nullptr, 0, nullptr, nullptr);
    } else {
        PEM_write_bio_PUBKEY(bio, pkey);
    }
    char* data = nullptr;
    auto len = BIO_get_mem_data(bio, &data);
    std::string pem(data, static_cast<std::size_t>(len));
    BIO_free(bio);
    return pem;
}

/// Generate a fresh 2048-bit RSA keypair at test runtime.
/// Returns {privateKeyPem, publicKeyPem}.
std::pair<std::string, std::string> generateTestRsaKeypair() {
    EVP_PKEY* pkey = EVP_RSA_gen(2048);
    auto privateKeyPem = evpPkeyToPem(pkey, true);
    auto publicKeyPem = evpPkeyToPem(pkey, false);
    EVP_PKEY_free(pkey);
    return {privateKeyPem, publicKeyPem};
}

/// Generated once per test process.
const std::pair<std::string, std::string>& testRsaKeypair() {
    static const auto kp = generateTestRsaKeypair();
    return kp;
}

AuthConfig makeRs256Config() {
    const auto& [priv, pub] = testRsaKeypair();
    AuthConfig config;
    config.algorithm = TokenAlgorithm::RS256;
    config.rsaPrivateKeyPem = priv;
    config.rsaPublicKeyPem = pub;
    return config;
}

} // namespace

class Rs256TokenCodecTest : public ::testing::Test {
protected:
    Rs256TokenCodecTest() : codec(makeRs256Config(), clock.source()) {}

    ManualClock clock;
    TokenCodec codec;
};

TEST_F(Rs256TokenCodecTest, IssueThenValidate) {
    TokenClaims claims;
    claims.subject = "99";
    claims.extensions["role"] = std::string("admin");

    auto token = codec.issue(claims, std::chrono::seconds{300});
    ASSERT_TRUE(token.hasValue());
    auto result = codec.validate(token.value());
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().subject, "99");
    EXPECT_EQ(result.value().algorithm, "RS256");
    EXPECT_EQ(std::get<std::string>(result.value().extensions.at("role")), "admin");
}

TEST_F(Rs256TokenCodecTest, Hs256TokenIsRejected) {
    TokenCodec hs(makeHs256Config(), clock.source());
    TokenClaims claims;
    claims.subject = "99";
    auto token = hs.issue(claims, std::chrono::seconds{300});
    ASSERT_TRUE(token.hasValue());

    auto result = codec.validate(token.value());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidSignature);
}

TEST_F(Rs256TokenCodecTest, TamperedSignatureIsRejected) {
    TokenClaims claims;
    claims.subject = "99";
    auto token = codec.issue(claims, std::chrono::seconds{300});
    ASSERT_TRUE(token.hasValue());

    auto tampered = token.value();
    auto pos = tampered.rfind('.') + 5;
    tampered[pos] = (tampered[pos] == 'A') ? 'B' : 'A';
    auto result = codec.validate(tampered);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidSignature);
}

TEST_F(Rs256TokenCodecTest, ExpiryApplies) {
    TokenClaims claims;
    claims.subject = "99";
    auto token = codec.issue(claims, std::chrono::seconds{300});
    ASSERT_TRUE(token.hasValue());
    clock.advance(std::chrono::seconds{300});
    auto result = codec.validate(token.value());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenExpired);
}

TEST_F(Rs256TokenCodecTest, MissingPrivateKeyIsConfigurationError) {
    auto config = makeRs256Config();
    config.rsaPrivateKeyPem.clear();
    TokenCodec verifyOnly(config, clock.source());

    TokenClaims claims;
    claims.subject = "99";
    auto result = verifyOnly.issue(claims, std::chrono::seconds{300});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigurationError);

    // Verification still works with the public key alone.
    auto token = codec.issue(claims, std::chrono::seconds{300});
    ASSERT_TRUE(token.hasValue());
    EXPECT_TRUE(verifyOnly.validate(token.value()).hasValue());
}
