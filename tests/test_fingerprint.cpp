// ═══════════════════════════════════════════════════════════════════
//  test_fingerprint.cpp — Cache key derivation
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <pqcache/crypto.h>
#include <pqcache/error.h>
#include <pqcache/fingerprint.h>

using namespace pqcache;

TEST(FingerprintTest, IsSha256OfIdWhenNoVariables) {
    // Same digest the crypto suite checks for "hello".
    EXPECT_EQ(fingerprint("hello"),
              "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST(FingerprintTest, SixtyFourLowercaseHexCharacters) {
    auto key = fingerprint("abc123", nlohmann::json{{"x", 1}});
    ASSERT_EQ(key.size(), 64u);
    for (char c : key) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
}

TEST(FingerprintTest, Deterministic) {
    nlohmann::json vars = {{"id", 7}, {"filter", {{"active", true}}}};
    EXPECT_EQ(fingerprint("userById", vars), fingerprint("userById", vars));
}

TEST(FingerprintTest, HashesIdConcatenatedWithCompactJson) {
    EXPECT_EQ(fingerprint("abc123", nlohmann::json{{"x", 1}}),
              crypto::sha256(R"(abc123{"x":1})"));
}

TEST(FingerprintTest, VariablesParticipateInKey) {
    EXPECT_NE(fingerprint("abc123"), fingerprint("abc123", nlohmann::json{{"x", 1}}));
    EXPECT_NE(fingerprint("abc123", nlohmann::json{{"x", 1}}),
              fingerprint("abc123", nlohmann::json{{"x", 2}}));
}

TEST(FingerprintTest, IdParticipatesInKey) {
    EXPECT_NE(fingerprint("a"), fingerprint("b"));
}

TEST(FingerprintTest, KeyOrderDoesNotMatter) {
    auto ab = nlohmann::json::parse(R"({"a": 1, "b": 2})");
    auto ba = nlohmann::json::parse(R"({"b": 2, "a": 1})");
    EXPECT_EQ(fingerprint("q", ab), fingerprint("q", ba));
}

TEST(FingerprintTest, NonObjectVariablesCountAsAbsent) {
    auto bare = fingerprint("q");
    EXPECT_EQ(fingerprint("q", nlohmann::json(nullptr)), bare);
    EXPECT_EQ(fingerprint("q", nlohmann::json::array({1, 2})), bare);
    EXPECT_EQ(fingerprint("q", nlohmann::json("text")), bare);
    EXPECT_EQ(fingerprint("q", nlohmann::json(5)), bare);
}

TEST(FingerprintTest, EmptyObjectDiffersFromAbsent) {
    EXPECT_EQ(canonicalVariables(nlohmann::json::object()), "{}");
    EXPECT_NE(fingerprint("q", nlohmann::json::object()), fingerprint("q"));
}

TEST(FingerprintTest, InvalidUtf8FailsWithSerializationError) {
    nlohmann::json vars = {{"name", std::string("\xff\xfe")}};
    EXPECT_THROW(fingerprint("q", vars), SerializationError);
}

TEST(CanonicalVariablesTest, EmptyWhenAbsent) {
    EXPECT_EQ(canonicalVariables(std::nullopt), "");
}

TEST(CanonicalVariablesTest, NestedValuesSerializeCompactly) {
    nlohmann::json vars = {{"b", {1, 2}}, {"a", {{"z", nullptr}}}};
    EXPECT_EQ(canonicalVariables(vars), R"({"a":{"z":null},"b":[1,2]})");
}
