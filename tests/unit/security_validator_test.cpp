#include <chrono>
#include <optional>
#include <string>

#include <gtest/gtest.h>

#include "dropguard/security_validator.hpp"

namespace {
const char* kChrome120 =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.6099.71 "
    "Safari/537.36";
const char* kChrome120Patch =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.6099.109 "
    "Safari/537.36";
const char* kCurl = "curl/8.4.0";

dropguard::SecurityFingerprint Fp(const std::string& ip, const std::string& ua) {
  return dropguard::SecurityFingerprint{ip, ua};
}
}  // namespace

TEST(SecurityValidatorTest, IdenticalContextHasNoWarnings) {
  auto verdict = dropguard::ValidateSecurityContext(Fp("10.0.0.1", kChrome120), Fp("10.0.0.1", kChrome120), true, true);
  EXPECT_TRUE(verdict.valid);
  EXPECT_TRUE(verdict.warnings.empty());
}

TEST(SecurityValidatorTest, IpChangeIsAdvisoryUnlessStrict) {
  auto lax = dropguard::ValidateSecurityContext(Fp("10.0.0.1", kCurl), Fp("10.0.0.2", kCurl), false, false);
  EXPECT_TRUE(lax.valid);
  ASSERT_EQ(lax.warnings.size(), 1u);
  EXPECT_EQ(lax.warnings[0], "IP change: 10.0.0.1 -> 10.0.0.2");

  auto strict = dropguard::ValidateSecurityContext(Fp("10.0.0.1", kCurl), Fp("10.0.0.2", kCurl), true, false);
  EXPECT_FALSE(strict.valid);
  EXPECT_EQ(strict.warnings, lax.warnings);
}

TEST(SecurityValidatorTest, MissingCurrentIpIsReportedAsUnknown) {
  dropguard::SecurityFingerprint current{std::nullopt, std::string(kCurl)};
  auto verdict = dropguard::ValidateSecurityContext(Fp("10.0.0.1", kCurl), current, true, false);
  EXPECT_FALSE(verdict.valid);
  ASSERT_EQ(verdict.warnings.size(), 1u);
  EXPECT_EQ(verdict.warnings[0], "IP change: 10.0.0.1 -> unknown");
}

TEST(SecurityValidatorTest, MissingStoredValuesSkipChecks) {
  dropguard::SecurityFingerprint stored{};
  auto verdict = dropguard::ValidateSecurityContext(stored, Fp("10.0.0.9", kCurl), true, true);
  EXPECT_TRUE(verdict.valid);
  EXPECT_TRUE(verdict.warnings.empty());
}

TEST(SecurityValidatorTest, MinorBrowserUpdateIsTolerated) {
  auto verdict =
      dropguard::ValidateSecurityContext(Fp("10.0.0.1", kChrome120), Fp("10.0.0.1", kChrome120Patch), false, true);
  EXPECT_TRUE(verdict.valid);
  EXPECT_TRUE(verdict.warnings.empty());
}

TEST(SecurityValidatorTest, DifferentClientFailsStrictUa) {
  auto verdict = dropguard::ValidateSecurityContext(Fp("10.0.0.1", kChrome120), Fp("10.0.0.1", kCurl), false, true);
  EXPECT_FALSE(verdict.valid);
  ASSERT_EQ(verdict.warnings.size(), 1u);
  EXPECT_EQ(verdict.warnings[0].rfind("UA change detected (similarity: 0.", 0), 0u);
}

TEST(SecurityValidatorTest, BothChecksRunAndCollectWarnings) {
  auto verdict = dropguard::ValidateSecurityContext(Fp("10.0.0.1", kChrome120), Fp("10.0.0.2", kCurl), true, true);
  EXPECT_FALSE(verdict.valid);
  ASSERT_EQ(verdict.warnings.size(), 2u);
  EXPECT_EQ(verdict.warnings[0], "IP change: 10.0.0.1 -> 10.0.0.2");
  EXPECT_EQ(verdict.warnings[1].rfind("UA change detected", 0), 0u);
}

TEST(SecurityValidatorTest, NormalizeKeepsMajorVersionOnly) {
  EXPECT_EQ(dropguard::NormalizeUserAgent("Chrome/120.0.6099.71 Safari/537.36"), "Chrome/120 Safari/537");
  EXPECT_EQ(dropguard::NormalizeUserAgent("no-version"), "no-version");
}

TEST(SecurityValidatorTest, SimilarityBounds) {
  EXPECT_DOUBLE_EQ(dropguard::CalculateUaSimilarity("", ""), 1.0);
  EXPECT_DOUBLE_EQ(dropguard::CalculateUaSimilarity("abc", "abc"), 1.0);
  EXPECT_DOUBLE_EQ(dropguard::CalculateUaSimilarity("abc", ""), 0.0);
  EXPECT_DOUBLE_EQ(dropguard::CalculateUaSimilarity("abcd", "abcx"), 0.75);
}

TEST(SecurityValidatorTest, LevenshteinDistanceClassicCases) {
  EXPECT_EQ(dropguard::LevenshteinDistance("kitten", "sitting"), 3u);
  EXPECT_EQ(dropguard::LevenshteinDistance("", "abc"), 3u);
  EXPECT_EQ(dropguard::LevenshteinDistance("same", "same"), 0u);
}

TEST(SecurityValidatorTest, LongAgentsUseOverlapRatio) {
  std::string base(300, 'a');
  std::string changed = base;
  changed.replace(150, 30, std::string(30, 'b'));
  // 공통 문자는 270개이므로 2*270/600 = 0.9
  EXPECT_NEAR(dropguard::CalculateUaSimilarity(base, changed), 0.9, 1e-9);
}

TEST(SecurityValidatorTest, HeaderSizedAgentsCompareInBoundedTime) {
  std::string stored(8000, 'a');
  std::string current = stored + "x";
  auto started = std::chrono::steady_clock::now();
  auto verdict = dropguard::ValidateSecurityContext({std::nullopt, stored}, {std::nullopt, current}, false, true);
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_TRUE(verdict.valid);
  EXPECT_TRUE(verdict.warnings.empty());
  EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);

  std::string unrelated(8000, 'b');
  EXPECT_DOUBLE_EQ(dropguard::CalculateUaSimilarity(stored, unrelated), 0.0);
}
