#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "dropguard/config.hpp"

namespace {
const std::vector<std::string> kManagedEnv = {
    "SERVER_PORT",         "SESSION_STORE",        "LOG_LEVEL",        "OPS_TOKEN",
    "PURGE_INTERVAL_SECONDS", "DROP_PRESET",       "DROP_SESSION_EXPIRY", "DROP_ALLOW_MULTIPLE",
    "DROP_MAX_SESSIONS",   "DROP_COOKIE_NAME",     "DROP_COOKIE_SECURE", "DROP_COOKIE_DOMAIN",
    "DROP_STRICT_IP",      "DROP_STRICT_UA",       "DROP_ROTATION_THRESHOLD", "DROP_SLIDING_EXPIRATION"};
}  // namespace

class EnvConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const auto& key : kManagedEnv) {
      unsetenv(key.c_str());
    }
  }
};

TEST(ProtocolConfigTest, DefaultsMatchDocumentedValues) {
  auto config = dropguard::ProtocolConfigBuilder().Build();
  EXPECT_EQ(config.session_expiry.count(), 3600);
  EXPECT_FALSE(config.allow_multiple_sessions);
  EXPECT_EQ(config.max_sessions_per_owner, 5u);
  EXPECT_EQ(config.cookie_name, "drop_session");
  EXPECT_EQ(config.cookie_options.path, "/");
  EXPECT_TRUE(config.cookie_options.secure);
  EXPECT_TRUE(config.cookie_options.http_only);
  EXPECT_EQ(config.cookie_options.same_site, "Strict");
  EXPECT_FALSE(config.strict_ip);
  EXPECT_FALSE(config.strict_ua);
  EXPECT_EQ(config.rotation_threshold_seconds, 300);
  EXPECT_TRUE(config.sliding_expiration);
}

TEST(ProtocolConfigTest, ExpiryBelowMinimumRejected) {
  EXPECT_THROW(dropguard::ProtocolConfigBuilder().WithSessionExpiry(59).Build(), std::invalid_argument);
  EXPECT_NO_THROW(dropguard::ProtocolConfigBuilder().WithSessionExpiry(60).Build());
}

TEST(ProtocolConfigTest, MaxSessionsClampedToOne) {
  auto config = dropguard::ProtocolConfigBuilder().EnableMultipleSessions().WithMaxSessionsPerOwner(0).Build();
  EXPECT_EQ(config.max_sessions_per_owner, 1u);
}

TEST(ProtocolConfigTest, DisablingMultipleSessionsForcesSingleSlot) {
  auto config = dropguard::ProtocolConfigBuilder().WithMaxSessionsPerOwner(8).DisableMultipleSessions().Build();
  EXPECT_FALSE(config.allow_multiple_sessions);
  EXPECT_EQ(config.max_sessions_per_owner, 1u);
}

TEST(ProtocolConfigTest, Presets) {
  auto balanced = dropguard::ProtocolConfigBuilder::Balanced().Build();
  EXPECT_EQ(balanced.session_expiry.count(), 3600);
  EXPECT_EQ(balanced.rotation_threshold_seconds, 300);
  EXPECT_TRUE(balanced.allow_multiple_sessions);
  EXPECT_EQ(balanced.max_sessions_per_owner, 5u);
  EXPECT_FALSE(balanced.strict_ip);

  auto high = dropguard::ProtocolConfigBuilder::HighSecurity().Build();
  EXPECT_EQ(high.session_expiry.count(), 1800);
  EXPECT_EQ(high.rotation_threshold_seconds, 60);
  EXPECT_TRUE(high.strict_ip);
  EXPECT_TRUE(high.strict_ua);
  EXPECT_FALSE(high.allow_multiple_sessions);
  EXPECT_EQ(high.max_sessions_per_owner, 1u);

  auto dev = dropguard::ProtocolConfigBuilder::Development().Build();
  EXPECT_EQ(dev.session_expiry.count(), 86400);
  EXPECT_EQ(dev.rotation_threshold_seconds, 0);
  EXPECT_FALSE(dev.cookie_options.secure);
  EXPECT_EQ(dev.max_sessions_per_owner, 10u);
}

TEST_F(EnvConfigTest, DefaultsWithoutEnvironment) {
  auto config = dropguard::LoadConfigFromEnv();
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.session_store, "memory");
  EXPECT_EQ(config.log_level, "info");
  EXPECT_TRUE(config.ops_token.empty());
  EXPECT_EQ(config.purge_interval_seconds, 60u);
  EXPECT_EQ(config.protocol.session_expiry.count(), 3600);
}

TEST_F(EnvConfigTest, PresetWithOverrides) {
  setenv("DROP_PRESET", "high_security", 1);
  setenv("DROP_SESSION_EXPIRY", "900", 1);
  setenv("DROP_COOKIE_NAME", "sid", 1);
  setenv("DROP_ROTATION_THRESHOLD", "-1", 1);
  setenv("SESSION_STORE", "MariaDB", 1);
  auto config = dropguard::LoadConfigFromEnv();
  EXPECT_EQ(config.session_store, "mariadb");
  EXPECT_EQ(config.protocol.session_expiry.count(), 900);
  EXPECT_EQ(config.protocol.cookie_name, "sid");
  EXPECT_EQ(config.protocol.rotation_threshold_seconds, -1);
  EXPECT_TRUE(config.protocol.strict_ip);
}

TEST_F(EnvConfigTest, BooleanOverrides) {
  setenv("DROP_ALLOW_MULTIPLE", "yes", 1);
  setenv("DROP_MAX_SESSIONS", "3", 1);
  setenv("DROP_COOKIE_SECURE", "false", 1);
  setenv("DROP_SLIDING_EXPIRATION", "off", 1);
  setenv("DROP_STRICT_UA", "1", 1);
  auto config = dropguard::LoadConfigFromEnv();
  EXPECT_TRUE(config.protocol.allow_multiple_sessions);
  EXPECT_EQ(config.protocol.max_sessions_per_owner, 3u);
  EXPECT_FALSE(config.protocol.cookie_options.secure);
  EXPECT_FALSE(config.protocol.sliding_expiration);
  EXPECT_TRUE(config.protocol.strict_ua);
  EXPECT_FALSE(config.protocol.strict_ip);
}

TEST_F(EnvConfigTest, StrictOverridesCanRelaxPreset) {
  setenv("DROP_PRESET", "high_security", 1);
  setenv("DROP_STRICT_IP", "false", 1);
  auto config = dropguard::LoadConfigFromEnv();
  EXPECT_FALSE(config.protocol.strict_ip);
  EXPECT_TRUE(config.protocol.strict_ua);

  setenv("DROP_STRICT_UA", "off", 1);
  config = dropguard::LoadConfigFromEnv();
  EXPECT_FALSE(config.protocol.strict_ua);
}

TEST_F(EnvConfigTest, UnknownPresetRejected) {
  setenv("DROP_PRESET", "paranoid", 1);
  EXPECT_THROW(dropguard::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(EnvConfigTest, ShortExpiryRejected) {
  setenv("DROP_SESSION_EXPIRY", "30", 1);
  EXPECT_THROW(dropguard::LoadConfigFromEnv(), std::invalid_argument);
}
