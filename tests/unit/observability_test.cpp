#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "dropguard/observability.hpp"

TEST(ObservabilityTest, LogWritesOneJsonObjectPerLine) {
  std::ostringstream sink;
  dropguard::Observability obs(dropguard::LogLevel::kDebug, &sink);
  obs.LogEvent(dropguard::LogLevel::kInfo, "session.login", std::string("alice"), "");
  obs.LogEvent(dropguard::LogLevel::kWarn, "session.security_advisory", std::nullopt, "IP change: a -> b");

  std::istringstream lines(sink.str());
  std::string first;
  std::string second;
  ASSERT_TRUE(std::getline(lines, first));
  ASSERT_TRUE(std::getline(lines, second));

  auto a = nlohmann::json::parse(first);
  EXPECT_EQ(a["level"], "info");
  EXPECT_EQ(a["eventName"], "session.login");
  EXPECT_EQ(a["ownerId"], "alice");
  EXPECT_FALSE(a.contains("detail"));

  auto b = nlohmann::json::parse(second);
  EXPECT_EQ(b["level"], "warn");
  EXPECT_FALSE(b.contains("ownerId"));
  EXPECT_EQ(b["detail"], "IP change: a -> b");
}

TEST(ObservabilityTest, InvalidUtf8IsReplacedInsteadOfThrowing) {
  std::ostringstream sink;
  dropguard::Observability obs(dropguard::LogLevel::kDebug, &sink);
  dropguard::LogContext ctx;
  ctx.name = "GET /api/health\xff";
  ctx.detail = "ua=\xfe";
  EXPECT_NO_THROW(obs.Log(ctx));

  auto line = nlohmann::json::parse(sink.str());
  EXPECT_EQ(line["eventName"], "GET /api/health\xEF\xBF\xBD");
  EXPECT_EQ(line["detail"], "ua=\xEF\xBF\xBD");
}

TEST(ObservabilityTest, MinimumLevelFiltersOutput) {
  std::ostringstream sink;
  dropguard::Observability obs(dropguard::LogLevel::kWarn, &sink);
  obs.LogEvent(dropguard::LogLevel::kDebug, "session.rotated", std::string("alice"), "");
  obs.LogEvent(dropguard::LogLevel::kInfo, "session.login", std::string("alice"), "");
  EXPECT_TRUE(sink.str().empty());
  obs.LogEvent(dropguard::LogLevel::kError, "store.unavailable", std::nullopt, "down");
  EXPECT_FALSE(sink.str().empty());
}

TEST(ObservabilityTest, CountersAccumulate) {
  std::ostringstream sink;
  dropguard::Observability obs(dropguard::LogLevel::kInfo, &sink);
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.IncrementLogin();
  obs.IncrementRotation();
  obs.IncrementRotationConflict();
  obs.IncrementSecurityViolation();
  obs.IncrementSecurityAdvisory();
  obs.IncrementSecurityAdvisory();

  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.logins, 1u);
  EXPECT_EQ(snapshot.rotations, 1u);
  EXPECT_EQ(snapshot.rotation_conflicts, 1u);
  EXPECT_EQ(snapshot.security_violations, 1u);
  EXPECT_EQ(snapshot.security_advisories, 2u);
}

TEST(ObservabilityTest, TraceIdsAreDistinct) {
  dropguard::Observability obs;
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}

TEST(ObservabilityTest, ParseLogLevelFallsBackToInfo) {
  EXPECT_EQ(dropguard::ParseLogLevel("DEBUG"), dropguard::LogLevel::kDebug);
  EXPECT_EQ(dropguard::ParseLogLevel("warning"), dropguard::LogLevel::kWarn);
  EXPECT_EQ(dropguard::ParseLogLevel("error"), dropguard::LogLevel::kError);
  EXPECT_EQ(dropguard::ParseLogLevel("verbose"), dropguard::LogLevel::kInfo);
}
