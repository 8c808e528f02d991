#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "dropguard/session_record.hpp"

TEST(SessionRecordTest, WireFormatShape) {
  dropguard::SessionRecord record;
  record.session_id = "abc";
  record.owner_id = "user-1";
  record.fingerprint.origin_ip = "10.0.0.1";
  record.created_at = dropguard::FromUnixSeconds(1700000000);
  record.last_activity_at = dropguard::FromUnixSeconds(1700000300);
  record.application_data = {{"role", "admin"}};

  auto body = dropguard::SessionRecordToJson(record);
  EXPECT_FALSE(body.contains("sessionId"));
  EXPECT_EQ(body["ownerId"], "user-1");
  EXPECT_EQ(body["data"]["ip"], "10.0.0.1");
  EXPECT_TRUE(body["data"]["userAgent"].is_null());
  EXPECT_EQ(body["data"]["userData"]["role"], "admin");
  EXPECT_EQ(body["createdAt"], 1700000000);
  EXPECT_EQ(body["lastActivityAt"], 1700000300);
}

TEST(SessionRecordTest, ParsesStoredBody) {
  auto body = nlohmann::json::parse(R"({
    "ownerId": "user-2",
    "data": {"ip": null, "userAgent": "curl/8.4.0", "userData": {"theme": "dark"}},
    "createdAt": 100,
    "lastActivityAt": 200
  })");
  auto record = dropguard::SessionRecordFromJson("key-1", body);
  EXPECT_EQ(record.session_id, "key-1");
  EXPECT_EQ(record.owner_id, "user-2");
  EXPECT_FALSE(record.fingerprint.origin_ip.has_value());
  EXPECT_EQ(record.fingerprint.user_agent, "curl/8.4.0");
  EXPECT_EQ(record.application_data["theme"], "dark");
  EXPECT_EQ(dropguard::ToUnixSeconds(record.created_at), 100);
  EXPECT_EQ(dropguard::ToUnixSeconds(record.last_activity_at), 200);
}

TEST(SessionRecordTest, MissingFieldsThrow) {
  auto body = nlohmann::json::parse(R"({"ownerId": "user-3", "createdAt": 1})");
  EXPECT_THROW(dropguard::SessionRecordFromJson("key", body), nlohmann::json::exception);
}

TEST(SessionRecordTest, SystemClockHasSecondPrecision) {
  auto now = dropguard::SystemClock()();
  EXPECT_EQ(dropguard::FromUnixSeconds(dropguard::ToUnixSeconds(now)), now);
}
