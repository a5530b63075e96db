#include <sstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "broker/observability.hpp"

namespace {

TEST(ObservabilityTest, LogsStructuredJsonLine) {
  std::ostringstream sink;
  broker::Observability obs(broker::LogLevel::kInfo, sink);
  broker::LogContext ctx;
  ctx.trace_id = "t-1";
  ctx.name = "room_created";
  ctx.user_id = "u1";
  ctx.room_id = "room-1";
  obs.Log(ctx);

  auto line = nlohmann::json::parse(sink.str());
  EXPECT_EQ(line["level"], "info");
  EXPECT_EQ(line["traceId"], "t-1");
  EXPECT_EQ(line["eventName"], "room_created");
  EXPECT_EQ(line["userId"], "u1");
  EXPECT_EQ(line["roomId"], "room-1");
  EXPECT_FALSE(line.contains("message"));
}

TEST(ObservabilityTest, FiltersBelowMinimumLevel) {
  std::ostringstream sink;
  broker::Observability obs(broker::ParseLogLevel("warn"), sink);
  broker::LogContext debug;
  debug.level = broker::LogLevel::kDebug;
  debug.name = "noise";
  obs.Log(debug);
  EXPECT_TRUE(sink.str().empty());

  broker::LogContext error;
  error.level = broker::LogLevel::kError;
  error.name = "boom";
  obs.Log(error);
  EXPECT_NE(sink.str().find("boom"), std::string::npos);
}

TEST(ObservabilityTest, CountersAndTraceIds) {
  std::ostringstream sink;
  broker::Observability obs(broker::LogLevel::kInfo, sink);
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.IncrementRoomsCreated();
  obs.IncrementQosRejection();
  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.rooms_created, 1u);
  EXPECT_EQ(snapshot.qos_rejections, 1u);
  EXPECT_EQ(snapshot.auth_failures, 0u);
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}

}  // namespace
