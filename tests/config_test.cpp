#include "critpath/config/config.hpp"
#include "critpath/util/log.hpp"

#include <cstdio>
#include <fstream>

#include "gtest/gtest.h"

using namespace critpath;

TEST(ConfigTest, EngineConfigDefaults) {
  EngineConfig config;

  EXPECT_EQ(config.logging.level, "warn");
  EXPECT_TRUE(config.logging.file.empty());
  EXPECT_EQ(config.calendar.work_days, kDefaultWorkWeek);
  EXPECT_DOUBLE_EQ(config.calendar.default_hours_per_day, 8.0);
  EXPECT_TRUE(config.leveling.enabled);
}

TEST(ConfigTest, LoadFromString) {
  auto result = ConfigLoader::load_from_string(R"(
logging:
  level: debug
calendar:
  work_days: [1, 2, 3, 4, 5]
  default_hours_per_day: 7.5
leveling:
  enabled: false
)");
  ASSERT_TRUE(result.has_value());

  EXPECT_EQ(result->logging.level, "debug");
  EXPECT_EQ(result->calendar.work_days, make_work_week({1, 2, 3, 4, 5}));
  EXPECT_DOUBLE_EQ(result->calendar.default_hours_per_day, 7.5);
  EXPECT_FALSE(result->leveling.enabled);
}

TEST(ConfigTest, MissingSectionsKeepDefaults) {
  auto result = ConfigLoader::load_from_string("leveling: {enabled: true}\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->calendar.work_days, kDefaultWorkWeek);
  EXPECT_EQ(result->logging.level, "warn");
}

TEST(ConfigTest, EmptyContentIsParseError) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, MalformedYamlIsParseError) {
  auto result = ConfigLoader::load_from_string("calendar: [unclosed\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, WeekdayOutOfRangeIsParseError) {
  auto result = ConfigLoader::load_from_string("calendar: {work_days: [0, 9]}\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, EmptyWorkWeekIsRejected) {
  auto result = ConfigLoader::load_from_string("calendar: {work_days: []}\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, NonPositiveHoursAreRejected) {
  auto result = ConfigLoader::load_from_string(
      "calendar: {default_hours_per_day: 0}\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::InvalidArgument));
}

TEST(ConfigTest, MissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/critpath.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, LoadFromFile) {
  const char* path = "/tmp/critpath_config_test.yaml";
  {
    std::ofstream out(path);
    out << "logging:\n  level: error\n";
  }
  auto result = ConfigLoader::load_from_file(path);
  std::remove(path);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->logging.level, "error");
}

TEST(ConfigTest, ToStringRoundTrips) {
  EngineConfig config;
  config.calendar.work_days = make_work_week({1, 2, 3});
  config.leveling.enabled = false;

  auto reloaded = ConfigLoader::load_from_string(ConfigLoader::to_string(config));
  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->calendar.work_days, config.calendar.work_days);
  EXPECT_FALSE(reloaded->leveling.enabled);
}

TEST(ConfigTest, ApplyLoggingSetsLevel) {
  LoggingConfig logging;
  logging.level = "error";
  ASSERT_TRUE(apply_logging(logging).has_value());
  EXPECT_EQ(log::logger().level(), log::Level::Error);

  logging.file = "/nonexistent/dir/critpath.log";
  auto result = apply_logging(logging);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileOpenFailed));

  log::set_level(log::Level::Warn);
}

TEST(LogTest, ParseLevel) {
  EXPECT_EQ(log::parse_level("trace"), log::Level::Trace);
  EXPECT_EQ(log::parse_level("off"), log::Level::Off);
  EXPECT_EQ(log::parse_level("bogus"), log::Level::Info);
  EXPECT_EQ(log::level_name(log::Level::Warn), "warn");
}
