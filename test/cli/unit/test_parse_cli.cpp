/***
 * Name: test_parse_cli
 * Purpose: Exercise CLI option parsing for the tyflow tool.
 */
#include <gtest/gtest.h>
#include "tyflow/driver/cli.h"

#include <sstream>

using namespace tyflow::driver;

TEST(ParseCli, HelpShortCircuits) {
  const char* argv[] = {"tyflow", "--help", "--bogus"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(3, argv, o, err));
  EXPECT_TRUE(o.show_help);
  EXPECT_TRUE(err.str().empty());
}

TEST(ParseCli, CollectsSpellingsAndSwitches) {
  const char* argv[] = {"tyflow", "--optional", "string", "--property=length", "'a'|1", "-1.5", "--metrics=json"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(7, argv, o, err)) << err.str();
  EXPECT_TRUE(o.optional);
  ASSERT_TRUE(o.property.has_value());
  EXPECT_EQ(*o.property, "length");
  ASSERT_EQ(o.types.size(), 3u);
  EXPECT_EQ(o.types[0], "string");
  EXPECT_EQ(o.types[1], "'a'|1");
  EXPECT_EQ(o.types[2], "-1.5");
  EXPECT_TRUE(o.metrics);
  EXPECT_EQ(o.metrics_format, CliOptions::MetricsFormat::Json);
}

TEST(ParseCli, PropertyTakesSeparateValue) {
  const char* argv[] = {"tyflow", "--property", "name", "object"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(4, argv, o, err));
  EXPECT_EQ(o.property.value_or(""), "name");
  ASSERT_EQ(o.types.size(), 1u);
}

TEST(ParseCli, MissingPropertyValueFails) {
  const char* argv[] = {"tyflow", "string", "--property"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(3, argv, o, err));
  EXPECT_NE(err.str().find("missing key"), std::string::npos);
}

TEST(ParseCli, UnknownOptionFails) {
  const char* argv[] = {"tyflow", "-x", "string"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(3, argv, o, err));
  EXPECT_NE(err.str().find("unknown option '-x'"), std::string::npos);
}

TEST(ParseCli, BadMetricsFormatFails) {
  const char* argv[] = {"tyflow", "--metrics=xml", "string"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(3, argv, o, err));
}

TEST(ParseCli, NoSpellingsFails) {
  const char* argv[] = {"tyflow", "--optional"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(2, argv, o, err));
  EXPECT_NE(err.str().find("no type spellings"), std::string::npos);
}

TEST(ParseCli, LogTypesRequiresLogPath) {
  const char* argv[] = {"tyflow", "--log-types", "string"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(3, argv, o, err));

  const char* ok[] = {"tyflow", "--log-path=logs", "--log-types", "string"};
  ASSERT_TRUE(ParseCli(4, ok, o, err));
  EXPECT_EQ(o.log_path, "logs");
  EXPECT_TRUE(o.log_types);
}

TEST(ParseCli, DoubleDashTreatsAllFollowingAsSpellings) {
  const char* argv[] = {"tyflow", "--", "--optional", "null"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(4, argv, o, err));
  EXPECT_FALSE(o.optional);
  ASSERT_EQ(o.types.size(), 2u);
  EXPECT_EQ(o.types[0], "--optional");
}

TEST(PrintUsage, NamesProgramAndFlags) {
  std::ostringstream out;
  PrintUsage(out, "/usr/local/bin/tyflow");
  const std::string text = out.str();
  EXPECT_EQ(text.rfind("Usage: tyflow [options] type...", 0), 0u);
  EXPECT_NE(text.find("--property=<key>"), std::string::npos);
}

TEST(ParseCli, LogPathTakesSeparateValue) {
  const char* argv[] = {"tyflow", "--log-path", "logs", "--log-types", "string"};
  CliOptions o;
  std::ostringstream err;
  ASSERT_TRUE(ParseCli(5, argv, o, err)) << err.str();
  EXPECT_EQ(o.log_path, "logs");
  ASSERT_EQ(o.types.size(), 1u);
  EXPECT_EQ(o.types[0], "string");
}

TEST(ParseCli, SwitchWithValueFails) {
  const char* argv[] = {"tyflow", "--optional=x", "string"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(3, argv, o, err));
  EXPECT_NE(err.str().find("takes no value"), std::string::npos);
}

TEST(ParseCli, EmptyPropertyKeyFails) {
  const char* argv[] = {"tyflow", "--property=", "string"};
  CliOptions o;
  std::ostringstream err;
  EXPECT_FALSE(ParseCli(3, argv, o, err));
  EXPECT_NE(err.str().find("empty property key"), std::string::npos);
}

TEST(PrintUsage, ListsEveryFlagSpelling) {
  std::ostringstream out;
  PrintUsage(out, "tyflow");
  const std::string text = out.str();
  for (const char* spelling : {"-h, --help", "--optional", "--log-path=<dir>", "--log-types", "--metrics[=<format>]"}) {
    EXPECT_NE(text.find(spelling), std::string::npos) << spelling;
  }
}
