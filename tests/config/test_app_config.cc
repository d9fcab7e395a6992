#include <gtest/gtest.h>

#include "realmlink/config/app_config.h"

#include "../mocks/temp_dir.h"

namespace realmlink {
namespace config {
namespace {

using test::ScopedEnv;
using test::TempDir;

TEST(EnvSubstitutionTest, ExpandsSetVariables) {
  ScopedEnv env("REALMLINK_TEST_HOST", "example.org");
  EXPECT_EQ("url: wss://example.org/x",
            substituteEnvVars("url: wss://${REALMLINK_TEST_HOST}/x"));
}

TEST(EnvSubstitutionTest, UsesDefaultWhenUnset) {
  ScopedEnv env("REALMLINK_TEST_UNSET", nullptr);
  EXPECT_EQ("port: 8080", substituteEnvVars("port: ${REALMLINK_TEST_UNSET:-8080}"));
  EXPECT_EQ("x=", substituteEnvVars("x=${REALMLINK_TEST_UNSET:-}"));
}

TEST(EnvSubstitutionTest, SetVariableBeatsDefault) {
  ScopedEnv env("REALMLINK_TEST_LEVEL", "debug");
  EXPECT_EQ("debug", substituteEnvVars("${REALMLINK_TEST_LEVEL:-info}"));
}

TEST(EnvSubstitutionTest, ReplacesSeveralReferences) {
  ScopedEnv a("REALMLINK_TEST_A", "alpha");
  ScopedEnv b("REALMLINK_TEST_B", "beta-long-value");
  EXPECT_EQ("beta-long-value/alpha/beta-long-value",
            substituteEnvVars(
                "${REALMLINK_TEST_B}/${REALMLINK_TEST_A}/${REALMLINK_TEST_B}"));
}

TEST(EnvSubstitutionTest, UndefinedWithoutDefaultThrows) {
  ScopedEnv env("REALMLINK_TEST_MISSING", nullptr);
  EXPECT_THROW(substituteEnvVars("${REALMLINK_TEST_MISSING}"),
               ConfigParseError);
}

TEST(EnvSubstitutionTest, LeavesPlainTextAlone) {
  EXPECT_EQ("cost: $5 {x}", substituteEnvVars("cost: $5 {x}"));
}

TEST(ConfigParseErrorTest, FormatsContext) {
  ConfigParseError error("bad value", "server.port", "app.yaml", 7);
  EXPECT_STREQ(
      "Configuration parse error in app.yaml:7 at field 'server.port': "
      "bad value",
      error.what());
  EXPECT_EQ("bad value", error.message());
  EXPECT_EQ("server.port", error.field());
}

TEST(AppConfigTest, DefaultsWithoutEnvironment) {
  ScopedEnv port("PORT", nullptr);
  ScopedEnv gbl("HAS_GBL", nullptr);

  AppConfig config = AppConfig::defaults();
  EXPECT_EQ(3000, config.server.port);
  EXPECT_EQ("0.0.0.0", config.server.bind_address);
  EXPECT_EQ(10000u, config.server.listen_delay_ms);
  EXPECT_EQ("/app/config", config.data_dir);
  EXPECT_FALSE(config.housekeeping);
  EXPECT_TRUE(config.tls.verify_peer);
  EXPECT_EQ("info", config.logging.level);
  EXPECT_EQ("text", config.logging.format);

  ASSERT_EQ(3u, config.feeds.size());
  EXPECT_EQ("EP", config.feeds[0].name);
  EXPECT_EQ("wss", config.feeds[0].scheme);
  EXPECT_EQ(FeedVariant::SingleRealm, config.feeds[0].variant);
  EXPECT_EQ("SP", config.feeds[1].name);
  EXPECT_NE(std::string::npos, config.feeds[1].url.find("39.xml"));
  EXPECT_EQ("E4K", config.feeds[2].name);
  EXPECT_EQ("ws", config.feeds[2].scheme);
  EXPECT_EQ(FeedVariant::MultiRealm, config.feeds[2].variant);
}

TEST(AppConfigTest, DefaultsFollowEnvironment) {
  ScopedEnv port("PORT", "8123");
  ScopedEnv gbl("HAS_GBL", "TRUE");

  AppConfig config = AppConfig::defaults();
  EXPECT_EQ(8123, config.server.port);
  EXPECT_TRUE(config.housekeeping);
}

TEST(AppConfigTest, HousekeepingNeedsLiteralTrue) {
  ScopedEnv gbl("HAS_GBL", "1");
  EXPECT_FALSE(AppConfig::defaults().housekeeping);
}

TEST(AppConfigTest, FromJsonOverlaysDefaults) {
  ScopedEnv port("PORT", nullptr);
  ParseContext ctx;
  auto doc = nlohmann::json::parse(R"({
    "server": {"port": 4000},
    "data_dir": "/srv/data",
    "logging": {"level": "debug", "format": "JSON",
                "patterns": {"protocol.*": "warning"}},
    "tls": {"verify_peer": false}
  })");

  AppConfig config = AppConfig::fromJson(doc, ctx);
  EXPECT_EQ(4000, config.server.port);
  EXPECT_EQ("0.0.0.0", config.server.bind_address);
  EXPECT_EQ("/srv/data", config.data_dir);
  EXPECT_EQ("debug", config.logging.level);
  EXPECT_EQ("json", config.logging.format);
  EXPECT_EQ("warning", config.logging.patterns.at("protocol.*"));
  EXPECT_FALSE(config.tls.verify_peer);
  EXPECT_EQ(3u, config.feeds.size());
}

TEST(AppConfigTest, FeedsReplaceDefaults) {
  ParseContext ctx;
  auto doc = nlohmann::json::parse(R"({
    "feeds": [
      {"name": "E4K", "url": "http://feeds.test/e4k.xml", "scheme": "tcp"},
      {"url": "http://feeds.test/1.xml", "variant": "single_realm"}
    ]
  })");

  AppConfig config = AppConfig::fromJson(doc, ctx);
  ASSERT_EQ(2u, config.feeds.size());
  EXPECT_EQ(FeedVariant::MultiRealmTcp, config.feeds[0].variant);
  EXPECT_EQ("http://feeds.test/1.xml", config.feeds[1].name);
  EXPECT_EQ("wss", config.feeds[1].scheme);
}

TEST(AppConfigTest, RejectsBadValuesWithFieldPath) {
  ParseContext ctx("app.json");
  auto doc = nlohmann::json::parse(R"({"server": {"port": 70000}})");
  try {
    AppConfig::fromJson(doc, ctx);
    FAIL() << "expected ConfigParseError";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ("server.port", e.field());
    EXPECT_EQ("app.json", e.file());
  }

  auto bad_type = nlohmann::json::parse(R"({"server": {"port": "x"}})");
  EXPECT_THROW(AppConfig::fromJson(bad_type, ctx), ConfigParseError);

  auto bad_feed = nlohmann::json::parse(R"({"feeds": [{"name": "x"}]})");
  try {
    AppConfig::fromJson(bad_feed, ctx);
    FAIL() << "expected ConfigParseError";
  } catch (const ConfigParseError& e) {
    EXPECT_EQ("feeds.0.url", e.field());
  }

  auto bad_variant = nlohmann::json::parse(
      R"({"feeds": [{"url": "u", "variant": "chess"}]})");
  EXPECT_THROW(AppConfig::fromJson(bad_variant, ctx), ConfigParseError);
}

TEST(AppConfigFileTest, LoadsYamlWithSubstitution) {
  TempDir dir;
  ScopedEnv env("REALMLINK_TEST_DATA", "/var/lib/realmlink");
  const std::string path = dir.write("app.yaml",
                                     "server:\n"
                                     "  port: 3100\n"
                                     "  listen_delay_ms: 0\n"
                                     "data_dir: ${REALMLINK_TEST_DATA}\n"
                                     "housekeeping: true\n"
                                     "logging:\n"
                                     "  level: \"warning\"\n"
                                     "  file: ${REALMLINK_TEST_LOG:-}\n");

  AppConfig config = loadAppConfig(path);
  EXPECT_EQ(path, config.source);
  EXPECT_EQ(3100, config.server.port);
  EXPECT_EQ(0u, config.server.listen_delay_ms);
  EXPECT_EQ("/var/lib/realmlink", config.data_dir);
  EXPECT_TRUE(config.housekeeping);
  EXPECT_EQ("warning", config.logging.level);
  EXPECT_TRUE(config.logging.file.empty());
}

TEST(AppConfigFileTest, QuotedNumbersStayStrings) {
  TempDir dir;
  const std::string path = dir.write("app.yaml", "data_dir: \"123\"\n");
  EXPECT_EQ("123", loadAppConfig(path).data_dir);
}

TEST(AppConfigFileTest, LoadsJson) {
  TempDir dir;
  const std::string path =
      dir.write("app.json", R"({"server": {"bind_address": "127.0.0.1"}})");
  EXPECT_EQ("127.0.0.1", loadAppConfig(path).server.bind_address);
}

TEST(AppConfigFileTest, ExplicitMissingFileThrows) {
  TempDir dir;
  EXPECT_THROW(loadAppConfig(dir.file("absent.yaml")), ConfigParseError);
}

TEST(AppConfigFileTest, MalformedDocumentsThrow) {
  TempDir dir;
  EXPECT_THROW(loadAppConfig(dir.write("bad.json", "{\"server\": ")),
               ConfigParseError);
  EXPECT_THROW(loadAppConfig(dir.write("bad.yaml", "server: [1, 2\n")),
               ConfigParseError);
}

TEST(AppConfigFileTest, EnvironmentVariableLocatesFile) {
  TempDir dir;
  const std::string path = dir.write("env.yaml", "data_dir: /from/env\n");
  ScopedEnv env("REALMLINK_CONFIG", path.c_str());

  EXPECT_EQ(path, findConfigFile(""));
  EXPECT_EQ("/from/env", loadAppConfig().data_dir);
}

TEST(AppConfigFileTest, ExplicitPathWinsOverEnvironment) {
  TempDir dir;
  const std::string env_path = dir.write("env.yaml", "data_dir: /env\n");
  const std::string cli_path = dir.write("cli.yaml", "data_dir: /cli\n");
  ScopedEnv env("REALMLINK_CONFIG", env_path.c_str());

  EXPECT_EQ(cli_path, findConfigFile(cli_path));
  EXPECT_EQ("/cli", loadAppConfig(cli_path).data_dir);
}

}  // namespace
}  // namespace config
}  // namespace realmlink
