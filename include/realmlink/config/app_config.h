/**
 * @file app_config.h
 * @brief Application configuration: file discovery, loading and defaults
 *
 * The configuration is a YAML or JSON document. ${VAR} and ${VAR:-default}
 * references are expanded from the environment before parsing. Every field
 * is optional and falls back to the built-in defaults.
 */

#ifndef REALMLINK_CONFIG_APP_CONFIG_H
#define REALMLINK_CONFIG_APP_CONFIG_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "realmlink/config/parse_error.h"

namespace realmlink {
namespace config {

// Which login sequence the servers of a feed speak
enum class FeedVariant {
  // lli login, one realm per account
  SingleRealm,
  // core_lga login with registration on first use
  MultiRealm,
  // MultiRealm over a NUL-delimited TCP stream
  MultiRealmTcp,
};

const char* feedVariantName(FeedVariant variant);

// "single_realm", "multi_realm", "multi_realm_tcp"
FeedVariant parseFeedVariant(const std::string& name, ParseContext& ctx);

struct FeedConfig {
  // Log label of the feed ("EP", "SP", "E4K")
  std::string name;
  std::string url;
  // Scheme prepended to each <server> entry ("wss", "ws", "tcp")
  std::string scheme{"wss"};
  FeedVariant variant{FeedVariant::SingleRealm};
};

struct ServerConfig {
  uint16_t port{3000};
  std::string bind_address{"0.0.0.0"};
  // Delay between starting the connections and accepting gateway calls
  uint32_t listen_delay_ms{10000};
};

struct LoggingConfig {
  std::string level{"info"};
  // "text" or "json"
  std::string format{"text"};
  // Empty logs to stderr
  std::string file;
  // Glob on logger name -> level name
  std::map<std::string, std::string> patterns;
};

struct TlsConfig {
  bool verify_peer{true};
  std::string ca_file;
};

struct AppConfig {
  ServerConfig server;
  std::string data_dir{"/app/config"};
  // Send the gbl housekeeping command after each login
  bool housekeeping{false};
  std::vector<FeedConfig> feeds;
  LoggingConfig logging;
  TlsConfig tls;

  // Path the configuration was read from; empty for built-in defaults
  std::string source;

  /**
   * Built-in defaults. PORT and HAS_GBL from the environment seed the port
   * and the housekeeping toggle.
   */
  static AppConfig defaults();

  // Overlay the fields present in the document onto defaults()
  static AppConfig fromJson(const nlohmann::json& j, ParseContext& ctx);
};

/**
 * Expand ${VAR} and ${VAR:-default} references. A referenced variable that
 * is unset and has no default is an error.
 */
std::string substituteEnvVars(const std::string& text);

/**
 * Locate the configuration file. Order: the explicit path, then
 * REALMLINK_CONFIG, then ./config/realmlink.{yaml,json}, then
 * /etc/realmlink/realmlink.{yaml,json}. Returns an empty string when none
 * exists.
 */
std::string findConfigFile(const std::string& explicit_path);

/**
 * Read, expand and parse one configuration document. Files ending in .json
 * are parsed as JSON, everything else as YAML.
 */
nlohmann::json loadConfigDocument(const std::string& path);

/**
 * Discover and load the application configuration. Throws ConfigParseError
 * when a file exists but cannot be read or parsed.
 */
AppConfig loadAppConfig(const std::string& explicit_path = "");

}  // namespace config
}  // namespace realmlink

#endif  // REALMLINK_CONFIG_APP_CONFIG_H
