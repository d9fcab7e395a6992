#define REALMLINK_LOG_COMPONENT "config"

#include "realmlink/config/app_config.h"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <tuple>

#include <yaml-cpp/yaml.h>

#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace config {

namespace {

constexpr size_t kMaxConfigFileBytes = 1024 * 1024;

bool exists(const std::string& path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

nlohmann::json yamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return nullptr;
    case YAML::NodeType::Scalar: {
      const std::string& text = node.Scalar();
      // Quoted scalars carry the non-specific tag and stay strings
      if (node.Tag() == "!") {
        return text;
      }
      if (text == "true" || text == "false") {
        return node.as<bool>();
      }
      if (text == "~" || text == "null") {
        return nullptr;
      }
      int64_t integer = 0;
      if (YAML::convert<int64_t>::decode(node, integer)) {
        return integer;
      }
      double number = 0;
      if (text.find('.') != std::string::npos &&
          YAML::convert<double>::decode(node, number)) {
        return number;
      }
      return text;
    }
    case YAML::NodeType::Sequence: {
      nlohmann::json result = nlohmann::json::array();
      for (const auto& item : node) {
        result.push_back(yamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      nlohmann::json result = nlohmann::json::object();
      for (const auto& pair : node) {
        result[pair.first.as<std::string>()] = yamlToJson(pair.second);
      }
      return result;
    }
    default:
      break;
  }
  return nullptr;
}

std::vector<FeedConfig> defaultFeeds() {
  return {
      {"EP", "https://gge-tracker.github.io/gge-cdn-mirror-files/1.xml", "wss",
       FeedVariant::SingleRealm},
      {"SP", "https://gge-tracker.github.io/gge-cdn-mirror-files/39.xml",
       "wss", FeedVariant::SingleRealm},
      {"E4K", "https://gge-tracker.github.io/gge-cdn-mirror-files/e4k.xml",
       "ws", FeedVariant::MultiRealm},
  };
}

FeedConfig parseFeed(const nlohmann::json& j, ParseContext& ctx) {
  if (!j.is_object()) {
    throw ctx.createError("Feed entry must be a mapping");
  }
  FeedConfig feed;
  getOptionalJsonField(j, "name", feed.name, ctx);
  if (!getOptionalJsonField(j, "url", feed.url, ctx) || feed.url.empty()) {
    ParseContext::FieldScope scope(ctx, "url");
    throw ctx.createError("Required field 'url' is missing");
  }
  getOptionalJsonField(j, "scheme", feed.scheme, ctx);
  feed.scheme = toLower(feed.scheme);
  if (feed.scheme != "ws" && feed.scheme != "wss" && feed.scheme != "tcp") {
    ParseContext::FieldScope scope(ctx, "scheme");
    throw ctx.createError("Unsupported scheme '" + feed.scheme + "'");
  }

  std::string variant;
  if (getOptionalJsonField(j, "variant", variant, ctx)) {
    ParseContext::FieldScope scope(ctx, "variant");
    feed.variant = parseFeedVariant(variant, ctx);
  } else if (feed.scheme == "tcp") {
    feed.variant = FeedVariant::MultiRealmTcp;
  }
  if (feed.name.empty()) {
    feed.name = feed.url;
  }
  return feed;
}

}  // namespace

const char* feedVariantName(FeedVariant variant) {
  switch (variant) {
    case FeedVariant::SingleRealm:
      return "single_realm";
    case FeedVariant::MultiRealm:
      return "multi_realm";
    case FeedVariant::MultiRealmTcp:
      return "multi_realm_tcp";
  }
  return "unknown";
}

FeedVariant parseFeedVariant(const std::string& name, ParseContext& ctx) {
  const std::string lower = toLower(name);
  if (lower == "single_realm" || lower == "ep") {
    return FeedVariant::SingleRealm;
  }
  if (lower == "multi_realm" || lower == "e4k") {
    return FeedVariant::MultiRealm;
  }
  if (lower == "multi_realm_tcp" || lower == "e4k_tcp") {
    return FeedVariant::MultiRealmTcp;
  }
  throw ctx.createError("Unknown feed variant '" + name + "'");
}

AppConfig AppConfig::defaults() {
  AppConfig config;
  const char* port = std::getenv("PORT");
  if (port && *port) {
    char* end = nullptr;
    long value = std::strtol(port, &end, 10);
    if (end && *end == '\0' && value > 0 && value <= 65535) {
      config.server.port = static_cast<uint16_t>(value);
    } else {
      REALMLINK_LOG(Warning, "Ignoring invalid PORT value '{}'", port);
    }
  }
  const char* gbl = std::getenv("HAS_GBL");
  config.housekeeping = gbl && toLower(gbl) == "true";
  config.feeds = defaultFeeds();
  return config;
}

AppConfig AppConfig::fromJson(const nlohmann::json& j, ParseContext& ctx) {
  AppConfig config = defaults();
  if (j.is_null()) {
    return config;
  }
  if (!j.is_object()) {
    throw ctx.createError("Top-level configuration must be a mapping");
  }

  if (j.contains("server")) {
    ParseContext::FieldScope scope(ctx, "server");
    const auto& server = j.at("server");
    int64_t port = 0;
    if (getOptionalJsonField(server, "port", port, ctx)) {
      if (port <= 0 || port > 65535) {
        ParseContext::FieldScope port_scope(ctx, "port");
        throw ctx.createError("Port out of range: " + std::to_string(port));
      }
      config.server.port = static_cast<uint16_t>(port);
    }
    getOptionalJsonField(server, "bind_address", config.server.bind_address,
                         ctx);
    getOptionalJsonField(server, "listen_delay_ms",
                         config.server.listen_delay_ms, ctx);
  }

  getOptionalJsonField(j, "data_dir", config.data_dir, ctx);
  getOptionalJsonField(j, "housekeeping", config.housekeeping, ctx);

  if (j.contains("feeds") && !j.at("feeds").is_null()) {
    ParseContext::FieldScope scope(ctx, "feeds");
    const auto& feeds = j.at("feeds");
    if (!feeds.is_array()) {
      throw ctx.createError("Expected a list of feeds");
    }
    config.feeds.clear();
    for (size_t i = 0; i < feeds.size(); ++i) {
      ParseContext::FieldScope item(ctx, std::to_string(i));
      config.feeds.push_back(parseFeed(feeds[i], ctx));
    }
  }

  if (j.contains("logging")) {
    ParseContext::FieldScope scope(ctx, "logging");
    const auto& logging = j.at("logging");
    getOptionalJsonField(logging, "level", config.logging.level, ctx);
    getOptionalJsonField(logging, "format", config.logging.format, ctx);
    getOptionalJsonField(logging, "file", config.logging.file, ctx);
    getOptionalJsonField(logging, "patterns", config.logging.patterns, ctx);
    config.logging.format = toLower(config.logging.format);
    if (config.logging.format != "text" && config.logging.format != "json") {
      ParseContext::FieldScope format_scope(ctx, "format");
      throw ctx.createError("Expected 'text' or 'json'");
    }
  }

  if (j.contains("tls")) {
    ParseContext::FieldScope scope(ctx, "tls");
    const auto& tls = j.at("tls");
    getOptionalJsonField(tls, "verify_peer", config.tls.verify_peer, ctx);
    getOptionalJsonField(tls, "ca_file", config.tls.ca_file, ctx);
  }

  return config;
}

std::string substituteEnvVars(const std::string& text) {
  std::regex env_regex(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:(-)?([^}]*))?\})");
  std::string result = text;

  std::smatch match;
  std::string::const_iterator search_start(text.cbegin());
  std::vector<std::tuple<size_t, size_t, std::string>> replacements;

  while (std::regex_search(search_start, text.cend(), match, env_regex)) {
    const std::string var_name = match[1].str();
    const bool has_default = match[2].matched;
    const char* env_value = std::getenv(var_name.c_str());

    if (!env_value && !has_default) {
      REALMLINK_LOG(Error,
                    "Undefined environment variable without default: ${{{}}}",
                    var_name);
      throw ConfigParseError("Undefined environment variable: " + var_name);
    }

    const size_t pos =
        match.position(0) + std::distance(text.cbegin(), search_start);
    replacements.emplace_back(pos, match.length(0),
                              env_value ? env_value : match[4].str());
    search_start = match.suffix().first;
  }

  // Back to front so earlier offsets stay valid
  for (auto it = replacements.rbegin(); it != replacements.rend(); ++it) {
    result.replace(std::get<0>(*it), std::get<1>(*it), std::get<2>(*it));
  }

  if (!replacements.empty()) {
    REALMLINK_LOG(Debug, "Expanded {} environment variables",
                  replacements.size());
  }
  return result;
}

std::string findConfigFile(const std::string& explicit_path) {
  if (!explicit_path.empty()) {
    // Returned unconditionally so a typo surfaces as a load error
    REALMLINK_LOG(Info, "Configuration source: --config={}", explicit_path);
    return explicit_path;
  }

  std::vector<std::string> search_paths;
  const char* env_config = std::getenv("REALMLINK_CONFIG");
  if (env_config && *env_config) {
    search_paths.push_back(env_config);
  }
  search_paths.push_back("./config/realmlink.yaml");
  search_paths.push_back("./config/realmlink.json");
  search_paths.push_back("/etc/realmlink/realmlink.yaml");
  search_paths.push_back("/etc/realmlink/realmlink.json");

  for (const auto& path : search_paths) {
    if (exists(path)) {
      REALMLINK_LOG(Info, "Configuration source: {}", path);
      return path;
    }
  }
  REALMLINK_LOG(Debug, "No configuration file among {} candidates",
                search_paths.size());
  return "";
}

nlohmann::json loadConfigDocument(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw ConfigParseError("Cannot open configuration file", "", path);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (content.size() > kMaxConfigFileBytes) {
    throw ConfigParseError("Configuration file exceeds 1 MiB", "", path);
  }

  try {
    content = substituteEnvVars(content);
  } catch (const ConfigParseError& e) {
    throw ConfigParseError(e.message(), "", path);
  }

  if (endsWith(toLower(path), ".json")) {
    try {
      return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
      throw ConfigParseError(e.what(), "", path);
    }
  }

  try {
    return yamlToJson(YAML::Load(content));
  } catch (const YAML::Exception& e) {
    throw ConfigParseError(e.msg, "", path, e.mark.line + 1);
  }
}

AppConfig loadAppConfig(const std::string& explicit_path) {
  const std::string path = findConfigFile(explicit_path);
  if (path.empty()) {
    REALMLINK_LOG(Info, "No configuration file found, using defaults");
    return AppConfig::defaults();
  }

  ParseContext ctx(path);
  AppConfig config = AppConfig::fromJson(loadConfigDocument(path), ctx);
  config.source = path;
  REALMLINK_LOG(Info, "Loaded configuration from {} ({} feeds)", path,
                config.feeds.size());
  return config;
}

}  // namespace config
}  // namespace realmlink
