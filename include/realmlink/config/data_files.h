#ifndef REALMLINK_CONFIG_DATA_FILES_H
#define REALMLINK_CONFIG_DATA_FILES_H

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "realmlink/core/compat.h"

namespace realmlink {
namespace config {

struct Credentials {
  std::string username;
  std::string password;
  std::string server_id;

  // All three fields present and non-empty
  bool complete() const {
    return !username.empty() && !password.empty() && !server_id.empty();
  }
};

/**
 * Operator data read from the data directory:
 *
 *   instances.json    {"allowed": ["EmpireEx_3", ...]}
 *   credentials.json  {"EmpireEx_3": {"USERNAME": .., "PASSWORD": ..,
 *                                     "SERVER_ID": ..}, ...}
 *   commands.json     {"gdi": {"PID": "O.OID"}, ...}
 *
 * A missing or malformed file is logged and leaves its part empty.
 */
class DataFiles {
 public:
  static DataFiles load(const std::string& data_dir);

  // Parse the individual documents; invalid shapes are logged and skipped
  void setAllowed(const nlohmann::json& doc);
  void setCredentials(const nlohmann::json& doc);
  void setCommands(const nlohmann::json& doc);

  bool isAllowed(const std::string& zone) const;

  /**
   * Credentials for an allow-listed zone. Returns nullopt, with a warning,
   * when the zone is not allowed or its credentials are incomplete.
   */
  optional<Credentials> credentialsFor(const std::string& zone) const;

  // Request key -> response path mapping for a command, null when unmapped
  const nlohmann::json& commandMapping(const std::string& command) const;

  const std::vector<std::string>& allowed() const { return allowed_; }
  size_t credentialCount() const { return credentials_.size(); }
  size_t commandCount() const { return commands_.size(); }

 private:
  std::vector<std::string> allowed_;
  std::map<std::string, Credentials> credentials_;
  nlohmann::json commands_ = nlohmann::json::object();
};

}  // namespace config
}  // namespace realmlink

#endif  // REALMLINK_CONFIG_DATA_FILES_H
