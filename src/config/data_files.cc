#define REALMLINK_LOG_COMPONENT "config"

#include "realmlink/config/data_files.h"

#include <algorithm>
#include <fstream>

#include "realmlink/logging/log_macros.h"

namespace realmlink {
namespace config {

namespace {

// Loads one JSON document, null when it is missing or malformed
nlohmann::json readJsonFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    REALMLINK_LOG(Error, "Failed to load {}: file not found", path);
    return nullptr;
  }
  try {
    nlohmann::json doc = nlohmann::json::parse(file);
    REALMLINK_LOG(Info, "Loaded {} successfully", path);
    return doc;
  } catch (const nlohmann::json::exception& e) {
    REALMLINK_LOG(Error, "Failed to parse {}: {}", path, e.what());
    return nullptr;
  }
}

// Zones and ids show up as strings or bare numbers
std::string scalarText(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number()) {
    return value.dump();
  }
  return "";
}

std::string joinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) {
    return name;
  }
  return dir.back() == '/' ? dir + name : dir + "/" + name;
}

const nlohmann::json kNullMapping;

}  // namespace

DataFiles DataFiles::load(const std::string& data_dir) {
  DataFiles files;
  files.setAllowed(readJsonFile(joinPath(data_dir, "instances.json")));
  files.setCredentials(readJsonFile(joinPath(data_dir, "credentials.json")));
  files.setCommands(readJsonFile(joinPath(data_dir, "commands.json")));
  REALMLINK_LOG(Info,
                "Data files: {} allowed zones, {} credential sets, {} "
                "command mappings",
                files.allowed_.size(), files.credentials_.size(),
                files.commands_.size());
  return files;
}

void DataFiles::setAllowed(const nlohmann::json& doc) {
  allowed_.clear();
  if (doc.is_null()) {
    return;
  }
  if (!doc.is_object() || !doc.contains("allowed") ||
      !doc.at("allowed").is_array()) {
    REALMLINK_LOG(Error, "instances.json must contain an 'allowed' list");
    return;
  }
  for (const auto& zone : doc.at("allowed")) {
    std::string text = scalarText(zone);
    if (text.empty()) {
      REALMLINK_LOG(Warning, "Skipping invalid allow-list entry {}",
                    zone.dump());
      continue;
    }
    allowed_.push_back(std::move(text));
  }
}

void DataFiles::setCredentials(const nlohmann::json& doc) {
  credentials_.clear();
  if (doc.is_null()) {
    return;
  }
  if (!doc.is_object()) {
    REALMLINK_LOG(Error, "credentials.json must be an object keyed by zone");
    return;
  }
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (!it.value().is_object()) {
      REALMLINK_LOG(Warning, "[{}] Credentials entry is not an object",
                    it.key());
      continue;
    }
    const auto& entry = it.value();
    Credentials creds;
    creds.username = scalarText(entry.value("USERNAME", nlohmann::json()));
    creds.password = scalarText(entry.value("PASSWORD", nlohmann::json()));
    creds.server_id = scalarText(entry.value("SERVER_ID", nlohmann::json()));
    credentials_[it.key()] = std::move(creds);
  }
}

void DataFiles::setCommands(const nlohmann::json& doc) {
  commands_ = nlohmann::json::object();
  if (doc.is_null()) {
    return;
  }
  if (!doc.is_object()) {
    REALMLINK_LOG(Error, "commands.json must be an object keyed by command");
    return;
  }
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    if (!it.value().is_object()) {
      REALMLINK_LOG(Warning, "Skipping mapping for command '{}'", it.key());
      continue;
    }
    commands_[it.key()] = it.value();
  }
}

bool DataFiles::isAllowed(const std::string& zone) const {
  return std::find(allowed_.begin(), allowed_.end(), zone) != allowed_.end();
}

optional<Credentials> DataFiles::credentialsFor(const std::string& zone) const {
  if (!isAllowed(zone)) {
    REALMLINK_LOG(Warning, "[{}] Not in allowed instances", zone);
    return nullopt;
  }
  auto it = credentials_.find(zone);
  if (it == credentials_.end() || !it->second.complete()) {
    REALMLINK_LOG(Warning, "[{}] Missing or incomplete credentials", zone);
    return nullopt;
  }
  return it->second;
}

const nlohmann::json& DataFiles::commandMapping(
    const std::string& command) const {
  auto it = commands_.find(command);
  if (it == commands_.end()) {
    return kNullMapping;
  }
  return *it;
}

}  // namespace config
}  // namespace realmlink
