#include "realmlink/protocol/nested_path.h"

namespace realmlink {
namespace protocol {

namespace {

bool isStructured(const nlohmann::json& value) {
  return value.is_object() || value.is_array();
}

bool compareEntry(const std::string& key,
                  const nlohmann::json& expected,
                  const nlohmann::json& candidate) {
  if (!candidate.is_object()) {
    return false;
  }
  auto actual = candidate.find(key);
  if (actual == candidate.end()) {
    return false;
  }
  if (isStructured(expected) || expected.is_null()) {
    return compareNested(expected, *actual);
  }
  return *actual == expected;
}

}  // namespace

void setNestedValue(nlohmann::json& object,
                    const std::string& path,
                    const nlohmann::json& value) {
  if (!object.is_object()) {
    object = nlohmann::json::object();
  }

  nlohmann::json* current = &object;
  size_t start = 0;
  size_t dot;
  while ((dot = path.find('.', start)) != std::string::npos) {
    const std::string key = path.substr(start, dot - start);
    nlohmann::json& next = (*current)[key];
    if (!next.is_object()) {
      next = nlohmann::json::object();
    }
    current = &next;
    start = dot + 1;
  }
  (*current)[path.substr(start)] = value;
}

bool compareNested(const nlohmann::json& pattern,
                   const nlohmann::json& candidate) {
  if (pattern.is_null() || candidate.is_null()) {
    return false;
  }

  if (candidate.is_array()) {
    for (const auto& element : candidate) {
      if (compareNested(pattern, element)) {
        return true;
      }
    }
    return false;
  }

  if (!isStructured(pattern)) {
    return pattern == candidate;
  }

  if (pattern.is_object()) {
    for (auto it = pattern.begin(); it != pattern.end(); ++it) {
      if (!compareEntry(it.key(), it.value(), candidate)) {
        return false;
      }
    }
    return true;
  }

  for (size_t i = 0; i < pattern.size(); ++i) {
    if (!compareEntry(std::to_string(i), pattern[i], candidate)) {
      return false;
    }
  }
  return true;
}

}  // namespace protocol
}  // namespace realmlink
