#ifndef REALMLINK_PROTOCOL_NESTED_PATH_H
#define REALMLINK_PROTOCOL_NESTED_PATH_H

#include <string>

#include <nlohmann/json.hpp>

namespace realmlink {
namespace protocol {

/**
 * Write value at a dot-separated path ("a.b.c"), creating intermediate
 * objects. An intermediate that exists but is not an object is replaced.
 */
void setNestedValue(nlohmann::json& object,
                    const std::string& path,
                    const nlohmann::json& value);

/**
 * Structural match of a pattern against a candidate.
 *
 * Every key of the pattern must be present in the candidate with an equal
 * value; object or array values in the pattern are matched recursively. An
 * array candidate matches when any of its elements matches. A null on
 * either side never matches. An empty pattern matches any non-null
 * candidate.
 */
bool compareNested(const nlohmann::json& pattern,
                   const nlohmann::json& candidate);

}  // namespace protocol
}  // namespace realmlink

#endif  // REALMLINK_PROTOCOL_NESTED_PATH_H
