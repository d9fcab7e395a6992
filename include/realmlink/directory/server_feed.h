#ifndef REALMLINK_DIRECTORY_SERVER_FEED_H
#define REALMLINK_DIRECTORY_SERVER_FEED_H

#include <string>
#include <vector>

#include "realmlink/core/result.h"

namespace realmlink {
namespace directory {

struct ServerDescriptor {
  // Zone name, always text even when it looks numeric
  std::string zone;
  // Host or host:port of the game server, without scheme
  std::string server;
  // False only when the feed says <enabled>false</enabled>
  bool enabled{true};
};

/**
 * Parse a server-list feed:
 *
 *   <network><instances>
 *     <instance><zone>EmpireEx_3</zone><server>host</server></instance>
 *     ...
 *   </instances></network>
 *
 * Instances without a zone or server are skipped. A document without
 * <network> or <instances> is a kParseError.
 */
Result<std::vector<ServerDescriptor>> parseServerFeed(const std::string& xml);

}  // namespace directory
}  // namespace realmlink

#endif  // REALMLINK_DIRECTORY_SERVER_FEED_H
