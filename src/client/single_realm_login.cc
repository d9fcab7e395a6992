#include "realmlink/client/single_realm_login.h"

#include <fmt/format.h>

namespace realmlink {
namespace client {

void SingleRealmLogin::login() {
  expectDelimited("lli", [this](const protocol::DelimitedFrame& lli) {
    if (lli.status == kLoginOk) {
      enterSteadyState(true);
      return;
    }
    if (lli.status == kInvalidCredentials) {
      log().error(
          "Login failed: Invalid credentials. Please check your USERNAME "
          "and PASSWORD.");
      return;
    }
    engine().handleErrorResponse(fmt::format(
        "Login failed with status: {}. Retrying in 5 minutes...",
        lli.status));
  });

  const nlohmann::json payload = {
      {"CONM", 175},
      {"RTM", 24},
      {"ID", 0},
      {"PL", 1},
      {"NOM", credentials().username},
      {"PW", credentials().password},
      {"LT", nullptr},
      {"LANG", "fr"},
      {"DID", "0"},
      {"AID", "1760000000000000000"},
      {"KID", ""},
      {"REF", "https://empire.goodgamestudios.com"},
      {"GCI", ""},
      {"SID", 9},
      {"PLFID", 1},
  };
  engine().sendJson("lli", payload);
  log().info("Sent login command with username: {}", credentials().username);
}

}  // namespace client
}  // namespace realmlink
