#include "realmlink/client/multi_realm_login.h"

#include <random>

#include <fmt/format.h>

namespace realmlink {
namespace client {

namespace {

int randomMailSuffix() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<int> dist(0, 99998);
  return dist(rng);
}

}  // namespace

void MultiRealmLogin::login() {
  expectDelimited("core_lga", [this](const protocol::DelimitedFrame& lga) {
    if (lga.status == kMultiRealmSuccess) {
      enterSteadyState(false);
      return;
    }
    if (lga.status == kMultiRealmPlayerNotFound) {
      log().warning("Login failed: Register a new account...");
      registerAccount();
      return;
    }
    engine().handleErrorResponse(fmt::format(
        "Login failed with status: {}. Retrying in 5 minutes...", lga.status));
  });
  sendLogin();
  log().info("Sent login command with username: {}", credentials().username);
}

void MultiRealmLogin::registerAccount() {
  expectDelimited("core_reg", [this](const protocol::DelimitedFrame& reg) {
    if (reg.status != kMultiRealmSuccess) {
      engine().handleErrorResponse(fmt::format(
          "Registration failed with status: {}. Retrying in 5 minutes...",
          reg.status));
      return;
    }
    log().info("Registration successful, proceeding to login...");
    loginAfterRegistration();
  });

  const int suffix = mail_suffix_ ? mail_suffix_() : randomMailSuffix();
  const nlohmann::json payload = {
      {"PN", credentials().username},
      {"PW", credentials().password},
      {"MAIL", fmt::format("{}-{}@mail.com", credentials().username, suffix)},
      {"LANG", "fr"},
      {"AID", "1760000000000000000"},
      {"DID", "5"},
      {"PLFID", "3"},
      {"ADID", "null"},
      {"AFUID", "appsFlyerUID"},
      {"IDFV", "null"},
      {"REF", ""},
  };
  engine().sendJson("core_reg", payload);
}

void MultiRealmLogin::loginAfterRegistration() {
  expectDelimited("core_lga", [this](const protocol::DelimitedFrame& lga) {
    if (lga.status == kMultiRealmSuccess) {
      enterSteadyState(false);
      return;
    }
    engine().handleErrorResponse(fmt::format(
        "Login after registration failed with status: {}. Retrying in 5 "
        "minutes...",
        lga.status));
  });
  sendLogin();
}

void MultiRealmLogin::sendLogin() {
  const nlohmann::json payload = {
      {"NM", credentials().username},
      {"PW", credentials().password},
      {"L", "fr"},
      {"AID", "1760000000000000000"},
      {"DID", "5"},
      {"PLFID", "3"},
      {"ADID", "null"},
      {"AFUID", "ggetracker"},
      {"IDFV", "null"},
  };
  engine().sendJson("core_lga", payload);
}

}  // namespace client
}  // namespace realmlink
