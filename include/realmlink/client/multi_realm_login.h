#ifndef REALMLINK_CLIENT_MULTI_REALM_LOGIN_H
#define REALMLINK_CLIENT_MULTI_REALM_LOGIN_H

#include <functional>

#include "realmlink/client/login_machine.h"

namespace realmlink {
namespace client {

constexpr int kMultiRealmSuccess = 10005;
constexpr int kMultiRealmPlayerNotFound = 10010;

/**
 * Multi-realm servers: "core_lga" login. An unknown player is registered
 * with "core_reg" and logged in once more. Works over both the framed and
 * the NUL-delimited stream transport; the factory decides.
 */
class MultiRealmLogin : public LoginMachine {
 public:
  using LoginMachine::LoginMachine;

  // Source of the 0..99998 suffix of the registration e-mail
  void setMailSuffixSource(std::function<int()> source) {
    mail_suffix_ = std::move(source);
  }

 protected:
  void login() override;

 private:
  void sendLogin();
  void registerAccount();
  void loginAfterRegistration();

  std::function<int()> mail_suffix_;
};

}  // namespace client
}  // namespace realmlink

#endif  // REALMLINK_CLIENT_MULTI_REALM_LOGIN_H
