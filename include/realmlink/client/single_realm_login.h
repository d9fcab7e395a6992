#ifndef REALMLINK_CLIENT_SINGLE_REALM_LOGIN_H
#define REALMLINK_CLIENT_SINGLE_REALM_LOGIN_H

#include "realmlink/client/login_machine.h"

namespace realmlink {
namespace client {

/**
 * Single-realm servers: "lli" login with the account name and password.
 * Status 21 means the credentials are wrong and nothing is retried.
 */
class SingleRealmLogin : public LoginMachine {
 public:
  using LoginMachine::LoginMachine;

 protected:
  void login() override;
};

}  // namespace client
}  // namespace realmlink

#endif  // REALMLINK_CLIENT_SINGLE_REALM_LOGIN_H
