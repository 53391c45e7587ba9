#pragma once

#include <string>

namespace twiper::auth {

/*
  OAuth 1.0a user-context credentials. Loaded once at startup.
*/
struct Credentials {
  std::string consumer_key;
  std::string consumer_secret;
  std::string access_token;
  std::string access_secret;
};

} // namespace twiper::auth
