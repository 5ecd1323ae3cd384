#include "Authorizer.hpp"
#include "TestHeaders.hpp"

using namespace gm;

namespace {
ConnectRequest makeRequest(const string& token) {
  ConnectRequest request;
  request.set_token(token);
  request.set_origin("http://127.0.0.1:5000");
  request.set_host("127.0.0.1:5000");
  return request;
}
}  // namespace

TEST_CASE("Origin comparison", "[Authorizer]") {
  REQUIRE_FALSE(
      TokenAuthorizer::isCrossOrigin("http://localhost:5000", "localhost:5000"));
  REQUIRE_FALSE(TokenAuthorizer::isCrossOrigin("https://localhost:5000/dash",
                                               "localhost:5000"));
  REQUIRE(
      TokenAuthorizer::isCrossOrigin("http://evil.com:5000", "localhost:5000"));
  REQUIRE(
      TokenAuthorizer::isCrossOrigin("http://localhost:5001", "localhost:5000"));
  // Non-browser clients send neither header
  REQUIRE_FALSE(TokenAuthorizer::isCrossOrigin("", "localhost:5000"));
  REQUIRE_FALSE(TokenAuthorizer::isCrossOrigin("http://localhost:5000", ""));
}

TEST_CASE("Tokens are checked", "[Authorizer]") {
  TokenAuthorizer authorizer("s3cret", {});
  string reason;

  REQUIRE(authorizer.authorize(makeRequest("s3cret"), &reason) ==
          AuthResult::AUTHORIZED);

  REQUIRE(authorizer.authorize(makeRequest("s3cre7"), &reason) ==
          AuthResult::INVALID_TOKEN);
  REQUIRE(reason == "Session expired. Please refresh this webpage.");

  REQUIRE(authorizer.authorize(makeRequest("s3cret-longer"), &reason) ==
          AuthResult::INVALID_TOKEN);

  reason.clear();
  REQUIRE(authorizer.authorize(makeRequest(""), &reason) ==
          AuthResult::INVALID_TOKEN);
  REQUIRE(reason == "Received invalid csrf token");

  ConnectRequest noToken = makeRequest("");
  noToken.clear_token();
  REQUIRE(authorizer.authorize(noToken, &reason) == AuthResult::INVALID_TOKEN);
  REQUIRE(reason == "Received invalid csrf token");
}

TEST_CASE("An empty server token accepts nothing", "[Authorizer]") {
  TokenAuthorizer authorizer("", {});
  string reason;
  REQUIRE(authorizer.authorize(makeRequest("anything"), &reason) ==
          AuthResult::INVALID_TOKEN);
}

TEST_CASE("Allow-listed paths skip the token", "[Authorizer]") {
  TokenAuthorizer authorizer("s3cret", {"/dashboard"});
  string reason;
  ConnectRequest request = makeRequest("");
  request.set_path("/dashboard");
  REQUIRE(authorizer.authorize(request, &reason) == AuthResult::AUTHORIZED);

  request.set_path("/gdb");
  REQUIRE(authorizer.authorize(request, &reason) == AuthResult::INVALID_TOKEN);
}

TEST_CASE("Cross origin handshakes are rejected first", "[Authorizer]") {
  TokenAuthorizer authorizer("s3cret", {"/dashboard"});
  string reason;
  ConnectRequest request = makeRequest("s3cret");
  request.set_origin("http://evil.com");
  request.set_path("/dashboard");
  REQUIRE(authorizer.authorize(request, &reason) == AuthResult::CROSS_ORIGIN);
  REQUIRE(reason == "Cross origin request rejected");
}
