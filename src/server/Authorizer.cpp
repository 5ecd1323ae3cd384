#include "Authorizer.hpp"

namespace gm {
TokenAuthorizer::TokenAuthorizer(const string& _serverToken,
                                 const vector<string>& _allowedPaths)
    : serverToken(_serverToken),
      allowedPaths(_allowedPaths.begin(), _allowedPaths.end()) {}

bool TokenAuthorizer::isCrossOrigin(const string& origin, const string& host) {
  if (origin.empty() || host.empty()) {
    return false;
  }
  string originHost = origin;
  auto schemeEnd = originHost.find("://");
  if (schemeEnd != string::npos) {
    originHost = originHost.substr(schemeEnd + 3);
  }
  auto pathStart = originHost.find('/');
  if (pathStart != string::npos) {
    originHost = originHost.substr(0, pathStart);
  }
  return originHost != host;
}

bool TokenAuthorizer::tokenMatches(const string& token) {
  if (serverToken.empty() || token.length() != serverToken.length()) {
    return false;
  }
  return sodium_memcmp(token.c_str(), serverToken.c_str(), token.length()) ==
         0;
}

AuthResult TokenAuthorizer::authorize(const ConnectRequest& request,
                                      string* reason) {
  if (isCrossOrigin(request.origin(), request.host())) {
    LOG(WARNING) << "Received cross origin handshake from " << request.origin()
                 << ". Aborting";
    *reason = "Cross origin request rejected";
    return AuthResult::CROSS_ORIGIN;
  }
  if (request.has_path() && allowedPaths.count(request.path())) {
    return AuthResult::AUTHORIZED;
  }
  if (!request.has_token() || request.token().empty()) {
    LOG(WARNING) << "Received invalid csrf token";
    *reason = "Received invalid csrf token";
    return AuthResult::INVALID_TOKEN;
  }
  if (!tokenMatches(request.token())) {
    VLOG(1) << "Received a csrf token that does not match";
    *reason = "Session expired. Please refresh this webpage.";
    return AuthResult::INVALID_TOKEN;
  }
  return AuthResult::AUTHORIZED;
}
}  // namespace gm
