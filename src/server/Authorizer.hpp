#ifndef __GM_AUTHORIZER_H__
#define __GM_AUTHORIZER_H__

#include "Headers.hpp"

namespace gm {
enum class AuthResult {
  AUTHORIZED,
  // The connection stays open but every event is refused
  INVALID_TOKEN,
  // The connection is dropped right away
  CROSS_ORIGIN,
};

/**
 * @brief Decides whether a client handshake may reach the debugger core.
 */
class Authorizer {
 public:
  virtual ~Authorizer() {}

  virtual AuthResult authorize(const ConnectRequest& request,
                               string* reason) = 0;
};

/**
 * @brief Accepts same-origin handshakes that carry the server token, or that
 * target a path on the allow-list.
 */
class TokenAuthorizer : public Authorizer {
 public:
  TokenAuthorizer(const string& _serverToken,
                  const vector<string>& _allowedPaths);

  virtual AuthResult authorize(const ConnectRequest& request, string* reason);

  /** @brief True when the Origin's host:port differs from the Host. */
  static bool isCrossOrigin(const string& origin, const string& host);

 protected:
  bool tokenMatches(const string& token);

  string serverToken;
  set<string> allowedPaths;
};
}  // namespace gm

#endif  // __GM_AUTHORIZER_H__
