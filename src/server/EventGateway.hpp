#ifndef __GM_EVENT_GATEWAY_H__
#define __GM_EVENT_GATEWAY_H__

#include "Authorizer.hpp"
#include "EventSink.hpp"
#include "OutputRelay.hpp"
#include "RemoteSessionController.hpp"
#include "SessionManager.hpp"

namespace gm {
/**
 * @brief Turns inbound client events into registry and remote session
 * operations, and addresses the replies to the caller's room.
 *
 * Only clients whose handshake was authorized get past `handleEvent`.
 */
class EventGateway {
 public:
  EventGateway(shared_ptr<SessionManager> _manager,
               shared_ptr<RemoteSessionController> _remote,
               shared_ptr<OutputRelay> _relay,
               shared_ptr<Authorizer> _authorizer,
               shared_ptr<EventSink> _sink, const string& _defaultGdbCommand);

  /**
   * @brief Authorizes the handshake and attaches the client to a new or
   * existing debug session.
   */
  AuthResult handleConnect(const string& clientId,
                           const ConnectRequest& request);
  void handleEvent(const string& clientId, const string& name,
                   const json& payload);
  /** @brief Transport closed: silent cleanup of everything the client held. */
  void handleDisconnect(const string& clientId);

  bool isAuthorized(const string& clientId);

 protected:
  typedef void (EventGateway::*EventHandler)(const string&, const json&);

  void onPtyInteraction(const string& clientId, const json& payload);
  void onRunGdbCommand(const string& clientId, const json& payload);
  void onSshConnect(const string& clientId, const json& payload);
  void onSshCommand(const string& clientId, const json& payload);
  void onSshCommandInput(const string& clientId, const json& payload);
  void onSshShellStart(const string& clientId, const json& payload);
  void onSshShellInput(const string& clientId, const json& payload);
  void onSshShellStop(const string& clientId, const json& payload);
  void onSshDisconnect(const string& clientId, const json& payload);
  void onKillSession(const string& clientId, const json& payload);
  void onDashboardData(const string& clientId, const json& payload);

  shared_ptr<SessionManager> manager;
  shared_ptr<RemoteSessionController> remote;
  shared_ptr<OutputRelay> relay;
  shared_ptr<Authorizer> authorizer;
  shared_ptr<EventSink> sink;
  string defaultGdbCommand;

  map<string, EventHandler> handlers;
  mutex authorizedMutex;
  set<string> authorizedClients;
};
}  // namespace gm

#endif  // __GM_EVENT_GATEWAY_H__
