#include "GdbMuxServer.hpp"

namespace gm {
GdbMuxServer::GdbMuxServer(shared_ptr<SocketHandler> _socketHandler,
                           const SocketEndpoint& _serverEndpoint,
                           shared_ptr<ClientConnectionRegistry> _registry,
                           shared_ptr<EventGateway> _gateway)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      registry(_registry),
      gateway(_gateway),
      halt(false),
      handshakePool(new ThreadPool(8)) {
  socketHandler->listen(serverEndpoint);
}

GdbMuxServer::~GdbMuxServer() {
  halt = true;
  handshakePool.reset();
  clientThreads.joinAll();
}

void GdbMuxServer::run() {
  LOG(INFO) << "Listening on " << serverEndpoint;
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverPortFds = socketHandler->getEndpointFds(serverEndpoint);
  if (serverPortFds.empty()) {
    STFATAL << "No listening sockets for " << serverEndpoint;
  }
  for (int i : serverPortFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (!halt) {
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }

    for (int i : serverPortFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
  }

  LOG(INFO) << "Shutting down server";
  socketHandler->stopListening(serverEndpoint);
  handshakePool.reset();
  clientThreads.joinAll();
}

void GdbMuxServer::acceptNewConnection(int fd) {
  VLOG(1) << "Accepting connection";
  int clientFd = socketHandler->accept(fd);
  if (clientFd < 0) {
    return;
  }
  VLOG(1) << "Got client socket fd: " << clientFd;
  handshakePool->enqueue([this, clientFd]() { this->handshake(clientFd); });
}

void GdbMuxServer::handshake(int clientFd) {
  el::Helpers::setThreadName("server-handshake");
  string clientId;
  try {
    Packet packet;
    if (!socketHandler->readPacket(clientFd, &packet, true)) {
      throw std::runtime_error("Empty handshake packet");
    }
    if (packet.getHeader() != uint8_t(PacketType::CONNECT)) {
      throw std::runtime_error("Invalid header: expecting CONNECT but got " +
                               to_string(int(packet.getHeader())));
    }
    ConnectRequest request =
        stringToProto<ConnectRequest>(packet.getPayload());

    clientId = sole::uuid4().str();
    LOG(INFO) << "Got client " << clientId << " on fd " << clientFd;
    registry->addClient(clientId, clientFd);
    AuthResult result = gateway->handleConnect(clientId, request);
    if (result == AuthResult::CROSS_ORIGIN) {
      registry->removeClient(clientId);
      clientId.clear();
      socketHandler->writePacket(
          clientFd, Packet(uint8_t(PacketType::CONNECT_REJECTED), ""));
      socketHandler->close(clientFd);
      return;
    }
  } catch (const std::runtime_error& err) {
    LOG(WARNING) << "Error handling new client: " << err.what();
    if (!clientId.empty()) {
      registry->removeClient(clientId);
      gateway->handleDisconnect(clientId);
    }
    socketHandler->close(clientFd);
    return;
  }

  clientThreads.spawn("client-" + clientId.substr(0, 8),
                      [this, clientId, clientFd]() {
                        this->readClientEvents(clientId, clientFd);
                      });
}

void GdbMuxServer::readClientEvents(const string& clientId, int clientFd) {
  while (!halt) {
    fd_set rfd;
    FD_ZERO(&rfd);
    FD_SET(clientFd, &rfd);
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100000;
    int rc = select(clientFd + 1, &rfd, NULL, NULL, &tv);
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(rc);
    if (rc == 0) {
      continue;
    }
    try {
      Packet packet;
      if (!socketHandler->readPacket(clientFd, &packet, true)) {
        continue;
      }
      dispatchPacket(clientId, packet);
    } catch (const std::runtime_error& re) {
      LOG(INFO) << "Client " << clientId << " went away: " << re.what();
      break;
    }
  }

  registry->removeClient(clientId);
  gateway->handleDisconnect(clientId);
  socketHandler->close(clientFd);
}

void GdbMuxServer::dispatchPacket(const string& clientId,
                                  const Packet& packet) {
  if (packet.getHeader() != uint8_t(PacketType::EVENT)) {
    LOG(WARNING) << "Ignoring packet with header "
                 << int(packet.getHeader()) << " from " << clientId;
    return;
  }
  EventMessage message = stringToProto<EventMessage>(packet.getPayload());
  json payload = json::object();
  if (message.has_json_payload() && !message.json_payload().empty()) {
    try {
      payload = json::parse(message.json_payload());
    } catch (const json::parse_error& pe) {
      LOG(WARNING) << "Bad json from " << clientId << ": " << pe.what();
      json error;
      error["message"] = "Could not parse the payload of " + message.name();
      registry->emit(clientId, "server_error", error);
      return;
    }
  }
  gateway->handleEvent(clientId, message.name(), payload);
}
}  // namespace gm
