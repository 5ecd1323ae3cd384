#include "TcpSocketHandler.hpp"

namespace gm {
TcpSocketHandler::TcpSocketHandler(int _connectTimeoutSeconds)
    : connectTimeoutSeconds(_connectTimeoutSeconds) {}

int TcpSocketHandler::connectToAddress(const addrinfo *address,
                                       const SocketEndpoint &endpoint,
                                       int *error) {
  int sockFd = socket(address->ai_family, address->ai_socktype,
                      address->ai_protocol);
  if (sockFd == -1) {
    *error = errno;
    LOG(INFO) << "Error creating socket: " << strerror(*error);
    return -1;
  }
  setBlocking(sockFd, false);
  if (::connect(sockFd, address->ai_addr, address->ai_addrlen) == -1 &&
      errno != EINPROGRESS) {
    *error = errno;
  } else {
    *error = finishConnect(sockFd, connectTimeoutSeconds);
  }
  if (*error != 0) {
    LOG(INFO) << "Could not connect to " << endpoint << ": "
              << strerror(*error);
    ::close(sockFd);
    return -1;
  }
  return sockFd;
}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_ADDRCONFIG;
  string portname = to_string(endpoint.port());

  addrinfo *results = NULL;
  int rc = getaddrinfo(endpoint.name().c_str(), portname.c_str(), &hints,
                       &results);
  if (rc != 0) {
    LOG(INFO) << "Could not resolve " << endpoint << ": " << gai_strerror(rc);
    if (results) {
      freeaddrinfo(results);
    }
    errno = EHOSTUNREACH;
    return -1;
  }

  int sockFd = -1;
  int lastError = ECONNREFUSED;
  // First address that answers wins
  for (addrinfo *p = results; p != NULL && sockFd == -1; p = p->ai_next) {
    sockFd = connectToAddress(p, endpoint, &lastError);
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    errno = lastError;
    return -1;
  }
  VLOG(1) << "Connected to " << endpoint << " on fd " << sockFd;
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) != portServerSockets.end()) {
    STFATAL << "Tried to listen twice on the same port";
  }

  addrinfo hints, *servinfo, *p;
  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  std::string portname = std::to_string(port);
  const char *bindName = NULL;
  if (endpoint.has_name() && !endpoint.name().empty()) {
    bindName = endpoint.name().c_str();
  }

  int rc = getaddrinfo(bindName, portname.c_str(), &hints, &servinfo);
  if (rc != 0) {
    stringstream oss;
    oss << "Error getting address info for " << endpoint << ": "
        << gai_strerror(rc);
    throw std::runtime_error(oss.str());
  }

  set<int> serverSockets;
  for (p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd;
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    addToActiveSockets(sockFd);
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      // IPv4 gets its own socket from the next addrinfo entry
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      stringstream oss;
      oss << "Error binding port " << port << ": " << errno << " "
          << strerror(errno);
      string s = oss.str();
      LOG(ERROR) << s;
      close(sockFd);
      for (int fd : serverSockets) {
        close(fd);
      }
      freeaddrinfo(servinfo);
      throw std::runtime_error(s.c_str());
    }

    FATAL_FAIL(::listen(sockFd, 32));
    LOG(INFO) << "Listening on " << endpoint << "/" << p->ai_family;
    serverSockets.insert(sockFd);
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    throw std::runtime_error("Could not bind to any interface");
  }

  portServerSockets[port] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) == portServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a port without calling listen() "
               "first";
  }
  return portServerSockets[port];
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  auto it = portServerSockets.find(port);
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to stop listening to a port that we weren't listening on";
  }
  for (int sockFd : it->second) {
    close(sockFd);
  }
  portServerSockets.erase(it);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace gm
