#include "PipeSocketHandler.hpp"

namespace gm {
PipeSocketHandler::PipeSocketHandler() {}

sockaddr_un PipeSocketHandler::pipeAddress(const string& pipePath) {
  sockaddr_un address;
  memset(&address, 0, sizeof(sockaddr_un));
  if (pipePath.length() >= sizeof(address.sun_path)) {
    throw runtime_error("Socket path too long: " + pipePath);
  }
  address.sun_family = AF_UNIX;
  strncpy(address.sun_path, pipePath.c_str(), sizeof(address.sun_path) - 1);
  return address;
}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  sockaddr_un remote = pipeAddress(endpoint.name());
  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  initSocket(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  int connectError = finishConnect(sockFd, CONNECT_TIMEOUT_SECONDS);
  if (connectError != 0) {
    LOG(INFO) << "Error connecting to " << endpoint << ": "
              << strerror(connectError);
    FATAL_FAIL(::close(sockFd));
    SetErrno(connectError);
    return -1;
  }

  VLOG(1) << "Connected to endpoint " << endpoint;
  addToActiveSockets(sockFd);
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local = pipeAddress(pipePath);
  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  addToActiveSockets(fd);
  initServerSocket(fd);
  // A stale socket file from an earlier run
  unlink(local.sun_path);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    close(fd);
    throw runtime_error(string("Error binding ") + pipePath + ": " +
                        strerror(localErrno));
  }
  FATAL_FAIL(::listen(fd, 5));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) == pipeServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a pipe without calling listen() "
               "first: "
            << pipePath;
  }
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  for (int sockFd : it->second) {
    close(sockFd);
  }
  pipeServerSockets.erase(it);
  unlink(pipePath.c_str());
}
}  // namespace gm
