#include "ClientConnectionRegistry.hpp"

namespace gm {
ClientConnectionRegistry::ClientConnectionRegistry(
    shared_ptr<SocketHandler> _socketHandler)
    : socketHandler(_socketHandler) {}

ClientConnectionRegistry::~ClientConnectionRegistry() {
  map<string, shared_ptr<ClientSocket>> remaining;
  {
    lock_guard<mutex> guard(registryMutex);
    remaining.swap(clients);
  }
  for (auto& it : remaining) {
    lock_guard<mutex> queueGuard(it.second->queueMutex);
    it.second->open = false;
    it.second->outbox.clear();
    it.second->queueCv.notify_all();
  }
  writers.joinAll();
}

void ClientConnectionRegistry::addClient(const string& clientId, int fd) {
  auto client = make_shared<ClientSocket>(fd);
  {
    lock_guard<mutex> guard(registryMutex);
    if (clients.find(clientId) != clients.end()) {
      STFATAL << "Tried to add a client id twice: " << clientId;
    }
    clients[clientId] = client;
  }
  writers.spawn("writer-" + clientId.substr(0, 8), [this, clientId, client]() {
    this->drainOutbox(clientId, client);
  });
}

void ClientConnectionRegistry::removeClient(const string& clientId) {
  shared_ptr<ClientSocket> client;
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = clients.find(clientId);
    if (it == clients.end()) {
      return;
    }
    client = it->second;
    clients.erase(it);
  }
  stopWriter(client);
}

void ClientConnectionRegistry::stopWriter(shared_ptr<ClientSocket> client) {
  unique_lock<mutex> lock(client->queueMutex);
  client->closing = true;
  client->queueCv.notify_all();
  client->queueCv.wait(lock, [client]() { return client->writerDone; });
}

void ClientConnectionRegistry::drainOutbox(const string& clientId,
                                           shared_ptr<ClientSocket> client) {
  while (true) {
    Packet packet;
    {
      unique_lock<mutex> lock(client->queueMutex);
      client->queueCv.wait(lock, [client]() {
        return !client->open || client->closing || !client->outbox.empty();
      });
      if (!client->open || client->outbox.empty()) {
        break;
      }
      packet = client->outbox.front();
      client->outbox.pop_front();
    }
    try {
      socketHandler->writePacket(client->fd, packet);
    } catch (const std::runtime_error& ex) {
      LOG(INFO) << "Could not write to client " << clientId << ": "
                << ex.what();
      lock_guard<mutex> lock(client->queueMutex);
      client->open = false;
      client->outbox.clear();
      break;
    }
  }
  lock_guard<mutex> lock(client->queueMutex);
  client->writerDone = true;
  client->queueCv.notify_all();
}

bool ClientConnectionRegistry::hasClient(const string& clientId) {
  lock_guard<mutex> guard(registryMutex);
  return clients.find(clientId) != clients.end();
}

vector<string> ClientConnectionRegistry::getClientIds() {
  lock_guard<mutex> guard(registryMutex);
  vector<string> ids;
  for (auto& it : clients) {
    ids.push_back(it.first);
  }
  return ids;
}

shared_ptr<ClientConnectionRegistry::ClientSocket>
ClientConnectionRegistry::getClient(const string& clientId) {
  lock_guard<mutex> guard(registryMutex);
  auto it = clients.find(clientId);
  if (it == clients.end()) {
    return shared_ptr<ClientSocket>();
  }
  return it->second;
}

void ClientConnectionRegistry::sendPacket(const string& clientId,
                                          const Packet& packet) {
  auto client = getClient(clientId);
  if (client.get() == NULL) {
    VLOG(1) << "Dropping packet for departed client " << clientId;
    return;
  }
  lock_guard<mutex> lock(client->queueMutex);
  if (!client->open || client->closing) {
    return;
  }
  if (int(client->outbox.size()) >= MAX_QUEUED_PACKETS) {
    LOG(WARNING) << "Client " << clientId << " fell " << MAX_QUEUED_PACKETS
                 << " packets behind, dropping its stream";
    client->open = false;
    client->outbox.clear();
  } else {
    client->outbox.push_back(packet);
  }
  client->queueCv.notify_all();
}

void ClientConnectionRegistry::emit(const string& room, const string& event,
                                    const json& payload) {
  VLOG(2) << "Emitting " << event << " to " << room;
  sendPacket(room, makeEventPacket(event, payload));
}
}  // namespace gm
