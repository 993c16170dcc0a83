// src/ClientRegistry.cpp
#include "ClientRegistry.hpp"
#include "Logger.h"

namespace {
const char* kPrefix = "ws";
}

ClientRegistry::ClientRegistry(std::size_t queueLimit) : m_queueLimit(queueLimit) {}

ClientHandle ClientRegistry::registerClient() {
    return insert(std::make_shared<ClientConnection>(m_nextId++, m_queueLimit));
}

ClientHandle ClientRegistry::registerClient(const ControlMessage& greeting) {
    auto client = std::make_shared<ClientConnection>(m_nextId++, m_queueLimit);
    client->pushControl(greeting);
    return insert(client);
}

ClientHandle ClientRegistry::insert(ClientHandle client) {
    std::size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_clients.emplace(client->id(), client);
        active = m_clients.size();
    }
    LOG_INFO(kPrefix, "Client #" + std::to_string(client->id()) + " registered, active clients: "
             + std::to_string(active));
    return client;
}

boost::system::error_code ClientRegistry::unregisterClient(const ClientHandle& handle) {
    if (!handle) {
        return RegistryError::AlreadyRemoved;
    }

    std::size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_clients.find(handle->id());
        if (it == m_clients.end() || it->second != handle) {
            return RegistryError::AlreadyRemoved;
        }
        m_clients.erase(it);
        active = m_clients.size();
    }
    handle->close();
    LOG_INFO(kPrefix, "Client #" + std::to_string(handle->id()) + " removed, active clients: "
             + std::to_string(active));
    return {};
}

std::vector<ClientHandle> ClientRegistry::snapshot() const {
    std::vector<ClientHandle> clients;
    std::lock_guard<std::mutex> lock(m_mutex);
    clients.reserve(m_clients.size());
    for (const auto& entry : m_clients) {
        clients.push_back(entry.second);
    }
    return clients;
}

std::size_t ClientRegistry::broadcast(const FramePtr& frame) {
    // 创建临时副本避免迭代器失效
    auto clients = snapshot();
    for (const auto& client : clients) {
        if (!client->pushFrame(frame) && !client->closed()) {
            LOG_DEBUG(kPrefix, "Frame dropped for slow client #" + std::to_string(client->id()));
        }
    }
    return clients.size();
}

bool ClientRegistry::sendControl(const ClientHandle& handle, const ControlMessage& message) {
    if (!handle) return false;
    return handle->pushControl(message);
}

bool ClientRegistry::sendControlOnce(const ClientHandle& handle, const ControlMessage& message) {
    if (!handle) return false;
    return handle->pushControlOnce(message);
}

std::size_t ClientRegistry::sendControlAll(const ControlMessage& message) {
    std::size_t delivered = 0;
    for (const auto& client : snapshot()) {
        if (client->pushControl(message)) {
            ++delivered;
        }
    }
    return delivered;
}

std::size_t ClientRegistry::count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_clients.size();
}
