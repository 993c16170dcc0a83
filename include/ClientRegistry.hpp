// include/ClientRegistry.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "BridgeErrors.hpp"
#include "ClientConnection.hpp"
#include "ControlMessage.hpp"

using ClientHandle = std::shared_ptr<ClientConnection>;

// The set of live WebSocket clients. Iteration takes a snapshot under the lock
// and delivers outside it, so registration never waits on a slow peer.
class ClientRegistry {
public:
    explicit ClientRegistry(std::size_t queueLimit = 256);

    ClientHandle registerClient();
    // `greeting` is queued before the client becomes visible to broadcasts
    ClientHandle registerClient(const ControlMessage& greeting);
    // RegistryError::AlreadyRemoved when the handle is not (or no longer) registered
    boost::system::error_code unregisterClient(const ClientHandle& handle);

    // Returns the number of delivery attempts (one per registered client)
    std::size_t broadcast(const FramePtr& frame);
    bool sendControl(const ClientHandle& handle, const ControlMessage& message);
    // Dropped while an earlier one is still waiting in that client's queue
    bool sendControlOnce(const ClientHandle& handle, const ControlMessage& message);
    std::size_t sendControlAll(const ControlMessage& message);

    std::size_t count() const;
    std::vector<ClientHandle> snapshot() const;

private:
    ClientHandle insert(ClientHandle client);

    mutable std::mutex m_mutex;
    std::unordered_map<ClientConnection::Id, ClientHandle> m_clients;
    std::atomic<ClientConnection::Id> m_nextId{1};
    const std::size_t m_queueLimit;
};
