// include/BridgeCoordinator.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include "ClientRegistry.hpp"
#include "SerialLink.hpp"

// Moves serial frames into the client fan-out and client payloads into the
// serial write path. Owns no resources of its own: the link and the registry
// are long-lived components passed in by the caller.
class BridgeCoordinator {
public:
    BridgeCoordinator(SerialLink& link, ClientRegistry& registry, SerialConfig config);
    ~BridgeCoordinator();

    BridgeCoordinator(const BridgeCoordinator&) = delete;
    BridgeCoordinator& operator=(const BridgeCoordinator&) = delete;

    // Opens the link and starts the reader. An open failure is returned and logged,
    // the bridge keeps serving clients with the link in Error.
    boost::system::error_code start();
    void stop();
    bool isRunning() const { return m_isRunning; }

    // Registers a new peer and queues the initial info message
    ClientHandle attachClient();
    void detachClient(const ClientHandle& client);
    // Binary payloads are written to the link, anything else gets a warning back
    boost::system::error_code handleClientMessage(const ClientHandle& client,
                                                  const std::string& payload, bool binary);

    boost::system::error_code reconnect();
    // Write path for the HTTP send endpoint
    boost::system::error_code sendData(const Frame& data);

    SerialLinkState linkStatus() const { return m_link.status(); }
    std::size_t clientCount() const { return m_registry.count(); }

private:
    void onSerialFrame(const FramePtr& frame);
    void announceLinkError(const ControlMessage& message);
    void announceIfLinkFailed(const std::string& reason);

    SerialLink& m_link;
    ClientRegistry& m_registry;
    SerialConfig m_config;
    std::mutex m_reconnectMutex;
    std::atomic<bool> m_isRunning{false};
    // One error broadcast per Error episode; cleared by a successful reconnect
    std::atomic<bool> m_errorAnnounced{false};
};
