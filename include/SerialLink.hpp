// include/SerialLink.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include "BridgeErrors.hpp"
#include "Common.h"
#include "ControlMessage.hpp"
#include "SerialDevice.hpp"
#include "SerialLinkState.hpp"

// Exclusive owner of the serial device.
//
// Lifecycle transitions (open/close/reconnect) are serialized by one mutex and
// at most one reader runs at a time; close() and reconnect() wait for it to exit.
// Writes are serialized by a separate mutex so a reader blocked in readSome never
// holds up a client write.
class SerialLink {
public:
    using FrameHandler = std::function<void(const FramePtr&)>;
    using ControlHandler = std::function<void(const ControlMessage&)>;

    explicit SerialLink(std::unique_ptr<SerialDevice> device, std::size_t readBufferSize = 4096);
    ~SerialLink();

    SerialLink(const SerialLink&) = delete;
    SerialLink& operator=(const SerialLink&) = delete;

    boost::system::error_code open(const SerialConfig& config);
    void close();
    boost::system::error_code reconnect();

    // Runs on the calling thread until close(), an I/O error or a stop request
    void readLoop(const FrameHandler& onFrame);
    // readLoop on a dedicated worker thread; fails with NotConnected unless Connected
    boost::system::error_code startReader(FrameHandler onFrame);
    bool readerActive() const { return m_readerActive; }

    boost::system::error_code write(const Frame& frame);

    // Called from the reader thread when a hard read error degrades the link
    void setControlHandler(ControlHandler handler);

    SerialLinkState status() const;
    bool isConnected() const;
    SerialConfig config() const;

private:
    boost::system::error_code openLocked(const SerialConfig& config);
    void closeLocked();
    void stopReaderLocked();
    void markError(const std::string& reason);

    std::unique_ptr<SerialDevice> m_device;
    std::size_t m_readBufferSize;

    mutable std::mutex m_lifecycleMutex;  // open/close/reconnect
    mutable std::mutex m_stateMutex;      // m_state
    std::mutex m_writeMutex;

    SerialLinkState m_state;
    bool m_configured = false;

    std::thread m_reader;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_readerActive{false};
    std::mutex m_readerMutex;
    std::condition_variable m_readerDone;

    std::mutex m_handlerMutex;
    ControlHandler m_controlHandler;
};
