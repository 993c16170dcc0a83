// src/SerialLink.cpp
#include "SerialLink.hpp"
#include "Logger.h"
#include <boost/asio/error.hpp>
#include <algorithm>
#include <vector>

namespace asio = boost::asio;
using boost::system::error_code;

namespace {
const char* kPrefix = "uart";
// A zero read timeout would spin the reader
const std::chrono::milliseconds kMinReadSlice{10};
}

SerialLink::SerialLink(std::unique_ptr<SerialDevice> device, std::size_t readBufferSize)
    : m_device(std::move(device)), m_readBufferSize(std::max<std::size_t>(readBufferSize, 1)) {
}

SerialLink::~SerialLink() {
    close();
}

void SerialLink::setControlHandler(ControlHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_controlHandler = std::move(handler);
}

SerialLinkState SerialLink::status() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

bool SerialLink::isConnected() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.status == LinkStatus::Connected;
}

SerialConfig SerialLink::config() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state.config;
}

error_code SerialLink::open(const SerialConfig& config) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    return openLocked(config);
}

error_code SerialLink::openLocked(const SerialConfig& config) {
    closeLocked();

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state.config = config;
        m_state.status = LinkStatus::Connecting;
        m_state.lastError.clear();
        m_configured = true;
    }

    error_code ec;
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        m_device->open(config, ec);
    }

    if (ec) {
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_state.status = LinkStatus::Error;
            m_state.lastError = ec.message();
        }
        LOG_ERROR(kPrefix, "Serial open error: " + config.device + ": " + ec.message());
        return LinkError::OpenFailed;
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state.status = LinkStatus::Connected;
    }
    LOG_INFO(kPrefix, "Serial port opened: " + config.device + " @ "
             + std::to_string(config.baudRate) + " baud ("
             + std::to_string(config.byteSize) + parityToString(config.parity)
             + std::to_string(config.stopBits) + ")");
    return {};
}

void SerialLink::close() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    closeLocked();
}

void SerialLink::closeLocked() {
    stopReaderLocked();

    bool wasOpen = false;
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        if (m_device->isOpen()) {
            wasOpen = true;
            error_code ec;
            m_device->close(ec);
            if (ec) {
                LOG_ERROR(kPrefix, "Serial port close error: " + ec.message());
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state.status = LinkStatus::Disconnected;
    }
    if (wasOpen) {
        LOG_INFO(kPrefix, "Serial port closed: " + config().device);
    }
}

void SerialLink::stopReaderLocked() {
    if (!m_reader.joinable() && !m_readerActive) return;

    m_stopRequested = true;
    m_device->cancel();

    const bool self = m_reader.joinable() && m_reader.get_id() == std::this_thread::get_id();
    if (self) {
        // close() from inside onFrame: the loop exits on its own once we return
        m_reader.detach();
    } else {
        if (m_reader.joinable()) {
            m_reader.join();
        }
        // readLoop may also be driven by a caller-owned thread
        std::unique_lock<std::mutex> lock(m_readerMutex);
        m_readerDone.wait(lock, [this] { return !m_readerActive; });
    }
    m_stopRequested = false;
}

error_code SerialLink::reconnect() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    SerialConfig config;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!m_configured) {
            m_state.status = LinkStatus::Error;
            m_state.lastError = "No serial configuration to reconnect with";
            return LinkError::OpenFailed;
        }
        config = m_state.config;
    }
    LOG_INFO(kPrefix, "Reconnecting serial port " + config.device);
    return openLocked(config);
}

error_code SerialLink::startReader(FrameHandler onFrame) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    if (!isConnected()) {
        return LinkError::NotConnected;
    }
    if (m_readerActive) {
        return {};
    }
    if (m_reader.joinable()) {
        // previous reader already left after an I/O error
        m_reader.join();
    }
    m_stopRequested = false;
    m_reader = std::thread([this, onFrame = std::move(onFrame)]() {
        readLoop(onFrame);
    });
    return {};
}

void SerialLink::readLoop(const FrameHandler& onFrame) {
    bool expected = false;
    if (!m_readerActive.compare_exchange_strong(expected, true)) {
        LOG_ERROR(kPrefix, "Serial reader already running, refusing a second reader");
        return;
    }

    const auto timeout = std::max(config().readTimeout, kMinReadSlice);
    std::vector<char> buffer(m_readBufferSize);
    LOG_DEBUG(kPrefix, "Serial reader started");

    while (!m_stopRequested && isConnected()) {
        error_code ec;
        std::size_t length = m_device->readSome(buffer.data(), buffer.size(), timeout, ec);
        if (ec == asio::error::timed_out) {
            continue;
        }
        if (ec == asio::error::operation_aborted || (ec && m_stopRequested)) {
            break;
        }
        if (ec) {
            markError("Serial read error: " + ec.message());
            break;
        }
        if (length == 0 || !onFrame) {
            continue;
        }

        FramePtr frame = makeFrame(buffer.data(), length);
        Logger::instance().logData(kPrefix, "UART -> WS", *frame);
        try {
            onFrame(frame);
        } catch (const std::exception& e) {
            LOG_ERROR(kPrefix, std::string("Frame handler error: ") + e.what());
        }
    }

    LOG_DEBUG(kPrefix, "Serial reader stopped");
    {
        std::lock_guard<std::mutex> lock(m_readerMutex);
        m_readerActive = false;
    }
    m_readerDone.notify_all();
}

error_code SerialLink::write(const Frame& frame) {
    if (!isConnected()) {
        return LinkError::NotConnected;
    }

    error_code ec;
    std::size_t written = 0;
    std::size_t total = frame.size();
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        // close() may have won the race for the lock
        if (!isConnected()) {
            return LinkError::NotConnected;
        }
        written = m_device->write(frame.data(), frame.size(), config().writeTimeout, ec);
    }

    if (!ec) {
        Logger::instance().logData(kPrefix, "WS -> UART", frame);
        return {};
    }
    if (ec == asio::error::timed_out) {
        LOG_ERROR(kPrefix, "Serial write timed out after " + std::to_string(written)
                  + " of " + std::to_string(total) + " bytes");
        return LinkError::Timeout;
    }
    if (ec == asio::error::operation_aborted) {
        return LinkError::NotConnected;
    }
    markError("Serial write error: " + ec.message());
    return LinkError::IOError;
}

void SerialLink::markError(const std::string& reason) {
    SerialLinkState snapshot;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state.status != LinkStatus::Connected) {
            return;
        }
        m_state.status = LinkStatus::Error;
        m_state.lastError = reason;
        snapshot = m_state;
    }
    LOG_ERROR(kPrefix, reason);

    ControlHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = m_controlHandler;
    }
    if (handler) {
        handler(ControlMessage::error(reason, snapshot));
    }
}
