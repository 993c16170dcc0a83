// include/SerialDevice.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include "BridgeConfig.hpp"

// Blocking access to one serial device. readSome and write may run on different
// threads at the same time; open/close are serialized by the owner.
class SerialDevice {
public:
    virtual ~SerialDevice() = default;

    virtual void open(const SerialConfig& config, boost::system::error_code& ec) = 0;
    virtual void close(boost::system::error_code& ec) = 0;
    virtual bool isOpen() const = 0;

    // Waits up to `timeout` for data. Returns 0 with ec == asio::error::timed_out
    // when nothing arrived, or 0 with ec == asio::error::operation_aborted after cancel().
    virtual std::size_t readSome(char* buffer, std::size_t size,
                                 std::chrono::milliseconds timeout,
                                 boost::system::error_code& ec) = 0;

    // Writes the whole buffer or fails; asio::error::timed_out when the deadline passes.
    virtual std::size_t write(const char* data, std::size_t size,
                              std::chrono::milliseconds timeout,
                              boost::system::error_code& ec) = 0;

    // Wakes a blocked readSome from another thread.
    virtual void cancel() = 0;
};
