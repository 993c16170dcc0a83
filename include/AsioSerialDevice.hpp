// include/AsioSerialDevice.hpp
#pragma once
#include "SerialDevice.hpp"
#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>
#include <atomic>

// SerialDevice on boost::asio::serial_port. Each blocking call issues one async
// operation and runs a private io_context for at most the timeout. Reads and
// writes use separate io_contexts (the write side on a dup of the handle) so a
// write timeout never cancels the pending read.
class AsioSerialDevice : public SerialDevice {
public:
    AsioSerialDevice();
    ~AsioSerialDevice() override;

    void open(const SerialConfig& config, boost::system::error_code& ec) override;
    void close(boost::system::error_code& ec) override;
    bool isOpen() const override { return m_port.is_open(); }

    std::size_t readSome(char* buffer, std::size_t size,
                         std::chrono::milliseconds timeout,
                         boost::system::error_code& ec) override;
    std::size_t write(const char* data, std::size_t size,
                      std::chrono::milliseconds timeout,
                      boost::system::error_code& ec) override;
    void cancel() override;

private:
    void applyOptions(const SerialConfig& config, boost::system::error_code& ec);
    void applyMarkSpaceParity(Parity parity, boost::system::error_code& ec);

    boost::asio::io_context m_readIo;
    boost::asio::io_context m_writeIo;
    boost::asio::serial_port m_port;       // reads, options
    boost::asio::serial_port m_writePort;  // writes
    std::atomic<bool> m_cancelled{false};
};
