// src/AsioSerialDevice.cpp
#include "AsioSerialDevice.hpp"
#include <cerrno>
#include <termios.h>
#include <unistd.h>

namespace asio = boost::asio;
using boost::system::error_code;

namespace {
error_code lastError() {
    return error_code(errno, boost::system::system_category());
}
}

AsioSerialDevice::AsioSerialDevice() : m_port(m_readIo), m_writePort(m_writeIo) {}

AsioSerialDevice::~AsioSerialDevice() {
    error_code ec;
    close(ec);
}

void AsioSerialDevice::open(const SerialConfig& config, error_code& ec) {
    ec.clear();
    if (m_port.is_open()) {
        close(ec);
        if (ec) return;
    }
    m_cancelled = false;
    // run cancel requests left over from the previous session against the closed port
    m_readIo.restart();
    m_readIo.poll();

    m_port.open(config.device, ec);
    if (ec) return;

    applyOptions(config, ec);
    if (ec) {
        error_code ignored;
        m_port.close(ignored);
        return;
    }

    int writeHandle = ::dup(m_port.native_handle());
    if (writeHandle < 0) {
        ec = lastError();
    } else {
        m_writePort.assign(writeHandle, ec);
        if (ec) ::close(writeHandle);
    }
    if (ec) {
        error_code ignored;
        m_port.close(ignored);
    }
}

void AsioSerialDevice::applyOptions(const SerialConfig& config, error_code& ec) {
    using base = asio::serial_port_base;

    m_port.set_option(base::baud_rate(config.baudRate), ec);
    if (ec) return;
    m_port.set_option(base::character_size(config.byteSize), ec);
    if (ec) return;
    m_port.set_option(base::stop_bits(config.stopBits == 2 ? base::stop_bits::two
                                                            : base::stop_bits::one), ec);
    if (ec) return;
    m_port.set_option(base::flow_control(base::flow_control::none), ec);
    if (ec) return;

    switch (config.parity) {
        case Parity::None:
            m_port.set_option(base::parity(base::parity::none), ec);
            break;
        case Parity::Even:
            m_port.set_option(base::parity(base::parity::even), ec);
            break;
        case Parity::Odd:
            m_port.set_option(base::parity(base::parity::odd), ec);
            break;
        case Parity::Mark:
        case Parity::Space:
            applyMarkSpaceParity(config.parity, ec);
            break;
    }
}

// serial_port_base::parity has no mark/space, go through termios
void AsioSerialDevice::applyMarkSpaceParity(Parity parity, error_code& ec) {
#ifdef CMSPAR
    termios tio{};
    int fd = m_port.native_handle();
    if (::tcgetattr(fd, &tio) != 0) {
        ec = lastError();
        return;
    }
    tio.c_iflag |= INPCK;
    tio.c_iflag &= ~IGNPAR;
    tio.c_cflag |= PARENB | CMSPAR;
    if (parity == Parity::Mark) {
        tio.c_cflag |= PARODD;
    } else {
        tio.c_cflag &= ~PARODD;
    }
    if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
        ec = lastError();
    }
#else
    (void)parity;
    ec = asio::error::operation_not_supported;
#endif
}

void AsioSerialDevice::close(error_code& ec) {
    ec.clear();
    if (m_writePort.is_open()) {
        m_writePort.close(ec);
    }
    if (m_port.is_open()) {
        error_code readEc;
        m_port.close(readEc);
        if (!ec) ec = readEc;
    }
}

void AsioSerialDevice::cancel() {
    m_cancelled = true;
    // m_port belongs to whichever thread is running m_readIo
    asio::post(m_readIo, [this]() {
        error_code ignored;
        m_port.cancel(ignored);
    });
}

std::size_t AsioSerialDevice::readSome(char* buffer, std::size_t size,
                                       std::chrono::milliseconds timeout, error_code& ec) {
    ec.clear();
    if (!m_port.is_open()) {
        ec = asio::error::bad_descriptor;
        return 0;
    }
    if (m_cancelled) {
        ec = asio::error::operation_aborted;
        return 0;
    }

    bool done = false;
    std::size_t length = 0;
    m_readIo.restart();
    m_port.async_read_some(asio::buffer(buffer, size),
        [&](const error_code& error, std::size_t bytes_transferred) {
            ec = error;
            length = bytes_transferred;
            done = true;
        });
    m_readIo.run_for(timeout);

    if (!done) {
        error_code ignored;
        m_port.cancel(ignored);
        m_readIo.restart();
        m_readIo.run();
    }
    // aborted by our own deadline rather than by cancel()
    if (ec == asio::error::operation_aborted && !m_cancelled) {
        ec = asio::error::timed_out;
    }
    return length;
}

std::size_t AsioSerialDevice::write(const char* data, std::size_t size,
                                    std::chrono::milliseconds timeout, error_code& ec) {
    ec.clear();
    if (!m_writePort.is_open()) {
        ec = asio::error::bad_descriptor;
        return 0;
    }

    bool done = false;
    std::size_t written = 0;
    m_writeIo.restart();
    asio::async_write(m_writePort, asio::buffer(data, size),
        [&](const error_code& error, std::size_t bytes_transferred) {
            ec = error;
            written = bytes_transferred;
            done = true;
        });
    m_writeIo.run_for(timeout);

    if (!done) {
        error_code ignored;
        m_writePort.cancel(ignored);
        m_writeIo.restart();
        m_writeIo.run();
        if (ec == asio::error::operation_aborted) {
            ec = asio::error::timed_out;
        }
    }
    return written;
}
