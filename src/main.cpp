// src/main.cpp
#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>
#include "AsioSerialDevice.hpp"
#include "BridgeConfig.hpp"
#include "BridgeCoordinator.hpp"
#include "BridgeServer.hpp"
#include "ClientRegistry.hpp"
#include "Logger.h"
#include "SerialLink.hpp"

namespace po = boost::program_options;

namespace {

// command line option -> settings key
const std::vector<std::pair<std::string, std::string>> kCliKeys = {
    {"host", "http_host"},
    {"port", "http_port"},
    {"threads", "http_io_threads"},
    {"device", "uart_port"},
    {"baud", "uart_baudrate"},
    {"bytesize", "uart_bytesize"},
    {"stopbits", "uart_stopbits"},
    {"parity", "uart_parity"},
    {"read-timeout", "uart_timeout"},
    {"write-timeout", "uart_write_timeout"},
    {"ping-interval", "ws_ping_interval"},
    {"ping-timeout", "ws_ping_timeout"},
    {"max-size", "ws_max_size"},
    {"queue-limit", "ws_queue_limit"},
    {"log-level", "log_level"},
    {"log-file", "log_file"}
};

} // namespace

int main(int argc, char* argv[]) {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Show help")
        ("config,c", po::value<std::string>(), "JSON settings file")
        ("host", po::value<std::string>(), "HTTP/WebSocket listen address (default 0.0.0.0)")
        ("port,p", po::value<std::string>(), "HTTP/WebSocket port (default 8000)")
        ("threads", po::value<std::string>(), "Network I/O threads (default 2)")
        ("device,d", po::value<std::string>(), "Serial device (default /dev/ttyUSB0)")
        ("baud,b", po::value<std::string>(), "Baud rate (default 115200)")
        ("bytesize", po::value<std::string>(), "Data bits 5-8 (default 8)")
        ("stopbits", po::value<std::string>(), "Stop bits 1-2 (default 1)")
        ("parity", po::value<std::string>(), "Parity N/E/O/M/S (default N)")
        ("read-timeout", po::value<std::string>(), "Serial read timeout in seconds (default 1.0)")
        ("write-timeout", po::value<std::string>(), "Serial write timeout in seconds (default 1.0)")
        ("ping-interval", po::value<std::string>(), "WebSocket ping interval in seconds (default 30)")
        ("ping-timeout", po::value<std::string>(), "WebSocket pong timeout in seconds (default 10)")
        ("max-size", po::value<std::string>(), "Max WebSocket message size in bytes")
        ("queue-limit", po::value<std::string>(), "Frames buffered per slow client (default 256)")
        ("log-level", po::value<std::string>(), "DEBUG, INFO, WARNING, ERROR or CRITICAL")
        ("log-file", po::value<std::string>(), "Also append log lines to this file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n" << desc << "\n";
        return 1;
    }

    if (vm.count("help")) {
        std::cout << "Usage: uart_ws_bridge [options]\n"
                  << "Settings are read from the --config file, then the environment "
                     "(UART_PORT, HTTP_PORT, ...), then these options.\n"
                  << desc << "\n";
        return 0;
    }

    RawSettings settings;
    try {
        if (vm.count("config")) {
            mergeSettings(settings, loadSettingsFile(vm["config"].as<std::string>()));
        }
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    mergeEnvironment(settings);
    for (const auto& option : kCliKeys) {
        if (vm.count(option.first)) {
            settings[option.second] = vm[option.first].as<std::string>();
        }
    }

    std::vector<std::string> warnings;
    ConfigResult result = validateConfig(settings, &warnings);
    if (const auto* error = std::get_if<ValidationError>(&result)) {
        std::cerr << error->message() << "\n";
        return 2;
    }
    const AppConfig config = std::get<AppConfig>(result);

    try {
        Logger::instance().configure(config.logging.level, config.logging.file);
        for (const auto& warning : warnings) {
            LOG_WARNING("main", warning);
        }
        LOG_INFO("main", "Starting UART WebSocket Bridge");
        LOG_INFO("main", "Configuration: " + configToJson(config).dump());

        SerialLink link(std::make_unique<AsioSerialDevice>());
        ClientRegistry registry(config.websocket.outboundQueueLimit);
        BridgeCoordinator coordinator(link, registry, config.serial);

        boost::asio::io_context io(static_cast<int>(config.http.ioThreads));
        BridgeServer server(io, coordinator, config);

        // An unavailable UART is not fatal: clients and /api/uart/reconnect still work
        if (auto ec = coordinator.start()) {
            LOG_WARNING("main", "Continuing without UART: " + ec.message());
        }
        server.start();

        boost::asio::steady_timer shutdownTimer(io);
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            LOG_INFO("main", "Received signal " + std::to_string(signo) + ", shutting down");
            server.stop();
            coordinator.stop();
            // give sessions a moment to send their close frames
            shutdownTimer.expires_after(std::chrono::seconds(2));
            shutdownTimer.async_wait([&](const boost::system::error_code&) {
                io.stop();
            });
        });

        std::vector<std::thread> workers;
        for (unsigned int i = 1; i < config.http.ioThreads; ++i) {
            workers.emplace_back([&io]() { io.run(); });
        }
        io.run();
        for (auto& worker : workers) {
            worker.join();
        }

        coordinator.stop();
        LOG_INFO("main", "UART WebSocket Bridge stopped");
    } catch (const std::exception& e) {
        LOG_ERROR("main", "Fatal error: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
