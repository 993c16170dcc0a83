// include/BridgeServer.hpp
#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "AdminApi.hpp"
#include "BridgeConfig.hpp"
#include "BridgeCoordinator.hpp"

class BridgeServer;

// One /ws peer. All socket work runs on the session strand; the registry wakes
// it through a post when new frames are queued.
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    using SessionPtr = std::shared_ptr<WebSocketSession>;

    WebSocketSession(boost::asio::ip::tcp::socket&& socket, BridgeCoordinator& coordinator,
                     const WebSocketConfig& config);
    ~WebSocketSession();

    void run(boost::beast::http::request<boost::beast::http::string_body> request);
    // Graceful close, safe from any thread
    void stop();

private:
    void onAccept(const boost::system::error_code& ec);
    void startReceive();
    void handleReceive(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void flush();
    void handleWrite(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void startClose();
    void finish(const std::string& reason);
    // ping every pingInterval, drop the peer when no pong arrives within pingTimeout
    void schedulePing(std::chrono::steady_clock::duration delay);
    void handlePingTimer(const boost::system::error_code& ec);
    void onControlFrame(boost::beast::websocket::frame_type kind);

    boost::beast::websocket::stream<boost::beast::tcp_stream> m_ws;
    boost::asio::steady_timer m_pingTimer;
    boost::beast::flat_buffer m_buffer;
    BridgeCoordinator& m_coordinator;
    WebSocketConfig m_config;
    ClientHandle m_client;
    OutboundMessage m_current;  // payload of the write in flight
    std::string m_remote;
    bool m_writing = false;
    bool m_closing = false;
    bool m_finished = false;
    bool m_awaitingPong = false;
};

// Plain HTTP connection: admin routes, or hand-over to WebSocketSession on /ws
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(boost::asio::ip::tcp::socket&& socket, BridgeServer& server);

    void start();

private:
    void startReceive();
    void handleReceive(const boost::system::error_code& ec, std::size_t bytes_transferred);
    void send(AdminApi::Response&& response);
    void handleWrite(bool close, const boost::system::error_code& ec, std::size_t bytes_transferred);
    void stop();

    boost::beast::tcp_stream m_stream;
    boost::beast::flat_buffer m_buffer;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> m_parser;
    std::shared_ptr<AdminApi::Response> m_response;
    BridgeServer& m_server;
};

class BridgeServer {
public:
    BridgeServer(boost::asio::io_context& io, BridgeCoordinator& coordinator, const AppConfig& config);
    ~BridgeServer();

    // Binds and starts accepting; throws boost::system::system_error when the bind fails
    void start();
    void stop();
    bool isRunning() const { return m_isRunning; }
    uint16_t port() const;

    AdminApi& api() { return m_api; }
    BridgeCoordinator& coordinator() { return m_coordinator; }
    const AppConfig& config() const { return m_config; }
    void addSession(const WebSocketSession::SessionPtr& session);

private:
    void startAccept();
    void handleAccept(const boost::system::error_code& ec, boost::asio::ip::tcp::socket socket);

    boost::asio::io_context& m_io;
    BridgeCoordinator& m_coordinator;
    AppConfig m_config;
    AdminApi m_api;
    boost::asio::ip::tcp::acceptor m_acceptor;
    std::atomic<bool> m_isRunning{false};

    std::mutex m_sessionsMutex;
    std::vector<std::weak_ptr<WebSocketSession>> m_sessions;
};
