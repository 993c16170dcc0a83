// src/BridgeServer.cpp
#include "BridgeServer.hpp"
#include "Logger.h"
#include <algorithm>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using boost::system::error_code;

namespace {
const char* kPrefix = "ws";
const char* kServerName = "uart-ws-bridge";
const std::chrono::seconds kHttpTimeout{30};

std::string endpointString(const tcp::socket& socket) {
    error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) return "unknown";
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

std::string targetPath(const AdminApi::Request& request) {
    std::string path(request.target().data(), request.target().size());
    auto query = path.find('?');
    if (query != std::string::npos) {
        path.erase(query);
    }
    return path;
}
}

// ------------------- WebSocketSession -------------------
WebSocketSession::WebSocketSession(tcp::socket&& socket, BridgeCoordinator& coordinator,
                                   const WebSocketConfig& config)
    : m_ws(std::move(socket)),
      m_pingTimer(m_ws.get_executor()),
      m_coordinator(coordinator),
      m_config(config) {
    m_remote = endpointString(beast::get_lowest_layer(m_ws).socket());
}

WebSocketSession::~WebSocketSession() {
    if (!m_finished && m_client) {
        m_coordinator.detachClient(m_client);
    }
}

void WebSocketSession::run(http::request<http::string_body> request) {
    // keep-alive is driven by m_pingTimer, Beast only guards the handshake
    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
    timeouts.idle_timeout = websocket::stream_base::none();
    timeouts.keep_alive_pings = false;
    m_ws.set_option(timeouts);
    m_ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, kServerName);
    }));
    m_ws.read_message_max(m_config.maxMessageSize);

    m_ws.async_accept(request,
        beast::bind_front_handler(&WebSocketSession::onAccept, shared_from_this()));
}

void WebSocketSession::onAccept(const error_code& ec) {
    if (ec) {
        LOG_WARNING(kPrefix, "WebSocket handshake with " + m_remote + " failed: " + ec.message());
        return;
    }

    m_client = m_coordinator.attachClient();
    std::weak_ptr<WebSocketSession> weak = shared_from_this();
    auto executor = m_ws.get_executor();
    m_client->setWakeHandler([weak, executor]() {
        net::post(executor, [weak]() {
            if (auto self = weak.lock()) {
                self->flush();
            }
        });
    });
    LOG_INFO(kPrefix, "WebSocket connected: " + m_remote + " (client #"
             + std::to_string(m_client->id()) + ")");

    m_ws.control_callback([weak](websocket::frame_type kind, beast::string_view) {
        if (auto self = weak.lock()) {
            self->onControlFrame(kind);
        }
    });
    schedulePing(m_config.pingInterval);

    flush();
    startReceive();
}

void WebSocketSession::schedulePing(std::chrono::steady_clock::duration delay) {
    m_pingTimer.expires_after(delay);
    m_pingTimer.async_wait(
        beast::bind_front_handler(&WebSocketSession::handlePingTimer, shared_from_this()));
}

void WebSocketSession::handlePingTimer(const error_code& ec) {
    if (ec || m_finished || m_closing) return;

    if (m_awaitingPong) {
        LOG_WARNING(kPrefix, "No pong from " + m_remote + " within "
                    + std::to_string(m_config.pingTimeout.count()) + "s, dropping client");
        // the pending read fails and finish() detaches the client
        beast::get_lowest_layer(m_ws).close();
        return;
    }

    m_awaitingPong = true;
    m_ws.async_ping({}, [self = shared_from_this()](const error_code& ec) {
        if (ec && ec != net::error::operation_aborted) {
            LOG_DEBUG(kPrefix, "Ping to " + self->m_remote + " failed: " + ec.message());
        }
    });
    schedulePing(m_config.pingTimeout);
}

void WebSocketSession::onControlFrame(websocket::frame_type kind) {
    if (kind != websocket::frame_type::pong || !m_awaitingPong) return;
    m_awaitingPong = false;
    // next ping one full interval after the answer
    schedulePing(m_config.pingInterval);
}

void WebSocketSession::startReceive() {
    m_ws.async_read(m_buffer,
        beast::bind_front_handler(&WebSocketSession::handleReceive, shared_from_this()));
}

void WebSocketSession::handleReceive(const error_code& ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            finish("closed by peer");
        } else if (ec == net::error::operation_aborted) {
            finish("aborted");
        } else {
            finish("receive error: " + ec.message());
        }
        return;
    }

    std::string payload = beast::buffers_to_string(m_buffer.data());
    m_buffer.consume(m_buffer.size());
    const bool binary = m_ws.got_binary();
    if (binary) {
        Logger::instance().logData(kPrefix, "client #" + std::to_string(m_client->id()) + " ->",
                                   payload);
    }
    m_coordinator.handleClientMessage(m_client, payload, binary);

    startReceive();
}

void WebSocketSession::flush() {
    // once closing, only the close frame may be written
    if (m_writing || m_closing || m_finished || !m_client) return;

    if (!m_client->pop(m_current)) {
        return;
    }
    m_writing = true;
    m_ws.binary(m_current.type == OutboundMessage::Type::Binary);
    m_ws.async_write(net::buffer(*m_current.payload),
        beast::bind_front_handler(&WebSocketSession::handleWrite, shared_from_this()));
}

void WebSocketSession::handleWrite(const error_code& ec, std::size_t) {
    m_writing = false;
    m_current = OutboundMessage{};
    if (ec) {
        finish("send error: " + ec.message());
        return;
    }
    if (m_closing) {
        startClose();
        return;
    }
    flush();
}

void WebSocketSession::stop() {
    net::post(m_ws.get_executor(), [self = shared_from_this()]() {
        self->m_closing = true;
        if (!self->m_writing) {
            self->startClose();
        }
    });
}

void WebSocketSession::startClose() {
    if (m_finished || !m_ws.is_open()) return;
    m_ws.async_close(websocket::close_code::going_away,
        [self = shared_from_this()](const error_code& ec) {
            if (ec) {
                LOG_DEBUG(kPrefix, "WebSocket close: " + ec.message());
            }
            self->finish("server shutdown");
        });
}

void WebSocketSession::finish(const std::string& reason) {
    if (m_finished) return;
    m_finished = true;
    m_pingTimer.cancel();
    if (m_client) {
        m_coordinator.detachClient(m_client);
        LOG_INFO(kPrefix, "WebSocket disconnected: " + m_remote + " (client #"
                 + std::to_string(m_client->id()) + ", " + reason + ")");
    }
}

// ------------------- HttpSession -------------------
HttpSession::HttpSession(tcp::socket&& socket, BridgeServer& server)
    : m_stream(std::move(socket)), m_server(server) {}

void HttpSession::start() {
    net::dispatch(m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::startReceive, shared_from_this()));
}

void HttpSession::startReceive() {
    m_parser.emplace();
    // hex encoding doubles the payload of /api/uart/send
    m_parser->body_limit(static_cast<std::uint64_t>(m_server.config().websocket.maxMessageSize) * 2 + 1024);
    m_stream.expires_after(kHttpTimeout);

    http::async_read(m_stream, m_buffer, *m_parser,
        beast::bind_front_handler(&HttpSession::handleReceive, shared_from_this()));
}

void HttpSession::handleReceive(const error_code& ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        stop();
        return;
    }
    if (ec == http::error::body_limit) {
        LOG_WARNING("http", "Request body over the limit from " + endpointString(m_stream.socket()));
        AdminApi::Request& request = m_parser->get();
        request.keep_alive(false);
        send(m_server.api().reject(request, http::status::payload_too_large, "Request body too large"));
        return;
    }
    if (ec) {
        if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
            LOG_WARNING("http", "Receive error: " + ec.message());
        }
        return;
    }

    AdminApi::Request request = m_parser->release();
    if (websocket::is_upgrade(request) && targetPath(request) == "/ws") {
        m_stream.expires_never();
        auto session = std::make_shared<WebSocketSession>(
            m_stream.release_socket(), m_server.coordinator(), m_server.config().websocket);
        m_server.addSession(session);
        session->run(std::move(request));
        return;
    }

    send(m_server.api().handle(request));
}

void HttpSession::send(AdminApi::Response&& response) {
    m_response = std::make_shared<AdminApi::Response>(std::move(response));
    const bool close = m_response->need_eof();
    http::async_write(m_stream, *m_response,
        beast::bind_front_handler(&HttpSession::handleWrite, shared_from_this(), close));
}

void HttpSession::handleWrite(bool close, const error_code& ec, std::size_t) {
    if (ec) {
        LOG_WARNING("http", "Send error: " + ec.message());
        return;
    }
    if (close) {
        stop();
        return;
    }
    m_response.reset();
    startReceive();
}

void HttpSession::stop() {
    error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

// ------------------- BridgeServer -------------------
BridgeServer::BridgeServer(net::io_context& io, BridgeCoordinator& coordinator, const AppConfig& config)
    : m_io(io),
      m_coordinator(coordinator),
      m_config(config),
      m_api(coordinator, config),
      m_acceptor(net::make_strand(io)) {}

BridgeServer::~BridgeServer() {
    m_isRunning = false;
    error_code ec;
    m_acceptor.close(ec);
}

void BridgeServer::start() {
    if (m_isRunning) return;

    tcp::endpoint endpoint(net::ip::make_address(m_config.http.host), m_config.http.port);
    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(net::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(net::socket_base::max_listen_connections);

    m_isRunning = true;
    startAccept();
    LOG_INFO("http", "Listening on " + m_config.http.host + ":" + std::to_string(port())
             + " (WebSocket at /ws)");
}

uint16_t BridgeServer::port() const {
    error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void BridgeServer::stop() {
    if (!m_isRunning.exchange(false)) return;

    net::post(m_acceptor.get_executor(), [this]() {
        error_code ec;
        m_acceptor.close(ec);
        if (ec) {
            LOG_ERROR("http", "Acceptor close error: " + ec.message());
        }
    });

    std::vector<std::weak_ptr<WebSocketSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(m_sessionsMutex);
        sessions.swap(m_sessions);
    }
    for (auto& weak : sessions) {
        if (auto session = weak.lock()) {
            session->stop();
        }
    }
    LOG_INFO("http", "Server stopped");
}

void BridgeServer::addSession(const WebSocketSession::SessionPtr& session) {
    std::lock_guard<std::mutex> lock(m_sessionsMutex);
    m_sessions.erase(std::remove_if(m_sessions.begin(), m_sessions.end(),
                                    [](const std::weak_ptr<WebSocketSession>& w) { return w.expired(); }),
                     m_sessions.end());
    m_sessions.push_back(session);
}

void BridgeServer::startAccept() {
    if (!m_isRunning) return;

    m_acceptor.async_accept(net::make_strand(m_io),
        beast::bind_front_handler(&BridgeServer::handleAccept, this));
}

void BridgeServer::handleAccept(const error_code& ec, tcp::socket socket) {
    if (!m_isRunning) return;

    if (!ec) {
        std::make_shared<HttpSession>(std::move(socket), *this)->start();
    } else if (ec != net::error::operation_aborted) {
        LOG_ERROR("http", "Accept error: " + ec.message());
    }

    startAccept();
}
