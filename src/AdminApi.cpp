// src/AdminApi.cpp
#include "AdminApi.hpp"
#include "Logger.h"
#include <functional>
#include <map>

namespace http = boost::beast::http;
using json = nlohmann::json;

namespace {
const char* kPrefix = "http";
const char* kServerName = "uart-ws-bridge";
const char* kVersion = "1.0.0";
}

AdminApi::AdminApi(BridgeCoordinator& coordinator, const AppConfig& config)
    : m_coordinator(coordinator), m_config(config) {}

AdminApi::Response AdminApi::makeResponse(const Request& request, http::status status,
                                          const json& body) const {
    Response res{status, request.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(request.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

AdminApi::Response AdminApi::reject(const Request& request, http::status status,
                                    const std::string& detail) const {
    return makeResponse(request, status, {{"detail", detail}});
}

AdminApi::Response AdminApi::handle(const Request& request) {
    std::string path(request.target().data(), request.target().size());
    auto query = path.find('?');
    if (query != std::string::npos) {
        path.erase(query);
    }
    LOG_DEBUG(kPrefix, std::string(request.method_string().data(), request.method_string().size())
              + " " + path);

    if (request.method() == http::verb::options) {
        Response res = makeResponse(request, http::status::no_content, json::object());
        res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        res.set(http::field::access_control_allow_headers, "*");
        res.body().clear();
        res.prepare_payload();
        return res;
    }

    struct Route {
        http::verb method;
        std::function<Response()> handler;
    };
    const std::map<std::string, Route> routes = {
        {"/", {http::verb::get, [&] { return makeResponse(request, http::status::ok, describe()); }}},
        {"/api/status", {http::verb::get, [&] { return makeResponse(request, http::status::ok, systemStatus()); }}},
        {"/api/uart/info", {http::verb::get, [&] { return makeResponse(request, http::status::ok, uartInfo()); }}},
        {"/api/uart/reconnect", {http::verb::post, [&] { return reconnect(request); }}},
        {"/api/uart/send", {http::verb::post, [&] { return sendData(request); }}},
        {"/api/config", {http::verb::get, [&] { return makeResponse(request, http::status::ok, configToJson(m_config)); }}},
        {"/health", {http::verb::get, [&] { return makeResponse(request, http::status::ok, health()); }}}
    };

    auto it = routes.find(path);
    if (it == routes.end()) {
        return makeResponse(request, http::status::not_found, {{"detail", "Not Found"}});
    }
    if (it->second.method != request.method()) {
        return makeResponse(request, http::status::method_not_allowed, {{"detail", "Method Not Allowed"}});
    }
    return it->second.handler();
}

json AdminApi::describe() const {
    return {
        {"name", "UART WebSocket Bridge API"},
        {"version", kVersion},
        {"description", "Bidirectional relay between WebSocket clients and a UART"},
        {"endpoints", {
            {"websocket", "/ws"},
            {"status", "/api/status"},
            {"uart_info", "/api/uart/info"},
            {"uart_reconnect", "/api/uart/reconnect"},
            {"uart_send", "/api/uart/send"},
            {"config", "/api/config"},
            {"health", "/health"}
        }}
    };
}

json AdminApi::systemStatus() const {
    return {
        {"uart", uartStatusJson(m_coordinator.linkStatus())},
        {"websocket", {
            {"active_connections", m_coordinator.clientCount()},
            {"ping_interval", m_config.websocket.pingInterval.count()},
            {"max_message_size", m_config.websocket.maxMessageSize}
        }},
        {"server", {
            {"host", m_config.http.host},
            {"port", m_config.http.port},
            {"log_level", logLevelToString(m_config.logging.level)}
        }},
        {"timestamp", utcTimestamp()}
    };
}

json AdminApi::uartInfo() const {
    SerialLinkState state = m_coordinator.linkStatus();
    json info = uartStatusJson(state);
    info["status"] = linkStatusToString(state.status);
    info["timeout"] = std::chrono::duration<double>(state.config.readTimeout).count();
    info["write_timeout"] = std::chrono::duration<double>(state.config.writeTimeout).count();
    if (!state.lastError.empty()) {
        info["last_error"] = state.lastError;
    }
    return info;
}

AdminApi::Response AdminApi::reconnect(const Request& request) {
    LOG_INFO(kPrefix, "UART reconnect requested");
    auto ec = m_coordinator.reconnect();
    SerialLinkState state = m_coordinator.linkStatus();
    json body = {
        {"status", ec ? "error" : "success"},
        {"message", ec ? "Failed to reconnect UART: " + state.lastError : "UART reconnected"},
        {"uart_status", uartStatusJson(state)}
    };
    return makeResponse(request, http::status::ok, body);
}

AdminApi::Response AdminApi::sendData(const Request& request) {
    json payload = json::parse(request.body(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object() || !payload.contains("data")
        || !payload["data"].is_string()) {
        return makeResponse(request, http::status::unprocessable_entity,
                            {{"detail", "Body must be a JSON object with a string field 'data'"}});
    }

    auto bytes = fromHex(payload["data"].get<std::string>());
    if (!bytes) {
        return makeResponse(request, http::status::bad_request,
                            {{"detail", "Invalid hex format"}});
    }

    auto ec = m_coordinator.sendData(*bytes);
    if (ec) {
        return makeResponse(request, http::status::ok, {
            {"status", "error"},
            {"bytes_sent", 0},
            {"message", "UART port not available: " + ec.message()}
        });
    }
    return makeResponse(request, http::status::ok, {
        {"status", "success"},
        {"bytes_sent", bytes->size()},
        {"message", "Sent " + std::to_string(bytes->size()) + " bytes to UART"}
    });
}

json AdminApi::health() const {
    bool connected = m_coordinator.linkStatus().connected();
    return {
        {"status", connected ? "healthy" : "degraded"},
        {"uart_connected", connected},
        {"websocket_connections", m_coordinator.clientCount()}
    };
}
