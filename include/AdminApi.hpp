// include/AdminApi.hpp
#pragma once
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "BridgeConfig.hpp"
#include "BridgeCoordinator.hpp"

// JSON status/control routes served next to /ws
class AdminApi {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    AdminApi(BridgeCoordinator& coordinator, const AppConfig& config);

    Response handle(const Request& request);
    // {"detail": ...} error reply for requests rejected before routing
    Response reject(const Request& request, boost::beast::http::status status,
                    const std::string& detail) const;

private:
    nlohmann::json describe() const;
    nlohmann::json systemStatus() const;
    nlohmann::json uartInfo() const;
    Response reconnect(const Request& request);
    Response sendData(const Request& request);
    nlohmann::json health() const;

    Response makeResponse(const Request& request, boost::beast::http::status status,
                          const nlohmann::json& body) const;

    BridgeCoordinator& m_coordinator;
    AppConfig m_config;
};
