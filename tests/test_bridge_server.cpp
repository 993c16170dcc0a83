// tests/test_bridge_server.cpp
#include <cassert>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include "BridgeServer.hpp"
#include "FakeSerialDevice.hpp"
#include "TestUtil.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

using WsClient = websocket::stream<tcp::socket>;

http::response<http::string_body> httpRequest(uint16_t port, http::verb verb, const std::string& target,
                                              const std::string& body = "") {
    net::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(false);
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();
    http::write(socket, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

std::unique_ptr<WsClient> connectClient(net::io_context& io, uint16_t port) {
    auto ws = std::make_unique<WsClient>(io);
    ws->next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    ws->handshake("127.0.0.1:" + std::to_string(port), "/ws");
    return ws;
}

// Reads one message; `binary` reports its frame type
std::string readMessage(WsClient& ws, bool& binary) {
    beast::flat_buffer buffer;
    ws.read(buffer);
    binary = ws.got_binary();
    return beast::buffers_to_string(buffer.data());
}

json readControl(WsClient& ws) {
    bool binary = true;
    std::string text = readMessage(ws, binary);
    assert(!binary);
    return json::parse(text);
}

std::string readBinary(WsClient& ws) {
    bool binary = false;
    std::string data = readMessage(ws, binary);
    assert(binary);
    return data;
}

void test_end_to_end() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    fake->setLoopback(true);

    AppConfig config;
    config.serial = testSerialConfig("/dev/ttyFAKE0");
    config.http.host = "127.0.0.1";
    config.http.port = 0;

    SerialLink link(std::move(device));
    ClientRegistry registry(config.websocket.outboundQueueLimit);
    BridgeCoordinator coordinator(link, registry, config.serial);
    net::io_context io;
    BridgeServer server(io, coordinator, config);

    assert(!coordinator.start());
    server.start();
    const uint16_t port = server.port();
    assert(port != 0);

    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([&io] { io.run(); });
    }

    net::io_context clientIo;
    auto a = connectClient(clientIo, port);
    json greeting = readControl(*a);
    assert(greeting["type"] == "info");
    assert(greeting["uartStatus"]["connected"] == true);
    assert(greeting["uartStatus"]["port"] == "/dev/ttyFAKE0");
    assert(greeting["uartStatus"]["baudrate"] == 115200);

    auto b = connectClient(clientIo, port);
    assert(readControl(*b)["type"] == "info");
    assert(waitUntil([&] { return coordinator.clientCount() == 2; }));

    // binary frames go to the UART and the echo comes back to everyone
    const std::string hello("\x48\x65\x6C\x6C\x6F", 5);
    a->binary(true);
    a->write(net::buffer(hello));
    assert(readBinary(*a) == hello);
    assert(readBinary(*b) == hello);
    assert(fake->written() == hello);

    a->text(true);
    a->write(net::buffer(std::string("hello")));
    assert(readControl(*a)["type"] == "warning");

    auto health = httpRequest(port, http::verb::get, "/health");
    assert(health.result() == http::status::ok);
    json h = json::parse(health.body());
    assert(h["status"] == "healthy");
    assert(h["uart_connected"] == true);
    assert(h["websocket_connections"] == 2);

    auto status = httpRequest(port, http::verb::get, "/api/status");
    assert(status.result() == http::status::ok);
    assert(json::parse(status.body())["uart"]["connected"] == true);

    auto info = httpRequest(port, http::verb::get, "/api/uart/info");
    assert(json::parse(info.body())["port"] == "/dev/ttyFAKE0");

    auto sent = httpRequest(port, http::verb::post, "/api/uart/send", R"({"data": "48656c6c6f"})");
    assert(sent.result() == http::status::ok);
    json s = json::parse(sent.body());
    assert(s["status"] == "success");
    assert(s["bytes_sent"] == 5);
    assert(readBinary(*a) == hello);
    assert(readBinary(*b) == hello);

    assert(httpRequest(port, http::verb::post, "/api/uart/send", R"({"data": "zz"})").result()
           == http::status::bad_request);
    assert(httpRequest(port, http::verb::post, "/api/uart/send", R"({"bytes": 1})").result()
           == http::status::unprocessable_entity);
    assert(httpRequest(port, http::verb::get, "/nope").result() == http::status::not_found);
    assert(httpRequest(port, http::verb::delete_, "/health").result()
           == http::status::method_not_allowed);

    auto cors = httpRequest(port, http::verb::options, "/api/status");
    assert(cors.result() == http::status::no_content);
    assert(cors[http::field::access_control_allow_origin] == "*");

    auto reconnect = httpRequest(port, http::verb::post, "/api/uart/reconnect");
    assert(json::parse(reconnect.body())["status"] == "success");
    assert(readControl(*a)["message"] == "UART reconnected");
    assert(readControl(*b)["message"] == "UART reconnected");

    // client-initiated close unregisters only that client
    a->close(websocket::close_code::normal);
    assert(waitUntil([&] { return coordinator.clientCount() == 1; }));

    server.stop();
    beast::flat_buffer buffer;
    beast::error_code ec;
    b->read(buffer, ec);
    assert(ec == websocket::error::closed);
    assert(waitUntil([&] { return coordinator.clientCount() == 0; }));

    coordinator.stop();
    io.stop();
    for (auto& t : threads) t.join();
    assert(!fake->reentered());
}

void test_bind_failure_throws() {
    SerialLink link(std::make_unique<FakeSerialDevice>());
    ClientRegistry registry;
    AppConfig config;
    config.http.host = "127.0.0.1";
    config.http.port = 0;
    BridgeCoordinator coordinator(link, registry, config.serial);
    net::io_context io;

    BridgeServer first(io, coordinator, config);
    first.start();
    config.http.port = first.port();

    BridgeServer second(io, coordinator, config);
    bool threw = false;
    try {
        second.start();
    } catch (const boost::system::system_error&) {
        threw = true;
    }
    assert(threw);
    assert(!second.isRunning());
    first.stop();
}

// Bridge on 127.0.0.1 with an ephemeral port, a loopback fake device and two io threads
struct RunningBridge {
    explicit RunningBridge(const AppConfig& base)
        : config(withLocalAddress(base)),
          link(makeDevice()),
          registry(config.websocket.outboundQueueLimit),
          coordinator(link, registry, config.serial),
          server(io, coordinator, config) {
        assert(!coordinator.start());
        server.start();
        port = server.port();
        for (int i = 0; i < 2; ++i) {
            threads.emplace_back([this] { io.run(); });
        }
    }

    ~RunningBridge() {
        server.stop();
        coordinator.stop();
        io.stop();
        for (auto& t : threads) t.join();
    }

    static AppConfig withLocalAddress(AppConfig config) {
        config.serial = testSerialConfig("/dev/ttyFAKE0");
        config.http.host = "127.0.0.1";
        config.http.port = 0;
        return config;
    }

    std::unique_ptr<SerialDevice> makeDevice() {
        auto device = std::make_unique<FakeSerialDevice>();
        device->setLoopback(true);
        fake = device.get();
        return device;
    }

    AppConfig config;
    FakeSerialDevice* fake = nullptr;
    SerialLink link;
    ClientRegistry registry;
    BridgeCoordinator coordinator;
    net::io_context io;
    BridgeServer server;
    uint16_t port = 0;
    std::vector<std::thread> threads;
};

std::string readBinaryBytes(WsClient& ws, std::size_t count) {
    std::string all;
    while (all.size() < count) {
        all += readBinary(ws);
    }
    return all;
}

void test_max_size_payload_round_trip() {
    AppConfig base;
    base.websocket.maxMessageSize = 64 * 1024;
    base.websocket.outboundQueueLimit = 1024;
    RunningBridge bridge(base);

    net::io_context clientIo;
    auto a = connectClient(clientIo, bridge.port);
    readControl(*a);
    auto b = connectClient(clientIo, bridge.port);
    readControl(*b);

    std::string payload(base.websocket.maxMessageSize, '\0');
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>((i * 31 + 7) & 0xff);
    }
    a->binary(true);
    a->write(net::buffer(payload));

    // the serial side may split it, the concatenation must be exact
    assert(readBinaryBytes(*a, payload.size()) == payload);
    assert(readBinaryBytes(*b, payload.size()) == payload);
    assert(bridge.fake->written() == payload);

    // one byte over the limit never reaches the UART and costs the sender its connection
    auto c = connectClient(clientIo, bridge.port);
    readControl(*c);
    assert(waitUntil([&] { return bridge.coordinator.clientCount() == 3; }));
    std::string oversized(base.websocket.maxMessageSize + 1, 'z');
    c->binary(true);
    beast::error_code ec;
    c->write(net::buffer(oversized), ec);
    beast::flat_buffer buffer;
    c->read(buffer, ec);
    assert(ec);
    assert(waitUntil([&] { return bridge.coordinator.clientCount() == 2; }));
    assert(bridge.fake->written().size() == payload.size());
}

void test_keepalive_pings_and_silent_peer() {
    AppConfig base;
    base.websocket.pingInterval = std::chrono::seconds(1);
    base.websocket.pingTimeout = std::chrono::seconds(1);
    RunningBridge bridge(base);

    net::io_context clientIo;
    // never reads after the greeting, so it never answers a ping
    auto silent = connectClient(clientIo, bridge.port);
    readControl(*silent);

    auto live = connectClient(clientIo, bridge.port);
    readControl(*live);
    std::atomic<int> pings{0};
    live->control_callback([&pings](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::ping) ++pings;
    });
    std::thread reader([&live] {
        beast::flat_buffer buffer;
        beast::error_code ec;
        while (!ec) {
            live->read(buffer, ec);
            buffer.consume(buffer.size());
        }
    });

    assert(waitUntil([&] { return bridge.coordinator.clientCount() == 1; }, std::chrono::seconds(6)));
    assert(waitUntil([&] { return pings >= 2; }, std::chrono::seconds(6)));
    assert(bridge.coordinator.clientCount() == 1);

    bridge.server.stop();
    reader.join();
}

void test_oversized_request_body_gets_413() {
    AppConfig base;
    base.websocket.maxMessageSize = 64 * 1024;
    RunningBridge bridge(base);

    net::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), bridge.port));
    // the declared length alone is over the limit, the body is never sent
    const std::string head =
        "POST /api/uart/send HTTP/1.1\r\n"
        "Host: 127.0.0.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(3 * base.websocket.maxMessageSize) + "\r\n\r\n";
    net::write(socket, net::buffer(head));

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    assert(res.result() == http::status::payload_too_large);
    assert(json::parse(res.body())["detail"] == "Request body too large");
    assert(bridge.fake->written().empty());
}

void test_shutdown_while_streaming_closes_cleanly() {
    RunningBridge bridge(AppConfig{});

    net::io_context clientIo;
    auto ws = connectClient(clientIo, bridge.port);
    readControl(*ws);

    std::atomic<bool> streaming{true};
    std::thread producer([&] {
        while (streaming) {
            bridge.fake->inject(std::string(256, 's'));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    assert(readBinary(*ws).size() > 0);

    bridge.server.stop();
    beast::flat_buffer buffer;
    beast::error_code ec;
    while (!ec) {
        ws->read(buffer, ec);
        buffer.consume(buffer.size());
    }
    // only data frames before the close frame, then a normal close
    assert(ec == websocket::error::closed);
    assert(ws->reason().code == websocket::close_code::going_away);

    streaming = false;
    producer.join();
    assert(waitUntil([&] { return bridge.coordinator.clientCount() == 0; }));
}

} // namespace

int main() {
    quietLogs();
    RUN_TEST(test_end_to_end);
    RUN_TEST(test_bind_failure_throws);
    RUN_TEST(test_max_size_payload_round_trip);
    RUN_TEST(test_keepalive_pings_and_silent_peer);
    RUN_TEST(test_oversized_request_body_gets_413);
    RUN_TEST(test_shutdown_while_streaming_closes_cleanly);
    std::cout << "All bridge server tests passed" << std::endl;
    return 0;
}
