// tests/test_serial_link.cpp
#include <cassert>
#include <poll.h>
#include <pty.h>
#include <unistd.h>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "AsioSerialDevice.hpp"
#include "FakeSerialDevice.hpp"
#include "SerialLink.hpp"
#include "TestUtil.hpp"

using namespace std::chrono_literals;
using boost::system::error_code;

namespace {

struct FrameSink {
    std::mutex mutex;
    std::vector<std::string> frames;

    SerialLink::FrameHandler handler() {
        return [this](const FramePtr& frame) {
            std::lock_guard<std::mutex> lock(mutex);
            frames.push_back(*frame);
        };
    }
    std::size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }
    std::string joined() {
        std::lock_guard<std::mutex> lock(mutex);
        std::string all;
        for (const auto& f : frames) all += f;
        return all;
    }
};

void test_open_missing_device_fails() {
    SerialLink link(std::make_unique<AsioSerialDevice>());
    SerialConfig config = testSerialConfig("/dev/ttyFAKE0");

    error_code ec = link.open(config);
    assert(ec == LinkError::OpenFailed);

    SerialLinkState state = link.status();
    assert(state.status == LinkStatus::Error);
    assert(!state.connected());
    assert(!state.lastError.empty());
    assert(state.config.device == "/dev/ttyFAKE0");
    assert(state.config.baudRate == 115200);

    assert(link.write("x") == LinkError::NotConnected);
    assert(link.startReader([](const FramePtr&) {}) == LinkError::NotConnected);
}

void test_write_before_open_is_not_connected() {
    SerialLink link(std::make_unique<FakeSerialDevice>());
    assert(link.status().status == LinkStatus::Disconnected);
    assert(link.write("hello") == LinkError::NotConnected);
    // nothing to reconnect with yet
    assert(link.reconnect() == LinkError::OpenFailed);
}

void test_frames_delivered_in_order() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    SerialLink link(std::move(device));
    FrameSink sink;

    assert(!link.open(testSerialConfig()));
    assert(link.isConnected());
    assert(fake->device() == "/dev/ttyTEST0");
    assert(!link.startReader(sink.handler()));

    fake->inject("abc");
    assert(waitUntil([&] { return sink.size() == 1; }));
    fake->inject("def");
    assert(waitUntil([&] { return sink.size() == 2; }));
    fake->inject("ghi");
    assert(waitUntil([&] { return sink.size() == 3; }));
    assert(sink.joined() == "abcdefghi");

    link.close();
    assert(!link.readerActive());
}

void test_close_is_idempotent() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    SerialLink link(std::move(device));
    FrameSink sink;

    assert(!link.open(testSerialConfig()));
    assert(!link.startReader(sink.handler()));
    assert(waitUntil([&] { return fake->readInFlight(); }));

    link.close();
    assert(link.status().status == LinkStatus::Disconnected);
    assert(!link.readerActive());
    assert(fake->closes() == 1);

    link.close();
    assert(link.status().status == LinkStatus::Disconnected);
    assert(fake->closes() == 1);
    assert(link.write("x") == LinkError::NotConnected);
}

void test_reconnect_waits_for_inflight_read() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    fake->setCancelDelay(200ms);
    SerialLink link(std::move(device));
    FrameSink sink;

    SerialConfig config = testSerialConfig();
    config.readTimeout = 5s;
    assert(!link.open(config));
    assert(!link.startReader(sink.handler()));
    assert(waitUntil([&] { return fake->readInFlight(); }));

    auto started = std::chrono::steady_clock::now();
    error_code ec = link.reconnect();
    auto elapsed = std::chrono::steady_clock::now() - started;

    assert(!ec);
    // the old read had fully returned before the device was reopened
    assert(elapsed >= 150ms);
    assert(fake->readersInside() == 0);
    assert(!link.readerActive());
    assert(fake->opens() == 2);
    assert(fake->closes() == 1);
    assert(link.isConnected());

    assert(!link.startReader(sink.handler()));
    fake->inject("after");
    assert(waitUntil([&] { return sink.size() == 1; }));
    assert(sink.joined() == "after");
    assert(!fake->reentered());
}

void test_second_reader_is_refused() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    SerialLink link(std::move(device));
    FrameSink sink;

    assert(!link.open(testSerialConfig()));
    assert(!link.startReader(sink.handler()));
    assert(waitUntil([&] { return link.readerActive(); }));

    // a second readLoop must return at once instead of reading concurrently
    std::thread second([&] { link.readLoop(sink.handler()); });
    second.join();
    // startReader while a reader runs is a no-op
    assert(!link.startReader(sink.handler()));

    fake->inject("one");
    assert(waitUntil([&] { return sink.size() == 1; }));
    assert(!fake->reentered());
    link.close();
}

void test_read_error_degrades_link_once() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    SerialLink link(std::move(device));
    FrameSink sink;

    std::mutex mutex;
    std::vector<ControlMessage> notices;
    link.setControlHandler([&](const ControlMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);
        notices.push_back(message);
    });

    assert(!link.open(testSerialConfig()));
    assert(!link.startReader(sink.handler()));
    assert(waitUntil([&] { return fake->readInFlight(); }));

    fake->failNextRead(boost::system::errc::make_error_code(boost::system::errc::io_error));
    assert(waitUntil([&] { return !link.readerActive(); }));

    SerialLinkState state = link.status();
    assert(state.status == LinkStatus::Error);
    assert(state.lastError.find("read") != std::string::npos);

    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(notices.size() == 1);
        assert(notices[0].kind == ControlMessage::Kind::Error);
        assert(notices[0].linkStatus.has_value());
        assert(!notices[0].linkStatus->connected());
    }

    // no automatic retry
    int calls = fake->readCalls();
    std::this_thread::sleep_for(100ms);
    assert(fake->readCalls() == calls);
    assert(link.write("x") == LinkError::NotConnected);

    assert(!link.reconnect());
    assert(link.isConnected());
}

void test_write_errors() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    SerialLink link(std::move(device));

    int notices = 0;
    link.setControlHandler([&](const ControlMessage&) { ++notices; });

    assert(!link.open(testSerialConfig()));
    assert(!link.write("ok"));
    assert(fake->written() == "ok");

    fake->setStallWrites(true);
    assert(link.write("slow") == LinkError::Timeout);
    // a timeout does not take the link down
    assert(link.isConnected());
    assert(notices == 0);
    fake->setStallWrites(false);

    fake->setWriteError(boost::system::errc::make_error_code(boost::system::errc::io_error));
    assert(link.write("boom") == LinkError::IOError);
    assert(link.status().status == LinkStatus::Error);
    assert(notices == 1);
    assert(link.write("again") == LinkError::NotConnected);
    assert(notices == 1);
}

void test_write_does_not_wait_for_reader() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    SerialLink link(std::move(device));
    FrameSink sink;

    SerialConfig config = testSerialConfig();
    config.readTimeout = 5s;
    assert(!link.open(config));
    assert(!link.startReader(sink.handler()));
    assert(waitUntil([&] { return fake->readInFlight(); }));

    auto started = std::chrono::steady_clock::now();
    assert(!link.write("ping"));
    assert(std::chrono::steady_clock::now() - started < 1s);
    link.close();
}

void test_concurrent_writes_are_not_interleaved() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    SerialLink link(std::move(device));
    assert(!link.open(testSerialConfig()));

    const int kThreads = 4;
    const int kWrites = 50;
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&link, t] {
            std::string chunk(8, static_cast<char>('a' + t));
            for (int i = 0; i < kWrites; ++i) {
                assert(!link.write(chunk));
            }
        });
    }
    for (auto& w : writers) w.join();

    std::string written = fake->written();
    assert(written.size() == static_cast<std::size_t>(kThreads * kWrites * 8));
    for (std::size_t i = 0; i < written.size(); i += 8) {
        assert(written.substr(i, 8) == std::string(8, written[i]));
    }
    assert(!fake->writeOverlap());
}

void test_open_while_connected_closes_first() {
    auto device = std::make_unique<FakeSerialDevice>();
    FakeSerialDevice* fake = device.get();
    SerialLink link(std::move(device));

    assert(!link.open(testSerialConfig("/dev/ttyA")));
    assert(!link.open(testSerialConfig("/dev/ttyB")));
    assert(fake->opens() == 2);
    assert(fake->closes() == 1);
    assert(link.config().device == "/dev/ttyB");

    fake->setOpenError(boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory));
    assert(link.reconnect() == LinkError::OpenFailed);
    assert(link.status().status == LinkStatus::Error);
    assert(link.config().device == "/dev/ttyB");
}

// Pseudo terminal pair: the link opens the slave, the test plays the device on the master
struct PtyPair {
    PtyPair() {
        char name[256] = {};
        int rc = ::openpty(&master, &slave, name, nullptr, nullptr);
        assert(rc == 0);
        slaveName = name;
    }
    ~PtyPair() {
        ::close(master);
        ::close(slave);
    }

    void send(const std::string& bytes) {
        ssize_t n = ::write(master, bytes.data(), bytes.size());
        assert(n == static_cast<ssize_t>(bytes.size()));
    }

    std::string receive(std::size_t count, std::chrono::milliseconds timeout = 2000ms) {
        std::string out;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (out.size() < count && std::chrono::steady_clock::now() < deadline) {
            pollfd pfd{master, POLLIN, 0};
            if (::poll(&pfd, 1, 20) <= 0) continue;
            char buf[256];
            ssize_t n = ::read(master, buf, sizeof(buf));
            if (n > 0) out.append(buf, static_cast<std::size_t>(n));
        }
        return out;
    }

    int master = -1;
    int slave = -1;
    std::string slaveName;
};

void test_asio_device_over_pty() {
    PtyPair pty;
    SerialLink link(std::make_unique<AsioSerialDevice>());
    FrameSink sink;

    SerialConfig config = testSerialConfig(pty.slaveName);
    config.readTimeout = 5s;
    config.writeTimeout = 100ms;
    assert(!link.open(config));
    assert(!link.startReader(sink.handler()));

    pty.send("hello pty");
    assert(waitUntil([&] { return sink.joined() == "hello pty"; }));

    assert(!link.write("back"));
    assert(pty.receive(4) == "back");

    // the read timeout is 5 s, so these only return quickly if cancel() wakes the reader
    assert(waitUntil([&] { return link.readerActive(); }));
    std::this_thread::sleep_for(50ms);
    auto started = std::chrono::steady_clock::now();
    assert(!link.reconnect());
    assert(std::chrono::steady_clock::now() - started < 2s);
    assert(!link.readerActive());
    assert(link.isConnected());

    assert(!link.startReader(sink.handler()));
    pty.send("again");
    assert(waitUntil([&] { return sink.joined() == "hello ptyagain"; }));

    // nobody drains the master, so a large write fills the pty buffer and times out
    std::string bulk(1 << 20, 'x');
    assert(link.write(bulk) == LinkError::Timeout);
    assert(link.isConnected());

    assert(waitUntil([&] { return link.readerActive(); }));
    started = std::chrono::steady_clock::now();
    link.close();
    assert(std::chrono::steady_clock::now() - started < 2s);
    assert(link.status().status == LinkStatus::Disconnected);
    assert(!link.readerActive());
}

void test_asio_device_short_read_timeout() {
    PtyPair pty;
    SerialLink link(std::make_unique<AsioSerialDevice>());
    FrameSink sink;

    SerialConfig config = testSerialConfig(pty.slaveName);
    config.readTimeout = std::chrono::milliseconds(0);
    assert(!link.open(config));
    assert(!link.startReader(sink.handler()));

    // idle slices time out quietly and the reader keeps going
    std::this_thread::sleep_for(100ms);
    assert(link.readerActive());
    pty.send("late");
    assert(waitUntil([&] { return sink.joined() == "late"; }));
    link.close();
}

} // namespace

int main() {
    quietLogs();
    RUN_TEST(test_open_missing_device_fails);
    RUN_TEST(test_write_before_open_is_not_connected);
    RUN_TEST(test_frames_delivered_in_order);
    RUN_TEST(test_close_is_idempotent);
    RUN_TEST(test_reconnect_waits_for_inflight_read);
    RUN_TEST(test_second_reader_is_refused);
    RUN_TEST(test_read_error_degrades_link_once);
    RUN_TEST(test_write_errors);
    RUN_TEST(test_write_does_not_wait_for_reader);
    RUN_TEST(test_concurrent_writes_are_not_interleaved);
    RUN_TEST(test_open_while_connected_closes_first);
    RUN_TEST(test_asio_device_over_pty);
    RUN_TEST(test_asio_device_short_read_timeout);
    std::cout << "All serial link tests passed" << std::endl;
    return 0;
}
