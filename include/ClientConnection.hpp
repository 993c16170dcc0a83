// include/ClientConnection.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include "Common.h"
#include "ControlMessage.hpp"

struct OutboundMessage {
    enum class Type {
        Binary,  // raw serial bytes
        Text     // JSON control message
    };

    Type type = Type::Binary;
    FramePtr payload;
};

// One registered WebSocket peer as seen by the registry: an id, a connect time
// and a bounded outbound queue that the network session drains.
//
// Data frames are limited to `frameCapacity`. When the queue is full the new frame
// is dropped for this client only, and the first drop of an overflow episode
// queues a single warning. The episode ends once the session empties the queue.
// Control messages may use kControlReserve slots above the frame capacity; the
// overflow warning has one more slot of its own so it is never crowded out.
class ClientConnection {
public:
    using Id = uint64_t;
    using WakeHandler = std::function<void()>;

    static constexpr std::size_t kControlReserve = 16;
    static const char* const kOverflowWarning;

    ClientConnection(Id id, std::size_t frameCapacity);

    ClientConnection(const ClientConnection&) = delete;
    ClientConnection& operator=(const ClientConnection&) = delete;

    Id id() const { return m_id; }
    std::chrono::system_clock::time_point connectedAt() const { return m_connectedAt; }

    // false when the frame was dropped (queue full or connection closed)
    bool pushFrame(const FramePtr& frame);
    bool pushControl(const ControlMessage& message);
    // At most one such message waits in the queue until the session drains it
    bool pushControlOnce(const ControlMessage& message);
    bool pop(OutboundMessage& out);

    // Invoked after every successful push, from the pushing thread
    void setWakeHandler(WakeHandler handler);
    void close();
    bool closed() const;

    std::size_t pending() const;
    std::size_t droppedFrames() const;

private:
    void wake();

    const Id m_id;
    const std::chrono::system_clock::time_point m_connectedAt;
    const std::size_t m_frameCapacity;

    mutable std::mutex m_mutex;
    std::deque<OutboundMessage> m_queue;
    std::size_t m_queuedFrames = 0;
    std::size_t m_dropped = 0;
    bool m_overflowed = false;
    bool m_reminderQueued = false;
    bool m_closed = false;
    WakeHandler m_wake;
};
