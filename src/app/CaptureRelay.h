#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include "../audio/AudioChunk.h"
#include "../core/WorkerThread.h"

namespace VoxLink {

// Decouples the capture callback from the transmitter. Enqueue() never blocks;
// when the queue reaches capacity the oldest chunk is replaced so the sender
// always works from the freshest audio after a stall.
class CaptureRelay {
public:
    using SendFn = std::function<void(AudioChunk)>;

    explicit CaptureRelay(size_t capacity = 20) : m_Capacity(capacity ? capacity : 1) {}
    ~CaptureRelay() { Stop(); }

    CaptureRelay(const CaptureRelay&)            = delete;
    CaptureRelay& operator=(const CaptureRelay&) = delete;

    bool Start(SendFn fn);
    void Stop();
    bool IsRunning() const { return m_Worker.IsRunning(); }

    void Enqueue(AudioChunk chunk);

    uint64_t FramesCaptured() const { return m_FramesCaptured.load(std::memory_order_relaxed); }
    uint64_t FramesReplaced() const { return m_FramesReplaced.load(std::memory_order_relaxed); }
    uint64_t FramesForwarded() const { return m_FramesForwarded.load(std::memory_order_relaxed); }
    uint64_t SendFailures() const { return m_SendFailures.load(std::memory_order_relaxed); }
    size_t   QueueDepth() const;

private:
    void ForwardOnce();

    const size_t            m_Capacity;
    SendFn                  m_SendFn;
    std::deque<AudioChunk>  m_Queue;
    mutable std::mutex      m_Mutex;
    std::condition_variable m_Cv;

    std::atomic<uint64_t> m_FramesCaptured{ 0 };
    std::atomic<uint64_t> m_FramesReplaced{ 0 };
    std::atomic<uint64_t> m_FramesForwarded{ 0 };
    std::atomic<uint64_t> m_SendFailures{ 0 };

    WorkerThread m_Worker{ "relay" };
};

} // namespace VoxLink
