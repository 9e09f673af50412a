#include "CaptureRelay.h"
#include "../core/Globals.h"
#include "../core/Logger.h"
#include <exception>
#include <string>

namespace VoxLink {

bool CaptureRelay::Start(SendFn fn) {
    if (m_Worker.IsRunning()) return true;
    m_SendFn = std::move(fn);
    return m_Worker.Start([this] { ForwardOnce(); });
}

void CaptureRelay::Stop() {
    if (!m_Worker.IsRunning()) return;
    m_Worker.RequestStop();
    m_Cv.notify_all();
    m_Worker.Join(std::chrono::milliseconds(Globals::WORKER_JOIN_GRACE_MS));

    std::lock_guard<std::mutex> lk(m_Mutex);
    m_Queue.clear();
}

void CaptureRelay::Enqueue(AudioChunk chunk) {
    m_FramesCaptured.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lk(m_Mutex);
        if (m_Queue.size() >= m_Capacity) {
            m_Queue.pop_front();
            m_FramesReplaced.fetch_add(1, std::memory_order_relaxed);
        }
        m_Queue.push_back(std::move(chunk));
    }
    m_Cv.notify_one();
}

size_t CaptureRelay::QueueDepth() const {
    std::lock_guard<std::mutex> lk(m_Mutex);
    return m_Queue.size();
}

void CaptureRelay::ForwardOnce() {
    // Drain everything queued since the last wake-up; after a burst this
    // catches up in one pass.
    std::deque<AudioChunk> batch;
    {
        std::unique_lock<std::mutex> lk(m_Mutex);
        if (!m_Cv.wait_for(lk, std::chrono::milliseconds(Globals::WORKER_POLL_MS),
            [this] { return !m_Queue.empty() || !m_Worker.IsRunning(); }))
            return;
        batch.swap(m_Queue);
    }
    for (auto& chunk : batch) {
        if (!m_SendFn) continue;
        try {
            m_SendFn(std::move(chunk));
            m_FramesForwarded.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            m_SendFailures.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR(std::string("step=relay_send_failed what=") + e.what());
        }
    }
}

} // namespace VoxLink
