#include "PlaybackQueue.h"
#include <algorithm>

namespace VoxLink {

    PlaybackQueue::PlaybackQueue(size_t capacity) : m_Capacity((std::max)(capacity, size_t{ 1 })) {}

    bool PlaybackQueue::TryPush(AudioChunk chunk) {
        {
            std::lock_guard<std::mutex> lk(m_Mutex);
            if (m_Queue.size() >= m_Capacity) {
                m_Overflows.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            m_Queue.push_back(std::move(chunk));
        }
        m_Cv.notify_one();
        return true;
    }

    std::optional<AudioChunk> PlaybackQueue::PopFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_Mutex);
        if (!m_Cv.wait_for(lk, timeout, [this] { return !m_Queue.empty(); }))
            return std::nullopt;
        AudioChunk chunk = std::move(m_Queue.front());
        m_Queue.pop_front();
        return chunk;
    }

    size_t PlaybackQueue::SetCapacity(size_t capacity) {
        std::lock_guard<std::mutex> lk(m_Mutex);
        m_Capacity = (std::max)(capacity, size_t{ 1 });
        size_t dropped = 0;
        while (m_Queue.size() > m_Capacity) {
            m_Queue.pop_front();
            ++dropped;
        }
        if (dropped > 0) m_Trimmed.fetch_add(dropped, std::memory_order_relaxed);
        return dropped;
    }

    size_t PlaybackQueue::Capacity() const {
        std::lock_guard<std::mutex> lk(m_Mutex);
        return m_Capacity;
    }

    size_t PlaybackQueue::Size() const {
        std::lock_guard<std::mutex> lk(m_Mutex);
        return m_Queue.size();
    }

    void PlaybackQueue::Clear() {
        std::lock_guard<std::mutex> lk(m_Mutex);
        m_Queue.clear();
    }

} // namespace VoxLink
