#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include "AudioChunk.h"

namespace VoxLink {

    // Bounded FIFO between the receive worker and the playback worker.
    // TryPush() never blocks: when the queue holds `capacity` chunks the
    // incoming chunk is rejected and counted as an overflow. The capacity
    // follows the synchronizer's buffer depth at runtime; shrinking below the
    // current occupancy discards the oldest chunks.
    class PlaybackQueue {
    public:
        explicit PlaybackQueue(size_t capacity);

        PlaybackQueue(const PlaybackQueue&) = delete;
        PlaybackQueue& operator=(const PlaybackQueue&) = delete;

        bool TryPush(AudioChunk chunk);

        // Waits up to `timeout` for a chunk. Returns nullopt on timeout.
        std::optional<AudioChunk> PopFor(std::chrono::milliseconds timeout);

        // Returns how many queued chunks were discarded to fit the new capacity.
        size_t SetCapacity(size_t capacity);
        size_t Capacity() const;
        size_t Size() const;
        void Clear();

        uint64_t Overflows() const { return m_Overflows.load(std::memory_order_relaxed); }
        uint64_t Trimmed() const { return m_Trimmed.load(std::memory_order_relaxed); }

    private:
        mutable std::mutex      m_Mutex;
        std::condition_variable m_Cv;
        std::deque<AudioChunk>  m_Queue;
        size_t                  m_Capacity;

        std::atomic<uint64_t> m_Overflows{ 0 };
        std::atomic<uint64_t> m_Trimmed{ 0 };
    };

} // namespace VoxLink
