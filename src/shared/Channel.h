#pragma once
#include <cstdint>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace VoxLink {

    // Multi-producer, single-consumer mailbox. Post() never blocks; when the
    // mailbox already holds `capacity` messages the oldest is replaced, since
    // only the latest control message matters to a consumer that fell behind.
    template <typename T>
    class Channel {
    public:
        explicit Channel(size_t capacity = 16) : m_Capacity(capacity ? capacity : 1) {}

        Channel(const Channel&) = delete;
        Channel& operator=(const Channel&) = delete;

        void Post(T message) {
            std::lock_guard<std::mutex> lk(m_Mutex);
            if (m_Queue.size() >= m_Capacity) m_Queue.pop_front();
            m_Queue.push_back(std::move(message));
        }

        std::optional<T> TryReceive() {
            std::lock_guard<std::mutex> lk(m_Mutex);
            if (m_Queue.empty()) return std::nullopt;
            T message = std::move(m_Queue.front());
            m_Queue.pop_front();
            return message;
        }

        std::vector<T> Drain() {
            std::lock_guard<std::mutex> lk(m_Mutex);
            std::vector<T> out(std::make_move_iterator(m_Queue.begin()),
                std::make_move_iterator(m_Queue.end()));
            m_Queue.clear();
            return out;
        }

        size_t Size() const {
            std::lock_guard<std::mutex> lk(m_Mutex);
            return m_Queue.size();
        }

    private:
        mutable std::mutex m_Mutex;
        std::deque<T>      m_Queue;
        const size_t       m_Capacity;
    };

    // Synchronizer -> receiver control message carrying a new playback depth.
    struct BufferSizeHint {
        enum class Source : uint8_t { Adaptive, Forced };

        int    depth = 0;
        int    previousDepth = 0;
        Source source = Source::Adaptive;
    };

    using BufferHintChannel = Channel<BufferSizeHint>;

} // namespace VoxLink
