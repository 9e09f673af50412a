#pragma once
#include <cstdint>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "WireCodec.h"
#include "../audio/AudioChunk.h"

namespace VoxLink {

    // Rebuilds audio chunks from fragment datagrams and keeps frame-level loss
    // accounting. Pure bookkeeping: no sockets, no threads. All methods are
    // thread-safe; times are caller-supplied microseconds so tests can drive
    // the clock.
    class Reassembler {
    public:
        struct Config {
            uint64_t reassemblyTimeoutUs = 500000;
            size_t   maxPendingFrames = 256;
        };

        struct Stats {
            uint64_t fragmentsAccepted = 0;
            uint64_t duplicateFragments = 0;
            uint64_t inconsistentFragments = 0;
            uint64_t lateFragments = 0;
            uint64_t framesCompleted = 0;
            uint64_t framesLostToGaps = 0;
            uint64_t framesTimedOut = 0;
            uint64_t framesEvictedForCapacity = 0;
            size_t   pendingFrames = 0;
            bool     hasLastSeen = false;
            uint32_t lastSeenSequence = 0;

            uint64_t TotalFramesLost() const {
                return framesLostToGaps + framesTimedOut + framesEvictedForCapacity;
            }
        };

        explicit Reassembler(const Config& config);

        // Records the fragment and returns the completed chunk once every
        // fragment of its frame is present.
        std::optional<AudioChunk> Accept(const AudioPacket& packet, uint64_t nowUs);

        // Drops entries pending longer than the reassembly timeout. Returns how
        // many frames were evicted (each one counts as lost).
        size_t EvictStale(uint64_t nowUs);

        void Reset();
        Stats GetStats() const;

        // Frames completed / lost since the previous call; feeds the per-interval loss rate.
        void TakeIntervalCounts(uint64_t& completed, uint64_t& lost);

    private:
        struct Entry {
            uint16_t totalFragments = 0;
            uint64_t firstSeenUs = 0;
            uint64_t captureTimeUs = 0;
            std::map<uint16_t, std::vector<uint8_t>> fragments;
        };

        void TrackSequence(uint32_t frameSequence);
        void EvictOldestLocked();
        void MarkClosed(uint32_t frameSequence);
        static AudioChunk Assemble(const Entry& entry);

        const Config m_Config;

        mutable std::mutex m_Mutex;
        std::unordered_map<uint32_t, Entry> m_Pending;
        // Sequences already completed or evicted; late fragments for them are dropped
        // instead of opening a fresh entry that could only time out again.
        std::deque<uint32_t> m_ClosedOrder;
        std::unordered_set<uint32_t> m_Closed;
        bool     m_HasLastSeen = false;
        uint32_t m_LastSeen = 0;
        Stats    m_Stats;
        uint64_t m_IntervalCompleted = 0;
        uint64_t m_IntervalLost = 0;
    };

} // namespace VoxLink
