#include "Reassembler.h"
#include "../core/Logger.h"
#include <algorithm>
#include <cstdio>

namespace VoxLink {

    namespace {
        constexpr size_t kClosedHistory = 1024;
    }

    Reassembler::Reassembler(const Config& config) : m_Config(config) {}

    void Reassembler::TrackSequence(uint32_t frameSequence) {
        // Serial-number comparison: the 32-bit counter wraps, so a small
        // forward distance across zero is progress, not a gap.
        const uint32_t ahead = frameSequence - m_LastSeen;
        const bool isNewer = !m_HasLastSeen || (ahead != 0 && ahead < 0x80000000u);
        if (m_HasLastSeen && isNewer && ahead > 1u) {
            const uint64_t gap = ahead - 1u;
            m_Stats.framesLostToGaps += gap;
            m_IntervalLost += gap;
            char buf[128];
            std::snprintf(buf, sizeof(buf), "step=rx_gap from=%u to=%u lost=%llu",
                m_LastSeen, frameSequence, static_cast<unsigned long long>(gap));
            Logger::Instance().LogPacketTrace(buf);
        }
        if (isNewer) {
            m_LastSeen = frameSequence;
            m_HasLastSeen = true;
        }
    }

    void Reassembler::MarkClosed(uint32_t frameSequence) {
        if (!m_Closed.insert(frameSequence).second) return;
        m_ClosedOrder.push_back(frameSequence);
        while (m_ClosedOrder.size() > kClosedHistory) {
            m_Closed.erase(m_ClosedOrder.front());
            m_ClosedOrder.pop_front();
        }
    }

    AudioChunk Reassembler::Assemble(const Entry& entry) {
        size_t total = 0;
        for (const auto& kv : entry.fragments) total += kv.second.size();
        std::vector<uint8_t> bytes;
        bytes.reserve(total);
        // std::map iterates in fragment-index order.
        for (const auto& kv : entry.fragments)
            bytes.insert(bytes.end(), kv.second.begin(), kv.second.end());
        if (bytes.size() % 2 != 0)
            LOG_WARN("Reassembled frame has an odd byte count; trailing byte dropped");
        return AudioChunk::FromBytes(bytes, entry.captureTimeUs);
    }

    std::optional<AudioChunk> Reassembler::Accept(const AudioPacket& packet, uint64_t nowUs) {
        std::lock_guard<std::mutex> lock(m_Mutex);

        TrackSequence(packet.frameSequence);

        if (m_Closed.count(packet.frameSequence)) {
            m_Stats.lateFragments++;
            return std::nullopt;
        }

        auto it = m_Pending.find(packet.frameSequence);
        if (it == m_Pending.end()) {
            if (m_Pending.size() >= m_Config.maxPendingFrames)
                EvictOldestLocked();
            Entry entry;
            entry.totalFragments = packet.totalFragments;
            entry.firstSeenUs = nowUs;
            entry.captureTimeUs = packet.captureTimeUs;
            it = m_Pending.emplace(packet.frameSequence, std::move(entry)).first;
        }
        else if (it->second.totalFragments != packet.totalFragments) {
            m_Stats.inconsistentFragments++;
            return std::nullopt;
        }

        Entry& entry = it->second;
        if (!entry.fragments.emplace(packet.fragmentIndex, packet.payload).second) {
            m_Stats.duplicateFragments++;
            return std::nullopt;
        }
        m_Stats.fragmentsAccepted++;

        if (entry.fragments.size() < entry.totalFragments)
            return std::nullopt;

        AudioChunk chunk = Assemble(entry);
        m_Pending.erase(it);
        MarkClosed(packet.frameSequence);
        m_Stats.framesCompleted++;
        m_IntervalCompleted++;
        return chunk;
    }

    void Reassembler::EvictOldestLocked() {
        auto oldest = m_Pending.end();
        for (auto it = m_Pending.begin(); it != m_Pending.end(); ++it) {
            if (oldest == m_Pending.end() || it->second.firstSeenUs < oldest->second.firstSeenUs)
                oldest = it;
        }
        if (oldest == m_Pending.end()) return;
        MarkClosed(oldest->first);
        m_Pending.erase(oldest);
        m_Stats.framesEvictedForCapacity++;
        m_IntervalLost++;
    }

    size_t Reassembler::EvictStale(uint64_t nowUs) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        size_t evicted = 0;
        for (auto it = m_Pending.begin(); it != m_Pending.end();) {
            const uint64_t age = nowUs > it->second.firstSeenUs ? nowUs - it->second.firstSeenUs : 0;
            if (age > m_Config.reassemblyTimeoutUs) {
                char buf[128];
                std::snprintf(buf, sizeof(buf), "step=rx_evict seq=%u have=%zu total=%u age_us=%llu",
                    it->first, it->second.fragments.size(),
                    static_cast<unsigned>(it->second.totalFragments),
                    static_cast<unsigned long long>(age));
                Logger::Instance().LogPacketTrace(buf);
                MarkClosed(it->first);
                it = m_Pending.erase(it);
                ++evicted;
            }
            else {
                ++it;
            }
        }
        m_Stats.framesTimedOut += evicted;
        m_IntervalLost += evicted;
        return evicted;
    }

    void Reassembler::Reset() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Pending.clear();
        m_Closed.clear();
        m_ClosedOrder.clear();
        m_HasLastSeen = false;
        m_LastSeen = 0;
        m_Stats = Stats{};
        m_IntervalCompleted = 0;
        m_IntervalLost = 0;
    }

    Reassembler::Stats Reassembler::GetStats() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        Stats s = m_Stats;
        s.pendingFrames = m_Pending.size();
        s.hasLastSeen = m_HasLastSeen;
        s.lastSeenSequence = m_LastSeen;
        return s;
    }

    void Reassembler::TakeIntervalCounts(uint64_t& completed, uint64_t& lost) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        completed = m_IntervalCompleted;
        lost = m_IntervalLost;
        m_IntervalCompleted = 0;
        m_IntervalLost = 0;
    }

} // namespace VoxLink
