#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../core/WorkerThread.h"
#include "../shared/Channel.h"

namespace VoxLink {

    // Fixed-capacity window; the oldest sample falls out when full.
    class RollingWindow {
    public:
        explicit RollingWindow(size_t capacity) : m_Capacity(capacity ? capacity : 1) {}

        void Push(double value) {
            if (m_Values.size() >= m_Capacity) {
                m_Sum -= m_Values.front();
                m_Values.pop_front();
            }
            m_Values.push_back(value);
            m_Sum += value;
        }

        double MeanOr(double fallback) const {
            return m_Values.empty() ? fallback : m_Sum / static_cast<double>(m_Values.size());
        }

        void Clear() { m_Values.clear(); m_Sum = 0.0; }
        size_t Size() const { return m_Values.size(); }
        size_t Capacity() const { return m_Capacity; }

    private:
        size_t             m_Capacity;
        std::deque<double> m_Values;
        double             m_Sum = 0.0;
    };

    // Periodic controller that turns latency / jitter / loss measurements into
    // a playback buffer depth. Depth changes are posted to the hint channel;
    // the receiver applies them to its playback queue.
    class AdaptiveSynchronizer {
    public:
        struct Config {
            int    minBuffer = 3;
            int    maxBuffer = 20;
            double targetLatencyMs = 50.0;
            double maxLatencyMs = 200.0;
            double jitterThresholdMs = 10.0;
            int    periodMs = 1000;
        };

        struct Stats {
            bool     active = false;
            double   latencyMs = 0.0;
            double   jitterMs = 0.0;
            double   packetLossPct = 0.0;
            double   audioQuality = 100.0;
            int      bufferDepth = 0;
            double   targetLatencyMs = 0.0;
            double   maxLatencyMs = 0.0;
            uint64_t adjustments = 0;
            uint64_t qualityDegradations = 0;
            size_t   latencySamples = 0;
            size_t   jitterSamples = 0;
            size_t   lossSamples = 0;
            size_t   qualitySamples = 0;
        };

        static constexpr size_t kLatencyWindow = 100;
        static constexpr size_t kJitterWindow = 50;
        static constexpr size_t kLossWindow = 20;
        static constexpr size_t kQualityWindow = 50;

        AdaptiveSynchronizer(const Config& config, std::shared_ptr<BufferHintChannel> hints);
        ~AdaptiveSynchronizer();

        AdaptiveSynchronizer(const AdaptiveSynchronizer&) = delete;
        AdaptiveSynchronizer& operator=(const AdaptiveSynchronizer&) = delete;

        bool Start();
        void Stop();
        bool IsActive() const { return m_Worker.IsRunning(); }

        // Both timestamps in microseconds on the local monotonic clock.
        void RecordLatency(uint64_t captureTimeUs, uint64_t observedTimeUs);
        void RecordLossRate(double percent);
        void RecordQuality(double score);

        double GetCurrentLatency() const;
        double GetCurrentJitter() const;
        double GetCurrentPacketLoss() const;
        double GetCurrentAudioQuality() const;
        int GetCurrentBufferSize() const;

        // Clamps into [minBuffer, maxBuffer]; posts a Forced hint when the depth changes.
        int ForceBufferSize(int depth);

        // One control step. Called by the worker every period; public so the
        // rules can be driven deterministically. Returns the resulting depth.
        int AdjustBufferSize();

        double QualityScore() const;
        std::string QualityAssessment() const;
        std::vector<std::string> DetectQualityIssues() const;

        void ResetMeasurements();
        Stats GetStats() const;

    private:
        double QualityScoreLocked() const;
        std::vector<std::string> DetectQualityIssuesLocked() const;
        void PostHintLocked(int previous, BufferSizeHint::Source source);

        const Config m_Config;
        std::shared_ptr<BufferHintChannel> m_Hints;

        mutable std::mutex m_Mutex;
        RollingWindow m_Latency{ kLatencyWindow };
        RollingWindow m_Jitter{ kJitterWindow };
        RollingWindow m_Loss{ kLossWindow };
        RollingWindow m_Quality{ kQualityWindow };
        bool     m_HasLastLatency = false;
        double   m_LastLatencyMs = 0.0;
        int      m_Depth;
        uint64_t m_Adjustments = 0;
        uint64_t m_QualityDegradations = 0;

        WorkerThread m_Worker{ "sync" };
    };

    const char* QualityBandName(double score) noexcept;

} // namespace VoxLink
