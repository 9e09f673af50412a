#include "AdaptiveSynchronizer.h"
#include "../core/Globals.h"
#include "../core/Logger.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <thread>

namespace VoxLink {

    const char* QualityBandName(double score) noexcept {
        if (score >= 90.0) return "Excellent";
        if (score >= 75.0) return "Good";
        if (score >= 60.0) return "Fair";
        if (score >= 40.0) return "Poor";
        return "Very Poor";
    }

    AdaptiveSynchronizer::AdaptiveSynchronizer(const Config& config, std::shared_ptr<BufferHintChannel> hints)
        : m_Config(config)
        , m_Hints(std::move(hints))
        , m_Depth((config.minBuffer + config.maxBuffer) / 2)
    {
        char buf[160];
        std::snprintf(buf, sizeof(buf), "Synchronizer ready: target=%.0fms max=%.0fms buffer=%d-%d depth=%d",
            m_Config.targetLatencyMs, m_Config.maxLatencyMs, m_Config.minBuffer, m_Config.maxBuffer, m_Depth);
        LOG_SYNC(buf);
    }

    AdaptiveSynchronizer::~AdaptiveSynchronizer() { Stop(); }

    bool AdaptiveSynchronizer::Start() {
        const auto period = std::chrono::microseconds(static_cast<int64_t>((std::max)(m_Config.periodMs, 1)) * 1000);
        const auto poll = std::chrono::milliseconds(Globals::WORKER_POLL_MS);
        auto nextTick = std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now() + period);

        const bool started = m_Worker.Start([this, period, poll, nextTick] {
            const auto now = std::chrono::steady_clock::now();
            if (now < *nextTick) {
                std::this_thread::sleep_for((std::min)(poll,
                    std::chrono::duration_cast<std::chrono::milliseconds>(*nextTick - now) + std::chrono::milliseconds(1)));
                return;
            }
            *nextTick = now + period;
            AdjustBufferSize();

            const auto issues = DetectQualityIssues();
            if (!issues.empty()) {
                std::string joined;
                for (const auto& issue : issues) {
                    if (!joined.empty()) joined += ", ";
                    joined += issue;
                }
                LOG_WARN("Audio quality issues: " + joined);
                std::lock_guard<std::mutex> lock(m_Mutex);
                m_QualityDegradations++;
            }
        });
        if (!started) {
            LOG_WARN("Synchronizer already active");
            return false;
        }
        LOG_SYNC("Synchronizer started");
        return true;
    }

    void AdaptiveSynchronizer::Stop() {
        if (!m_Worker.IsRunning()) return;
        m_Worker.Stop(std::chrono::milliseconds(Globals::WORKER_JOIN_GRACE_MS));
        LOG_SYNC("Synchronizer stopped");
    }

    void AdaptiveSynchronizer::RecordLatency(uint64_t captureTimeUs, uint64_t observedTimeUs) {
        const double latencyMs = observedTimeUs > captureTimeUs
            ? static_cast<double>(observedTimeUs - captureTimeUs) / 1000.0
            : 0.0;
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Latency.Push(latencyMs);
        if (m_HasLastLatency)
            m_Jitter.Push(std::fabs(latencyMs - m_LastLatencyMs));
        m_LastLatencyMs = latencyMs;
        m_HasLastLatency = true;
    }

    void AdaptiveSynchronizer::RecordLossRate(double percent) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Loss.Push((std::max)(0.0, (std::min)(100.0, percent)));
    }

    void AdaptiveSynchronizer::RecordQuality(double score) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Quality.Push((std::max)(0.0, (std::min)(100.0, score)));
    }

    double AdaptiveSynchronizer::GetCurrentLatency() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Latency.MeanOr(0.0);
    }

    double AdaptiveSynchronizer::GetCurrentJitter() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Jitter.MeanOr(0.0);
    }

    double AdaptiveSynchronizer::GetCurrentPacketLoss() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Loss.MeanOr(0.0);
    }

    double AdaptiveSynchronizer::GetCurrentAudioQuality() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Quality.MeanOr(100.0);
    }

    int AdaptiveSynchronizer::GetCurrentBufferSize() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Depth;
    }

    void AdaptiveSynchronizer::PostHintLocked(int previous, BufferSizeHint::Source source) {
        if (!m_Hints) return;
        BufferSizeHint hint;
        hint.depth = m_Depth;
        hint.previousDepth = previous;
        hint.source = source;
        m_Hints->Post(hint);
    }

    int AdaptiveSynchronizer::ForceBufferSize(int depth) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        const int previous = m_Depth;
        m_Depth = (std::max)(m_Config.minBuffer, (std::min)(m_Config.maxBuffer, depth));
        if (m_Depth != previous) {
            LOG_SYNC("Buffer size forced: " + std::to_string(previous) + " -> " + std::to_string(m_Depth));
            PostHintLocked(previous, BufferSizeHint::Source::Forced);
        }
        return m_Depth;
    }

    int AdaptiveSynchronizer::AdjustBufferSize() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        const double latency = m_Latency.MeanOr(0.0);
        const double jitter = m_Jitter.MeanOr(0.0);
        const double loss = m_Loss.MeanOr(0.0);

        int candidate = m_Depth;
        if (latency > m_Config.maxLatencyMs)
            candidate -= 2;
        else if (latency < m_Config.targetLatencyMs * 0.5)
            candidate += 1;

        if (jitter > m_Config.jitterThresholdMs)
            candidate += 1;

        if (loss > 5.0)
            candidate += 2;
        else if (loss < 1.0)
            candidate -= 1;

        candidate = (std::max)(m_Config.minBuffer, (std::min)(m_Config.maxBuffer, candidate));
        if (candidate != m_Depth) {
            const int previous = m_Depth;
            m_Depth = candidate;
            m_Adjustments++;
            char buf[160];
            std::snprintf(buf, sizeof(buf), "Buffer size adjusted: %d -> %d (latency=%.1fms jitter=%.1fms loss=%.1f%%)",
                previous, candidate, latency, jitter, loss);
            LOG_SYNC(buf);
            PostHintLocked(previous, BufferSizeHint::Source::Adaptive);
        }
        return m_Depth;
    }

    double AdaptiveSynchronizer::QualityScoreLocked() const {
        const double latency = m_Latency.MeanOr(0.0);
        const double jitter = m_Jitter.MeanOr(0.0);
        const double loss = m_Loss.MeanOr(0.0);
        const double quality = m_Quality.MeanOr(100.0);

        const double latencyScore = m_Config.maxLatencyMs > 0.0
            ? (std::max)(0.0, 100.0 - latency / m_Config.maxLatencyMs * 100.0) : 0.0;
        const double jitterScore = m_Config.jitterThresholdMs > 0.0
            ? (std::max)(0.0, 100.0 - jitter / m_Config.jitterThresholdMs * 100.0) : 0.0;
        const double lossScore = (std::max)(0.0, 100.0 - loss * 10.0);
        return (latencyScore + jitterScore + lossScore + quality) / 4.0;
    }

    double AdaptiveSynchronizer::QualityScore() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return QualityScoreLocked();
    }

    std::string AdaptiveSynchronizer::QualityAssessment() const {
        return QualityBandName(QualityScore());
    }

    std::vector<std::string> AdaptiveSynchronizer::DetectQualityIssuesLocked() const {
        std::vector<std::string> issues;
        char buf[64];
        const double latency = m_Latency.MeanOr(0.0);
        const double jitter = m_Jitter.MeanOr(0.0);
        const double loss = m_Loss.MeanOr(0.0);
        const double quality = m_Quality.MeanOr(100.0);

        if (latency > m_Config.maxLatencyMs) {
            std::snprintf(buf, sizeof(buf), "High latency: %.1fms", latency);
            issues.emplace_back(buf);
        }
        if (jitter > m_Config.jitterThresholdMs) {
            std::snprintf(buf, sizeof(buf), "High jitter: %.1fms", jitter);
            issues.emplace_back(buf);
        }
        if (loss > 5.0) {
            std::snprintf(buf, sizeof(buf), "High packet loss: %.1f%%", loss);
            issues.emplace_back(buf);
        }
        if (quality < 70.0) {
            std::snprintf(buf, sizeof(buf), "Poor audio quality: %.1f/100", quality);
            issues.emplace_back(buf);
        }
        return issues;
    }

    std::vector<std::string> AdaptiveSynchronizer::DetectQualityIssues() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return DetectQualityIssuesLocked();
    }

    void AdaptiveSynchronizer::ResetMeasurements() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Latency.Clear();
        m_Jitter.Clear();
        m_Loss.Clear();
        m_Quality.Clear();
        m_HasLastLatency = false;
        m_LastLatencyMs = 0.0;
        m_Adjustments = 0;
        m_QualityDegradations = 0;
        LOG_SYNC("Synchronizer measurements reset");
    }

    AdaptiveSynchronizer::Stats AdaptiveSynchronizer::GetStats() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        Stats s;
        s.active = m_Worker.IsRunning();
        s.latencyMs = m_Latency.MeanOr(0.0);
        s.jitterMs = m_Jitter.MeanOr(0.0);
        s.packetLossPct = m_Loss.MeanOr(0.0);
        s.audioQuality = m_Quality.MeanOr(100.0);
        s.bufferDepth = m_Depth;
        s.targetLatencyMs = m_Config.targetLatencyMs;
        s.maxLatencyMs = m_Config.maxLatencyMs;
        s.adjustments = m_Adjustments;
        s.qualityDegradations = m_QualityDegradations;
        s.latencySamples = m_Latency.Size();
        s.jitterSamples = m_Jitter.Size();
        s.lossSamples = m_Loss.Size();
        s.qualitySamples = m_Quality.Size();
        return s;
    }

} // namespace VoxLink
