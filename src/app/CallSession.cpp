#include "CallSession.h"
#include "../core/Globals.h"
#include "../core/Logger.h"
#include "../../Version.h"

namespace VoxLink {

    const char* CallStateName(CallState state) noexcept {
        switch (state) {
        case CallState::Idle:          return "idle";
        case CallState::Connecting:    return "connecting";
        case CallState::Connected:     return "connected";
        case CallState::Disconnecting: return "disconnecting";
        case CallState::Error:         return "error";
        }
        return "unknown";
    }

    void to_json(nlohmann::json& j, const CallStatus& s) {
        j = nlohmann::json{
            { "version", VOXLINK_VERSION_STRING },
            { "call_state", CallStateName(s.state) },
            { "remote_address", s.remoteAddress },
            { "call_duration", s.callDurationSec },
            { "total_calls", s.totalCalls },
            { "components_active", {
                { "capture", s.captureActive },
                { "transmission", s.transmitActive },
                { "reception", s.receiveActive },
                { "playback", s.playbackActive },
                { "synchronization", s.syncActive } } },
        };
        if (!s.hasStats) return;

        const auto& tx = s.transmitter;
        j["transmission_stats"] = {
            { "packets_sent", tx.packetsSent },
            { "bytes_sent", tx.bytesSent },
            { "chunks_submitted", tx.chunksSubmitted },
            { "chunks_sent", tx.chunksSent },
            { "chunks_dropped", tx.chunksDropped },
            { "chunks_unroutable", tx.chunksUnroutable },
            { "send_errors", tx.sendErrors },
            { "queue_depth", tx.queueDepth },
            { "packets_per_second", tx.packetsPerSec },
            { "bytes_per_second", tx.bytesPerSec },
        };

        const auto& rx = s.receiver;
        j["reception_stats"] = {
            { "packets_received", rx.packetsReceived },
            { "bytes_received", rx.bytesReceived },
            { "decode_failures", rx.DecodeFailures() },
            { "frames_completed", rx.reassembly.framesCompleted },
            { "frames_lost", rx.reassembly.TotalFramesLost() },
            { "frames_timed_out", rx.reassembly.framesTimedOut },
            { "duplicate_fragments", rx.reassembly.duplicateFragments },
            { "pending_frames", rx.reassembly.pendingFrames },
            { "chunks_played", rx.chunksPlayed },
            { "underruns", rx.underruns },
            { "queue_depth", rx.queueDepth },
            { "queue_capacity", rx.queueCapacity },
            { "queue_overflows", rx.queueOverflows },
            { "mean_latency_ms", rx.meanLatencyMs },
            { "loss_rate_pct", rx.lossRatePct },
            { "packets_per_second", rx.packetsPerSec },
        };

        const auto& sy = s.sync;
        j["synchronization_stats"] = {
            { "current_latency_ms", sy.latencyMs },
            { "current_jitter_ms", sy.jitterMs },
            { "packet_loss_pct", sy.packetLossPct },
            { "audio_quality", sy.audioQuality },
            { "buffer_size", sy.bufferDepth },
            { "target_latency_ms", sy.targetLatencyMs },
            { "max_latency_ms", sy.maxLatencyMs },
            { "buffer_adjustments", sy.adjustments },
            { "quality_degradations", sy.qualityDegradations },
        };

        j["capture_stats"] = {
            { "frames_captured", s.framesCaptured },
            { "frames_replaced", s.framesReplaced },
        };
        j["quality_assessment"] = s.quality;
    }

    CallSession::CallSession(const PeerConfig& config,
        std::unique_ptr<CaptureSource> capture,
        std::unique_ptr<PlaybackSink> playback)
        : m_Config(config)
        , m_Capture(std::move(capture))
        , m_Playback(std::move(playback))
    {
    }

    CallSession::~CallSession() {
        EndCall();
        std::lock_guard<std::mutex> lk(m_Mutex);
        Cleanup();
    }

    void CallSession::SetState(CallState state) {
        m_State.store(state, std::memory_order_release);
        LOG_APP(std::string("Call state: ") + CallStateName(state));
    }

    bool CallSession::StartCall(const std::string& remoteIp, uint16_t remotePort) {
        std::lock_guard<std::mutex> lk(m_Mutex);
        const CallState state = GetState();
        if (state == CallState::Error) {
            Cleanup();
            SetState(CallState::Idle);
        }
        else if (state != CallState::Idle) {
            LOG_WARN(std::string("Cannot start call in state ") + CallStateName(state));
            return false;
        }
        if (!m_Playback) {
            LOG_ERROR("step=call_start reason=no_playback_sink");
            return false;
        }

        SetState(CallState::Connecting);
        m_RemoteAddress = remoteIp + ":" + std::to_string(remotePort);
        LOG_APP("Starting call to " + m_RemoteAddress);

        AdaptiveSynchronizer::Config syncConfig;
        syncConfig.minBuffer = m_Config.minBuffer;
        syncConfig.maxBuffer = m_Config.maxBuffer;
        syncConfig.targetLatencyMs = m_Config.targetLatencyMs;
        syncConfig.maxLatencyMs = m_Config.maxLatencyMs;
        syncConfig.jitterThresholdMs = m_Config.jitterThresholdMs;
        syncConfig.periodMs = m_Config.syncPeriodMs;
        m_Hints = std::make_shared<BufferHintChannel>();
        m_Sync = std::make_shared<AdaptiveSynchronizer>(syncConfig, m_Hints);

        AudioReceiver::Config rxConfig;
        rxConfig.listenPort = m_Config.listenPort;
        rxConfig.sampleRate = m_Config.sampleRate;
        rxConfig.channels = m_Config.channels;
        rxConfig.reassemblyTimeoutUs = static_cast<uint64_t>(m_Config.reassemblyTimeoutMs) * 1000ull;
        rxConfig.maxPendingFrames = static_cast<size_t>(m_Config.maxPendingFrames);
        rxConfig.lossReportPeriodMs = m_Config.syncPeriodMs;
        m_Receiver = std::make_unique<AudioReceiver>(rxConfig,
            static_cast<size_t>(m_Sync->GetCurrentBufferSize()), m_Sync, m_Hints);

        AudioTransmitter::Config txConfig;
        txConfig.localPort = m_Config.localPort;
        txConfig.maxPacketSize = static_cast<size_t>(m_Config.maxPacketSize);
        txConfig.queueCapacity = static_cast<size_t>(m_Config.sendQueueCapacity);
        m_Transmitter = std::make_unique<AudioTransmitter>(txConfig);

        m_Relay = std::make_unique<CaptureRelay>(static_cast<size_t>(m_Config.captureQueueCapacity));

        const char* failedStep = nullptr;
        if (!m_Sync->Start()) failedStep = "synchronizer";
        else if (!m_Receiver->StartReception()) failedStep = "reception";
        else if (!m_Receiver->StartPlayback(*m_Playback)) failedStep = "playback";
        else if (!m_Transmitter->SetTarget(remoteIp, remotePort)) failedStep = "target";
        else if (!m_Transmitter->Start()) failedStep = "transmission";
        else if (!m_Relay->Start([tx = m_Transmitter.get()](AudioChunk chunk) { tx->Submit(std::move(chunk)); }))
            failedStep = "relay";
        else if (m_Capture && !m_Capture->Start([relay = m_Relay.get()](AudioChunk chunk) {
                relay->Enqueue(std::move(chunk));
            }))
            failedStep = "capture";

        if (failedStep) {
            LOG_ERROR(std::string("step=call_start reason=") + failedStep + "_failed remote=" + m_RemoteAddress);
            Cleanup();
            SetState(CallState::Error);
            return false;
        }

        m_CallStartUs = NowMicros();
        m_TotalCalls++;
        SetState(CallState::Connected);
        LOG_APP("Call established with " + m_RemoteAddress);
        return true;
    }

    void CallSession::Cleanup() {
        if (m_Capture) m_Capture->Stop();
        if (m_Relay) m_Relay->Stop();
        if (m_Transmitter) m_Transmitter->Stop();
        if (m_Receiver) m_Receiver->Stop();
        if (m_Sync) m_Sync->Stop();
    }

    void CallSession::EndCall() {
        std::lock_guard<std::mutex> lk(m_Mutex);
        const CallState state = GetState();
        if (state != CallState::Connected && state != CallState::Connecting) {
            if (state != CallState::Idle)
                LOG_WARN(std::string("No active call to end (state ") + CallStateName(state) + ")");
            return;
        }

        SetState(CallState::Disconnecting);
        const double durationSec = static_cast<double>(NowMicros() - m_CallStartUs) / 1e6;
        Cleanup();
        LOG_APP("Call with " + m_RemoteAddress + " ended after " + std::to_string(durationSec) + "s");
        m_CallStartUs = 0;
        SetState(CallState::Idle);
    }

    uint16_t CallSession::GetListenPort() const {
        std::lock_guard<std::mutex> lk(m_Mutex);
        return m_Receiver ? m_Receiver->GetLocalPort() : 0;
    }

    CallStatus CallSession::GetStatus() const {
        std::lock_guard<std::mutex> lk(m_Mutex);
        CallStatus s;
        s.state = GetState();
        s.remoteAddress = m_RemoteAddress;
        s.totalCalls = m_TotalCalls;
        if (m_CallStartUs > 0)
            s.callDurationSec = static_cast<double>(NowMicros() - m_CallStartUs) / 1e6;

        s.captureActive = m_Capture && m_Capture->IsRunning();
        s.transmitActive = m_Transmitter && m_Transmitter->IsRunning();
        s.receiveActive = m_Receiver && m_Receiver->IsReceiving();
        s.playbackActive = m_Receiver && m_Receiver->IsPlaying();
        s.syncActive = m_Sync && m_Sync->IsActive();

        if (s.state == CallState::Connected) {
            s.hasStats = true;
            s.transmitter = m_Transmitter->GetStats();
            s.receiver = m_Receiver->GetStats();
            s.sync = m_Sync->GetStats();
            s.framesCaptured = m_Relay->FramesCaptured();
            s.framesReplaced = m_Relay->FramesReplaced();
            s.quality = m_Sync->QualityAssessment();
        }
        return s;
    }

} // namespace VoxLink
