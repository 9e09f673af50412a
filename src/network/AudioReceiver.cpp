#include "AudioReceiver.h"
#include "../core/Globals.h"
#include "../core/Logger.h"
#include <cstdio>

using asio::ip::udp;

namespace VoxLink {

    namespace {

        inline void LogError(const char* step, const std::error_code& ec) {
            char buf[256];
            std::snprintf(buf, sizeof(buf), "step=%s msg=%.200s", step, ec.message().c_str());
            LOG_ERROR(buf);
            Logger::Instance().LogPacketTrace(buf);
        }

        Reassembler::Config MakeReassemblerConfig(const AudioReceiver::Config& c) {
            Reassembler::Config rc;
            rc.reassemblyTimeoutUs = c.reassemblyTimeoutUs;
            rc.maxPendingFrames = c.maxPendingFrames;
            return rc;
        }

    } // namespace

    AudioReceiver::AudioReceiver(const Config& config, size_t initialCapacity,
        std::shared_ptr<AdaptiveSynchronizer> sync,
        std::shared_ptr<BufferHintChannel> hints)
        : m_Config(config)
        , m_Sync(std::move(sync))
        , m_Hints(std::move(hints))
        , m_Socket(m_Context)
        , m_Reassembler(MakeReassemblerConfig(config))
        , m_Queue(initialCapacity)
    {
    }

    AudioReceiver::~AudioReceiver() { Stop(); }

    bool AudioReceiver::StartReception() {
        if (m_RxWorker.IsRunning()) return true;

        std::error_code ec;
        m_Socket.open(udp::v4(), ec);
        if (!ec) m_Socket.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec) m_Socket.bind(udp::endpoint(udp::v4(), m_Config.listenPort), ec);
        if (ec) {
            LogError("rx_bind", ec);
            std::error_code ignored;
            if (m_Socket.is_open()) m_Socket.close(ignored);
            return false;
        }
        m_Socket.set_option(asio::socket_base::receive_buffer_size(256 * 1024), ec);
        if (ec) LogError("rx_rcvbuf", ec);

        const udp::endpoint local = m_Socket.local_endpoint(ec);
        m_BoundPort.store(ec ? m_Config.listenPort : local.port(), std::memory_order_relaxed);

        m_Reassembler.Reset();
        const uint64_t now = NowMicros();
        m_StartUs.store(now, std::memory_order_relaxed);
        m_NextLossReportUs = now + static_cast<uint64_t>(m_Config.lossReportPeriodMs) * 1000ull;
        m_RxWorker.Start([this] { ReceiveOnce(); });

        LOG_NETWORK("Receiver listening on port " + std::to_string(GetLocalPort()));
        return true;
    }

    bool AudioReceiver::StartPlayback(PlaybackSink& sink) {
        if (m_PlayWorker.IsRunning()) return true;
        if (!sink.Open(m_Config.sampleRate, m_Config.channels)) {
            LOG_ERROR("step=playback_start reason=sink_open_failed");
            return false;
        }
        m_Sink = &sink;
        m_PlayWorker.Start([this] { PlayOnce(); });
        LOG_AUDIO("Playback started");
        return true;
    }

    void AudioReceiver::Stop() {
        const bool wasActive = m_RxWorker.IsRunning() || m_PlayWorker.IsRunning() || m_Socket.is_open();
        const auto grace = std::chrono::milliseconds(Globals::WORKER_JOIN_GRACE_MS);

        m_RxWorker.Stop(grace);
        m_PlayWorker.Stop(grace);

        std::error_code ec;
        if (m_Socket.is_open()) m_Socket.close(ec);
        if (ec) LogError("rx_close", ec);

        if (m_Sink) {
            m_Sink->Close();
            m_Sink = nullptr;
        }
        m_Queue.Clear();
        if (wasActive) LOG_NETWORK("Receiver stopped");
    }

    void AudioReceiver::ReceiveOnce() {
        std::error_code rxError = asio::error::would_block;
        size_t rxBytes = 0;

        m_Socket.async_receive_from(asio::buffer(m_RecvArray), m_SenderEndpoint,
            [&rxError, &rxBytes](const std::error_code& ec, std::size_t n) {
                rxError = ec;
                rxBytes = n;
            });

        // Bounded wait so the running flag is observed at least every poll interval.
        m_Context.restart();
        m_Context.run_for(std::chrono::milliseconds(Globals::WORKER_POLL_MS));
        if (!m_Context.stopped()) {
            std::error_code ignored;
            m_Socket.cancel(ignored);
            m_Context.run();
        }

        const uint64_t now = NowMicros();
        if (!rxError) {
            HandleDatagram(m_RecvArray.data(), rxBytes, now);
        }
        else if (rxError != asio::error::operation_aborted) {
            m_ReceiveErrors.fetch_add(1, std::memory_order_relaxed);
            LogError("udp_recv_error", rxError);
        }
        RunMaintenance(now);
    }

    void AudioReceiver::HandleDatagram(const uint8_t* data, size_t length, uint64_t nowUs) {
        m_PacketsReceived.fetch_add(1, std::memory_order_relaxed);
        m_BytesReceived.fetch_add(length, std::memory_order_relaxed);

        DecodedPacket decoded = DecodePacket(data, length);
        if (!decoded.valid) {
            m_DecodeFailures[static_cast<size_t>(decoded.error)].fetch_add(1, std::memory_order_relaxed);
            char buf[96];
            std::snprintf(buf, sizeof(buf), "step=rx_drop reason=%s len=%zu",
                DecodeErrorName(decoded.error), length);
            Logger::Instance().LogPacketTrace(buf);
            return;
        }

        std::optional<AudioChunk> chunk = m_Reassembler.Accept(decoded.packet, nowUs);
        if (!chunk) return;

        const uint64_t captureUs = chunk->captureTimeUs;
        if (nowUs > captureUs) {
            m_LatencySumUs.fetch_add(nowUs - captureUs, std::memory_order_relaxed);
            m_LatencyCount.fetch_add(1, std::memory_order_relaxed);
        }
        if (m_Sync) m_Sync->RecordLatency(captureUs, nowUs);

        if (!m_Queue.TryPush(std::move(*chunk))) {
            char buf[96];
            std::snprintf(buf, sizeof(buf), "step=rx_queue_full seq=%u capacity=%zu",
                decoded.packet.frameSequence, m_Queue.Capacity());
            Logger::Instance().LogPacketTrace(buf);
        }
    }

    void AudioReceiver::ApplyHints() {
        if (!m_Hints) return;
        for (const BufferSizeHint& hint : m_Hints->Drain()) {
            if (hint.depth <= 0) continue;
            const size_t dropped = m_Queue.SetCapacity(static_cast<size_t>(hint.depth));
            m_HintsApplied.fetch_add(1, std::memory_order_relaxed);
            char buf[128];
            std::snprintf(buf, sizeof(buf), "Playback queue capacity %d -> %d (%s), dropped %zu",
                hint.previousDepth, hint.depth,
                hint.source == BufferSizeHint::Source::Forced ? "forced" : "adaptive", dropped);
            LOG_AUDIO(buf);
        }
    }

    void AudioReceiver::RunMaintenance(uint64_t nowUs) {
        ApplyHints();
        m_Reassembler.EvictStale(nowUs);

        if (nowUs < m_NextLossReportUs) return;
        m_NextLossReportUs = nowUs + static_cast<uint64_t>(m_Config.lossReportPeriodMs) * 1000ull;

        uint64_t completed = 0, lost = 0;
        m_Reassembler.TakeIntervalCounts(completed, lost);
        if (completed + lost == 0 || !m_Sync) return;
        m_Sync->RecordLossRate(100.0 * static_cast<double>(lost) / static_cast<double>(completed + lost));
    }

    void AudioReceiver::PlayOnce() {
        std::optional<AudioChunk> chunk = m_Queue.PopFor(std::chrono::milliseconds(Globals::WORKER_POLL_MS));
        if (!chunk) {
            m_Underruns.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        if (m_Sink) m_Sink->Write(*chunk);
        m_ChunksPlayed.fetch_add(1, std::memory_order_relaxed);
    }

    AudioReceiver::Stats AudioReceiver::GetStats() const {
        Stats s;
        s.receiving = m_RxWorker.IsRunning();
        s.playing = m_PlayWorker.IsRunning();
        s.packetsReceived = m_PacketsReceived.load(std::memory_order_relaxed);
        s.bytesReceived = m_BytesReceived.load(std::memory_order_relaxed);
        s.decodeTooShort = m_DecodeFailures[static_cast<size_t>(DecodeError::TooShort)].load(std::memory_order_relaxed);
        s.decodeBadMagic = m_DecodeFailures[static_cast<size_t>(DecodeError::BadMagic)].load(std::memory_order_relaxed);
        s.decodeLengthMismatch = m_DecodeFailures[static_cast<size_t>(DecodeError::LengthMismatch)].load(std::memory_order_relaxed);
        s.decodeBadFragmentInfo = m_DecodeFailures[static_cast<size_t>(DecodeError::BadFragmentInfo)].load(std::memory_order_relaxed);
        s.receiveErrors = m_ReceiveErrors.load(std::memory_order_relaxed);
        s.chunksPlayed = m_ChunksPlayed.load(std::memory_order_relaxed);
        s.underruns = m_Underruns.load(std::memory_order_relaxed);
        s.queueOverflows = m_Queue.Overflows();
        s.queueTrimmed = m_Queue.Trimmed();
        s.hintsApplied = m_HintsApplied.load(std::memory_order_relaxed);
        s.queueDepth = m_Queue.Size();
        s.queueCapacity = m_Queue.Capacity();
        s.reassembly = m_Reassembler.GetStats();

        const uint64_t latencyCount = m_LatencyCount.load(std::memory_order_relaxed);
        if (latencyCount > 0)
            s.meanLatencyMs = static_cast<double>(m_LatencySumUs.load(std::memory_order_relaxed))
                / static_cast<double>(latencyCount) / 1000.0;

        const uint64_t lost = s.reassembly.TotalFramesLost();
        const uint64_t accounted = s.reassembly.framesCompleted + lost;
        if (accounted > 0)
            s.lossRatePct = 100.0 * static_cast<double>(lost) / static_cast<double>(accounted);

        const uint64_t start = m_StartUs.load(std::memory_order_relaxed);
        if (start > 0 && s.receiving) {
            s.elapsedSec = static_cast<double>(NowMicros() - start) / 1e6;
            if (s.elapsedSec > 0.0)
                s.packetsPerSec = static_cast<double>(s.packetsReceived) / s.elapsedSec;
        }
        return s;
    }

} // namespace VoxLink
