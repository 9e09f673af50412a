#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <asio.hpp>
#include "Reassembler.h"
#include "WireCodec.h"
#include "../audio/AdaptiveSynchronizer.h"
#include "../audio/AudioDevice.h"
#include "../audio/PlaybackQueue.h"
#include "../core/WorkerThread.h"
#include "../shared/Channel.h"

namespace VoxLink {

    // Receiving half of the pipeline. The receive worker decodes datagrams,
    // feeds the reassembler and pushes completed chunks into the playback
    // queue; the playback worker drains that queue into the sink. Buffer-depth
    // hints from the synchronizer arrive on the hint channel and are applied
    // on the receive worker between datagrams.
    class AudioReceiver {
    public:
        struct Config {
            uint16_t listenPort = 5001;
            int      sampleRate = 44100;
            int      channels = 1;
            uint64_t reassemblyTimeoutUs = 500000;
            size_t   maxPendingFrames = 256;
            int      lossReportPeriodMs = 1000;
        };

        struct Stats {
            bool     receiving = false;
            bool     playing = false;
            uint64_t packetsReceived = 0;
            uint64_t bytesReceived = 0;
            uint64_t decodeTooShort = 0;
            uint64_t decodeBadMagic = 0;
            uint64_t decodeLengthMismatch = 0;
            uint64_t decodeBadFragmentInfo = 0;
            uint64_t receiveErrors = 0;
            uint64_t chunksPlayed = 0;
            uint64_t underruns = 0;
            uint64_t queueOverflows = 0;
            uint64_t queueTrimmed = 0;
            uint64_t hintsApplied = 0;
            size_t   queueDepth = 0;
            size_t   queueCapacity = 0;
            double   meanLatencyMs = 0.0;
            double   lossRatePct = 0.0;
            double   elapsedSec = 0.0;
            double   packetsPerSec = 0.0;
            Reassembler::Stats reassembly;

            uint64_t DecodeFailures() const {
                return decodeTooShort + decodeBadMagic + decodeLengthMismatch + decodeBadFragmentInfo;
            }
        };

        // `sync` may be null (no latency feedback); `hints` may be null (fixed capacity).
        AudioReceiver(const Config& config, size_t initialCapacity,
            std::shared_ptr<AdaptiveSynchronizer> sync,
            std::shared_ptr<BufferHintChannel> hints);
        ~AudioReceiver();

        AudioReceiver(const AudioReceiver&) = delete;
        AudioReceiver& operator=(const AudioReceiver&) = delete;

        // Binds the listen port (0 picks an ephemeral port) and starts the receive worker.
        bool StartReception();
        // Opens the sink and starts the playback worker. The sink must outlive Stop().
        bool StartPlayback(PlaybackSink& sink);
        void Stop();

        bool IsReceiving() const { return m_RxWorker.IsRunning(); }
        bool IsPlaying() const { return m_PlayWorker.IsRunning(); }
        uint16_t GetLocalPort() const { return m_BoundPort.load(std::memory_order_relaxed); }

        // Decodes and processes one datagram. The receive worker calls this for
        // every read; exposed so tests can inject datagrams without a socket.
        void HandleDatagram(const uint8_t* data, size_t length, uint64_t nowUs);

        // Applies pending buffer hints, evicts stale reassembly entries and
        // reports interval loss when due. Called once per receive-loop pass.
        void RunMaintenance(uint64_t nowUs);

        PlaybackQueue& Queue() { return m_Queue; }
        Stats GetStats() const;

    private:
        void ReceiveOnce();
        void PlayOnce();
        void ApplyHints();

        static constexpr size_t kRecvBufferSize = 65536;

        const Config m_Config;
        std::shared_ptr<AdaptiveSynchronizer> m_Sync;
        std::shared_ptr<BufferHintChannel>    m_Hints;

        asio::io_context                     m_Context;
        asio::ip::udp::socket                m_Socket;
        asio::ip::udp::endpoint              m_SenderEndpoint;
        std::array<uint8_t, kRecvBufferSize> m_RecvArray{};
        std::atomic<uint16_t>                m_BoundPort{ 0 };

        Reassembler   m_Reassembler;
        PlaybackQueue m_Queue;
        PlaybackSink* m_Sink = nullptr;

        uint64_t m_NextLossReportUs = 0;    // receive worker only
        std::atomic<uint64_t> m_StartUs{ 0 };

        std::atomic<uint64_t> m_PacketsReceived{ 0 };
        std::atomic<uint64_t> m_BytesReceived{ 0 };
        std::atomic<uint64_t> m_DecodeFailures[5]{};
        std::atomic<uint64_t> m_ReceiveErrors{ 0 };
        std::atomic<uint64_t> m_ChunksPlayed{ 0 };
        std::atomic<uint64_t> m_Underruns{ 0 };
        std::atomic<uint64_t> m_HintsApplied{ 0 };
        std::atomic<uint64_t> m_LatencySumUs{ 0 };
        std::atomic<uint64_t> m_LatencyCount{ 0 };

        WorkerThread m_RxWorker{ "receive" };
        WorkerThread m_PlayWorker{ "playback" };
    };

} // namespace VoxLink
