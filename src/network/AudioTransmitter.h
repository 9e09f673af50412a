#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <asio.hpp>
#include "../audio/AudioChunk.h"
#include "../core/WorkerThread.h"

namespace VoxLink {

    // Sending half of the pipeline. Submit() queues a chunk without blocking;
    // the transmit worker splits it into fragments that share one frame
    // sequence and sends each as its own datagram (synchronous send_to).
    class AudioTransmitter {
    public:
        struct Config {
            uint16_t localPort = 5000;
            size_t   maxPacketSize = 1400;
            size_t   queueCapacity = 50;
        };

        struct Stats {
            bool     running = false;
            uint64_t packetsSent = 0;
            uint64_t bytesSent = 0;
            uint64_t chunksSubmitted = 0;
            uint64_t chunksSent = 0;
            uint64_t chunksDropped = 0;      // send queue full
            uint64_t chunksUnroutable = 0;   // no target configured
            uint64_t chunksOversized = 0;    // needs more fragments than the header can count
            uint64_t sendErrors = 0;
            size_t   queueDepth = 0;
            uint32_t nextFrameSequence = 0;
            double   elapsedSec = 0.0;
            double   packetsPerSec = 0.0;
            double   bytesPerSec = 0.0;
        };

        explicit AudioTransmitter(const Config& config);
        ~AudioTransmitter();

        AudioTransmitter(const AudioTransmitter&) = delete;
        AudioTransmitter& operator=(const AudioTransmitter&) = delete;

        // Binds the local port and starts the transmit worker. On failure nothing
        // is left open and Start() may be retried.
        bool Start();
        void Stop();
        bool IsRunning() const { return m_Worker.IsRunning(); }

        // Rejects addresses that do not parse.
        bool SetTarget(const std::string& ip, uint16_t port);
        bool HasTarget() const;

        // Never blocks. Returns false when the queue is full and the chunk was dropped.
        bool Submit(AudioChunk chunk);

        // Sends a probe datagram from a throw-away socket. UDP gives no
        // acknowledgement, so success only means the send was accepted locally.
        static bool TestConnectivity(const std::string& ip, uint16_t port);

        size_t MaxFragmentPayload() const;
        uint16_t GetLocalPort() const;
        Stats GetStats() const;

    private:
        void TransmitOnce();
        void SendChunk(const AudioChunk& chunk, const asio::ip::udp::endpoint& target);

        const Config m_Config;

        asio::io_context      m_Context;
        asio::ip::udp::socket m_Socket;
        uint16_t              m_BoundPort = 0;

        mutable std::mutex m_TargetMutex;
        std::optional<asio::ip::udp::endpoint> m_Target;

        mutable std::mutex      m_QueueMutex;
        std::condition_variable m_QueueCv;
        std::deque<AudioChunk>  m_Queue;

        uint32_t m_NextSequence = 0;   // transmit worker only
        std::atomic<uint32_t> m_PublishedSequence{ 0 };
        std::atomic<uint64_t> m_StartUs{ 0 };

        std::atomic<uint64_t> m_PacketsSent{ 0 };
        std::atomic<uint64_t> m_BytesSent{ 0 };
        std::atomic<uint64_t> m_ChunksSubmitted{ 0 };
        std::atomic<uint64_t> m_ChunksSent{ 0 };
        std::atomic<uint64_t> m_ChunksDropped{ 0 };
        std::atomic<uint64_t> m_ChunksUnroutable{ 0 };
        std::atomic<uint64_t> m_ChunksOversized{ 0 };
        std::atomic<uint64_t> m_SendErrors{ 0 };

        WorkerThread m_Worker{ "transmit" };
    };

} // namespace VoxLink
