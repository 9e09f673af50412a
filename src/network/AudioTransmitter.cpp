#include "AudioTransmitter.h"
#include "WireCodec.h"
#include "../core/Globals.h"
#include "../core/Logger.h"
#include "../shared/Protocol.h"
#include <cstdio>

using asio::ip::udp;

namespace VoxLink {

    namespace {

        inline void LogError(const char* step, const char* detail) {
            char buf[256];
            std::snprintf(buf, sizeof(buf), "step=%s msg=%.200s", step, detail);
            LOG_ERROR(buf);
            Logger::Instance().LogPacketTrace(buf);
        }

        inline void LogError(const char* step, const std::error_code& ec) {
            LogError(step, ec.message().c_str());
        }

    } // namespace

    AudioTransmitter::AudioTransmitter(const Config& config)
        : m_Config(config), m_Socket(m_Context) {}

    AudioTransmitter::~AudioTransmitter() { Stop(); }

    bool AudioTransmitter::Start() {
        if (m_Worker.IsRunning()) return true;
        if (m_Config.maxPacketSize <= kPacketHeaderSize) {
            LogError("tx_start", "max packet size does not leave room for a payload");
            return false;
        }

        std::error_code ec;
        m_Socket.open(udp::v4(), ec);
        if (!ec) m_Socket.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec) m_Socket.bind(udp::endpoint(udp::v4(), m_Config.localPort), ec);
        if (ec) {
            LogError("tx_bind", ec);
            std::error_code ignored;
            if (m_Socket.is_open()) m_Socket.close(ignored);
            return false;
        }
        m_Socket.set_option(asio::socket_base::send_buffer_size(64 * 1024), ec);
        if (ec) LogError("tx_sndbuf", ec);

        const udp::endpoint local = m_Socket.local_endpoint(ec);
        m_BoundPort = ec ? m_Config.localPort : local.port();

        m_NextSequence = 0;
        m_PublishedSequence.store(0, std::memory_order_relaxed);
        m_StartUs.store(NowMicros(), std::memory_order_relaxed);
        m_Worker.Start([this] { TransmitOnce(); });

        LOG_NETWORK("Transmitter started on port " + std::to_string(m_BoundPort));
        return true;
    }

    void AudioTransmitter::Stop() {
        if (!m_Worker.IsRunning() && !m_Socket.is_open()) return;
        m_Worker.RequestStop();
        m_QueueCv.notify_all();
        m_Worker.Join(std::chrono::milliseconds(Globals::WORKER_JOIN_GRACE_MS));

        std::error_code ec;
        if (m_Socket.is_open()) m_Socket.close(ec);
        if (ec) LogError("tx_close", ec);
        {
            std::lock_guard<std::mutex> lk(m_QueueMutex);
            m_Queue.clear();
        }
        LOG_NETWORK("Transmitter stopped");
    }

    bool AudioTransmitter::SetTarget(const std::string& ip, uint16_t port) {
        std::error_code ec;
        const asio::ip::address address = asio::ip::make_address(ip, ec);
        if (ec || port == 0) {
            LOG_WARN("Rejected transmit target " + ip + ":" + std::to_string(port));
            return false;
        }
        std::lock_guard<std::mutex> lk(m_TargetMutex);
        m_Target = udp::endpoint(address, port);
        LOG_NETWORK("Transmit target set to " + ip + ":" + std::to_string(port));
        return true;
    }

    bool AudioTransmitter::HasTarget() const {
        std::lock_guard<std::mutex> lk(m_TargetMutex);
        return m_Target.has_value();
    }

    bool AudioTransmitter::Submit(AudioChunk chunk) {
        m_ChunksSubmitted.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lk(m_QueueMutex);
            if (m_Queue.size() >= m_Config.queueCapacity) {
                m_ChunksDropped.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            m_Queue.push_back(std::move(chunk));
        }
        m_QueueCv.notify_one();
        return true;
    }

    void AudioTransmitter::TransmitOnce() {
        AudioChunk chunk;
        {
            std::unique_lock<std::mutex> lk(m_QueueMutex);
            if (!m_QueueCv.wait_for(lk, std::chrono::milliseconds(Globals::WORKER_POLL_MS),
                [this] { return !m_Queue.empty() || !m_Worker.IsRunning(); }))
                return;
            if (m_Queue.empty()) return;
            chunk = std::move(m_Queue.front());
            m_Queue.pop_front();
        }

        std::optional<udp::endpoint> target;
        {
            std::lock_guard<std::mutex> lk(m_TargetMutex);
            target = m_Target;
        }
        if (!target) {
            m_ChunksUnroutable.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN("step=tx_discard reason=no_target");
            return;
        }
        SendChunk(chunk, *target);
    }

    void AudioTransmitter::SendChunk(const AudioChunk& chunk, const udp::endpoint& target) {
        const uint32_t sequence = m_NextSequence++;
        m_PublishedSequence.store(m_NextSequence, std::memory_order_relaxed);

        const auto fragments = BuildFragments(sequence, chunk.captureTimeUs, chunk.ToBytes(), MaxFragmentPayload());
        if (fragments.empty()) {
            m_ChunksOversized.fetch_add(1, std::memory_order_relaxed);
            LogError("tx_fragment", "chunk too large to fragment");
            return;
        }

        size_t fragmentsSent = 0;
        for (const auto& datagram : fragments) {
            std::error_code ec;
            const size_t sent = m_Socket.send_to(asio::buffer(datagram), target, 0, ec);
            if (ec) {
                m_SendErrors.fetch_add(1, std::memory_order_relaxed);
                LogError("udp_send_error", ec);
                continue;
            }
            m_PacketsSent.fetch_add(1, std::memory_order_relaxed);
            m_BytesSent.fetch_add(sent, std::memory_order_relaxed);
            ++fragmentsSent;
        }
        if (fragmentsSent == 0) return;
        m_ChunksSent.fetch_add(1, std::memory_order_relaxed);

        if (Logger::Instance().IsPacketTraceEnabled()) {
            char buf[128];
            std::snprintf(buf, sizeof(buf), "step=tx_chunk seq=%u fragments=%zu bytes=%zu",
                sequence, fragments.size(), chunk.ByteSize());
            Logger::Instance().LogPacketTrace(buf);
        }
    }

    bool AudioTransmitter::TestConnectivity(const std::string& ip, uint16_t port) {
        std::error_code ec;
        const asio::ip::address address = asio::ip::make_address(ip, ec);
        if (ec || port == 0) {
            LOG_WARN("Connectivity test: invalid address " + ip + ":" + std::to_string(port));
            return false;
        }

        asio::io_context context;
        udp::socket probe(context);
        probe.open(address.is_v6() ? udp::v6() : udp::v4(), ec);
        if (!ec)
            probe.send_to(asio::buffer(kConnectivityProbe, sizeof(kConnectivityProbe)),
                udp::endpoint(address, port), 0, ec);
        std::error_code ignored;
        if (probe.is_open()) probe.close(ignored);

        if (ec) {
            LOG_WARN("Connectivity test to " + ip + ":" + std::to_string(port) + " failed: " + ec.message());
            return false;
        }
        LOG_NETWORK("Connectivity test to " + ip + ":" + std::to_string(port) + " sent");
        return true;
    }

    size_t AudioTransmitter::MaxFragmentPayload() const {
        return m_Config.maxPacketSize > kPacketHeaderSize ? m_Config.maxPacketSize - kPacketHeaderSize : 0;
    }

    uint16_t AudioTransmitter::GetLocalPort() const { return m_BoundPort; }

    AudioTransmitter::Stats AudioTransmitter::GetStats() const {
        Stats s;
        s.running = m_Worker.IsRunning();
        s.packetsSent = m_PacketsSent.load(std::memory_order_relaxed);
        s.bytesSent = m_BytesSent.load(std::memory_order_relaxed);
        s.chunksSubmitted = m_ChunksSubmitted.load(std::memory_order_relaxed);
        s.chunksSent = m_ChunksSent.load(std::memory_order_relaxed);
        s.chunksDropped = m_ChunksDropped.load(std::memory_order_relaxed);
        s.chunksUnroutable = m_ChunksUnroutable.load(std::memory_order_relaxed);
        s.chunksOversized = m_ChunksOversized.load(std::memory_order_relaxed);
        s.sendErrors = m_SendErrors.load(std::memory_order_relaxed);
        s.nextFrameSequence = m_PublishedSequence.load(std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lk(m_QueueMutex);
            s.queueDepth = m_Queue.size();
        }
        const uint64_t start = m_StartUs.load(std::memory_order_relaxed);
        if (start > 0 && s.running) {
            s.elapsedSec = static_cast<double>(NowMicros() - start) / 1e6;
            if (s.elapsedSec > 0.0) {
                s.packetsPerSec = static_cast<double>(s.packetsSent) / s.elapsedSec;
                s.bytesPerSec = static_cast<double>(s.bytesSent) / s.elapsedSec;
            }
        }
        return s;
    }

} // namespace VoxLink
