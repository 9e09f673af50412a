#include "PcmFileDevice.h"
#include "../core/Globals.h"
#include "../core/Logger.h"
#include <algorithm>
#include <thread>

namespace VoxLink {

    PcmFileSource::PcmFileSource(std::string path, int sampleRate, int channels, int framesPerBuffer, bool loop)
        : m_Path(std::move(path))
        , m_SampleRate(sampleRate > 0 ? sampleRate : Globals::SAMPLE_RATE_DEFAULT)
        , m_Channels(channels > 0 ? channels : Globals::CHANNELS_DEFAULT)
        , m_FramesPerBuffer(framesPerBuffer > 0 ? framesPerBuffer : Globals::FRAMES_PER_BUFFER_DEFAULT)
        , m_Loop(loop)
    {
    }

    PcmFileSource::~PcmFileSource() { Stop(); }

    bool PcmFileSource::ReadChunk(std::vector<int16_t>& samples) {
        const size_t wantBytes = static_cast<size_t>(m_FramesPerBuffer) * m_Channels * Globals::BYTES_PER_SAMPLE;
        std::vector<uint8_t> bytes(wantBytes);
        m_File.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(wantBytes));
        size_t got = static_cast<size_t>(m_File.gcount());
        if (got < wantBytes && m_Loop) {
            m_File.clear();
            m_File.seekg(0);
            m_File.read(reinterpret_cast<char*>(bytes.data() + got), static_cast<std::streamsize>(wantBytes - got));
            got += static_cast<size_t>(m_File.gcount());
        }
        if (got == 0) return false;
        bytes.resize(got);
        samples = AudioChunk::FromBytes(bytes, 0).samples;
        return true;
    }

    bool PcmFileSource::Start(ChunkCallback onChunk) {
        if (m_Worker.IsRunning()) return true;
        if (m_File.is_open()) m_File.close();
        m_File.open(m_Path, std::ios::binary);
        if (!m_File.is_open()) {
            LOG_ERROR("step=capture_open reason=open_failed path=" + m_Path);
            return false;
        }
        m_OnChunk = std::move(onChunk);
        m_NextDueUs = NowMicros();

        const uint64_t periodUs = static_cast<uint64_t>(m_FramesPerBuffer) * 1000000ull / static_cast<uint64_t>(m_SampleRate);
        m_Worker.Start([this, periodUs] {
            const uint64_t now = NowMicros();
            if (now < m_NextDueUs) {
                const uint64_t waitUs = (std::min<uint64_t>)(m_NextDueUs - now,
                    static_cast<uint64_t>(Globals::WORKER_POLL_MS) * 1000ull);
                std::this_thread::sleep_for(std::chrono::microseconds(waitUs));
                return;
            }
            m_NextDueUs += periodUs;
            // Fell more than a second behind (suspended process): resync instead of bursting.
            if (now > m_NextDueUs + 1000000ull) m_NextDueUs = now + periodUs;

            std::vector<int16_t> samples;
            if (!ReadChunk(samples)) {
                LOG_AUDIO("Capture file exhausted: " + m_Path);
                m_Worker.RequestStop();
                return;
            }
            m_ChunksProduced.fetch_add(1, std::memory_order_relaxed);
            if (m_OnChunk) m_OnChunk(AudioChunk(std::move(samples), now));
        });
        LOG_AUDIO("Capture started from " + m_Path);
        return true;
    }

    void PcmFileSource::Stop() {
        m_Worker.Stop(std::chrono::milliseconds(Globals::WORKER_JOIN_GRACE_MS));
        if (m_File.is_open()) m_File.close();
    }

    bool PcmFileSink::Open(int sampleRate, int channels) {
        std::lock_guard<std::mutex> lk(m_Mutex);
        if (m_File.is_open()) return true;
        m_File.open(m_Path, std::ios::binary | std::ios::app);
        if (!m_File.is_open()) {
            LOG_ERROR("step=playback_open reason=open_failed path=" + m_Path);
            return false;
        }
        LOG_AUDIO("Playback to " + m_Path + " rate=" + std::to_string(sampleRate)
            + " channels=" + std::to_string(channels));
        return true;
    }

    void PcmFileSink::Write(const AudioChunk& chunk) {
        const std::vector<uint8_t> bytes = chunk.ToBytes();
        std::lock_guard<std::mutex> lk(m_Mutex);
        if (!m_File.is_open()) return;
        m_File.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        m_BytesWritten.fetch_add(bytes.size(), std::memory_order_relaxed);
    }

    void PcmFileSink::Close() {
        std::lock_guard<std::mutex> lk(m_Mutex);
        if (m_File.is_open()) m_File.close();
    }

} // namespace VoxLink
