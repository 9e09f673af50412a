#pragma once
#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include "AudioDevice.h"
#include "../core/WorkerThread.h"

namespace VoxLink {

    // Reads raw s16le PCM and emits it in framesPerBuffer chunks at the
    // real-time rate. Loops to the start of the file at EOF when `loop` is set.
    class PcmFileSource : public CaptureSource {
    public:
        PcmFileSource(std::string path, int sampleRate, int channels, int framesPerBuffer, bool loop = true);
        ~PcmFileSource() override;

        bool Start(ChunkCallback onChunk) override;
        void Stop() override;
        bool IsRunning() const override { return m_Worker.IsRunning(); }

        uint64_t ChunksProduced() const { return m_ChunksProduced.load(std::memory_order_relaxed); }

    private:
        bool ReadChunk(std::vector<int16_t>& samples);

        const std::string m_Path;
        const int  m_SampleRate;
        const int  m_Channels;
        const int  m_FramesPerBuffer;
        const bool m_Loop;

        std::ifstream m_File;
        ChunkCallback m_OnChunk;
        uint64_t      m_NextDueUs = 0;
        std::atomic<uint64_t> m_ChunksProduced{ 0 };
        WorkerThread  m_Worker{ "capture" };
    };

    // Appends every played chunk to a raw s16le PCM file.
    class PcmFileSink : public PlaybackSink {
    public:
        explicit PcmFileSink(std::string path) : m_Path(std::move(path)) {}
        ~PcmFileSink() override { Close(); }

        bool Open(int sampleRate, int channels) override;
        void Write(const AudioChunk& chunk) override;
        void Close() override;

        uint64_t BytesWritten() const { return m_BytesWritten.load(std::memory_order_relaxed); }

    private:
        const std::string m_Path;
        std::mutex        m_Mutex;
        std::ofstream     m_File;
        std::atomic<uint64_t> m_BytesWritten{ 0 };
    };

} // namespace VoxLink
