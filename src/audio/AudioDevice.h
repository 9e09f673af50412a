#pragma once
#include <functional>
#include "AudioChunk.h"

namespace VoxLink {

    // Produces captured chunks on its own thread. The callback must not block.
    class CaptureSource {
    public:
        using ChunkCallback = std::function<void(AudioChunk)>;

        virtual ~CaptureSource() = default;
        virtual bool Start(ChunkCallback onChunk) = 0;
        virtual void Stop() = 0;
        virtual bool IsRunning() const = 0;
    };

    // Consumes reassembled chunks. Write() is called from the playback worker only.
    class PlaybackSink {
    public:
        virtual ~PlaybackSink() = default;
        virtual bool Open(int sampleRate, int channels) = 0;
        virtual void Write(const AudioChunk& chunk) = 0;
        virtual void Close() = 0;
    };

} // namespace VoxLink
