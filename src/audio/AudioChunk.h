#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <utility>

namespace VoxLink {

    // One unit of captured audio: interleaved s16 samples plus the capture
    // timestamp (microseconds, monotonic clock of the capturing host).
    // Chunks move between pipeline stages; they are never shared.
    struct AudioChunk {
        std::vector<int16_t> samples;
        uint64_t captureTimeUs = 0;

        AudioChunk() = default;
        AudioChunk(std::vector<int16_t> s, uint64_t captureUs)
            : samples(std::move(s)), captureTimeUs(captureUs) {}

        size_t ByteSize() const { return samples.size() * sizeof(int16_t); }

        // Raw little-endian payload, as carried on the wire.
        std::vector<uint8_t> ToBytes() const;

        // Inverse of ToBytes(). A trailing odd byte is discarded.
        static AudioChunk FromBytes(const std::vector<uint8_t>& bytes, uint64_t captureUs);

        // RMS level in dBFS, -96 for silence or an empty chunk.
        [[nodiscard]] float LevelDb() const noexcept;

        // Playback duration at the given format; 0 when the format is invalid.
        [[nodiscard]] double DurationMs(int sampleRate, int channels) const noexcept;
    };

} // namespace VoxLink
