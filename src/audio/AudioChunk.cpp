#include "AudioChunk.h"
#include <cmath>
#include <algorithm>

namespace VoxLink {

    std::vector<uint8_t> AudioChunk::ToBytes() const {
        std::vector<uint8_t> out;
        out.reserve(ByteSize());
        for (int16_t s : samples) {
            const uint16_t u = static_cast<uint16_t>(s);
            out.push_back(static_cast<uint8_t>(u & 0xFF));
            out.push_back(static_cast<uint8_t>(u >> 8));
        }
        return out;
    }

    AudioChunk AudioChunk::FromBytes(const std::vector<uint8_t>& bytes, uint64_t captureUs) {
        AudioChunk chunk;
        chunk.captureTimeUs = captureUs;
        const size_t count = bytes.size() / 2;
        chunk.samples.resize(count);
        for (size_t i = 0; i < count; ++i) {
            const uint16_t u = static_cast<uint16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
            chunk.samples[i] = static_cast<int16_t>(u);
        }
        return chunk;
    }

    float AudioChunk::LevelDb() const noexcept {
        if (samples.empty()) return -96.0f;
        double sum = 0.0;
        for (int16_t s : samples) sum += static_cast<double>(s) * s;
        const double rms = std::sqrt(sum / static_cast<double>(samples.size()));
        if (rms <= 0.0) return -96.0f;
        const double db = 20.0 * std::log10(rms / 32767.0);
        return static_cast<float>((std::max)(db, -96.0));
    }

    double AudioChunk::DurationMs(int sampleRate, int channels) const noexcept {
        if (sampleRate <= 0 || channels <= 0) return 0.0;
        const double frames = static_cast<double>(samples.size()) / channels;
        return frames * 1000.0 / sampleRate;
    }

} // namespace VoxLink
