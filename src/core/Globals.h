#pragma once
#include <chrono>
#include <cstdint>

namespace VoxLink {
    namespace Globals {
        // Session-wide audio format. Every chunk on the wire is raw signed
        // 16-bit little-endian PCM at these settings.
        constexpr int SAMPLE_RATE_DEFAULT = 44100;
        constexpr int CHANNELS_DEFAULT = 1;
        constexpr int BYTES_PER_SAMPLE = 2;
        constexpr int FRAMES_PER_BUFFER_DEFAULT = 1024;

        // Network
        constexpr uint16_t LISTEN_PORT_DEFAULT = 5001;
        constexpr int MAX_PACKET_SIZE_DEFAULT = 1400;
        constexpr int MAX_UDP_PAYLOAD = 65507;

        // Worker loops wake at least this often to observe a stop request.
        constexpr int WORKER_POLL_MS = 100;
        // Grace period a Stop() gives a worker before reporting it as stuck.
        constexpr int WORKER_JOIN_GRACE_MS = 2000;
    }

    // Monotonic microsecond clock used for capture and arrival timestamps.
    inline uint64_t NowMicros() noexcept {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }
}
