#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace VoxLink {

    // ---------------------------------------------------------------------------
    // Endianness helpers. Wire fields are big-endian (network order); audio
    // samples inside the payload stay little-endian.
    // ---------------------------------------------------------------------------
    namespace detail {
        inline bool IsLittleEndian() noexcept {
            static constexpr uint32_t kOne = 1u;
            uint8_t b;
            std::memcpy(&b, &kOne, 1);
            return b == 1u;
        }
    }

    inline uint32_t Swap32(uint32_t v) noexcept {
        return ((v & 0xFFU) << 24) | ((v & 0xFF00U) << 8)
            | ((v & 0xFF0000U) >> 8) | ((v & 0xFF000000U) >> 24);
    }

    inline uint64_t Swap64(uint64_t v) noexcept {
        return ((v & 0xFFULL) << 56) | ((v & 0xFF00ULL) << 40)
            | ((v & 0xFF0000ULL) << 24) | ((v & 0xFF000000ULL) << 8)
            | ((v & 0xFF00000000ULL) >> 8) | ((v & 0xFF0000000000ULL) >> 24)
            | ((v & 0xFF000000000000ULL) >> 40) | ((v & 0xFF00000000000000ULL) >> 56);
    }

    inline uint32_t HostToNet32(uint32_t v) noexcept {
        return detail::IsLittleEndian() ? Swap32(v) : v;
    }

    inline uint64_t HostToNet64(uint64_t v) noexcept {
        return detail::IsLittleEndian() ? Swap64(v) : v;
    }

    // Append a value in big-endian order.
    inline void AppendBE(std::vector<uint8_t>& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    inline void AppendBE(std::vector<uint8_t>& out, uint32_t value) {
        uint32_t net = HostToNet32(value);
        uint8_t  tmp[4];
        std::memcpy(tmp, &net, 4);
        for (uint8_t b : tmp) out.push_back(b);
    }

    inline void AppendBE(std::vector<uint8_t>& out, uint64_t value) {
        uint64_t net = HostToNet64(value);
        uint8_t  tmp[8];
        std::memcpy(tmp, &net, 8);
        for (uint8_t b : tmp) out.push_back(b);
    }

    // The shift loops produce the host-order result directly.
    inline uint16_t ReadU16BE(const uint8_t* p) noexcept {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    }

    inline uint32_t ReadU32BE(const uint8_t* p) noexcept {
        return (static_cast<uint32_t>(p[0]) << 24) |
            (static_cast<uint32_t>(p[1]) << 16) |
            (static_cast<uint32_t>(p[2]) << 8) |
            static_cast<uint32_t>(p[3]);
    }

    inline uint64_t ReadU64BE(const uint8_t* p) noexcept {
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | static_cast<uint64_t>(p[i]);
        return v;
    }

    // ---------------------------------------------------------------------------
    // Audio datagram layout (all header fields big-endian):
    //
    //   offset  size  field
    //   0       4     magic            "VXLK"
    //   4       4     frame_sequence   one value per audio chunk
    //   8       8     capture_time_us  sender's monotonic clock
    //   16      2     fragment_index   0-based
    //   18      2     total_fragments  >= 1
    //   20      4     payload_length   bytes following the header
    //   24      ...   payload          s16le samples
    // ---------------------------------------------------------------------------
    constexpr uint8_t kPacketMagic[4] = { 'V', 'X', 'L', 'K' };
    constexpr size_t  kPacketHeaderSize = 24;

    namespace WireOffset {
        constexpr size_t Magic = 0;
        constexpr size_t FrameSequence = 4;
        constexpr size_t CaptureTime = 8;
        constexpr size_t FragmentIndex = 16;
        constexpr size_t TotalFragments = 18;
        constexpr size_t PayloadLength = 20;
    }

    // Sent by TestConnectivity(); shorter than a header, so receivers drop it as TooShort.
    constexpr uint8_t kConnectivityProbe[] = { 'V', 'X', 'L', 'K', '_', 'P', 'R', 'O', 'B', 'E' };

} // namespace VoxLink
