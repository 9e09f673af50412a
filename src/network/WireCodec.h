#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>
#include "../shared/Protocol.h"

namespace VoxLink {

    enum class DecodeError : uint8_t {
        None = 0,
        TooShort,          // fewer bytes than a header
        BadMagic,          // not one of ours
        LengthMismatch,    // payload_length disagrees with the trailing byte count
        BadFragmentInfo    // total_fragments == 0 or fragment_index >= total_fragments
    };

    const char* DecodeErrorName(DecodeError e) noexcept;

    // One decoded datagram. The payload is a copy; the receive buffer can be reused.
    struct AudioPacket {
        uint32_t frameSequence = 0;
        uint64_t captureTimeUs = 0;
        uint16_t fragmentIndex = 0;
        uint16_t totalFragments = 0;
        std::vector<uint8_t> payload;
    };

    struct DecodedPacket {
        AudioPacket packet;
        DecodeError error = DecodeError::None;
        bool valid = false;
    };

    // Header + payload for one fragment. The caller guarantees
    // fragmentIndex < totalFragments and that the payload fits the datagram.
    std::vector<uint8_t> EncodePacket(uint32_t frameSequence, uint64_t captureTimeUs,
        uint16_t fragmentIndex, uint16_t totalFragments,
        const uint8_t* payload, size_t payloadLength);

    inline std::vector<uint8_t> EncodePacket(uint32_t frameSequence, uint64_t captureTimeUs,
        uint16_t fragmentIndex, uint16_t totalFragments, const std::vector<uint8_t>& payload) {
        return EncodePacket(frameSequence, captureTimeUs, fragmentIndex, totalFragments,
            payload.data(), payload.size());
    }

    // Never throws for malformed input; inspect .valid / .error.
    DecodedPacket DecodePacket(const uint8_t* data, size_t length);

    inline DecodedPacket DecodePacket(const std::vector<uint8_t>& bytes) {
        return DecodePacket(bytes.data(), bytes.size());
    }

    // ceil(payloadBytes / maxFragmentPayload), at least 1 (an empty chunk still
    // travels as one empty fragment). Returns 0 if maxFragmentPayload is 0.
    [[nodiscard]] size_t FragmentCount(size_t payloadBytes, size_t maxFragmentPayload) noexcept;

    // Splits a chunk's payload into encoded datagrams, all carrying the same
    // frame sequence. Returns an empty vector when the payload needs more
    // fragments than the 16-bit fragment fields can describe.
    std::vector<std::vector<uint8_t>> BuildFragments(uint32_t frameSequence, uint64_t captureTimeUs,
        const std::vector<uint8_t>& payload, size_t maxFragmentPayload);

} // namespace VoxLink
