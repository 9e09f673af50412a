#include "WireCodec.h"
#include <algorithm>
#include <iterator>
#include <limits>

namespace VoxLink {

    const char* DecodeErrorName(DecodeError e) noexcept {
        switch (e) {
        case DecodeError::None:            return "none";
        case DecodeError::TooShort:        return "too_short";
        case DecodeError::BadMagic:        return "bad_magic";
        case DecodeError::LengthMismatch:  return "length_mismatch";
        case DecodeError::BadFragmentInfo: return "bad_fragment_info";
        }
        return "unknown";
    }

    std::vector<uint8_t> EncodePacket(uint32_t frameSequence, uint64_t captureTimeUs,
        uint16_t fragmentIndex, uint16_t totalFragments,
        const uint8_t* payload, size_t payloadLength)
    {
        std::vector<uint8_t> out;
        out.reserve(kPacketHeaderSize + payloadLength);
        out.insert(out.end(), std::begin(kPacketMagic), std::end(kPacketMagic));
        AppendBE(out, frameSequence);
        AppendBE(out, captureTimeUs);
        AppendBE(out, fragmentIndex);
        AppendBE(out, totalFragments);
        AppendBE(out, static_cast<uint32_t>(payloadLength));
        if (payloadLength > 0) out.insert(out.end(), payload, payload + payloadLength);
        return out;
    }

    DecodedPacket DecodePacket(const uint8_t* data, size_t length) {
        DecodedPacket out;
        if (!data || length < kPacketHeaderSize) {
            out.error = DecodeError::TooShort;
            return out;
        }
        if (!std::equal(std::begin(kPacketMagic), std::end(kPacketMagic), data + WireOffset::Magic)) {
            out.error = DecodeError::BadMagic;
            return out;
        }

        const uint32_t declared = ReadU32BE(data + WireOffset::PayloadLength);
        if (declared != length - kPacketHeaderSize) {
            out.error = DecodeError::LengthMismatch;
            return out;
        }

        const uint16_t index = ReadU16BE(data + WireOffset::FragmentIndex);
        const uint16_t total = ReadU16BE(data + WireOffset::TotalFragments);
        if (total == 0 || index >= total) {
            out.error = DecodeError::BadFragmentInfo;
            return out;
        }

        out.packet.payload.assign(data + kPacketHeaderSize, data + length);
        out.packet.frameSequence = ReadU32BE(data + WireOffset::FrameSequence);
        out.packet.captureTimeUs = ReadU64BE(data + WireOffset::CaptureTime);
        out.packet.fragmentIndex = index;
        out.packet.totalFragments = total;
        out.valid = true;
        return out;
    }

    size_t FragmentCount(size_t payloadBytes, size_t maxFragmentPayload) noexcept {
        if (maxFragmentPayload == 0) return 0;
        if (payloadBytes == 0) return 1;
        return (payloadBytes + maxFragmentPayload - 1) / maxFragmentPayload;
    }

    std::vector<std::vector<uint8_t>> BuildFragments(uint32_t frameSequence, uint64_t captureTimeUs,
        const std::vector<uint8_t>& payload, size_t maxFragmentPayload)
    {
        std::vector<std::vector<uint8_t>> fragments;
        const size_t total = FragmentCount(payload.size(), maxFragmentPayload);
        if (total == 0 || total > (std::numeric_limits<uint16_t>::max)()) return fragments;

        fragments.reserve(total);
        for (size_t i = 0; i < total; ++i) {
            const size_t start = i * maxFragmentPayload;
            const size_t len = (std::min)(maxFragmentPayload, payload.size() - (std::min)(start, payload.size()));
            fragments.push_back(EncodePacket(frameSequence, captureTimeUs,
                static_cast<uint16_t>(i), static_cast<uint16_t>(total),
                payload.data() + (std::min)(start, payload.size()), len));
        }
        return fragments;
    }

} // namespace VoxLink
