#include "unit_test.h"
#include "../src/network/Reassembler.h"
#include <vector>

using namespace VoxLink;

static AudioPacket Packet(uint32_t seq, uint16_t index, uint16_t total, std::vector<uint8_t> payload = { 1, 0 }) {
    AudioPacket p;
    p.frameSequence = seq;
    p.captureTimeUs = 1000ull * seq;
    p.fragmentIndex = index;
    p.totalFragments = total;
    p.payload = std::move(payload);
    return p;
}

static Reassembler::Config DefaultConfig() {
    Reassembler::Config c;
    c.reassemblyTimeoutUs = 500000;
    c.maxPendingFrames = 256;
    return c;
}

static void SingleFragmentFrameCompletesImmediately() {
    Reassembler r(DefaultConfig());
    auto chunk = r.Accept(Packet(10, 0, 1, { 0x34, 0x12, 0xFF, 0xFF }), 0);
    ASSERT_TRUE(chunk.has_value());
    ASSERT_TRUE(chunk->samples.size() == 2);
    ASSERT_TRUE(chunk->samples[0] == 0x1234);
    ASSERT_TRUE(chunk->samples[1] == -1);
    ASSERT_TRUE(chunk->captureTimeUs == 10000ull);
    ASSERT_TRUE(r.GetStats().pendingFrames == 0);
    ASSERT_TRUE(r.GetStats().framesCompleted == 1);
}

static void GapAccountingCountsMissingSequences() {
    Reassembler r(DefaultConfig());
    for (uint32_t seq : { 1u, 2u, 4u, 5u })
        ASSERT_TRUE(r.Accept(Packet(seq, 0, 1), 0).has_value());
    const auto s = r.GetStats();
    ASSERT_TRUE(s.framesLostToGaps == 1) << s.framesLostToGaps;
    ASSERT_TRUE(s.hasLastSeen && s.lastSeenSequence == 5);
}

static void FirstPacketDoesNotCountLoss() {
    Reassembler r(DefaultConfig());
    ASSERT_TRUE(r.Accept(Packet(1000, 0, 1), 0).has_value());
    ASSERT_TRUE(r.GetStats().framesLostToGaps == 0);
}

static void SequenceWrapIsNotAGap() {
    Reassembler r(DefaultConfig());
    ASSERT_TRUE(r.Accept(Packet(0xFFFFFFFEu, 0, 1), 0).has_value());
    ASSERT_TRUE(r.Accept(Packet(0xFFFFFFFFu, 0, 1), 0).has_value());
    ASSERT_TRUE(r.Accept(Packet(0u, 0, 1), 0).has_value());
    auto s = r.GetStats();
    ASSERT_TRUE(s.framesLostToGaps == 0) << s.framesLostToGaps;
    ASSERT_TRUE(s.lastSeenSequence == 0);

    // 1 and 2 missing after the wrap.
    ASSERT_TRUE(r.Accept(Packet(3u, 0, 1), 0).has_value());
    s = r.GetStats();
    ASSERT_TRUE(s.framesLostToGaps == 2) << s.framesLostToGaps;
    ASSERT_TRUE(s.lastSeenSequence == 3);

    uint64_t completed = 0, lost = 0;
    r.TakeIntervalCounts(completed, lost);
    ASSERT_TRUE(lost == 2) << lost;
}

static void OutOfOrderArrivalDoesNotRewindLastSeen() {
    Reassembler r(DefaultConfig());
    r.Accept(Packet(1, 0, 1), 0);
    r.Accept(Packet(3, 0, 1), 0);
    r.Accept(Packet(2, 0, 1), 0);
    const auto s = r.GetStats();
    ASSERT_TRUE(s.lastSeenSequence == 3);
    ASSERT_TRUE(s.framesLostToGaps == 1);
    ASSERT_TRUE(s.framesCompleted == 3);
}

static void FragmentsReassembleInIndexOrder() {
    Reassembler r(DefaultConfig());
    ASSERT_TRUE(!r.Accept(Packet(7, 2, 3, { 5, 0 }), 0).has_value());
    ASSERT_TRUE(!r.Accept(Packet(7, 0, 3, { 1, 0, 2, 0 }), 10).has_value());
    ASSERT_TRUE(r.GetStats().pendingFrames == 1);
    auto chunk = r.Accept(Packet(7, 1, 3, { 3, 0, 4, 0 }), 20);
    ASSERT_TRUE(chunk.has_value());
    ASSERT_TRUE((chunk->samples == std::vector<int16_t>{ 1, 2, 3, 4, 5 }));
    ASSERT_TRUE(r.GetStats().pendingFrames == 0);
}

static void DuplicateAndInconsistentFragmentsAreIgnored() {
    Reassembler r(DefaultConfig());
    r.Accept(Packet(1, 0, 2), 0);
    ASSERT_TRUE(!r.Accept(Packet(1, 0, 2), 0).has_value());
    ASSERT_TRUE(!r.Accept(Packet(1, 1, 3), 0).has_value());
    auto s = r.GetStats();
    ASSERT_TRUE(s.duplicateFragments == 1);
    ASSERT_TRUE(s.inconsistentFragments == 1);
    ASSERT_TRUE(r.Accept(Packet(1, 1, 2), 0).has_value());
}

static void LateFragmentsOfClosedFramesAreDropped() {
    Reassembler r(DefaultConfig());
    ASSERT_TRUE(r.Accept(Packet(1, 0, 1), 0).has_value());
    ASSERT_TRUE(!r.Accept(Packet(1, 0, 1), 0).has_value());
    ASSERT_TRUE(r.GetStats().lateFragments == 1);
    ASSERT_TRUE(r.GetStats().pendingFrames == 0);
}

static void StaleEntriesAreEvictedAndCountedLost() {
    Reassembler r(DefaultConfig());
    r.Accept(Packet(1, 0, 2), 0);
    ASSERT_TRUE(r.EvictStale(400000) == 0);
    ASSERT_TRUE(r.EvictStale(600000) == 1);
    auto s = r.GetStats();
    ASSERT_TRUE(s.pendingFrames == 0);
    ASSERT_TRUE(s.framesTimedOut == 1);
    ASSERT_TRUE(s.TotalFramesLost() == 1);

    // The missing half arriving later must not reopen the frame.
    ASSERT_TRUE(!r.Accept(Packet(1, 1, 2), 700000).has_value());
    ASSERT_TRUE(r.GetStats().pendingFrames == 0);
}

static void SustainedPartialLossStaysBounded() {
    Reassembler::Config c = DefaultConfig();
    c.maxPendingFrames = 32;
    Reassembler r(c);
    uint64_t now = 0;
    for (uint32_t seq = 0; seq < 5000; ++seq) {
        now += 20000;
        r.Accept(Packet(seq, 0, 2), now);   // second fragment never arrives
        r.EvictStale(now);
        ASSERT_TRUE(r.GetStats().pendingFrames <= 32) << "seq " << seq;
    }
    const auto s = r.GetStats();
    ASSERT_TRUE(s.framesCompleted == 0);
    ASSERT_TRUE(s.framesTimedOut + s.framesEvictedForCapacity + s.pendingFrames == 5000);
}

static void CapacityEvictionDropsOldestPending() {
    Reassembler::Config c = DefaultConfig();
    c.maxPendingFrames = 2;
    Reassembler r(c);
    r.Accept(Packet(1, 0, 2), 10);
    r.Accept(Packet(2, 0, 2), 20);
    r.Accept(Packet(3, 0, 2), 30);
    auto s = r.GetStats();
    ASSERT_TRUE(s.pendingFrames == 2);
    ASSERT_TRUE(s.framesEvictedForCapacity == 1);
    ASSERT_TRUE(r.Accept(Packet(2, 1, 2), 40).has_value());
    ASSERT_TRUE(!r.Accept(Packet(1, 1, 2), 50).has_value());
}

static void IntervalCountsResetAfterTaking() {
    Reassembler r(DefaultConfig());
    r.Accept(Packet(1, 0, 1), 0);
    r.Accept(Packet(4, 0, 1), 0);
    uint64_t completed = 0, lost = 0;
    r.TakeIntervalCounts(completed, lost);
    ASSERT_TRUE(completed == 2 && lost == 2);
    r.TakeIntervalCounts(completed, lost);
    ASSERT_TRUE(completed == 0 && lost == 0);
}

static void ResetForgetsEverything() {
    Reassembler r(DefaultConfig());
    r.Accept(Packet(1, 0, 2), 0);
    r.Accept(Packet(9, 0, 1), 0);
    r.Reset();
    const auto s = r.GetStats();
    ASSERT_TRUE(s.pendingFrames == 0 && !s.hasLastSeen && s.framesCompleted == 0);
    ASSERT_TRUE(r.Accept(Packet(9, 0, 1), 0).has_value());
}

int main() {
    RUN_TEST(SingleFragmentFrameCompletesImmediately);
    RUN_TEST(GapAccountingCountsMissingSequences);
    RUN_TEST(FirstPacketDoesNotCountLoss);
    RUN_TEST(SequenceWrapIsNotAGap);
    RUN_TEST(OutOfOrderArrivalDoesNotRewindLastSeen);
    RUN_TEST(FragmentsReassembleInIndexOrder);
    RUN_TEST(DuplicateAndInconsistentFragmentsAreIgnored);
    RUN_TEST(LateFragmentsOfClosedFramesAreDropped);
    RUN_TEST(StaleEntriesAreEvictedAndCountedLost);
    RUN_TEST(SustainedPartialLossStaysBounded);
    RUN_TEST(CapacityEvictionDropsOldestPending);
    RUN_TEST(IntervalCountsResetAfterTaking);
    RUN_TEST(ResetForgetsEverything);
    return 0;
}
