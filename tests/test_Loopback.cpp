#include "unit_test.h"
#include "RecordingSink.h"
#include "../src/app/CallSession.h"
#include "../src/audio/PcmFileDevice.h"
#include "../src/network/AudioReceiver.h"
#include "../src/network/AudioTransmitter.h"
#include "../src/network/WireCodec.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <thread>

using namespace VoxLink;

namespace {

    bool WaitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return condition();
    }

    AudioChunk Ramp(size_t samples, uint64_t captureUs) {
        std::vector<int16_t> s(samples);
        for (size_t i = 0; i < samples; ++i) s[i] = static_cast<int16_t>(i * 13 - 20000);
        return AudioChunk(std::move(s), captureUs);
    }

    AudioReceiver::Config EphemeralReceiver() {
        AudioReceiver::Config c;
        c.listenPort = 0;
        return c;
    }

    AudioTransmitter::Config EphemeralTransmitter() {
        AudioTransmitter::Config c;
        c.localPort = 0;
        c.maxPacketSize = 1400;
        c.queueCapacity = 50;
        return c;
    }

} // namespace

static void MultiFragmentChunksCrossTheLoopback() {
    RecordingSink sink;
    AudioReceiver rx(EphemeralReceiver(), 10, nullptr, nullptr);
    ASSERT_TRUE(rx.StartReception());
    ASSERT_TRUE(rx.StartPlayback(sink));
    ASSERT_TRUE(rx.GetLocalPort() != 0);

    AudioTransmitter tx(EphemeralTransmitter());
    ASSERT_TRUE(tx.Start());
    ASSERT_TRUE(tx.SetTarget("127.0.0.1", rx.GetLocalPort()));
    ASSERT_TRUE(FragmentCount(6000, tx.MaxFragmentPayload()) == 5);

    const AudioChunk a = Ramp(3000, NowMicros());
    const AudioChunk b = Ramp(100, NowMicros());
    ASSERT_TRUE(tx.Submit(a));
    ASSERT_TRUE(tx.Submit(b));

    ASSERT_TRUE(WaitFor([&] { return sink.Count() >= 2; })) << "played " << sink.Count();
    tx.Stop();
    rx.Stop();

    const auto played = sink.Chunks();
    ASSERT_TRUE(played[0].samples == a.samples);
    ASSERT_TRUE(played[0].captureTimeUs == a.captureTimeUs);
    ASSERT_TRUE(played[1].samples == b.samples);
    ASSERT_TRUE(sink.Closed());

    const auto txStats = tx.GetStats();
    ASSERT_TRUE(txStats.packetsSent == 6) << txStats.packetsSent;
    ASSERT_TRUE(txStats.chunksSent == 2);
    ASSERT_TRUE(txStats.nextFrameSequence == 2);
    const auto rxStats = rx.GetStats();
    ASSERT_TRUE(rxStats.packetsReceived == 6);
    ASSERT_TRUE(rxStats.reassembly.framesCompleted == 2);
    ASSERT_TRUE(rxStats.reassembly.TotalFramesLost() == 0);
}

static void MalformedDatagramsAreCountedAndDropped() {
    AudioReceiver rx(EphemeralReceiver(), 4, nullptr, nullptr);
    const uint64_t now = NowMicros();

    rx.HandleDatagram(kConnectivityProbe, sizeof(kConnectivityProbe), now);
    auto bytes = EncodePacket(1u, now, 0, 1, AudioChunk({ 1, 2 }, 0).ToBytes());
    auto badMagic = bytes;
    badMagic[0] = 'X';
    rx.HandleDatagram(badMagic.data(), badMagic.size(), now);
    rx.HandleDatagram(bytes.data(), bytes.size() - 1, now);
    auto badFragment = EncodePacket(1u, now, 2, 2, nullptr, 0);
    rx.HandleDatagram(badFragment.data(), badFragment.size(), now);
    rx.HandleDatagram(bytes.data(), bytes.size(), now);

    const auto s = rx.GetStats();
    ASSERT_TRUE(s.packetsReceived == 5);
    ASSERT_TRUE(s.decodeTooShort == 1 && s.decodeBadMagic == 1);
    ASSERT_TRUE(s.decodeLengthMismatch == 1 && s.decodeBadFragmentInfo == 1);
    ASSERT_TRUE(s.DecodeFailures() == 4);
    ASSERT_TRUE(s.reassembly.framesCompleted == 1);
    ASSERT_TRUE(rx.Queue().Size() == 1);
}

static void FullPlaybackQueueDropsIncoming() {
    AudioReceiver rx(EphemeralReceiver(), 2, nullptr, nullptr);
    const uint64_t now = NowMicros();
    for (uint32_t seq = 0; seq < 4; ++seq) {
        const auto bytes = EncodePacket(seq, now + seq, 0, 1, AudioChunk({ 7 }, 0).ToBytes());
        rx.HandleDatagram(bytes.data(), bytes.size(), now);
    }
    ASSERT_TRUE(rx.Queue().Size() == 2);
    ASSERT_TRUE(rx.GetStats().queueOverflows == 2);
    ASSERT_TRUE(rx.Queue().PopFor(std::chrono::milliseconds(0))->captureTimeUs == now);
}

static void SynchronizerHintsResizeThePlaybackQueue() {
    auto hints = std::make_shared<BufferHintChannel>();
    AdaptiveSynchronizer::Config syncConfig;
    syncConfig.minBuffer = 2;
    syncConfig.maxBuffer = 10;
    auto sync = std::make_shared<AdaptiveSynchronizer>(syncConfig, hints);
    AudioReceiver rx(EphemeralReceiver(), static_cast<size_t>(sync->GetCurrentBufferSize()), sync, hints);
    ASSERT_TRUE(rx.Queue().Capacity() == 6);

    const uint64_t now = NowMicros();
    for (uint32_t seq = 0; seq < 6; ++seq) {
        const auto bytes = EncodePacket(seq, now, 0, 1, AudioChunk({ 1 }, 0).ToBytes());
        rx.HandleDatagram(bytes.data(), bytes.size(), now);
    }
    ASSERT_TRUE(rx.Queue().Size() == 6);

    sync->ForceBufferSize(3);
    rx.RunMaintenance(now);
    ASSERT_TRUE(rx.Queue().Capacity() == 3);
    ASSERT_TRUE(rx.Queue().Size() == 3);
    ASSERT_TRUE(rx.GetStats().hintsApplied == 1);
    ASSERT_TRUE(rx.GetStats().queueTrimmed == 3);

    sync->ForceBufferSize(9);
    rx.RunMaintenance(now);
    ASSERT_TRUE(rx.Queue().Capacity() == 9);
}

static void ReceiverFeedsLatencyAndIntervalLoss() {
    auto sync = std::make_shared<AdaptiveSynchronizer>(AdaptiveSynchronizer::Config{}, nullptr);
    AudioReceiver rx(EphemeralReceiver(), 20, sync, nullptr);

    const uint64_t now = NowMicros();
    for (uint32_t seq : { 0u, 1u, 2u, 5u }) {   // 3 and 4 never arrive
        const auto bytes = EncodePacket(seq, now - 40000, 0, 1, AudioChunk({ 1 }, 0).ToBytes());
        rx.HandleDatagram(bytes.data(), bytes.size(), now);
    }
    ASSERT_TRUE(sync->GetCurrentLatency() > 39.9 && sync->GetCurrentLatency() < 40.1);

    rx.RunMaintenance(now);
    // 2 lost out of 6 accounted frames
    ASSERT_TRUE(sync->GetCurrentPacketLoss() > 33.2 && sync->GetCurrentPacketLoss() < 33.4)
        << sync->GetCurrentPacketLoss();
    const auto s = rx.GetStats();
    ASSERT_TRUE(s.reassembly.framesLostToGaps == 2);
    ASSERT_TRUE(s.meanLatencyMs > 39.9 && s.meanLatencyMs < 40.1);
}

static void StaleFragmentsAreEvictedDuringMaintenance() {
    AudioReceiver::Config c = EphemeralReceiver();
    c.reassemblyTimeoutUs = 1000;
    AudioReceiver rx(c, 4, nullptr, nullptr);
    const uint64_t now = NowMicros();
    const auto half = EncodePacket(9u, now, 0, 2, AudioChunk({ 1 }, 0).ToBytes());
    rx.HandleDatagram(half.data(), half.size(), now);
    ASSERT_TRUE(rx.GetStats().reassembly.pendingFrames == 1);
    rx.RunMaintenance(now + 5000);
    ASSERT_TRUE(rx.GetStats().reassembly.pendingFrames == 0);
    ASSERT_TRUE(rx.GetStats().reassembly.framesTimedOut == 1);
}

static void TransmitterDropsNewestWhenQueueIsFull() {
    AudioTransmitter::Config c = EphemeralTransmitter();
    c.queueCapacity = 2;
    AudioTransmitter tx(c);   // not started: nothing drains
    ASSERT_TRUE(tx.Submit(Ramp(10, 1)));
    ASSERT_TRUE(tx.Submit(Ramp(10, 2)));
    ASSERT_TRUE(!tx.Submit(Ramp(10, 3)));
    const auto s = tx.GetStats();
    ASSERT_TRUE(s.chunksDropped == 1 && s.chunksSubmitted == 3 && s.queueDepth == 2);
}

static void TransmitterWithoutTargetDiscards() {
    AudioTransmitter tx(EphemeralTransmitter());
    ASSERT_TRUE(tx.Start());
    ASSERT_TRUE(!tx.HasTarget());
    ASSERT_TRUE(tx.Submit(Ramp(10, 1)));
    ASSERT_TRUE(WaitFor([&] { return tx.GetStats().chunksUnroutable == 1; }));
    tx.Stop();
    ASSERT_TRUE(tx.GetStats().packetsSent == 0);
    ASSERT_TRUE(!tx.IsRunning());
}

static void ChunkIsNotCountedSentWhenEveryFragmentFails() {
    // An IPv4 socket cannot reach an IPv6 destination; every send_to fails.
    AudioTransmitter tx(EphemeralTransmitter());
    ASSERT_TRUE(tx.Start());
    ASSERT_TRUE(tx.SetTarget("::1", 5001));
    ASSERT_TRUE(tx.Submit(Ramp(10, 1)));
    ASSERT_TRUE(tx.Submit(Ramp(10, 2)));
    ASSERT_TRUE(WaitFor([&] { return tx.GetStats().sendErrors >= 2; }));
    tx.Stop();
    const auto s = tx.GetStats();
    ASSERT_TRUE(s.chunksSent == 0) << s.chunksSent;
    ASSERT_TRUE(s.packetsSent == 0);
}

static void TransmitterRejectsBadConfigurationAndTargets() {
    AudioTransmitter::Config c = EphemeralTransmitter();
    c.maxPacketSize = kPacketHeaderSize;
    AudioTransmitter tiny(c);
    ASSERT_TRUE(!tiny.Start());
    ASSERT_TRUE(!tiny.IsRunning());

    AudioTransmitter tx(EphemeralTransmitter());
    ASSERT_TRUE(!tx.SetTarget("not-an-address", 5001));
    ASSERT_TRUE(!tx.SetTarget("127.0.0.1", 0));
    ASSERT_TRUE(tx.SetTarget("::1", 5001));

    ASSERT_TRUE(AudioTransmitter::TestConnectivity("127.0.0.1", 9));
    ASSERT_TRUE(!AudioTransmitter::TestConnectivity("999.1.1.1", 9));
}

static void PlaybackFailsWhenSinkCannotOpen() {
    RecordingSink sink(true);
    AudioReceiver rx(EphemeralReceiver(), 4, nullptr, nullptr);
    ASSERT_TRUE(!rx.StartPlayback(sink));
    ASSERT_TRUE(!rx.IsPlaying());
}

static void CallSessionStreamsPcmFileEndToEnd() {
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "voxlink_loopback_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    const std::string inputPath = (dir / "in.pcm").string();
    const std::string outputPath = (dir / "out.pcm").string();

    constexpr int kFrames = 256;
    constexpr int kChunks = 8;
    std::vector<uint8_t> input;
    {
        const AudioChunk ramp = Ramp(kFrames * kChunks, 0);
        input = ramp.ToBytes();
        std::ofstream f(inputPath, std::ios::binary);
        f.write(reinterpret_cast<const char*>(input.data()), static_cast<std::streamsize>(input.size()));
    }

    PeerConfig config;
    config.localPort = 0;
    config.listenPort = 0;
    config.framesPerBuffer = kFrames;
    config.maxPacketSize = 200;   // forces several fragments per chunk
    config.syncPeriodMs = 100;

    CallSession listener(config, nullptr, std::make_unique<PcmFileSink>(outputPath));
    ASSERT_TRUE(listener.StartCall("127.0.0.1", 9));
    ASSERT_TRUE(listener.IsCallActive());
    const uint16_t listenPort = listener.GetListenPort();
    ASSERT_TRUE(listenPort != 0);

    CallSession speaker(config,
        std::make_unique<PcmFileSource>(inputPath, config.sampleRate, config.channels, kFrames, false),
        std::make_unique<RecordingSink>());
    ASSERT_TRUE(speaker.StartCall("127.0.0.1", listenPort));

    ASSERT_TRUE(WaitFor([&] { return listener.GetStatus().receiver.chunksPlayed >= kChunks; }))
        << "played " << listener.GetStatus().receiver.chunksPlayed;

    const nlohmann::json status = listener.GetStatus();
    ASSERT_TRUE(status["call_state"] == "connected");
    ASSERT_TRUE(status["components_active"]["reception"] == true);
    ASSERT_TRUE(status["reception_stats"]["frames_completed"] == kChunks);
    ASSERT_TRUE(status.contains("quality_assessment"));

    const nlohmann::json speakerStatus = speaker.GetStatus();
    ASSERT_TRUE(speakerStatus["capture_stats"]["frames_captured"] == kChunks);

    speaker.EndCall();
    listener.EndCall();
    ASSERT_TRUE(listener.GetState() == CallState::Idle);
    ASSERT_TRUE(listener.GetStatus().totalCalls == 1);
    ASSERT_TRUE(!listener.GetStatus().hasStats);

    std::ifstream f(outputPath, std::ios::binary);
    const std::vector<uint8_t> output((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    ASSERT_TRUE(output == input) << "output bytes " << output.size() << " input bytes " << input.size();

    std::filesystem::remove_all(dir, ec);
}

static void FailedCallStartLeavesNothingRunning() {
    PeerConfig config;
    config.localPort = 0;
    config.listenPort = 0;
    CallSession session(config, nullptr, std::make_unique<RecordingSink>());
    ASSERT_TRUE(!session.StartCall("not-an-address", 5001));
    ASSERT_TRUE(session.GetState() == CallState::Error);
    const CallStatus failed = session.GetStatus();
    ASSERT_TRUE(!failed.receiveActive && !failed.transmitActive && !failed.syncActive && !failed.playbackActive);

    // A call can be started again after an error.
    ASSERT_TRUE(session.StartCall("127.0.0.1", 9));
    ASSERT_TRUE(session.IsCallActive());
    ASSERT_TRUE(!session.StartCall("127.0.0.1", 9));
    session.EndCall();
    ASSERT_TRUE(session.GetState() == CallState::Idle);
}

int main() {
    RUN_TEST(MultiFragmentChunksCrossTheLoopback);
    RUN_TEST(MalformedDatagramsAreCountedAndDropped);
    RUN_TEST(FullPlaybackQueueDropsIncoming);
    RUN_TEST(SynchronizerHintsResizeThePlaybackQueue);
    RUN_TEST(ReceiverFeedsLatencyAndIntervalLoss);
    RUN_TEST(StaleFragmentsAreEvictedDuringMaintenance);
    RUN_TEST(TransmitterDropsNewestWhenQueueIsFull);
    RUN_TEST(TransmitterWithoutTargetDiscards);
    RUN_TEST(ChunkIsNotCountedSentWhenEveryFragmentFails);
    RUN_TEST(TransmitterRejectsBadConfigurationAndTargets);
    RUN_TEST(PlaybackFailsWhenSinkCannotOpen);
    RUN_TEST(CallSessionStreamsPcmFileEndToEnd);
    RUN_TEST(FailedCallStartLeavesNothingRunning);
    return 0;
}
