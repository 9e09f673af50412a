#include "unit_test.h"
#include "../src/app/CaptureRelay.h"
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace VoxLink;

static AudioChunk Tagged(uint64_t tag) { return AudioChunk({ 0 }, tag); }

static void ForwardsInCaptureOrder() {
    std::mutex mutex;
    std::vector<uint64_t> seen;
    CaptureRelay relay(20);
    ASSERT_TRUE(relay.Start([&](AudioChunk chunk) {
        std::lock_guard<std::mutex> lk(mutex);
        seen.push_back(chunk.captureTimeUs);
    }));
    for (uint64_t i = 1; i <= 10; ++i) relay.Enqueue(Tagged(i));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (relay.FramesForwarded() < 10 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    relay.Stop();

    ASSERT_TRUE(relay.FramesForwarded() == 10);
    ASSERT_TRUE(relay.FramesCaptured() == 10);
    for (size_t i = 0; i < seen.size(); ++i)
        ASSERT_TRUE(seen[i] == i + 1) << "position " << i;
}

static void FullQueueReplacesOldest() {
    // Not started: nothing drains, so the queue fills up.
    CaptureRelay relay(3);
    for (uint64_t i = 1; i <= 5; ++i) relay.Enqueue(Tagged(i));
    ASSERT_TRUE(relay.QueueDepth() == 3);
    ASSERT_TRUE(relay.FramesReplaced() == 2);

    std::vector<uint64_t> seen;
    std::mutex mutex;
    ASSERT_TRUE(relay.Start([&](AudioChunk chunk) {
        std::lock_guard<std::mutex> lk(mutex);
        seen.push_back(chunk.captureTimeUs);
    }));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (relay.FramesForwarded() < 3 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    relay.Stop();

    ASSERT_TRUE((seen == std::vector<uint64_t>{ 3, 4, 5 }));
}

static void FailedSendDoesNotLoseRestOfBatch() {
    // Not started: all five chunks are forwarded as one batch.
    CaptureRelay relay(20);
    for (uint64_t i = 1; i <= 5; ++i) relay.Enqueue(Tagged(i));

    std::mutex mutex;
    std::vector<uint64_t> seen;
    ASSERT_TRUE(relay.Start([&](AudioChunk chunk) {
        if (chunk.captureTimeUs == 2) throw std::runtime_error("send failed");
        std::lock_guard<std::mutex> lk(mutex);
        seen.push_back(chunk.captureTimeUs);
    }));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (relay.FramesForwarded() < 4 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    relay.Stop();

    ASSERT_TRUE(relay.SendFailures() == 1);
    ASSERT_TRUE(relay.FramesForwarded() == 4);
    ASSERT_TRUE((seen == std::vector<uint64_t>{ 1, 3, 4, 5 }));
}

static void StopIsPromptAndIdempotent() {
    CaptureRelay relay;
    ASSERT_TRUE(relay.Start([](AudioChunk) {}));
    const auto start = std::chrono::steady_clock::now();
    relay.Stop();
    relay.Stop();
    ASSERT_TRUE(!relay.IsRunning());
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1500));
}

int main() {
    RUN_TEST(ForwardsInCaptureOrder);
    RUN_TEST(FullQueueReplacesOldest);
    RUN_TEST(FailedSendDoesNotLoseRestOfBatch);
    RUN_TEST(StopIsPromptAndIdempotent);
    return 0;
}
