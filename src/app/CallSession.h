#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "CaptureRelay.h"
#include "../audio/AdaptiveSynchronizer.h"
#include "../audio/AudioDevice.h"
#include "../core/ConfigManager.h"
#include "../network/AudioReceiver.h"
#include "../network/AudioTransmitter.h"
#include "../shared/Channel.h"

namespace VoxLink {

    enum class CallState { Idle, Connecting, Connected, Disconnecting, Error };

    const char* CallStateName(CallState state) noexcept;

    struct CallStatus {
        CallState   state = CallState::Idle;
        std::string remoteAddress;
        double      callDurationSec = 0.0;
        uint64_t    totalCalls = 0;

        bool captureActive = false;
        bool transmitActive = false;
        bool receiveActive = false;
        bool playbackActive = false;
        bool syncActive = false;

        // Filled only while connected.
        bool hasStats = false;
        AudioTransmitter::Stats     transmitter;
        AudioReceiver::Stats        receiver;
        AdaptiveSynchronizer::Stats sync;
        uint64_t    framesCaptured = 0;
        uint64_t    framesReplaced = 0;
        std::string quality;
    };

    void to_json(nlohmann::json& j, const CallStatus& s);

    // Owns one peer's pipeline: capture -> relay -> transmitter on the way
    // out, receiver -> playback queue -> sink on the way in, plus the
    // synchronizer and the hint channel between it and the receiver.
    // Components are created per call so every call starts from clean stats.
    class CallSession {
    public:
        // `capture` may be null for a receive-only peer.
        CallSession(const PeerConfig& config,
            std::unique_ptr<CaptureSource> capture,
            std::unique_ptr<PlaybackSink> playback);
        ~CallSession();

        CallSession(const CallSession&) = delete;
        CallSession& operator=(const CallSession&) = delete;

        bool StartCall(const std::string& remoteIp, uint16_t remotePort);
        void EndCall();

        bool IsCallActive() const { return GetState() == CallState::Connected; }
        CallState GetState() const { return m_State.load(std::memory_order_acquire); }
        CallStatus GetStatus() const;

        // Port the receiver actually bound; differs from the config when it asks for 0.
        uint16_t GetListenPort() const;

        static bool TestConnectivity(const std::string& ip, uint16_t port) {
            return AudioTransmitter::TestConnectivity(ip, port);
        }

    private:
        void Cleanup();
        void SetState(CallState state);

        const PeerConfig m_Config;
        std::unique_ptr<CaptureSource> m_Capture;
        std::unique_ptr<PlaybackSink>  m_Playback;

        mutable std::mutex m_Mutex;
        std::atomic<CallState> m_State{ CallState::Idle };
        std::string m_RemoteAddress;
        uint64_t    m_CallStartUs = 0;
        uint64_t    m_TotalCalls = 0;

        std::shared_ptr<BufferHintChannel>    m_Hints;
        std::shared_ptr<AdaptiveSynchronizer> m_Sync;
        std::unique_ptr<AudioReceiver>        m_Receiver;
        std::unique_ptr<AudioTransmitter>     m_Transmitter;
        std::unique_ptr<CaptureRelay>         m_Relay;
    };

} // namespace VoxLink
