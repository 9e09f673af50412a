#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace VoxLink {

    // Everything a peer needs to run a call. Defaults describe a mono 44.1 kHz
    // session on the local ports 5000 (send) and 5001 (listen).
    struct PeerConfig {
        uint16_t    localPort = 5000;
        uint16_t    listenPort = 5001;
        std::string remoteIp;
        uint16_t    remotePort = 5001;

        int sampleRate = 44100;
        int channels = 1;
        int framesPerBuffer = 1024;

        int maxPacketSize = 1400;
        int sendQueueCapacity = 50;
        int captureQueueCapacity = 20;

        int    minBuffer = 3;
        int    maxBuffer = 20;
        double targetLatencyMs = 50.0;
        double maxLatencyMs = 200.0;
        double jitterThresholdMs = 10.0;
        int    reassemblyTimeoutMs = 500;
        int    maxPendingFrames = 256;
        int    syncPeriodMs = 1000;
        int    statsIntervalSec = 5;

        std::string logFile;
        std::string logLevel = "info";
        std::string packetTraceFile;
        std::string statsFile;
        std::string inputPcm;
        std::string outputPcm;
    };

    void to_json(nlohmann::json& j, const PeerConfig& c);
    void from_json(const nlohmann::json& j, PeerConfig& c);

    class ConfigManager {
    public:
        // Parses and validates. On any failure `out` is left untouched and
        // `error` says why.
        static bool LoadFromString(const std::string& text, PeerConfig& out, std::string& error);
        static bool Load(const std::string& path, PeerConfig& out, std::string& error);
        static bool Save(const std::string& path, const PeerConfig& config, std::string& error);

        // Empty string when the config is usable, otherwise the first problem found.
        static std::string Validate(const PeerConfig& config);

        // $XDG_CONFIG_HOME/voxlink/peer.json, else $HOME/.config/voxlink/peer.json.
        static std::string DefaultPath();
    };

} // namespace VoxLink
