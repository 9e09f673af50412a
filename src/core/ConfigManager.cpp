#include "ConfigManager.h"
#include "Globals.h"
#include "../shared/Protocol.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace VoxLink {

    void to_json(nlohmann::json& j, const PeerConfig& c) {
        j = nlohmann::json{
            { "local_port", c.localPort },
            { "listen_port", c.listenPort },
            { "remote_ip", c.remoteIp },
            { "remote_port", c.remotePort },
            { "sample_rate", c.sampleRate },
            { "channels", c.channels },
            { "frames_per_buffer", c.framesPerBuffer },
            { "max_packet_size", c.maxPacketSize },
            { "send_queue_capacity", c.sendQueueCapacity },
            { "capture_queue_capacity", c.captureQueueCapacity },
            { "min_buffer", c.minBuffer },
            { "max_buffer", c.maxBuffer },
            { "target_latency_ms", c.targetLatencyMs },
            { "max_latency_ms", c.maxLatencyMs },
            { "jitter_threshold_ms", c.jitterThresholdMs },
            { "reassembly_timeout_ms", c.reassemblyTimeoutMs },
            { "max_pending_frames", c.maxPendingFrames },
            { "sync_period_ms", c.syncPeriodMs },
            { "stats_interval_sec", c.statsIntervalSec },
            { "log_file", c.logFile },
            { "log_level", c.logLevel },
            { "packet_trace_file", c.packetTraceFile },
            { "stats_file", c.statsFile },
            { "input_pcm", c.inputPcm },
            { "output_pcm", c.outputPcm },
        };
    }

    void from_json(const nlohmann::json& j, PeerConfig& c) {
        // Ports are read wide so an out-of-range value is reported instead of wrapping.
        auto port = [&j](const char* key, uint16_t fallback) -> uint16_t {
            const int64_t v = j.value(key, static_cast<int64_t>(fallback));
            if (v < 0 || v > 65535)
                throw std::out_of_range(std::string(key) + " must be within 0..65535");
            return static_cast<uint16_t>(v);
        };

        c.localPort = port("local_port", c.localPort);
        c.listenPort = port("listen_port", c.listenPort);
        c.remoteIp = j.value("remote_ip", c.remoteIp);
        c.remotePort = port("remote_port", c.remotePort);
        c.sampleRate = j.value("sample_rate", c.sampleRate);
        c.channels = j.value("channels", c.channels);
        c.framesPerBuffer = j.value("frames_per_buffer", c.framesPerBuffer);
        c.maxPacketSize = j.value("max_packet_size", c.maxPacketSize);
        c.sendQueueCapacity = j.value("send_queue_capacity", c.sendQueueCapacity);
        c.captureQueueCapacity = j.value("capture_queue_capacity", c.captureQueueCapacity);
        c.minBuffer = j.value("min_buffer", c.minBuffer);
        c.maxBuffer = j.value("max_buffer", c.maxBuffer);
        c.targetLatencyMs = j.value("target_latency_ms", c.targetLatencyMs);
        c.maxLatencyMs = j.value("max_latency_ms", c.maxLatencyMs);
        c.jitterThresholdMs = j.value("jitter_threshold_ms", c.jitterThresholdMs);
        c.reassemblyTimeoutMs = j.value("reassembly_timeout_ms", c.reassemblyTimeoutMs);
        c.maxPendingFrames = j.value("max_pending_frames", c.maxPendingFrames);
        c.syncPeriodMs = j.value("sync_period_ms", c.syncPeriodMs);
        c.statsIntervalSec = j.value("stats_interval_sec", c.statsIntervalSec);
        c.logFile = j.value("log_file", c.logFile);
        c.logLevel = j.value("log_level", c.logLevel);
        c.packetTraceFile = j.value("packet_trace_file", c.packetTraceFile);
        c.statsFile = j.value("stats_file", c.statsFile);
        c.inputPcm = j.value("input_pcm", c.inputPcm);
        c.outputPcm = j.value("output_pcm", c.outputPcm);
    }

    std::string ConfigManager::Validate(const PeerConfig& c) {
        if (c.maxPacketSize <= static_cast<int>(kPacketHeaderSize))
            return "max_packet_size must exceed the " + std::to_string(kPacketHeaderSize) + "-byte header";
        if (c.maxPacketSize > Globals::MAX_UDP_PAYLOAD)
            return "max_packet_size must not exceed " + std::to_string(Globals::MAX_UDP_PAYLOAD);
        if (c.minBuffer < 1) return "min_buffer must be at least 1";
        if (c.maxBuffer < c.minBuffer) return "max_buffer must not be below min_buffer";
        if (c.channels < 1) return "channels must be at least 1";
        if (c.sampleRate <= 0) return "sample_rate must be positive";
        if (c.framesPerBuffer <= 0) return "frames_per_buffer must be positive";
        if (c.sendQueueCapacity <= 0) return "send_queue_capacity must be positive";
        if (c.captureQueueCapacity <= 0) return "capture_queue_capacity must be positive";
        if (c.targetLatencyMs <= 0.0) return "target_latency_ms must be positive";
        if (c.maxLatencyMs <= 0.0) return "max_latency_ms must be positive";
        if (c.jitterThresholdMs <= 0.0) return "jitter_threshold_ms must be positive";
        if (c.reassemblyTimeoutMs <= 0) return "reassembly_timeout_ms must be positive";
        if (c.maxPendingFrames <= 0) return "max_pending_frames must be positive";
        if (c.syncPeriodMs <= 0) return "sync_period_ms must be positive";
        if (c.statsIntervalSec <= 0) return "stats_interval_sec must be positive";
        if (c.remotePort == 0) return "remote_port must be within 1..65535";
        return {};
    }

    bool ConfigManager::LoadFromString(const std::string& text, PeerConfig& out, std::string& error) {
        PeerConfig parsed;
        try {
            const nlohmann::json j = nlohmann::json::parse(text);
            if (!j.is_object()) {
                error = "top-level JSON value must be an object";
                return false;
            }
            parsed = j.get<PeerConfig>();
        }
        catch (const std::exception& e) {
            error = e.what();
            return false;
        }
        error = Validate(parsed);
        if (!error.empty()) return false;
        out = parsed;
        return true;
    }

    bool ConfigManager::Load(const std::string& path, PeerConfig& out, std::string& error) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            error = "cannot open " + path;
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        if (!LoadFromString(buffer.str(), out, error)) {
            error = path + ": " + error;
            return false;
        }
        return true;
    }

    bool ConfigManager::Save(const std::string& path, const PeerConfig& config, std::string& error) {
        std::error_code ec;
        const std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "cannot create " + parent.string() + ": " + ec.message();
            return false;
        }
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            error = "cannot write " + path;
            return false;
        }
        file << nlohmann::json(config).dump(4) << "\n";
        if (!file.good()) {
            error = "write failed for " + path;
            return false;
        }
        return true;
    }

    std::string ConfigManager::DefaultPath() {
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg && *xdg) return std::string(xdg) + "/voxlink/peer.json";
        const char* home = std::getenv("HOME");
        if (home && *home) return std::string(home) + "/.config/voxlink/peer.json";
        return "peer.json";
    }

} // namespace VoxLink
