#include "CallSession.h"
#include "../audio/PcmFileDevice.h"
#include "../core/ConfigManager.h"
#include "../core/Logger.h"
#include "../../Version.h"
#include <asio.hpp>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iostream>

namespace {

    // Re-armed after each delivery so a second Ctrl+C during shutdown is still
    // handled instead of killing the process mid-cleanup.
    void ArmSignals(asio::signal_set& signals, asio::io_context& io_context) {
        signals.async_wait([&signals, &io_context](const std::error_code& ec, int signo) {
            if (ec) return;
            LOG_APP("step=peer_shutdown status=graceful signal=" + std::to_string(signo));
            io_context.stop();
            ArmSignals(signals, io_context);
        });
    }

    void ScheduleStats(asio::steady_timer& timer, const VoxLink::CallSession& session, std::chrono::seconds interval) {
        timer.expires_after(interval);
        timer.async_wait([&timer, &session, interval](const std::error_code& ec) {
            if (ec) return;
            const VoxLink::CallStatus status = session.GetStatus();
            if (status.hasStats) {
                VoxLink::Logger::Instance().LogCallStats(status.remoteAddress,
                    status.transmitter.packetsSent, status.receiver.packetsReceived,
                    status.receiver.reassembly.TotalFramesLost(),
                    static_cast<float>(status.receiver.lossRatePct),
                    static_cast<float>(status.sync.latencyMs),
                    static_cast<float>(status.sync.jitterMs),
                    status.sync.bufferDepth, status.quality);
            }
            ScheduleStats(timer, session, interval);
        });
    }

} // namespace

int main(int argc, char* argv[]) {
    try {
        VoxLink::PeerConfig config;
        std::string error;
        const bool explicitPath = argc > 1;
        const std::string path = explicitPath ? argv[1] : VoxLink::ConfigManager::DefaultPath();
        if (explicitPath || std::filesystem::exists(path)) {
            if (!VoxLink::ConfigManager::Load(path, config, error)) {
                std::cerr << "voxlink_peer: " << error << "\n";
                return 1;
            }
        }

        auto& logger = VoxLink::Logger::Instance();
        if (!logger.Initialize(config.logFile))
            std::cerr << "voxlink_peer: cannot open log file " << config.logFile << "\n";
        logger.SetLevel(VoxLink::ParseLogLevel(config.logLevel));
        // A configured trace file turns the trace on; otherwise VOXLINK_PACKET_TRACE=1 does.
        const bool traceConfigured = !config.packetTraceFile.empty();
        const std::string tracePath = traceConfigured ? config.packetTraceFile : "voxlink_packet_trace.log";
        if (logger.InitializePacketTrace(tracePath, traceConfigured))
            LOG_APP("Packet trace written to " + tracePath);
        else if (traceConfigured)
            LOG_WARN("Packet trace not started for " + tracePath);
        if (!logger.InitializeStatsLog(config.statsFile))
            LOG_WARN("Cannot open stats log " + config.statsFile);

        LOG_APP(std::string("VoxLink peer ") + VOXLINK_VERSION_STRING + " starting");

        if (config.remoteIp.empty()) {
            LOG_ERROR("step=peer_start reason=no_remote_ip");
            std::cerr << "voxlink_peer: remote_ip is not configured\n";
            logger.Shutdown();
            return 1;
        }

        std::unique_ptr<VoxLink::CaptureSource> capture;
        if (!config.inputPcm.empty())
            capture = std::make_unique<VoxLink::PcmFileSource>(config.inputPcm,
                config.sampleRate, config.channels, config.framesPerBuffer);
        else
            LOG_APP("No input_pcm configured; running receive-only");

        auto playback = std::make_unique<VoxLink::PcmFileSink>(
            config.outputPcm.empty() ? std::string("/dev/null") : config.outputPcm);

        VoxLink::CallSession session(config, std::move(capture), std::move(playback));
        if (!session.StartCall(config.remoteIp, config.remotePort)) {
            std::cerr << "voxlink_peer: call setup failed, see log\n";
            logger.Shutdown();
            return 1;
        }

        asio::io_context io_context;
        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        ArmSignals(signals, io_context);
        asio::steady_timer statsTimer(io_context);
        ScheduleStats(statsTimer, session, std::chrono::seconds(config.statsIntervalSec));

        std::cout << "VoxLink peer " << VOXLINK_VERSION_STRING << " streaming to "
            << config.remoteIp << ":" << config.remotePort << ", listening on "
            << session.GetListenPort() << "\n";
        io_context.run();

        session.EndCall();
        logger.Shutdown();
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
