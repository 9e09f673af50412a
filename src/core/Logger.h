#pragma once
#include <fstream>
#include <sstream>
#include <iostream>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <iomanip>
#include <string>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <cstdio>
#include <thread>
#include <atomic>
#include <array>
#include <cstdint>

namespace VoxLink {

    static constexpr size_t kPacketTraceBufSize = 256;
    static constexpr size_t kPacketTraceQueueSize = 2048;

    enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4 };

    // Accepts "trace", "debug", "info", "warn"/"warning", "error". Anything else maps to Info.
    inline LogLevel ParseLogLevel(const std::string& name) noexcept {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        return LogLevel::Info;
    }

    class Logger {
    public:
        static Logger& Instance() {
            static Logger instance;
            return instance;
        }

        bool Initialize(const std::string& filePath) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_File.is_open()) m_File.close();
            if (filePath.empty()) return true;
            m_File.open(filePath, std::ios::app);
            return m_File.is_open();
        }

        void SetLevel(LogLevel level) { m_Level.store(static_cast<int>(level), std::memory_order_relaxed); }
        LogLevel GetLevel() const { return static_cast<LogLevel>(m_Level.load(std::memory_order_relaxed)); }

        bool IsEnabled(LogLevel level) const {
            return static_cast<int>(level) >= m_Level.load(std::memory_order_relaxed);
        }

        void Log(LogLevel level, const std::string& prefix, const std::string& message) {
            Log(level, prefix, message.c_str());
        }

        /// Overload for hot paths: caller passes a pre-formatted buffer.
        void Log(LogLevel level, const std::string& prefix, const char* message) {
            if (!message || !IsEnabled(level)) return;
            char stamp[48];
            FormatTimestamp(stamp, sizeof(stamp));

            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_File.is_open()) {
                m_File << stamp << " [" << prefix << "] " << message << "\n";
                m_File.flush();
            }
            else if (level >= LogLevel::Warn) {
                std::cerr << stamp << " [" << prefix << "] " << message << "\n";
            }
        }

        /// Initialize the packet trace log. Starts the async writer thread.
        /// Enabled when enableOverride is set or env VOXLINK_PACKET_TRACE=1.
        bool InitializePacketTrace(const std::string& filePath, bool enableOverride = false) {
            bool enable = enableOverride;
            if (!enable) {
                const char* env = std::getenv("VOXLINK_PACKET_TRACE");
                enable = (env && (env[0] == '1' || env[0] == 'y' || env[0] == 'Y'));
            }
            if (!enable || filePath.empty()) return false;
            if (m_PacketTraceThread.joinable()) return true;
            {
                std::lock_guard<std::mutex> lock(m_PacketTraceMutex);
                m_PacketTraceFile.open(filePath, std::ios::out | std::ios::trunc);
                if (!m_PacketTraceFile.is_open()) return false;
            }
            m_PacketTraceStop.store(false);
            m_PacketTraceEnabled.store(true, std::memory_order_release);
            m_PacketTraceThread = std::thread(&Logger::PacketTraceWorker, this);
            return true;
        }

        bool IsPacketTraceEnabled() const { return m_PacketTraceEnabled.load(std::memory_order_acquire); }

        /// Non-blocking: enqueues only if the queue lock is free, so the receive and
        /// transmit workers never stall on the trace. Returns false if the line was dropped.
        bool LogPacketTrace(const char* buf) {
            if (!buf || !IsPacketTraceEnabled()) return false;
            std::unique_lock<std::mutex> lock(m_PacketTraceQueueMutex, std::try_to_lock);
            if (!lock.owns_lock()) return false;
            size_t w = m_PacketTraceWriteIdx.load(std::memory_order_relaxed);
            std::snprintf(m_PacketTraceQueue[w].data(), kPacketTraceBufSize, "%.255s", buf);
            m_PacketTraceWriteIdx.store((w + 1) % kPacketTraceQueueSize, std::memory_order_release);
            if ((w + 1) % kPacketTraceQueueSize == m_PacketTraceReadIdx) {
                m_PacketTraceReadIdx = (m_PacketTraceReadIdx + 1) % kPacketTraceQueueSize;
            }
            m_PacketTraceCond.notify_one();
            return true;
        }

        /// Optional per-interval call statistics log. Call once at startup.
        bool InitializeStatsLog(const std::string& filePath) {
            std::lock_guard<std::mutex> lock(m_StatsMutex);
            if (m_StatsFile.is_open()) m_StatsFile.close();
            if (filePath.empty()) return true;
            m_StatsFile.open(filePath, std::ios::app);
            return m_StatsFile.is_open();
        }

        /// One line of call statistics. Thread-safe.
        void LogCallStats(const std::string& remote, uint64_t packetsSent, uint64_t packetsRecv,
            uint64_t framesLost, float lossPct, float latencyMs, float jitterMs,
            int bufferDepth, const std::string& quality) {
            std::lock_guard<std::mutex> lock(m_StatsMutex);
            if (!m_StatsFile.is_open()) return;
            auto now = std::chrono::system_clock::now();
            auto t = std::chrono::system_clock::to_time_t(now);
            struct tm localTime;
#ifdef _WIN32
            localtime_s(&localTime, &t);
#else
            localtime_r(&t, &localTime);
#endif
            std::stringstream ss;
            ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
            ss << " | remote=" << remote;
            ss << " | sent=" << packetsSent << " recv=" << packetsRecv << " lost=" << framesLost
               << " loss%=" << std::fixed << std::setprecision(1) << lossPct;
            ss << "% | latency_ms=" << latencyMs << " jitter_ms=" << jitterMs
               << " buffer=" << bufferDepth << " quality=" << quality << "\n";
            m_StatsFile << ss.str();
            m_StatsFile.flush();
        }

        void Shutdown() {
            {
                std::lock_guard<std::mutex> lock(m_Mutex);
                if (m_File.is_open()) m_File.close();
            }
            {
                std::lock_guard<std::mutex> lock(m_StatsMutex);
                if (m_StatsFile.is_open()) m_StatsFile.close();
            }
            m_PacketTraceEnabled.store(false, std::memory_order_release);
            m_PacketTraceStop.store(true);
            m_PacketTraceCond.notify_all();
            if (m_PacketTraceThread.joinable()) m_PacketTraceThread.join();
            {
                std::lock_guard<std::mutex> l2(m_PacketTraceMutex);
                if (m_PacketTraceFile.is_open()) m_PacketTraceFile.close();
            }
        }

    private:
        Logger() = default;
        ~Logger() { Shutdown(); }

        static void FormatTimestamp(char* out, size_t size) {
            auto now = std::chrono::system_clock::now();
            auto t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            struct tm localTime;
#ifdef _WIN32
            localtime_s(&localTime, &t);
#else
            localtime_r(&t, &localTime);
#endif
            char timeBuf[32];
            if (std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &localTime) == 0) timeBuf[0] = '\0';
            std::snprintf(out, size, "%s.%03d", timeBuf, static_cast<int>(ms.count()));
        }

        void PacketTraceWorker() {
            try {
                std::unique_lock<std::mutex> lock(m_PacketTraceQueueMutex);
                while (!m_PacketTraceStop.load(std::memory_order_acquire)) {
                    m_PacketTraceCond.wait_for(lock, std::chrono::milliseconds(100), [this] {
                        return m_PacketTraceStop.load(std::memory_order_acquire) ||
                               m_PacketTraceReadIdx != m_PacketTraceWriteIdx.load(std::memory_order_acquire);
                    });
                    while (m_PacketTraceReadIdx != m_PacketTraceWriteIdx.load(std::memory_order_acquire)) {
                        char line[kPacketTraceBufSize + 64];
                        char stamp[48];
                        FormatTimestamp(stamp, sizeof(stamp));
                        std::snprintf(line, sizeof(line), "%s [TRACE] %s\n", stamp,
                            m_PacketTraceQueue[m_PacketTraceReadIdx].data());
                        m_PacketTraceReadIdx = (m_PacketTraceReadIdx + 1) % kPacketTraceQueueSize;
                        lock.unlock();
                        {
                            std::lock_guard<std::mutex> fl(m_PacketTraceMutex);
                            if (m_PacketTraceFile.is_open()) m_PacketTraceFile << line;
                        }
                        lock.lock();
                    }
                }
                std::lock_guard<std::mutex> fl(m_PacketTraceMutex);
                if (m_PacketTraceFile.is_open()) m_PacketTraceFile.flush();
            }
            catch (const std::exception& e) {
                std::cerr << "packet trace writer stopped: " << e.what() << "\n";
            }
        }

        std::atomic<int> m_Level{ static_cast<int>(LogLevel::Info) };

        std::mutex m_Mutex;
        std::ofstream m_File;
        std::mutex m_StatsMutex;
        std::ofstream m_StatsFile;
        std::mutex m_PacketTraceMutex;
        std::ofstream m_PacketTraceFile;

        std::array<std::array<char, kPacketTraceBufSize>, kPacketTraceQueueSize> m_PacketTraceQueue{};
        size_t m_PacketTraceReadIdx = 0;
        std::atomic<size_t> m_PacketTraceWriteIdx{0};
        std::mutex m_PacketTraceQueueMutex;
        std::condition_variable m_PacketTraceCond;
        std::atomic<bool> m_PacketTraceStop{false};
        std::atomic<bool> m_PacketTraceEnabled{false};
        std::thread m_PacketTraceThread;
    };

    #define LOG_TRACE(msg)      VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Trace, "TRACE", msg)
    #define LOG_DEBUG(msg)      VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Debug, "DEBUG", msg)
    #define LOG_INFO(msg)       VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Info, "INFO", msg)
    #define LOG_WARN(msg)       VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Warn, "WARN", msg)
    #define LOG_ERROR(msg)      VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Error, "ERROR", msg)
    #define LOG_NETWORK(msg)    VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Info, "Network", msg)
    #define LOG_AUDIO(msg)      VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Info, "Audio", msg)
    #define LOG_SYNC(msg)       VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Info, "Sync", msg)
    #define LOG_APP(msg)        VoxLink::Logger::Instance().Log(VoxLink::LogLevel::Info, "App", msg)
}
