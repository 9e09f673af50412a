#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include "Logger.h"

namespace VoxLink {

    // Owns one worker thread and its running flag. The body is called in a
    // loop until RequestStop(); each call must return within a bounded
    // timeout (Globals::WORKER_POLL_MS) so the flag is observed promptly.
    // An exception escaping the body is logged and the loop keeps going.
    class WorkerThread {
    public:
        using Body = std::function<void()>;

        explicit WorkerThread(std::string name) : m_Name(std::move(name)) {}
        ~WorkerThread() { Stop(std::chrono::milliseconds(2000)); }

        WorkerThread(const WorkerThread&) = delete;
        WorkerThread& operator=(const WorkerThread&) = delete;

        bool Start(Body body) {
            if (m_Running.exchange(true)) return false;
            if (m_Thread.joinable()) m_Thread.join();
            {
                std::lock_guard<std::mutex> lk(m_ExitMutex);
                m_Exited = false;
            }
            m_Thread = std::thread([this, body = std::move(body)] {
                while (m_Running.load(std::memory_order_acquire)) {
                    try {
                        body();
                    }
                    catch (const std::exception& e) {
                        LOG_ERROR(std::string("step=worker_exception worker=") + m_Name + " what=" + e.what());
                    }
                }
                {
                    std::lock_guard<std::mutex> lk(m_ExitMutex);
                    m_Exited = true;
                }
                m_ExitCv.notify_all();
            });
            return true;
        }

        void RequestStop() { m_Running.store(false, std::memory_order_release); }

        // Waits up to `grace` for the loop to notice the stop request. A worker
        // that overruns is reported; the thread is still joined so nothing
        // outlives its owner.
        bool Join(std::chrono::milliseconds grace) {
            if (!m_Thread.joinable()) return true;
            bool inTime;
            {
                std::unique_lock<std::mutex> lk(m_ExitMutex);
                inTime = m_ExitCv.wait_for(lk, grace, [this] { return m_Exited; });
            }
            if (!inTime)
                LOG_ERROR("step=worker_join reason=grace_exceeded worker=" + m_Name
                    + " grace_ms=" + std::to_string(grace.count()));
            m_Thread.join();
            return inTime;
        }

        bool Stop(std::chrono::milliseconds grace) {
            RequestStop();
            return Join(grace);
        }

        bool IsRunning() const { return m_Running.load(std::memory_order_acquire); }

    private:
        const std::string       m_Name;
        std::thread             m_Thread;
        std::atomic<bool>       m_Running{ false };
        std::mutex              m_ExitMutex;
        std::condition_variable m_ExitCv;
        bool                    m_Exited = true;
    };

} // namespace VoxLink
