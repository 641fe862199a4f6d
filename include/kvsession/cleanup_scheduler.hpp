#pragma once

#include "kvsession/logger.hpp"
#include "kvsession/session_lifecycle.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace kvsession
{

// Runs SessionLifecycle::cleanup_sessions on the io_context every `interval`,
// starting one interval after start(). A failed sweep is logged and the next
// one is still scheduled.
class CleanupScheduler
    {
    public:
        CleanupScheduler(boost::asio::io_context& ioc,
                         SessionLifecycle& lifecycle,
                         std::chrono::steady_clock::duration interval);

        void start();
        void stop();

        std::size_t sweeps() const { return sweeps_.load(); }
        std::size_t failures() const { return failures_.load(); }
        std::size_t removed() const { return removed_.load(); }

    private:
        void schedule();
        void run_sweep();

        boost::asio::steady_timer timer_;
        SessionLifecycle& lifecycle_;
        std::chrono::steady_clock::duration interval_;
        bool running_ = false;
        std::atomic<std::size_t> sweeps_{ 0 };
        std::atomic<std::size_t> failures_{ 0 };
        std::atomic<std::size_t> removed_{ 0 };
        log::Logger logger_{ "CleanupScheduler" };
    };

} // namespace kvsession
