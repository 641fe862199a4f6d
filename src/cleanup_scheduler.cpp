#include "kvsession/cleanup_scheduler.hpp"
#include <exception>

namespace kvsession
{

CleanupScheduler::CleanupScheduler(boost::asio::io_context& ioc,
                                   SessionLifecycle& lifecycle,
                                   std::chrono::steady_clock::duration interval)
    : timer_(ioc)
    , lifecycle_(lifecycle)
    , interval_(interval)
    {}

void CleanupScheduler::start()
    {
    if (running_)
        {
        return;
        }
    running_ = true;
    logger_.info("Sweeping expired sessions every " +
                 std::to_string(std::chrono::duration_cast<std::chrono::seconds>(interval_).count()) + "s");
    schedule();
    }

void CleanupScheduler::stop()
    {
    running_ = false;
    timer_.cancel();
    }

void CleanupScheduler::schedule()
    {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec)
        {
        if (ec == boost::asio::error::operation_aborted || !running_)
            {
            return;
            }
        if (ec)
            {
            logger_.error("Cleanup timer failed: " + ec.message());
            }
        else
            {
            run_sweep();
            }
        schedule();
        });
    }

void CleanupScheduler::run_sweep()
    {
    ++sweeps_;
    try
        {
        removed_ += lifecycle_.cleanup_sessions();
        }
        catch (const std::exception& e)
            {
            ++failures_;
            logger_.error(std::string("Session cleanup failed: ") + e.what());
            }
    }

} // namespace kvsession
