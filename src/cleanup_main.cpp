#include "kvsession/cleanup_options.hpp"
#include "kvsession/cleanup_scheduler.hpp"
#include "kvsession/errors.hpp"
#include "kvsession/logger.hpp"
#include "kvsession/service_config.hpp"
#include "kvsession/session_context.hpp"
#include "kvsession/session_lifecycle.hpp"
#include "kvsession/store_factory.hpp"
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

static void print_usage(const char* prog)
    {
    std::cerr << "Usage: " << prog << " [--config FILE] [--once] [--interval SECONDS]\n";
    std::cerr << "  Config file defaults to config/kvsession.yaml\n";
    std::cerr << "  --once runs a single sweep and exits\n";
    std::cerr << "  Command line options override config file values\n";
    }

int main(int argc, char** argv)
    {
    kvsession::CleanupOptions options;
    try
        {
        options = kvsession::parse_cleanup_options(argc, argv);
        }
        catch (const kvsession::UsageError& e)
            {
            std::cerr << e.what() << std::endl;
            print_usage(argv[0]);
            return 1;
            }

    if (options.help)
        {
        print_usage(argv[0]);
        return 0;
        }

    auto& config = kvsession::config::ServiceConfig::instance();
    if (!config.load(options.config_file))
        {
        std::cerr << "Warning: Could not load config file: " << options.config_file << std::endl;
        }

    bool once = options.once;
    int interval_seconds = options.interval_seconds
        ? *options.interval_seconds
        : config.get_int("cleanup.interval_seconds", 3600);

    if (interval_seconds < 1)
        {
        std::cerr << "Cleanup interval must be at least one second" << std::endl;
        return 1;
        }

    kvsession::log::set_global_level(
        kvsession::log::level_from_string(config.get_string("logging.level", "info")));
    kvsession::log::Logger logger("kvsession-cleanup");

    try
        {
        auto store = kvsession::make_store(config);
        auto context = kvsession::SessionContext::from_settings(
            kvsession::SessionSettings::from_config(config));
        kvsession::SessionLifecycle lifecycle(context, *store);

        if (once)
            {
            lifecycle.cleanup_sessions();
            return 0;
            }

        boost::asio::io_context ioc;
        kvsession::CleanupScheduler scheduler(ioc, lifecycle, std::chrono::seconds(interval_seconds));

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](auto, auto)
            {
            logger.info("Shutdown signal received");
            scheduler.stop();
            ioc.stop();
            });

        scheduler.start();
        ioc.run();

        logger.info("Cleanup stopped after " + std::to_string(scheduler.sweeps()) + " sweep(s)");
        }
        catch (const std::exception& e)
            {
            logger.error(std::string("Session cleanup failed: ") + e.what());
            return 1;
            }

    return 0;
    }
