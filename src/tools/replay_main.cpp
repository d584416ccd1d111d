#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json/object.hpp>

#include "adapters/json/MessageCodec.hpp"
#include "adapters/replay/ReplayScript.hpp"
#include "adapters/replay/ReplaySession.hpp"
#include "app/MessageWindow.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

boost::json::object describeWindow(const app::MessageWindow& window) {
    const auto& snapshot = window.snapshot();

    boost::json::object bounds;
    bounds["start"] = snapshot.bounds.start;
    bounds["end"] = snapshot.bounds.end;

    boost::json::object out;
    out["room"] = window.roomId();
    out["totalMessages"] = snapshot.totalMessages;
    out["version"] = snapshot.version;
    out["followsTail"] = snapshot.followsTail;
    out["loading"] = snapshot.loading;
    out["hasMoreHistory"] = snapshot.hasMoreHistory;
    out["recovering"] = window.recovering();
    out["bounds"] = std::move(bounds);
    out["messages"] = adapters::json::encodeMessages(*snapshot.messages);
    return out;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        const auto config = mwin::common::Config::fromArgs(argc, argv);
        mwin::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << mwin::log::levelToString(config.logLevel));
        LOG_INFO("  Window: size=" << config.windowSize << " overscan=" << config.overscan);
        LOG_INFO("  History batch: " << config.historyBatchSize);
        LOG_INFO("  History latency: " << config.historyLatencyMs << " ms");

        if (config.scriptPath.empty()) {
            LOG_ERR("A replay script is required (--script or MWIN_SCRIPT)");
            return EXIT_FAILURE;
        }
        auto script = adapters::replay::ReplayScript::load(config.scriptPath);
        LOG_INFO("  Script: " << config.scriptPath << " (" << script.steps.size() << " steps)");

        boost::asio::io_context ioc;
        app::MessageWindow window(app::MessageWindowOptions{config.windowSize, config.overscan,
                                                            config.historyBatchSize});
        std::size_t errors = 0;
        window.setErrorCallback([&errors](const std::string& description) {
            ++errors;
            LOG_WARN("Window error: " << description);
        });

        adapters::replay::ReplaySession session(ioc, window, std::move(script),
                                                std::chrono::milliseconds(config.historyLatencyMs));

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            LOG_WARN("Signal " << signal << " received, stopping replay");
            ioc.stop();
        });

        session.start([&signals]() { signals.cancel(); });
        ioc.run();

        if (!session.finished()) {
            LOG_WARN("Replay interrupted after " << session.stepsExecuted() << " steps");
        }
        LOG_INFO("Replay done: " << window.totalMessages() << " messages, " << errors << " errors");

        if (config.printWindow) {
            std::cout << adapters::json::serialize(describeWindow(window)) << std::endl;
        }
        window.leaveRoom();
        return session.finished() ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }
}
