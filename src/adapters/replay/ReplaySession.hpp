#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "adapters/replay/ReplayEventSource.hpp"
#include "adapters/replay/ReplayScript.hpp"
#include "adapters/replay/ScriptedHistory.hpp"
#include "app/MessageWindow.hpp"

namespace adapters::replay {

// Plays a script against a MessageWindow. Each step is posted to the
// io_context on its own, so history pages requested by one step can complete
// before the next step runs.
class ReplaySession {
public:
    ReplaySession(boost::asio::io_context& ioc,
                  app::MessageWindow& window,
                  ReplayScript script,
                  std::chrono::milliseconds historyLatency = std::chrono::milliseconds{0});

    ReplaySession(const ReplaySession&) = delete;
    ReplaySession& operator=(const ReplaySession&) = delete;

    // Enters the scripted room and schedules the first step.
    void start(std::function<void()> onFinished = {});

    std::size_t stepsExecuted() const noexcept { return executed_; }
    bool finished() const noexcept { return executed_ == script_.steps.size(); }
    const std::shared_ptr<ScriptedHistory>& history() const noexcept { return history_; }
    const std::shared_ptr<ReplayEventSource>& events() const noexcept { return events_; }

private:
    void schedule_();
    void execute_(const ReplayStep& step);

    boost::asio::io_context& ioc_;
    app::MessageWindow& window_;
    ReplayScript script_;
    std::shared_ptr<ScriptedHistory> history_;
    std::shared_ptr<ReplayEventSource> events_;
    std::function<void()> onFinished_;
    std::size_t executed_{0};
};

}  // namespace adapters::replay
