#include <cstddef>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "adapters/replay/ScriptedHistory.hpp"
#include "app/RecoveryEngine.hpp"
#include "core/MessageStore.h"
#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace {

std::string serialFor(int n) {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << n;
    return oss.str();
}

std::vector<domain::Message> makeMessages(int first, int count) {
    std::vector<domain::Message> out;
    for (int i = first; i < first + count; ++i) {
        domain::Message message;
        message.serial = serialFor(i);
        message.version.serial = message.serial;
        out.push_back(message);
    }
    return out;
}

struct Harness {
    explicit Harness(std::size_t batchSize)
        : history(std::make_shared<adapters::replay::ScriptedHistory>(ioc)), engine(batchSize, callbacks()) {}

    app::RecoveryEngine::Callbacks callbacks() {
        app::RecoveryEngine::Callbacks cb;
        cb.integrate = [this](const std::vector<domain::Message>& batch, bool prepend) {
            ++integrations;
            if (onIntegrate) {
                onIntegrate();
            }
            store.integrate(batch, prepend);
        };
        cb.stateChanged = [this]() { transitions.push_back(engine.recovering()); };
        cb.error = [this](const std::string& description) { errors.push_back(description); };
        return cb;
    }

    boost::asio::io_context ioc;
    std::shared_ptr<adapters::replay::ScriptedHistory> history;
    core::MessageStore store;
    std::vector<bool> transitions;
    std::vector<std::string> errors;
    std::size_t integrations{0};
    std::function<void()> onIntegrate;
    app::RecoveryEngine engine;
};

// History service whose failures are not std::exception.
class NonStandardFailureQuery : public domain::contracts::IHistoryQuery {
public:
    explicit NonStandardFailureQuery(bool throwInline) : throwInline_(throwInline) {}

    void query(std::size_t, domain::contracts::PageCallback callback) override {
        ++requests;
        if (throwInline_) {
            throw 7;
        }
        callback(std::make_exception_ptr(42), nullptr);
    }

    std::size_t requests{0};

private:
    bool throwInline_;
};

bool containsRange(const core::MessageStore& store, int first, int last) {
    for (int i = first; i <= last; ++i) {
        if (!store.contains(serialFor(i))) {
            std::cerr << "Missing " << serialFor(i) << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    {
        // The client saw up to 0050, then the channel dropped 0051..0099.
        Harness h(30);
        h.history->append(makeMessages(0, 100));
        h.store.integrate(makeMessages(20, 31));
        h.engine.attach(h.history);

        if (!h.engine.onDiscontinuity("0050") || !h.engine.recovering()) {
            std::cerr << "Expected recovery to start\n";
            return 1;
        }
        h.ioc.run();

        if (h.engine.recovering() || h.engine.pagesFetched() != 2 || h.engine.completedPasses() != 1) {
            std::cerr << "Expected a completed pass over two pages, got " << h.engine.pagesFetched() << "\n";
            return 1;
        }
        if (h.transitions != std::vector<bool>{true, false}) {
            std::cerr << "Expected Idle -> Recovering -> Idle\n";
            return 1;
        }
        if (!containsRange(h.store, 20, 99) || h.store.size() != 80 || !h.errors.empty()) {
            std::cerr << "Expected 0020..0099 after recovery, store has " << h.store.size() << "\n";
            return 1;
        }
    }

    {
        // Only one pass at a time.
        Harness h(30);
        h.history->append(makeMessages(0, 40));
        h.engine.attach(h.history);
        h.engine.onDiscontinuity("0035");
        if (h.engine.onDiscontinuity("0035")) {
            std::cerr << "Expected second discontinuity to be ignored while recovering\n";
            return 1;
        }
        h.ioc.run();
        if (h.history->requestCount() != 1 || h.engine.completedPasses() != 1) {
            std::cerr << "Expected a single request for a single pass\n";
            return 1;
        }
    }

    {
        // A failed page ends the pass and clears the flag.
        Harness h(10);
        h.history->append(makeMessages(0, 50));
        h.onIntegrate = [&h]() { h.history->failNext(1); };
        h.engine.attach(h.history);
        h.engine.onDiscontinuity("0005");
        h.ioc.run();
        if (h.engine.recovering() || h.errors.size() != 1 || h.engine.pagesFetched() != 1) {
            std::cerr << "Expected failure on the second page to clear the recovering flag\n";
            return 1;
        }
        if (h.store.size() != 10) {
            std::cerr << "Expected the first page to stay integrated\n";
            return 1;
        }

        // A later discontinuity starts a fresh pass.
        h.onIntegrate = nullptr;
        h.ioc.restart();
        if (!h.engine.onDiscontinuity("0045")) {
            std::cerr << "Expected a new pass after a failure\n";
            return 1;
        }
        h.ioc.run();
        if (h.engine.recovering() || h.engine.completedPasses() != 2) {
            std::cerr << "Expected second pass to finish\n";
            return 1;
        }
    }

    {
        // A lost serial that history no longer holds ends with the oldest page.
        Harness h(8);
        h.history->append(makeMessages(100, 20));
        h.engine.attach(h.history);
        h.engine.onDiscontinuity("0042");
        h.ioc.run();
        if (h.engine.recovering() || h.engine.pagesFetched() != 3 || h.store.size() != 20) {
            std::cerr << "Expected pagination to stop when history is exhausted\n";
            return 1;
        }
    }

    {
        // Leaving the room drops the pass in flight.
        Harness h(10);
        h.history->append(makeMessages(0, 30));
        h.engine.attach(h.history);
        h.engine.onDiscontinuity("0001");
        h.engine.reset();
        h.ioc.run();
        if (h.engine.recovering() || h.integrations != 0) {
            std::cerr << "Expected stale recovery pages to be discarded\n";
            return 1;
        }
        if (h.engine.onDiscontinuity("0001")) {
            std::cerr << "Expected no pass without history\n";
            return 1;
        }
    }

    for (const bool throwInline : {true, false}) {
        // Failures of any type end the pass.
        Harness h(10);
        auto failing = std::make_shared<NonStandardFailureQuery>(throwInline);
        h.engine.attach(failing);
        if (!h.engine.onDiscontinuity("0001") || h.engine.recovering() || h.engine.completedPasses() != 1) {
            std::cerr << "Expected a non-standard failure to end the pass (inline=" << throwInline << ")\n";
            return 1;
        }
        if (h.errors.size() != 1 || h.errors.front().find("non-standard exception") == std::string::npos) {
            std::cerr << "Expected the failure to be reported (inline=" << throwInline << ")\n";
            return 1;
        }
        if (!h.engine.onDiscontinuity("0001") || failing->requests != 2 || h.engine.recovering()) {
            std::cerr << "Expected a later discontinuity to start a new pass (inline=" << throwInline << ")\n";
            return 1;
        }
    }

    {
        // Switching rooms from inside the integrate callback stops the old pass.
        Harness h(10);
        h.history->append(makeMessages(0, 50));
        auto otherRoom = std::make_shared<adapters::replay::ScriptedHistory>(h.ioc);
        otherRoom->append(makeMessages(100, 5));
        bool switched = false;
        h.onIntegrate = [&h, &switched, otherRoom]() {
            if (switched) {
                return;
            }
            switched = true;
            h.engine.attach(otherRoom);
            h.engine.onDiscontinuity("0102");
        };
        h.engine.attach(h.history);
        h.engine.onDiscontinuity("0005");
        h.ioc.run();
        if (h.history->requestCount() != 1 || otherRoom->requestCount() != 1) {
            std::cerr << "Expected the old room to stop paging, requests " << h.history->requestCount() << "\n";
            return 1;
        }
        if (h.integrations != 2 || h.engine.completedPasses() != 1 || h.engine.recovering() || !h.errors.empty()) {
            std::cerr << "Expected only the new room's pass to finish, passes " << h.engine.completedPasses()
                      << "\n";
            return 1;
        }
    }

    return 0;
}
