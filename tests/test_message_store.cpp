#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "core/Anchor.h"
#include "core/MessageStore.h"
#include "domain/Models.hpp"

namespace {

std::string serialFor(int n) {
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << n;
    return oss.str();
}

domain::Message makeMessage(const std::string& serial, const std::string& text = "text") {
    domain::Message message;
    message.serial = serial;
    message.text = text;
    message.version.serial = serial;
    return message;
}

bool strictlyOrdered(const core::MessageStore& store) {
    const auto& messages = store.messages();
    for (std::size_t i = 1; i < messages.size(); ++i) {
        if (!messages[i - 1].before(messages[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main() {
    {
        // Insertion in the middle keeps order; a tail anchor still sees the newest row.
        core::MessageStore store;
        core::Anchor anchor = core::Anchor::tail();
        store.integrate({makeMessage("0001"), makeMessage("0003")}, false, &anchor);
        if (!store.integrate({makeMessage("0002")}, false, &anchor)) {
            std::cerr << "Expected integrate of a new serial to report a change\n";
            return 1;
        }
        const auto& messages = store.messages();
        if (messages.size() != 3 || messages[0].serial != "0001" || messages[1].serial != "0002" ||
            messages[2].serial != "0003") {
            std::cerr << "Expected [0001, 0002, 0003]\n";
            return 1;
        }
        if (!anchor.followsTail() || messages[anchor.resolve(store.size())].serial != "0003") {
            std::cerr << "Expected tail anchor to resolve to 0003\n";
            return 1;
        }
    }

    {
        // Any arrival order converges to the same strictly ordered, duplicate-free sequence.
        std::vector<domain::Message> all;
        for (int i = 0; i < 200; ++i) {
            all.push_back(makeMessage(serialFor(i)));
        }
        std::mt19937 rng(42);
        for (int round = 0; round < 5; ++round) {
            auto shuffled = all;
            std::shuffle(shuffled.begin(), shuffled.end(), rng);
            // Redeliver a slice to exercise dedup.
            shuffled.insert(shuffled.end(), all.begin() + 50, all.begin() + 80);

            core::MessageStore store;
            std::size_t offset = 0;
            while (offset < shuffled.size()) {
                const std::size_t chunk = std::min<std::size_t>(1 + rng() % 17, shuffled.size() - offset);
                std::vector<domain::Message> batch(shuffled.begin() + static_cast<std::ptrdiff_t>(offset),
                                                   shuffled.begin() + static_cast<std::ptrdiff_t>(offset + chunk));
                store.integrate(batch, rng() % 2 == 0);
                offset += chunk;
            }
            if (store.size() != all.size() || !strictlyOrdered(store)) {
                std::cerr << "Round " << round << ": expected " << all.size()
                          << " ordered messages, got " << store.size() << "\n";
                return 1;
            }
        }
    }

    {
        // Redelivery of an identical batch is a no-op and does not bump the version.
        core::MessageStore store;
        const std::vector<domain::Message> batch{makeMessage("0001"), makeMessage("0002")};
        store.integrate(batch);
        const auto version = store.version();
        if (store.integrate(batch) || store.version() != version || store.size() != 2) {
            std::cerr << "Expected identical redelivery to change nothing\n";
            return 1;
        }
        if (store.integrate({})) {
            std::cerr << "Expected empty batch to change nothing\n";
            return 1;
        }
    }

    {
        // A concrete anchor keeps pointing at the same message when older rows arrive.
        core::MessageStore store;
        store.integrate({makeMessage("0010"), makeMessage("0020"), makeMessage("0030")});
        core::Anchor anchor = core::Anchor::at(1);
        store.integrate({makeMessage("0001"), makeMessage("0002"), makeMessage("0015")}, true, &anchor);
        if (anchor.followsTail() || store.messages()[*anchor.index].serial != "0020") {
            std::cerr << "Expected anchor to follow 0020 after inserts\n";
            return 1;
        }
        store.integrate({makeMessage("0040")}, false, &anchor);
        if (store.messages()[*anchor.index].serial != "0020") {
            std::cerr << "Expected newer rows not to move the anchor\n";
            return 1;
        }
    }

    {
        // Edits merge in place; stale edits do not.
        core::MessageStore store;
        store.integrate({makeMessage("0001", "first")});
        auto edit = makeMessage("0001", "edited");
        edit.version.serial = "0004";
        edit.action = domain::MessageAction::Update;
        if (!store.integrate({edit}) || store.messages().front().text != "edited") {
            std::cerr << "Expected edit to replace text\n";
            return 1;
        }
        if (store.integrate({makeMessage("0001", "first")}) || store.messages().front().text != "edited") {
            std::cerr << "Expected stale copy not to overwrite the edit\n";
            return 1;
        }
    }

    {
        // Reaction summaries only apply to known messages.
        core::MessageStore store;
        store.integrate({makeMessage("0001")});
        const auto before = store.version();

        domain::ReactionSummaryEvent unknown;
        unknown.messageSerial = "0099";
        unknown.summary.unique["heart"] = domain::ReactionTally{1, {"carol"}};
        if (store.applyReactionSummary(unknown) || store.version() != before || store.contains("0099")) {
            std::cerr << "Expected summary for unknown serial to be dropped\n";
            return 1;
        }

        domain::ReactionSummaryEvent known = unknown;
        known.messageSerial = "0001";
        if (!store.applyReactionSummary(known) || store.version() != before + 1) {
            std::cerr << "Expected summary for a known serial to apply\n";
            return 1;
        }
        const auto& reactions = store.messages().front().reactions;
        if (!reactions || reactions->unique.at("heart").total != 1) {
            std::cerr << "Expected heart reaction on 0001\n";
            return 1;
        }
        if (store.applyReactionSummary(known)) {
            std::cerr << "Expected identical summary to be a no-op\n";
            return 1;
        }
    }

    {
        core::MessageStore store;
        store.integrate({makeMessage("0001"), makeMessage("0002")});
        if (!store.indexOf("0002") || *store.indexOf("0002") != 1 || store.indexOf("0003")) {
            std::cerr << "Unexpected indexOf results\n";
            return 1;
        }
        store.clear();
        if (!store.empty() || store.version() != 0 || store.contains("0001") || store.back() != nullptr) {
            std::cerr << "Expected clear to empty the store\n";
            return 1;
        }
    }

    return 0;
}
