#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/Ordering.hpp"

namespace {

domain::Message makeMessage(const std::string& serial) {
    domain::Message message;
    message.serial = serial;
    message.version.serial = serial;
    return message;
}

std::vector<domain::Message> makeSequence(const std::vector<std::string>& serials) {
    std::vector<domain::Message> out;
    for (const auto& serial : serials) {
        out.push_back(makeMessage(serial));
    }
    return out;
}

}  // namespace

int main() {
    using domain::Order;

    if (domain::compareSerials("0001", "0002") != Order::Before ||
        domain::compareSerials("0002", "0001") != Order::After ||
        domain::compareSerials("0002", "0002") != Order::Same) {
        std::cerr << "Expected bytewise serial comparison\n";
        return 1;
    }
    // Bytewise, not numeric: a shorter prefix sorts first.
    if (domain::compareSerials("01", "010") != Order::Before) {
        std::cerr << "Expected prefix to sort before longer serial\n";
        return 1;
    }

    const auto a = makeMessage("0001");
    const auto b = makeMessage("0002");
    if (!a.before(b) || a.after(b) || !b.after(a) || domain::compare(a, a) != Order::Same) {
        std::cerr << "Message before/after disagree with serial order\n";
        return 1;
    }

    const auto sequence = makeSequence({"0001", "0003", "0005", "0007"});
    if (domain::insertionIndex(sequence, makeMessage("0000")) != 0) {
        std::cerr << "Expected oldest insertion at index 0\n";
        return 1;
    }
    if (domain::insertionIndex(sequence, makeMessage("0004")) != 2) {
        std::cerr << "Expected 0004 to insert at index 2\n";
        return 1;
    }
    if (domain::insertionIndex(sequence, makeMessage("0009")) != sequence.size()) {
        std::cerr << "Expected newest insertion at the end\n";
        return 1;
    }
    if (domain::insertionIndex(sequence, makeMessage("0003")) != 2) {
        std::cerr << "Expected equal serial to insert after the existing one\n";
        return 1;
    }
    const std::vector<domain::Message> empty;
    if (domain::insertionIndex(empty, makeMessage("0001")) != 0) {
        std::cerr << "Expected insertion into empty sequence at 0\n";
        return 1;
    }

    const auto found = domain::findBySerial(sequence, "0005");
    if (!found || *found != 2) {
        std::cerr << "Expected to find 0005 at index 2\n";
        return 1;
    }
    if (domain::findBySerial(sequence, "0004")) {
        std::cerr << "Did not expect to find missing serial 0004\n";
        return 1;
    }
    if (domain::findBySerial(empty, "0001")) {
        std::cerr << "Did not expect a match in an empty sequence\n";
        return 1;
    }

    const auto newestFirst = makeSequence({"0009", "0007", "0005", "0003", "0001"});
    for (std::size_t i = 0; i < newestFirst.size(); ++i) {
        const auto idx = domain::findBySerial(newestFirst, newestFirst[i].serial, /*descending=*/true);
        if (!idx || *idx != i) {
            std::cerr << "Descending search failed for " << newestFirst[i].serial << "\n";
            return 1;
        }
    }
    if (domain::findBySerial(newestFirst, "0006", true)) {
        std::cerr << "Did not expect descending match for 0006\n";
        return 1;
    }

    return 0;
}
