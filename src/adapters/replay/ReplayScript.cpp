#include "adapters/replay/ReplayScript.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <boost/json/object.hpp>

#include "adapters/json/MessageCodec.hpp"

namespace adapters::replay {
namespace {

std::string stringField(const boost::json::object& obj, const char* key) {
    const auto* field = obj.if_contains(key);
    if (field == nullptr || !field->is_string()) {
        throw std::runtime_error(std::string{"missing string field '"} + key + "'");
    }
    return std::string(field->as_string().data(), field->as_string().size());
}

std::int64_t integerField(const boost::json::object& obj, const char* key) {
    const auto* field = obj.if_contains(key);
    if (field == nullptr) {
        throw std::runtime_error(std::string{"missing integer field '"} + key + "'");
    }
    if (field->is_int64()) {
        return field->as_int64();
    }
    if (field->is_uint64()) {
        return static_cast<std::int64_t>(field->as_uint64());
    }
    throw std::runtime_error(std::string{"field '"} + key + "' must be an integer");
}

const boost::json::value& requireField(const boost::json::object& obj, const char* key) {
    const auto* field = obj.if_contains(key);
    if (field == nullptr) {
        throw std::runtime_error(std::string{"missing field '"} + key + "'");
    }
    return *field;
}

ReplayStep decodeStep(const boost::json::value& value) {
    if (!value.is_object()) {
        throw std::runtime_error("step must be a JSON object");
    }
    const auto& obj = value.as_object();
    const auto type = stringField(obj, "type");

    ReplayStep step;
    if (domain::eventTypeFromString(type)) {
        step.kind = ReplayStep::Kind::Message;
        step.message = json::decodeMessageEvent(value);
    } else if (type == "reaction.summary") {
        step.kind = ReplayStep::Kind::ReactionSummary;
        step.reaction = json::decodeReactionSummaryEvent(value);
    } else if (type == "discontinuity") {
        step.kind = ReplayStep::Kind::Discontinuity;
    } else if (type == "ui.showLatest") {
        step.kind = ReplayStep::Kind::ShowLatest;
    } else if (type == "ui.scrollBy") {
        step.kind = ReplayStep::Kind::ScrollBy;
        step.delta = integerField(obj, "delta");
    } else if (type == "ui.showAround") {
        step.kind = ReplayStep::Kind::ShowAround;
        step.serial = stringField(obj, "serial");
    } else if (type == "ui.loadMore") {
        step.kind = ReplayStep::Kind::LoadMore;
    } else if (type == "history.append") {
        step.kind = ReplayStep::Kind::HistoryAppend;
        step.messages = json::decodeMessages(requireField(obj, "messages"));
    } else {
        throw std::runtime_error("unknown step type '" + type + "'");
    }
    return step;
}

}  // namespace

const char* stepKindToString(ReplayStep::Kind kind) noexcept {
    switch (kind) {
    case ReplayStep::Kind::Message:
        return "message";
    case ReplayStep::Kind::ReactionSummary:
        return "reaction.summary";
    case ReplayStep::Kind::Discontinuity:
        return "discontinuity";
    case ReplayStep::Kind::ShowLatest:
        return "ui.showLatest";
    case ReplayStep::Kind::ScrollBy:
        return "ui.scrollBy";
    case ReplayStep::Kind::ShowAround:
        return "ui.showAround";
    case ReplayStep::Kind::LoadMore:
        return "ui.loadMore";
    case ReplayStep::Kind::HistoryAppend:
        return "history.append";
    }
    return "unknown";
}

ReplayScript ReplayScript::fromJson(const boost::json::value& value) {
    if (!value.is_object()) {
        throw std::runtime_error("Replay script must be a JSON object");
    }
    const auto& obj = value.as_object();

    ReplayScript script;
    if (const auto* room = obj.if_contains("room")) {
        if (!room->is_string()) {
            throw std::runtime_error("Replay script field 'room' must be a string");
        }
        script.room.assign(room->as_string().data(), room->as_string().size());
    }
    if (const auto* history = obj.if_contains("history")) {
        script.history = json::decodeMessages(*history);
    }

    if (const auto* steps = obj.if_contains("steps")) {
        if (!steps->is_array()) {
            throw std::runtime_error("Replay script field 'steps' must be an array");
        }
        std::size_t index = 0;
        for (const auto& item : steps->as_array()) {
            try {
                script.steps.push_back(decodeStep(item));
            } catch (const std::exception& ex) {
                std::ostringstream oss;
                oss << "Replay step " << index << ": " << ex.what();
                throw std::runtime_error(oss.str());
            }
            ++index;
        }
    }
    return script;
}

ReplayScript ReplayScript::load(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Cannot open replay script: " + path);
    }
    const std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    return fromJson(json::parse(text));
}

}  // namespace adapters::replay
