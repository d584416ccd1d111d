#include "adapters/json/MessageCodec.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/json/array.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serializer.hpp>
#include <boost/json/string.hpp>

namespace adapters::json {
namespace {

std::runtime_error makeError(const std::string& context, const std::string& detail) {
    return std::runtime_error("Malformed " + context + ": " + detail);
}

const boost::json::object& requireObject(const boost::json::value& value, const char* context) {
    if (!value.is_object()) {
        throw makeError(context, "expected a JSON object");
    }
    return value.as_object();
}

std::string toString(const boost::json::string& str) { return std::string(str.data(), str.size()); }

std::int64_t toInt64(const boost::json::value& value, const char* field) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        const auto raw = value.as_uint64();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw makeError(field, "integer out of range");
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_double()) {
        constexpr double kTwoPow63 = 9223372036854775808.0;
        const double raw = value.as_double();
        // Also rejects NaN.
        if (!(raw >= -kTwoPow63 && raw < kTwoPow63)) {
            throw makeError(field, "integer out of range");
        }
        return static_cast<std::int64_t>(std::llround(raw));
    }
    if (value.is_string()) {
        const auto str = toString(value.as_string());
        try {
            std::size_t consumed = 0;
            const auto parsed = std::stoll(str, &consumed);
            if (consumed != str.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return parsed;
        } catch (const std::exception& ex) {
            throw makeError(field, "cannot parse integer '" + str + "' (" + ex.what() + ")");
        }
    }
    throw makeError(field, "unsupported JSON type for integer");
}

std::uint32_t toCount(const boost::json::value& value, const char* field) {
    const auto parsed = toInt64(value, field);
    if (parsed < 0 || parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw makeError(field, "count out of range");
    }
    return static_cast<std::uint32_t>(parsed);
}

std::string requireString(const boost::json::object& obj, const char* key, const char* context) {
    const auto* field = obj.if_contains(key);
    if (field == nullptr || !field->is_string()) {
        throw makeError(context, std::string{"missing string field '"} + key + "'");
    }
    return toString(field->as_string());
}

std::optional<std::string> optionalString(const boost::json::object& obj, const char* key, const char* context) {
    const auto* field = obj.if_contains(key);
    if (field == nullptr || field->is_null()) {
        return std::nullopt;
    }
    if (!field->is_string()) {
        throw makeError(context, std::string{"field '"} + key + "' must be a string");
    }
    return toString(field->as_string());
}

// Non-string values are kept as their JSON text so nothing is lost.
domain::StringMap decodeStringMap(const boost::json::value* value, const char* context) {
    domain::StringMap out;
    if (value == nullptr || value->is_null()) {
        return out;
    }
    for (const auto& entry : requireObject(*value, context)) {
        const std::string key(entry.key().data(), entry.key().size());
        if (entry.value().is_string()) {
            out.emplace(key, toString(entry.value().as_string()));
        } else {
            out.emplace(key, serialize(entry.value()));
        }
    }
    return out;
}

boost::json::object encodeStringMap(const domain::StringMap& map) {
    boost::json::object out;
    for (const auto& [key, value] : map) {
        out[key] = value;
    }
    return out;
}

std::vector<std::string> decodeClientList(const boost::json::value* value, const char* context) {
    std::vector<std::string> out;
    if (value == nullptr || value->is_null()) {
        return out;
    }
    if (!value->is_array()) {
        throw makeError(context, "clientIds must be an array");
    }
    for (const auto& item : value->as_array()) {
        if (!item.is_string()) {
            throw makeError(context, "clientIds must contain strings");
        }
        out.push_back(toString(item.as_string()));
    }
    return out;
}

std::map<std::string, domain::ReactionTally> decodeTallies(const boost::json::value* value, const char* context) {
    std::map<std::string, domain::ReactionTally> out;
    if (value == nullptr || value->is_null()) {
        return out;
    }
    for (const auto& entry : requireObject(*value, context)) {
        const auto& obj = requireObject(entry.value(), context);
        domain::ReactionTally tally;
        if (const auto* total = obj.if_contains("total")) {
            tally.total = toCount(*total, context);
        }
        tally.clientIds = decodeClientList(obj.if_contains("clientIds"), context);
        out.emplace(std::string(entry.key().data(), entry.key().size()), std::move(tally));
    }
    return out;
}

std::map<std::string, domain::MultipleReactionTally> decodeMultipleTallies(const boost::json::value* value) {
    constexpr const char* kContext = "multiple reaction summary";
    std::map<std::string, domain::MultipleReactionTally> out;
    if (value == nullptr || value->is_null()) {
        return out;
    }
    for (const auto& entry : requireObject(*value, kContext)) {
        const auto& obj = requireObject(entry.value(), kContext);
        domain::MultipleReactionTally tally;
        if (const auto* total = obj.if_contains("total")) {
            tally.total = toCount(*total, kContext);
        }
        if (const auto* unidentified = obj.if_contains("totalUnidentified")) {
            tally.totalUnidentified = toCount(*unidentified, kContext);
        }
        if (const auto* clients = obj.if_contains("clientIds"); clients != nullptr && !clients->is_null()) {
            for (const auto& client : requireObject(*clients, kContext)) {
                tally.clientIds.emplace(std::string(client.key().data(), client.key().size()),
                                        toCount(client.value(), kContext));
            }
        }
        out.emplace(std::string(entry.key().data(), entry.key().size()), std::move(tally));
    }
    return out;
}

boost::json::object encodeTallies(const std::map<std::string, domain::ReactionTally>& tallies) {
    boost::json::object out;
    for (const auto& [name, tally] : tallies) {
        boost::json::array clients;
        for (const auto& client : tally.clientIds) {
            clients.emplace_back(client);
        }
        boost::json::object row;
        row["total"] = tally.total;
        row["clientIds"] = std::move(clients);
        out[name] = std::move(row);
    }
    return out;
}

domain::MessageVersion decodeVersion(const boost::json::value* value, const domain::Message& message) {
    domain::MessageVersion version;
    version.serial = message.serial;
    version.timestamp = message.createdAt;
    if (value == nullptr || value->is_null()) {
        return version;
    }

    constexpr const char* kContext = "message version";
    const auto& obj = requireObject(*value, kContext);
    if (auto serial = optionalString(obj, "serial", kContext)) {
        version.serial = std::move(*serial);
    }
    if (const auto* timestamp = obj.if_contains("timestamp")) {
        version.timestamp = toInt64(*timestamp, kContext);
    }
    version.clientId = optionalString(obj, "clientId", kContext);
    version.description = optionalString(obj, "description", kContext);
    version.metadata = decodeStringMap(obj.if_contains("metadata"), kContext);
    return version;
}

}  // namespace

boost::json::value parse(std::string_view text) {
    boost::json::error_code ec;
    auto value = boost::json::parse(boost::json::string_view(text.data(), text.size()), ec);
    if (ec) {
        throw std::runtime_error("Invalid JSON: " + ec.message());
    }
    return value;
}

std::string serialize(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};
    while (!sr.done()) {
        const boost::json::string_view chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }
    return result;
}

domain::Message decodeMessage(const boost::json::value& value) {
    constexpr const char* kContext = "message";
    const auto& obj = requireObject(value, kContext);

    domain::Message message;
    message.serial = requireString(obj, "serial", kContext);
    if (message.serial.empty()) {
        throw makeError(kContext, "serial must not be empty");
    }
    message.clientId = optionalString(obj, "clientId", kContext).value_or("");
    message.text = optionalString(obj, "text", kContext).value_or("");
    if (const auto* createdAt = obj.if_contains("createdAt")) {
        message.createdAt = toInt64(*createdAt, kContext);
    } else if (const auto* timestamp = obj.if_contains("timestamp")) {
        message.createdAt = toInt64(*timestamp, kContext);
    }

    if (auto action = optionalString(obj, "action", kContext)) {
        const auto parsed = domain::actionFromString(*action);
        if (!parsed) {
            throw makeError(kContext, "unknown action '" + *action + "'");
        }
        message.action = *parsed;
    }

    message.version = decodeVersion(obj.if_contains("version"), message);
    message.metadata = decodeStringMap(obj.if_contains("metadata"), kContext);
    message.headers = decodeStringMap(obj.if_contains("headers"), kContext);
    if (const auto* reactions = obj.if_contains("reactions"); reactions != nullptr && !reactions->is_null()) {
        message.reactions = decodeReactionSummary(*reactions);
    }
    return message;
}

std::vector<domain::Message> decodeMessages(const boost::json::value& value) {
    if (!value.is_array()) {
        throw makeError("message list", "expected a JSON array");
    }
    std::vector<domain::Message> out;
    out.reserve(value.as_array().size());
    for (const auto& item : value.as_array()) {
        out.push_back(decodeMessage(item));
    }
    return out;
}

domain::ReactionSummary decodeReactionSummary(const boost::json::value& value) {
    const auto& obj = requireObject(value, "reaction summary");
    domain::ReactionSummary summary;
    summary.unique = decodeTallies(obj.if_contains("unique"), "unique reaction summary");
    summary.distinct = decodeTallies(obj.if_contains("distinct"), "distinct reaction summary");
    summary.multiple = decodeMultipleTallies(obj.if_contains("multiple"));
    return summary;
}

domain::MessageEvent decodeMessageEvent(const boost::json::value& value) {
    constexpr const char* kContext = "message event";
    const auto& obj = requireObject(value, kContext);

    const auto typeLabel = requireString(obj, "type", kContext);
    const auto type = domain::eventTypeFromString(typeLabel);
    if (!type) {
        throw makeError(kContext, "unknown event type '" + typeLabel + "'");
    }

    const auto* message = obj.if_contains("message");
    if (message == nullptr) {
        throw makeError(kContext, "missing 'message'");
    }
    return domain::MessageEvent{*type, decodeMessage(*message)};
}

domain::ReactionSummaryEvent decodeReactionSummaryEvent(const boost::json::value& value) {
    constexpr const char* kContext = "reaction summary event";
    const auto& obj = requireObject(value, kContext);

    const auto* summaryValue = obj.if_contains("summary");
    if (summaryValue == nullptr) {
        throw makeError(kContext, "missing 'summary'");
    }
    const auto& summaryObj = requireObject(*summaryValue, kContext);

    domain::ReactionSummaryEvent event;
    if (auto serial = optionalString(summaryObj, "messageSerial", kContext)) {
        event.messageSerial = std::move(*serial);
    } else {
        event.messageSerial = requireString(obj, "messageSerial", kContext);
    }
    event.summary = decodeReactionSummary(*summaryValue);
    return event;
}

boost::json::object encodeReactionSummary(const domain::ReactionSummary& summary) {
    boost::json::object out;
    out["unique"] = encodeTallies(summary.unique);
    out["distinct"] = encodeTallies(summary.distinct);

    boost::json::object multiple;
    for (const auto& [name, tally] : summary.multiple) {
        boost::json::object clients;
        for (const auto& [client, count] : tally.clientIds) {
            clients[client] = count;
        }
        boost::json::object row;
        row["total"] = tally.total;
        row["clientIds"] = std::move(clients);
        row["totalUnidentified"] = tally.totalUnidentified;
        multiple[name] = std::move(row);
    }
    out["multiple"] = std::move(multiple);
    return out;
}

boost::json::object encodeMessage(const domain::Message& message) {
    boost::json::object out;
    out["serial"] = message.serial;
    out["clientId"] = message.clientId;
    out["text"] = message.text;
    out["createdAt"] = message.createdAt;
    out["action"] = domain::actionToString(message.action);

    boost::json::object version;
    version["serial"] = message.version.serial;
    version["timestamp"] = message.version.timestamp;
    if (message.version.clientId) {
        version["clientId"] = *message.version.clientId;
    }
    if (message.version.description) {
        version["description"] = *message.version.description;
    }
    if (!message.version.metadata.empty()) {
        version["metadata"] = encodeStringMap(message.version.metadata);
    }
    out["version"] = std::move(version);

    out["metadata"] = encodeStringMap(message.metadata);
    out["headers"] = encodeStringMap(message.headers);
    if (message.reactions) {
        out["reactions"] = encodeReactionSummary(*message.reactions);
    }
    return out;
}

boost::json::value encodeMessages(const std::vector<domain::Message>& messages) {
    boost::json::array out;
    out.reserve(messages.size());
    for (const auto& message : messages) {
        out.emplace_back(encodeMessage(message));
    }
    return out;
}

}  // namespace adapters::json
