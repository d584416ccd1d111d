#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "domain/Models.hpp"

namespace adapters::json {

// All decoders throw std::runtime_error on malformed input.
boost::json::value parse(std::string_view text);
std::string serialize(const boost::json::value& value);

domain::Message decodeMessage(const boost::json::value& value);
std::vector<domain::Message> decodeMessages(const boost::json::value& value);
domain::ReactionSummary decodeReactionSummary(const boost::json::value& value);
domain::MessageEvent decodeMessageEvent(const boost::json::value& value);
domain::ReactionSummaryEvent decodeReactionSummaryEvent(const boost::json::value& value);

boost::json::object encodeMessage(const domain::Message& message);
boost::json::object encodeReactionSummary(const domain::ReactionSummary& summary);
boost::json::value encodeMessages(const std::vector<domain::Message>& messages);

}  // namespace adapters::json
