#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace guidelink {
namespace rpc {

// Serialize {"jsonrpc":"2.0","method":...,"params":...,"id":N}. Null params are omitted.
std::string encode_call(uint64_t id, const std::string &method, const nlohmann::json &params);

// Parse one line into a JSON object. Non-objects are rejected.
bool decode_message(const std::string &line, nlohmann::json &out, std::string &error);

// Correlation id of a message, if it carries a non-negative integer "id"
std::optional<uint64_t> message_id(const nlohmann::json &message);

// Name of the "Event" tag, if present
std::optional<std::string> event_name(const nlohmann::json &message);

}  // namespace rpc
}  // namespace guidelink
