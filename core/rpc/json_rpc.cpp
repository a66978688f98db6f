#include "json_rpc.hpp"

namespace guidelink {
namespace rpc {

std::string encode_call(uint64_t id, const std::string &method, const nlohmann::json &params) {
    nlohmann::json request = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null()) {
        request["params"] = params;
    }
    request["id"] = id;
    return request.dump();
}

bool decode_message(const std::string &line, nlohmann::json &out, std::string &error) {
    try {
        out = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error &e) {
        error = "Invalid JSON: " + std::string(e.what());
        return false;
    }

    if (!out.is_object()) {
        error = "Message is not a JSON object";
        return false;
    }
    return true;
}

std::optional<uint64_t> message_id(const nlohmann::json &message) {
    auto it = message.find("id");
    if (it == message.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_number_integer() && it->get<int64_t>() >= 0) {
        return static_cast<uint64_t>(it->get<int64_t>());
    }
    return std::nullopt;
}

std::optional<std::string> event_name(const nlohmann::json &message) {
    auto it = message.find("Event");
    if (it == message.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace rpc
}  // namespace guidelink
