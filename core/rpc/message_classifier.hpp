#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace guidelink {
namespace rpc {

enum class MessageKind {
    RESPONSE,  // Answers a call that is still outstanding
    EVENT,     // Tagged notification
    ANOMALY    // Neither: late or foreign response, or untagged noise
};

const char *message_kind_to_string(MessageKind kind);

struct Classification {
    MessageKind kind = MessageKind::ANOMALY;
    std::optional<uint64_t> id;  // Correlation id if the message carried one
    std::string event;           // Event tag when kind == EVENT
    bool unknown_id = false;     // Carried an id that no outstanding call owns
};

// Response if the id belongs to an outstanding call; otherwise an event if
// tagged with "Event"; otherwise an anomaly. Never throws.
class MessageClassifier {
public:
    using OutstandingFn = std::function<bool(uint64_t)>;

    explicit MessageClassifier(OutstandingFn is_outstanding);

    Classification classify(const nlohmann::json &message) const;

private:
    OutstandingFn is_outstanding_;
};

}  // namespace rpc
}  // namespace guidelink
