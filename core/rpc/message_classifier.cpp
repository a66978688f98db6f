#include "message_classifier.hpp"

#include <utility>

#include "json_rpc.hpp"

namespace guidelink {
namespace rpc {

const char *message_kind_to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::RESPONSE: return "RESPONSE";
        case MessageKind::EVENT: return "EVENT";
        case MessageKind::ANOMALY: return "ANOMALY";
    }
    return "ANOMALY";
}

MessageClassifier::MessageClassifier(OutstandingFn is_outstanding) : is_outstanding_(std::move(is_outstanding)) {}

Classification MessageClassifier::classify(const nlohmann::json &message) const {
    Classification result;
    if (!message.is_object()) {
        return result;
    }

    result.id = message_id(message);
    if (result.id) {
        if (is_outstanding_ && is_outstanding_(*result.id)) {
            result.kind = MessageKind::RESPONSE;
            return result;
        }
        result.unknown_id = true;
    }

    auto name = event_name(message);
    if (name) {
        result.kind = MessageKind::EVENT;
        result.event = *name;
        return result;
    }

    result.kind = MessageKind::ANOMALY;
    return result;
}

}  // namespace rpc
}  // namespace guidelink
