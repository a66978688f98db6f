#pragma once

#include <nlohmann/json.hpp>

#include "event_types.hpp"

namespace guidelink {
namespace events {

/**
 * @brief Decode a tagged PHD2 notification into a typed Event
 *
 * Never fails: unknown tags, and known tags whose fields have the wrong
 * JSON type, come back as UnknownEvent carrying the raw message.
 * event_id is left at 0 (assigned by the emitter).
 */
Event parse_event(const nlohmann::json &message);

/**
 * @brief Render an event as a flat JSON object with an "Event" tag
 *
 * Used by the CLI monitor; PHD2 field names are reused for PHD2 events.
 */
nlohmann::json event_to_json(const Event &event);

}  // namespace events
}  // namespace guidelink
