#pragma once

/**
 * @file event_types.hpp
 * @brief Event types published to guidelink subscribers
 *
 * Two families share one variant:
 * - Notifications sent by PHD2 (tagged with "Event" on the wire)
 * - Connection lifecycle events produced locally by the session supervisor
 *
 * Tags this client does not model are carried as UnknownEvent with the raw
 * payload, so newer PHD2 builds never break subscribers.
 *
 * Timestamps are epoch milliseconds taken when the event was decoded.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace guidelink {
namespace events {

/**
 * @brief PHD2 application state as reported by AppState events and get_app_state
 */
enum class AppState {
    STOPPED,
    SELECTED,
    CALIBRATING,
    GUIDING,
    LOST_LOCK,
    PAUSED,
    LOOPING,
    UNKNOWN
};

inline const char *app_state_to_string(AppState state) {
    switch (state) {
        case AppState::STOPPED: return "Stopped";
        case AppState::SELECTED: return "Selected";
        case AppState::CALIBRATING: return "Calibrating";
        case AppState::GUIDING: return "Guiding";
        case AppState::LOST_LOCK: return "LostLock";
        case AppState::PAUSED: return "Paused";
        case AppState::LOOPING: return "Looping";
        default: return "Unknown";
    }
}

inline std::optional<AppState> app_state_from_string(const std::string &s) {
    if (s == "Stopped") return AppState::STOPPED;
    if (s == "Selected") return AppState::SELECTED;
    if (s == "Calibrating") return AppState::CALIBRATING;
    if (s == "Guiding") return AppState::GUIDING;
    if (s == "LostLock") return AppState::LOST_LOCK;
    if (s == "Paused") return AppState::PAUSED;
    if (s == "Looping") return AppState::LOOPING;
    return std::nullopt;
}

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// PHD2 notifications
// ============================================================================

// Greeting sent by PHD2 as the first message of every connection
struct VersionEvent {
    static constexpr const char *kName = "Version";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string phd_version;  // "2.6.11"
    std::string phd_subver;
    int msg_version = 0;
    bool overlap_support = false;
};

struct AppStateEvent {
    static constexpr const char *kName = "AppState";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    AppState state = AppState::UNKNOWN;
    std::string raw_state;
};

struct GuideStepEvent {
    static constexpr const char *kName = "GuideStep";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    int64_t frame = 0;
    double time = 0.0;  // Seconds since guiding started
    std::string mount;
    double dx = 0.0;
    double dy = 0.0;
    double ra_distance_raw = 0.0;
    double dec_distance_raw = 0.0;
    double ra_distance_guide = 0.0;
    double dec_distance_guide = 0.0;
    int ra_duration = 0;  // ms
    std::string ra_direction;
    int dec_duration = 0;  // ms
    std::string dec_direction;
    double star_mass = 0.0;
    double snr = 0.0;
    double hfd = 0.0;
    double avg_dist = 0.0;
    bool ra_limited = false;
    bool dec_limited = false;
    int error_code = 0;
};

struct StarLostEvent {
    static constexpr const char *kName = "StarLost";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    int64_t frame = 0;
    double time = 0.0;
    double star_mass = 0.0;
    double snr = 0.0;
    double avg_dist = 0.0;
    int error_code = 0;
    std::string status;
};

struct StarSelectedEvent {
    static constexpr const char *kName = "StarSelected";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    double x = 0.0;
    double y = 0.0;
};

struct LockPositionSetEvent {
    static constexpr const char *kName = "LockPositionSet";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    double x = 0.0;
    double y = 0.0;
};

struct CalibratingEvent {
    static constexpr const char *kName = "Calibrating";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string mount;
    std::string dir;
    double dist = 0.0;
    double dx = 0.0;
    double dy = 0.0;
    double pos_x = 0.0;
    double pos_y = 0.0;
    int step = 0;
    std::string state;
};

struct CalibrationCompleteEvent {
    static constexpr const char *kName = "CalibrationComplete";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string mount;
};

struct CalibrationFailedEvent {
    static constexpr const char *kName = "CalibrationFailed";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string reason;
};

struct SettlingEvent {
    static constexpr const char *kName = "Settling";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    double distance = 0.0;
    double time = 0.0;
    double settle_time = 0.0;
    bool star_locked = false;
};

struct SettleDoneEvent {
    static constexpr const char *kName = "SettleDone";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    int status = 0;  // 0 = success
    std::string error;
    int total_frames = 0;
    int dropped_frames = 0;
};

struct GuidingDitheredEvent {
    static constexpr const char *kName = "GuidingDithered";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    double dx = 0.0;
    double dy = 0.0;
};

struct LoopingExposuresEvent {
    static constexpr const char *kName = "LoopingExposures";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    int64_t frame = 0;
};

struct AlertEvent {
    static constexpr const char *kName = "Alert";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string msg;
    std::string type;  // info, question, warning, error
};

struct GuideParamChangeEvent {
    static constexpr const char *kName = "GuideParamChange";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string name;
    nlohmann::json value;
};

// Parameterless notifications (Paused, Resumed, GuidingStopped, StartGuiding, ...)
struct SignalEvent {
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string name;
};

// Unrecognized tag, or a known tag whose fields did not decode
struct UnknownEvent {
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string name;
    nlohmann::json payload;
};

// ============================================================================
// Connection lifecycle (local)
// ============================================================================

struct ConnectionLostEvent {
    static constexpr const char *kName = "ConnectionLost";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string reason;
};

struct ReconnectingEvent {
    static constexpr const char *kName = "Reconnecting";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    int attempt = 0;
    std::optional<int> max_attempts;  // nullopt: unlimited
};

struct ReconnectedEvent {
    static constexpr const char *kName = "Reconnected";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
};

struct ReconnectFailedEvent {
    static constexpr const char *kName = "ReconnectFailed";
    uint64_t event_id = 0;
    int64_t timestamp_ms = 0;
    std::string reason;
};

/**
 * @brief Union of all event types
 */
using Event = std::variant<VersionEvent, AppStateEvent, GuideStepEvent, StarLostEvent, StarSelectedEvent,
                           LockPositionSetEvent, CalibratingEvent, CalibrationCompleteEvent, CalibrationFailedEvent,
                           SettlingEvent, SettleDoneEvent, GuidingDitheredEvent, LoopingExposuresEvent, AlertEvent,
                           GuideParamChangeEvent, SignalEvent, UnknownEvent, ConnectionLostEvent, ReconnectingEvent,
                           ReconnectedEvent, ReconnectFailedEvent>;

/**
 * @brief Wire name of any event ("StarLost", "Reconnecting", ...)
 */
inline std::string event_type_name(const Event &event) {
    return std::visit(
        [](auto &&e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, SignalEvent> || std::is_same_v<T, UnknownEvent>) {
                return e.name;
            } else {
                return T::kName;
            }
        },
        event);
}

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

}  // namespace events
}  // namespace guidelink
