#include "event_parser.hpp"

#include <string>
#include <unordered_set>

#include "logging/logger.hpp"

namespace guidelink {
namespace events {

namespace {

using nlohmann::json;

// PHD2 notifications that carry nothing beyond their tag
const std::unordered_set<std::string> &signal_event_names() {
    static const std::unordered_set<std::string> names = {"Paused",
                                                          "Resumed",
                                                          "GuidingStopped",
                                                          "StartGuiding",
                                                          "StartCalibration",
                                                          "LoopingExposuresStopped",
                                                          "ConfigurationChange",
                                                          "LockPositionLost",
                                                          "LockPositionShiftLimitReached",
                                                          "CalibrationDataFlipped"};
    return names;
}

template <typename T>
T field(const json &message, const char *key, T fallback) {
    auto it = message.find(key);
    if (it == message.end() || it->is_null()) {
        return fallback;
    }
    return it->get<T>();
}

Event decode_known(const std::string &name, const json &m, int64_t ts) {
    if (name == VersionEvent::kName) {
        VersionEvent e;
        e.phd_version = field<std::string>(m, "PHDVersion", "");
        e.phd_subver = field<std::string>(m, "PHDSubver", "");
        e.msg_version = field<int>(m, "MsgVersion", 0);
        e.overlap_support = field<bool>(m, "OverlapSupport", false);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == AppStateEvent::kName) {
        AppStateEvent e;
        e.raw_state = field<std::string>(m, "State", "");
        e.state = app_state_from_string(e.raw_state).value_or(AppState::UNKNOWN);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == GuideStepEvent::kName) {
        GuideStepEvent e;
        e.frame = field<int64_t>(m, "Frame", 0);
        e.time = field<double>(m, "Time", 0.0);
        e.mount = field<std::string>(m, "Mount", "");
        e.dx = field<double>(m, "dx", 0.0);
        e.dy = field<double>(m, "dy", 0.0);
        e.ra_distance_raw = field<double>(m, "RADistanceRaw", 0.0);
        e.dec_distance_raw = field<double>(m, "DECDistanceRaw", 0.0);
        e.ra_distance_guide = field<double>(m, "RADistanceGuide", 0.0);
        e.dec_distance_guide = field<double>(m, "DECDistanceGuide", 0.0);
        e.ra_duration = field<int>(m, "RADuration", 0);
        e.ra_direction = field<std::string>(m, "RADirection", "");
        e.dec_duration = field<int>(m, "DECDuration", 0);
        e.dec_direction = field<std::string>(m, "DECDirection", "");
        e.star_mass = field<double>(m, "StarMass", 0.0);
        e.snr = field<double>(m, "SNR", 0.0);
        e.hfd = field<double>(m, "HFD", 0.0);
        e.avg_dist = field<double>(m, "AvgDist", 0.0);
        e.ra_limited = field<bool>(m, "RALimited", false);
        e.dec_limited = field<bool>(m, "DecLimited", false);
        e.error_code = field<int>(m, "ErrorCode", 0);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == StarLostEvent::kName) {
        StarLostEvent e;
        e.frame = field<int64_t>(m, "Frame", 0);
        e.time = field<double>(m, "Time", 0.0);
        e.star_mass = field<double>(m, "StarMass", 0.0);
        e.snr = field<double>(m, "SNR", 0.0);
        e.avg_dist = field<double>(m, "AvgDist", 0.0);
        e.error_code = field<int>(m, "ErrorCode", 0);
        e.status = field<std::string>(m, "Status", "");
        e.timestamp_ms = ts;
        return e;
    }
    if (name == StarSelectedEvent::kName) {
        StarSelectedEvent e;
        e.x = field<double>(m, "X", 0.0);
        e.y = field<double>(m, "Y", 0.0);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == LockPositionSetEvent::kName) {
        LockPositionSetEvent e;
        e.x = field<double>(m, "X", 0.0);
        e.y = field<double>(m, "Y", 0.0);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == CalibratingEvent::kName) {
        CalibratingEvent e;
        e.mount = field<std::string>(m, "Mount", "");
        e.dir = field<std::string>(m, "dir", "");
        e.dist = field<double>(m, "dist", 0.0);
        e.dx = field<double>(m, "dx", 0.0);
        e.dy = field<double>(m, "dy", 0.0);
        auto pos = m.find("pos");
        if (pos != m.end() && pos->is_array() && pos->size() >= 2) {
            e.pos_x = (*pos)[0].get<double>();
            e.pos_y = (*pos)[1].get<double>();
        }
        e.step = field<int>(m, "step", 0);
        e.state = field<std::string>(m, "State", "");
        e.timestamp_ms = ts;
        return e;
    }
    if (name == CalibrationCompleteEvent::kName) {
        CalibrationCompleteEvent e;
        e.mount = field<std::string>(m, "Mount", "");
        e.timestamp_ms = ts;
        return e;
    }
    if (name == CalibrationFailedEvent::kName) {
        CalibrationFailedEvent e;
        e.reason = field<std::string>(m, "Reason", "");
        e.timestamp_ms = ts;
        return e;
    }
    if (name == SettlingEvent::kName) {
        SettlingEvent e;
        e.distance = field<double>(m, "Distance", 0.0);
        e.time = field<double>(m, "Time", 0.0);
        e.settle_time = field<double>(m, "SettleTime", 0.0);
        e.star_locked = field<bool>(m, "StarLocked", false);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == SettleDoneEvent::kName) {
        SettleDoneEvent e;
        e.status = field<int>(m, "Status", 0);
        e.error = field<std::string>(m, "Error", "");
        e.total_frames = field<int>(m, "TotalFrames", 0);
        e.dropped_frames = field<int>(m, "DroppedFrames", 0);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == GuidingDitheredEvent::kName) {
        GuidingDitheredEvent e;
        e.dx = field<double>(m, "dx", 0.0);
        e.dy = field<double>(m, "dy", 0.0);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == LoopingExposuresEvent::kName) {
        LoopingExposuresEvent e;
        e.frame = field<int64_t>(m, "Frame", 0);
        e.timestamp_ms = ts;
        return e;
    }
    if (name == AlertEvent::kName) {
        AlertEvent e;
        e.msg = field<std::string>(m, "Msg", "");
        e.type = field<std::string>(m, "Type", "");
        e.timestamp_ms = ts;
        return e;
    }
    if (name == GuideParamChangeEvent::kName) {
        GuideParamChangeEvent e;
        e.name = field<std::string>(m, "Name", "");
        auto value = m.find("Value");
        if (value != m.end()) {
            e.value = *value;
        }
        e.timestamp_ms = ts;
        return e;
    }
    if (signal_event_names().count(name) > 0) {
        SignalEvent e;
        e.name = name;
        e.timestamp_ms = ts;
        return e;
    }

    UnknownEvent e;
    e.name = name;
    e.payload = m;
    e.timestamp_ms = ts;
    return e;
}

}  // namespace

Event parse_event(const nlohmann::json &message) {
    const int64_t ts = now_epoch_ms();

    std::string name;
    auto tag = message.find("Event");
    if (tag != message.end() && tag->is_string()) {
        name = tag->get<std::string>();
    }

    try {
        return decode_known(name, message, ts);
    } catch (const nlohmann::json::exception &e) {
        LOG_WARN("[Events] Could not decode '" << name << "' fields, passing raw payload: " << e.what());
    }

    UnknownEvent fallback;
    fallback.name = name;
    fallback.payload = message;
    fallback.timestamp_ms = ts;
    return fallback;
}

nlohmann::json event_to_json(const Event &event) {
    json out = std::visit(
        [](auto &&e) -> json {
            using T = std::decay_t<decltype(e)>;
            json j;

            if constexpr (std::is_same_v<T, VersionEvent>) {
                j = {{"PHDVersion", e.phd_version},
                     {"PHDSubver", e.phd_subver},
                     {"MsgVersion", e.msg_version},
                     {"OverlapSupport", e.overlap_support}};
            } else if constexpr (std::is_same_v<T, AppStateEvent>) {
                j = {{"State", e.raw_state}};
            } else if constexpr (std::is_same_v<T, GuideStepEvent>) {
                j = {{"Frame", e.frame},
                     {"Time", e.time},
                     {"Mount", e.mount},
                     {"dx", e.dx},
                     {"dy", e.dy},
                     {"RADistanceRaw", e.ra_distance_raw},
                     {"DECDistanceRaw", e.dec_distance_raw},
                     {"RADistanceGuide", e.ra_distance_guide},
                     {"DECDistanceGuide", e.dec_distance_guide},
                     {"RADuration", e.ra_duration},
                     {"RADirection", e.ra_direction},
                     {"DECDuration", e.dec_duration},
                     {"DECDirection", e.dec_direction},
                     {"StarMass", e.star_mass},
                     {"SNR", e.snr},
                     {"HFD", e.hfd},
                     {"AvgDist", e.avg_dist},
                     {"ErrorCode", e.error_code}};
            } else if constexpr (std::is_same_v<T, StarLostEvent>) {
                j = {{"Frame", e.frame},   {"Time", e.time},         {"StarMass", e.star_mass},
                     {"SNR", e.snr},       {"AvgDist", e.avg_dist},  {"ErrorCode", e.error_code},
                     {"Status", e.status}};
            } else if constexpr (std::is_same_v<T, StarSelectedEvent> || std::is_same_v<T, LockPositionSetEvent>) {
                j = {{"X", e.x}, {"Y", e.y}};
            } else if constexpr (std::is_same_v<T, CalibratingEvent>) {
                j = {{"Mount", e.mount}, {"dir", e.dir},   {"dist", e.dist},
                     {"dx", e.dx},       {"dy", e.dy},     {"pos", json::array({e.pos_x, e.pos_y})},
                     {"step", e.step},   {"State", e.state}};
            } else if constexpr (std::is_same_v<T, CalibrationCompleteEvent>) {
                j = {{"Mount", e.mount}};
            } else if constexpr (std::is_same_v<T, CalibrationFailedEvent>) {
                j = {{"Reason", e.reason}};
            } else if constexpr (std::is_same_v<T, SettlingEvent>) {
                j = {{"Distance", e.distance},
                     {"Time", e.time},
                     {"SettleTime", e.settle_time},
                     {"StarLocked", e.star_locked}};
            } else if constexpr (std::is_same_v<T, SettleDoneEvent>) {
                j = {{"Status", e.status},
                     {"Error", e.error},
                     {"TotalFrames", e.total_frames},
                     {"DroppedFrames", e.dropped_frames}};
            } else if constexpr (std::is_same_v<T, GuidingDitheredEvent>) {
                j = {{"dx", e.dx}, {"dy", e.dy}};
            } else if constexpr (std::is_same_v<T, LoopingExposuresEvent>) {
                j = {{"Frame", e.frame}};
            } else if constexpr (std::is_same_v<T, AlertEvent>) {
                j = {{"Msg", e.msg}, {"Type", e.type}};
            } else if constexpr (std::is_same_v<T, GuideParamChangeEvent>) {
                j = {{"Name", e.name}, {"Value", e.value}};
            } else if constexpr (std::is_same_v<T, UnknownEvent>) {
                j = e.payload.is_object() ? e.payload : json::object();
            } else if constexpr (std::is_same_v<T, ConnectionLostEvent> || std::is_same_v<T, ReconnectFailedEvent>) {
                j = {{"Reason", e.reason}};
            } else if constexpr (std::is_same_v<T, ReconnectingEvent>) {
                j = {{"Attempt", e.attempt}};
                j["MaxAttempts"] = e.max_attempts ? json(*e.max_attempts) : json(nullptr);
            } else {
                j = json::object();
            }

            j["event_id"] = e.event_id;
            j["timestamp_ms"] = e.timestamp_ms;
            return j;
        },
        event);

    out["Event"] = event_type_name(event);
    return out;
}

}  // namespace events
}  // namespace guidelink
