#pragma once

#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace buildtrace {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

// Parses "YYYY-MM-DDTHH:MM:SSZ". The epoch itself is a valid timestamp.
inline std::optional<std::chrono::system_clock::time_point> fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    errno = 0;
#if defined(_WIN32)
    const std::time_t time = _mkgmtime(&tm);
#else
    const std::time_t time = timegm(&tm);
#endif
    // -1 is also 1969-12-31T23:59:59Z; only errno tells the two apart.
    if (time == static_cast<std::time_t>(-1) && errno != 0) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toWarehouseStateString(WarehouseInsertState state)
{
    switch (state) {
    case WarehouseInsertState::NotAttempted:
        return "not_attempted";
    case WarehouseInsertState::Succeeded:
        return "succeeded";
    case WarehouseInsertState::Failed:
        return "failed";
    }
    return "not_attempted";
}

// Human wording used in reports: "attempted, succeeded" and friends.
inline std::string describeWarehouseStatus(const WarehouseStatus &status)
{
    switch (status.state) {
    case WarehouseInsertState::NotAttempted:
        return "not attempted";
    case WarehouseInsertState::Succeeded:
        return "attempted, succeeded";
    case WarehouseInsertState::Failed:
        if (status.message.empty()) {
            return "attempted, failed";
        }
        return "attempted, failed: " + status.message;
    }
    return "not attempted";
}

// Parses JSON text, rejecting objects that repeat a key. nlohmann::json
// would otherwise keep the last value silently.
inline nlohmann::json parseStrictJson(const std::string &text)
{
    std::vector<std::vector<std::string>> openObjects;
    const nlohmann::json::parser_callback_t callback =
        [&openObjects](int, nlohmann::json::parse_event_t event, nlohmann::json &parsed) {
            switch (event) {
            case nlohmann::json::parse_event_t::object_start:
                openObjects.emplace_back();
                break;
            case nlohmann::json::parse_event_t::key: {
                auto &seen = openObjects.back();
                const std::string key = parsed.get<std::string>();
                for (const auto &existing : seen) {
                    if (existing == key) {
                        throw MalformedSnapshotError("duplicate key in JSON object: " + key);
                    }
                }
                seen.push_back(key);
                break;
            }
            case nlohmann::json::parse_event_t::object_end:
                openObjects.pop_back();
                break;
            default:
                break;
            }
            return true;
        };

    try {
        return nlohmann::json::parse(text, callback);
    } catch (const nlohmann::json::parse_error &ex) {
        throw MalformedSnapshotError(std::string("invalid JSON: ") + ex.what());
    }
}

// Ingestion record: {job_id, timestamp, latency_ms, state: {key: fingerprint}}.
inline JobSnapshot parseJobSubmission(const nlohmann::json &j)
{
    if (!j.is_object()) {
        throw MalformedSnapshotError("job submission must be an object");
    }
    if (!j.contains("job_id") || !j.at("job_id").is_number_integer()) {
        throw MalformedSnapshotError("job submission requires integer job_id");
    }
    if (!j.contains("timestamp") || !j.at("timestamp").is_string()) {
        throw MalformedSnapshotError("job submission requires ISO-8601 timestamp");
    }
    if (!j.contains("latency_ms") || !j.at("latency_ms").is_number_integer()) {
        throw MalformedSnapshotError("job submission requires integer latency_ms");
    }
    if (!j.contains("state") || !j.at("state").is_object()) {
        throw MalformedSnapshotError("job submission requires a state object");
    }

    JobSnapshot snapshot;
    snapshot.jobId = j.at("job_id").get<int64_t>();
    const auto timestamp = fromIso8601Utc(j.at("timestamp").get<std::string>());
    if (!timestamp) {
        throw MalformedSnapshotError("job " + std::to_string(snapshot.jobId)
                                     + " has an unparseable timestamp");
    }
    snapshot.timestamp = *timestamp;
    snapshot.latencyMs = j.at("latency_ms").get<int64_t>();

    for (const auto &item : j.at("state").items()) {
        if (!item.value().is_string()) {
            throw MalformedSnapshotError("fingerprint for '" + item.key()
                                         + "' must be a string");
        }
        snapshot.objects.emplace(item.key(), item.value().get<std::string>());
    }
    return snapshot;
}

inline std::vector<JobSnapshot> parseJobSubmissions(const nlohmann::json &j)
{
    if (!j.is_array()) {
        throw MalformedSnapshotError("job submissions must be a JSON array");
    }
    std::vector<JobSnapshot> snapshots;
    snapshots.reserve(j.size());
    for (const auto &item : j) {
        snapshots.push_back(parseJobSubmission(item));
    }
    return snapshots;
}

inline void to_json(nlohmann::json &j, const JobSnapshot &snapshot)
{
    j = nlohmann::json{
        {"job_id", snapshot.jobId},
        {"timestamp", toIso8601Utc(snapshot.timestamp)},
        {"latency_ms", snapshot.latencyMs},
        {"state", snapshot.objects}
    };
}

inline void from_json(const nlohmann::json &j, JobSnapshot &snapshot)
{
    snapshot = parseJobSubmission(j);
}

inline void to_json(nlohmann::json &j, const SnapshotMeta &meta)
{
    j = nlohmann::json{
        {"job_id", meta.jobId},
        {"timestamp", toIso8601Utc(meta.timestamp)},
        {"latency_ms", meta.latencyMs}
    };
}

inline void to_json(nlohmann::json &j, const MovedObject &move)
{
    j = nlohmann::json{
        {"from", move.fromKey},
        {"to", move.toKey},
        {"fingerprint", move.fingerprint}
    };
}

inline void to_json(nlohmann::json &j, const ChangeSet &changeSet)
{
    j = nlohmann::json{
        {"previous_job_id", changeSet.previousJobId},
        {"current_job_id", changeSet.currentJobId},
        {"added", changeSet.added},
        {"removed", changeSet.removed},
        {"modified", changeSet.modified},
        {"unchanged", changeSet.unchanged},
        {"moves", changeSet.moves}
    };
}

// Field names match the warehouse row schema.
inline void to_json(nlohmann::json &j, const MetricsRecord &record)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(record.timestamp)},
        {"job_id", std::to_string(record.jobId)},
        {"latency_ms", record.latencyMs},
        {"total_added", record.totalAdded},
        {"total_removed", record.totalRemoved},
        {"total_modified", record.totalModified},
        {"total_unchanged", record.totalUnchanged}
    };
}

inline void to_json(nlohmann::json &j, const WarehouseStatus &status)
{
    j = nlohmann::json{
        {"state", toWarehouseStateString(status.state)},
        {"attempted", status.state != WarehouseInsertState::NotAttempted},
        {"succeeded", status.state == WarehouseInsertState::Succeeded},
        {"message", status.message},
        {"text", describeWarehouseStatus(status)}
    };
}

inline void to_json(nlohmann::json &j, const ChangeReport::Entry &entry)
{
    j = nlohmann::json{{"key", entry.key}, {"description", entry.description}};
}

inline void to_json(nlohmann::json &j, const ChangeReport::ModifiedEntry &entry)
{
    j = nlohmann::json{
        {"key", entry.key},
        {"before", entry.before},
        {"after", entry.after},
        {"description", entry.description}
    };
}

inline void to_json(nlohmann::json &j, const ChangeReport::MovedEntry &entry)
{
    j = nlohmann::json{
        {"from", entry.fromKey},
        {"to", entry.toKey},
        {"fingerprint", entry.fingerprint},
        {"description", entry.description}
    };
}

inline void to_json(nlohmann::json &j, const ChangeReport &report)
{
    j = nlohmann::json{
        {"job_id", report.jobId},
        {"previous_job_id", report.previousJobId.has_value()
             ? nlohmann::json(*report.previousJobId)
             : nlohmann::json()},
        {"metrics", report.metrics},
        {"added", report.added},
        {"removed", report.removed},
        {"moved", report.moved},
        {"modified", report.modified},
        {"summary", report.summary},
        {"metrics_status", report.warehouseStatus}
    };
}

} // namespace buildtrace
