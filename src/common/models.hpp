#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace buildtrace {

// Object key -> opaque fingerprint. Fingerprints compare byte-exactly.
using ObjectMap = std::map<std::string, std::string>;

struct SnapshotMeta {
    int64_t jobId = 0;
    std::chrono::system_clock::time_point timestamp;
    int64_t latencyMs = 0;
};

struct JobSnapshot {
    int64_t jobId = 0;
    std::chrono::system_clock::time_point timestamp;
    int64_t latencyMs = 0;
    ObjectMap objects;

    SnapshotMeta meta() const
    {
        return SnapshotMeta{jobId, timestamp, latencyMs};
    }
};

inline bool operator==(const JobSnapshot &a, const JobSnapshot &b)
{
    return a.jobId == b.jobId && a.timestamp == b.timestamp
        && a.latencyMs == b.latencyMs && a.objects == b.objects;
}

struct MovedObject {
    std::string fromKey;
    std::string toKey;
    std::string fingerprint;
};

inline bool operator==(const MovedObject &a, const MovedObject &b)
{
    return a.fromKey == b.fromKey && a.toKey == b.toKey
        && a.fingerprint == b.fingerprint;
}

struct ChangeSet {
    int64_t previousJobId = 0;
    int64_t currentJobId = 0;

    // Sorted, duplicate-free key lists.
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> modified;
    std::vector<std::string> unchanged;

    // Annotation over added/removed pairs, sorted by fromKey.
    std::vector<MovedObject> moves;
};

inline bool operator==(const ChangeSet &a, const ChangeSet &b)
{
    return a.previousJobId == b.previousJobId
        && a.currentJobId == b.currentJobId
        && a.added == b.added
        && a.removed == b.removed
        && a.modified == b.modified
        && a.unchanged == b.unchanged
        && a.moves == b.moves;
}

struct MetricsRecord {
    std::chrono::system_clock::time_point timestamp;
    int64_t jobId = 0;
    int64_t latencyMs = 0;

    int64_t totalAdded = 0;
    int64_t totalRemoved = 0;
    int64_t totalModified = 0;
    int64_t totalUnchanged = 0;
};

struct WarehouseStatus {
    WarehouseInsertState state = WarehouseInsertState::NotAttempted;
    std::string message;
};

struct ChangeReport {
    struct Entry {
        std::string key;
        std::string description;
    };

    struct ModifiedEntry {
        std::string key;
        std::string before;
        std::string after;
        std::string description;
    };

    struct MovedEntry {
        std::string fromKey;
        std::string toKey;
        std::string fingerprint;
        std::string description;
    };

    int64_t jobId = 0;
    std::optional<int64_t> previousJobId;
    MetricsRecord metrics;

    // Moves are listed separately; added/removed hold the plain entries only.
    std::vector<Entry> added;
    std::vector<Entry> removed;
    std::vector<MovedEntry> moved;
    std::vector<ModifiedEntry> modified;

    std::string summary;
    WarehouseStatus warehouseStatus;
};

} // namespace buildtrace
