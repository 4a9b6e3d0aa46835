#pragma once

#include <memory>
#include <string>

#include "store/snapshot_store.hpp"

namespace buildtrace {

/**
 * SqliteSnapshotStore persists one record per job: metadata in `snapshots`
 * and the key -> fingerprint map in `snapshot_objects`. Fingerprints are
 * stored as BLOBs so a put/fetch cycle returns them bit-for-bit.
 *
 * Timestamps are kept with second resolution, matching the ingestion format.
 */
class SqliteSnapshotStore : public SnapshotStore {
public:
    explicit SqliteSnapshotStore(const std::string &dbPath);
    ~SqliteSnapshotStore() override;

    JobSnapshot fetch(int64_t jobId) const override;
    void put(const JobSnapshot &snapshot) override;

    std::optional<int64_t> latestJobBefore(int64_t jobId) const override;
    std::vector<SnapshotMeta> listSnapshots() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace buildtrace
