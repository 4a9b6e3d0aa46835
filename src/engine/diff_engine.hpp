#pragma once

#include "common/models.hpp"

namespace buildtrace {

/**
 * Classifies every object key of two snapshots into added, removed,
 * modified or unchanged, and annotates moves (a removed key whose
 * fingerprint reappears under an added key).
 *
 * Pure: no I/O and no shared state, so it is safe to call concurrently.
 * Identical inputs always produce an identical ChangeSet.
 */
ChangeSet diffSnapshots(const JobSnapshot &previous, const JobSnapshot &current);

// Throws MalformedSnapshotError if the snapshot violates the ingestion contract.
void validateSnapshot(const JobSnapshot &snapshot);

} // namespace buildtrace
