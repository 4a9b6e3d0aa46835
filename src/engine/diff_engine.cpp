#include "engine/diff_engine.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/errors.hpp"

namespace buildtrace {

namespace {

using KeysByFingerprint = std::map<std::string, std::vector<std::string>>;

// Keys are visited in map order, so every group is already ascending.
KeysByFingerprint groupByFingerprint(const std::vector<std::string> &keys,
                                     const ObjectMap &objects)
{
    KeysByFingerprint groups;
    for (const auto &key : keys) {
        groups[objects.at(key)].push_back(key);
    }
    return groups;
}

std::vector<MovedObject> pairMoves(const std::vector<std::string> &removed,
                                   const std::vector<std::string> &added,
                                   const JobSnapshot &previous,
                                   const JobSnapshot &current)
{
    const KeysByFingerprint removedGroups = groupByFingerprint(removed, previous.objects);
    const KeysByFingerprint addedGroups = groupByFingerprint(added, current.objects);

    std::vector<MovedObject> moves;
    for (const auto &[fingerprint, fromKeys] : removedGroups) {
        auto match = addedGroups.find(fingerprint);
        if (match == addedGroups.end()) {
            continue;
        }
        const auto &toKeys = match->second;
        const size_t pairs = std::min(fromKeys.size(), toKeys.size());
        for (size_t i = 0; i < pairs; ++i) {
            moves.push_back(MovedObject{fromKeys[i], toKeys[i], fingerprint});
        }
    }

    std::sort(moves.begin(), moves.end(),
              [](const MovedObject &a, const MovedObject &b) {
                  return a.fromKey < b.fromKey;
              });
    return moves;
}

void checkPartition(const ChangeSet &changeSet,
                    const JobSnapshot &previous,
                    const JobSnapshot &current)
{
    const size_t currentCount = changeSet.added.size() + changeSet.modified.size()
        + changeSet.unchanged.size();
    const size_t previousCount = changeSet.removed.size() + changeSet.modified.size()
        + changeSet.unchanged.size();
    if (currentCount != current.objects.size() || previousCount != previous.objects.size()) {
        throw std::logic_error("diff classification does not partition the key sets");
    }
}

} // namespace

ChangeSet diffSnapshots(const JobSnapshot &previous, const JobSnapshot &current)
{
    ChangeSet changeSet;
    changeSet.previousJobId = previous.jobId;
    changeSet.currentJobId = current.jobId;

    // Both maps are ordered by key, so a single merge pass classifies
    // every key and leaves each list sorted.
    auto prevIt = previous.objects.begin();
    auto currIt = current.objects.begin();
    while (prevIt != previous.objects.end() || currIt != current.objects.end()) {
        if (currIt == current.objects.end()
            || (prevIt != previous.objects.end() && prevIt->first < currIt->first)) {
            changeSet.removed.push_back(prevIt->first);
            ++prevIt;
        } else if (prevIt == previous.objects.end() || currIt->first < prevIt->first) {
            changeSet.added.push_back(currIt->first);
            ++currIt;
        } else {
            if (prevIt->second == currIt->second) {
                changeSet.unchanged.push_back(currIt->first);
            } else {
                changeSet.modified.push_back(currIt->first);
            }
            ++prevIt;
            ++currIt;
        }
    }

    changeSet.moves = pairMoves(changeSet.removed, changeSet.added, previous, current);

    // INVARIANT: added+modified+unchanged == keys(current) and
    // removed+modified+unchanged == keys(previous).
    checkPartition(changeSet, previous, current);
    return changeSet;
}

void validateSnapshot(const JobSnapshot &snapshot)
{
    const std::string job = "job " + std::to_string(snapshot.jobId);
    if (snapshot.jobId <= 0) {
        throw MalformedSnapshotError(job + ": job id must be positive");
    }
    if (snapshot.latencyMs < 0) {
        throw MalformedSnapshotError(job + ": latency_ms must not be negative");
    }
    if (snapshot.objects.count(std::string()) > 0) {
        throw MalformedSnapshotError(job + ": object key must not be empty");
    }
}

} // namespace buildtrace
