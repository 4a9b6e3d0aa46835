#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace buildtrace {

/**
 * JobSimulator generates a sequence of geometry build jobs for demos and
 * load tests. Each job removes, nudges and adds objects relative to the
 * previous one; fingerprints are "<type>_<x>_<y>_<w>_<h>" pseudo-hashes.
 *
 * The output depends only on the seed.
 */
class JobSimulator {
public:
    explicit JobSimulator(uint64_t seed, int baseObjects = 50);

    std::vector<JobSnapshot> generate(int jobs);

private:
    struct SimObject {
        std::string id;
        std::string type;
        int x = 0;
        int y = 0;
        int width = 0;
        int height = 0;
    };

    int randomInt(int low, int high);
    SimObject makeObject(std::string id, const std::string &type);
    const std::string &randomType();
    std::vector<size_t> sampleIndices(size_t population, size_t count);

    void seedObjects();
    void applyChanges(int64_t jobId);
    JobSnapshot snapshotFor(int64_t jobId);

    std::mt19937_64 m_rng;
    int m_baseObjects;
    std::vector<SimObject> m_objects;
};

} // namespace buildtrace
