#include "sim/job_simulator.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>
#include <set>
#include <stdexcept>

#include "common/json_utils.hpp"

namespace buildtrace {

namespace {

const std::vector<std::string> kObjectTypes = {"wall", "door", "window", "column", "stair"};

constexpr const char *kFirstJobTimestamp = "2024-01-01T00:00:00Z";

std::string typeInitial(const std::string &type)
{
    return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(type.front()))));
}

std::string zeroPad3(int value)
{
    std::string text = std::to_string(value);
    if (text.size() < 3) {
        text.insert(0, 3 - text.size(), '0');
    }
    return text;
}

} // namespace

JobSimulator::JobSimulator(uint64_t seed, int baseObjects)
    : m_rng(seed)
    , m_baseObjects(baseObjects)
{
    if (baseObjects <= 0) {
        throw std::invalid_argument("base object count must be positive");
    }
}

int JobSimulator::randomInt(int low, int high)
{
    std::uniform_int_distribution<int> dist(low, high);
    return dist(m_rng);
}

const std::string &JobSimulator::randomType()
{
    return kObjectTypes[static_cast<size_t>(randomInt(0, static_cast<int>(kObjectTypes.size()) - 1))];
}

JobSimulator::SimObject JobSimulator::makeObject(std::string id, const std::string &type)
{
    SimObject object;
    object.id = std::move(id);
    object.type = type;
    object.x = randomInt(0, 100);
    object.y = randomInt(0, 100);
    object.width = randomInt(1, 10);
    object.height = randomInt(1, 10);
    return object;
}

std::vector<size_t> JobSimulator::sampleIndices(size_t population, size_t count)
{
    std::vector<size_t> indices(population);
    std::iota(indices.begin(), indices.end(), 0);
    std::shuffle(indices.begin(), indices.end(), m_rng);
    indices.resize(std::min(count, population));
    return indices;
}

void JobSimulator::seedObjects()
{
    m_objects.clear();
    for (int i = 0; i < m_baseObjects; ++i) {
        const std::string &type = randomType();
        m_objects.push_back(makeObject(typeInitial(type) + zeroPad3(i), type));
    }
}

void JobSimulator::applyChanges(int64_t jobId)
{
    // Removals: 5-10% of the objects once there are more than five.
    if (m_objects.size() > 5) {
        const int size = static_cast<int>(m_objects.size());
        const int toRemove = randomInt(static_cast<int>(size * 0.05), static_cast<int>(size * 0.10));
        std::vector<size_t> doomed = sampleIndices(m_objects.size(), static_cast<size_t>(toRemove));
        std::sort(doomed.rbegin(), doomed.rend());
        for (size_t index : doomed) {
            m_objects.erase(m_objects.begin() + static_cast<std::ptrdiff_t>(index));
        }
    }

    // Positional nudges: 10-20% of the remaining objects.
    const int size = static_cast<int>(m_objects.size());
    const int toModify = randomInt(static_cast<int>(size * 0.10), static_cast<int>(size * 0.20));
    for (size_t index : sampleIndices(m_objects.size(), static_cast<size_t>(toModify))) {
        m_objects[index].x += randomInt(-2, 2);
        m_objects[index].y += randomInt(-2, 2);
    }

    // Additions: 2-5 objects with ids unique within the job.
    std::set<std::string> used;
    const int toAdd = randomInt(2, 5);
    for (int i = 0; i < toAdd; ++i) {
        const std::string &type = randomType();
        std::string id;
        do {
            id = "J" + std::to_string(jobId) + "N" + typeInitial(type)
                + std::to_string(randomInt(100, 999));
        } while (!used.insert(id).second);
        m_objects.push_back(makeObject(std::move(id), type));
    }
}

JobSnapshot JobSimulator::snapshotFor(int64_t jobId)
{
    JobSnapshot snapshot;
    snapshot.jobId = jobId;
    snapshot.timestamp = *fromIso8601Utc(kFirstJobTimestamp) + std::chrono::minutes(jobId - 1);
    snapshot.latencyMs = randomInt(1000, 30000);
    for (const auto &object : m_objects) {
        snapshot.objects[object.id] = object.type + "_" + std::to_string(object.x) + "_"
            + std::to_string(object.y) + "_" + std::to_string(object.width) + "_"
            + std::to_string(object.height);
    }
    return snapshot;
}

std::vector<JobSnapshot> JobSimulator::generate(int jobs)
{
    std::vector<JobSnapshot> snapshots;
    for (int64_t jobId = 1; jobId <= jobs; ++jobId) {
        if (jobId == 1) {
            seedObjects();
        } else {
            applyChanges(jobId);
        }
        snapshots.push_back(snapshotFor(jobId));
    }
    return snapshots;
}

} // namespace buildtrace
