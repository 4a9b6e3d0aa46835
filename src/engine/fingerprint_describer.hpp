#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace buildtrace {

// Structural pseudo-hash emitted by geometry jobs: "<type>_<x>_<y>_<w>_<h>".
// Components outside the int64 range leave the fingerprint opaque.
struct StructuralFingerprint {
    std::string type;
    std::int64_t x = 0;
    std::int64_t y = 0;
    std::int64_t width = 0;
    std::int64_t height = 0;
};

std::optional<StructuralFingerprint> parseStructuralFingerprint(const std::string &fingerprint);

// Human wording for report entries. Opaque fingerprints get generic text.
std::string describeAddition(const std::string &key, const std::string &fingerprint);
std::string describeRemoval(const std::string &key);
std::string describeModification(const std::string &key,
                                 const std::string &before,
                                 const std::string &after);
std::string describeMove(const MovedObject &move);

} // namespace buildtrace
