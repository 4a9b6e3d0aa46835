#include "engine/fingerprint_describer.hpp"

#include <charconv>
#include <sstream>
#include <system_error>
#include <vector>

namespace buildtrace {

namespace {

std::optional<std::int64_t> parseInt(const std::string &value)
{
    std::int64_t parsed = 0;
    const char *first = value.data();
    const char *last = first + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return parsed;
}

std::vector<std::string> splitUnderscore(const std::string &value)
{
    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(value);
    while (std::getline(in, part, '_')) {
        parts.push_back(part);
    }
    return parts;
}

// |to - from| without signed overflow; the distance always fits in uint64.
std::uint64_t distance(std::int64_t from, std::int64_t to)
{
    const auto a = static_cast<std::uint64_t>(from);
    const auto b = static_cast<std::uint64_t>(to);
    return to >= from ? b - a : a - b;
}

std::string unitsText(std::uint64_t amount, const char *direction)
{
    return std::to_string(amount) + " units " + direction;
}

} // namespace

std::optional<StructuralFingerprint> parseStructuralFingerprint(const std::string &fingerprint)
{
    const std::vector<std::string> parts = splitUnderscore(fingerprint);
    if (parts.size() != 5 || parts[0].empty()) {
        return std::nullopt;
    }

    StructuralFingerprint parsed;
    parsed.type = parts[0];
    const auto x = parseInt(parts[1]);
    const auto y = parseInt(parts[2]);
    const auto width = parseInt(parts[3]);
    const auto height = parseInt(parts[4]);
    if (!x || !y || !width || !height) {
        return std::nullopt;
    }
    parsed.x = *x;
    parsed.y = *y;
    parsed.width = *width;
    parsed.height = *height;
    return parsed;
}

std::string describeAddition(const std::string &key, const std::string &fingerprint)
{
    const auto parsed = parseStructuralFingerprint(fingerprint);
    if (!parsed) {
        return key + " added";
    }
    return key + " (" + parsed->type + " added at x:" + std::to_string(parsed->x)
        + ", y:" + std::to_string(parsed->y) + ")";
}

std::string describeRemoval(const std::string &key)
{
    return key + " removed";
}

std::string describeModification(const std::string &key,
                                 const std::string &before,
                                 const std::string &after)
{
    const auto prev = parseStructuralFingerprint(before);
    const auto curr = parseStructuralFingerprint(after);
    if (!prev || !curr) {
        return key + " fingerprint changed";
    }

    if (curr->x == prev->x && curr->y == prev->y) {
        return key + " attributes modified (not position).";
    }

    std::string movement;
    if (curr->x != prev->x) {
        movement = unitsText(distance(prev->x, curr->x), curr->x > prev->x ? "east" : "west");
    }
    if (curr->y != prev->y) {
        if (!movement.empty()) {
            movement += " and ";
        }
        movement += unitsText(distance(prev->y, curr->y), curr->y > prev->y ? "north" : "south");
    }
    return key + " (" + prev->type + ") moved " + movement;
}

std::string describeMove(const MovedObject &move)
{
    return move.fromKey + " renamed to " + move.toKey;
}

} // namespace buildtrace
