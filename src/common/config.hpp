#pragma once

#include <string>

namespace buildtrace {

struct ServiceConfig {
    std::string dataDir;
    std::string snapshotDbPath;
    std::string warehouseDbPath;
    bool warehouseEnabled = true;
    // "decrement" or "latest_stored".
    std::string predecessorStrategy = "decrement";
    // Local socket name or path; empty means $XDG_RUNTIME_DIR/buildtrace.sock.
    std::string socketName;
};

// Defaults, then <dataDir>/config.json, then BUILDTRACE_* environment
// variables. Throws ConfigError on invalid values.
ServiceConfig loadServiceConfig();

std::string defaultDataDir();

} // namespace buildtrace
