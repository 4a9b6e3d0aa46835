#pragma once

#include <stdexcept>
#include <string>

namespace buildtrace {

/*
  Error taxonomy shared by the store, the engine and the service layer.

  The API server maps these to JSON-RPC error codes and the report CLI
  maps them to exit codes.
*/

class BuildTraceError : public std::runtime_error {
public:
    explicit BuildTraceError(const std::string &msg) : std::runtime_error(msg)
    {
    }
};

// No snapshot is stored for the requested job.
class NotFoundError : public BuildTraceError {
public:
    explicit NotFoundError(const std::string &msg) : BuildTraceError(msg)
    {
    }
};

// Transport or storage failure inside a store adapter.
class StoreUnavailableError : public BuildTraceError {
public:
    explicit StoreUnavailableError(const std::string &msg) : BuildTraceError(msg)
    {
    }
};

class WarehouseInsertError : public BuildTraceError {
public:
    explicit WarehouseInsertError(const std::string &msg) : BuildTraceError(msg)
    {
    }
};

class MalformedSnapshotError : public BuildTraceError {
public:
    explicit MalformedSnapshotError(const std::string &msg) : BuildTraceError(msg)
    {
    }
};

// A different snapshot is already stored under the same job id.
class SnapshotConflictError : public BuildTraceError {
public:
    explicit SnapshotConflictError(const std::string &msg) : BuildTraceError(msg)
    {
    }
};

class InvalidRequestError : public BuildTraceError {
public:
    explicit InvalidRequestError(const std::string &msg) : BuildTraceError(msg)
    {
    }
};

class ConfigError : public BuildTraceError {
public:
    explicit ConfigError(const std::string &msg) : BuildTraceError(msg)
    {
    }
};

} // namespace buildtrace
