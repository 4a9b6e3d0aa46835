#pragma once

#include <memory>
#include <string>
#include <vector>

#include "store/warehouse_sink.hpp"

namespace buildtrace {

/**
 * SqliteWarehouseSink appends metrics rows to the `job_results` table of a
 * local analytics database. Rows are append-only.
 */
class SqliteWarehouseSink : public WarehouseSink {
public:
    explicit SqliteWarehouseSink(const std::string &dbPath);
    ~SqliteWarehouseSink() override;

    void insert(const MetricsRecord &record) override;

    // Longitudinal read-back for the report CLI, oldest row first.
    std::vector<MetricsRecord> listRecords() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace buildtrace
