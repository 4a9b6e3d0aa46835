#pragma once

#include "common/models.hpp"

namespace buildtrace {

// Analytics destination for metrics rows. insert() throws
// WarehouseInsertError when the row could not be written.
class WarehouseSink {
public:
    virtual ~WarehouseSink() = default;

    virtual void insert(const MetricsRecord &record) = 0;
};

} // namespace buildtrace
