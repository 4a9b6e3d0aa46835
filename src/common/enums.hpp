#pragma once

namespace buildtrace {

enum class WarehouseInsertState {
    NotAttempted,
    Succeeded,
    Failed
};

enum class ReportFormat {
    Markdown,
    Json
};

} // namespace buildtrace
