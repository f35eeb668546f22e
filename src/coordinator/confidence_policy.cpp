// ---------------------------------------------------------------------------
// confidence_policy.cpp
// ---------------------------------------------------------------------------

#include "coordinator/confidence_policy.hpp"

#include <algorithm>
#include <cstdint>

double confidence_delta_for(ConstructKind kind, const ConstructMetadata& metadata) {
    switch (kind) {
        case ConstructKind::kCte: {
            double delta = kCteBaseDelta;
            if (metadata_value<bool>(metadata, "is_recursive", false)) {
                delta = kCteRecursiveDelta;
            }
            if (metadata_value<std::int64_t>(metadata, "cte_count", 0) > kCteManyThreshold) {
                delta += kCteManyBonus;
            }
            return delta;
        }
        case ConstructKind::kException:       return kExceptionDelta;
        case ConstructKind::kDynamicSql:      return kDynamicSqlDelta;
        case ConstructKind::kControlFlow:     return kControlFlowDelta;
        case ConstructKind::kWindow:          return kWindowDelta;
        case ConstructKind::kAggregateFilter: return kAggregateFilterDelta;
        case ConstructKind::kCursor:          return kCursorDelta;
    }
    return 0.0;
}

double clamp_confidence(double value) noexcept {
    return std::clamp(value, 0.0, 1.0);
}
