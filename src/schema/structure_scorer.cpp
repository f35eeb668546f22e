// ---------------------------------------------------------------------------
// structure_scorer.cpp
// ---------------------------------------------------------------------------

#include "schema/structure_scorer.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "construct/text_scan.hpp"
#include "schema/identifier.hpp"

namespace {

bool has_column(const ParsedTable& table, std::string_view name) {
    return std::any_of(table.columns.begin(), table.columns.end(),
                       [name](const ColumnInfo& c) { return text_scan::iequals(c.name, name); });
}

}  // namespace

StructureScorer::StructureScorer(std::vector<std::string> table_prefixes,
                                 std::vector<std::string> tenant_columns)
    : table_prefixes_(std::move(table_prefixes))
    , tenant_columns_(std::move(tenant_columns))
{}

StructuralSignals StructureScorer::score(const ParsedTable& table) const {
    const std::string entity = normalize_entity_name(table.table_name, table_prefixes_);

    StructuralSignals s;
    s.has_surrogate_key = has_column(table, "pk_" + entity);
    s.has_external_id   = has_column(table, "id");
    s.has_lookup_key    = has_column(table, "identifier");
    s.has_created_at    = has_column(table, "created_at");
    s.has_updated_at    = has_column(table, "updated_at");
    s.has_deleted_at    = has_column(table, "deleted_at");
    s.has_tenant_column = std::any_of(tenant_columns_.begin(), tenant_columns_.end(),
                                      [&table](const std::string& c) { return has_column(table, c); });
    s.has_declared_pk   = !table.primary_key.empty();
    s.has_table_comment = table.table_comment.has_value() && !table.table_comment->empty();

    double baseline = kTrinityWeight * (static_cast<double>(s.trinity_count()) / 3.0)
                    + kAuditWeight * (static_cast<double>(s.audit_count()) / 3.0);
    if (s.has_declared_pk) {
        baseline += kDeclaredPkWeight;
    }
    if (s.has_tenant_column) {
        baseline += kTenantWeight;
    }
    if (s.has_table_comment) {
        baseline += kTableCommentWeight;
    }
    s.baseline_confidence = std::min(baseline, 1.0);
    return s;
}
