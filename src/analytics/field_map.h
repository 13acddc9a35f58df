#pragma once

/// @file field_map.h
/// @brief Registry of logical field paths and their physical columns

#include <string>
#include <string_view>
#include <vector>

#include "analytics/types.h"

namespace tracelens::analytics {

/// @brief How values behind a map-access column are interpreted
enum class MapValueKind {
    kNone,       ///< plain column
    kString,
    kNumber,     ///< numeric text, converted with toFloat64OrNull
    kJsonArray,  ///< JSON array text, extracted with JSONExtract
};

/// @brief Physical location of a logical field
struct FieldMapping {
    std::string logical_path;
    TableId table = TableId::kPrimary;
    std::string column_expr;  ///< unqualified, e.g. Attributes['langwatch.user_id']
    bool is_array_valued = false;
    MapValueKind map_value_kind = MapValueKind::kNone;
    bool is_fallback = false;  ///< produced by ResolveField for an unknown path
    bool is_numeric = false;   ///< accepts numeric aggregates (avg, sum, quantiles)
};

/// @brief All registered mappings, built once and read-only afterwards
const std::vector<FieldMapping>& FieldMappings();

/// @brief Registered mapping for a path, or nullptr
const FieldMapping* FindFieldMapping(std::string_view path);

/// @brief Registered mapping, or a primary-table fallback whose column is
///        the snake-cased path restricted to [a-z0-9_]
FieldMapping ResolveField(std::string_view path);

/// @brief Physical table name (trace_summaries, stored_spans, evaluation_runs)
std::string_view TableName(TableId table);

/// @brief Fixed alias: ts, ss or es
std::string_view TableAlias(TableId table);

/// @brief Tenant and trace equality predicate between a child alias and ts
std::string JoinPredicate(TableId table);

/// @brief LEFT JOIN of a child table on its join predicate; "" for the primary table
std::string JoinClause(TableId table);

/// @brief Prefix an unqualified column expression with the table alias
///
/// Map access keeps the alias on the column: Attributes['k'] becomes
/// ts.Attributes['k'].
std::string Qualify(TableId table, std::string_view column_expr);

/// @brief Qualify(resolved.table, resolved.column_expr) for a logical path
std::string QualifiedColumn(std::string_view path);

/// @brief Latest-version view of trace_summaries for one tenant and window
///
/// trace_summaries keeps several versions per trace; the subquery keeps the
/// newest (by UpdatedAt) and is aliased as ts.
std::string PrimaryTableSource(std::string_view start_param, std::string_view end_param);

}  // namespace tracelens::analytics
