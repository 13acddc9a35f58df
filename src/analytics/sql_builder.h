#pragma once

/// @file sql_builder.h
/// @brief Structured SELECT assembly and placeholder naming
///
/// Clauses are collected as separate fragments and serialized once by
/// SelectBuilder::Build(). Literal values never pass through this class;
/// callers bind them in a ParamMap and reference them with Placeholder().

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tracelens::analytics {

/// @brief Per-call generator of unique placeholder names
///
/// Each top-level build owns one instance and threads it through every
/// translator, so names are unique within a query without shared state.
class ParamNames {
public:
    /// @brief Returns "<prefix>_<n>", n counting up from 0
    std::string Next(std::string_view prefix);

private:
    int64_t counter_ = 0;
};

/// @brief "{name:Type}"
std::string Placeholder(std::string_view name, std::string_view type);

/// @brief Backtick-quote an alias produced by SanitizeIdentifier
std::string QuoteIdentifier(std::string_view identifier);

/// @brief Replace everything outside [A-Za-z0-9_] with '_'
std::string SanitizeIdentifier(std::string_view text);

/// @brief Single-quoted literal for compiler-owned constants only
///
/// Never call this with caller-supplied text; bind it as a parameter instead.
std::string QuoteLiteral(std::string_view text);

/// @brief True if the fragment is the trivial "1=1" condition
bool IsTrivialCondition(std::string_view condition);

/// @brief Builder for one SELECT statement (optionally with CTEs)
class SelectBuilder {
public:
    SelectBuilder& With(std::string name, std::string body);
    SelectBuilder& Select(std::string expression);
    SelectBuilder& Distinct();
    SelectBuilder& From(std::string source);

    /// @brief Add a JOIN clause; identical clauses are emitted once
    SelectBuilder& Join(std::string clause);

    SelectBuilder& ArrayJoin(std::string clause);

    /// @brief AND a condition into WHERE; "1=1" and empty text are skipped
    SelectBuilder& Where(std::string condition);

    SelectBuilder& GroupBy(std::string expression);
    SelectBuilder& Having(std::string condition);
    SelectBuilder& OrderBy(std::string expression);
    SelectBuilder& LimitBy(int64_t count, std::string expressions);
    SelectBuilder& Limit(int64_t count);

    std::string Build() const;

private:
    std::vector<std::pair<std::string, std::string>> ctes_;
    std::vector<std::string> select_;
    bool distinct_ = false;
    std::string from_;
    std::vector<std::string> joins_;
    std::vector<std::string> array_joins_;
    std::vector<std::string> where_;
    std::vector<std::string> group_by_;
    std::vector<std::string> having_;
    std::vector<std::string> order_by_;
    std::optional<std::pair<int64_t, std::string>> limit_by_;
    std::optional<int64_t> limit_;
};

}  // namespace tracelens::analytics
