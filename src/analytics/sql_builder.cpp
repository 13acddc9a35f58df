#include "analytics/sql_builder.h"

#include <algorithm>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_replace.h>

namespace tracelens::analytics {

std::string ParamNames::Next(std::string_view prefix) {
    return absl::StrCat(prefix, "_", counter_++);
}

std::string Placeholder(std::string_view name, std::string_view type) {
    return absl::StrCat("{", name, ":", type, "}");
}

std::string QuoteIdentifier(std::string_view identifier) {
    return absl::StrCat("`", SanitizeIdentifier(identifier), "`");
}

std::string SanitizeIdentifier(std::string_view text) {
    std::string out(text);
    for (char& c : out) {
        if (!absl::ascii_isalnum(static_cast<unsigned char>(c)) && c != '_') {
            c = '_';
        }
    }
    return out;
}

std::string QuoteLiteral(std::string_view text) {
    return absl::StrCat("'", absl::StrReplaceAll(text, {{"\\", "\\\\"}, {"'", "\\'"}}), "'");
}

bool IsTrivialCondition(std::string_view condition) {
    return condition.empty() || condition == "1=1";
}

SelectBuilder& SelectBuilder::With(std::string name, std::string body) {
    ctes_.emplace_back(std::move(name), std::move(body));
    return *this;
}

SelectBuilder& SelectBuilder::Select(std::string expression) {
    select_.push_back(std::move(expression));
    return *this;
}

SelectBuilder& SelectBuilder::Distinct() {
    distinct_ = true;
    return *this;
}

SelectBuilder& SelectBuilder::From(std::string source) {
    from_ = std::move(source);
    return *this;
}

SelectBuilder& SelectBuilder::Join(std::string clause) {
    if (!clause.empty() &&
        std::find(joins_.begin(), joins_.end(), clause) == joins_.end()) {
        joins_.push_back(std::move(clause));
    }
    return *this;
}

SelectBuilder& SelectBuilder::ArrayJoin(std::string clause) {
    array_joins_.push_back(std::move(clause));
    return *this;
}

SelectBuilder& SelectBuilder::Where(std::string condition) {
    if (!IsTrivialCondition(condition)) {
        where_.push_back(std::move(condition));
    }
    return *this;
}

SelectBuilder& SelectBuilder::GroupBy(std::string expression) {
    group_by_.push_back(std::move(expression));
    return *this;
}

SelectBuilder& SelectBuilder::Having(std::string condition) {
    if (!IsTrivialCondition(condition)) {
        having_.push_back(std::move(condition));
    }
    return *this;
}

SelectBuilder& SelectBuilder::OrderBy(std::string expression) {
    order_by_.push_back(std::move(expression));
    return *this;
}

SelectBuilder& SelectBuilder::LimitBy(int64_t count, std::string expressions) {
    limit_by_ = std::make_pair(count, std::move(expressions));
    return *this;
}

SelectBuilder& SelectBuilder::Limit(int64_t count) {
    limit_ = count;
    return *this;
}

std::string SelectBuilder::Build() const {
    std::ostringstream sql;

    if (!ctes_.empty()) {
        sql << "WITH ";
        for (size_t i = 0; i < ctes_.size(); ++i) {
            if (i > 0) sql << ",\n";
            sql << ctes_[i].first << " AS (\n" << ctes_[i].second << "\n)";
        }
        sql << "\n";
    }

    sql << "SELECT ";
    if (distinct_) sql << "DISTINCT ";
    sql << (select_.empty() ? std::string("1") : absl::StrJoin(select_, ",\n  "));

    if (!from_.empty()) {
        sql << "\nFROM " << from_;
    }
    for (const auto& join : joins_) {
        sql << "\n" << join;
    }
    if (!array_joins_.empty()) {
        sql << "\nARRAY JOIN " << absl::StrJoin(array_joins_, ", ");
    }
    if (!where_.empty()) {
        sql << "\nWHERE " << absl::StrJoin(where_, "\n  AND ");
    }
    if (!group_by_.empty()) {
        sql << "\nGROUP BY " << absl::StrJoin(group_by_, ", ");
    }
    if (!having_.empty()) {
        sql << "\nHAVING " << absl::StrJoin(having_, " AND ");
    }
    if (!order_by_.empty()) {
        sql << "\nORDER BY " << absl::StrJoin(order_by_, ", ");
    }
    if (limit_by_.has_value()) {
        sql << "\nLIMIT " << limit_by_->first << " BY " << limit_by_->second;
    }
    if (limit_.has_value()) {
        sql << "\nLIMIT " << *limit_;
    }

    return sql.str();
}

}  // namespace tracelens::analytics
