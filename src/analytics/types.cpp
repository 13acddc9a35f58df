#include "analytics/types.h"

namespace tracelens::analytics {

std::optional<AggKind> ParseAggKind(std::string_view name) {
    if (name == "avg") return AggKind::kAvg;
    if (name == "sum") return AggKind::kSum;
    if (name == "min") return AggKind::kMin;
    if (name == "max") return AggKind::kMax;
    if (name == "cardinality") return AggKind::kCardinality;
    if (name == "terms") return AggKind::kTerms;
    if (name == "median") return AggKind::kMedian;
    if (name == "p90") return AggKind::kP90;
    if (name == "p95") return AggKind::kP95;
    if (name == "p99") return AggKind::kP99;
    return std::nullopt;
}

std::string_view AggKindName(AggKind kind) {
    switch (kind) {
        case AggKind::kAvg: return "avg";
        case AggKind::kSum: return "sum";
        case AggKind::kMin: return "min";
        case AggKind::kMax: return "max";
        case AggKind::kCardinality: return "cardinality";
        case AggKind::kTerms: return "terms";
        case AggKind::kMedian: return "median";
        case AggKind::kP90: return "p90";
        case AggKind::kP95: return "p95";
        case AggKind::kP99: return "p99";
    }
    return "avg";
}

bool IsPercentile(AggKind kind) {
    return kind == AggKind::kMedian || kind == AggKind::kP90 ||
           kind == AggKind::kP95 || kind == AggKind::kP99;
}

double PercentileLevel(AggKind kind) {
    switch (kind) {
        case AggKind::kMedian: return 0.5;
        case AggKind::kP90: return 0.9;
        case AggKind::kP95: return 0.95;
        case AggKind::kP99: return 0.99;
        default: return 0.5;
    }
}

}  // namespace tracelens::analytics
