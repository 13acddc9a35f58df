#include "analytics/time_bucket.h"

#include <algorithm>
#include <chrono>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

#include "analytics/sql_builder.h"
#include "common/logging.h"

namespace tracelens::analytics {

namespace {

constexpr int64_t kMinutesPerHour = 60;
constexpr int64_t kMinutesPerDay = 1440;
constexpr int64_t kMinutesPerWeek = 7 * kMinutesPerDay;
constexpr int64_t kMinutesPerMonth = 31 * kMinutesPerDay;

bool IsSafeZoneName(std::string_view name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return absl::ascii_isalnum(static_cast<unsigned char>(c)) ||
               c == '_' || c == '/' || c == '+' || c == '-';
    });
}

}  // namespace

std::string ResolveTimeZone(std::string_view requested, std::string_view fallback) {
    absl::TimeZone zone;
    if (IsSafeZoneName(requested) && absl::LoadTimeZone(std::string(requested), &zone)) {
        return std::string(requested);
    }
    TRACELENS_LOG_WARN("Unknown time zone '{}', using {}", requested, fallback);
    return std::string(fallback);
}

std::string DateTruncExpression(int64_t granularity_minutes, std::string_view time_zone,
                                std::string_view column) {
    const std::string tz = QuoteLiteral(time_zone);

    if (granularity_minutes <= 1) {
        return absl::StrCat("toStartOfMinute(", column, ", ", tz, ")");
    }
    if (granularity_minutes < kMinutesPerDay) {
        if (granularity_minutes % kMinutesPerHour == 0) {
            return absl::StrCat("toStartOfInterval(", column, ", INTERVAL ",
                                granularity_minutes / kMinutesPerHour, " HOUR, ", tz, ")");
        }
        return absl::StrCat("toStartOfInterval(", column, ", INTERVAL ", granularity_minutes,
                            " MINUTE, ", tz, ")");
    }
    if (granularity_minutes <= kMinutesPerWeek) {
        return absl::StrCat("toStartOfInterval(", column, ", INTERVAL ",
                            granularity_minutes / kMinutesPerDay, " DAY, ", tz, ")");
    }
    if (granularity_minutes <= kMinutesPerMonth) {
        return absl::StrCat("toStartOfWeek(", column, ", 1, ", tz, ")");
    }
    return absl::StrCat("toStartOfMonth(", column, ", ", tz, ")");
}

int64_t CapGranularity(int64_t granularity_minutes, Timestamp start, Timestamp end,
                       int64_t max_buckets) {
    if (granularity_minutes <= 0 || max_buckets <= 0 || end <= start) {
        return granularity_minutes;
    }
    const int64_t window_minutes =
        std::chrono::duration_cast<std::chrono::minutes>(end - start).count();
    const int64_t buckets = (window_minutes + granularity_minutes - 1) / granularity_minutes;
    if (buckets > max_buckets && granularity_minutes < kMinutesPerDay) {
        TRACELENS_LOG_INFO("{} buckets of {} minutes exceed the limit of {}, using daily buckets",
                           buckets, granularity_minutes, max_buckets);
        return kMinutesPerDay;
    }
    return granularity_minutes;
}

}  // namespace tracelens::analytics
