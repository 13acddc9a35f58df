#pragma once

/// @file time_bucket.h
/// @brief Time-bucket truncation and time zone validation

#include <cstdint>
#include <string>
#include <string_view>

#include "analytics/types.h"

namespace tracelens::analytics {

/// @brief Return the requested zone if the tz database knows it, else fallback
///
/// The result is later written into SQL as a literal, so names with
/// characters outside [A-Za-z0-9_/+-] are rejected even if they load.
std::string ResolveTimeZone(std::string_view requested, std::string_view fallback = "UTC");

/// @brief Truncation of a timestamp column to a bucket of the given width
///
/// <= 1 minute: minute; < 1 day: hours when the width is a whole number of
/// hours, minutes otherwise; <= 7 days: days; <= 31 days: ISO week; beyond:
/// month. time_zone must come from ResolveTimeZone.
std::string DateTruncExpression(int64_t granularity_minutes, std::string_view time_zone,
                                std::string_view column);

/// @brief Coarsen the granularity to one day when the window would need
///        more than max_buckets buckets
int64_t CapGranularity(int64_t granularity_minutes, Timestamp start, Timestamp end,
                       int64_t max_buckets);

}  // namespace tracelens::analytics
