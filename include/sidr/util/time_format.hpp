#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sidr {

/**
 * Format a FILETIME (100 ns ticks since 1601-01-01 UTC) as ISO 8601,
 * e.g. "2023-03-07T01:52:44Z".
 *
 * @return Empty string for zero or values outside 1970..2500
 */
std::string filetime_to_iso8601(uint64_t filetime);

/**
 * Format an OLE automation date (days since 1899-12-30) as ISO 8601.
 *
 * @return Empty string for NaN, infinity or values outside 1970..2500
 */
std::string ole_time_to_iso8601(double ole_time);

/**
 * Timestamp used in report file names: "YYYYmmdd_HHMMSS.ffffff" (UTC).
 */
std::string report_timestamp(std::chrono::system_clock::time_point now);

}  // namespace sidr
