#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace photo_pairing::classification {

/**
 * @brief Wall-clock fields of a capture timestamp in the configured zone
 */
struct LocalDateTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

/**
 * @brief Convert UTC seconds to local wall-clock fields using a fixed offset
 *
 * Does not consult the process time zone, so results are identical on every
 * host for the same configuration.
 */
LocalDateTime toLocalDateTime(std::time_t utc_seconds, int utc_offset_minutes);

/// Inverse of toLocalDateTime.
std::time_t fromLocalDateTime(const LocalDateTime& local, int utc_offset_minutes);

/**
 * @brief Parse "YYYY-MM-DD HH:MM[:SS]" (a 'T' separator is also accepted)
 * @return std::nullopt when the text is malformed or a field is out of range
 */
std::optional<LocalDateTime> parseLocalDateTime(const std::string& text);

/**
 * @brief Parse a fixed UTC offset such as "+08:00", "-0530", "+8" or "Z"
 * @throws ConfigurationError on malformed input
 */
int parseUtcOffset(const std::string& text);

std::string formatMonthKey(const LocalDateTime& local);      ///< "YYYY-MM"
std::string formatCompactStamp(const LocalDateTime& local);  ///< "YYYYMMDD_HHMMSS"
std::string formatDisplay(const LocalDateTime& local);       ///< "YYYY-MM-DD HH:MM:SS"

} // namespace photo_pairing::classification
