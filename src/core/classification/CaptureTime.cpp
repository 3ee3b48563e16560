#include "CaptureTime.hpp"
#include "photo_pairing/errors.hpp"
#include <cctype>
#include <cstdio>
#include <regex>

namespace photo_pairing::classification {

namespace {

constexpr long long kSecondsPerDay = 86400;

// Days since 1970-01-01 in the proleptic Gregorian calendar.
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& year, int& month, int& day) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(y + (m <= 2 ? 1 : 0));
    month = static_cast<int>(m);
    day = static_cast<int>(d);
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

}

LocalDateTime toLocalDateTime(std::time_t utc_seconds, int utc_offset_minutes) {
    const long long local = static_cast<long long>(utc_seconds) + static_cast<long long>(utc_offset_minutes) * 60;
    const long long days = floorDiv(local, kSecondsPerDay);
    const long long seconds_of_day = local - days * kSecondsPerDay;

    LocalDateTime result;
    civilFromDays(days, result.year, result.month, result.day);
    result.hour = static_cast<int>(seconds_of_day / 3600);
    result.minute = static_cast<int>((seconds_of_day % 3600) / 60);
    result.second = static_cast<int>(seconds_of_day % 60);
    return result;
}

std::time_t fromLocalDateTime(const LocalDateTime& local, int utc_offset_minutes) {
    const long long days = daysFromCivil(local.year, static_cast<unsigned>(local.month), static_cast<unsigned>(local.day));
    const long long seconds = days * kSecondsPerDay + local.hour * 3600LL + local.minute * 60LL + local.second;
    return static_cast<std::time_t>(seconds - static_cast<long long>(utc_offset_minutes) * 60);
}

std::optional<LocalDateTime> parseLocalDateTime(const std::string& text) {
    static const std::regex pattern(R"(^\s*(\d{4})-(\d{2})-(\d{2})[ T](\d{2}):(\d{2})(?::(\d{2}))?\s*$)");
    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        return std::nullopt;
    }

    LocalDateTime local;
    local.year = std::stoi(match[1].str());
    local.month = std::stoi(match[2].str());
    local.day = std::stoi(match[3].str());
    local.hour = std::stoi(match[4].str());
    local.minute = std::stoi(match[5].str());
    local.second = match[6].matched ? std::stoi(match[6].str()) : 0;

    if (local.month < 1 || local.month > 12) return std::nullopt;
    if (local.day < 1 || local.day > daysInMonth(local.year, local.month)) return std::nullopt;
    if (local.hour > 23 || local.minute > 59 || local.second > 59) return std::nullopt;
    return local;
}

int parseUtcOffset(const std::string& text) {
    if (text.empty() || text == "Z" || text == "z" || text == "UTC") {
        return 0;
    }

    static const std::regex pattern(R"(^([+-])(\d{1,2})(?::?(\d{2}))?$)");
    std::smatch match;
    if (!std::regex_match(text, match, pattern)) {
        throw ConfigurationError("TIME_UTC_OFFSET must look like +08:00, got '" + text + "'");
    }

    const int hours = std::stoi(match[2].str());
    const int minutes = match[3].matched ? std::stoi(match[3].str()) : 0;
    if (hours > 14 || minutes > 59) {
        throw ConfigurationError("TIME_UTC_OFFSET out of range: '" + text + "'");
    }
    const int total = hours * 60 + minutes;
    return match[1].str() == "-" ? -total : total;
}

std::string formatMonthKey(const LocalDateTime& local) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d", local.year, local.month);
    return buffer;
}

std::string formatCompactStamp(const LocalDateTime& local) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d%02d%02d_%02d%02d%02d",
                  local.year, local.month, local.day, local.hour, local.minute, local.second);
    return buffer;
}

std::string formatDisplay(const LocalDateTime& local) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d",
                  local.year, local.month, local.day, local.hour, local.minute, local.second);
    return buffer;
}

} // namespace photo_pairing::classification
