#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

#include "core/LogFileInfo.hpp"

namespace LogAnalyzer
{
    namespace Utils
    {
        /**
         * Time utilities shared by the logger and the log selector.
         *
         * Notes:
         *  - system_clock is used for wall-clock timestamps in diagnostics.
         *  - Parsing functions return std::optional to signal failures instead of throwing.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using milliseconds = std::chrono::milliseconds;

        /// Convert a TimePoint to time_t (second precision).
        std::time_t to_time_t(TimePoint tp) noexcept;

        /// Current system time.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint into a human-readable timestamp string (local time).
         *
         * Default format: "YYYY.MM.DD HH:MM:SS", the one used by log lines.
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y.%m.%d %H:%M:%S");

        /// Compute the duration between two time points in milliseconds.
        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept;

        /// True for leap years of the proleptic Gregorian calendar.
        bool isLeapYear(int year) noexcept;

        /// Number of days in a month (1..12) of a given year; 0 for an invalid month.
        int daysInMonth(int year, int month) noexcept;

        /**
         * Parse a compact "YYYYMMDD" date.
         *
         * Returns std::nullopt unless the text is exactly 8 digits forming a
         * valid calendar date (month 1..12, day within the month, leap years
         * honoured, year >= 1).
         */
        std::optional<core::CalendarDate> parseCompactDate(std::string_view sv);

    } // namespace Utils
} // namespace LogAnalyzer
