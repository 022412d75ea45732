#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "core/LogFileInfo.hpp"
#include "utils/Logger.hpp"

namespace LogAnalyzer
{
    namespace Input
    {
        /// Name prefix of the rotated UI access logs.
        inline constexpr std::string_view kLogFilePrefix = "nginx-access-ui.log-";

        /**
         * Match a file name against "nginx-access-ui.log-YYYYMMDD[.gz]".
         *
         * Returns the embedded date, or std::nullopt if the name does not
         * match exactly or the digits are not a valid calendar date.
         */
        std::optional<core::CalendarDate> parseLogFileName(std::string_view fileName);

        /**
         * Find the log file with the latest embedded date in a directory.
         *
         * Scans the directory non-recursively. Returns std::nullopt when the
         * directory does not exist, is not a directory or holds no matching
         * file; nothing is thrown for those cases.
         *
         * When several files carry the same date (a plain log and its .gz
         * copy), the lexicographically smallest name wins, so the result
         * does not depend on directory iteration order.
         */
        std::optional<core::LogFileInfo> findLatestLogFile(const std::filesystem::path &directory,
                                                           Utils::Logger &logger);

    } // namespace Input
} // namespace LogAnalyzer
