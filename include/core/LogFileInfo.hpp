// Core data model describing a rotated access-log file picked for analysis.

#ifndef CORE_LOG_FILE_INFO_HPP
#define CORE_LOG_FILE_INFO_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <tuple>
#include <utility>

namespace LogAnalyzer
{
namespace core
{

/**
 * @brief Plain calendar date (no time zone, no time of day).
 *
 * Only produced by Utils::parseCompactDate, which guarantees the fields
 * form a valid Gregorian date.
 */
struct CalendarDate
{
    int year{0};
    int month{0};
    int day{0};

    /// Render with a separator, e.g. "2017.06.30" for '.'.
    std::string toString(char separator = '.') const
    {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "%04d%c%02d%c%02d",
                      year, separator, month, separator, day);
        return buffer;
    }

    friend bool operator<(const CalendarDate& a, const CalendarDate& b) noexcept
    {
        return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
    }

    friend bool operator>(const CalendarDate& a, const CalendarDate& b) noexcept
    {
        return b < a;
    }

    friend bool operator==(const CalendarDate& a, const CalendarDate& b) noexcept
    {
        return std::tie(a.year, a.month, a.day) == std::tie(b.year, b.month, b.day);
    }

    friend bool operator!=(const CalendarDate& a, const CalendarDate& b) noexcept
    {
        return !(a == b);
    }
};

/**
 * @brief A log file found in the log directory together with its date.
 *
 * Immutable value produced by the log selector. The file name is kept
 * relative to the directory it was found in.
 */
class LogFileInfo
{
public:
    LogFileInfo(std::filesystem::path directory, std::string name, CalendarDate date)
        : m_directory(std::move(directory)),
          m_name(std::move(name)),
          m_date(date)
    {
    }

    const std::string& name() const noexcept
    {
        return m_name;
    }

    const CalendarDate& date() const noexcept
    {
        return m_date;
    }

    /// Full path of the file (directory / name).
    std::filesystem::path path() const
    {
        return m_directory / m_name;
    }

    /// True if the name says the file is gzip-compressed.
    bool isCompressed() const noexcept
    {
        return m_name.size() > 3 && m_name.compare(m_name.size() - 3, 3, ".gz") == 0;
    }

private:
    std::filesystem::path m_directory;
    std::string           m_name;
    CalendarDate          m_date;
};

} // namespace core
} // namespace LogAnalyzer

#endif // CORE_LOG_FILE_INFO_HPP
