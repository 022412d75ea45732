#include "utils/TimeUtils.hpp"

#include <iomanip>
#include <sstream>

namespace LogAnalyzer
{
    namespace Utils
    {
        // -------- Basic conversions --------

        std::time_t to_time_t(TimePoint tp) noexcept
        {
            return Clock::to_time_t(tp);
        }

        TimePoint now() noexcept
        {
            return Clock::now();
        }

        // -------- Formatting helpers --------

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            std::time_t t = to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            std::ostringstream oss;
            oss << std::put_time(&tm_buf, std::string(format).c_str());
            return oss.str();
        }

        std::int64_t diffMillis(TimePoint start, TimePoint end) noexcept
        {
            return std::chrono::duration_cast<milliseconds>(end - start).count();
        }

        // -------- Calendar helpers --------

        bool isLeapYear(int year) noexcept
        {
            return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        }

        int daysInMonth(int year, int month) noexcept
        {
            switch (month)
            {
            case 1: case 3: case 5: case 7: case 8: case 10: case 12:
                return 31;
            case 4: case 6: case 9: case 11:
                return 30;
            case 2:
                return isLeapYear(year) ? 29 : 28;
            default:
                return 0;
            }
        }

        namespace
        {
            // Digits only; callers check the length.
            std::optional<int> parseDigits(std::string_view sv)
            {
                int value = 0;
                for (char c : sv)
                {
                    if (c < '0' || c > '9')
                    {
                        return std::nullopt;
                    }
                    value = value * 10 + (c - '0');
                }
                return value;
            }
        } // anonymous namespace

        std::optional<core::CalendarDate> parseCompactDate(std::string_view sv)
        {
            if (sv.size() != 8)
            {
                return std::nullopt;
            }

            const auto year  = parseDigits(sv.substr(0, 4));
            const auto month = parseDigits(sv.substr(4, 2));
            const auto day   = parseDigits(sv.substr(6, 2));
            if (!year || !month || !day)
            {
                return std::nullopt;
            }

            if (*year < 1 || *day < 1 || *day > daysInMonth(*year, *month))
            {
                return std::nullopt;
            }

            return core::CalendarDate{*year, *month, *day};
        }

    } // namespace Utils
} // namespace LogAnalyzer
