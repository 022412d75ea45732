#include "report/JsonReporter.hpp"

#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

#include "utils/StringUtils.hpp"

namespace LogAnalyzer
{
namespace Report
{
    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty)
    {
    }

    void JsonReporter::writeJson(std::ostream& output, const std::vector<core::UrlStat>& stats) const
    {
        const bool pretty = m_prettyPrint == PrettyPrint::PRETTY;

        output << "[";
        for (std::size_t i = 0; i < stats.size(); ++i)
        {
            if (i)
                output << (pretty ? ",\n " : ", ");
            output << statToJson(stats[i]);
        }
        output << "]";
    }

    std::string JsonReporter::toJson(const std::vector<core::UrlStat>& stats) const
    {
        std::ostringstream oss;
        writeJson(oss, stats);
        return oss.str();
    }

    std::string JsonReporter::statToJson(const core::UrlStat& stat) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"url\": \"" << Utils::escapeJson(stat.url) << "\", ";
        oss << "\"count\": " << stat.count << ", ";
        oss << "\"count_perc\": " << formatNumber(stat.countPerc) << ", ";
        oss << "\"time_sum\": " << formatNumber(stat.timeSum) << ", ";
        oss << "\"time_perc\": " << formatNumber(stat.timePerc) << ", ";
        oss << "\"time_avg\": " << formatNumber(stat.timeAvg) << ", ";
        oss << "\"time_max\": " << formatNumber(stat.timeMax) << ", ";
        oss << "\"time_med\": " << formatNumber(stat.timeMed);
        oss << "}";
        return oss.str();
    }

    void JsonReporter::setPrettyPrint(PrettyPrint mode) noexcept
    {
        m_prettyPrint = mode;
    }

    // ---- Private helpers ----

    std::string JsonReporter::formatNumber(double value)
    {
        if (!std::isfinite(value))
            return "null";

        // Fewest significant digits that read back as the same double,
        // with '.' as decimal separator whatever the global locale is.
        std::string text;
        for (int precision = std::numeric_limits<double>::digits10;
             precision <= std::numeric_limits<double>::max_digits10; ++precision)
        {
            std::ostringstream oss;
            oss.imbue(std::locale::classic());
            oss << std::setprecision(precision) << value;
            text = oss.str();

            std::istringstream back(text);
            back.imbue(std::locale::classic());
            double parsed = 0.0;
            if (back >> parsed && parsed == value)
                break;
        }
        return text;
    }

} // namespace Report
} // namespace LogAnalyzer
