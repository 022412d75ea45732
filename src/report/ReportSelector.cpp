#include "report/ReportSelector.hpp"

#include <algorithm>

namespace LogAnalyzer
{
namespace Report
{
    std::vector<core::UrlStat> selectTop(std::vector<core::UrlStat> stats, std::size_t size)
    {
        std::stable_sort(stats.begin(), stats.end(),
                         [](const core::UrlStat& a, const core::UrlStat& b) {
                             return a.timeSum > b.timeSum;
                         });

        if (stats.size() > size)
            stats.resize(size);

        return stats;
    }

} // namespace Report
} // namespace LogAnalyzer
