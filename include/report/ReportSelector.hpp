#pragma once

#include <cstddef>
#include <vector>

#include "core/UrlStat.hpp"

namespace LogAnalyzer
{
    namespace Report
    {
        /**
         * Rank URL statistics by total request time, largest first, and keep
         * the first `size` entries.
         *
         * The sort is stable: URLs with equal time_sum keep their input order.
         */
        std::vector<core::UrlStat> selectTop(std::vector<core::UrlStat> stats, std::size_t size);

    } // namespace Report
} // namespace LogAnalyzer
