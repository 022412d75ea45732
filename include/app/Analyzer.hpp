#pragma once

#include "app/AnalyzerConfig.hpp"
#include "utils/Logger.hpp"

namespace LogAnalyzer
{
    namespace App
    {
        /// How a run that did not throw ended.
        enum class RunStatus
        {
            ReportWritten,
            NoLogFound,      // nothing matching in LOG_DIR
            ReportExists     // report for the latest log was produced earlier
        };

        /**
         * One analyzer run: pick the latest log in config.logDir, parse and
         * aggregate it, and write the top config.reportSize URLs by total
         * request time to the dated report in config.reportDir.
         *
         * @throws core::AnalyzerError subclasses for fatal conditions (error
         *         budget exceeded, empty log, I/O, decompression). No report
         *         file is created in that case.
         */
        RunStatus runAnalysis(const AnalyzerConfig &config, Utils::Logger &logger);

    } // namespace App
} // namespace LogAnalyzer
