#include "app/Analyzer.hpp"

#include <system_error>

#include "analysis/UrlStatsAggregator.hpp"
#include "core/Errors.hpp"
#include "input/LogFileParser.hpp"
#include "input/LogFileSelector.hpp"
#include "input/LogParser.hpp"
#include "report/HtmlReportWriter.hpp"
#include "report/ReportSelector.hpp"
#include "utils/TimeUtils.hpp"

namespace LogAnalyzer
{
    namespace App
    {
        namespace fs = std::filesystem;

        RunStatus runAnalysis(const AnalyzerConfig &config, Utils::Logger &logger)
        {
            const auto logFile = Input::findLatestLogFile(config.logDir, logger);
            if (!logFile)
            {
                logger.error("Can't find log files in " + config.logDir.string());
                return RunStatus::NoLogFound;
            }

            const fs::path reportPath =
                Report::HtmlReportWriter::reportPath(config.reportDir, logFile->date());

            std::error_code ec;
            const bool reportExists = fs::exists(reportPath, ec);
            if (ec)
            {
                throw core::IoError("Cannot check report file " + reportPath.string() + ": " +
                                    ec.message());
            }
            if (reportExists)
            {
                logger.info("Report already exists: " + reportPath.string());
                return RunStatus::ReportExists;
            }

            logger.info("Start parsing " + logFile->path().string());
            const auto started = Utils::now();

            Input::LogFileParser records(logFile->path().string(),
                                         Input::LogParser(),
                                         config.errorsLimit,
                                         logger);
            auto stats = Analysis::aggregate(records);

            logger.info("Aggregated " + std::to_string(stats.size()) + " urls in " +
                        std::to_string(Utils::diffMillis(started, Utils::now())) + " ms");

            Report::HtmlReportWriter writer(config.reportTemplate, logger);
            writer.write(reportPath, Report::selectTop(std::move(stats), config.reportSize));

            return RunStatus::ReportWritten;
        }

    } // namespace App
} // namespace LogAnalyzer
