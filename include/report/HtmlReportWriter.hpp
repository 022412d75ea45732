#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/LogFileInfo.hpp"
#include "core/UrlStat.hpp"
#include "report/JsonReporter.hpp"
#include "utils/Logger.hpp"

namespace LogAnalyzer
{
    namespace Report
    {
        /**
         * HtmlReportWriter
         *
         * Responsibilities:
         *  - Embed the ranked statistics (as JSON) into the HTML template by
         *    substituting the $table_json placeholder.
         *  - Write the report atomically: the content goes to a temporary
         *    file in the same directory that is renamed into place, so an
         *    aborted run never leaves a partial report behind.
         */
        class HtmlReportWriter
        {
        public:
            /// Placeholder name the template uses for the statistics table.
            static constexpr std::string_view kTablePlaceholder = "table_json";

            HtmlReportWriter(std::filesystem::path templatePath, Utils::Logger& logger);

            HtmlReportWriter(const HtmlReportWriter&) = delete;
            HtmlReportWriter& operator=(const HtmlReportWriter&) = delete;

            /// "<reportDir>/report-YYYY.MM.DD.html" for the date of a log file.
            static std::filesystem::path reportPath(const std::filesystem::path& reportDir,
                                                    const core::CalendarDate& date);

            /**
             * Template text with the statistics substituted.
             *
             * @throws core::IoError if the template cannot be read.
             */
            std::string render(const std::vector<core::UrlStat>& stats) const;

            /**
             * Render and write the report to `target`, creating its directory
             * if needed.
             *
             * @throws core::IoError on any read or write failure; `target` is
             *         left untouched in that case.
             */
            void write(const std::filesystem::path& target,
                       const std::vector<core::UrlStat>& stats) const;

        private:
            std::string loadTemplate() const;

        private:
            std::filesystem::path m_templatePath;
            Utils::Logger&        m_logger;
            JsonReporter          m_json;
        };

    } // namespace Report
} // namespace LogAnalyzer
