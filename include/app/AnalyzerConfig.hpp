#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

namespace LogAnalyzer
{
    namespace App
    {
        /**
         * Typed settings of one analyzer run.
         *
         * Defaults apply to every key the configuration file does not set:
         *   REPORT_SIZE     1000
         *   REPORT_DIR      ./reports
         *   LOG_DIR         ./log
         *   ERRORS_LIMIT    0.05   (empty or "none" disables the check)
         *   REPORT_TEMPLATE ./report.html
         *   LOG_FILE        (empty: diagnostics go to stderr)
         *   LOG_LEVEL       INFO
         */
        struct AnalyzerConfig
        {
            std::size_t            reportSize = 1000;
            std::filesystem::path  reportDir = "./reports";
            std::filesystem::path  logDir = "./log";
            std::optional<double>  errorsLimit = 0.05;
            std::filesystem::path  reportTemplate = "./report.html";
            std::string            logFile;
            Utils::LogLevel        logLevel = Utils::LogLevel::INFO;

            /**
             * Build from loaded key/value pairs.
             *
             * @throws core::ConfigError for values of the wrong type or out of range.
             */
            static AnalyzerConfig fromLoader(const Utils::ConfigLoader &loader);

            /**
             * Defaults, overridden by `configFile` when one is given.
             *
             * @throws core::ConfigError if the file cannot be read or holds invalid values.
             */
            static AnalyzerConfig load(const std::optional<std::string> &configFile);
        };

    } // namespace App
} // namespace LogAnalyzer
