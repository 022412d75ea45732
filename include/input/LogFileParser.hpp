#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/LogRecord.hpp"
#include "input/FileReader.hpp"
#include "input/LogParser.hpp"
#include "utils/Logger.hpp"

namespace LogAnalyzer
{
    namespace Input
    {
        /**
         * LogFileParser
         *
         * Lazy, single-pass stream of records read from one log file.
         * Each call to next() reads lines until one parses; unparsable lines
         * are counted and skipped. Memory use does not depend on file size.
         *
         * Error budget: once the file is exhausted, if a limit is set, at
         * least one line was read and errors / lines is strictly greater
         * than the limit, next() throws core::ErrorsBudgetExceeded instead
         * of returning std::nullopt. Records handed out before that stay
         * valid; the caller decides to discard them.
         *
         * Usage:
         *   LogFileParser records(path, parser, 0.05, logger);
         *   while (auto record = records.next())
         *       consume(*record);
         */
        class LogFileParser
        {
        public:
            /**
             * Open a log file for parsing.
             *
             * @param errorsLimit Allowed fraction of bad lines; std::nullopt disables the check.
             * @throws core::IoError if the file cannot be opened.
             */
            LogFileParser(const std::string &filePath,
                          LogParser parser,
                          std::optional<double> errorsLimit,
                          Utils::Logger &logger);

            LogFileParser(const LogFileParser &)            = delete;
            LogFileParser &operator=(const LogFileParser &) = delete;

            /**
             * Next successfully parsed record, or std::nullopt at the end.
             *
             * @throws core::ErrorsBudgetExceeded at the end of an over-budget file.
             * @throws core::IoError, core::DecompressionError on read failures.
             */
            std::optional<core::LogRecord> next();

            /// Lines read so far, parsed or not.
            std::uint64_t linesRead() const noexcept { return m_lines; }

            /// Lines that failed to parse so far.
            std::uint64_t errors() const noexcept { return m_errors; }

            /// True once the end of the file has been reached.
            bool exhausted() const noexcept { return m_exhausted; }

        private:
            /// Close the file and apply the error budget.
            void finish();

        private:
            FileReader            m_reader;
            LogParser             m_parser;
            std::optional<double> m_errorsLimit;
            Utils::Logger        &m_logger;

            std::uint64_t m_lines  = 0;
            std::uint64_t m_errors = 0;
            bool          m_exhausted = false;
        };

    } // namespace Input
} // namespace LogAnalyzer
