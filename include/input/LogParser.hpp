#pragma once

#include <string>
#include <string_view>
#include <optional>

#include "core/FieldSpec.hpp"
#include "core/LogRecord.hpp"

namespace LogAnalyzer
{
    namespace Input
    {
        /**
         * LogParser
         *
         * Responsibilities:
         *  - Parse raw access-log lines into LogRecord objects, positionally,
         *    following a compiled FieldSpec.
         *  - Reject malformed lines as a whole: a record is either complete
         *    or not produced.
         *
         * Design notes:
         *  - Stateless parsing logic (thread-safe, copyable).
         *  - Malformed lines are frequent in production logs, so failures
         *    are reported through std::optional, never by throwing.
         */
        class LogParser
        {
        public:
            // Detailed parse result used to log why a line was rejected.
            // parseLine() returns only the parsed record.
            struct ParseResult
            {
                std::optional<core::LogRecord> entry;
                bool malformed = false;
                std::string error; // best-effort parse error
            };

            /**
             * Parser for a given line format.
             *
             * @throws std::invalid_argument if the format lacks the "request"
             *         or "request_time" field the statistics are built from.
             */
            explicit LogParser(core::FieldSpec spec = core::FieldSpec::nginxUiFormat());

            LogParser(const LogParser &)            = default;
            LogParser &operator=(const LogParser &) = default;

            LogParser(LogParser &&)                 = default;
            LogParser &operator=(LogParser &&)      = default;

            /**
             * Parse a single raw log line.
             *
             * Returns std::nullopt if any field fails to match at its position,
             * if the request has no path, or if request_time is not a number.
             */
            std::optional<core::LogRecord> parseLine(std::string_view rawLine) const;

            /**
             * Parse a line and return diagnostics.
             *
             * - If parsing succeeds: result.entry has value.
             * - If parsing fails: result.malformed=true and result.error names
             *   the field that failed.
             */
            ParseResult parseLineDetailed(std::string_view rawLine) const;

            const core::FieldSpec &spec() const noexcept { return m_spec; }

        private:
            core::FieldSpec m_spec;
        };

    } // namespace Input
} // namespace LogAnalyzer
