#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>

namespace LogAnalyzer
{
    namespace Utils
    {
        /**
         * Log severity levels used across the system.
         *
         * Typical usage:
         *  - TRACE: very verbose, internal debugging
         *  - DEBUG: per-line parse diagnostics, skipped files
         *  - INFO: high-level application flow
         *  - WARN: unusual situations, not yet errors
         *  - ERROR: the run ends without a report
         *  - CRITICAL: unrecoverable failures
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /**
         * Parse a level name ("debug", "INFO", "warning", ...) or a numeric
         * level in the 10/20/30/40/50 scale used by the configuration files
         * of the cron deployment.
         */
        std::optional<LogLevel> parseLogLevel(std::string_view text);

        /**
         * Logger
         *
         * Small logging facility passed explicitly to the pipeline stages
         * that report diagnostics. One line per message:
         *
         *   [2017.06.30 03:50:32] I Start parsing nginx-access-ui.log-20170630.gz
         *
         * Output goes to a log file when one is configured, otherwise to a
         * console stream (stderr by default).
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only.
            Logger();

            /**
             * Create a logger with optional file output.
             *
             * If filePath is non-empty, the logger opens the file in append
             * mode and writes there only. If opening fails, logging falls
             * back to stderr and fileEnabled() returns false.
             */
            explicit Logger(std::string_view filePath, LogLevel level = LogLevel::INFO);

            /// Create a logger writing to an arbitrary stream (tests, tools).
            Logger(std::ostream &sink, LogLevel level);

            // Non-copyable: owns the file handle.
            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /// True when messages go to the configured log file.
            bool fileEnabled() const noexcept;

            /**
             * Log a message with a given severity.
             *
             * The entry includes the local timestamp, the first letter of
             * the level and the message text.
             */
            void log(LogLevel level, std::string_view message);

            /// Convenience wrappers for common severities.
            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

            /// Helper to convert level to string, e.g., "INFO".
            static const char *toString(LogLevel level) noexcept;

        private:
            /// Write a fully formatted line to the active sink.
            void writeLine(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            bool                            m_fileEnabled;
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all writes
        };

    } // namespace Utils
} // namespace LogAnalyzer
