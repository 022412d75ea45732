#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <mutex>

namespace LogAnalyzer
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Untyped store for the analyzer settings file. Keys are kept as
         * written (case-sensitive); App::AnalyzerConfig turns them into
         * typed settings and applies the defaults.
         *
         * File syntax, one setting per line:
         *  - key = value, split at the first '='; surrounding blanks are
         *    trimmed and a value in double quotes loses its quotes.
         *  - '#' or ';' at the start of a line marks a comment. Blank lines
         *    are skipped. Any other line without "key =" is an error, so a
         *    file in another format (JSON, YAML) is refused as a whole.
         *  - A repeated key keeps its last value.
         *
         * Sample:
         *   REPORT_SIZE  = 1000
         *   LOG_DIR      = /var/log/nginx
         *   ERRORS_LIMIT = 0.05
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            /**
             * Load configuration from a file path, replacing any values
             * loaded before.
             *
             * Returns true on success, false if the file cannot be opened.
             *
             * @throws core::ConfigError naming file and line for a line that
             *         is not a comment and has no "key =" part. Values loaded
             *         before are kept in that case.
             */
            bool loadFromFile(const std::string &filePath);

            /// Store a value as if it had been read from a file.
            void set(std::string key, std::string value);

            /// True if the key was set, even to an empty value.
            bool hasKey(std::string_view key) const;

            /// Value as written, or std::nullopt for an unset key.
            std::optional<std::string> getString(std::string_view key) const;

            /// Value as written, or `defaultValue` for an unset key.
            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Whole value as a base-10 integer; std::nullopt if unset or not an integer.
            std::optional<long long> getInt(std::string_view key) const;

            /// Whole value as a floating point number; std::nullopt if unset or malformed.
            std::optional<double> getDouble(std::string_view key) const;

        private:
            // Caller holds m_mutex.
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;

            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace LogAnalyzer
