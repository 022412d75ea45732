#include "utils/Logger.hpp"

#include <iostream>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace LogAnalyzer
{
    namespace Utils
    {
        std::optional<LogLevel> parseLogLevel(std::string_view text)
        {
            const std::string name = toUpper(trim(text));

            if (name == "TRACE")                         return LogLevel::TRACE;
            if (name == "DEBUG" || name == "10")         return LogLevel::DEBUG;
            if (name == "INFO" || name == "20")          return LogLevel::INFO;
            if (name == "WARN" || name == "WARNING" || name == "30")
                return LogLevel::WARN;
            if (name == "ERROR" || name == "40")         return LogLevel::ERROR;
            if (name == "CRITICAL" || name == "FATAL" || name == "50")
                return LogLevel::CRITICAL;

            return std::nullopt;
        }

        // ------------ Logger implementation ------------

        Logger::Logger()
            : m_level(LogLevel::INFO),
              m_file(),
              m_fileEnabled(false),
              m_console(&std::cerr)
        {
        }

        Logger::Logger(std::string_view filePath, LogLevel level)
            : m_level(level),
              m_file(),
              m_fileEnabled(false),
              m_console(&std::cerr)
        {
            if (!filePath.empty())
            {
                // Append mode; RAII closes it in the destructor.
                m_file.open(std::string(filePath), std::ios::out | std::ios::app);
                if (m_file.is_open())
                {
                    m_fileEnabled = true;
                }
            }
        }

        Logger::Logger(std::ostream &sink, LogLevel level)
            : m_level(level),
              m_file(),
              m_fileEnabled(false),
              m_console(&sink)
        {
        }

        Logger::~Logger()
        {
            if (m_file.is_open())
            {
                m_file.flush();
                m_file.close();
            }
        }

        void Logger::setLevel(LogLevel level) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_level = level;
        }

        LogLevel Logger::level() const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_level;
        }

        bool Logger::isEnabled(LogLevel level) const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return static_cast<int>(level) >= static_cast<int>(m_level);
        }

        bool Logger::fileEnabled() const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_fileEnabled;
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            if (!isEnabled(level))
            {
                return;
            }

            // "[timestamp] L message"
            const std::string tsStr = formatTimestamp(now(), "%Y.%m.%d %H:%M:%S");
            const char *levelStr = toString(level);

            std::string line;
            line.reserve(tsStr.size() + message.size() + 8);
            line.append("[");
            line.append(tsStr);
            line.append("] ");
            line.push_back(levelStr[0]);
            line.append(" ");
            line.append(message);

            writeLine(line);
        }

        const char *Logger::toString(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::TRACE:    return "TRACE";
            case LogLevel::DEBUG:    return "DEBUG";
            case LogLevel::INFO:     return "INFO";
            case LogLevel::WARN:     return "WARN";
            case LogLevel::ERROR:    return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN";
            }
        }

        void Logger::writeLine(std::string_view line)
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_fileEnabled && m_file.is_open())
            {
                m_file << line << '\n';
                m_file.flush();
                return;
            }

            if (m_console)
            {
                (*m_console) << line << '\n';
                m_console->flush();
            }
        }

    } // namespace Utils
} // namespace LogAnalyzer
