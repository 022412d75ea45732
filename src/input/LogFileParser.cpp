#include "input/LogFileParser.hpp"

#include "core/Errors.hpp"

namespace LogAnalyzer
{
    namespace Input
    {
        LogFileParser::LogFileParser(const std::string &filePath,
                                     LogParser parser,
                                     std::optional<double> errorsLimit,
                                     Utils::Logger &logger)
            : m_reader(),
              m_parser(std::move(parser)),
              m_errorsLimit(errorsLimit),
              m_logger(logger)
        {
            if (!m_reader.open(filePath))
            {
                throw core::IoError("Cannot open log file: " + filePath);
            }
            m_logger.debug(std::string("Reading ") +
                           (m_reader.isCompressed() ? "gzip" : "plain") +
                           " log " + filePath);
        }

        std::optional<core::LogRecord> LogFileParser::next()
        {
            if (m_exhausted)
            {
                return std::nullopt;
            }

            while (auto line = m_reader.nextLine())
            {
                ++m_lines;

                auto result = m_parser.parseLineDetailed(*line);
                if (result.entry)
                {
                    return std::move(result.entry);
                }

                ++m_errors;
                if (m_logger.isEnabled(Utils::LogLevel::DEBUG))
                {
                    m_logger.debug("Can't parse line " + std::to_string(m_lines) + ": " +
                                   result.error);
                }
            }

            finish();
            return std::nullopt;
        }

        void LogFileParser::finish()
        {
            m_exhausted = true;
            const std::string path = m_reader.filePath();
            m_reader.close();

            m_logger.info("Parsed " + path + ": " + std::to_string(m_lines) + " lines, " +
                          std::to_string(m_errors) + " errors");

            if (!m_errorsLimit || m_lines == 0)
            {
                return;
            }

            const double ratio = static_cast<double>(m_errors) / static_cast<double>(m_lines);
            if (ratio > *m_errorsLimit)
            {
                throw core::ErrorsBudgetExceeded(m_errors, m_lines, *m_errorsLimit);
            }
        }

    } // namespace Input
} // namespace LogAnalyzer
