// Exceptions raised by the analysis pipeline.
//
// Malformed single lines are not exceptions: the line parser reports them
// through std::optional. Everything here aborts the current run.

#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace LogAnalyzer
{
namespace core
{

/// Base class for all fatal pipeline conditions.
class AnalyzerError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Ratio of unparsable lines exceeded the configured limit.
class ErrorsBudgetExceeded : public AnalyzerError
{
public:
    ErrorsBudgetExceeded(std::uint64_t errors, std::uint64_t lines, double limit)
        : AnalyzerError("Errors limit exceeded: " + std::to_string(errors) + " of " +
                        std::to_string(lines) + " lines could not be parsed (limit " +
                        std::to_string(limit) + ")"),
          m_errors(errors),
          m_lines(lines),
          m_limit(limit)
    {
    }

    std::uint64_t errors() const noexcept { return m_errors; }
    std::uint64_t lines() const noexcept { return m_lines; }
    double limit() const noexcept { return m_limit; }

private:
    std::uint64_t m_errors;
    std::uint64_t m_lines;
    double        m_limit;
};

/// The log produced no records, so no statistic can be computed.
class EmptyLogError : public AnalyzerError
{
public:
    EmptyLogError()
        : AnalyzerError("No log records to aggregate")
    {
    }
};

/// Opening, reading or writing a file failed.
class IoError : public AnalyzerError
{
public:
    using AnalyzerError::AnalyzerError;
};

/// A gzip stream is corrupt or truncated.
class DecompressionError : public AnalyzerError
{
public:
    using AnalyzerError::AnalyzerError;
};

/// Configuration file unreadable or a value out of range.
class ConfigError : public AnalyzerError
{
public:
    using AnalyzerError::AnalyzerError;
};

} // namespace core
} // namespace LogAnalyzer

#endif // CORE_ERRORS_HPP
