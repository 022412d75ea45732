// Core data model representing a single parsed access-log line.
//
// Value type: records are produced by the line parser and moved through
// the pipeline one at a time.

#ifndef CORE_LOG_RECORD_HPP
#define CORE_LOG_RECORD_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace LogAnalyzer
{
namespace core
{

/**
 * @brief One fully parsed access-log line.
 *
 * Responsibilities:
 *  - Map every template field name to the raw text matched for it.
 *    Quoted and bracketed fields keep their delimiters.
 *  - Carry the typed values the aggregator needs: the request path
 *    (second token of "request") and request_time in seconds.
 *
 * A LogRecord only exists for lines where every field matched; the parser
 * never hands out partially filled records.
 */
class LogRecord
{
public:
    using FieldMap = std::unordered_map<std::string, std::string>;

    LogRecord() = default;

    LogRecord(FieldMap fields, std::string url, double requestTime)
        : m_fields(std::move(fields)),
          m_url(std::move(url)),
          m_requestTime(requestTime)
    {
    }

    LogRecord(const LogRecord&)            = default;
    LogRecord(LogRecord&&) noexcept        = default;
    LogRecord& operator=(const LogRecord&) = default;
    LogRecord& operator=(LogRecord&&) noexcept = default;

    ~LogRecord() = default;

    // ---------- Accessors ----------

    /// Request path, e.g. "/api/1/campaigns/?id=617832".
    const std::string& url() const noexcept
    {
        return m_url;
    }

    /// Value of the request_time field, in seconds.
    double requestTime() const noexcept
    {
        return m_requestTime;
    }

    /// Raw text of a field, or std::nullopt if the template has no such field.
    std::optional<std::string_view> field(std::string_view name) const
    {
        auto it = m_fields.find(std::string(name));
        if (it == m_fields.end())
        {
            return std::nullopt;
        }
        return std::string_view(it->second);
    }

    const FieldMap& fields() const noexcept
    {
        return m_fields;
    }

private:
    FieldMap    m_fields;
    std::string m_url;
    double      m_requestTime{0.0};
};

} // namespace core
} // namespace LogAnalyzer

#endif // CORE_LOG_RECORD_HPP
