// Compiled description of the positional fields in an access-log line.

#ifndef CORE_FIELD_SPEC_HPP
#define CORE_FIELD_SPEC_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

namespace LogAnalyzer
{
namespace core
{

/**
 * @brief How a field is delimited in the log line.
 *
 *  - Quoted:    "GET / HTTP/1.1"
 *  - Bracketed: [29/Jun/2017:03:50:32 +0300]
 *  - Plain:     a run of non-whitespace characters
 */
enum class FieldKind : std::uint8_t
{
    Quoted,
    Bracketed,
    Plain
};

struct FieldDescriptor
{
    FieldKind   kind{FieldKind::Plain};
    std::string name;
};

/**
 * @brief Ordered, immutable list of field descriptors.
 *
 * Built once from a template such as
 *   remote_addr [time_local] "request" request_time
 * where the delimiters around each token select the matcher and the token
 * text without delimiters becomes the field name.
 */
class FieldSpec
{
public:
    /// Names the parser treats specially.
    static constexpr std::string_view kRequestField     = "request";
    static constexpr std::string_view kRequestTimeField = "request_time";
    static constexpr std::string_view kUrlField         = "url";

    /**
     * @brief Compile a whitespace-separated template.
     *
     * @throws std::invalid_argument if the template has no fields or a
     *         token has an empty name once delimiters are stripped.
     */
    static FieldSpec compile(std::string_view templateText);

    /// The nginx "ui" access log format the tool is deployed against.
    static const FieldSpec& nginxUiFormat();

    const std::vector<FieldDescriptor>& fields() const noexcept
    {
        return m_fields;
    }

    std::size_t size() const noexcept
    {
        return m_fields.size();
    }

    bool contains(std::string_view name) const noexcept;

private:
    explicit FieldSpec(std::vector<FieldDescriptor> fields)
        : m_fields(std::move(fields))
    {
    }

    std::vector<FieldDescriptor> m_fields;
};

/// Template text for FieldSpec::nginxUiFormat().
extern const char* const kNginxUiLogFormat;

} // namespace core
} // namespace LogAnalyzer

#endif // CORE_FIELD_SPEC_HPP
