#include "core/FieldSpec.hpp"

#include <algorithm>
#include <stdexcept>

#include "utils/StringUtils.hpp"

namespace LogAnalyzer
{
namespace core
{
    const char* const kNginxUiLogFormat =
        "remote_addr  remote_user http_x_real_ip [time_local] \"request\" status body_bytes_sent "
        "\"http_referer\" \"http_user_agent\" \"http_x_forwarded_for\" \"http_X_REQUEST_ID\" "
        "\"http_X_RB_USER\" request_time";

    namespace
    {
        bool isWrapped(std::string_view token, char open, char close) noexcept
        {
            return token.size() >= 2 && token.front() == open && token.back() == close;
        }

        // Strip every leading and trailing delimiter character.
        std::string_view stripDelimiters(std::string_view token) noexcept
        {
            constexpr std::string_view delimiters = "\"[]";
            const auto first = token.find_first_not_of(delimiters);
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = token.find_last_not_of(delimiters);
            return token.substr(first, last - first + 1);
        }
    } // anonymous namespace

    FieldSpec FieldSpec::compile(std::string_view templateText)
    {
        std::vector<FieldDescriptor> fields;

        for (const auto& token : Utils::splitWhitespace(templateText))
        {
            FieldDescriptor field;
            if (isWrapped(token, '"', '"'))
            {
                field.kind = FieldKind::Quoted;
            }
            else if (isWrapped(token, '[', ']'))
            {
                field.kind = FieldKind::Bracketed;
            }
            else
            {
                field.kind = FieldKind::Plain;
            }

            field.name = std::string(stripDelimiters(token));
            if (field.name.empty())
            {
                throw std::invalid_argument("Log format token without a field name: " +
                                            std::string(token));
            }
            fields.push_back(std::move(field));
        }

        if (fields.empty())
        {
            throw std::invalid_argument("Log format template has no fields");
        }

        return FieldSpec(std::move(fields));
    }

    const FieldSpec& FieldSpec::nginxUiFormat()
    {
        static const FieldSpec spec = compile(kNginxUiLogFormat);
        return spec;
    }

    bool FieldSpec::contains(std::string_view name) const noexcept
    {
        return std::any_of(m_fields.begin(), m_fields.end(),
                           [name](const FieldDescriptor& f) { return f.name == name; });
    }

} // namespace core
} // namespace LogAnalyzer
