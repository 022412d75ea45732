#include "input/LogParser.hpp"

#include <stdexcept>

#include "utils/StringUtils.hpp"

namespace LogAnalyzer
{
    namespace Input
    {
        using core::FieldKind;
        using core::FieldSpec;

        namespace
        {
            // Each matcher is anchored at `pos` and returns the end of the
            // match (one past the last character), or npos.
            constexpr std::size_t npos = std::string_view::npos;

            // open + one or more characters other than close + close
            std::size_t matchDelimited(std::string_view line, std::size_t pos,
                                       char open, char close)
            {
                if (pos >= line.size() || line[pos] != open)
                {
                    return npos;
                }
                const std::size_t closing = line.find(close, pos + 1);
                if (closing == npos || closing == pos + 1)
                {
                    return npos;
                }
                return closing + 1;
            }

            // One or more non-whitespace characters.
            std::size_t matchToken(std::string_view line, std::size_t pos)
            {
                std::size_t end = pos;
                while (end < line.size() && !Utils::isSpace(line[end]))
                {
                    ++end;
                }
                return end > pos ? end : npos;
            }

            std::size_t matchField(std::string_view line, std::size_t pos, FieldKind kind)
            {
                switch (kind)
                {
                case FieldKind::Quoted:    return matchDelimited(line, pos, '"', '"');
                case FieldKind::Bracketed: return matchDelimited(line, pos, '[', ']');
                case FieldKind::Plain:     return matchToken(line, pos);
                }
                return npos;
            }

            LogParser::ParseResult failure(std::string error)
            {
                LogParser::ParseResult r;
                r.malformed = true;
                r.error = std::move(error);
                return r;
            }
        } // anonymous namespace

        LogParser::LogParser(core::FieldSpec spec)
            : m_spec(std::move(spec))
        {
            if (!m_spec.contains(FieldSpec::kRequestField) ||
                !m_spec.contains(FieldSpec::kRequestTimeField))
            {
                throw std::invalid_argument(
                    "Log format must contain the \"request\" and request_time fields");
            }
        }

        std::optional<core::LogRecord> LogParser::parseLine(std::string_view rawLine) const
        {
            auto r = parseLineDetailed(rawLine);
            return std::move(r.entry);
        }

        LogParser::ParseResult LogParser::parseLineDetailed(std::string_view rawLine) const
        {
            core::LogRecord::FieldMap fields;
            std::string url;
            double requestTime = 0.0;

            const auto &descriptors = m_spec.fields();
            std::size_t cursor = 0;

            for (std::size_t i = 0; i < descriptors.size(); ++i)
            {
                const auto &field = descriptors[i];

                const std::size_t end = matchField(rawLine, cursor, field.kind);
                if (end == npos)
                {
                    return failure("No match for field " + field.name +
                                   " at offset " + std::to_string(cursor));
                }

                // Typed values come from the matched text, delimiters included.
                const std::string_view matched = rawLine.substr(cursor, end - cursor);

                if (field.name == FieldSpec::kRequestField)
                {
                    const auto parts = Utils::splitWhitespace(matched);
                    if (parts.size() < 2)
                    {
                        return failure("Request without a path: " + std::string(matched));
                    }
                    url = std::string(parts[1]);
                }
                else if (field.name == FieldSpec::kRequestTimeField)
                {
                    const auto value = Utils::parseDouble(matched);
                    if (!value)
                    {
                        return failure("request_time is not a number: " + std::string(matched));
                    }
                    requestTime = *value;
                }

                fields[field.name] = std::string(matched);
                cursor = end;

                // Fields are separated by exactly one run of whitespace.
                if (i + 1 < descriptors.size())
                {
                    const std::size_t fieldEnd = cursor;
                    while (cursor < rawLine.size() && Utils::isSpace(rawLine[cursor]))
                    {
                        ++cursor;
                    }
                    if (cursor == fieldEnd)
                    {
                        return failure("Missing separator after field " + field.name);
                    }
                }
            }

            fields[std::string(FieldSpec::kUrlField)] = url;

            ParseResult r;
            r.entry = core::LogRecord(std::move(fields), std::move(url), requestTime);
            return r;
        }

    } // namespace Input
} // namespace LogAnalyzer
