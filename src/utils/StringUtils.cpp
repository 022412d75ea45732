// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace {
    bool isIdentifierStart(char c) noexcept {
        return c == '_' || std::isalpha(static_cast<unsigned char>(c)) != 0;
    }

    bool isIdentifierChar(char c) noexcept {
        return c == '_' || std::isalnum(static_cast<unsigned char>(c)) != 0;
    }
}

namespace LogAnalyzer::Utils {

std::string escapeJson(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            // Keep the text inert inside an HTML <script> block.
            case '<':  out += "\\u003c"; break;
            case '>':  out += "\\u003e"; break;
            case '&':  out += "\\u0026"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04X",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buffer;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string substitutePlaceholders(std::string_view text,
                                   const std::unordered_map<std::string, std::string>& values)
{
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        const std::size_t dollar = text.find('$', i);
        if (dollar == std::string_view::npos)
        {
            out.append(text.substr(i));
            break;
        }
        out.append(text.substr(i, dollar - i));

        const std::size_t next = dollar + 1;
        if (next < text.size() && text[next] == '$')
        {
            out += '$';
            i = next + 1;
            continue;
        }

        // ${name} or $name
        const bool braced = next < text.size() && text[next] == '{';
        std::size_t nameStart = braced ? next + 1 : next;
        std::size_t nameEnd = nameStart;
        if (nameEnd < text.size() && isIdentifierStart(text[nameEnd]))
        {
            ++nameEnd;
            while (nameEnd < text.size() && isIdentifierChar(text[nameEnd]))
                ++nameEnd;
        }

        const bool hasName = nameEnd > nameStart;
        const bool closed = !braced || (nameEnd < text.size() && text[nameEnd] == '}');
        if (hasName && closed)
        {
            auto it = values.find(std::string(text.substr(nameStart, nameEnd - nameStart)));
            const std::size_t end = braced ? nameEnd + 1 : nameEnd;
            if (it != values.end())
                out += it->second;
            else
                out.append(text.substr(dollar, end - dollar));
            i = end;
            continue;
        }

        out += '$';
        i = next;
    }

    return out;
}

std::vector<std::string_view> splitWhitespace(std::string_view sv)
{
    std::vector<std::string_view> tokens;

    std::size_t pos = 0;
    while (pos < sv.size())
    {
        while (pos < sv.size() && isSpace(sv[pos]))
            ++pos;
        const std::size_t start = pos;
        while (pos < sv.size() && !isSpace(sv[pos]))
            ++pos;
        if (pos > start)
            tokens.push_back(sv.substr(start, pos - start));
    }

    return tokens;
}

std::optional<double> parseDouble(std::string_view sv)
{
    if (sv.empty() || isSpace(sv.front()) || isSpace(sv.back()))
        return std::nullopt;

    // strtod needs a terminated buffer.
    const std::string s(sv);
    char* end = nullptr;
    const double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size())
        return std::nullopt;

    return value;
}

} // namespace LogAnalyzer::Utils
