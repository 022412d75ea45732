#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace LogAnalyzer::Utils {
    /// Body of a JSON string literal. '<', '>' and '&' become \u escapes so
    /// the result can be embedded in an HTML <script> block.
    std::string escapeJson(std::string_view s);

    /**
     * Substitute $name and ${name} placeholders from a map.
     *
     * "$$" renders a single '$'. Placeholders without a value, and '$'
     * signs not followed by an identifier, are copied unchanged.
     */
    std::string substitutePlaceholders(std::string_view text,
                                       const std::unordered_map<std::string, std::string> &values);

    /// Split on runs of whitespace; never yields empty tokens.
    std::vector<std::string_view> splitWhitespace(std::string_view sv);

    /**
     * Parse a floating-point number that must span the whole text.
     *
     * Accepts what strtod accepts (including "inf"/"nan" spellings and
     * exponents). Leading or trailing whitespace makes the text invalid.
     */
    std::optional<double> parseDouble(std::string_view sv);
}

namespace LogAnalyzer
{
    namespace Utils
    {
        /**
         * String utility helpers for parsing and normalizing log text.
         *
         * All functions are:
         *  - Header-only, inline where appropriate for performance.
         *  - Stateless and thread-safe.
         *  - Using std::string_view where possible to avoid unnecessary copies.
         */

        inline bool isSpace(char ch) noexcept
        {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(sv.begin(), sv.end(), isSpace);
            return sv.substr(static_cast<std::size_t>(it - sv.begin()));
        }

        /// Trim whitespace (space, tab, CR, LF) from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(sv.rbegin(), sv.rend(), isSpace);
            return sv.substr(0, static_cast<std::size_t>(sv.rend() - it));
        }

        /// Trim whitespace from both ends of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Convert a string to uppercase (returns a new std::string).
        inline std::string toUpper(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); }
            );
            return result;
        }

        /// Check if a string_view starts with a given prefix (case-sensitive).
        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.size() >= prefix.size()
                   && sv.compare(0, prefix.size(), prefix) == 0;
        }

        /// Check if a string_view ends with a given suffix (case-sensitive).
        inline bool endsWith(std::string_view sv, std::string_view suffix) noexcept
        {
            return sv.size() >= suffix.size()
                   && sv.compare(sv.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        /// Case-insensitive equality comparison without allocations.
        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                unsigned char ca = static_cast<unsigned char>(a[i]);
                unsigned char cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb))
                {
                    return false;
                }
            }
            return true;
        }

    } // namespace Utils
} // namespace LogAnalyzer
