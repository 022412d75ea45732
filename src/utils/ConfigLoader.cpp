#include "utils/ConfigLoader.hpp"

#include <fstream>
#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace LogAnalyzer
{
    namespace Utils
    {
        namespace
        {
            std::string unquote(std::string_view value)
            {
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                {
                    value = value.substr(1, value.size() - 2);
                }
                return std::string(value);
            }
        } // anonymous namespace

        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                // Could not open file; keep existing config as-is.
                return false;
            }

            std::unordered_map<std::string, std::string> newValues;

            std::string line;
            std::size_t lineNo = 0;
            while (std::getline(in, line))
            {
                ++lineNo;
                const std::string_view content = trim(line);
                if (content.empty() || content[0] == '#' || content[0] == ';')
                {
                    continue;
                }

                // Split into key and value at the first '='.
                const auto pos = content.find('=');
                const std::string_view key =
                    pos == std::string_view::npos ? std::string_view() : trim(content.substr(0, pos));
                if (key.empty())
                {
                    throw core::ConfigError(filePath + ":" + std::to_string(lineNo) +
                                            ": expected key = value, got \"" +
                                            std::string(content) + "\"");
                }

                // Last occurrence wins if key is repeated.
                newValues[std::string(key)] = unquote(trim(content.substr(pos + 1)));
            }

            if (in.bad())
            {
                return false;
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_values = std::move(newValues);
            }

            return true;
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto v = getRawUnlocked(key);
            if (!v)
            {
                return std::string(defaultValue);
            }
            return *v;
        }

        std::optional<long long> ConfigLoader::getInt(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto v = getRawUnlocked(key);
            if (!v)
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                long long value = std::stoll(*v, &idx);
                if (idx != v->size())
                {
                    // Trailing characters make this invalid.
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::logic_error &)
            {
                // std::invalid_argument or std::out_of_range
                return std::nullopt;
            }
        }

        std::optional<double> ConfigLoader::getDouble(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto v = getRawUnlocked(key);
            if (!v)
            {
                return std::nullopt;
            }
            return parseDouble(*v);
        }

    } // namespace Utils
} // namespace LogAnalyzer
