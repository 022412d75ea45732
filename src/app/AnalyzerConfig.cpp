#include "app/AnalyzerConfig.hpp"

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace LogAnalyzer
{
    namespace App
    {
        namespace
        {
            core::ConfigError invalidValue(std::string_view key, const std::string &value,
                                           std::string_view expected)
            {
                return core::ConfigError("Invalid " + std::string(key) + " = \"" + value +
                                         "\": expected " + std::string(expected));
            }
        } // anonymous namespace

        AnalyzerConfig AnalyzerConfig::fromLoader(const Utils::ConfigLoader &loader)
        {
            AnalyzerConfig config;

            if (auto raw = loader.getString("REPORT_SIZE"))
            {
                const auto size = loader.getInt("REPORT_SIZE");
                if (!size || *size <= 0)
                {
                    throw invalidValue("REPORT_SIZE", *raw, "a positive integer");
                }
                config.reportSize = static_cast<std::size_t>(*size);
            }

            if (auto raw = loader.getString("ERRORS_LIMIT"))
            {
                if (raw->empty() || Utils::iequals(*raw, "none") || Utils::iequals(*raw, "null"))
                {
                    config.errorsLimit.reset();
                }
                else
                {
                    const auto limit = loader.getDouble("ERRORS_LIMIT");
                    if (!limit || !(*limit >= 0.0 && *limit <= 1.0))
                    {
                        throw invalidValue("ERRORS_LIMIT", *raw, "a fraction between 0 and 1");
                    }
                    config.errorsLimit = *limit;
                }
            }

            if (auto raw = loader.getString("LOG_LEVEL"))
            {
                const auto level = Utils::parseLogLevel(*raw);
                if (!level)
                {
                    throw invalidValue("LOG_LEVEL", *raw, "DEBUG, INFO, WARNING, ERROR or CRITICAL");
                }
                config.logLevel = *level;
            }

            config.reportDir      = loader.getStringOr("REPORT_DIR", config.reportDir.string());
            config.logDir         = loader.getStringOr("LOG_DIR", config.logDir.string());
            config.reportTemplate = loader.getStringOr("REPORT_TEMPLATE", config.reportTemplate.string());
            config.logFile        = loader.getStringOr("LOG_FILE", config.logFile);

            return config;
        }

        AnalyzerConfig AnalyzerConfig::load(const std::optional<std::string> &configFile)
        {
            Utils::ConfigLoader loader;
            if (configFile && !loader.loadFromFile(*configFile))
            {
                throw core::ConfigError("Cannot read config file: " + *configFile);
            }
            return fromLoader(loader);
        }

    } // namespace App
} // namespace LogAnalyzer
