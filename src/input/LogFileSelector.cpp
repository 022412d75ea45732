#include "input/LogFileSelector.hpp"

#include <string>
#include <system_error>

#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

namespace LogAnalyzer
{
    namespace Input
    {
        namespace fs = std::filesystem;

        std::optional<core::CalendarDate> parseLogFileName(std::string_view fileName)
        {
            if (!Utils::startsWith(fileName, kLogFilePrefix))
            {
                return std::nullopt;
            }

            std::string_view rest = fileName.substr(kLogFilePrefix.size());
            if (Utils::endsWith(rest, ".gz"))
            {
                rest.remove_suffix(3);
            }

            // parseCompactDate insists on exactly 8 digits.
            return Utils::parseCompactDate(rest);
        }

        std::optional<core::LogFileInfo> findLatestLogFile(const fs::path &directory,
                                                           Utils::Logger &logger)
        {
            std::error_code ec;
            if (!fs::is_directory(directory, ec))
            {
                logger.debug("Log directory not found: " + directory.string());
                return std::nullopt;
            }

            fs::directory_iterator it(directory, ec);
            if (ec)
            {
                logger.warn("Cannot list " + directory.string() + ": " + ec.message());
                return std::nullopt;
            }

            std::optional<core::LogFileInfo> latest;
            for (const auto end = fs::end(it); it != end; it.increment(ec))
            {
                if (ec)
                {
                    break;
                }

                const std::string name = it->path().filename().string();
                const auto date = parseLogFileName(name);
                if (!date)
                {
                    logger.trace("Skipping " + name);
                    continue;
                }

                if (!latest || *date > latest->date() ||
                    (*date == latest->date() && name < latest->name()))
                {
                    latest.emplace(directory, name, *date);
                }
            }

            if (ec)
            {
                logger.warn("Error while listing " + directory.string() + ": " + ec.message());
            }

            return latest;
        }

    } // namespace Input
} // namespace LogAnalyzer
