#include "report/HtmlReportWriter.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_map>

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace LogAnalyzer
{
namespace Report
{
    namespace fs = std::filesystem;

    HtmlReportWriter::HtmlReportWriter(fs::path templatePath, Utils::Logger& logger)
        : m_templatePath(std::move(templatePath)),
          m_logger(logger),
          m_json(JsonReporter::PrettyPrint::COMPACT)
    {
    }

    fs::path HtmlReportWriter::reportPath(const fs::path& reportDir, const core::CalendarDate& date)
    {
        return reportDir / ("report-" + date.toString('.') + ".html");
    }

    std::string HtmlReportWriter::loadTemplate() const
    {
        std::ifstream in(m_templatePath, std::ios::in | std::ios::binary);
        if (!in.is_open())
            throw core::IoError("Cannot open report template: " + m_templatePath.string());

        std::ostringstream content;
        content << in.rdbuf();
        if (in.bad())
            throw core::IoError("Failed to read report template: " + m_templatePath.string());

        return content.str();
    }

    std::string HtmlReportWriter::render(const std::vector<core::UrlStat>& stats) const
    {
        const std::unordered_map<std::string, std::string> values{
            {std::string(kTablePlaceholder), m_json.toJson(stats)}};

        return Utils::substitutePlaceholders(loadTemplate(), values);
    }

    void HtmlReportWriter::write(const fs::path& target, const std::vector<core::UrlStat>& stats) const
    {
        const std::string html = render(stats);

        std::error_code ec;
        if (target.has_parent_path())
        {
            fs::create_directories(target.parent_path(), ec);
            if (ec)
                throw core::IoError("Cannot create report directory " +
                                    target.parent_path().string() + ": " + ec.message());
        }

        fs::path tmp = target;
        tmp += ".tmp";

        {
            std::ofstream out(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
            if (!out.is_open())
                throw core::IoError("Cannot create report file: " + tmp.string());

            out << html;
            out.close();
            if (!out)
            {
                fs::remove(tmp, ec);
                throw core::IoError("Failed to write report file: " + tmp.string());
            }
        }

        fs::rename(tmp, target, ec);
        if (ec)
        {
            const std::string reason = ec.message();
            fs::remove(tmp, ec);
            throw core::IoError("Cannot move report into place at " + target.string() + ": " + reason);
        }

        m_logger.info("Report written: " + target.string() + " (" +
                      std::to_string(stats.size()) + " urls)");
    }

} // namespace Report
} // namespace LogAnalyzer
