#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <zlib.h>

#include "utils/Logger.hpp"

namespace LogAnalyzer
{
namespace Testing
{
    namespace fs = std::filesystem;

    /// Well-formed line from the production log.
    inline const std::string kGoodLine =
        "1.200.76.128 f032b48fb33e1e692  - [29/Jun/2017:03:50:32 +0300] "
        "\"GET /api/1/campaigns/?id=617832 HTTP/1.1\" 200 637 \"-\" \"-\" \"-\" "
        "\"1498697432-4102637017-4709-9928915\" \"-\" 0.146";

    /// Same line cut in the middle of the time_local field.
    inline const std::string kBadLine =
        "1.200.76.128 f032b48fb33e1e692  - [29/Jun/2017:03:50:327432-4102637017-4709-9928915\" "
        "\"-\" 0.146";

    /// A well-formed line for a given path and request time.
    inline std::string makeLine(const std::string& url, const std::string& requestTime)
    {
        return "1.196.116.32 -  - [29/Jun/2017:03:50:22 +0300] \"GET " + url +
               " HTTP/1.1\" 200 927 \"-\" \"Lynx/2.8.8dev.9 libwww-FM/2.14\" \"-\" "
               "\"1498697422-2190034393-4708-9752759\" \"dc7161be3\" " + requestTime;
    }

    /// Unique scratch directory, removed with its content on destruction.
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            std::ostringstream name;
            name << "log_analyzer_test_" << std::hex << rd() << rd();
            m_path = fs::temp_directory_path() / name.str();
            fs::create_directories(m_path);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        const fs::path& path() const noexcept { return m_path; }

        fs::path operator/(const std::string& name) const { return m_path / name; }

    private:
        fs::path m_path;
    };

    inline void writeFile(const fs::path& path, const std::string& content)
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out)
            throw std::runtime_error("cannot create " + path.string());
        out << content;
    }

    inline void writeLines(const fs::path& path, const std::vector<std::string>& lines)
    {
        std::string content;
        for (const auto& line : lines)
            content += line + "\n";
        writeFile(path, content);
    }

    inline void writeGzipLines(const fs::path& path, const std::vector<std::string>& lines)
    {
        gzFile gz = gzopen(path.string().c_str(), "wb");
        if (gz == nullptr)
            throw std::runtime_error("cannot create " + path.string());
        for (const auto& line : lines)
        {
            const std::string text = line + "\n";
            if (gzwrite(gz, text.data(), static_cast<unsigned>(text.size())) <= 0)
            {
                gzclose(gz);
                throw std::runtime_error("cannot write " + path.string());
            }
        }
        if (gzclose(gz) != Z_OK)
            throw std::runtime_error("cannot close " + path.string());
    }

    inline std::string readFile(const fs::path& path)
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    /// Logger writing into a string buffer.
    class CapturingLogger
    {
    public:
        explicit CapturingLogger(Utils::LogLevel level = Utils::LogLevel::DEBUG)
            : m_logger(m_buffer, level)
        {
        }

        Utils::Logger& logger() noexcept { return m_logger; }
        std::string text() const { return m_buffer.str(); }

    private:
        std::ostringstream m_buffer;
        Utils::Logger      m_logger;
    };

} // namespace Testing
} // namespace LogAnalyzer
