#include "input/FileReader.hpp"

#include <cerrno>
#include <cstring>
#include <utility>   // std::move, std::exchange

#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"

namespace LogAnalyzer
{
    namespace Input
    {
        namespace
        {
            constexpr unsigned kGzipBufferSize = 128 * 1024;
            constexpr int      kLineChunkSize  = 8 * 1024;
        } // anonymous namespace

        FileReader::FileReader(const std::string &filePath)
        {
            open(filePath);
        }

        FileReader::FileReader(FileReader &&other) noexcept
            : m_stream(std::move(other.m_stream)),
              m_gz(std::exchange(other.m_gz, nullptr)),
              m_filePath(std::move(other.m_filePath))
        {
        }

        FileReader &FileReader::operator=(FileReader &&other) noexcept
        {
            if (this != &other)
            {
                close();
                m_stream   = std::move(other.m_stream);
                m_gz       = std::exchange(other.m_gz, nullptr);
                m_filePath = std::move(other.m_filePath);
            }
            return *this;
        }

        FileReader::~FileReader()
        {
            close();
        }

        bool FileReader::open(const std::string &filePath)
        {
            close();

            if (Utils::endsWith(filePath, ".gz"))
            {
                m_gz = gzopen(filePath.c_str(), "rb");
                if (m_gz == nullptr)
                {
                    return false;
                }
                gzbuffer(m_gz, kGzipBufferSize);
            }
            else
            {
                m_stream.open(filePath, std::ios::in | std::ios::binary);
                if (!m_stream.is_open())
                {
                    return false;
                }
            }

            m_filePath = filePath;
            return true;
        }

        void FileReader::close() noexcept
        {
            if (m_gz != nullptr)
            {
                gzclose(m_gz);
                m_gz = nullptr;
            }
            if (m_stream.is_open())
            {
                m_stream.close();
            }
            m_stream.clear();
            m_filePath.clear();
        }

        bool FileReader::isOpen() const noexcept
        {
            return m_gz != nullptr || m_stream.is_open();
        }

        std::optional<std::string> FileReader::nextLine()
        {
            std::optional<std::string> line = isCompressed() ? nextCompressedLine()
                                                             : nextPlainLine();

            // Drop trailing '\r' for Windows-style line endings.
            if (line && !line->empty() && line->back() == '\r')
            {
                line->pop_back();
            }
            return line;
        }

        std::optional<std::string> FileReader::nextPlainLine()
        {
            if (!m_stream.is_open())
            {
                return std::nullopt;
            }

            std::string line;
            if (!std::getline(m_stream, line))
            {
                if (m_stream.bad())
                {
                    throw core::IoError("Failed to read " + m_filePath);
                }
                return std::nullopt;
            }
            return line;
        }

        std::optional<std::string> FileReader::nextCompressedLine()
        {
            std::string line;
            char chunk[kLineChunkSize];

            // gzgets stops after '\n' or when the chunk is full; keep going
            // until a full line has been collected.
            while (gzgets(m_gz, chunk, sizeof(chunk)) != nullptr)
            {
                const std::size_t len = std::strlen(chunk);
                if (len > 0 && chunk[len - 1] == '\n')
                {
                    line.append(chunk, len - 1);
                    return line;
                }
                line.append(chunk, len);
            }

            checkGzipError();

            // Last line without a terminating newline.
            if (!line.empty())
            {
                return line;
            }
            return std::nullopt;
        }

        void FileReader::checkGzipError()
        {
            int errnum = Z_OK;
            const char *message = gzerror(m_gz, &errnum);
            if (errnum == Z_OK || errnum == Z_STREAM_END)
            {
                return;
            }
            if (errnum == Z_ERRNO)
            {
                throw core::IoError("Failed to read " + m_filePath + ": " + std::strerror(errno));
            }
            throw core::DecompressionError("Failed to decompress " + m_filePath + ": " +
                                           (message != nullptr ? message : "unknown zlib error"));
        }

    } // namespace Input
} // namespace LogAnalyzer
