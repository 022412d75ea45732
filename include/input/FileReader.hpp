#pragma once

#include <string>
#include <fstream>
#include <optional>

#include <zlib.h>

namespace LogAnalyzer
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Responsibilities:
         *  - Provide stream-based, line-oriented reading of large log files.
         *  - Read gzip-compressed files (".gz" suffix) through zlib and
         *    everything else as plain text.
         *  - Manage the file handle via RAII: it is released on every exit
         *    path, including exceptions thrown while reading.
         *
         * Not copyable (owning a file handle), but movable.
         */
        class FileReader
        {
        public:
            /// Default-constructed FileReader is not associated with any file.
            FileReader() = default;

            /**
             * Construct and open a file immediately.
             * If open fails, isOpen() will return false.
             */
            explicit FileReader(const std::string &filePath);

            FileReader(const FileReader &)            = delete;
            FileReader &operator=(const FileReader &) = delete;

            FileReader(FileReader &&other) noexcept;
            FileReader &operator=(FileReader &&other) noexcept;

            /// Destructor closes the file if it is open (RAII).
            ~FileReader();

            /**
             * Open a file for reading.
             * Returns true on success, false if opening fails.
             * Any previously open file is closed first.
             */
            bool open(const std::string &filePath);

            /// Close the underlying file explicitly (optional).
            void close() noexcept;

            /// Check whether the file is currently open and ready.
            bool isOpen() const noexcept;

            /// True when the open file is read through zlib.
            bool isCompressed() const noexcept { return m_gz != nullptr; }

            /// Get the path of the currently opened file (empty if none).
            const std::string &filePath() const noexcept { return m_filePath; }

            /**
             * Read the next line from the file, without the line terminator
             * ("\n" or "\r\n").
             *
             * Returns std::nullopt at end of file.
             * @throws core::IoError on a read error.
             * @throws core::DecompressionError on a corrupt or truncated gzip stream.
             */
            std::optional<std::string> nextLine();

        private:
            std::optional<std::string> nextPlainLine();
            std::optional<std::string> nextCompressedLine();

            /// Throw if zlib reports a stream error; no-op at a clean EOF.
            void checkGzipError();

        private:
            std::ifstream m_stream;           // plain files
            gzFile        m_gz{nullptr};      // gzip files
            std::string   m_filePath;
        };

    } // namespace Input
} // namespace LogAnalyzer
