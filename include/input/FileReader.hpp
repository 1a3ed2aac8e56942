#pragma once

#include <fstream>
#include <istream>
#include <string>

namespace Linex
{
    namespace Input
    {
        /**
         * FileReader
         *
         * Responsibilities:
         *  - Own the input handle of a pipeline run: a file or standard input.
         *  - Manage the file resource via RAII so it is released on every
         *    exit path (normal completion, configuration error, I/O error).
         *
         * Design notes:
         *  - Uses std::ifstream and relies on its buffering.
         *  - Standard input is borrowed, never closed.
         *  - Not copyable (owning a file handle), but movable.
         */
        class FileReader
        {
        public:
            /// Default-constructed FileReader is not associated with any input.
            FileReader();

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

            /// Read from standard input instead of a file.
            void useStdin();

            /// True when standard input is selected and attached to a terminal.
            bool stdinIsTerminal() const noexcept;

            /// Close the underlying file stream explicitly (optional).
            void close() noexcept;

            /// Check whether an input (file or stdin) is ready.
            bool isOpen() const noexcept;

            /// Path of the open file, "<stdin>" for standard input, empty if none.
            std::string filePath() const;

            /// The active input stream. Only valid while isOpen().
            std::istream &stream() noexcept { return *m_input; }

        private:
            std::ifstream m_stream;       // RAII-managed file stream
            std::istream *m_input;        // &m_stream, &std::cin or nullptr
            std::string   m_filePath;
            bool          m_isStdin;
        };

    } // namespace Input
} // namespace Linex
