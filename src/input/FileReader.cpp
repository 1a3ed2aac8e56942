#include "input/FileReader.hpp"

#include <iostream>
#include <utility>   // std::move

#include <unistd.h>

namespace Linex
{
    namespace Input
    {
        FileReader::FileReader()
            : m_stream(),
              m_input(nullptr),
              m_filePath(),
              m_isStdin(false)
        {
        }

        FileReader::FileReader(const std::string &filePath)
            : FileReader()
        {
            open(filePath);
        }

        FileReader::FileReader(FileReader &&other) noexcept
            : m_stream(std::move(other.m_stream)),
              m_input(nullptr),
              m_filePath(std::move(other.m_filePath)),
              m_isStdin(other.m_isStdin)
        {
            if (other.m_input == &other.m_stream)
                m_input = &m_stream;
            else
                m_input = other.m_input;

            other.m_input   = nullptr;
            other.m_isStdin = false;
        }

        FileReader &FileReader::operator=(FileReader &&other) noexcept
        {
            if (this != &other)
            {
                // Close any currently open stream before taking over.
                close();

                m_stream   = std::move(other.m_stream);
                m_filePath = std::move(other.m_filePath);
                m_isStdin  = other.m_isStdin;
                m_input    = (other.m_input == &other.m_stream) ? &m_stream : other.m_input;

                other.m_input   = nullptr;
                other.m_isStdin = false;
            }
            return *this;
        }

        FileReader::~FileReader()
        {
            // RAII: ensure file is closed on destruction.
            if (m_stream.is_open())
            {
                m_stream.close();
            }
        }

        bool FileReader::open(const std::string &filePath)
        {
            close();

            // Binary mode: line terminators are handled by the line source.
            m_stream.open(filePath, std::ios::in | std::ios::binary);
            if (!m_stream.is_open())
            {
                return false;
            }

            m_filePath = filePath;
            m_input    = &m_stream;
            return true;
        }

        void FileReader::useStdin()
        {
            close();
            m_input    = &std::cin;
            m_filePath = "<stdin>";
            m_isStdin  = true;
        }

        bool FileReader::stdinIsTerminal() const noexcept
        {
            return m_isStdin && ::isatty(STDIN_FILENO) != 0;
        }

        void FileReader::close() noexcept
        {
            if (m_stream.is_open())
            {
                m_stream.close();
            }
            m_stream.clear();
            m_input   = nullptr;
            m_isStdin = false;
            m_filePath.clear();
        }

        bool FileReader::isOpen() const noexcept
        {
            return m_input != nullptr;
        }

        std::string FileReader::filePath() const
        {
            return m_filePath;
        }

    } // namespace Input
} // namespace Linex
