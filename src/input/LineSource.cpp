#include "input/LineSource.hpp"

#include <limits>
#include <string>
#include <utility>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Linex
{
    namespace Input
    {
        LineSource::LineSource(std::istream &input,
                               std::optional<Core::LineRange> range,
                               bool stripWhitespace)
            : m_input(input),
              m_range(std::move(range)),
              m_strip(stripWhitespace)
        {
        }

        std::optional<Core::Line> LineSource::readLine()
        {
            if (m_done)
            {
                return std::nullopt;
            }

            std::string text;
            if (!std::getline(m_input, text))
            {
                if (m_input.bad())
                {
                    throw Core::IOError("read error after line " + std::to_string(m_linesRead));
                }
                m_done = true;
                return std::nullopt;
            }

            // Drop trailing '\r' for Windows-style line endings.
            if (!text.empty() && text.back() == '\r')
            {
                text.pop_back();
            }

            if (m_strip)
            {
                const std::string_view stripped = Utils::trim(text);
                text = std::string(stripped);
            }

            ++m_linesRead;
            return Core::Line(m_linesRead, std::move(text));
        }

        void LineSource::skipLine()
        {
            if (m_done)
            {
                return;
            }

            m_input.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            if (m_input.bad())
            {
                throw Core::IOError("read error after line " + std::to_string(m_linesRead));
            }
            if (m_input.gcount() == 0)
            {
                m_done = true;
                return;
            }

            ++m_linesRead;
            if (m_input.eof())
            {
                m_done = true;
            }
        }

        void LineSource::fillTail()
        {
            const std::size_t keep = m_range->tailSize();

            while (auto line = readLine())
            {
                m_tail.push_back(std::move(*line));
                if (m_tail.size() > keep)
                {
                    m_tail.pop_front();
                }
            }

            m_tailFilled = true;
            Utils::getLogger().debug("Suffix range " + m_range->toString() + ": kept " +
                                     std::to_string(m_tail.size()) + " of " +
                                     std::to_string(m_linesRead) + " lines");
        }

        std::optional<Core::Line> LineSource::next()
        {
            if (!m_range)
            {
                return readLine();
            }

            if (m_range->isSuffix())
            {
                if (!m_tailFilled)
                {
                    fillTail();
                }
                if (m_tail.empty())
                {
                    return std::nullopt;
                }
                Core::Line line = std::move(m_tail.front());
                m_tail.pop_front();
                return line;
            }

            // Prefix forms: stop before touching the stream once the bound is passed.
            while (!m_done)
            {
                if (m_range->exhaustedAt(m_linesRead + 1))
                {
                    m_done = true;
                    m_stoppedEarly = true;
                    Utils::getLogger().debug("Line range " + m_range->toString() +
                                             " exhausted after " + std::to_string(m_linesRead) + " lines");
                    break;
                }

                if (m_linesRead + 1 < m_range->lowerBound())
                {
                    skipLine();
                    continue;
                }

                auto line = readLine();
                if (line && m_range->contains(line->index))
                {
                    return line;
                }
            }
            return std::nullopt;
        }

    } // namespace Input
} // namespace Linex
