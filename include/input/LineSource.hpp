#pragma once

#include <cstddef>
#include <deque>
#include <istream>
#include <optional>

#include "core/Line.hpp"
#include "core/LineRange.hpp"

namespace Linex
{
    namespace Input
    {
        /**
         * LineSource
         *
         * Lazy, forward-only sequence of 1-indexed lines read from a stream,
         * limited to an optional LineRange.
         *
         *  - Prefix ranges ("N", "N-M", "N-$") skip lines below the lower
         *    bound and stop reading as soon as the upper bound is passed.
         *  - Suffix ranges ("$", "$-K") read the whole stream once into a
         *    ring buffer of at most K lines, then replay it in input order.
         *
         * Line terminators are removed, including a trailing '\r'. The source
         * does not own the stream; it can only be restarted by reopening.
         */
        class LineSource
        {
        public:
            explicit LineSource(std::istream &input,
                                std::optional<Core::LineRange> range = std::nullopt,
                                bool stripWhitespace = false);

            LineSource(const LineSource &)            = delete;
            LineSource &operator=(const LineSource &) = delete;

            /**
             * Next selected line, or std::nullopt at the end of the selection.
             * Throws Core::IOError if the stream reports a read failure.
             */
            std::optional<Core::Line> next();

            /// Number of physical lines consumed from the stream so far.
            std::size_t linesRead() const noexcept { return m_linesRead; }

            /// True once reading stopped at the upper range bound, before end of input.
            bool stoppedEarly() const noexcept { return m_stoppedEarly; }

        private:
            /// Read one physical line; std::nullopt on end of input.
            std::optional<Core::Line> readLine();

            /// Discard one physical line without materialising it.
            void skipLine();

            /// Suffix mode: consume everything into m_tail.
            void fillTail();

        private:
            std::istream                   &m_input;
            std::optional<Core::LineRange>  m_range;
            bool                            m_strip;

            std::size_t                     m_linesRead = 0;
            bool                            m_done = false;
            bool                            m_stoppedEarly = false;

            bool                            m_tailFilled = false;
            std::deque<Core::Line>          m_tail;
        };

    } // namespace Input
} // namespace Linex
