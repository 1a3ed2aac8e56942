#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <type_traits>

namespace Linex
{
    namespace Utils
    {
        /**
         * String utility helpers shared by the extraction stages and the CLI.
         *
         * All functions are:
         *  - Inline in this header, except join() and splitWhitespace().
         *  - Stateless and thread-safe.
         *  - Using std::string_view where possible to avoid unnecessary copies.
         *
         * Case folding is ASCII-only and byte-length preserving, so offsets
         * computed on a folded copy are valid on the original text.
         */

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.begin(),
                sv.end(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(static_cast<std::size_t>(it - sv.begin()));
        }

        /// Trim whitespace (space, tab, CR, LF) from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.rbegin(),
                sv.rend(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(0, static_cast<std::size_t>(sv.rend() - it));
        }

        /// Trim whitespace from both ends of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Convert a string to lowercase (returns a new std::string).
        inline std::string toLower(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); }
            );
            return result;
        }

        /// Convert a string to uppercase (returns a new std::string).
        inline std::string toUpper(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); }
            );
            return result;
        }

        /// Case-insensitive equality comparison without allocations.
        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                unsigned char ca = static_cast<unsigned char>(a[i]);
                unsigned char cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb))
                {
                    return false;
                }
            }
            return true;
        }

        /// True if sv is non-empty and consists only of ASCII digits.
        inline bool isDigits(std::string_view sv) noexcept
        {
            return !sv.empty()
                   && std::all_of(sv.begin(), sv.end(),
                                  [](unsigned char ch) { return std::isdigit(ch) != 0; });
        }

        /**
         * Split a string_view by a single-character delimiter.
         *
         * - Empty fields are preserved if keepEmpty == true.
         * - Whitespace around tokens is not trimmed automatically.
         */
        inline std::vector<std::string_view> split(
            std::string_view sv,
            char delimiter,
            bool keepEmpty = false)
        {
            std::vector<std::string_view> result;
            std::size_t start = 0;

            while (start <= sv.size())
            {
                const std::size_t pos = sv.find(delimiter, start);
                const bool found = (pos != std::string_view::npos);
                const std::size_t end = found ? pos : sv.size();

                if (end > start || keepEmpty)
                {
                    result.emplace_back(sv.data() + start, end - start);
                }

                if (!found)
                {
                    break;
                }
                start = end + 1;
            }

            return result;
        }

        /**
         * Safely parse an integer from a string_view.
         *
         * Returns std::nullopt if parsing fails, if there are non-numeric
         * trailing characters after trimming, or if a sign is given for an
         * unsigned type.
         */
        template <typename IntType>
        std::optional<IntType> parseInteger(std::string_view sv)
        {
            static_assert(std::is_integral<IntType>::value,
                          "parseInteger requires an integral type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }
            if (std::is_unsigned<IntType>::value && !isDigits(sv))
            {
                return std::nullopt;
            }

            std::string s(sv); // local copy for stream parsing
            std::istringstream iss(s);
            IntType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

        /// Concatenate parts with delimiter between consecutive elements.
        std::string join(const std::vector<std::string> &parts, std::string_view delimiter);

        /// Whitespace-separated tokens; never yields empty tokens.
        std::vector<std::string> splitWhitespace(std::string_view input);

    } // namespace Utils
} // namespace Linex
