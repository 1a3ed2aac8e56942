// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

#include <sstream>

namespace Linex::Utils {

std::string join(const std::vector<std::string>& parts, std::string_view delimiter)
{
    if (parts.empty()) return {};

    std::size_t totalSize = 0;
    for (const auto& s : parts) totalSize += s.size();
    totalSize += delimiter.size() * (parts.size() - 1);

    std::string result;
    result.reserve(totalSize);

    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        if (i) result += delimiter;
        result += parts[i];
    }

    return result;
}

std::vector<std::string> splitWhitespace(std::string_view input)
{
    // operator>> already skips whitespace and never produces empty tokens.
    std::vector<std::string> tokens;
    std::istringstream iss{std::string(input)};
    for (std::string token; iss >> token; )
        tokens.push_back(token);
    return tokens;
}

} // namespace Linex::Utils
