#include "utils/ConfigLoader.hpp"

#include <fstream>

#include "utils/StringUtils.hpp"

namespace Linex
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                // Could not open file; keep existing config as-is.
                return false;
            }

            std::unordered_map<std::string, std::string> newValues;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view content = trim(line);
                if (content.empty() || content.front() == '#' || content.front() == ';')
                {
                    continue;
                }

                // Split into key and value at the first '='.
                const auto pos = content.find('=');
                if (pos == std::string_view::npos)
                {
                    continue;
                }

                const std::string_view key   = trim(content.substr(0, pos));
                const std::string_view value = trim(content.substr(pos + 1));

                if (key.empty())
                {
                    continue;
                }

                // Last occurrence wins if key is repeated.
                newValues[std::string(key)] = std::string(value);
            }

            // Keys from an earlier file survive unless this one overrides them.
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &kv : newValues)
            {
                m_values[kv.first] = std::move(kv.second);
            }

            return true;
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto v = getRawUnlocked(key);
            if (!v)
            {
                return std::string(defaultValue);
            }
            return *v;
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto v = getRawUnlocked(key);
            if (!v)
            {
                return std::nullopt;
            }

            const std::string_view s = trim(*v);
            if (s.empty())
            {
                return std::nullopt;
            }

            if (iequals(s, "1") || iequals(s, "true") ||
                iequals(s, "yes") || iequals(s, "on"))
            {
                return true;
            }
            if (iequals(s, "0") || iequals(s, "false") ||
                iequals(s, "no") || iequals(s, "off"))
            {
                return false;
            }

            return std::nullopt;
        }

    } // namespace Utils
} // namespace Linex
