#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <mutex>

namespace Linex
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration file (key = value format).
         *  - Expose read-only access to configuration values.
         *  - Provide string and boolean getters.
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored.
         *  - Whitespace around key and value is trimmed.
         *
         * Example:
         *   log_level        = DEBUG
         *   group_separator  = ,
         *   strip_whitespace = yes
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            ~ConfigLoader() = default;

            /**
             * Load configuration from a file path.
             *
             * Returns true on success, false if the file cannot be opened.
             * Malformed lines are skipped; valid lines are kept.
             */
            bool loadFromFile(const std::string &filePath);

            /// Check if a key exists in the loaded configuration.
            bool hasKey(std::string_view key) const;

            /// Get raw string value for a key; returns std::nullopt if missing.
            std::optional<std::string> getString(std::string_view key) const;

            /// Get string value or a default if the key is missing.
            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /**
             * Get boolean value; returns std::nullopt if missing or invalid.
             *
             * Accepted true values (case-insensitive): "1", "true", "yes", "on"
             * Accepted false values (case-insensitive): "0", "false", "no", "off"
             */
            std::optional<bool> getBool(std::string_view key) const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;

            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace Linex
