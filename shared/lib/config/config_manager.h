/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables with defaults.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Runtime overrides via set()
 * - Thread-safe singleton pattern
 */

#pragma once

#include <pesel/codec/types.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace pesel::common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found or not a boolean
     * @return Configuration value
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Date validation policy from PESEL_DATE_POLICY
     * @return DatePolicy::Strict when the key is unset
     * @throws ConfigException if the value is neither "strict" nor "permissive"
     */
    codec::DatePolicy datePolicy() const;

    /// @name Predefined Configuration Keys

    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
    static constexpr const char* PESEL_DATE_POLICY = "PESEL_DATE_POLICY";
    static constexpr const char* PESEL_SAMPLE = "PESEL_SAMPLE";
    static constexpr const char* PESEL_JSON = "PESEL_JSON";
};

} // namespace pesel::common
