// =================================================================
// include/Census/ScanConfig.hpp
// =================================================================
// Configuration loaded from .census/config.yml.

#pragma once

#include "FilterTables.hpp"
#include "Logger.hpp"
#include "ScanPipeline.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace Census {

/**
 * @brief Raised when a configuration file exists but cannot be parsed
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Settings for the scanner and its logging
 *
 * Example file:
 * @code
 * scan:
 *   batch_size: 50
 *   extensions: [".mjs"]
 *   ignored_directories: ["tmp"]
 * logging:
 *   level: info
 *   directory: .census/logs
 * @endcode
 */
struct ScanConfig {
    static constexpr const char* DEFAULT_CONFIG_PATH = ".census/config.yml";

    // Scan settings
    size_t batch_size = ScanOptions::DEFAULT_BATCH_SIZE;
    std::vector<std::string> extra_extensions;
    std::vector<std::string> extra_ignored_directories;

    // Logging settings
    LogLevel log_level = LogLevel::WARNING;
    bool log_level_set = false;
    std::string log_directory;  ///< Empty disables file logging

    /**
     * @brief Load settings from a YAML file
     * @param config_path Path to the config file; a missing file yields defaults
     * @return Loaded configuration
     * @throws ConfigError if the file exists but is not valid YAML
     */
    static ScanConfig loadFromFile(const std::string& config_path);

    /**
     * @brief Load settings from YAML text
     * @throws ConfigError on malformed YAML
     */
    static ScanConfig loadFromString(const std::string& yaml_text);

    /**
     * @brief Get the default tables extended with the configured additions
     * @return Merged filter tables
     */
    FilterTables filterTables() const;

    /**
     * @brief Build pipeline options from this configuration
     */
    ScanOptions scanOptions() const;
};

} // namespace Census
