// =================================================================
// src/Census/ScanConfig.cpp
// =================================================================
// Implementation of the YAML configuration loader.

#include "Census/ScanConfig.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace Census {

namespace {

std::vector<std::string> readStringList(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> values;
    if (!node.IsSequence()) {
        Logger::getInstance().warning("ScanConfig", "Expected a list for " + key + ", ignoring it");
        return values;
    }

    for (const auto& item : node) {
        try {
            values.push_back(item.as<std::string>());
        } catch (const YAML::Exception& e) {
            Logger::getInstance().warning("ScanConfig", "Invalid entry in " + key + ", skipping", e.what());
        }
    }
    return values;
}

void applyScanSection(const YAML::Node& scan, ScanConfig& config) {
    if (scan["batch_size"]) {
        try {
            long value = scan["batch_size"].as<long>();
            if (value > 0) {
                config.batch_size = static_cast<size_t>(value);
            } else {
                Logger::getInstance().warning("ScanConfig",
                    "scan.batch_size must be positive, using default",
                    "Got: " + std::to_string(value));
            }
        } catch (const YAML::Exception& e) {
            Logger::getInstance().warning("ScanConfig", "Invalid scan.batch_size value, using default", e.what());
        }
    }

    if (scan["extensions"]) {
        for (auto extension : readStringList(scan["extensions"], "scan.extensions")) {
            if (extension.empty()) {
                continue;
            }
            if (extension[0] != '.') {
                extension = "." + extension;
            }
            config.extra_extensions.push_back(extension);
        }
    }

    if (scan["ignored_directories"]) {
        for (const auto& name : readStringList(scan["ignored_directories"], "scan.ignored_directories")) {
            if (!name.empty()) {
                config.extra_ignored_directories.push_back(name);
            }
        }
    }
}

void applyLoggingSection(const YAML::Node& logging, ScanConfig& config) {
    if (logging["level"]) {
        try {
            std::string level_name = logging["level"].as<std::string>();
            LogLevel level = LogLevel::WARNING;
            if (Logger::parseLevelName(level_name, level)) {
                config.log_level = level;
                config.log_level_set = true;
            } else {
                Logger::getInstance().warning("ScanConfig", "Unknown logging.level, using default", level_name);
            }
        } catch (const YAML::Exception& e) {
            Logger::getInstance().warning("ScanConfig", "Invalid logging.level value, using default", e.what());
        }
    }

    if (logging["directory"]) {
        try {
            config.log_directory = logging["directory"].as<std::string>();
        } catch (const YAML::Exception& e) {
            Logger::getInstance().warning("ScanConfig", "Invalid logging.directory value, ignoring it", e.what());
        }
    }
}

ScanConfig fromNode(const YAML::Node& root) {
    ScanConfig config;

    // An empty document is a valid, empty configuration
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    if (root["scan"]) {
        if (root["scan"].IsMap()) {
            applyScanSection(root["scan"], config);
        } else {
            Logger::getInstance().warning("ScanConfig", "Section 'scan' must be a mapping, ignoring it");
        }
    }
    if (root["logging"]) {
        if (root["logging"].IsMap()) {
            applyLoggingSection(root["logging"], config);
        } else {
            Logger::getInstance().warning("ScanConfig", "Section 'logging' must be a mapping, ignoring it");
        }
    }

    return config;
}

} // namespace

ScanConfig ScanConfig::loadFromFile(const std::string& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        // No config file is fine, e.g. in a project that never set one up
        return ScanConfig();
    }

    try {
        ScanConfig config = fromNode(YAML::LoadFile(config_path));
        Logger::getInstance().debug("ScanConfig", "Loaded configuration", config_path);
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse " + config_path + ": " + e.what());
    }
}

ScanConfig ScanConfig::loadFromString(const std::string& yaml_text) {
    try {
        return fromNode(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

FilterTables ScanConfig::filterTables() const {
    FilterTables tables = FilterTables::defaults();
    tables.source_extensions.insert(extra_extensions.begin(), extra_extensions.end());
    tables.ignored_directories.insert(extra_ignored_directories.begin(), extra_ignored_directories.end());
    return tables;
}

ScanOptions ScanConfig::scanOptions() const {
    ScanOptions options;
    options.batch_size = batch_size;
    options.filters = filterTables();
    return options;
}

} // namespace Census
