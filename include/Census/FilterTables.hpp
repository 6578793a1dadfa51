// =================================================================
// include/Census/FilterTables.hpp
// =================================================================
// Membership tables consulted by the walker and the extractor.

#pragma once

#include <filesystem>
#include <string>
#include <unordered_set>

namespace Census {

/**
 * @brief Fixed lookup sets for file suffixes, ignored directories and rejected names
 *
 * All lookups are exact, case-sensitive set membership. Directory names are
 * compared by basename only, never by path or glob.
 */
struct FilterTables {
    std::unordered_set<std::string> source_extensions;
    std::unordered_set<std::string> ignored_directories;
    std::unordered_set<std::string> rejected_names;

    /**
     * @brief Get the built-in tables
     * @return Reference to the process-wide default tables
     */
    static const FilterTables& defaults();

    /**
     * @brief Check if a file has a recognized source suffix
     * @param file_path Path to the file (only the extension is inspected)
     * @return true if the extension, including the dot, is recognized
     */
    bool isSourceFile(const std::filesystem::path& file_path) const;

    /**
     * @brief Check if a directory basename is in the ignored set
     */
    bool isIgnoredDirectory(const std::string& directory_name) const;

    bool isRejectedName(const std::string& name) const;
};

} // namespace Census
