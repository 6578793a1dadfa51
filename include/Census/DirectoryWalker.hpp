// =================================================================
// include/Census/DirectoryWalker.hpp
// =================================================================
// Lazy depth-first walk producing candidate source files.

#pragma once

#include "FilterTables.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace Census {

/**
 * @brief Pull-style walker over a directory tree
 *
 * Each call to next() advances the walk just far enough to produce one
 * candidate file. The walker holds one open directory iterator per level
 * of the current path, so memory is bounded by the tree depth rather than
 * the number of files.
 *
 * Ignored directories are never entered. Symbolic links are neither
 * followed nor yielded. Directories that cannot be listed are skipped
 * without ending the walk. The order of yielded paths is unspecified.
 *
 * A walker is single-use: a rescan constructs a new one.
 */
class DirectoryWalker {
public:
    /**
     * @brief Construct a walker rooted at a directory
     * @param root Directory to walk; opened lazily on the first next()
     * @param filters Tables used for directory pruning and suffix checks
     */
    DirectoryWalker(const std::filesystem::path& root, const FilterTables& filters);

    /**
     * @brief Produce the next candidate file
     * @return Path of the next candidate, or std::nullopt when the walk is done
     */
    std::optional<std::filesystem::path> next();

    /**
     * @brief Number of directories successfully opened so far (root included)
     */
    size_t visitedDirectories() const { return m_visited_directories; }

    /**
     * @brief Number of directories that could not be listed
     */
    size_t skippedDirectories() const { return m_skipped_directories; }

private:
    std::filesystem::path m_root;
    const FilterTables& m_filters;
    bool m_started;
    size_t m_visited_directories;
    size_t m_skipped_directories;

    // Iterator into each directory on the current path, innermost last
    std::vector<std::filesystem::directory_iterator> m_stack;

    /**
     * @brief Open a directory and push its iterator
     * @param directory Directory to descend into
     */
    void enter(const std::filesystem::path& directory);

    /**
     * @brief Advance the innermost iterator, dropping it on error
     */
    void advance();
};

} // namespace Census
