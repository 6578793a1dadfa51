// =================================================================
// include/Census/ScanPipeline.hpp
// =================================================================
// Directory scan pipeline and the report it produces.

#pragma once

#include "FilterTables.hpp"
#include "ComponentExtractor.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Census {

/**
 * @brief Raised when the scan root is missing or is not a directory
 */
class InvalidRootError : public std::runtime_error {
public:
    explicit InvalidRootError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Declaration names found in one file
 */
struct FileFinding {
    std::filesystem::path path;
    std::vector<std::string> names;  ///< Unique, non-empty, sorted
};

/**
 * @brief Aggregate result of one scan
 *
 * The counts are derived from the findings at construction and the object
 * offers no way to change them afterwards.
 */
class Report {
public:
    Report(std::vector<FileFinding> findings, long elapsed_ms);

    size_t getTotalDeclarations() const { return m_total_declarations; }
    size_t getFilesWithFindings() const { return m_findings.size(); }
    const std::vector<FileFinding>& getFindings() const { return m_findings; }
    long getElapsedMillis() const { return m_elapsed_ms; }

private:
    std::vector<FileFinding> m_findings;
    size_t m_total_declarations;
    long m_elapsed_ms;
};

/**
 * @brief Diagnostics about the most recent scan
 */
struct ScanStatistics {
    size_t files_scanned = 0;        ///< Candidate files processed
    size_t unreadable_files = 0;     ///< Candidates that could not be read
    size_t batches = 0;
    size_t directories_visited = 0;
    size_t directories_skipped = 0;
};

/**
 * @brief Settings for a pipeline instance
 */
struct ScanOptions {
    static constexpr size_t DEFAULT_BATCH_SIZE = 50;
    static constexpr size_t MAX_BATCH_SIZE = 1024;

    size_t batch_size = DEFAULT_BATCH_SIZE;
    FilterTables filters = FilterTables::defaults();
};

/**
 * @brief Walks a tree, extracts declarations file by file, and builds a Report
 *
 * Candidates are processed in batches of batch_size. Every file of a batch
 * is read and extracted concurrently, and the whole batch completes before
 * the walker is asked for the next one, so at most batch_size files are
 * in memory at once. Files that cannot be read contribute nothing.
 */
class ScanPipeline {
public:
    explicit ScanPipeline(const ScanOptions& options = ScanOptions());

    // The extractor refers to m_options.filters
    ScanPipeline(const ScanPipeline&) = delete;
    ScanPipeline& operator=(const ScanPipeline&) = delete;

    /**
     * @brief Scan a directory tree
     * @param root Directory to scan
     * @return Report of all files with at least one declaration
     * @throws InvalidRootError if root does not exist or is not a directory
     */
    Report scan(const std::filesystem::path& root);

    /**
     * @brief Statistics gathered by the last call to scan()
     */
    const ScanStatistics& getStatistics() const { return m_statistics; }

    const ScanOptions& getOptions() const { return m_options; }

    /**
     * @brief Read one file and extract its declarations
     * @param file_path Candidate file
     * @param extractor Extractor to apply
     * @param readable Set to false if the file could not be read
     * @return Finding, or std::nullopt if the file yields no names
     */
    static std::optional<FileFinding> processFile(const std::filesystem::path& file_path,
                                                  const ComponentExtractor& extractor,
                                                  bool& readable);

private:
    ScanOptions m_options;
    ComponentExtractor m_extractor;
    ScanStatistics m_statistics;

    /**
     * @brief Run one batch concurrently and append its findings
     * @param batch Candidate files of this batch
     * @param findings Destination for non-empty findings
     */
    void processBatch(const std::vector<std::filesystem::path>& batch,
                      std::vector<FileFinding>& findings);

    /**
     * @brief Confirm that the root is an existing directory
     * @throws InvalidRootError otherwise
     */
    static void validateRoot(const std::filesystem::path& root);

    /**
     * @brief Read a whole file into a string
     * @return false if the file could not be opened or read
     */
    static bool readFile(const std::filesystem::path& file_path, std::string& content);
};

} // namespace Census
