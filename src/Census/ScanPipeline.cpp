// =================================================================
// src/Census/ScanPipeline.cpp
// =================================================================
// Implementation of the batched scan pipeline.

#include "Census/ScanPipeline.hpp"
#include "Census/DirectoryWalker.hpp"
#include "Census/Logger.hpp"
#include <chrono>
#include <fstream>
#include <future>
#include <sstream>
#include <system_error>

namespace Census {

namespace {

struct FileOutcome {
    std::optional<FileFinding> finding;
    bool readable = true;
};

} // namespace

// Report implementation

Report::Report(std::vector<FileFinding> findings, long elapsed_ms)
    : m_findings(std::move(findings)),
      m_total_declarations(0),
      m_elapsed_ms(elapsed_ms)
{
    for (const auto& finding : m_findings) {
        m_total_declarations += finding.names.size();
    }
}

// ScanPipeline implementation

ScanPipeline::ScanPipeline(const ScanOptions& options)
    : m_options(options),
      m_extractor(m_options.filters)
{
    if (m_options.batch_size == 0) {
        LOG_WARNING("ScanPipeline", "Batch size 0 is not usable, processing one file at a time");
        m_options.batch_size = 1;
    } else if (m_options.batch_size > ScanOptions::MAX_BATCH_SIZE) {
        LOG_WARNING("ScanPipeline", "Batch size " + std::to_string(m_options.batch_size) +
                    " exceeds the limit, using " + std::to_string(ScanOptions::MAX_BATCH_SIZE));
        m_options.batch_size = ScanOptions::MAX_BATCH_SIZE;
    }
}

Report ScanPipeline::scan(const std::filesystem::path& root) {
    auto start_time = std::chrono::steady_clock::now();
    m_statistics = ScanStatistics();

    validateRoot(root);

    Logger::getInstance().info("ScanPipeline", "Scanning " + root.string(),
                               "Batch size: " + std::to_string(m_options.batch_size));

    DirectoryWalker walker(root, m_options.filters);
    std::vector<FileFinding> findings;
    std::vector<std::filesystem::path> batch;
    batch.reserve(m_options.batch_size);

    while (auto candidate = walker.next()) {
        batch.push_back(std::move(*candidate));

        if (batch.size() >= m_options.batch_size) {
            processBatch(batch, findings);
            batch.clear();
        }
    }

    // Remaining partial batch
    if (!batch.empty()) {
        processBatch(batch, findings);
    }

    m_statistics.directories_visited = walker.visitedDirectories();
    m_statistics.directories_skipped = walker.skippedDirectories();

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    Report report(std::move(findings), static_cast<long>(duration.count()));

    Logger::getInstance().logScanSummary(root.string(), m_statistics.files_scanned,
                                         report.getFilesWithFindings(),
                                         report.getTotalDeclarations(),
                                         report.getElapsedMillis());
    if (m_statistics.unreadable_files > 0 || m_statistics.directories_skipped > 0) {
        std::ostringstream context;
        context << "Unreadable files: " << m_statistics.unreadable_files << ", ";
        context << "Skipped directories: " << m_statistics.directories_skipped;
        LOG_INFO("ScanPipeline", "Some entries were skipped (" + context.str() + ")");
    }

    return report;
}

void ScanPipeline::processBatch(const std::vector<std::filesystem::path>& batch,
                                std::vector<FileFinding>& findings) {
    std::vector<std::future<FileOutcome>> futures;
    futures.reserve(batch.size());

    for (const auto& file_path : batch) {
        auto task = [this, file_path]() {
            FileOutcome outcome;
            outcome.finding = processFile(file_path, m_extractor, outcome.readable);
            return outcome;
        };

        try {
            futures.push_back(std::async(std::launch::async, task));
        } catch (const std::system_error& e) {
            // No thread available, the item runs on this thread when collected
            LOG_DEBUG("ScanPipeline", "Could not start worker for " + file_path.string() + ": " + e.what());
            futures.push_back(std::async(std::launch::deferred, task));
        }
    }

    // Wait for the whole batch before touching shared results
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            FileOutcome outcome = futures[i].get();
            if (!outcome.readable) {
                m_statistics.unreadable_files++;
            }
            if (outcome.finding) {
                findings.push_back(std::move(*outcome.finding));
            }
        } catch (const std::exception& e) {
            m_statistics.unreadable_files++;
            LOG_WARNING("ScanPipeline", "Failed to process " + batch[i].string() + ": " + e.what());
        }
    }

    m_statistics.files_scanned += batch.size();
    m_statistics.batches++;
}

std::optional<FileFinding> ScanPipeline::processFile(const std::filesystem::path& file_path,
                                                     const ComponentExtractor& extractor,
                                                     bool& readable) {
    std::string content;
    readable = readFile(file_path, content);
    if (!readable) {
        LOG_DEBUG("ScanPipeline", "Skipping unreadable file " + file_path.string());
        return std::nullopt;
    }

    std::set<std::string> names = extractor.extract(content);
    if (names.empty()) {
        return std::nullopt;
    }

    FileFinding finding;
    finding.path = file_path;
    finding.names.assign(names.begin(), names.end());
    return finding;
}

void ScanPipeline::validateRoot(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(root, ec);
    if (ec || !std::filesystem::is_directory(status)) {
        throw InvalidRootError("Invalid directory: " + root.string());
    }
}

bool ScanPipeline::readFile(const std::filesystem::path& file_path, std::string& content) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    std::string result;
    std::vector<char> chunk(64 * 1024);
    while (file.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || file.gcount() > 0) {
        result.append(chunk.data(), static_cast<size_t>(file.gcount()));
    }

    // End of file sets failbit; only badbit means the read itself failed
    if (file.bad()) {
        return false;
    }

    content = std::move(result);
    return true;
}

} // namespace Census
