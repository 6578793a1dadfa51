// =================================================================
// src/Census/DirectoryWalker.cpp
// =================================================================
// Implementation of the lazy directory walk.

#include "Census/DirectoryWalker.hpp"
#include "Census/Logger.hpp"
#include <system_error>

namespace Census {

DirectoryWalker::DirectoryWalker(const std::filesystem::path& root, const FilterTables& filters)
    : m_root(root),
      m_filters(filters),
      m_started(false),
      m_visited_directories(0),
      m_skipped_directories(0)
{
}

std::optional<std::filesystem::path> DirectoryWalker::next() {
    if (!m_started) {
        m_started = true;
        enter(m_root);
    }

    while (!m_stack.empty()) {
        if (m_stack.back() == std::filesystem::directory_iterator()) {
            m_stack.pop_back();
            continue;
        }

        // Copy before advancing; enter() may grow the stack
        const std::filesystem::directory_entry entry = *m_stack.back();
        advance();

        std::error_code ec;
        std::filesystem::file_status status = entry.symlink_status(ec);
        if (ec) {
            continue;
        }

        if (std::filesystem::is_directory(status)) {
            std::string name = entry.path().filename().string();
            if (m_filters.isIgnoredDirectory(name)) {
                continue;
            }
            enter(entry.path());
        } else if (std::filesystem::is_regular_file(status)) {
            if (m_filters.isSourceFile(entry.path())) {
                return entry.path();
            }
        }
        // Symlinks, sockets, devices etc. are ignored
    }

    return std::nullopt;
}

void DirectoryWalker::enter(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        m_skipped_directories++;
        LOG_DEBUG("DirectoryWalker", "Skipping unreadable directory " + directory.string() +
                  ": " + ec.message());
        return;
    }

    m_visited_directories++;
    m_stack.push_back(std::move(it));
}

void DirectoryWalker::advance() {
    std::error_code ec;
    m_stack.back().increment(ec);
    if (ec) {
        m_skipped_directories++;
        LOG_DEBUG("DirectoryWalker", "Directory listing interrupted: " + ec.message());
        m_stack.pop_back();
    }
}

} // namespace Census
