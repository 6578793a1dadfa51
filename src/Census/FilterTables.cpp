// =================================================================
// src/Census/FilterTables.cpp
// =================================================================
// Implementation of the default filter tables.

#include "Census/FilterTables.hpp"

namespace Census {

const FilterTables& FilterTables::defaults() {
    static const FilterTables tables = [] {
        FilterTables t;
        t.source_extensions = {".tsx", ".ts", ".jsx", ".js"};
        t.ignored_directories = {
            "node_modules",
            "dist",
            "build",
            ".git",
            ".next",
            "coverage",
            ".cache",
            "out",
            ".turbo",
            ".vercel"
        };
        // Generic identifiers that match the rules but are rarely components
        t.rejected_names = {"Test", "Mock", "Util", "Helper", "Config"};
        return t;
    }();
    return tables;
}

bool FilterTables::isSourceFile(const std::filesystem::path& file_path) const {
    if (!file_path.has_extension()) {
        return false;
    }
    return source_extensions.count(file_path.extension().string()) > 0;
}

bool FilterTables::isIgnoredDirectory(const std::string& directory_name) const {
    return ignored_directories.count(directory_name) > 0;
}

bool FilterTables::isRejectedName(const std::string& name) const {
    return rejected_names.count(name) > 0;
}

} // namespace Census
