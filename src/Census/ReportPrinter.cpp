// =================================================================
// src/Census/ReportPrinter.cpp
// =================================================================
// Implementation of report rendering.

#include "Census/ReportPrinter.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <vector>

namespace Census {

ReportPrinter::ReportPrinter(bool verbose)
    : m_verbose(verbose)
{
}

void ReportPrinter::printText(const Report& report, std::ostream& out) const {
    out << "Scan completed in " << report.getElapsedMillis() << "ms" << std::endl << std::endl;
    out << "Results:" << std::endl;
    out << "   Total Components: " << report.getTotalDeclarations() << std::endl;
    out << "   Files with Components: " << report.getFilesWithFindings() << std::endl;

    if (!m_verbose || report.getFindings().empty()) {
        return;
    }

    out << std::endl << "Components by file:" << std::endl << std::endl;

    std::vector<const FileFinding*> sorted;
    sorted.reserve(report.getFindings().size());
    for (const auto& finding : report.getFindings()) {
        sorted.push_back(&finding);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const FileFinding* a, const FileFinding* b) {
                         return a->names.size() > b->names.size();
                     });

    for (const auto* finding : sorted) {
        out << "   " << finding->path.string() << std::endl;
        out << "   └─ ";
        for (size_t i = 0; i < finding->names.size(); ++i) {
            if (i > 0) out << ", ";
            out << finding->names[i];
        }
        out << std::endl << std::endl;
    }
}

void ReportPrinter::printJson(const Report& report, std::ostream& out) const {
    out << toJson(report) << std::endl;
}

std::string ReportPrinter::toJson(const Report& report, int indent) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& finding : report.getFindings()) {
        files.push_back({
            {"file", finding.path.string()},
            {"components", finding.names}
        });
    }

    nlohmann::json document = {
        {"totalComponents", report.getTotalDeclarations()},
        {"filesWithComponents", report.getFilesWithFindings()},
        {"timeTakenMs", report.getElapsedMillis()},
        {"componentsByFile", files}
    };

    // Paths are raw bytes and may not be valid UTF-8
    return document.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace Census
