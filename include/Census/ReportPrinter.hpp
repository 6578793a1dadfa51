// =================================================================
// include/Census/ReportPrinter.hpp
// =================================================================
// Text and JSON rendering of a scan report.

#pragma once

#include "ScanPipeline.hpp"
#include <ostream>
#include <string>

namespace Census {

class ReportPrinter {
public:
    /**
     * @brief Construct a printer
     * @param verbose Also list every file with its declaration names
     */
    explicit ReportPrinter(bool verbose = false);

    /**
     * @brief Write the human-readable summary
     *
     * In verbose mode files are listed by number of declarations,
     * largest first.
     * @param report Report to render
     * @param out Destination stream
     */
    void printText(const Report& report, std::ostream& out) const;

    /**
     * @brief Write the report as a JSON document
     * @param report Report to render
     * @param out Destination stream
     */
    void printJson(const Report& report, std::ostream& out) const;

    /**
     * @brief Render the report as a JSON string
     * @param report Report to render
     * @param indent Indentation width, or -1 for compact output
     */
    static std::string toJson(const Report& report, int indent = 2);

private:
    bool m_verbose;
};

} // namespace Census
