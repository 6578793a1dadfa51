// =================================================================
// tests/ScanPipelineTest.cpp
// =================================================================
// Unit tests for ScanPipeline and Report.

#include "Census/ScanPipeline.hpp"
#include "Census/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const char* APP_SOURCE =
    "export const App: React.FC = () => { return <div>Hello World</div>; };\n"
    "export default App;\n";

const char* BUTTON_SOURCE =
    "export const Button: React.FC<ButtonProps> = ({ label, onClick }) => {\n"
    "  return <button onClick={onClick}>{label}</button>;\n"
    "};\n"
    "export const IconButton = () => <button>Icon</button>;\n";

const char* HEADER_SOURCE =
    "class Header extends React.Component {\n"
    "  render() { return <header>My Header</header>; }\n"
    "}\n"
    "export default Header;\n";

using FindingMap = std::map<std::string, std::set<std::string>>;

// Findings keyed by path relative to root, so comparisons ignore completion order
FindingMap toMap(const Census::Report& report, const fs::path& root) {
    FindingMap result;
    for (const auto& finding : report.getFindings()) {
        std::string key = fs::relative(finding.path, root).generic_string();
        result[key] = std::set<std::string>(finding.names.begin(), finding.names.end());
    }
    return result;
}

void assertTotalsConsistent(const Census::Report& report) {
    size_t sum = 0;
    for (const auto& finding : report.getFindings()) {
        assert(!finding.names.empty() && "Findings are never empty");
        std::set<std::string> unique(finding.names.begin(), finding.names.end());
        assert(unique.size() == finding.names.size() && "Names within a finding are unique");
        sum += finding.names.size();
    }
    assert(report.getTotalDeclarations() == sum);
    assert(report.getFilesWithFindings() == report.getFindings().size());
}

} // namespace

class ScanPipelineTest {
private:
    fs::path test_dir;

    void writeFile(const fs::path& relative, const std::string& content) {
        fs::path full = test_dir / relative;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    void setupSampleProject() {
        cleanupTestFiles();
        writeFile("src/App.tsx", APP_SOURCE);
        writeFile("src/components/Button.tsx", BUTTON_SOURCE);
        writeFile("src/components/Header.jsx", HEADER_SOURCE);
    }

    void cleanupTestFiles() {
        std::error_code ec;
        fs::permissions(test_dir / "src" / "Locked.tsx", fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::add, ec);
        fs::remove_all(test_dir, ec);
    }

public:
    ScanPipelineTest() : test_dir(fs::temp_directory_path() / "census_scan_pipeline_test") {}

    ~ScanPipelineTest() { cleanupTestFiles(); }

    void testSampleProject() {
        std::cout << "Testing scan of a sample project..." << std::endl;

        setupSampleProject();

        Census::ScanPipeline pipeline;
        auto report = pipeline.scan(test_dir);

        assert(report.getTotalDeclarations() == 4);
        assert(report.getFilesWithFindings() == 3);
        assertTotalsConsistent(report);

        FindingMap expected = {
            {"src/App.tsx", {"App"}},
            {"src/components/Button.tsx", {"Button", "IconButton"}},
            {"src/components/Header.jsx", {"Header"}}
        };
        assert(toMap(report, test_dir) == expected);
        assert(pipeline.getStatistics().files_scanned == 3);

        std::cout << "✓ Sample project test passed" << std::endl;
    }

    void testIdempotence() {
        std::cout << "Testing repeated scans..." << std::endl;

        setupSampleProject();
        writeFile("lib/Card.js", "import React from 'react';\nexport function Card() { return <div/>; }\n");

        Census::ScanPipeline pipeline;
        auto first = pipeline.scan(test_dir);
        auto second = pipeline.scan(test_dir);

        assert(first.getTotalDeclarations() == second.getTotalDeclarations());
        assert(first.getFilesWithFindings() == second.getFilesWithFindings());
        assert(toMap(first, test_dir) == toMap(second, test_dir));

        Census::ScanPipeline other;
        assert(toMap(other.scan(test_dir), test_dir) == toMap(first, test_dir));

        std::cout << "✓ Repeated scan test passed" << std::endl;
    }

    void testIgnoredDirectories() {
        std::cout << "Testing ignored directories..." << std::endl;

        setupSampleProject();
        writeFile("node_modules/pkg/Widget.tsx", APP_SOURCE);
        writeFile("dist/Bundle.js", BUTTON_SOURCE);
        writeFile("packages/ui/coverage/Report.jsx", HEADER_SOURCE);

        Census::ScanPipeline pipeline;
        auto report = pipeline.scan(test_dir);

        for (const auto& finding : report.getFindings()) {
            std::string path = finding.path.generic_string();
            assert(path.find("/node_modules/") == std::string::npos);
            assert(path.find("/dist/") == std::string::npos);
            assert(path.find("/coverage/") == std::string::npos);
        }
        assert(report.getFilesWithFindings() == 3);
        assert(report.getTotalDeclarations() == 4);

        std::cout << "✓ Ignored directories test passed" << std::endl;
    }

    void testFilesWithoutFindingsAreDropped() {
        std::cout << "Testing files without findings..." << std::endl;

        setupSampleProject();
        writeFile("src/constants.ts", "export const MAX_ITEMS = 10;\n");
        writeFile("src/hooks.ts", "import { useState } from 'react';\nexport function useToggle() {}\n");
        writeFile("src/empty.js", "");

        Census::ScanPipeline pipeline;
        auto report = pipeline.scan(test_dir);

        assert(report.getFilesWithFindings() == 3);
        assert(pipeline.getStatistics().files_scanned == 6);
        assert(pipeline.getStatistics().unreadable_files == 0);
        assertTotalsConsistent(report);

        std::cout << "✓ Files without findings test passed" << std::endl;
    }

    void testDenylistedNamesNeverReported() {
        std::cout << "Testing denylisted names..." << std::endl;

        cleanupTestFiles();
        writeFile("src/Noise.tsx",
                  "import React from 'react';\n"
                  "export const Mock = () => <div/>;\n"
                  "export function Config() { return <div/>; }\n"
                  "export const Real = () => <div/>;\n");
        writeFile("src/OnlyNoise.tsx",
                  "import React from 'react';\n"
                  "export const Test = () => <div/>;\n");

        Census::ScanPipeline pipeline;
        auto report = pipeline.scan(test_dir);

        FindingMap expected = {{"src/Noise.tsx", {"Real"}}};
        assert(toMap(report, test_dir) == expected);

        std::cout << "✓ Denylisted names test passed" << std::endl;
    }

    void testBatchSizes() {
        std::cout << "Testing batch sizes..." << std::endl;

        cleanupTestFiles();
        for (int i = 0; i < 7; ++i) {
            std::string name = "Widget" + std::to_string(i);
            writeFile("src/" + name + ".tsx",
                      "export const " + name + " = () => { return <div/>; };\n");
        }

        FindingMap reference;
        for (size_t batch_size : {1, 3, 7, 50}) {
            Census::ScanOptions options;
            options.batch_size = batch_size;

            Census::ScanPipeline pipeline(options);
            auto report = pipeline.scan(test_dir);

            assert(report.getFilesWithFindings() == 7);
            assert(report.getTotalDeclarations() == 7);
            assertTotalsConsistent(report);

            size_t expected_batches = (7 + batch_size - 1) / batch_size;
            assert(pipeline.getStatistics().batches == expected_batches);

            if (reference.empty()) {
                reference = toMap(report, test_dir);
            } else {
                assert(toMap(report, test_dir) == reference);
            }
        }

        Census::ScanOptions zero;
        zero.batch_size = 0;
        Census::ScanPipeline clamped(zero);
        assert(clamped.getOptions().batch_size == 1 && "Batch size 0 falls back to 1");

        Census::ScanOptions huge;
        huge.batch_size = 100000;
        Census::ScanPipeline capped(huge);
        assert(capped.getOptions().batch_size == Census::ScanOptions::MAX_BATCH_SIZE);
        auto capped_report = capped.scan(test_dir);
        assert(toMap(capped_report, test_dir) == reference);
        assert(capped.getStatistics().batches == 1);

        std::cout << "✓ Batch sizes test passed" << std::endl;
    }

    void testInvalidRoot() {
        std::cout << "Testing invalid roots..." << std::endl;

        setupSampleProject();
        Census::ScanPipeline pipeline;

        bool thrown = false;
        try {
            pipeline.scan(test_dir / "missing");
        } catch (const Census::InvalidRootError& e) {
            thrown = true;
            assert(std::string(e.what()).find("missing") != std::string::npos);
        }
        assert(thrown && "Missing root should throw");

        thrown = false;
        try {
            pipeline.scan(test_dir / "src" / "App.tsx");
        } catch (const Census::InvalidRootError& e) {
            thrown = true;
            assert(std::string(e.what()) == "Invalid directory: " + (test_dir / "src" / "App.tsx").string());
        }
        assert(thrown && "A file is not a valid root");

        std::cout << "✓ Invalid root test passed" << std::endl;
    }

    void testEmptyDirectory() {
        std::cout << "Testing empty directory..." << std::endl;

        cleanupTestFiles();
        fs::create_directories(test_dir);

        Census::ScanPipeline pipeline;
        auto report = pipeline.scan(test_dir);

        assert(report.getTotalDeclarations() == 0);
        assert(report.getFilesWithFindings() == 0);
        assert(report.getFindings().empty());
        assert(report.getElapsedMillis() >= 0);

        std::cout << "✓ Empty directory test passed" << std::endl;
    }

    void testUnreadableFile() {
        std::cout << "Testing unreadable file..." << std::endl;

        setupSampleProject();
        writeFile("src/Locked.tsx", APP_SOURCE);
        fs::permissions(test_dir / "src" / "Locked.tsx", fs::perms::none);

        if (std::ifstream(test_dir / "src" / "Locked.tsx").is_open()) {
            // Privileged users can still read the file
            std::cout << "  (file permissions not enforced, skipping)" << std::endl;
            return;
        }

        Census::ScanPipeline pipeline;
        auto report = pipeline.scan(test_dir);

        assert(report.getFilesWithFindings() == 3 && "Unreadable file contributes nothing");
        assert(pipeline.getStatistics().unreadable_files == 1);
        assert(pipeline.getStatistics().files_scanned == 4);

        std::cout << "✓ Unreadable file test passed" << std::endl;
    }

    void testProcessFile() {
        std::cout << "Testing single file processing..." << std::endl;

        setupSampleProject();
        Census::ComponentExtractor extractor;

        bool readable = false;
        auto finding = Census::ScanPipeline::processFile(
            test_dir / "src" / "components" / "Button.tsx", extractor, readable);
        assert(readable);
        assert(finding.has_value());
        assert(finding->names == (std::vector<std::string>{"Button", "IconButton"}));

        finding = Census::ScanPipeline::processFile(test_dir / "src" / "Gone.tsx", extractor, readable);
        assert(!readable);
        assert(!finding.has_value());

        std::cout << "✓ Single file processing test passed" << std::endl;
    }

    void testLargeFiles() {
        std::cout << "Testing large files..." << std::endl;

        setupSampleProject();

        std::string messages = "// shared by the tsx views\nexport const Messages = ({";
        for (int i = 0; i < 4000; ++i) {
            messages += "key" + std::to_string(i) + ": \"" + std::string(20, 'm') + "\", ";
        }
        messages += "});\n";
        writeFile("src/messages.ts", messages);

        writeFile("src/Table.tsx", "import React from 'react';\n"
                                   "export function Table(" + std::string(150000, 'a') + ") {\n"
                                   "  return <table/>;\n}\n");

        assert(fs::file_size(test_dir / "src" / "messages.ts") > 100000);

        Census::ScanPipeline pipeline;
        auto report = pipeline.scan(test_dir);
        auto found = toMap(report, test_dir);

        assert(found.count("src/messages.ts") == 0);
        assert(found["src/Table.tsx"] == std::set<std::string>{"Table"});
        assert(report.getFilesWithFindings() == 4);
        assert(report.getTotalDeclarations() == 5);
        assert(pipeline.getStatistics().unreadable_files == 0);

        std::cout << "✓ Large files test passed" << std::endl;
    }

    void testFailedReadYieldsNothing() {
        std::cout << "Testing failed reads..." << std::endl;

        setupSampleProject();
        Census::ComponentExtractor extractor;

        // Opening a directory succeeds, reading from it fails
        std::ifstream directory_stream(test_dir / "src");
        if (!directory_stream.is_open()) {
            std::cout << "  (directories cannot be opened as files here, skipping)" << std::endl;
            return;
        }

        bool readable = true;
        auto finding = Census::ScanPipeline::processFile(test_dir / "src", extractor, readable);
        assert(!readable && "A read error is not an empty file");
        assert(!finding.has_value());

        std::cout << "✓ Failed reads test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ScanPipeline unit tests..." << std::endl;

        testSampleProject();
        testIdempotence();
        testIgnoredDirectories();
        testFilesWithoutFindingsAreDropped();
        testDenylistedNamesNeverReported();
        testBatchSizes();
        testInvalidRoot();
        testEmptyDirectory();
        testUnreadableFile();
        testProcessFile();
        testLargeFiles();
        testFailedReadYieldsNothing();

        cleanupTestFiles();
        std::cout << "All ScanPipeline tests passed!" << std::endl;
    }
};

class ReportTest {
public:
    void testCountsDerivedFromFindings() {
        std::cout << "Testing report counts..." << std::endl;

        std::vector<Census::FileFinding> findings = {
            {"a/One.tsx", {"One"}},
            {"b/Two.tsx", {"Alpha", "Beta"}},
            {"c/Three.tsx", {"X1", "X2", "X3"}}
        };

        Census::Report report(findings, 12);
        assert(report.getTotalDeclarations() == 6);
        assert(report.getFilesWithFindings() == 3);
        assert(report.getElapsedMillis() == 12);
        assertTotalsConsistent(report);

        Census::Report empty({}, 0);
        assert(empty.getTotalDeclarations() == 0);
        assert(empty.getFilesWithFindings() == 0);

        std::cout << "✓ Report counts test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Report unit tests..." << std::endl;

        testCountsDerivedFromFindings();

        std::cout << "All Report tests passed!" << std::endl;
    }
};

int main() {
    Census::Logger::getInstance().setConsoleLogging(false);

    try {
        ReportTest report_tests;
        report_tests.runAllTests();

        std::cout << std::endl;

        ScanPipelineTest pipeline_tests;
        pipeline_tests.runAllTests();

        std::cout << "\n🎉 All ScanPipeline component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
