// ==============================================================================
// test_discovery_gtest.cpp - Тесты поиска файла резервной копии (GoogleTest)
// ==============================================================================

#include <fireup/discovery.hpp>
#include <fireup/output.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fireup::io::test {

using fireup::test::TempDirTest;

class DiscoveryTest : public TempDirTest {
protected:
    std::filesystem::path touch(const std::string& relative) {
        return write_file(relative, std::string("test content"));
    }
};

// ==============================================================================
// discover_files
// ==============================================================================

TEST_F(DiscoveryTest, SingleFileIsReturnedAsIs) {
    auto file = touch("output-0");

    auto files = discover_files(file);

    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], file);
}

TEST_F(DiscoveryTest, RecursesIntoSubdirectories) {
    touch("export/all_namespaces/all_kinds/output-0");
    touch("export/all_namespaces/all_kinds/all_namespaces_all_kinds.export_metadata");
    touch("export/overall.overall_export_metadata");

    auto files = discover_files(test_dir_ / "export");

    EXPECT_EQ(files.size(), 3u);
}

TEST_F(DiscoveryTest, ResultIsSorted) {
    touch("d/c");
    touch("d/a");
    touch("d/b/z");

    auto files = discover_files(test_dir_ / "d");

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].filename(), "a");
    EXPECT_EQ(files[1].filename(), "z");
    EXPECT_EQ(files[2].filename(), "c");
}

TEST_F(DiscoveryTest, EmptyDirectoryYieldsNothing) {
    std::filesystem::create_directories(test_dir_ / "empty/inner");

    EXPECT_TRUE(discover_files(test_dir_ / "empty").empty());
}

TEST_F(DiscoveryTest, MissingPathThrows) {
    EXPECT_THROW(discover_files(test_dir_ / "missing"), std::runtime_error);
}

TEST_F(DiscoveryTest, MissingPathWithSkipErrorsWarns) {
    auto log_path = test_dir_ / "discovery.log";
    std::vector<std::filesystem::path> files;
    {
        output::OutputConfig cfg;
        cfg.log_path = log_path;
        output::Writer writer(cfg);
        files = discover_files(test_dir_ / "missing", true, &writer);
    }

    EXPECT_TRUE(files.empty());
    std::ifstream in(log_path);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line.rfind("[!] backup path does not exist - ", 0), 0u);
}

// ==============================================================================
// resolve_backup_file
// ==============================================================================

TEST_F(DiscoveryTest, ResolveFileReturnsSamePath) {
    auto file = touch("backup.log");

    EXPECT_EQ(resolve_backup_file(file), file);
}

TEST_F(DiscoveryTest, ResolvePrefersOutputZero) {
    touch("export/aaa/first-file");
    auto preferred = touch("export/zzz/output-0");

    EXPECT_EQ(resolve_backup_file(test_dir_ / "export"), preferred);
}

TEST_F(DiscoveryTest, ResolveFallsBackToFirstFile) {
    auto first = touch("export/a/output-1");
    touch("export/b/output-2");

    EXPECT_EQ(resolve_backup_file(test_dir_ / "export"), first);
}

TEST_F(DiscoveryTest, ResolveEmptyDirectoryThrows) {
    std::filesystem::create_directories(test_dir_ / "export");

    try {
        resolve_backup_file(test_dir_ / "export");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("no backup files found"), std::string::npos);
    }
}

TEST_F(DiscoveryTest, ResolveMissingPathThrows) {
    EXPECT_THROW(resolve_backup_file(test_dir_ / "missing"), std::runtime_error);
}

}  // namespace fireup::io::test
