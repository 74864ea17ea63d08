/**
 * @file test_config_writer.cpp
 * @brief Unit tests for writing catalog entries as engine config files
 */

#include "app/config_writer.h"
#include "pipeline/pipeline_json.h"
#include "support/fake_engine.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace camilla_remote;
using camilla_remote::testing::FakeEngine;

class ConfigWriterTest : public ::testing::Test {
   protected:
    void SetUp() override {
        tempDir = fs::temp_directory_path() /
                  ("camilla_remote_writer_test_" + std::to_string(getpid()));
        fs::remove_all(tempDir);
        hardware.correctionFilterPath = "/cfg/filters/drc.wav";
        hardware.balanceFilters = true;
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path tempDir;
    pipeline::HardwareParams hardware;
    FakeEngine engine;
};

TEST_F(ConfigWriterTest, WritesOneFilePerCombination) {
    auto catalog =
        control::ConfigurationCatalog::build(control::defaultMenuLayout(), hardware, engine);

    const auto outDir = tempDir / "nested" / "configs";
    EXPECT_EQ(app::writeCatalogFiles(catalog, outDir), 8u);

    EXPECT_TRUE(fs::exists(outDir / "Stream-2.1-DRC.yml"));
    EXPECT_TRUE(fs::exists(outDir / "Phono-Mono.yml"));

    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(outDir)) {
        (void)entry;
        ++count;
    }
    EXPECT_EQ(count, 8u);
}

TEST_F(ConfigWriterTest, WrittenFileParsesBackToCatalogEntry) {
    auto catalog =
        control::ConfigurationCatalog::build(control::defaultMenuLayout(), hardware, engine);
    app::writeCatalogFiles(catalog, tempDir);

    auto parsed = pipeline_json::parse(readFile(tempDir / "Phono-2.0.yml"));
    EXPECT_EQ(parsed, catalog.lookup("2.0", "Phono"));
}

TEST_F(ConfigWriterTest, UnwritableDirectoryThrows) {
    fs::create_directories(tempDir);
    const auto blocker = tempDir / "not_a_dir";
    std::ofstream(blocker) << "x";

    auto catalog =
        control::ConfigurationCatalog::build(control::defaultMenuLayout(), hardware, engine);
    EXPECT_THROW(app::writeCatalogFiles(catalog, blocker / "sub"), fs::filesystem_error);
}
