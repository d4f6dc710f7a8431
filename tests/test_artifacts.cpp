#include <gtest/gtest.h>
#include "core/artifact_catalog.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class ArtifactCatalogTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("svcguard-test-artifacts-" + std::to_string(getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    void touch(const fs::path& p, size_t bytes = 16) {
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << std::string(bytes, 'x');
    }
};

TEST_F(ArtifactCatalogTest, EmptyFolderPathIsAnError) {
    auto r = ArtifactCatalog::list("");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "No folder path configured. Please set folder path first.");
}

TEST_F(ArtifactCatalogTest, MissingFolderIsAnError) {
    auto r = ArtifactCatalog::list((dir / "nope").string());
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("Folder does not exist"), std::string::npos);
}

TEST_F(ArtifactCatalogTest, ListsFlatAndSubfolderArtifacts) {
    touch(dir / "zeta.jar");
    touch(dir / "billing" / "billing.jar", 2 * 1024 * 1024);
    touch(dir / "run.sh");
    touch(dir / "notes.txt");
    touch(dir / "tools" / "helper.jar");          // folder name differs: not listed
    touch(dir / "orders" / "orders" / "orders.jar");  // two levels down: not listed

    auto r = ArtifactCatalog::list(dir.string());
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_EQ(r.artifacts.size(), 3u);

    // Sorted by type label, then name
    EXPECT_EQ(r.artifacts[0].name, "billing.jar");
    EXPECT_TRUE(r.artifacts[0].subfolder_layout);
    EXPECT_DOUBLE_EQ(r.artifacts[0].size_mb, 2.0);
    EXPECT_EQ(r.artifacts[1].name, "zeta.jar");
    EXPECT_FALSE(r.artifacts[1].subfolder_layout);
    EXPECT_EQ(r.artifacts[2].name, "run.sh");
    EXPECT_EQ(r.artifacts[2].kind, ArtifactKind::ShellScript);
    EXPECT_EQ(r.artifacts[2].extension, ".sh");
}

TEST_F(ArtifactCatalogTest, SkipsOtherPlatformKinds) {
    touch(dir / "tool.exe");
    touch(dir / "job.bat");
    auto r = ArtifactCatalog::list(dir.string());
    ASSERT_TRUE(r.success);
#ifdef _WIN32
    EXPECT_EQ(r.artifacts.size(), 2u);
#else
    EXPECT_TRUE(r.artifacts.empty());
#endif
}

TEST_F(ArtifactCatalogTest, SizeIsRoundedToTwoDecimals) {
    touch(dir / "small.jar", 1000);
    auto r = ArtifactCatalog::list(dir.string());
    ASSERT_EQ(r.artifacts.size(), 1u);
    EXPECT_DOUBLE_EQ(r.artifacts[0].size_mb, 0.0);
}

TEST_F(ArtifactCatalogTest, ResolvePrefersSubfolderLayout) {
    touch(dir / "billing.jar");
    touch(dir / "billing" / "billing.jar");
    EXPECT_EQ(ArtifactCatalog::resolve(dir.string(), "billing.jar"),
              (dir / "billing" / "billing.jar").lexically_normal().string());
}

TEST_F(ArtifactCatalogTest, ResolveFallsBackToFlat) {
    touch(dir / "orders.jar");
    EXPECT_EQ(ArtifactCatalog::resolve(dir.string(), "orders.jar"),
              (dir / "orders.jar").lexically_normal().string());
    EXPECT_EQ(ArtifactCatalog::resolve(dir.string(), "missing.jar"), "");
    EXPECT_EQ(ArtifactCatalog::resolve("", "orders.jar"), "");
}
