#include <gtest/gtest.h>
#include "file_utils.h"
#include <filesystem>
#include <fstream>
#include <set>

namespace runbox {
namespace {

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() /
                   ("runbox_file_utils_" + FileUtils::random_hex(4));
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::string create_test_file(const std::string& relative, const std::string& content) {
        std::filesystem::path path = test_dir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path.string();
    }

    std::filesystem::path test_dir;
};

// ============================================================================
// SHA256 Tests
// ============================================================================

TEST_F(FileUtilsTest, SHA256String_KnownVectors) {
    // Given: Inputs with published SHA256 digests
    // When: Hashing them
    // Then: Lowercase hex digests match

    EXPECT_EQ(FileUtils::sha256_string(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(FileUtils::sha256_string("hello world"),
              "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(FileUtilsTest, SHA256File_MatchesStringHashAcrossChunks) {
    // Given: A file larger than one read chunk
    // When: Hashing the file and the same bytes in memory
    // Then: Both digests agree

    std::string content;
    for (int i = 0; i < 5000; i++) {
        content += "print(i)\n";
    }
    std::string path = create_test_file("big.py", content);

    EXPECT_EQ(FileUtils::sha256_file(path), FileUtils::sha256_string(content));
}

TEST_F(FileUtilsTest, SHA256File_MissingFileGivesEmptyDigest) {
    EXPECT_EQ(FileUtils::sha256_file((test_dir / "absent.txt").string()), "");
}

// ============================================================================
// Random Hex Tests
// ============================================================================

TEST_F(FileUtilsTest, RandomHex_LengthAndAlphabet) {
    // Given: A request for 8 random bytes
    // When: Generating hex
    // Then: 16 lowercase hex characters come back

    std::string hex = FileUtils::random_hex(8);
    ASSERT_EQ(hex.size(), 16u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(FileUtilsTest, RandomHex_DoesNotRepeat) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; i++) {
        seen.insert(FileUtils::random_hex(8));
    }
    EXPECT_EQ(seen.size(), 200u) << "64-bit ids should not collide in a small sample";
}

TEST_F(FileUtilsTest, BytesToHex_PadsEachByte) {
    unsigned char data[] = {0x00, 0x0a, 0xff};
    EXPECT_EQ(FileUtils::bytes_to_hex(data, 3), "000aff");
    EXPECT_EQ(FileUtils::bytes_to_hex(data, 0), "");
}

// ============================================================================
// Metadata and Directory Manifest Tests
// ============================================================================

TEST_F(FileUtilsTest, GetFileMetadata_RegularFile) {
    std::string path = create_test_file("result.csv", "x,y\n1,2\n");

    FileMetadata metadata = FileUtils::get_file_metadata(path);

    EXPECT_EQ(metadata.size_bytes, 8u);
    EXPECT_EQ(metadata.sha256_hash, FileUtils::sha256_string("x,y\n1,2\n"));
}

TEST_F(FileUtilsTest, GetFileMetadata_DirectoryIsEmpty) {
    std::filesystem::create_directories(test_dir / "plots");

    FileMetadata metadata = FileUtils::get_file_metadata((test_dir / "plots").string());

    EXPECT_EQ(metadata.size_bytes, 0u);
    EXPECT_EQ(metadata.sha256_hash, "");
}

TEST_F(FileUtilsTest, HashDirectory_RecursiveRelativeKeys) {
    // Given: Output files at several depths
    // When: Building the manifest
    // Then: Keys are paths relative to the root with '/' separators

    create_test_file("summary.txt", "ok");
    create_test_file("plots/a.png", "png");
    create_test_file("plots/raw/b.bin", "bin");

    auto manifest = FileUtils::hash_directory(test_dir.string());

    ASSERT_EQ(manifest.size(), 3u);
    EXPECT_EQ(manifest["summary.txt"].sha256_hash, FileUtils::sha256_string("ok"));
    EXPECT_EQ(manifest["plots/a.png"].size_bytes, 3u);
    EXPECT_EQ(manifest["plots/raw/b.bin"].path, "plots/raw/b.bin");
}

TEST_F(FileUtilsTest, HashDirectory_SkipsSymlinks) {
    // Given: A program-created symlink pointing outside the directory
    // When: Building the manifest
    // Then: The link is not followed or listed

    create_test_file("real.txt", "data");
    std::filesystem::create_symlink("/etc/passwd", test_dir / "escape");

    auto manifest = FileUtils::hash_directory(test_dir.string());

    EXPECT_EQ(manifest.size(), 1u);
    EXPECT_EQ(manifest.count("escape"), 0u);
}

TEST_F(FileUtilsTest, HashDirectory_MissingDirectoryIsEmpty) {
    EXPECT_TRUE(FileUtils::hash_directory((test_dir / "nope").string()).empty());
}

// ============================================================================
// Format File Size Tests
// ============================================================================

TEST_F(FileUtilsTest, FormatFileSize_Units) {
    EXPECT_EQ(FileUtils::format_file_size(0), "0.0 B");
    EXPECT_EQ(FileUtils::format_file_size(1536), "1.5 KB");
    EXPECT_EQ(FileUtils::format_file_size(64ULL * 1024 * 1024), "64.0 MB");
    EXPECT_EQ(FileUtils::format_file_size(1024ULL * 1024 * 1024 * 2), "2.0 GB");
}

} // namespace
} // namespace runbox
