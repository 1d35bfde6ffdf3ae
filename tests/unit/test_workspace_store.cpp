#include <gtest/gtest.h>
#include "workspace_store.h"
#include "file_utils.h"
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>

namespace runbox {
namespace {

class WorkspaceStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               ("runbox_ws_" + FileUtils::random_hex(4));
        store = std::make_unique<WorkspaceStore>(root.string());
    }

    void TearDown() override {
        store.reset();
        std::filesystem::remove_all(root);
    }

    std::filesystem::path root;
    std::unique_ptr<WorkspaceStore> store;
};

// ============================================================================
// Key Normalization Tests
// ============================================================================

TEST_F(WorkspaceStoreTest, NormalizeKey_LowercasesAndCollapses) {
    EXPECT_EQ(WorkspaceStore::normalize_key("Prime Sieve!!"), "prime_sieve_");
    EXPECT_EQ(WorkspaceStore::normalize_key("abc123"), "abc123");
    EXPECT_EQ(WorkspaceStore::normalize_key("a  --  b"), "a_b");
}

TEST_F(WorkspaceStoreTest, NormalizeKey_TraversalAttemptsStayInside) {
    // Given: Session names that try to climb out of the root
    // When: Normalizing them
    // Then: No '/' or '.' survives

    for (const char* raw : {"../../etc", "/absolute/path", "..", "a/../../b"}) {
        std::string key = WorkspaceStore::normalize_key(raw);
        EXPECT_EQ(key.find('/'), std::string::npos) << raw;
        EXPECT_EQ(key.find('.'), std::string::npos) << raw;
    }
}

TEST_F(WorkspaceStoreTest, NormalizeKey_EmptyAndLong) {
    EXPECT_EQ(WorkspaceStore::normalize_key(""), "default");
    EXPECT_EQ(WorkspaceStore::normalize_key("***"), "_");

    std::string long_a(300, 'a');
    std::string long_b = std::string(299, 'a') + "b";
    std::string key_a = WorkspaceStore::normalize_key(long_a);
    std::string key_b = WorkspaceStore::normalize_key(long_b);
    EXPECT_LE(key_a.size(), 100u);
    EXPECT_NE(key_a, key_b) << "Truncated keys must stay distinct";
    EXPECT_EQ(key_a, WorkspaceStore::normalize_key(long_a)) << "Must be deterministic";
}

// ============================================================================
// Open Tests
// ============================================================================

TEST_F(WorkspaceStoreTest, Open_CreatesTripleUnderRoot) {
    auto workspace = store->open("Chat About Primes");

    ASSERT_TRUE(workspace) << workspace.error().message;
    EXPECT_EQ(workspace->session_key, "chat_about_primes");
    EXPECT_TRUE(std::filesystem::is_directory(workspace->code));
    EXPECT_TRUE(std::filesystem::is_directory(workspace->data));
    EXPECT_TRUE(std::filesystem::is_directory(workspace->output));
    EXPECT_EQ(workspace->root.rfind(store->root() + "/", 0), 0u);
}

TEST_F(WorkspaceStoreTest, Open_IsIdempotentAndKeepsFiles) {
    auto first = store->open("session");
    ASSERT_TRUE(first);
    ASSERT_TRUE(store->write_file(*first, WorkspaceArea::Data, "input.csv", "1,2,3"));

    auto second = store->open("SESSION");

    ASSERT_TRUE(second);
    EXPECT_EQ(second->root, first->root);
    auto content = store->read_file(*second, WorkspaceArea::Data, "input.csv");
    ASSERT_TRUE(content);
    EXPECT_EQ(*content, "1,2,3");
}

TEST_F(WorkspaceStoreTest, Open_ConcurrentSameKey) {
    // Given: Many threads opening the same new session at once
    // When: They race on directory creation
    // Then: Every call succeeds with the same paths

    std::vector<std::thread> threads;
    std::vector<std::string> roots(16);
    std::vector<bool> ok(16, false);
    for (int i = 0; i < 16; i++) {
        threads.emplace_back([&, i]() {
            auto ws = store->open("race");
            ok[i] = static_cast<bool>(ws);
            if (ws) {
                roots[i] = ws->root;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < 16; i++) {
        EXPECT_TRUE(ok[i]);
        EXPECT_EQ(roots[i], roots[0]);
    }
}

TEST_F(WorkspaceStoreTest, Open_RefusesSymlinkedWorkspace) {
    // Given: A workspace directory replaced by a symlink to elsewhere
    // When: Opening it
    // Then: The store refuses instead of following it

    std::filesystem::path outside = root.string() + "_outside";
    std::filesystem::create_directories(outside);
    std::filesystem::create_symlink(outside, std::filesystem::path(store->root()) / "evil");

    auto workspace = store->open("evil");

    EXPECT_FALSE(workspace);
    std::filesystem::remove_all(outside);
}

// ============================================================================
// File Access Tests
// ============================================================================

TEST_F(WorkspaceStoreTest, WriteFile_CreatesSubdirectories) {
    auto ws = store->open("files");
    ASSERT_TRUE(ws);

    ASSERT_TRUE(store->write_file(*ws, WorkspaceArea::Output, "plots/fig.txt", "figure"));

    EXPECT_TRUE(store->file_exists(*ws, WorkspaceArea::Output, "plots/fig.txt"));
    auto files = store->list_files(*ws, WorkspaceArea::Output);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].path, "plots/fig.txt");
    EXPECT_EQ(files[0].size_bytes, 6u);
    EXPECT_EQ(files[0].sha256, FileUtils::sha256_string("figure"));
}

TEST_F(WorkspaceStoreTest, RelativePaths_RejectEscapes) {
    auto ws = store->open("paths");
    ASSERT_TRUE(ws);

    for (const char* path : {"", "/etc/passwd", "../x", "a/../../x", "./x", "a//b", "dir/",
                             "a\\b"}) {
        Status status = store->write_file(*ws, WorkspaceArea::Code, path, "x");
        ASSERT_FALSE(status) << path;
        EXPECT_EQ(status.error().kind, ErrorKind::Validation) << path;
    }
}

TEST_F(WorkspaceStoreTest, WriteFile_DoesNotFollowSymlinks) {
    auto ws = store->open("links");
    ASSERT_TRUE(ws);
    std::filesystem::path target = root.string() + "_target.txt";
    { std::ofstream(target) << "original"; }
    std::filesystem::create_symlink(target, std::filesystem::path(ws->code) / "main.py");

    Status status = store->write_file(*ws, WorkspaceArea::Code, "main.py", "overwritten");

    EXPECT_FALSE(status);
    std::ifstream in(target);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "original");
    std::filesystem::remove(target);
}

TEST_F(WorkspaceStoreTest, ReadFile_MissingIsValidationError) {
    auto ws = store->open("missing");
    ASSERT_TRUE(ws);

    auto content = store->read_file(*ws, WorkspaceArea::Code, "nope.py");

    ASSERT_FALSE(content);
    EXPECT_EQ(content.error().kind, ErrorKind::Validation);
}

} // namespace
} // namespace runbox
