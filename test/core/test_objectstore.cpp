#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "core/ObjectStore.hpp"
#include "util/Zlib.hpp"

namespace fs = std::filesystem;

using namespace gitpulse;
using namespace gitpulse::test::utils;

class ObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        fs::create_directories(tempDir / "objects");
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
};

// Test: Blob ids match git's
TEST_F(ObjectStoreTest, WriteBlobUsesGitObjectId) {
    ObjectStore store(tempDir / "objects");

    EXPECT_EQ(store.writeBlob(""), Constants::EMPTY_BLOB_ID);
    std::string hash = store.writeBlob("hello world\n");
    EXPECT_EQ(hash, "3b18e512dba79e4c8300dd08aeb37f8e728b8dad");

    fs::path objPath = store.getObjectPath(hash);
    EXPECT_TRUE(fs::exists(objPath));
    EXPECT_EQ(objPath.parent_path().filename().string(), "3b");
}

// Test: Read back a blob
TEST_F(ObjectStoreTest, ReadBlobRoundTrip) {
    ObjectStore store(tempDir / "objects");
    std::string content("binary\0data\n", 12);
    std::string hash = store.writeBlob(content);

    EXPECT_TRUE(store.contains(hash));
    EXPECT_EQ(store.readBlob(hash), content);
    EXPECT_EQ(store.readObject(hash).type, ObjectType::Blob);
}

// Test: Trees are written in git order and parsed with octal modes
TEST_F(ObjectStoreTest, WriteTreeSortsLikeGit) {
    ObjectStore store(tempDir / "objects");
    std::string blob = store.writeBlob("x");
    std::string sub = store.writeTree({TreeEntry{Constants::MODE_FILE, "inner.txt", blob}});

    // "a.txt" < "a/" (dir sorts as "a/") < "a0"
    std::string root = store.writeTree({
        TreeEntry{Constants::MODE_FILE, "a0", blob},
        TreeEntry{Constants::MODE_DIR, "a", sub},
        TreeEntry{Constants::MODE_EXECUTABLE, "a.txt", blob},
    });

    auto entries = store.readTree(root);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "a.txt");
    EXPECT_EQ(entries[0].mode, Constants::MODE_EXECUTABLE);
    EXPECT_TRUE(entries[0].isBlob());
    EXPECT_EQ(entries[1].name, "a");
    EXPECT_TRUE(entries[1].isTree());
    EXPECT_EQ(entries[1].hashHex, sub);
    EXPECT_EQ(entries[2].name, "a0");
}

// Test: Commit headers, multiple parents and the message
TEST_F(ObjectStoreTest, ParseCommit) {
    std::string payload =
        "tree 0000000000000000000000000000000000000001\n"
        "parent 0000000000000000000000000000000000000002\n"
        "parent 0000000000000000000000000000000000000003\n"
        "author Jane Doe <jane@example.com> 1700000000 +0100\n"
        "committer Bot <bot@example.com> 1700000100 -0800\n"
        "gpgsig -----BEGIN PGP SIGNATURE-----\n"
        " abc\n"
        " -----END PGP SIGNATURE-----\n"
        "\n"
        "feat: subject\n\nbody line\n";

    CommitObject commit = ObjectStore::parseCommit("c0ffee", payload);
    EXPECT_EQ(commit.treeHash, "0000000000000000000000000000000000000001");
    ASSERT_EQ(commit.parentHashes.size(), 2u);
    ASSERT_NE(commit.firstParent(), nullptr);
    EXPECT_EQ(*commit.firstParent(), "0000000000000000000000000000000000000002");
    EXPECT_EQ(commit.authorName, "Jane Doe");
    EXPECT_EQ(commit.authorEmail, "jane@example.com");
    EXPECT_EQ(commit.authorTimestamp, 1700000000);
    EXPECT_EQ(commit.authorTimezone, "+0100");
    EXPECT_EQ(commit.committerName, "Bot");
    EXPECT_EQ(commit.committerTimestamp, 1700000100);
    EXPECT_EQ(commit.message, "feat: subject\n\nbody line\n");
    EXPECT_EQ(commit.shortMessage(), "feat: subject");
}

TEST_F(ObjectStoreTest, CommitWithoutTreeIsCorrupt) {
    try {
        ObjectStore::parseCommit("c0ffee", "author A <a@b> 1 +0000\n\nmsg");
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CorruptObject);
    }
}

// Test: Missing objects and wrong types
TEST_F(ObjectStoreTest, ReadErrorsCarryCodes) {
    ObjectStore store(tempDir / "objects");
    std::string blob = store.writeBlob("content");

    try {
        store.readBlob("1111111111111111111111111111111111111111");
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ObjectNotFound);
    }

    try {
        store.readTree(blob);
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CorruptObject);
    }

    EXPECT_THROW(store.readObject("not-a-hash"), ObjectStoreError);
    EXPECT_FALSE(store.contains("not-a-hash"));
}

// Test: A loose object whose header lies about its size
TEST_F(ObjectStoreTest, SizeMismatchIsCorrupt) {
    ObjectStore store(tempDir / "objects");
    std::string fakeId = "2222222222222222222222222222222222222222";
    std::string raw("blob 99\0short", 13);
    createFile(tempDir / "objects", fakeId.substr(0, 2) + "/" + fakeId.substr(2), zlib::compress(raw));

    try {
        store.readBlob(fakeId);
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CorruptObject);
    }
}

// Test: Gitlink entries are recognised
TEST_F(ObjectStoreTest, GitlinkEntry) {
    ObjectStore store(tempDir / "objects");
    std::string root = store.writeTree({
        TreeEntry{Constants::MODE_GITLINK, "vendor", "3333333333333333333333333333333333333333"},
    });
    auto entries = store.readTree(root);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].isGitlink());
    EXPECT_FALSE(entries[0].isTree());
    EXPECT_FALSE(entries[0].isBlob());
}

// Test: A tree entry whose id is cut short is rejected, exact length accepted
TEST_F(ObjectStoreTest, TruncatedTreeEntryIsCorrupt) {
    std::string header("100644 a\0", 9);

    auto entries = ObjectStore::parseTree(header + std::string(20, '\x11'), 20);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].hashHex, std::string(40, '1'));

    try {
        ObjectStore::parseTree(header + std::string(19, '\x11'), 20);
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CorruptObject);
    }
}
