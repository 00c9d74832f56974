#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/ObjectStore.hpp"
#include "core/PackFile.hpp"

namespace fs = std::filesystem;

using namespace gitpulse;
using namespace gitpulse::test::utils;

class PackFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        objectsDir = tempDir / "objects";
        packDir = objectsDir / "pack";
        fs::create_directories(packDir);
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path objectsDir;
    fs::path packDir;
};

// Test: Whole objects are found through the index
TEST_F(PackFileTest, ReadsWholeObjects) {
    PackBuilder builder;
    std::string a = builder.add(ObjectType::Blob, "first blob\n");
    std::string b = builder.add(ObjectType::Blob, std::string(5000, 'z'));
    fs::path idx = builder.write(packDir);

    auto pack = PackFile::open(idx, 20);
    EXPECT_EQ(pack->objectCount(), 2u);
    EXPECT_TRUE(pack->contains(a));
    EXPECT_FALSE(pack->contains("4444444444444444444444444444444444444444"));

    ObjectStore store(objectsDir);
    EXPECT_EQ(store.packCount(), 1u);
    EXPECT_EQ(store.readBlob(a), "first blob\n");
    EXPECT_EQ(store.readBlob(b), std::string(5000, 'z'));
}

// Test: OFS_DELTA chains resolve inside the pack
TEST_F(PackFileTest, ResolvesOffsetDeltaChain) {
    std::string v1 = "line one\nline two\n";
    std::string v2 = v1 + "line three\n";
    std::string v3 = v2 + "line four\n";

    PackBuilder builder;
    std::string id1 = builder.add(ObjectType::Blob, v1);
    std::string id2 = builder.addOfsDelta(id1, v2);
    std::string id3 = builder.addOfsDelta(id2, v3);
    builder.write(packDir);

    ObjectStore store(objectsDir);
    EXPECT_EQ(store.readBlob(id3), v3);
    EXPECT_EQ(store.readBlob(id2), v2);
    EXPECT_EQ(id3, PackBuilder::objectId(ObjectType::Blob, v3));
}

// Test: REF_DELTA whose base is a loose object
TEST_F(PackFileTest, ResolvesRefDeltaAgainstLooseBase) {
    std::string base = "shared prefix\nold tail\n";
    std::string target = "shared prefix\nnew tail\n";

    std::string baseId;
    {
        ObjectStore loose(objectsDir);
        baseId = loose.writeBlob(base);
    }

    PackBuilder builder;
    std::string targetId = builder.addRefDelta(baseId, ObjectType::Blob, base, target);
    builder.write(packDir);

    ObjectStore store(objectsDir);
    EXPECT_EQ(store.readBlob(targetId), target);
}

// Test: REF_DELTA whose base lives in another pack
TEST_F(PackFileTest, ResolvesRefDeltaAcrossPacks) {
    std::string base = "tree-ish content that is long enough to copy\n";
    std::string target = base + "appended\n";

    PackBuilder first;
    std::string baseId = first.add(ObjectType::Blob, base);
    first.write(packDir, "a");

    PackBuilder second;
    std::string targetId = second.addRefDelta(baseId, ObjectType::Blob, base, target);
    second.write(packDir, "b");

    ObjectStore store(objectsDir);
    EXPECT_EQ(store.packCount(), 2u);
    EXPECT_EQ(store.readBlob(targetId), target);
}

// Test: Missing REF_DELTA base surfaces as ObjectNotFound
TEST_F(PackFileTest, MissingRefDeltaBase) {
    std::string base = "never stored\n";
    PackBuilder builder;
    std::string targetId = builder.addRefDelta(PackBuilder::objectId(ObjectType::Blob, base), ObjectType::Blob,
                                               base, base + "more\n");
    builder.write(packDir);

    ObjectStore store(objectsDir);
    try {
        store.readBlob(targetId);
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ObjectNotFound);
    }
}

// Test: Delta application, including copy and insert commands
TEST_F(PackFileTest, ApplyDelta) {
    std::string base = "The quick brown fox";
    std::string target = "The quick red fox jumps";
    EXPECT_EQ(PackFile::applyDelta(base, PackBuilder::makeDelta(base, target)), target);
    EXPECT_EQ(PackFile::applyDelta(base, PackBuilder::makeDelta(base, "")), "");
}

TEST_F(PackFileTest, ApplyDeltaRejectsWrongSourceSize) {
    std::string delta = PackBuilder::makeDelta("abc", "abcd");
    EXPECT_THROW(PackFile::applyDelta("abcdef", delta), ObjectStoreError);
}

TEST_F(PackFileTest, ApplyDeltaRejectsReservedOpcode) {
    // source size 1, target size 1, opcode 0
    std::string delta("\x01\x01\x00", 3);
    EXPECT_THROW(PackFile::applyDelta("a", delta), ObjectStoreError);
}

// Test: Malformed index
TEST_F(PackFileTest, CorruptIndexIsRejected) {
    PackBuilder builder;
    builder.add(ObjectType::Blob, "x");
    fs::path idx = builder.write(packDir);

    std::string bytes = readFile(idx);
    bytes[0] = 'X';
    createFile(packDir, idx.filename().string(), bytes);

    try {
        PackFile::open(idx, 20);
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CorruptObject);
    }
}

TEST_F(PackFileTest, PackWithoutIndexPartnerFails) {
    PackBuilder builder;
    builder.add(ObjectType::Blob, "x");
    fs::path idx = builder.write(packDir);
    fs::remove(fs::path(idx).replace_extension(".pack"));

    try {
        PackFile::open(idx, 20);
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::IoError);
    }
}
