#include "../../common/test_helpers.h"
#include <gtest/gtest.h>
#include <chatmine/storage/safe_reader.h>

#include <cstdlib>

using namespace chatmine;
using namespace chatmine::storage;
using namespace chatmine::test;

class SafeReaderTest : public ChatmineTest {
protected:
    fs::path tmpRoot;
    fs::path dbPath;

    void SetUp() override {
        ChatmineTest::SetUp();
        tmpRoot = tempDir / "tmp";
        fs::create_directories(tmpRoot);
        ::setenv("CHATMINE_TMPDIR", tmpRoot.c_str(), 1);
        dbPath = tempDir / "User" / "globalStorage" / "state.vscdb";
    }

    void TearDown() override {
        ::unsetenv("CHATMINE_TMPDIR");
        ChatmineTest::TearDown();
    }

    size_t leftoverTempDirs() const {
        size_t n = 0;
        for ([[maybe_unused]] const auto& entry : fs::directory_iterator(tmpRoot)) {
            ++n;
        }
        return n;
    }

    static std::string readBytes(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), {});
    }
};

TEST_F(SafeReaderTest, ReadsEntriesFromPrivateCopy) {
    make_item_db(dbPath, {{"composerData:a", "{}"}, {"composerData:b", "{}"}, {"other", "1"}});

    SafeReader reader(dbPath);
    ASSERT_TRUE(reader.open());
    EXPECT_TRUE(reader.isOpen());
    EXPECT_EQ(reader.tempDirectory().parent_path(), tmpRoot);
    EXPECT_EQ(reader.tempDirectory().filename().string().rfind("chatmine-db-", 0), 0u);

    auto all = reader.getAllEntries();
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value().size(), 3u);

    auto composer = reader.getEntriesByPrefix("composerData:%");
    ASSERT_TRUE(composer);
    EXPECT_EQ(composer.value().size(), 2u);

    auto keyed = reader.getEntriesByKeys({"other", "missing"});
    ASSERT_TRUE(keyed);
    ASSERT_EQ(keyed.value().size(), 1u);
    EXPECT_EQ(keyed.value()[0].value, "1");

    auto none = reader.getEntriesByKeys({});
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}

TEST_F(SafeReaderTest, NullValuesAreExcluded) {
    ItemTableWriter writer(dbPath);
    writer.put("a", "1");
    writer.putNull("b");
    writer.close();

    SafeReader reader(dbPath);
    ASSERT_TRUE(reader.open());
    auto all = reader.getAllEntries();
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].key, "a");
}

TEST_F(SafeReaderTest, SeesRowsThatOnlyExistInTheWriteAheadLog) {
    ItemTableWriter writer(dbPath, /*wal=*/true);
    writer.put("composerData:live", "{\"x\":1}");
    ASSERT_TRUE(fs::exists(dbPath.string() + "-wal"));

    const std::string mainBefore = readBytes(dbPath);
    const std::string walBefore = readBytes(dbPath.string() + "-wal");

    {
        SafeReader reader(dbPath);
        ASSERT_TRUE(reader.open());
        auto rows = reader.getEntriesByPrefix("composerData:%");
        ASSERT_TRUE(rows);
        ASSERT_EQ(rows.value().size(), 1u);
        EXPECT_EQ(rows.value()[0].key, "composerData:live");
    }

    // The live database and its log are left exactly as they were
    EXPECT_EQ(readBytes(dbPath), mainBefore);
    EXPECT_EQ(readBytes(dbPath.string() + "-wal"), walBefore);

    // The host can keep writing while and after we read
    writer.put("composerData:later", "{}");
    writer.close();
}

TEST_F(SafeReaderTest, CloseRemovesTempDirectoryAndIsIdempotent) {
    make_item_db(dbPath, {{"k", "v"}});

    SafeReader reader(dbPath);
    ASSERT_TRUE(reader.open());
    const auto dir = reader.tempDirectory();
    ASSERT_TRUE(fs::exists(dir));

    reader.close();
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_FALSE(reader.isOpen());
    reader.close();
    EXPECT_EQ(leftoverTempDirs(), 0u);
}

TEST_F(SafeReaderTest, DestructorCleansUp) {
    make_item_db(dbPath, {{"k", "v"}});
    fs::path dir;
    {
        SafeReader reader(dbPath);
        ASSERT_TRUE(reader.open());
        dir = reader.tempDirectory();
    }
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(SafeReaderTest, MissingFileFailsToOpenWithoutLeftovers) {
    SafeReader reader(tempDir / "nope" / "state.vscdb");
    auto opened = reader.open();
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code, ErrorCode::DatabaseOpenFailed);
    EXPECT_EQ(leftoverTempDirs(), 0u);
}

TEST_F(SafeReaderTest, GarbageFileFailsToOpenWithoutLeftovers) {
    write_file(dbPath, std::string(4096, 'z'));
    SafeReader reader(dbPath);
    auto opened = reader.open();
    ASSERT_FALSE(opened);
    EXPECT_EQ(opened.error().code, ErrorCode::DatabaseOpenFailed);
    EXPECT_FALSE(reader.isOpen());
    EXPECT_EQ(leftoverTempDirs(), 0u);
}

TEST_F(SafeReaderTest, SecondOpenIsRejected) {
    make_item_db(dbPath, {{"k", "v"}});
    SafeReader reader(dbPath);
    ASSERT_TRUE(reader.open());
    auto again = reader.open();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST_F(SafeReaderTest, MissingTableIsAQueryError) {
    fs::create_directories(dbPath.parent_path());
    {
        Database db;
        ASSERT_TRUE(db.open(dbPath.string(), ConnectionMode::Create));
        ASSERT_TRUE(db.execute("CREATE TABLE Unrelated (x INTEGER)"));
    }
    SafeReader reader(dbPath);
    ASSERT_TRUE(reader.open());
    auto rows = reader.getAllEntries();
    ASSERT_FALSE(rows);
    EXPECT_EQ(rows.error().code, ErrorCode::QueryFailed);
}

TEST_F(SafeReaderTest, MetadataDescribesTheCopy) {
    make_item_db(dbPath, {{"k", "v"}});
    SafeReader reader(dbPath);
    ASSERT_TRUE(reader.open());
    auto meta = reader.metadata();
    ASSERT_TRUE(meta);
    EXPECT_NE(std::find(meta.value().tables.begin(), meta.value().tables.end(), "ItemTable"),
              meta.value().tables.end());
    EXPECT_GT(meta.value().sizeBytes, 0);
    EXPECT_EQ(meta.value().originalPath, dbPath);
    EXPECT_EQ(meta.value().tempPath.parent_path(), reader.tempDirectory());
}
