#include <gtest/gtest.h>
#include "bulk/Checkpoint.hpp"
#include "TestUtil.hpp"

#include <limits>

using testutil::ScratchDir;
using testutil::write_file;

class CheckpointTest : public ::testing::Test {
protected:
    ScratchDir dir_;
    std::filesystem::path file_ = dir_.path() / "user.json";
};

TEST_F(CheckpointTest, LatestIdIsTheMaximumNotTheLastLine) {
    write_file(file_, "{\"id\":3,\"text\":\"a\"}\n{\"id\":7,\"text\":\"b\"}\n{\"id\":5,\"text\":\"c\"}\n");
    auto id = bulk::latest_id(file_);
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, 7);
}

TEST_F(CheckpointTest, LargeTweetIdsSurvive) {
    write_file(file_, "{\"id\":1050118621198921728}\n{\"id\":1050118621198921700}\n");
    EXPECT_EQ(bulk::latest_id(file_).value(), 1050118621198921728LL);
}

TEST_F(CheckpointTest, IdsBeyondInt64AreRejected) {
    write_file(file_, "{\"id\":5}\n{\"id\":18446744073709551615}\n");
    try {
        bulk::latest_id(file_);
        FAIL() << "expected MalformedRecordError";
    } catch (const bulk::MalformedRecordError& e) {
        EXPECT_EQ(e.line(), 2u);
        EXPECT_NE(std::string(e.what()).find("out of range"), std::string::npos);
    }

    write_file(file_, "{\"id\":9223372036854775807}\n");
    EXPECT_EQ(bulk::latest_id(file_).value(), std::numeric_limits<int64_t>::max());
}

TEST_F(CheckpointTest, EmptyFileHasNoCheckpoint) {
    write_file(file_, "");
    EXPECT_FALSE(bulk::latest_id(file_).has_value());
}

TEST_F(CheckpointTest, BlankLinesAreIgnored) {
    write_file(file_, "\n{\"id\":2}\n   \n{\"id\":1}\n\n");
    EXPECT_EQ(bulk::latest_id(file_).value(), 2);
}

TEST_F(CheckpointTest, TruncatedLineReportsItsLineNumber) {
    write_file(file_, "{\"id\":2}\n{\"id\":9, \"text\":\"cut off\n");
    try {
        bulk::latest_id(file_);
        FAIL() << "expected MalformedRecordError";
    } catch (const bulk::MalformedRecordError& e) {
        EXPECT_EQ(e.line(), 2u);
        EXPECT_EQ(e.path(), file_.string());
    }
}

TEST_F(CheckpointTest, RecordsWithoutIntegerIdAreMalformed) {
    write_file(file_, "{\"id\":\"12\"}\n");
    EXPECT_THROW(bulk::latest_id(file_), bulk::MalformedRecordError);

    write_file(file_, "{\"text\":\"no id\"}\n");
    EXPECT_THROW(bulk::latest_id(file_), bulk::MalformedRecordError);

    write_file(file_, "12345\n");
    EXPECT_THROW(bulk::latest_id(file_), bulk::MalformedRecordError);
}

TEST_F(CheckpointTest, MissingFileIsAFilesystemError) {
    EXPECT_THROW(bulk::latest_id(dir_.path() / "nope.json"), std::runtime_error);
}
