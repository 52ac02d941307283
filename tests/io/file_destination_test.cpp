#include "sconv/io/destination.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using sconv::io::FileDestination;
using sconv::test_support::create_temp_dir;
using sconv::test_support::read_file;
using sconv::test_support::write_file;

namespace {

bool write(FileDestination& destination, const std::string& data, bool final) {
    return destination.write_chunk(reinterpret_cast<const std::uint8_t*>(data.data()), data.size(), final).is_ok();
}

} // namespace

TEST(FileDestinationTest, StagesThenRenamesOnCommit) {
    const auto dir = create_temp_dir("sconv_destination");
    const auto target = dir / "movie.mp4";

    FileDestination destination(target);
    ASSERT_TRUE(destination.open().is_ok());
    ASSERT_TRUE(write(destination, "abc", false));
    ASSERT_TRUE(write(destination, "def", true));

    EXPECT_TRUE(fs::exists(destination.staging_path()));
    EXPECT_FALSE(fs::exists(target));

    auto committed = destination.commit();
    ASSERT_TRUE(committed.is_ok());
    EXPECT_EQ(fs::path(committed.value()), target);
    EXPECT_EQ(read_file(target), "abcdef");
    EXPECT_FALSE(fs::exists(destination.staging_path()));
}

TEST(FileDestinationTest, CommitRequiresFinalChunk) {
    const auto dir = create_temp_dir("sconv_destination");
    FileDestination destination(dir / "movie.mp4");
    ASSERT_TRUE(destination.open().is_ok());
    ASSERT_TRUE(write(destination, "abc", false));

    EXPECT_TRUE(destination.commit().is_error());
}

TEST(FileDestinationTest, RejectsChunksAfterFinal) {
    const auto dir = create_temp_dir("sconv_destination");
    FileDestination destination(dir / "movie.mp4");
    ASSERT_TRUE(destination.open().is_ok());
    ASSERT_TRUE(write(destination, "abc", true));

    EXPECT_FALSE(write(destination, "more", false));
}

TEST(FileDestinationTest, ResetDropsEarlierOutput) {
    const auto dir = create_temp_dir("sconv_destination");
    const auto target = dir / "movie.mp4";

    FileDestination destination(target);
    ASSERT_TRUE(destination.open().is_ok());
    ASSERT_TRUE(write(destination, "partial stream copy", true));

    ASSERT_TRUE(destination.reset().is_ok());
    EXPECT_EQ(destination.bytes_written(), 0u);
    ASSERT_TRUE(write(destination, "reencoded", true));
    ASSERT_TRUE(destination.commit().is_ok());

    EXPECT_EQ(read_file(target), "reencoded");
}

TEST(FileDestinationTest, DiscardLeavesNothingBehind) {
    const auto dir = create_temp_dir("sconv_destination");
    const auto target = dir / "movie.mp4";

    FileDestination destination(target);
    ASSERT_TRUE(destination.open().is_ok());
    ASSERT_TRUE(write(destination, "abc", false));

    destination.discard();
    destination.discard();

    EXPECT_FALSE(fs::exists(destination.staging_path()));
    EXPECT_FALSE(fs::exists(target));
}

TEST(FileDestinationTest, DestructorRemovesUncommittedStaging) {
    const auto dir = create_temp_dir("sconv_destination");
    fs::path staging;
    {
        FileDestination destination(dir / "movie.mp4");
        ASSERT_TRUE(destination.open().is_ok());
        ASSERT_TRUE(write(destination, "abc", false));
        staging = destination.staging_path();
        EXPECT_TRUE(fs::exists(staging));
    }
    EXPECT_FALSE(fs::exists(staging));
}

TEST(FileDestinationTest, ExistingTargetGetsNumberedName) {
    const auto dir = create_temp_dir("sconv_destination");
    const auto target = dir / "movie.mp4";
    write_file(target, "old");
    write_file(dir / "movie (1).mp4", "older");

    FileDestination destination(target);
    ASSERT_TRUE(destination.open().is_ok());
    ASSERT_TRUE(write(destination, "new", true));
    auto committed = destination.commit();
    ASSERT_TRUE(committed.is_ok());

    EXPECT_EQ(fs::path(committed.value()), dir / "movie (2).mp4");
    EXPECT_EQ(read_file(target), "old");
    EXPECT_EQ(read_file(dir / "movie (2).mp4"), "new");
}

TEST(FileDestinationTest, OverwriteReplacesExistingTarget) {
    const auto dir = create_temp_dir("sconv_destination");
    const auto target = dir / "movie.mp4";
    write_file(target, "old");

    FileDestination destination(target, true);
    ASSERT_TRUE(destination.open().is_ok());
    ASSERT_TRUE(write(destination, "new", true));
    ASSERT_TRUE(destination.commit().is_ok());

    EXPECT_EQ(read_file(target), "new");
}

TEST(FileDestinationTest, OpenCreatesMissingParentDirectories) {
    const auto dir = create_temp_dir("sconv_destination");
    const auto target = dir / "nested" / "deeper" / "movie.mp4";

    FileDestination destination(target);
    ASSERT_TRUE(destination.open().is_ok());
    ASSERT_TRUE(write(destination, "x", true));
    ASSERT_TRUE(destination.commit().is_ok());
    EXPECT_TRUE(fs::exists(target));
}
