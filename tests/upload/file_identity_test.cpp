#include "ferry/upload/file_identity.hpp"

#include <gtest/gtest.h>

using ferry::upload::FileRecord;
using ferry::upload::FileStatus;
using ferry::upload::MatchKind;
using ferry::upload::resolve_file_identity;

namespace {

FileRecord record(const std::string& name, const std::string& path, const std::string& relative_path,
                  FileStatus status = FileStatus::Pending) {
    FileRecord r;
    r.name = name;
    r.path = path;
    r.relative_path = relative_path;
    r.status = status;
    return r;
}

} // namespace

TEST(FileIdentityTest, ExactPathWins) {
    const std::vector<FileRecord> records{
        record("a.jpg", "trip/cam2/a.jpg", "cam2/a.jpg"),
        record("a.jpg", "trip/cam1/a.jpg", "cam1/a.jpg"),
    };

    auto match = resolve_file_identity(records, "trip/cam1/a.jpg", FileStatus::Complete);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->index, 1u);
    EXPECT_EQ(match->kind, MatchKind::ExactPath);

    auto by_relative = resolve_file_identity(records, "cam2/a.jpg", FileStatus::Complete);
    ASSERT_TRUE(by_relative.has_value());
    EXPECT_EQ(by_relative->index, 0u);
    EXPECT_EQ(by_relative->kind, MatchKind::ExactPath);
}

TEST(FileIdentityTest, FallsBackToNameForFlatSelections) {
    const std::vector<FileRecord> records{
        record("b.jpg", "b.jpg", "b.jpg"),
        record("c.jpg", "c.jpg", "c.jpg"),
    };

    auto match = resolve_file_identity(records, "c.jpg", FileStatus::Complete);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->index, 1u);

    auto with_folder = resolve_file_identity(records, "upload/b.jpg", FileStatus::Complete);
    ASSERT_TRUE(with_folder.has_value());
    EXPECT_EQ(with_folder->index, 0u);
    EXPECT_EQ(with_folder->kind, MatchKind::ExactName);
}

TEST(FileIdentityTest, SuffixMatchOnDirectoryBoundary) {
    const std::vector<FileRecord> records{
        record("a.jpg", "trip/cam1/a.jpg", ""),
    };

    auto longer = resolve_file_identity(records, "/mnt/card/trip/cam1/a.jpg", FileStatus::Complete);
    ASSERT_TRUE(longer.has_value());
    EXPECT_EQ(longer->kind, MatchKind::PathSuffix);

    EXPECT_FALSE(resolve_file_identity(records, "xtrip/cam1/a.jpg", FileStatus::Complete).has_value());
    EXPECT_FALSE(resolve_file_identity(records, "", FileStatus::Complete).has_value());
    EXPECT_FALSE(resolve_file_identity(records, "other.jpg", FileStatus::Complete).has_value());
}

TEST(FileIdentityTest, PrefersRecordNotYetInTargetStatus) {
    const std::vector<FileRecord> records{
        record("a.jpg", "a.jpg", "a.jpg", FileStatus::Complete),
        record("a.jpg", "a.jpg", "a.jpg", FileStatus::Pending),
    };

    auto match = resolve_file_identity(records, "a.jpg", FileStatus::Complete);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->index, 1u);

    auto to_pending = resolve_file_identity(records, "a.jpg", FileStatus::Pending);
    ASSERT_TRUE(to_pending.has_value());
    EXPECT_EQ(to_pending->index, 0u);
}

TEST(FileIdentityTest, HigherTierBeatsPendingPreference) {
    const std::vector<FileRecord> records{
        record("a.jpg", "trip/a.jpg", "a.jpg", FileStatus::Complete),
        record("a.jpg", "a.jpg", "", FileStatus::Pending),
    };

    // Exact path on a completed record still outranks a name match
    auto match = resolve_file_identity(records, "trip/a.jpg", FileStatus::Complete);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->index, 0u);
    EXPECT_EQ(match->kind, MatchKind::ExactPath);
}
