#include "ferry/upload/classifier.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

using ferry::upload::Classification;
using ferry::upload::FileClassifier;
using ferry::upload::SourceFile;

namespace {

SourceFile file_named(const std::string& relative_path, std::uint64_t size = 10) {
    SourceFile file;
    file.relative_path = relative_path;
    const auto slash = relative_path.find_last_of('/');
    file.name = slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
    file.size = size;
    return file;
}

} // namespace

TEST(FileClassifierTest, MatchesExtensionsCaseInsensitively) {
    FileClassifier classifier;
    EXPECT_TRUE(classifier.is_eligible(file_named("IMG_0001.JPG")));
    EXPECT_TRUE(classifier.is_eligible(file_named("a.Jpeg")));
    EXPECT_TRUE(classifier.is_eligible(file_named("scan.webp")));
    EXPECT_FALSE(classifier.is_eligible(file_named("notes.txt")));
    EXPECT_FALSE(classifier.is_eligible(file_named("jpg")));
    EXPECT_FALSE(classifier.is_eligible(file_named("archive.jpg.zip")));
}

TEST(FileClassifierTest, SplitsSelectionAndTotalsEligibleBytes) {
    FileClassifier classifier;
    const Classification result = classifier.classify({
        file_named("trip/cam1/a.jpg", 100),
        file_named("trip/cam1/notes.txt", 7),
        file_named("trip/cam2/b.png", 50),
        file_named("trip/.DS_Store", 3),
    });

    EXPECT_EQ(result.eligible_count(), 2u);
    EXPECT_EQ(result.ignored_count(), 2u);
    EXPECT_EQ(result.eligible_bytes, 150u);
    EXPECT_EQ(result.top_level_folder_name, "trip");
    EXPECT_FALSE(result.empty());
}

TEST(FileClassifierTest, EmptyWhenNothingEligible) {
    FileClassifier classifier;
    const auto result = classifier.classify({file_named("readme.md"), file_named("data.csv")});
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(result.ignored_count(), 2u);
    EXPECT_EQ(result.top_level_folder_name, "");
}

TEST(FileClassifierTest, CustomExtensionsAreNormalized) {
    FileClassifier classifier({"TIF", ".Raw", ""});
    EXPECT_EQ(classifier.allowed_extensions(), (std::vector<std::string>{".tif", ".raw"}));
    EXPECT_TRUE(classifier.is_eligible(file_named("x.tif")));
    EXPECT_FALSE(classifier.is_eligible(file_named("x.jpg")));
}

TEST(ClassifierHelpersTest, TopFolderName) {
    EXPECT_EQ(ferry::upload::extract_top_folder_name("trip/cam1/a.jpg"), "trip");
    EXPECT_EQ(ferry::upload::extract_top_folder_name("a.jpg"), "");
    EXPECT_EQ(ferry::upload::extract_top_folder_name(""), "");
}

TEST(ClassifierHelpersTest, MimeTypes) {
    EXPECT_EQ(ferry::upload::mime_type_for("a.JPG"), "image/jpeg");
    EXPECT_EQ(ferry::upload::mime_type_for("a.png"), "image/png");
    EXPECT_EQ(ferry::upload::mime_type_for("a.svg"), "image/svg+xml");
    EXPECT_EQ(ferry::upload::mime_type_for("Makefile"), "application/octet-stream");
}

TEST(ClassifierHelpersTest, FormatsSizes) {
    EXPECT_EQ(ferry::upload::format_file_size(0), "0 Bytes");
    EXPECT_EQ(ferry::upload::format_file_size(512), "512 Bytes");
    EXPECT_EQ(ferry::upload::format_file_size(1536), "1.5 KB");
    EXPECT_EQ(ferry::upload::format_file_size(1048576), "1 MB");
    EXPECT_EQ(ferry::upload::format_file_size(1572864, 0), "2 MB");
}

TEST(ScanDirectoryTest, ListsFilesBelowRootWithFolderPrefix) {
    const auto dir = ferry::testing::create_temp_dir("scan");
    ferry::testing::write_file(dir / "survey" / "b.jpg", "bb");
    ferry::testing::write_file(dir / "survey" / "day1" / "a.png", "a");
    ferry::testing::write_file(dir / "survey" / "notes.txt", "n");

    auto scanned = ferry::upload::scan_directory(dir / "survey");
    ASSERT_TRUE(scanned.is_ok()) << scanned.error();

    const auto& files = scanned.value();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].relative_path, "survey/b.jpg");
    EXPECT_EQ(files[0].size, 2u);
    EXPECT_EQ(files[0].mime_type, "image/jpeg");
    EXPECT_EQ(files[1].relative_path, "survey/day1/a.png");
    EXPECT_EQ(files[1].name, "a.png");
    EXPECT_EQ(files[2].relative_path, "survey/notes.txt");

    const auto classified = FileClassifier().classify(files);
    EXPECT_EQ(classified.top_level_folder_name, "survey");
    EXPECT_EQ(classified.eligible_count(), 2u);
}

TEST(ScanDirectoryTest, RejectsMissingDirectory) {
    const auto dir = ferry::testing::create_temp_dir("scan_missing");
    EXPECT_TRUE(ferry::upload::scan_directory(dir / "absent").is_error());
    ferry::testing::write_file(dir / "file.jpg", "x");
    EXPECT_TRUE(ferry::upload::scan_directory(dir / "file.jpg").is_error());
}
