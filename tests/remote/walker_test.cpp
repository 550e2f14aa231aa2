#include "dsync/remote/walker.hpp"

#include "support/fake_drive.hpp"

#include <gtest/gtest.h>

using dsync::ErrorKind;
using dsync::remote::RemoteWalker;
using dsync::remote::join_remote_path;
using dsync::testing::FakeDrive;

namespace {

std::vector<std::string> paths_of(const std::vector<dsync::metadata::RemoteFileRecord>& records) {
    std::vector<std::string> paths;
    for (const auto& record : records) {
        paths.push_back(record.path);
    }
    return paths;
}

} // namespace

TEST(RemoteWalkerTest, FlattensTreeDepthFirst) {
    FakeDrive drive;
    drive.add_file("f1", "top.txt", "root", "1");
    drive.add_folder("d1", "photos", "root");
    drive.add_file("f2", "a.png", "d1", "22");
    drive.add_folder("d2", "2024", "d1");
    drive.add_file("f3", "b.png", "d2", "333");
    drive.add_file("f4", "last.txt", "root", "4444");

    RemoteWalker walker(drive);
    auto walked = walker.walk("root");
    ASSERT_TRUE(walked.is_ok());
    EXPECT_EQ(paths_of(walked.value()),
              (std::vector<std::string>{"top.txt", "photos/a.png", "photos/2024/b.png", "last.txt"}));
    EXPECT_EQ(walker.folders_visited(), 3u);
    EXPECT_EQ(walked.value()[2].size, 3u);
}

TEST(RemoteWalkerTest, FollowsPageTokens) {
    FakeDrive drive;
    drive.set_page_size(2);
    for (int i = 0; i < 5; ++i) {
        drive.add_file("f" + std::to_string(i), "file" + std::to_string(i), "root", "x");
    }

    RemoteWalker walker(drive);
    auto walked = walker.walk("root");
    ASSERT_TRUE(walked.is_ok());
    EXPECT_EQ(walked.value().size(), 5u);
    EXPECT_EQ(drive.list_calls(), 3u);
}

TEST(RemoteWalkerTest, EmptyFolderYieldsNothing) {
    FakeDrive drive;
    drive.add_folder("d1", "empty", "root");

    RemoteWalker walker(drive);
    auto walked = walker.walk("root");
    ASSERT_TRUE(walked.is_ok());
    EXPECT_TRUE(walked.value().empty());
}

TEST(RemoteWalkerTest, SkipsUnsafeNamesAndCycles) {
    FakeDrive drive;
    drive.add_file("f1", "..", "root", "x");
    drive.add_file("f2", "a/b", "root", "x");
    drive.add_file("f3", "", "root", "x");
    drive.add_folder("d1", "loop", "root");
    drive.add_folder("root", "back", "d1");
    drive.add_file("f4", "ok.txt", "d1", "x");

    RemoteWalker walker(drive);
    auto walked = walker.walk("root");
    ASSERT_TRUE(walked.is_ok());
    EXPECT_EQ(paths_of(walked.value()), std::vector<std::string>{"loop/ok.txt"});
}

TEST(RemoteWalkerTest, ListingFailureKeepsKindAndNamesFolder) {
    FakeDrive drive;
    drive.add_folder("d1", "private", "root");
    drive.fail_listing("d1", dsync::Error{ErrorKind::Authentication, "HTTP 401"});

    RemoteWalker walker(drive);
    auto walked = walker.walk("root");
    ASSERT_TRUE(walked.is_error());
    EXPECT_EQ(walked.error().kind, ErrorKind::Authentication);
    EXPECT_NE(walked.error().message.find("private"), std::string::npos);
}

TEST(RemoteWalkerTest, JoinsPaths) {
    EXPECT_EQ(join_remote_path("", "a"), "a");
    EXPECT_EQ(join_remote_path("a/b", "c"), "a/b/c");
}
