#include <gtest/gtest.h>

#include "apg/archive_path_policy.hpp"
#include "testing.hpp"

#include <filesystem>
#include <string>

namespace apg {
namespace {

namespace fs = std::filesystem;

TEST(ArchivePathPolicyTest, CleansSafeEntryName) {
    std::string out;

    auto res = ArchivePathPolicy::SanitizeEntryName("./dir//./file.txt", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "dir/file.txt");

    res = ArchivePathPolicy::SanitizeEntryName("data/", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "data");
}

TEST(ArchivePathPolicyTest, ArchiveRootCleansToEmpty) {
    std::string out = "stale";
    auto res = ArchivePathPolicy::SanitizeEntryName("./", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(out.empty());
}

TEST(ArchivePathPolicyTest, RejectsParentSegmentInAnyPosition) {
    const char* names[] = {
        "..",
        "../escape.txt",
        "a/../b",
        "a/b/..",
        "./../x",
        "data/../../etc/passwd",
        "a//..//b",
    };
    for (const char* name : names) {
        std::string out;
        auto res = ArchivePathPolicy::SanitizeEntryName(name, out);
        ASSERT_FALSE(res.is_ok()) << name;
        EXPECT_EQ(res.kind, ErrorKind::PathSecurity) << name;
        EXPECT_NE(res.msg.find("path traversal"), std::string::npos) << res.msg;
        EXPECT_TRUE(out.empty());
    }
}

TEST(ArchivePathPolicyTest, DotDotInsideSegmentIsAllowed) {
    std::string out;
    auto res = ArchivePathPolicy::SanitizeEntryName("data/..hidden/file..txt", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "data/..hidden/file..txt");
}

TEST(ArchivePathPolicyTest, RejectsAbsolutePath) {
    std::string out;
    auto res = ArchivePathPolicy::SanitizeEntryName("/etc/passwd", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::PathSecurity);
    EXPECT_NE(res.msg.find("absolute path"), std::string::npos);

    res = ArchivePathPolicy::SanitizeEntryName("//tmp/x", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::PathSecurity);
}

TEST(ArchivePathPolicyTest, RejectsBackslash) {
    std::string out;
    auto res = ArchivePathPolicy::SanitizeEntryName("data\\..\\..\\evil", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::PathSecurity);
}

TEST(ArchivePathPolicyTest, EnforcesMaximumLength) {
    std::string out;
    const std::string at_limit(ArchivePathPolicy::kMaxNameLength, 'a');
    EXPECT_TRUE(ArchivePathPolicy::SanitizeEntryName(at_limit, out).is_ok());

    const std::string too_long(ArchivePathPolicy::kMaxNameLength + 1, 'a');
    auto res = ArchivePathPolicy::SanitizeEntryName(too_long, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::PathSecurity);
    EXPECT_NE(res.msg.find("Path too long"), std::string::npos);
}

TEST(ArchivePathPolicyTest, RejectsEmbeddedNul) {
    std::string out;
    const std::string name("data/a\0b", 8);
    auto res = ArchivePathPolicy::SanitizeEntryName(name, out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::PathSecurity);
    EXPECT_NE(res.msg.find("null byte"), std::string::npos);
}

TEST(ArchivePathPolicyTest, ResolvesInsideRoot) {
    testutil::TemporaryDirectory temp;
    const fs::path root = fs::canonical(temp.Path());
    ArchivePathPolicy policy(root);

    SanitizedTarget target;
    auto res = policy.Resolve("./data/usr/bin/hello", target);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(target.relative, "data/usr/bin/hello");
    EXPECT_EQ(target.absolute, root / "data" / "usr" / "bin" / "hello");
}

TEST(ArchivePathPolicyTest, ContainmentGuardCatchesSymlinkedAncestor) {
    testutil::TemporaryDirectory temp;
    const fs::path base = fs::canonical(temp.Path());
    const fs::path root = base / "root";
    const fs::path outside = base / "outside";
    fs::create_directories(root);
    fs::create_directories(outside);
    fs::create_directory_symlink(outside, root / "data");

    ArchivePathPolicy policy(root);
    SanitizedTarget target;
    auto res = policy.Resolve("data/payload", target);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::PathSecurity);
    EXPECT_NE(res.msg.find("outside destination"), std::string::npos);
}

TEST(ArchivePathPolicyTest, IsWithinComparesWholeComponents) {
    EXPECT_TRUE(ArchivePathPolicy::IsWithin("/tmp/root", "/tmp/root"));
    EXPECT_TRUE(ArchivePathPolicy::IsWithin("/tmp/root", "/tmp/root/a/b"));
    EXPECT_FALSE(ArchivePathPolicy::IsWithin("/tmp/root", "/tmp/root2/a"));
    EXPECT_FALSE(ArchivePathPolicy::IsWithin("/tmp/root", "/tmp"));
    EXPECT_TRUE(ArchivePathPolicy::IsWithin("/tmp/root/", "/tmp/root/a"));
}

} // namespace
} // namespace apg
