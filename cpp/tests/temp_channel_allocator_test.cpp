#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "temp_channel_allocator.hpp"

using namespace psrelay::core;

namespace fs = std::filesystem;

namespace
{

    fs::path makeTempDir(const std::string& name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        fs::path dir = fs::temp_directory_path() / ("psrelay_channel_test_" + name + "_" + std::to_string(now));
        fs::create_directories(dir);
        return dir;
    }

    void cleanupTemp(const fs::path& root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    bool isEmptyDir(const fs::path& dir)
    {
        return fs::is_empty(dir);
    }

} // namespace

TEST(TempChannelAllocator, CreatesUniqueEmptyFilesWithKindSuffix)
{
    const fs::path dir = makeTempDir("unique");
    {
        TempChannelAllocator alloc(dir);
        std::set<fs::path> seen;
        for (auto kind : {ChannelKind::Stdout, ChannelKind::Stderr, ChannelKind::ExitStatus,
                          ChannelKind::Stdout, ChannelKind::Stdout})
        {
            auto p = alloc.allocate(kind);
            ASSERT_TRUE(p.has_value());
            EXPECT_TRUE(fs::exists(*p));
            EXPECT_EQ(fs::file_size(*p), 0u);
            EXPECT_EQ(p->parent_path(), dir);
            EXPECT_TRUE(seen.insert(*p).second);
        }
        EXPECT_EQ(alloc.live().size(), 5u);
        EXPECT_EQ(alloc.allocate(ChannelKind::Stderr)->extension(), ".err");
        EXPECT_EQ(alloc.allocate(ChannelKind::ExitStatus)->extension(), ".rc");
    }
    EXPECT_TRUE(isEmptyDir(dir));
    cleanupTemp(dir);
}

TEST(TempChannelAllocator, ScriptChannelHoldsNativeBytes)
{
    const fs::path dir = makeTempDir("script");
    TempChannelAllocator alloc(dir);

    auto utf8 = alloc.allocate_script("Write-Output 1", TextEncoding::Utf8NoBom);
    ASSERT_TRUE(utf8.has_value());
    EXPECT_EQ(utf8->extension(), ".ps1");
    EXPECT_EQ(TempChannelAllocator::read_back(*utf8).value_or(""), "Write-Output 1");

    auto utf16 = alloc.allocate_script("ab", TextEncoding::Utf16LeBom);
    ASSERT_TRUE(utf16.has_value());
    EXPECT_EQ(TempChannelAllocator::read_back(*utf16).value_or(""), std::string("\xFF\xFE" "a\0b\0", 6));

    EXPECT_TRUE(alloc.release_all());
    cleanupTemp(dir);
}

TEST(TempChannelAllocator, ReleaseAllIsIdempotent)
{
    const fs::path dir = makeTempDir("release");
    TempChannelAllocator alloc(dir);
    auto p = alloc.allocate(ChannelKind::Stdout);
    ASSERT_TRUE(p.has_value());

    EXPECT_TRUE(alloc.release_all());
    EXPECT_FALSE(fs::exists(*p));
    EXPECT_TRUE(alloc.live().empty());
    EXPECT_TRUE(alloc.release_all());
    EXPECT_TRUE(isEmptyDir(dir));
    cleanupTemp(dir);
}

TEST(TempChannelAllocator, AlreadyDeletedFileCountsAsReleased)
{
    const fs::path dir = makeTempDir("gone");
    TempChannelAllocator alloc(dir);
    auto p = alloc.allocate(ChannelKind::Stderr);
    ASSERT_TRUE(p.has_value());
    fs::remove(*p);
    EXPECT_TRUE(alloc.release_all());
    cleanupTemp(dir);
}

TEST(TempChannelAllocator, MissingDirectoryFailsAllocation)
{
    const fs::path dir = makeTempDir("missing");
    cleanupTemp(dir);
    TempChannelAllocator alloc(dir / "does-not-exist");
    EXPECT_FALSE(alloc.allocate(ChannelKind::Stdout).has_value());
    EXPECT_TRUE(alloc.live().empty());
}

TEST(TempChannelAllocator, RelativeDirectoryYieldsAbsolutePaths)
{
    const fs::path dir = makeTempDir("relative");
    const fs::path previous = fs::current_path();
    fs::current_path(dir.parent_path());
    const fs::path relative = dir.filename();
    {
        TempChannelAllocator alloc(relative);
        auto p = alloc.allocate(ChannelKind::Stdout);
        ASSERT_TRUE(p.has_value());
        EXPECT_TRUE(p->is_absolute());
        EXPECT_EQ(p->parent_path(), fs::absolute(relative));

        // Still reachable after the cwd moves away.
        fs::current_path(previous);
        EXPECT_TRUE(fs::exists(*p));
        EXPECT_TRUE(alloc.release_all());
        EXPECT_FALSE(fs::exists(*p));
    }
    fs::current_path(previous);
    EXPECT_TRUE(isEmptyDir(dir));
    cleanupTemp(dir);
}

TEST(TempChannelAllocator, ReadBackOfMissingFileIsEmpty)
{
    EXPECT_FALSE(TempChannelAllocator::read_back(fs::temp_directory_path() / "psrelay-no-such-file.out").has_value());
}
