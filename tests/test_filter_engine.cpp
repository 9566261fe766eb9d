#include "TestHarness.hpp"
#include "ConfigGlobal.hpp"
#include "FilterEngine.hpp"
#include "TimeUtils.hpp"

#include <chrono>
#include <limits>

namespace FS = std::filesystem;

static void AgeFile(const FS::path& Target, std::chrono::hours Age)
{
    FS::last_write_time(Target, FS::file_time_type::clock::now() - Age);
}

TEST(floor_unlimited_and_unknown_are_empty)
{
    ASSERT(!FilterEngine::ResolveFloor("unlimited").has_value());
    ASSERT(!FilterEngine::ResolveFloor("last-week").has_value());
    ASSERT(!FilterEngine::ResolveFloor("").has_value());
}

TEST(floor_one_hour_and_today)
{
    int64_t Before = NowSeconds();
    auto HourFloor = FilterEngine::ResolveFloor("1h");
    ASSERT(HourFloor.has_value());
    ASSERT(*HourFloor >= Before - 3600 - 1);
    ASSERT(*HourFloor <= NowSeconds() - 3600 + 1);

    auto DayFloor = FilterEngine::ResolveFloor("today");
    ASSERT(DayFloor.has_value());
    ASSERT(*DayFloor <= NowSeconds());
    ASSERT(NowSeconds() - *DayFloor < 24 * 3600 + 3600);
}

TEST(parse_size_strings)
{
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("unlimited"), 0u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("0"), 0u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes(""), 0u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("512"), 512u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("1k"), 1024u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("1.5M"), 1572864u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("2G"), 2147483648ull);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("lots"), 0u);
}

TEST(parse_size_rejects_non_finite_and_saturates)
{
    const uint64_t Largest = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("inf"), 0u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("nan"), 0u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("infT"), 0u);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("10000000T"), Largest);
    ASSERT_EQ(FilterEngine::ParseSizeToBytes("1e30"), Largest);
}

TEST(preview_with_huge_size_floor_excludes_everything)
{
    TempDir Dir;
    Dir.Write("src/a.log", "0123456789");

    PreviewResult Result = FilterEngine::Preview(Dir.Path("src").string(), { "*" }, "unlimited", "10000000T", 50);
    ASSERT(Result.Files.empty());
    ASSERT_EQ(Result.TotalBytes, 0u);
}

TEST(pattern_matching_is_case_sensitive_glob)
{
    ASSERT(FilterEngine::MatchesPattern("a.log", { "*.log" }));
    ASSERT(!FilterEngine::MatchesPattern("a.LOG", { "*.log" }));
    ASSERT(FilterEngine::MatchesPattern("run_01.bag", { "*.rec", "run_??.bag" }));
    ASSERT(FilterEngine::MatchesPattern("anything", { "*" }));
    ASSERT(FilterEngine::MatchesPattern("anything", {}));
    ASSERT(!FilterEngine::MatchesPattern("b.txt", { "*.log", "*.bag" }));
}

TEST(matches_requires_every_predicate)
{
    ScannedFileInfo File{ "/data/run/a.log", 100, 5000 };

    ASSERT(FilterEngine::Matches(File, { "*.log" }, 0, std::nullopt));
    ASSERT(FilterEngine::Matches(File, { "*.log" }, 100, 5000));
    ASSERT(!FilterEngine::Matches(File, { "*.txt" }, 0, std::nullopt));
    ASSERT(!FilterEngine::Matches(File, { "*.log" }, 101, std::nullopt));
    ASSERT(!FilterEngine::Matches(File, { "*.log" }, 0, 5001));
    ASSERT(FilterEngine::Matches(File, { "*.log" }, -1, std::nullopt));
}

TEST(matches_uses_base_name_only)
{
    ScannedFileInfo File{ "/logs.d/readme.md", 1, 0 };
    ASSERT(!FilterEngine::Matches(File, { "logs*" }, 0, std::nullopt));
    ASSERT(FilterEngine::Matches(File, { "*.md" }, 0, std::nullopt));
}

TEST(preview_filters_by_pattern)
{
    TempDir Dir;
    Dir.Write("src/a.log", std::string(10, 'a'));
    Dir.Write("src/b.txt", std::string(5, 'b'));

    PreviewResult Result = FilterEngine::Preview(Dir.Path("src").string(), { "*.log" }, "unlimited", "0", 50);
    ASSERT_EQ(Result.Files.size(), 1u);
    ASSERT_EQ(FS::path(Result.Files[0]).filename().string(), "a.log");
    ASSERT_EQ(Result.TotalBytes, 10u);
}

TEST(preview_total_ignores_display_limit)
{
    TempDir Dir;
    for (int i = 0; i < 5; ++i)
    {
        Dir.Write("src/f" + std::to_string(i) + ".log", std::string(10, 'x'));
    }

    PreviewResult Result = FilterEngine::Preview(Dir.Path("src").string(), { "*.log" }, "unlimited", "unlimited", 2);
    ASSERT_EQ(Result.Files.size(), 2u);
    ASSERT_EQ(Result.TotalBytes, 50u);
    ASSERT_EQ(FS::path(Result.Files[0]).filename().string(), "f0.log");
    ASSERT_EQ(FS::path(Result.Files[1]).filename().string(), "f1.log");
}

TEST(preview_recurses_and_skips_directories)
{
    TempDir Dir;
    Dir.Write("src/top.bin", "1234");
    Dir.Write("src/nested/deeper/inner.bin", "12");
    FS::create_directories(Dir.Path("src/empty.bin"));

    PreviewResult Result = FilterEngine::Preview(Dir.Path("src").string(), { "*.bin" }, "unlimited", "0", 50);
    ASSERT_EQ(Result.Files.size(), 2u);
    ASSERT_EQ(Result.TotalBytes, 6u);
    for (const auto& File : Result.Files)
    {
        ASSERT(FS::is_regular_file(File));
    }
}

TEST(preview_single_file_source)
{
    TempDir Dir;
    FS::path File = Dir.Write("one.log", "hello");

    PreviewResult Result = FilterEngine::Preview(File.string(), { "*" }, "unlimited", "0", 50);
    ASSERT_EQ(Result.Files.size(), 1u);
    ASSERT_EQ(Result.TotalBytes, 5u);
}

TEST(preview_missing_source_is_empty)
{
    TempDir Dir;
    PreviewResult Result = FilterEngine::Preview(Dir.Path("nope").string(), { "*" }, "unlimited", "0", 50);
    ASSERT(Result.Files.empty());
    ASSERT_EQ(Result.TotalBytes, 0u);
}

TEST(preview_applies_size_and_time_floors)
{
    TempDir Dir;
    Dir.Write("src/small.dat", std::string(100, 's'));
    Dir.Write("src/big.dat", std::string(4096, 'b'));
    FS::path Old = Dir.Write("src/old_big.dat", std::string(4096, 'o'));
    AgeFile(Old, std::chrono::hours(3));

    PreviewResult BySize = FilterEngine::Preview(Dir.Path("src").string(), { "*.dat" }, "unlimited", "1K", 50);
    ASSERT_EQ(BySize.Files.size(), 2u);
    ASSERT_EQ(BySize.TotalBytes, 8192u);

    PreviewResult ByBoth = FilterEngine::Preview(Dir.Path("src").string(), { "*.dat" }, "1h", "1K", 50);
    ASSERT_EQ(ByBoth.Files.size(), 1u);
    ASSERT_EQ(FS::path(ByBoth.Files[0]).filename().string(), "big.dat");
}

TEST(preview_today_excludes_older_days)
{
    TempDir Dir;
    Dir.Write("src/fresh.log", "new");
    FS::path Stale = Dir.Write("src/stale.log", "old");
    AgeFile(Stale, std::chrono::hours(72));

    PreviewResult Result = FilterEngine::Preview(Dir.Path("src").string(), { "*.log" }, "today", "0", 50);
    ASSERT_EQ(Result.Files.size(), 1u);
    ASSERT_EQ(FS::path(Result.Files[0]).filename().string(), "fresh.log");
}

int main()
{
    ConfigGlobal::InitializeDefaults();
    printf("FilterEngine tests\n");
    RUN_TEST(floor_unlimited_and_unknown_are_empty);
    RUN_TEST(floor_one_hour_and_today);
    RUN_TEST(parse_size_strings);
    RUN_TEST(parse_size_rejects_non_finite_and_saturates);
    RUN_TEST(preview_with_huge_size_floor_excludes_everything);
    RUN_TEST(pattern_matching_is_case_sensitive_glob);
    RUN_TEST(matches_requires_every_predicate);
    RUN_TEST(matches_uses_base_name_only);
    RUN_TEST(preview_filters_by_pattern);
    RUN_TEST(preview_total_ignores_display_limit);
    RUN_TEST(preview_recurses_and_skips_directories);
    RUN_TEST(preview_single_file_source);
    RUN_TEST(preview_missing_source_is_empty);
    RUN_TEST(preview_applies_size_and_time_floors);
    RUN_TEST(preview_today_excludes_older_days);
    TEST_SUMMARY();
}
