#include "FilterEngine.hpp"
#include "AddressResolver.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fnmatch.h>
#include <limits>

namespace FS = std::filesystem;

std::optional<int64_t> FilterEngine::ResolveFloor(const std::string& TimeRange)
{
    if (TimeRange == "unlimited")
    {
        return std::nullopt;
    }
    if (TimeRange == "today")
    {
        return StartOfLocalDaySeconds();
    }
    if (TimeRange == "1h")
    {
        return NowSeconds() - 3600;
    }

    Log.Debug("[FilterEngine] Unrecognized time range '" + TimeRange + "', no time floor applied");
    return std::nullopt;
}

uint64_t FilterEngine::ParseSizeToBytes(const std::string& SizeText)
{
    std::string Text;
    for (char Ch : SizeText)
    {
        if (!std::isspace(static_cast<unsigned char>(Ch)))
        {
            Text += static_cast<char>(std::toupper(static_cast<unsigned char>(Ch)));
        }
    }

    if (Text.empty() || Text == "UNLIMITED" || Text == "0")
    {
        return 0;
    }

    double Multiplier = 1.0;
    switch (Text.back())
    {
    case 'K': Multiplier = 1024.0; break;
    case 'M': Multiplier = 1024.0 * 1024; break;
    case 'G': Multiplier = 1024.0 * 1024 * 1024; break;
    case 'T': Multiplier = 1024.0 * 1024 * 1024 * 1024; break;
    default: break;
    }
    if (Multiplier > 1.0)
    {
        Text.pop_back();
    }

    try
    {
        std::size_t Consumed = 0;
        double Value = std::stod(Text, &Consumed);
        if (Consumed != Text.size() || !std::isfinite(Value) || Value < 0)
        {
            Log.Warn("[FilterEngine] Invalid size limit '" + SizeText + "', no size floor applied");
            return 0;
        }

        // Floors are compared as int64_t, so anything larger saturates instead of wrapping.
        const double Bytes = Value * Multiplier;
        if (Bytes >= static_cast<double>(std::numeric_limits<int64_t>::max()))
        {
            Log.Warn("[FilterEngine] Size limit '" + SizeText + "' exceeds the largest file size, every file is excluded");
            return static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        }
        return static_cast<uint64_t>(Bytes);
    }
    catch (const std::exception& e)
    {
        Log.Warn("[FilterEngine] Invalid size limit '" + SizeText + "' (" + e.what() + "), no size floor applied");
        return 0;
    }
}

bool FilterEngine::MatchesPattern(const std::string& FileName, const std::vector<std::string>& Patterns)
{
    if (Patterns.empty())
    {
        return true;
    }
    return std::any_of(Patterns.begin(), Patterns.end(), [&FileName](const std::string& Pattern)
    {
        return fnmatch(Pattern.c_str(), FileName.c_str(), 0) == 0;
    });
}

bool FilterEngine::Matches(const ScannedFileInfo& File,
                           const std::vector<std::string>& Patterns,
                           int64_t SizeFloor,
                           const std::optional<int64_t>& MTimeFloor)
{
    if (!MatchesPattern(FS::path(File.Path).filename().string(), Patterns))
    {
        return false;
    }
    if (SizeFloor > 0 && File.Size < static_cast<uintmax_t>(SizeFloor))
    {
        return false;
    }
    if (MTimeFloor && File.MTime < *MTimeFloor)
    {
        return false;
    }
    return true;
}

PreviewResult FilterEngine::Preview(const std::string& Source,
                                    const std::vector<std::string>& Patterns,
                                    const std::string& TimeRange,
                                    const std::string& SizeLimit,
                                    std::size_t DisplayLimit)
{
    PreviewResult Result;

    std::string SourcePath = AddressResolver::ExpandUser(Source);
    std::error_code ec;
    if (!FS::exists(SourcePath, ec))
    {
        Log.Info("[FilterEngine] Nothing to preview, source not found: " + SourcePath);
        return Result;
    }

    FileScanner Scanner;
    Scanner.Scan(SourcePath);

    const std::optional<int64_t> MTimeFloor = ResolveFloor(TimeRange);
    const int64_t SizeFloor = static_cast<int64_t>(ParseSizeToBytes(SizeLimit));

    std::size_t MatchCount = 0;
    for (const auto& File : Scanner.GetFiles())
    {
        if (!Matches(File, Patterns, SizeFloor, MTimeFloor))
        {
            continue;
        }
        ++MatchCount;
        Result.TotalBytes += File.Size;
        if (Result.Files.size() < DisplayLimit)
        {
            Result.Files.push_back(File.Path);
        }
    }

    Log.Info("[FilterEngine] Preview of " + SourcePath + ": " + std::to_string(MatchCount) + " matching files, " +
             std::to_string(Result.TotalBytes) + " bytes");
    return Result;
}
