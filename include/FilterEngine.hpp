#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "FileScanner.hpp"

struct PreviewResult
{
    std::vector<std::string> Files;
    uint64_t TotalBytes = 0;
};

class FilterEngine
{
public:
    // Earliest modification time (Unix seconds) a file may have; empty means no floor.
    static std::optional<int64_t> ResolveFloor(const std::string& TimeRange);

    // "unlimited", "", "0" -> 0. Accepts K/M/G/T suffixes (powers of 1024).
    static uint64_t ParseSizeToBytes(const std::string& SizeText);

    static bool MatchesPattern(const std::string& FileName, const std::vector<std::string>& Patterns);

    static bool Matches(const ScannedFileInfo& File,
                        const std::vector<std::string>& Patterns,
                        int64_t SizeFloor,
                        const std::optional<int64_t>& MTimeFloor);

    // TotalBytes counts every match; Files holds at most DisplayLimit of them.
    static PreviewResult Preview(const std::string& Source,
                                 const std::vector<std::string>& Patterns,
                                 const std::string& TimeRange,
                                 const std::string& SizeLimit,
                                 std::size_t DisplayLimit);
};
