#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

struct ScannedFileInfo
{
    std::string Path;
    uintmax_t Size = 0;
    int64_t MTime = 0;
};

class FileScanner
{
public:
    FileScanner() = default;

    void Clear();

    // A regular file yields itself; a directory yields every regular file beneath it.
    void Scan(const std::string& RootPath);

    const std::vector<ScannedFileInfo>& GetFiles() const;

private:
    std::vector<ScannedFileInfo> Files;

    void ScanDirectoryIterative(const std::filesystem::path& Root);
    void AddFile(const std::filesystem::path& FilePath, uintmax_t Size);
};
