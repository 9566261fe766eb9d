#include <algorithm>
#include <filesystem>
#include <stack>

#include "FileScanner.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

const std::vector<ScannedFileInfo>& FileScanner::GetFiles() const
{
    return Files;
}

void FileScanner::Clear()
{
    Files.clear();
}

void FileScanner::AddFile(const FS::path& FilePath, uintmax_t Size)
{
    ScannedFileInfo Info;
    Info.Path = FilePath.string();
    Info.Size = Size;
    Info.MTime = FileMTimeSeconds(Info.Path);
    Files.push_back(std::move(Info));
}

void FileScanner::Scan(const std::string& RootPath)
{
    FS::path Root(RootPath);
    try
    {
        if (!FS::exists(Root))
        {
            Log.Debug("Scan: Path does not exist: " + Root.string());
            return;
        }
        if (FS::is_regular_file(Root)) // Single file case
        {
            AddFile(Root, FS::file_size(Root));
            return;
        }
        if (!FS::is_directory(Root))
        {
            Log.Warn("Scan: Path is neither a directory nor a file: " + Root.string());
            return;
        }
        ScanDirectoryIterative(Root);
    }
    catch (const FS::filesystem_error& e)
    {
        Log.Error(std::string("Filesystem error during scan: ") + e.what());
        Log.Error(std::string("Path: ") + e.path1().string());
    }
}

void FileScanner::ScanDirectoryIterative(const FS::path& Root)
{
    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        std::vector<FS::directory_entry> Entries;
        try
        {
            for (const auto& Entry : FS::directory_iterator(Current))
            {
                Entries.push_back(Entry);
            }
        }
        catch (const FS::filesystem_error& e)
        {
            Log.Error(std::string("Filesystem error iterating directory: ") + e.what() + std::string(" Path: ") + Current.string());
            continue;
        }

        // Sorted so repeated previews list files in the same order.
        std::sort(Entries.begin(), Entries.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
        {
            return A.path().filename() < B.path().filename();
        });

        std::vector<FS::path> SubDirs;
        for (const auto& Entry : Entries)
        {
            try
            {
                // Skip symbolic links to avoid loops.
                if (FS::is_symlink(Entry.symlink_status()))
                {
                    Log.Info(std::string("Skipping SymLink: ") + Entry.path().string());
                    continue;
                }
                if (Entry.is_directory())
                {
                    SubDirs.push_back(Entry.path());
                }
                else if (Entry.is_regular_file())
                {
                    AddFile(Entry.path(), Entry.file_size());
                }
            }
            catch (const FS::filesystem_error& e)
            {
                Log.Error(std::string("Filesystem error accessing entry: ") + e.what() + std::string(" Path: ") + Entry.path().string());
            }
        }

        for (auto It = SubDirs.rbegin(); It != SubDirs.rend(); ++It)
        {
            DirStack.push(*It);
        }
    }
}
