#include "FilesystemBackend.hpp"
#include "AddressResolver.hpp"
#include "FileHasher.hpp"
#include "TransportErrors.hpp"
#include "Logger.hpp"

#include <algorithm>

namespace FS = std::filesystem;

FilesystemBackend::FilesystemBackend(std::shared_ptr<CommandRunner> Runner)
    : Runner(std::move(Runner))
{
}

std::string FilesystemBackend::Name() const
{
    return "filesystem";
}

bool FilesystemBackend::Connect()
{
    return true;
}

int64_t FilesystemBackend::GetFreeSpace(const std::string& Path)
{
    std::error_code ec;
    FS::path CheckPath = FS::absolute(AddressResolver::ExpandUser(Path), ec);
    if (ec)
    {
        Log.Warn("[Filesystem] Free space probe could not resolve " + Path + ": " + ec.message());
        return -1;
    }

    // Destinations that do not exist yet report the space of their nearest existing ancestor.
    while (!FS::exists(CheckPath, ec) && CheckPath.has_parent_path() && CheckPath.parent_path() != CheckPath)
    {
        CheckPath = CheckPath.parent_path();
    }

    FS::space_info Space = FS::space(CheckPath, ec);
    if (ec)
    {
        Log.Warn("[Filesystem] Free space probe failed for " + CheckPath.string() + ": " + ec.message());
        return -1;
    }
    return static_cast<int64_t>(Space.available);
}

std::vector<std::string> FilesystemBackend::ListDirs(const std::string& Path)
{
    std::vector<std::string> Dirs;
    std::error_code ec;
    FS::path Root(AddressResolver::ExpandUser(Path));

    if (!FS::is_directory(Root, ec))
    {
        return Dirs;
    }

    for (FS::directory_iterator It(Root, ec), End; !ec && It != End; It.increment(ec))
    {
        std::error_code EntryEc;
        if (It->is_directory(EntryEc))
        {
            Dirs.push_back(It->path().filename().string());
        }
    }
    if (ec)
    {
        Log.Warn("[Filesystem] Listing failed for " + Root.string() + ": " + ec.message());
        return {};
    }

    std::sort(Dirs.begin(), Dirs.end());
    return Dirs;
}

bool FilesystemBackend::Exists(const std::string& Path)
{
    std::error_code ec;
    bool Found = FS::exists(AddressResolver::ExpandUser(Path), ec);
    if (ec)
    {
        Log.Warn("[Filesystem] Existence probe failed for " + Path + ": " + ec.message());
        return false;
    }
    return Found;
}

void FilesystemBackend::MakeDir(const std::string& Path)
{
    FS::path Target(AddressResolver::ExpandUser(Path));
    std::error_code ec;
    FS::create_directories(Target, ec);
    if (ec)
    {
        throw TransferError("Failed to create directory " + Target.string() + ": " + ec.message());
    }
}

bool FilesystemBackend::ResumableCopyAvailable()
{
    return Runner->Run("command -v rsync >/dev/null 2>&1").ExitCode == 0;
}

void FilesystemBackend::Transfer(const CopyPlan& Plan, bool Resume, bool Verify)
{
    FS::path Source(AddressResolver::ExpandUser(Plan.Source));
    FS::path Destination(AddressResolver::ExpandUser(Plan.Destination));

    std::error_code ec;
    if (!FS::exists(Source, ec))
    {
        throw TransferError("Source path does not exist: " + Source.string());
    }

    MakeDir(Destination.string());

    // Trailing separators would make filename() empty.
    Source = Source.lexically_normal();
    if (!Source.has_filename())
    {
        Source = Source.parent_path();
    }

    if (Resume && ResumableCopyAvailable())
    {
        ResumableCopy(Source, Destination, Verify);
    }
    else
    {
        if (Resume)
        {
            Log.Info("[Filesystem] rsync not available, falling back to a plain copy");
        }
        PlainCopy(Source, Destination);
    }

    if (Verify)
    {
        FS::path Landed = Destination / Source.filename();
        if (FS::is_directory(Source, ec))
        {
            VerifyTree(Source, Landed);
        }
        else
        {
            VerifyFile(Source, Landed, Source.filename().string());
        }
        Log.Info("[Filesystem] Checksum verification passed [blake3]: " + Landed.string());
    }
}

void FilesystemBackend::ResumableCopy(const FS::path& Source, const FS::path& Destination, bool Verify)
{
    std::string Command = "rsync -a --partial";
    if (Verify)
    {
        Command += " --checksum";
    }
    Command += " " + ShellQuote(Source.string()) + " " + ShellQuote(Destination.string());

    Log.Info("[Filesystem] Resumable copy: " + Source.string() + " -> " + Destination.string());
    CommandResult Result = Runner->Run(Command);
    if (Result.ExitCode != 0)
    {
        throw TransferError("Local rsync failed with exit code " + std::to_string(Result.ExitCode) + ": " + Result.Output, Result.ExitCode);
    }
}

void FilesystemBackend::PlainCopy(const FS::path& Source, const FS::path& Destination)
{
    try
    {
        if (FS::is_directory(Source))
        {
            FS::path DestPath = Destination / Source.filename();
            FS::copy(Source, DestPath, FS::copy_options::recursive | FS::copy_options::overwrite_existing);
            Log.Info("[Filesystem] Directory copied: " + Source.string() + " -> " + DestPath.string());
        }
        else
        {
            FS::path DestPath = Destination / Source.filename();
            FS::copy_file(Source, DestPath, FS::copy_options::overwrite_existing);
            Log.Info("[Filesystem] File copied: " + Source.string() + " -> " + DestPath.string());
        }
    }
    catch (const FS::filesystem_error& e)
    {
        throw TransferError(std::string("Copy failed: ") + e.what());
    }
}

void FilesystemBackend::VerifyFile(const FS::path& SourceFile, const FS::path& DestFile, const std::string& RelativePath)
{
    std::error_code ec;
    if (!FS::is_regular_file(SourceFile, ec))
    {
        throw VerificationError(RelativePath, "missing", "present");
    }
    if (!FS::is_regular_file(DestFile, ec))
    {
        throw VerificationError(RelativePath, "present", "missing");
    }

    std::string SourceDigest;
    std::string DestDigest;
    try
    {
        SourceDigest = FileHasher::HashFile(SourceFile.string());
        DestDigest = FileHasher::HashFile(DestFile.string());
    }
    catch (const std::runtime_error& e)
    {
        throw TransferError(std::string("Verification could not read file: ") + e.what());
    }

    Log.Debug("[Filesystem] Verify [blake3]: " + RelativePath + (SourceDigest == DestDigest ? " OK" : " MISMATCH"));
    if (SourceDigest != DestDigest)
    {
        Log.Error("[Filesystem] Checksum mismatch [blake3]: " + RelativePath + " (src=" + SourceDigest + ", dst=" + DestDigest + ")");
        throw VerificationError(RelativePath, SourceDigest, DestDigest);
    }
}

void FilesystemBackend::VerifyTree(const FS::path& SourceRoot, const FS::path& DestRoot)
{
    std::error_code ec;
    if (!FS::is_directory(DestRoot, ec))
    {
        throw VerificationError(".", "present", "missing");
    }

    std::vector<FS::path> DestFiles;
    try
    {
        for (const auto& Entry : FS::recursive_directory_iterator(DestRoot))
        {
            if (Entry.is_regular_file())
            {
                DestFiles.push_back(Entry.path());
            }
        }
    }
    catch (const FS::filesystem_error& e)
    {
        throw TransferError(std::string("Verification could not walk destination: ") + e.what());
    }
    std::sort(DestFiles.begin(), DestFiles.end());

    for (const auto& DestFile : DestFiles)
    {
        FS::path Relative = DestFile.lexically_relative(DestRoot);
        VerifyFile(SourceRoot / Relative, DestFile, Relative.generic_string());
    }
}
