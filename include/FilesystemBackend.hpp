#pragma once

#include <filesystem>
#include <memory>

#include "StorageBackend.hpp"
#include "CommandRunner.hpp"

// Local disks and mounted removable media.
class FilesystemBackend : public StorageBackend
{
public:
    explicit FilesystemBackend(std::shared_ptr<CommandRunner> Runner = std::make_shared<ShellCommandRunner>());

    bool Connect() override;
    int64_t GetFreeSpace(const std::string& Path) override;
    std::vector<std::string> ListDirs(const std::string& Path) override;
    bool Exists(const std::string& Path) override;
    void MakeDir(const std::string& Path) override;
    void Transfer(const CopyPlan& Plan, bool Resume, bool Verify) override;
    std::string Name() const override;

    // Compares every file under DestRoot with its counterpart under SourceRoot.
    static void VerifyTree(const std::filesystem::path& SourceRoot, const std::filesystem::path& DestRoot);

private:
    std::shared_ptr<CommandRunner> Runner;

    bool ResumableCopyAvailable();
    void ResumableCopy(const std::filesystem::path& Source, const std::filesystem::path& Destination, bool Verify);
    void PlainCopy(const std::filesystem::path& Source, const std::filesystem::path& Destination);
    static void VerifyFile(const std::filesystem::path& SourceFile, const std::filesystem::path& DestFile, const std::string& RelativePath);
};
