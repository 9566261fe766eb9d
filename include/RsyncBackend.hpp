#pragma once

#include <memory>
#include <string>

#include "StorageBackend.hpp"
#include "AddressResolver.hpp"
#include "CommandRunner.hpp"
#include "FilesystemBackend.hpp"

// Remote host reachable over ssh. Data moves with rsync, probes run one remote command each.
class RsyncBackend : public StorageBackend
{
public:
    RsyncBackend(std::shared_ptr<CommandRunner> Runner, std::string SshKeyPath = "", std::string ConnectAddress = "");

    bool Connect() override;
    int64_t GetFreeSpace(const std::string& Path) override;
    std::vector<std::string> ListDirs(const std::string& Path) override;
    bool Exists(const std::string& Path) override;
    void MakeDir(const std::string& Path) override;
    void Transfer(const CopyPlan& Plan, bool Resume, bool Verify) override;
    std::string Name() const override;

    // Exactly one side of the plan must be remote; throws UnsupportedRouteError otherwise.
    static void CheckRoute(const CopyPlan& Plan);

    std::string BuildSshCommand() const;
    std::string BuildTransferCommand(const CopyPlan& Plan, bool Resume, bool Verify) const;

private:
    std::shared_ptr<CommandRunner> Runner;
    std::string SshKeyPath;
    std::string ConnectAddress;
    FilesystemBackend LocalSide;

    std::string BuildRemoteCommand(const RemoteAddress& Remote, const std::string& RemoteCommand) const;
};
