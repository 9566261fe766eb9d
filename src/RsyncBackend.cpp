#include "RsyncBackend.hpp"
#include "AddressResolver.hpp"
#include "ConfigGlobal.hpp"
#include "TransportErrors.hpp"
#include "Logger.hpp"

#include <sstream>

RsyncBackend::RsyncBackend(std::shared_ptr<CommandRunner> Runner, std::string SshKeyPath, std::string ConnectAddress)
    : Runner(Runner), SshKeyPath(std::move(SshKeyPath)), ConnectAddress(std::move(ConnectAddress)), LocalSide(Runner)
{
}

std::string RsyncBackend::Name() const
{
    return "remote";
}

std::string RsyncBackend::BuildSshCommand() const
{
    std::string Command = "ssh -o BatchMode=yes -o ConnectTimeout=" + std::to_string(ConfigGlobal::SshConnectTimeout);
    if (!SshKeyPath.empty())
    {
        Command += " -i " + ShellQuote(SshKeyPath);
    }
    return Command;
}

std::string RsyncBackend::BuildRemoteCommand(const RemoteAddress& Remote, const std::string& RemoteCommand) const
{
    return BuildSshCommand() + " " + ShellQuote(Remote.User + "@" + Remote.Host) + " " + ShellQuote(RemoteCommand);
}

bool RsyncBackend::Connect()
{
    if (!AddressResolver::IsRemote(ConnectAddress))
    {
        Log.Debug("[Rsync] No remote address to probe, assuming reachable");
        return true;
    }

    try
    {
        RemoteAddress Remote = AddressResolver::SplitRemote(ConnectAddress);
        CommandResult Result = Runner->Run(BuildRemoteCommand(Remote, "true"));
        if (Result.ExitCode != 0)
        {
            Log.Warn("[Rsync] Connection probe to " + Remote.Host + " failed (exit " + std::to_string(Result.ExitCode) + "): " + Result.Output);
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        Log.Warn(std::string("[Rsync] Connection probe failed: ") + e.what());
        return false;
    }
}

bool RsyncBackend::Exists(const std::string& Path)
{
    if (!AddressResolver::IsRemote(Path))
    {
        return LocalSide.Exists(Path);
    }

    try
    {
        RemoteAddress Remote = AddressResolver::SplitRemote(Path);
        return Runner->Run(BuildRemoteCommand(Remote, "test -e " + ShellQuote(Remote.Path))).ExitCode == 0;
    }
    catch (const std::exception& e)
    {
        Log.Warn("[Rsync] Existence probe failed for " + Path + ": " + e.what());
        return false;
    }
}

void RsyncBackend::MakeDir(const std::string& Path)
{
    if (!AddressResolver::IsRemote(Path))
    {
        LocalSide.MakeDir(Path);
        return;
    }

    RemoteAddress Remote = AddressResolver::SplitRemote(Path);
    CommandResult Result = Runner->Run(BuildRemoteCommand(Remote, "mkdir -p " + ShellQuote(Remote.Path)));
    if (Result.ExitCode != 0)
    {
        // rsync reports the authoritative failure if the directory is really unusable.
        Log.Error("[Rsync] Remote mkdir failed for " + Path + " (exit " + std::to_string(Result.ExitCode) + "): " + Result.Output);
    }
}

int64_t RsyncBackend::GetFreeSpace(const std::string& Path)
{
    if (!AddressResolver::IsRemote(Path))
    {
        return LocalSide.GetFreeSpace(Path);
    }

    try
    {
        RemoteAddress Remote = AddressResolver::SplitRemote(Path);
        std::string RemoteCommand = "df -Pk " + ShellQuote(Remote.Path) + " | tail -1 | awk '{print $4}'";
        CommandResult Result = Runner->Run(BuildRemoteCommand(Remote, RemoteCommand));
        if (Result.ExitCode != 0)
        {
            Log.Warn("[Rsync] Free space probe failed for " + Path + " (exit " + std::to_string(Result.ExitCode) + ")");
            return -1;
        }
        return std::stoll(Result.Output) * 1024;
    }
    catch (const std::exception& e)
    {
        Log.Warn("[Rsync] Free space probe failed for " + Path + ": " + e.what());
        return -1;
    }
}

std::vector<std::string> RsyncBackend::ListDirs(const std::string& Path)
{
    if (!AddressResolver::IsRemote(Path))
    {
        return LocalSide.ListDirs(Path);
    }

    std::vector<std::string> Dirs;
    try
    {
        RemoteAddress Remote = AddressResolver::SplitRemote(Path);
        std::string RemoteCommand = "find " + ShellQuote(Remote.Path) + " -mindepth 1 -maxdepth 1 -type d -exec basename {} \\;";
        CommandResult Result = Runner->Run(BuildRemoteCommand(Remote, RemoteCommand));
        if (Result.ExitCode != 0)
        {
            Log.Warn("[Rsync] Listing failed for " + Path + " (exit " + std::to_string(Result.ExitCode) + ")");
            return {};
        }

        std::istringstream Lines(Result.Output);
        std::string Line;
        while (std::getline(Lines, Line))
        {
            while (!Line.empty() && (Line.back() == '\r' || Line.back() == ' '))
            {
                Line.pop_back();
            }
            if (!Line.empty())
            {
                Dirs.push_back(Line);
            }
        }
    }
    catch (const std::exception& e)
    {
        Log.Warn("[Rsync] Listing failed for " + Path + ": " + e.what());
        return {};
    }
    return Dirs;
}

void RsyncBackend::CheckRoute(const CopyPlan& Plan)
{
    bool IsPush = AddressResolver::IsRemote(Plan.Destination);
    bool IsPull = AddressResolver::IsRemote(Plan.Source);

    if (IsPush == IsPull)
    {
        throw UnsupportedRouteError(IsPush ? "Remote to remote transfer is not supported: " + Plan.Source + " -> " + Plan.Destination
                                           : "Local to local transfer belongs to the filesystem backend: " + Plan.Source + " -> " + Plan.Destination);
    }
}

std::string RsyncBackend::BuildTransferCommand(const CopyPlan& Plan, bool Resume, bool Verify) const
{
    CheckRoute(Plan);
    bool IsPush = AddressResolver::IsRemote(Plan.Destination);

    std::string Command = "rsync -avz";
    if (Resume)
    {
        Command += " --partial";
    }
    if (Verify)
    {
        Command += " --checksum";
    }
    Command += " -e " + ShellQuote(BuildSshCommand());

    if (IsPush)
    {
        RemoteAddress Remote = AddressResolver::SplitRemote(Plan.Destination);
        Command += " " + ShellQuote(AddressResolver::ExpandUser(Plan.Source)) + " " + ShellQuote(Remote.User + "@" + Remote.Host + ":" + Remote.Path);
    }
    else
    {
        RemoteAddress Remote = AddressResolver::SplitRemote(Plan.Source);
        Command += " " + ShellQuote(Remote.User + "@" + Remote.Host + ":" + Remote.Path) + " " + ShellQuote(AddressResolver::ExpandUser(Plan.Destination));
    }
    return Command;
}

void RsyncBackend::Transfer(const CopyPlan& Plan, bool Resume, bool Verify)
{
    std::string Command = BuildTransferCommand(Plan, Resume, Verify);

    Log.Info("[Rsync] Transfer: " + Plan.Source + " -> " + Plan.Destination);
    Log.Debug("[Rsync] Running: " + Command);

    CommandResult Result = Runner->Run(Command);
    if (Result.ExitCode != 0)
    {
        Log.Error("[Rsync] rsync failed with exit code " + std::to_string(Result.ExitCode) + ": " + Result.Output);
        throw TransferError("rsync failed with exit code " + std::to_string(Result.ExitCode) + ": " + Result.Output, Result.ExitCode);
    }
    Log.Info("[Rsync] Transfer completed: " + Plan.Source + " -> " + Plan.Destination);
}
