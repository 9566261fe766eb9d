#include "StorageRegistry.hpp"
#include "AddressResolver.hpp"
#include "CloudBackend.hpp"
#include "FilesystemBackend.hpp"
#include "RsyncBackend.hpp"
#include "TransportErrors.hpp"
#include "Logger.hpp"

StorageRegistry StorageRegistry::CreateDefault(std::shared_ptr<CommandRunner> Runner, const std::string& SshKeyPath)
{
    StorageRegistry Registry;

    auto MakeFilesystem = [Runner](const CopyPlan&) -> std::unique_ptr<StorageBackend>
    {
        return std::make_unique<FilesystemBackend>(Runner);
    };
    Registry.Register("filesystem", MakeFilesystem);
    Registry.Register("local", MakeFilesystem);

    Registry.Register("remote", [Runner, SshKeyPath](const CopyPlan& Plan) -> std::unique_ptr<StorageBackend>
    {
        // Rejected here so a bad route never reaches Connect or MakeDir.
        RsyncBackend::CheckRoute(Plan);

        // Connect probes whichever side lives on the remote host.
        std::string ConnectAddress = AddressResolver::IsRemote(Plan.Destination) ? Plan.Destination : Plan.Source;
        return std::make_unique<RsyncBackend>(Runner, SshKeyPath, ConnectAddress);
    });

    Registry.Register("cloud", [](const CopyPlan&) -> std::unique_ptr<StorageBackend>
    {
        return std::make_unique<CloudBackend>();
    });

    return Registry;
}

void StorageRegistry::Register(const std::string& Key, BackendFactory Factory)
{
    Factories[Key] = std::move(Factory);
}

bool StorageRegistry::Has(const std::string& Key) const
{
    return Factories.find(Key) != Factories.end();
}

const BackendFactory& StorageRegistry::Get(const std::string& Key) const
{
    auto It = Factories.find(Key);
    if (It == Factories.end())
    {
        throw UnregisteredBackendError(Key);
    }
    return It->second;
}

std::string StorageRegistry::ClassifyRoute(const CopyPlan& Plan)
{
    if (AddressResolver::IsCloud(Plan.Source) || AddressResolver::IsCloud(Plan.Destination))
    {
        return "cloud";
    }
    if (AddressResolver::IsRemote(Plan.Destination) || AddressResolver::IsRemote(Plan.Source))
    {
        return "remote";
    }
    return "filesystem";
}

std::unique_ptr<StorageBackend> StorageRegistry::Build(const CopyPlan& Plan) const
{
    std::string Key = Plan.BackendKey ? *Plan.BackendKey : ClassifyRoute(Plan);
    Log.Debug("[StorageRegistry] Selected backend '" + Key + "' for " + Plan.Source + " -> " + Plan.Destination);
    return Get(Key)(Plan);
}
