#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "StorageBackend.hpp"
#include "CommandRunner.hpp"

using BackendFactory = std::function<std::unique_ptr<StorageBackend>(const CopyPlan&)>;

class StorageRegistry
{
public:
    StorageRegistry() = default;

    // Registers filesystem, local, remote and cloud.
    static StorageRegistry CreateDefault(std::shared_ptr<CommandRunner> Runner, const std::string& SshKeyPath = "");

    void Register(const std::string& Key, BackendFactory Factory);
    bool Has(const std::string& Key) const;

    // Throws UnregisteredBackendError for unknown keys.
    const BackendFactory& Get(const std::string& Key) const;

    // Explicit BackendKey wins; otherwise cloud, then remote, then filesystem.
    std::unique_ptr<StorageBackend> Build(const CopyPlan& Plan) const;

    static std::string ClassifyRoute(const CopyPlan& Plan);

private:
    std::map<std::string, BackendFactory> Factories;
};
