#pragma once

#include <string>
#include <vector>
#include <optional>

struct FilterConfig
{
    std::string Id = "default";
    std::string Name = "All Files";
    std::vector<std::string> IncludeDirs{ "*" };
    std::vector<std::string> Patterns{ "*" };
    std::string TimeRange = "unlimited";
    std::string SizeLimit = "unlimited";

    // One line description used in previews and logs.
    std::string Summary() const;
};

struct CopyPlan
{
    std::string Source;
    std::string Destination;
    FilterConfig Filter;
    std::optional<std::string> BackendKey;
    std::optional<std::string> PresetName;
};

// A named, reusable storage location.
struct StorageEndpoint
{
    std::string Id;
    std::string Name;
    std::string BackendKey;
    std::string Address;
    std::string Path;

    std::string FullPath() const;
};

struct SyncJob
{
    std::string Id;
    std::string Name;
    StorageEndpoint Source;
    StorageEndpoint Destination;
    FilterConfig Filter;

    CopyPlan ToPlan() const;
};
