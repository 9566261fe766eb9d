#include "CopyPlan.hpp"
#include "AddressResolver.hpp"

#include <filesystem>

namespace FS = std::filesystem;

namespace
{
    bool IsWildcardOnly(const std::vector<std::string>& Globs)
    {
        return Globs.empty() || (Globs.size() == 1 && Globs.front() == "*");
    }

    std::string JoinComma(const std::vector<std::string>& Items)
    {
        std::string Out;
        for (const auto& Item : Items)
        {
            if (!Out.empty())
            {
                Out += ",";
            }
            Out += Item;
        }
        return Out;
    }
}

std::string FilterConfig::Summary() const
{
    std::string Dirs = IsWildcardOnly(IncludeDirs) ? "All" : JoinComma(IncludeDirs);
    std::string Types = IsWildcardOnly(Patterns) ? "All" : JoinComma(Patterns);
    std::string Time = TimeRange == "unlimited" ? "All Time" : TimeRange;
    std::string Size = (SizeLimit == "unlimited" || SizeLimit == "0" || SizeLimit.empty()) ? "Any Size" : SizeLimit;
    return "[Dir: " + Dirs + " | Time: " + Time + " | Type: " + Types + " | Size: " + Size + "]";
}

std::string StorageEndpoint::FullPath() const
{
    if (Path.empty())
    {
        return Address;
    }

    std::string Tail = Path;
    Tail.erase(0, Tail.find_first_not_of('/'));

    if (AddressResolver::IsCloud(Address))
    {
        std::string Head = Address;
        while (!Head.empty() && Head.back() == '/')
        {
            Head.pop_back();
        }
        return Head + "/" + Tail;
    }
    if (BackendKey == "remote")
    {
        return Address + ":" + Path;
    }
    return (FS::path(Address) / Tail).string();
}

CopyPlan SyncJob::ToPlan() const
{
    CopyPlan Plan;
    Plan.Source = Source.FullPath();
    Plan.Destination = Destination.FullPath();
    Plan.Filter = Filter;

    // Filesystem endpoints leave routing to address classification.
    for (const auto* Endpoint : { &Destination, &Source })
    {
        if (!Endpoint->BackendKey.empty() && Endpoint->BackendKey != "filesystem" && Endpoint->BackendKey != "local")
        {
            Plan.BackendKey = Endpoint->BackendKey;
            break;
        }
    }
    return Plan;
}
