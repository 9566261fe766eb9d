#include "TransportService.hpp"
#include "AddressResolver.hpp"
#include "TransportErrors.hpp"
#include "Logger.hpp"

TransportService::TransportService(BackendFactory Factory, std::size_t PreviewLimit)
    : Factory(std::move(Factory)), PreviewLimit(PreviewLimit)
{
}

PreviewResult TransportService::Preview(const CopyPlan& Plan) const
{
    // Only local sources can be scanned before the transfer.
    if (AddressResolver::IsRemote(Plan.Source) || AddressResolver::IsCloud(Plan.Source))
    {
        Log.Info("[Transport] Source is not local, preview skipped: " + Plan.Source);
        return {};
    }

    return FilterEngine::Preview(Plan.Source, Plan.Filter.Patterns, Plan.Filter.TimeRange, Plan.Filter.SizeLimit, PreviewLimit);
}

void TransportService::Execute(const CopyPlan& Plan, const TransferOptions& Options) const
{
    PreviewResult Candidates = Preview(Plan);

    std::unique_ptr<StorageBackend> Backend = Factory(Plan);
    Log.Info("[Transport] Using " + Backend->Name() + " backend for " + Plan.Source + " -> " + Plan.Destination);

    if (!Backend->Connect())
    {
        throw ConnectionError("Failed to connect to storage for destination: " + Plan.Destination);
    }

    int64_t FreeSpace = Backend->GetFreeSpace(Plan.Destination);
    if (FreeSpace < 0)
    {
        Log.Info("[Transport] Free space unknown for " + Plan.Destination + ", capacity check skipped");
    }
    else if (static_cast<uint64_t>(FreeSpace) < Candidates.TotalBytes)
    {
        Log.Error("[Transport] Insufficient space on " + Plan.Destination);
        throw CapacityError(Candidates.TotalBytes, FreeSpace);
    }

    if (!Backend->Exists(Plan.Destination))
    {
        Log.Info("[Transport] Creating destination " + Plan.Destination);
        Backend->MakeDir(Plan.Destination);
    }

    Log.Info(std::string("[Transport] Transfer starting (resume=") + (Options.Resume ? "true" : "false") +
             ", verify=" + (Options.Verify ? "true" : "false") + ")");
    Backend->Transfer(Plan, Options.Resume, Options.Verify);
    Log.Info("[Transport] Transfer finished: " + Plan.Destination);
}
