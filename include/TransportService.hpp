#pragma once

#include <cstddef>
#include <memory>

#include "CopyPlan.hpp"
#include "FilterEngine.hpp"
#include "StorageRegistry.hpp"

struct TransferOptions
{
    bool Resume = true;
    bool Verify = false;
};

// Runs one plan: Preview, Connect, CapacityCheck, EnsureDestination, Transfer.
class TransportService
{
public:
    explicit TransportService(BackendFactory Factory, std::size_t PreviewLimit = 50);

    PreviewResult Preview(const CopyPlan& Plan) const;
    void Execute(const CopyPlan& Plan, const TransferOptions& Options) const;

private:
    BackendFactory Factory;
    std::size_t PreviewLimit;
};
