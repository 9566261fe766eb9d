#pragma once

#include "PlanParser.hpp"
#include "TransportService.hpp"

class ControlFlow
{
public:
    ControlFlow() = default;

    int Run();

private:
    PlanParser Parser;

    void LogPlan(const CopyPlan& Plan);
    void ReportPreview(const PreviewResult& Preview);
};
