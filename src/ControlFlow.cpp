#include <iostream>
#include <memory>
#include <string>

#include "ControlFlow.hpp"
#include "CommandRunner.hpp"
#include "ConfigGlobal.hpp"
#include "FailureDetect.hpp"
#include "Logger.hpp"
#include "StorageRegistry.hpp"
#include "TransportErrors.hpp"

int ControlFlow::Run()
{
    bool Parsed = Parser.Parse(ConfigGlobal::ConfigFile);

    // LogDir may come from the plan file, so the log opens after parsing.
    Log.Init(ConfigGlobal::LogDir);
    Log.SetMinLevel(ConfigGlobal::MinLogLevel);
    std::cout << "Starting RouteCopy \n";

    if (!Parsed)
    {
        for (const auto& Error : Parser.GetErrors())
        {
            std::cerr << "Plan Error: " << Error << "\n";
            Log.Error(Error);
        }
        std::cerr << "Check Errors and Fix Them, Exiting\n";
        Log.Error("Check Errors and Fix Them, Exiting");
        return 1;
    }
    Log.Info("Plan Parsed Successfully.");
    std::cout << "Plan Parsed Successfully.\n";

    for (const auto& Info : Parser.GetInfos())
    {
        std::cout << "Plan Info: " << Info << "\n";
        Log.Info(Info);
    }

    TransferOptions Options;
    Options.Resume = ConfigGlobal::Resume;
    Options.Verify = ConfigGlobal::Verify;

    if (FailureDetect::WasLastFailure())
    {
        std::cout << "Previous transfer did not complete. Resuming.\n";
        Log.Info("Previous transfer incomplete, forcing resume mode.");
        Options.Resume = true;
    }
    else if (FailureDetect::WasLastSuccess())
    {
        Log.Info("Last transfer completed successfully.");
    }
    if (!FailureDetect::MarkFailure())
    {
        std::cerr << "Warning: could not record run status in " << ConfigGlobal::LogDir << "\n";
    }

    Log.CleanupOldLogs();

    const CopyPlan& Plan = Parser.GetPlan();
    LogPlan(Plan);

    StorageRegistry Registry = StorageRegistry::CreateDefault(std::make_shared<ShellCommandRunner>(), ConfigGlobal::SshKeyPath);
    TransportService Transport([&Registry](const CopyPlan& P) { return Registry.Build(P); }, ConfigGlobal::PreviewLimit);

    try
    {
        ReportPreview(Transport.Preview(Plan));

        std::cout << "Transferring...\n";
        Transport.Execute(Plan, Options);
    }
    catch (const CapacityError& e)
    {
        std::cerr << "Not enough space: need " << e.Required << " bytes, " << e.Available << " available.\n";
        Log.Error(e.what());
        return 1;
    }
    catch (const VerificationError& e)
    {
        std::cerr << "Verification failed for " << e.RelativePath << ". Destination content is untrusted.\n";
        Log.Error(e.what());
        return 1;
    }
    catch (const StorageError& e)
    {
        std::cerr << "Transfer failed: " << e.what() << "\n";
        Log.Error(std::string("Transfer failed: ") + e.what());
        std::cerr << "Partially copied files are kept. Run again to resume.\n";
        return 1;
    }

    if (!FailureDetect::MarkSuccess())
    {
        std::cerr << "Warning: could not record run status in " << ConfigGlobal::LogDir << "\n";
    }

    Log.Info("Transfer Completed");
    std::cout << "Logs Saved to : " << Log.CurrentLogFilePath << "\n";
    std::cout << "Transfer Complete \n";
    return 0;
}

void ControlFlow::LogPlan(const CopyPlan& Plan)
{
    Log.Info("Source: " + Plan.Source);
    Log.Info("Destination: " + Plan.Destination);
    Log.Info("Backend: " + (Plan.BackendKey ? *Plan.BackendKey : std::string("auto")));
    if (Plan.PresetName)
    {
        Log.Info("Preset: " + *Plan.PresetName);
    }
    Log.Info("Filter " + Plan.Filter.Name + ": " + Plan.Filter.Summary());
}

void ControlFlow::ReportPreview(const PreviewResult& Preview)
{
    for (const auto& File : Preview.Files)
    {
        std::cout << "  " << File << "\n";
        Log.Debug("Candidate: " + File);
    }
    std::cout << "Total: " << Preview.TotalBytes << " bytes\n";
    Log.Info("Preview total: " + std::to_string(Preview.TotalBytes) + " bytes");
}
