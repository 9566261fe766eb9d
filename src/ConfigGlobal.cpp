#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    std::string SshKeyPath;
    LogLevel MinLogLevel;
    bool Resume;
    bool Verify;

    unsigned short int MaxLogFiles;
    unsigned short int SshConnectTimeout;
    std::size_t PreviewLimit;

    std::filesystem::path FailureFile;
    std::filesystem::path SuccessFile;

    void InitializeDefaults()
    {
        ConfigFile = "Plan.txt"; //Relative to the working directory unless an absolute path is given
        LogDir = "Transfer_Logs";
        SshKeyPath.clear(); //Empty means ssh picks its default identity
        MinLogLevel = LogLevel::INFO;
        Resume = true;
        Verify = false;
        MaxLogFiles = 10;
        SshConnectTimeout = 5;
        PreviewLimit = 50;
        ResolveMarkerFiles();
    }

    void ResolveMarkerFiles()
    {
        FailureFile = std::filesystem::path(LogDir) / ".TransferIncomplete";
        SuccessFile = std::filesystem::path(LogDir) / ".TransferComplete";
    }
}
