#pragma once

#include <string>
#include <filesystem>
#include <cstdint>

#include "Logger.hpp"

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern std::string SshKeyPath;
    extern LogLevel MinLogLevel;
    extern bool Resume;
    extern bool Verify;

    extern unsigned short int MaxLogFiles;
    extern unsigned short int SshConnectTimeout;
    extern std::size_t PreviewLimit;

    extern std::filesystem::path FailureFile;
    extern std::filesystem::path SuccessFile;

    void InitializeDefaults();
    void ResolveMarkerFiles();
}
