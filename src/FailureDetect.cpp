#include "FailureDetect.hpp"
#include "ConfigGlobal.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fstream>

namespace FailureDetect
{
    bool MarkFailure()
    {
        std::error_code ec;
        std::filesystem::remove(ConfigGlobal::SuccessFile, ec); // absent marker is fine

        std::ofstream ofs(ConfigGlobal::FailureFile, std::ios::trunc);
        if (!ofs.good())
        {
            Log.Warn("Could not write run marker: " + ConfigGlobal::FailureFile.string());
            return false;
        }
        return true;
    }

    bool MarkSuccess()
    {
        std::error_code ec;
        std::filesystem::remove(ConfigGlobal::FailureFile, ec); // absent marker is fine

        std::ofstream ofs(ConfigGlobal::SuccessFile, std::ios::trunc);
        if (!ofs.good())
        {
            Log.Warn("Could not write run marker: " + ConfigGlobal::SuccessFile.string());
            return false;
        }
        return true;
    }

    bool WasLastSuccess()
    {
        std::error_code ec;
        return std::filesystem::exists(ConfigGlobal::SuccessFile, ec);
    }

    bool WasLastFailure()
    {
        std::error_code ec;
        return std::filesystem::exists(ConfigGlobal::FailureFile, ec);
    }
}
