#include "CloudBackend.hpp"
#include "Logger.hpp"

std::string CloudBackend::Name() const
{
    return "cloud";
}

bool CloudBackend::Connect()
{
    return true;
}

int64_t CloudBackend::GetFreeSpace(const std::string&)
{
    return -1;
}

std::vector<std::string> CloudBackend::ListDirs(const std::string&)
{
    return {};
}

bool CloudBackend::Exists(const std::string&)
{
    return true;
}

void CloudBackend::MakeDir(const std::string&)
{
}

void CloudBackend::Transfer(const CopyPlan& Plan, bool Resume, bool Verify)
{
    Log.Info("[Cloud] Upload requested (no network I/O): " + Plan.Source + " -> " + Plan.Destination);
    if (Resume)
    {
        Log.Info("[Cloud] Resumable chunked upload requested");
    }
    Uploads.push_back({ Plan.Source, Plan.Destination, Resume, Verify });
}

const std::vector<CloudUploadRecord>& CloudBackend::GetUploads() const
{
    return Uploads;
}
