#pragma once

#include <chrono>
#include <ctime>
#include <cstdint>
#include <string>
#include <sys/stat.h>

//UNIX Time since Epoch, whole seconds
inline int64_t FileMTimeSeconds(const std::string& Path)
{
    struct stat StatBuf;
    if (stat(Path.c_str(), &StatBuf) != 0)
    {
        return 0;
    }
    return static_cast<int64_t>(StatBuf.st_mtime);
}

inline int64_t NowSeconds()
{
    return static_cast<int64_t>(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
}

// Midnight of the current local day.
inline int64_t StartOfLocalDaySeconds()
{
    std::time_t Now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm Local{};
    localtime_r(&Now, &Local);
    Local.tm_hour = 0;
    Local.tm_min = 0;
    Local.tm_sec = 0;
    Local.tm_isdst = -1;
    return static_cast<int64_t>(std::mktime(&Local));
}
