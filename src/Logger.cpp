#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>
#include <cctype>

Logger Log;
namespace FS = std::filesystem;

void Logger::Init(const std::string& LogDir)
{
    std::error_code ec;
    if (!FS::exists(LogDir, ec))
    {
        FS::create_directories(LogDir, ec);
        if (ec)
        {
            std::cerr << "Logger: Failed to create log directory: " << LogDir << " (" << ec.message() << ")\n";
            return;
        }
    }

    LogDirectory = LogDir;
    CurrentLogFilePath = (FS::path(LogDir) / ("Transfer_Log" + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("Run Started at " + GetTimestamp());
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Info("Run Finished at " + GetTimestamp());
        LogFile.close();
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

void Logger::CleanupOldLogs()
{
    if (LogDirectory.empty())
    {
        return;
    }

    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(LogDirectory, ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().find("Transfer_Log") == 0)
        {
            Logs.push_back(Entry);
        }
    }

    if ((int)Logs.size() <= ConfigGlobal::MaxLogFiles)
    {
        return;
    }

    // Timestamped names sort oldest first.
    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while ((int)Logs.size() > ConfigGlobal::MaxLogFiles)
    {
        if (Logs.front().path().string() != CurrentLogFilePath && !FS::remove(Logs.front().path(), ec) && ec)
        {
            Warn("Could not remove old log " + Logs.front().path().string() + ": " + ec.message());
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::SetMinLevel(LogLevel Level)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    MinLevel = Level;
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open() || Level < MinLevel)
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::Debug(const std::string& Message)
{
    Log(LogLevel::DEBUG, Message);
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

std::string Logger::GetTimestampForFilename()
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};
    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y%m%d_%H%M%S");
    return Stream.str();
}

bool Logger::ParseLevel(const std::string& Text, LogLevel& Level)
{
    std::string Upper = Text;
    std::transform(Upper.begin(), Upper.end(), Upper.begin(), [](unsigned char Ch) { return static_cast<char>(std::toupper(Ch)); });

    if (Upper == "DEBUG")      Level = LogLevel::DEBUG;
    else if (Upper == "INFO")  Level = LogLevel::INFO;
    else if (Upper == "WARN")  Level = LogLevel::WARN;
    else if (Upper == "ERROR") Level = LogLevel::ERROR;
    else return false;

    return true;
}

std::string Logger::GetTimestamp() const
{
    auto Now = std::chrono::system_clock::now();
    std::time_t Time = std::chrono::system_clock::to_time_t(Now);
    std::tm Local{};
    localtime_r(&Time, &Local);

    std::ostringstream Stream;
    Stream << std::put_time(&Local, "%Y-%m-%d %H:%M:%S");
    return Stream.str();
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
