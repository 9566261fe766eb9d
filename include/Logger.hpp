#pragma once

#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel
{
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    void Init(const std::string& LogDir);
    void Log(LogLevel Level, const std::string& Message);
    void Debug(const std::string& Message);
    void Info(const std::string& Message);
    void Warn(const std::string& Message);
    void Error(const std::string& Message);
    void CleanupOldLogs();
    void SetMinLevel(LogLevel Level);

    static std::string GetTimestampForFilename();
    static bool ParseLevel(const std::string& Text, LogLevel& Level);

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    std::mutex LogWriteMutex;
    std::string LogDirectory;
    LogLevel MinLevel = LogLevel::INFO;

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;

    void OpenLogFile(const std::string& FilePath);
};

extern Logger Log;
