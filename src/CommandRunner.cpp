#include "CommandRunner.hpp"
#include "Logger.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/wait.h>

CommandResult ShellCommandRunner::Run(const std::string& Command)
{
    CommandResult Result;
    Log.Debug("[CommandRunner] Running: " + Command);

    std::string FullCommand = Command + " 2>&1";
    FILE* Pipe = popen(FullCommand.c_str(), "r");
    if (Pipe == nullptr)
    {
        Log.Error(std::string("[CommandRunner] popen failed: ") + std::strerror(errno));
        return Result;
    }

    std::array<char, 4096> Buffer{};
    std::size_t Count = 0;
    while ((Count = std::fread(Buffer.data(), 1, Buffer.size(), Pipe)) > 0)
    {
        Result.Output.append(Buffer.data(), Count);
    }

    int Status = pclose(Pipe);
    if (Status == -1)
    {
        Log.Error(std::string("[CommandRunner] pclose failed: ") + std::strerror(errno));
        return Result;
    }
    Result.ExitCode = WIFEXITED(Status) ? WEXITSTATUS(Status) : 128 + WTERMSIG(Status);
    Log.Debug("[CommandRunner] Exit code " + std::to_string(Result.ExitCode));
    return Result;
}

std::string ShellQuote(const std::string& Text)
{
    if (Text.empty())
    {
        return "''";
    }

    bool Safe = true;
    for (char Ch : Text)
    {
        bool Plain = (Ch >= 'a' && Ch <= 'z') || (Ch >= 'A' && Ch <= 'Z') || (Ch >= '0' && Ch <= '9') ||
                     Ch == '_' || Ch == '-' || Ch == '.' || Ch == '/' || Ch == '@' || Ch == ':' ||
                     Ch == ',' || Ch == '+' || Ch == '=' || Ch == '%';
        if (!Plain)
        {
            Safe = false;
            break;
        }
    }
    if (Safe)
    {
        return Text;
    }

    std::string Quoted = "'";
    for (char Ch : Text)
    {
        if (Ch == '\'')
        {
            Quoted += "'\\''";
        }
        else
        {
            Quoted += Ch;
        }
    }
    Quoted += "'";
    return Quoted;
}
