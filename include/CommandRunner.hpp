#pragma once

#include <string>

struct CommandResult
{
    int ExitCode = -1;
    std::string Output;
};

// Runs one shell command line. Backends build commands, runners execute them.
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult Run(const std::string& Command) = 0;
};

// popen based runner; stderr is folded into the captured output.
class ShellCommandRunner : public CommandRunner
{
public:
    CommandResult Run(const std::string& Command) override;
};

// POSIX single-quote escaping, safe for any byte except NUL.
std::string ShellQuote(const std::string& Text);
