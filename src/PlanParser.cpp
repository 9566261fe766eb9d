#include <algorithm>
#include <cctype>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>

#include "PlanParser.hpp"
#include "AddressResolver.hpp"
#include "ConfigGlobal.hpp"
#include "FilterEngine.hpp"

namespace
{
    void TrimInPlace(std::string& Text)
    {
        Text.erase(Text.begin(), std::find_if(Text.begin(), Text.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Text.erase(std::find_if(Text.rbegin(), Text.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Text.end());
    }
}

const std::vector<std::string>& PlanParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& PlanParser::GetInfos() const
{
    return Infos;
}

const CopyPlan& PlanParser::GetPlan() const
{
    return Plan;
}

void PlanParser::Reset()
{
    Plan = CopyPlan{};
    DestinationDevice.clear();
    SaveDirectory.clear();
    Errors.clear();
    Infos.clear();

    ConfigGlobal::InitializeDefaults();
}

void PlanParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void PlanParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

std::vector<std::string> PlanParser::SplitList(const std::string& Value)
{
    std::vector<std::string> Items;
    std::stringstream Stream(Value);
    std::string Item;
    while (std::getline(Stream, Item, ','))
    {
        TrimInPlace(Item);
        if (!Item.empty())
        {
            Items.push_back(Item);
        }
    }
    return Items;
}

bool PlanParser::ParseBool(const std::string& Value, bool& Out) const
{
    std::string Lower = Value;
    std::transform(Lower.begin(), Lower.end(), Lower.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
    if (Lower == "true" || Lower == "yes" || Lower == "1")
    {
        Out = true;
        return true;
    }
    if (Lower == "false" || Lower == "no" || Lower == "0")
    {
        Out = false;
        return true;
    }
    return false;
}

bool PlanParser::Parse(const std::string& FilePath)
{
    if (!std::filesystem::exists(FilePath))
    {
        AddError("Plan file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open plan file: " + FilePath);
        return false;
    }

    return ParseStream(File);
}

bool PlanParser::ParseStream(std::istream& Input)
{
    std::string Line;
    int LineNumber = 0;

    while (std::getline(Input, Line))
    {
        LineNumber++;
        TrimInPlace(Line);

        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        std::size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddError("Invalid format on line " + std::to_string(LineNumber) + ": No '=' found.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Line.substr(EqualPos + 1);

        Key.erase(std::remove_if(Key.begin(), Key.end(), [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());
        TrimInPlace(Value);

        ApplyKey(Key, Value, LineNumber);
    }

    return Finish();
}

void PlanParser::ApplyKey(const std::string& Key, const std::string& Value, int LineNumber)
{
    const std::string Where = "Line " + std::to_string(LineNumber) + ": ";

    if (Key == "Source")
    {
        if (Value.empty())
        {
            AddError(Where + "Source is empty.");
            return;
        }
        if (!Plan.Source.empty())
        {
            AddError(Where + "Multiple source entries found.");
            return;
        }
        Plan.Source = Value;
    }

    else if (Key == "Destination")
    {
        if (Value.empty())
        {
            AddError(Where + "Destination is empty.");
            return;
        }
        if (!Plan.Destination.empty())
        {
            AddError(Where + "Multiple destination entries found.");
            return;
        }
        Plan.Destination = Value;
    }

    else if (Key == "DestinationDevice")
    {
        DestinationDevice = Value;
    }

    else if (Key == "SaveDirectory")
    {
        SaveDirectory = Value;
    }

    else if (Key == "Backend")
    {
        if (Value != "filesystem" && Value != "local" && Value != "remote" && Value != "cloud")
        {
            AddError(Where + "Unknown backend '" + Value + "'. Use 'filesystem', 'local', 'remote' or 'cloud'.");
            return;
        }
        Plan.BackendKey = Value;
    }

    else if (Key == "Preset")
    {
        Plan.PresetName = Value;
    }

    else if (Key == "FilterName")
    {
        Plan.Filter.Name = Value;
    }

    else if (Key == "IncludeDirs")
    {
        Plan.Filter.IncludeDirs = SplitList(Value);
        if (Plan.Filter.IncludeDirs.empty())
        {
            Plan.Filter.IncludeDirs = { "*" };
        }
    }

    else if (Key == "Patterns")
    {
        Plan.Filter.Patterns = SplitList(Value);
        if (Plan.Filter.Patterns.empty())
        {
            Plan.Filter.Patterns = { "*" };
        }
    }

    else if (Key == "TimeRange")
    {
        if (Value != "unlimited" && Value != "today" && Value != "1h")
        {
            AddInfo(Where + "Time range '" + Value + "' not recognized, no time floor will be applied.");
        }
        Plan.Filter.TimeRange = Value;
    }

    else if (Key == "SizeLimit")
    {
        Plan.Filter.SizeLimit = Value;
        AddInfo("Size floor set to " + std::to_string(FilterEngine::ParseSizeToBytes(Value)) + " bytes");
    }

    else if (Key == "Resume" || Key == "Verify")
    {
        bool Flag = false;
        if (!ParseBool(Value, Flag))
        {
            AddError(Where + "Invalid boolean for " + Key + ". Use 'true' or 'false'.");
            return;
        }
        (Key == "Resume" ? ConfigGlobal::Resume : ConfigGlobal::Verify) = Flag;
    }

    else if (Key == "SshKey")
    {
        ConfigGlobal::SshKeyPath = Value;
    }

    else if (Key == "PreviewLimit")
    {
        try
        {
            ConfigGlobal::PreviewLimit = static_cast<std::size_t>(std::stoul(Value));
        }
        catch (const std::exception&)
        {
            AddError(Where + "Invalid number for PreviewLimit.");
        }
    }

    else if (Key == "LogDir")
    {
        if (Value.empty())
        {
            AddError(Where + "LogDir is empty.");
            return;
        }
        ConfigGlobal::LogDir = Value;
        ConfigGlobal::ResolveMarkerFiles();
    }

    else if (Key == "MaxLogFiles")
    {
        try
        {
            int ValueNum = std::stoi(Value);
            if (ValueNum <= 0)
            {
                AddError(Where + "MaxLogFiles must be greater than zero.");
                return;
            }
            ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(ValueNum);
        }
        catch (const std::exception&)
        {
            AddError(Where + "Invalid number for MaxLogFiles.");
        }
    }

    else if (Key == "LogLevel")
    {
        LogLevel Level;
        if (!Logger::ParseLevel(Value, Level))
        {
            AddError(Where + "Invalid LogLevel. Use 'DEBUG', 'INFO', 'WARN' or 'ERROR'.");
            return;
        }
        ConfigGlobal::MinLogLevel = Level;
    }

    else
    {
        AddError(Where + "Unknown key '" + Key + "'.");
    }
}

bool PlanParser::Finish()
{
    if (!DestinationDevice.empty())
    {
        if (!Plan.Destination.empty())
        {
            AddError("Both Destination and DestinationDevice are set. Use one of them.");
        }
        else
        {
            Plan.Destination = AddressResolver::Join(DestinationDevice, SaveDirectory);
            AddInfo("Destination resolved to " + Plan.Destination);
        }
    }
    else if (!SaveDirectory.empty())
    {
        AddError("SaveDirectory requires DestinationDevice.");
    }

    if (Plan.Source.empty())
    {
        AddError("No Source specified.");
    }
    if (Plan.Destination.empty())
    {
        AddError("No Destination specified.");
    }

    return Errors.empty();
}
