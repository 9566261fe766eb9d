#pragma once

#include <istream>
#include <string>
#include <vector>

#include "CopyPlan.hpp"

// Reads "Key = Value" plan files. Plan fields land in GetPlan(), run options in ConfigGlobal.
class PlanParser
{
public:
    PlanParser() = default;
    bool Parse(const std::string& FilePath);
    bool ParseStream(std::istream& Input);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const CopyPlan& GetPlan() const;
    void Reset();

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);
    void ApplyKey(const std::string& Key, const std::string& Value, int LineNumber);
    bool ParseBool(const std::string& Value, bool& Out) const;
    bool Finish();

    static std::vector<std::string> SplitList(const std::string& Value);

    CopyPlan Plan;
    std::string DestinationDevice;
    std::string SaveDirectory;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
