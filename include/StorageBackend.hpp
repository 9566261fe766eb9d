#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "CopyPlan.hpp"

// One storage medium. Connect, GetFreeSpace, ListDirs and Exists are advisory
// probes and never throw; Transfer throws on any failure.
class StorageBackend
{
public:
    virtual ~StorageBackend() = default;

    virtual bool Connect() = 0;

    // Bytes available at Path, -1 when unknowable.
    virtual int64_t GetFreeSpace(const std::string& Path) = 0;

    virtual std::vector<std::string> ListDirs(const std::string& Path) = 0;
    virtual bool Exists(const std::string& Path) = 0;

    // Creates Path and missing ancestors. No error if it already exists.
    virtual void MakeDir(const std::string& Path) = 0;

    virtual void Transfer(const CopyPlan& Plan, bool Resume, bool Verify) = 0;

    virtual std::string Name() const = 0;
};
