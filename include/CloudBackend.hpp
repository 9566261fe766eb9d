#pragma once

#include <vector>

#include "StorageBackend.hpp"

struct CloudUploadRecord
{
    std::string Source;
    std::string Destination;
    bool Resumable = false;
    bool Verify = false;
};

// Object storage placeholder: accepts every probe and records uploads without network I/O.
class CloudBackend : public StorageBackend
{
public:
    bool Connect() override;
    int64_t GetFreeSpace(const std::string& Path) override;
    std::vector<std::string> ListDirs(const std::string& Path) override;
    bool Exists(const std::string& Path) override;
    void MakeDir(const std::string& Path) override;
    void Transfer(const CopyPlan& Plan, bool Resume, bool Verify) override;
    std::string Name() const override;

    const std::vector<CloudUploadRecord>& GetUploads() const;

private:
    std::vector<CloudUploadRecord> Uploads;
};
