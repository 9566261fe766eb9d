#pragma once

#include <string>
#include <utility>

struct RemoteAddress
{
    std::string User;
    std::string Host;
    std::string Path;
};

// Classifies address strings and composes "device root + save directory".
// local  : /mnt/usb/backup
// remote : user@host:/data
// cloud  : scheme://bucket/prefix
class AddressResolver
{
public:
    static bool IsRemote(const std::string& Address);
    static bool IsCloud(const std::string& Address);

    static std::string Join(const std::string& Device, const std::string& RelativeDir);
    static std::pair<std::string, std::string> Split(const std::string& Address);

    // Throws AddressKindError when Address is not user@host:path.
    static RemoteAddress SplitRemote(const std::string& Address);

    static std::string ExpandUser(const std::string& Path);

private:
    static std::string CleanRelativeDir(const std::string& RelativeDir);
    static std::string StripTrailingSlashes(const std::string& Text);
};
