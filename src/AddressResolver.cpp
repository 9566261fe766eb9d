#include "AddressResolver.hpp"
#include "TransportErrors.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace FS = std::filesystem;

bool AddressResolver::IsRemote(const std::string& Address)
{
    return Address.find('@') != std::string::npos && Address.find(':') != std::string::npos;
}

bool AddressResolver::IsCloud(const std::string& Address)
{
    std::size_t SchemeEnd = Address.find("://");
    if (SchemeEnd == std::string::npos || SchemeEnd == 0)
    {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(Address[0])))
    {
        return false;
    }
    for (std::size_t i = 1; i < SchemeEnd; ++i)
    {
        unsigned char Ch = static_cast<unsigned char>(Address[i]);
        if (!std::isalnum(Ch) && Ch != '+' && Ch != '-' && Ch != '.')
        {
            return false;
        }
    }
    return true;
}

std::string AddressResolver::StripTrailingSlashes(const std::string& Text)
{
    std::string Out = Text;
    while (!Out.empty() && Out.back() == '/')
    {
        Out.pop_back();
    }
    return Out;
}

std::string AddressResolver::CleanRelativeDir(const std::string& RelativeDir)
{
    const std::string Strip = " \t\r\n/";
    std::size_t Begin = RelativeDir.find_first_not_of(Strip);
    if (Begin == std::string::npos)
    {
        return "";
    }
    std::size_t End = RelativeDir.find_last_not_of(Strip);
    return RelativeDir.substr(Begin, End - Begin + 1);
}

std::string AddressResolver::Join(const std::string& Device, const std::string& RelativeDir)
{
    std::string CleanDir = CleanRelativeDir(RelativeDir);

    if (IsCloud(Device))
    {
        return CleanDir.empty() ? Device : StripTrailingSlashes(Device) + "/" + CleanDir;
    }

    if (IsRemote(Device))
    {
        std::size_t Colon = Device.find(':');
        std::string UserHost = Device.substr(0, Colon);
        std::string RemoteBase = StripTrailingSlashes(Device.substr(Colon + 1));
        if (CleanDir.empty())
        {
            return UserHost + ":" + RemoteBase;
        }
        return UserHost + ":" + RemoteBase + "/" + CleanDir;
    }

    if (CleanDir.empty())
    {
        return Device;
    }
    return (FS::path(Device) / CleanDir).string();
}

std::pair<std::string, std::string> AddressResolver::Split(const std::string& Address)
{
    if (IsCloud(Address))
    {
        std::string Cleaned = StripTrailingSlashes(Address);
        std::size_t PrefixEnd = Address.find("://") + 3;
        std::size_t Slash = Cleaned.rfind('/');
        // The bucket itself has no parent inside the store.
        if (Slash == std::string::npos || Slash < PrefixEnd)
        {
            return { Address, "" };
        }
        return { Cleaned.substr(0, Slash), Cleaned.substr(Slash + 1) };
    }

    if (IsRemote(Address))
    {
        std::size_t Colon = Address.find(':');
        std::string UserHost = Address.substr(0, Colon);
        std::string Cleaned = StripTrailingSlashes(Address.substr(Colon + 1));
        std::size_t Slash = Cleaned.rfind('/');
        if (Slash == std::string::npos)
        {
            return { Address, "" };
        }
        std::string Head = Cleaned.substr(0, Slash);
        if (Head.empty())
        {
            Head = "/";
        }
        return { UserHost + ":" + Head, Cleaned.substr(Slash + 1) };
    }

    std::string Cleaned = StripTrailingSlashes(Address);
    if (Cleaned.empty())
    {
        return { Address, "" };
    }
    FS::path LocalPath(Cleaned);
    if (!LocalPath.has_filename())
    {
        return { Cleaned, "" };
    }
    return { LocalPath.parent_path().string(), LocalPath.filename().string() };
}

RemoteAddress AddressResolver::SplitRemote(const std::string& Address)
{
    if (!IsRemote(Address))
    {
        throw AddressKindError("Address is not remote: " + Address);
    }

    std::size_t Colon = Address.find(':');
    std::string UserHost = Address.substr(0, Colon);
    std::size_t At = UserHost.find('@');
    if (At == std::string::npos)
    {
        throw AddressKindError("Address has no user@host part: " + Address);
    }

    RemoteAddress Remote;
    Remote.User = UserHost.substr(0, At);
    Remote.Host = UserHost.substr(At + 1);
    Remote.Path = Address.substr(Colon + 1);
    return Remote;
}

std::string AddressResolver::ExpandUser(const std::string& Path)
{
    if (Path.empty() || Path[0] != '~' || (Path.size() > 1 && Path[1] != '/'))
    {
        return Path;
    }
    const char* Home = std::getenv("HOME");
    if (Home == nullptr)
    {
        return Path;
    }
    return std::string(Home) + Path.substr(1);
}
