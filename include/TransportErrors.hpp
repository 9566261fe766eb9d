#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

// Every fatal condition of a transfer derives from StorageError.
class StorageError : public std::runtime_error
{
public:
    explicit StorageError(const std::string& Message) : std::runtime_error(Message) {}
};

class ConnectionError : public StorageError
{
public:
    explicit ConnectionError(const std::string& Message) : StorageError(Message) {}
};

class CapacityError : public StorageError
{
public:
    CapacityError(uint64_t RequiredBytes, int64_t AvailableBytes)
        : StorageError("Insufficient space on destination. Required: " + std::to_string(RequiredBytes) +
                       " bytes, Available: " + std::to_string(AvailableBytes) + " bytes."),
          Required(RequiredBytes), Available(AvailableBytes) {}

    uint64_t Required;
    int64_t Available;
};

class TransferError : public StorageError
{
public:
    explicit TransferError(const std::string& Message, int Code = -1) : StorageError(Message), ExitCode(Code) {}

    int ExitCode;
};

class VerificationError : public StorageError
{
public:
    VerificationError(const std::string& Path, const std::string& SrcDigest, const std::string& DstDigest)
        : StorageError("Checksum mismatch [blake3]: " + Path + " (src=" + SrcDigest + ", dst=" + DstDigest + ")"),
          RelativePath(Path), SourceDigest(SrcDigest), DestinationDigest(DstDigest) {}

    std::string RelativePath;
    std::string SourceDigest;
    std::string DestinationDigest;
};

class UnregisteredBackendError : public StorageError
{
public:
    explicit UnregisteredBackendError(const std::string& BackendKey)
        : StorageError("Storage backend key not registered: " + BackendKey), Key(BackendKey) {}

    std::string Key;
};

class UnsupportedRouteError : public StorageError
{
public:
    explicit UnsupportedRouteError(const std::string& Message) : StorageError(Message) {}
};

class AddressKindError : public StorageError
{
public:
    explicit AddressKindError(const std::string& Message) : StorageError(Message) {}
};
