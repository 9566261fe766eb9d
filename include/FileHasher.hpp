#pragma once

#include <string>

class FileHasher
{
public:
    // Lowercase hex BLAKE3 digest of the file contents. Throws std::runtime_error if unreadable.
    static std::string HashFile(const std::string& FilePath);

private:
    static constexpr std::size_t ReadChunkSize = 64 * 1024;
};
