#include "FileHasher.hpp"
#include <blake3.h>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <vector>

std::string FileHasher::HashFile(const std::string& FilePath)
{
    std::ifstream Input(FilePath, std::ios::binary);
    if (!Input.is_open())
    {
        throw std::runtime_error("Failed to open file for hashing: " + FilePath);
    }

    blake3_hasher Hasher;
    blake3_hasher_init(&Hasher);

    std::vector<char> Buffer(ReadChunkSize);
    while (Input)
    {
        Input.read(Buffer.data(), static_cast<std::streamsize>(Buffer.size()));
        std::streamsize Count = Input.gcount();
        if (Count > 0)
        {
            blake3_hasher_update(&Hasher, Buffer.data(), static_cast<size_t>(Count));
        }
    }
    if (Input.bad())
    {
        throw std::runtime_error("Read error while hashing: " + FilePath);
    }

    uint8_t OutHash[BLAKE3_OUT_LEN] = { 0 };
    blake3_hasher_finalize(&Hasher, OutHash, BLAKE3_OUT_LEN);

    static const char HexDigits[] = "0123456789abcdef";
    std::string Digest;
    Digest.reserve(BLAKE3_OUT_LEN * 2);
    for (uint8_t Byte : OutHash)
    {
        Digest += HexDigits[Byte >> 4];
        Digest += HexDigits[Byte & 0x0F];
    }
    return Digest;
}
