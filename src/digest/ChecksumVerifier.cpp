#include "ChecksumVerifier.hpp"
#include "../utils/SyncErrors.hpp"

#include <openssl/evp.h>
#include <picosha2.h>
#include <plog/Log.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace
{

constexpr std::size_t kReadChunkSize = 64 * 1024;

struct EvpContextDeleter
{
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::ifstream openForDigest(const fs::path& path)
{
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status))
    {
        throw utils::VerificationInputError("Local file does not exist", path.string());
    }
    if (!fs::is_regular_file(status))
    {
        throw utils::VerificationInputError("Local path is not a regular file", path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        throw utils::VerificationInputError("Failed to open file for checksum verification", path.string());
    }
    return file;
}

// Feeds the stream to sink in fixed-size chunks so large files never sit in memory.
template <typename Sink>
void streamChunks(std::ifstream& file, const fs::path& path, Sink&& sink)
{
    std::vector<char> buffer(kReadChunkSize);
    while (file)
    {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = file.gcount();
        if (count > 0)
        {
            sink(buffer.data(), static_cast<std::size_t>(count));
        }
    }

    if (file.bad())
    {
        throw utils::VerificationInputError("Read error during checksum computation", path.string());
    }
}

std::string sha256Hex(std::ifstream& file, const fs::path& path)
{
    picosha2::hash256_one_by_one hasher;
    streamChunks(file, path, [&hasher](const char* data, std::size_t size) { hasher.process(data, data + size); });
    hasher.finish();
    return picosha2::get_hash_hex_string(hasher);
}

std::string evpHex(std::ifstream& file, const fs::path& path, const EVP_MD* md)
{
    std::unique_ptr<EVP_MD_CTX, EvpContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
    {
        throw std::runtime_error("OpenSSL digest initialization failed");
    }

    streamChunks(file, path,
                 [&ctx](const char* data, std::size_t size)
                 {
                     if (EVP_DigestUpdate(ctx.get(), data, size) != 1)
                     {
                         throw std::runtime_error("OpenSSL digest update failed");
                     }
                 });

    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash.data(), &length) != 1)
    {
        throw std::runtime_error("OpenSSL digest finalization failed");
    }

    return picosha2::bytes_to_hex_string(hash.begin(), hash.begin() + length);
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

namespace digest
{

std::string ChecksumVerifier::computeDigest(const fs::path& path, Algorithm algorithm)
{
    if (algorithm == Algorithm::None)
    {
        return {};
    }

    std::ifstream file = openForDigest(path);

    switch (algorithm)
    {
    case Algorithm::MD5:
        return evpHex(file, path, EVP_md5());
    case Algorithm::SHA1:
        return evpHex(file, path, EVP_sha1());
    case Algorithm::SHA256:
        return sha256Hex(file, path);
    case Algorithm::SHA512:
        return evpHex(file, path, EVP_sha512());
    case Algorithm::None:
        break;
    }
    return {};
}

bool ChecksumVerifier::verify(const fs::path& path, Algorithm algorithm, const std::string& expectedHex)
{
    if (algorithm == Algorithm::None)
    {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    const std::string actual = computeDigest(path, algorithm);
    const bool matches = hexEquals(actual, expectedHex);
    if (!matches)
    {
        PLOG_DEBUG << "Checksum mismatch for " << path.string() << ": expected " << expectedHex << ", got " << actual;
    }
    return matches;
}

bool ChecksumVerifier::hexEquals(const std::string& lhs, const std::string& rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

std::string ChecksumVerifier::algorithmName(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::None:
        return "none";
    case Algorithm::MD5:
        return "md5";
    case Algorithm::SHA1:
        return "sha1";
    case Algorithm::SHA256:
        return "sha256";
    case Algorithm::SHA512:
        return "sha512";
    }
    return "none";
}

bool ChecksumVerifier::tryParseAlgorithm(const std::string& name, Algorithm& outAlgorithm)
{
    const std::string key = toLower(name);
    if (key.empty() || key == "none")
    {
        outAlgorithm = Algorithm::None;
    }
    else if (key == "md5")
    {
        outAlgorithm = Algorithm::MD5;
    }
    else if (key == "sha1" || key == "sha-1")
    {
        outAlgorithm = Algorithm::SHA1;
    }
    else if (key == "sha256" || key == "sha-256")
    {
        outAlgorithm = Algorithm::SHA256;
    }
    else if (key == "sha512" || key == "sha-512")
    {
        outAlgorithm = Algorithm::SHA512;
    }
    else
    {
        return false;
    }
    return true;
}

} // namespace digest
