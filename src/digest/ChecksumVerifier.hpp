#pragma once

#include <filesystem>
#include <string>

namespace digest
{

enum class Algorithm
{
    None,
    MD5,
    SHA1,
    SHA256,
    SHA512
};

class ChecksumVerifier
{
public:
    // Streams the file through the selected hash and returns lowercase hex.
    // Algorithm::None yields an empty string without touching the file.
    // Throws utils::VerificationInputError when the file cannot be read.
    static std::string computeDigest(const std::filesystem::path& path, Algorithm algorithm);

    // Case-insensitive compare against expectedHex. A mismatch is a normal false, read
    // failures still throw. With Algorithm::None only existence as a regular file is checked.
    static bool verify(const std::filesystem::path& path, Algorithm algorithm, const std::string& expectedHex);

    static bool hexEquals(const std::string& lhs, const std::string& rhs);

    static std::string algorithmName(Algorithm algorithm);

    // Accepts "none", "md5", "sha1", "sha256", "sha512" and the dashed SHA spellings.
    static bool tryParseAlgorithm(const std::string& name, Algorithm& outAlgorithm);
};

} // namespace digest
