#include <catch2/catch_test_macros.hpp>
#include "digest/ChecksumVerifier.hpp"
#include "utils/SyncErrors.hpp"
#include "../utils/TempDir.hpp"

#include <cctype>
#include <string>

using digest::Algorithm;
using digest::ChecksumVerifier;
using test_utils::TempDir;

namespace {

const std::string kAbcMd5 = "900150983cd24fb0d6963f7d28e17f72";
const std::string kAbcSha1 = "a9993e364706816aba3e25717850c26c9cd0d89d";
const std::string kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const std::string kAbcSha512 =
    "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
    "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f";

}  // namespace

TEST_CASE("ChecksumVerifier - Known digests", "[digest]")
{
    TempDir dir;
    const auto file = dir.write("abc.txt", "abc");

    SECTION("MD5")
    {
        REQUIRE(ChecksumVerifier::computeDigest(file, Algorithm::MD5) == kAbcMd5);
    }

    SECTION("SHA-1")
    {
        REQUIRE(ChecksumVerifier::computeDigest(file, Algorithm::SHA1) == kAbcSha1);
    }

    SECTION("SHA-256")
    {
        REQUIRE(ChecksumVerifier::computeDigest(file, Algorithm::SHA256) == kAbcSha256);
    }

    SECTION("SHA-512")
    {
        REQUIRE(ChecksumVerifier::computeDigest(file, Algorithm::SHA512) == kAbcSha512);
    }

    SECTION("None yields an empty digest")
    {
        REQUIRE(ChecksumVerifier::computeDigest(file, Algorithm::None).empty());
    }
}

TEST_CASE("ChecksumVerifier - Empty file", "[digest]")
{
    TempDir dir;
    const auto file = dir.write("empty.bin", "");

    REQUIRE(ChecksumVerifier::computeDigest(file, Algorithm::MD5) == "d41d8cd98f00b204e9800998ecf8427e");
    REQUIRE(ChecksumVerifier::computeDigest(file, Algorithm::SHA256) ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("ChecksumVerifier - Large file spans several read chunks", "[digest]")
{
    TempDir dir;
    // 200 KiB of 'a', crossing the 64 KiB read boundary more than once
    const std::string content(200 * 1024, 'a');
    const auto file = dir.write("big.bin", content);

    const std::string once = ChecksumVerifier::computeDigest(file, Algorithm::SHA256);
    REQUIRE(once.size() == 64);
    REQUIRE(ChecksumVerifier::computeDigest(file, Algorithm::SHA256) == once);
    REQUIRE(ChecksumVerifier::verify(file, Algorithm::SHA256, once));
}

TEST_CASE("ChecksumVerifier - Verify", "[digest]")
{
    TempDir dir;
    const auto file = dir.write("abc.txt", "abc");

    SECTION("Match is case-insensitive")
    {
        std::string upper = kAbcSha1;
        for (auto& c : upper)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        REQUIRE(ChecksumVerifier::verify(file, Algorithm::SHA1, upper));
    }

    SECTION("Mismatch returns false")
    {
        REQUIRE_FALSE(ChecksumVerifier::verify(file, Algorithm::MD5, kAbcSha1.substr(0, 32)));
    }

    SECTION("Single byte change is detected")
    {
        dir.write("abc.txt", "abd");
        REQUIRE_FALSE(ChecksumVerifier::verify(file, Algorithm::SHA512, kAbcSha512));
    }

    SECTION("None checks existence only")
    {
        REQUIRE(ChecksumVerifier::verify(file, Algorithm::None, "ignored"));
        REQUIRE_FALSE(ChecksumVerifier::verify(dir.file("missing.txt"), Algorithm::None, ""));
    }
}

TEST_CASE("ChecksumVerifier - Unreadable input", "[digest]")
{
    TempDir dir;

    SECTION("Missing file throws")
    {
        REQUIRE_THROWS_AS(ChecksumVerifier::computeDigest(dir.file("nope.bin"), Algorithm::SHA256),
                          utils::VerificationInputError);
    }

    SECTION("Directory throws")
    {
        REQUIRE_THROWS_AS(ChecksumVerifier::verify(dir.path(), Algorithm::MD5, kAbcMd5),
                          utils::VerificationInputError);
    }

    SECTION("Error carries the path as technical info")
    {
        const auto missing = dir.file("gone.bin");
        try
        {
            ChecksumVerifier::computeDigest(missing, Algorithm::SHA1);
            FAIL("computeDigest should have thrown");
        }
        catch (const utils::SyncError& e)
        {
            REQUIRE(e.technicalInfo() == missing.string());
        }
    }
}

TEST_CASE("ChecksumVerifier - Algorithm names", "[digest]")
{
    Algorithm alg = Algorithm::None;

    REQUIRE(ChecksumVerifier::tryParseAlgorithm("sha-256", alg));
    REQUIRE(alg == Algorithm::SHA256);
    REQUIRE(ChecksumVerifier::tryParseAlgorithm("SHA512", alg));
    REQUIRE(alg == Algorithm::SHA512);
    REQUIRE(ChecksumVerifier::tryParseAlgorithm("md5", alg));
    REQUIRE(alg == Algorithm::MD5);
    REQUIRE_FALSE(ChecksumVerifier::tryParseAlgorithm("crc32", alg));

    REQUIRE(ChecksumVerifier::hexEquals("ABCdef", "abcDEF"));
    REQUIRE_FALSE(ChecksumVerifier::hexEquals("abc", "abcd"));
}
