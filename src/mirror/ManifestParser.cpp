#include "ManifestParser.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace
{

// Checked in this order; the first key present wins
const std::array<std::pair<const char*, digest::Algorithm>, 4> kDigestKeys = {{
    { "sha512", digest::Algorithm::SHA512 },
    { "sha256", digest::Algorithm::SHA256 },
    { "sha1", digest::Algorithm::SHA1 },
    { "md5", digest::Algorithm::MD5 },
}};

bool readDigest(const json& fileJson, mirror::ExpectedDigest& outDigest, std::string& outError)
{
    for (const auto& [key, algorithm] : kDigestKeys)
    {
        if (fileJson.contains(key) && fileJson[key].is_string())
        {
            outDigest.algorithm = algorithm;
            outDigest.hex = fileJson[key].get<std::string>();
            return true;
        }
    }

    if (fileJson.contains("digest") && fileJson["digest"].is_object())
    {
        const auto& digestJson = fileJson["digest"];
        const std::string name = digestJson.value("algorithm", "none");
        if (!digest::ChecksumVerifier::tryParseAlgorithm(name, outDigest.algorithm))
        {
            outError = "Unknown digest algorithm '" + name + "'";
            return false;
        }
        outDigest.hex = digestJson.value("value", "");
    }

    return true;
}

} // namespace

namespace mirror
{

bool ManifestParser::parse(const std::string& jsonContent, SyncManifest& outManifest, std::string& outError)
{
    try
    {
        json manifestJson = json::parse(jsonContent);

        if (!manifestJson.is_object())
        {
            outError = "Manifest root must be an object";
            return false;
        }

        if (!manifestJson.contains("files") || !manifestJson["files"].is_array())
        {
            outError = "Manifest missing 'files' array";
            return false;
        }

        outManifest.version = manifestJson.value("version", "");
        outManifest.root = manifestJson.value("root", "");
        outManifest.files.clear();

        for (const auto& fileJson : manifestJson["files"])
        {
            if (!fileJson.is_object())
            {
                PLOG_WARNING << "Skipping manifest entry that is not an object";
                continue;
            }

            const std::string remote = fileJson.value("remote", "");
            const std::string local = fileJson.value("local", "");
            if (remote.empty() || local.empty())
            {
                PLOG_WARNING << "Skipping manifest file entry without remote or local path";
                continue;
            }

            ExpectedDigest expected;
            std::string digestError;
            if (!readDigest(fileJson, expected, digestError))
            {
                outError = "File '" + local + "': " + digestError;
                return false;
            }

            outManifest.files.emplace_back(remote, local, expected);
            if (!outManifest.root.empty())
            {
                outManifest.files.back().setLocalRootOverride(outManifest.root);
            }
        }

        if (!validate(outManifest, outError))
        {
            return false;
        }

        PLOG_INFO << "Manifest parsed successfully: version "
                  << (outManifest.version.empty() ? "(none)" : outManifest.version) << " with "
                  << outManifest.files.size() << " files";
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool ManifestParser::parseFile(const std::string& filePath, SyncManifest& outManifest, std::string& outError)
{
    try
    {
        std::ifstream file(filePath);
        if (!file.is_open())
        {
            outError = "Failed to open manifest file: " + filePath;
            PLOG_ERROR << outError;
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        file.close();

        return parse(buffer.str(), outManifest, outError);
    }
    catch (const std::exception& e)
    {
        outError = std::string("File read error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool ManifestParser::validate(const SyncManifest& manifest, std::string& outError)
{
    for (const auto& file : manifest.files)
    {
        const auto& expected = file.expectedDigest();
        if (!expected)
            continue;

        const std::size_t length = expectedHexLength(expected->algorithm);
        if (expected->hex.size() != length)
        {
            outError = "File '" + file.localRelativePath() + "' has invalid " +
                       digest::ChecksumVerifier::algorithmName(expected->algorithm) + " checksum length";
            return false;
        }

        const bool allHex = std::all_of(expected->hex.begin(), expected->hex.end(),
                                        [](unsigned char c) { return std::isxdigit(c) != 0; });
        if (!allHex)
        {
            outError = "File '" + file.localRelativePath() + "' has a non-hex checksum";
            return false;
        }
    }

    return true;
}

std::size_t ManifestParser::expectedHexLength(digest::Algorithm algorithm)
{
    switch (algorithm)
    {
    case digest::Algorithm::MD5:
        return 32;
    case digest::Algorithm::SHA1:
        return 40;
    case digest::Algorithm::SHA256:
        return 64;
    case digest::Algorithm::SHA512:
        return 128;
    case digest::Algorithm::None:
        break;
    }
    return 0;
}

} // namespace mirror
