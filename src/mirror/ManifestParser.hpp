#pragma once

#include "SyncDescriptor.hpp"

#include <string>
#include <vector>

namespace mirror
{

// List of files to keep mirrored, as supplied by the caller
struct SyncManifest
{
    std::string version;
    std::string root; // Applied as local root override unless the caller supplies one
    std::vector<SyncDescriptor> files;
};

// Parser for sync manifest JSON
class ManifestParser
{
public:
    ManifestParser() = default;
    ~ManifestParser() = default;

    // Parse manifest from JSON string
    bool parse(const std::string& jsonContent, SyncManifest& outManifest, std::string& outError);

    // Parse manifest from file
    bool parseFile(const std::string& filePath, SyncManifest& outManifest, std::string& outError);

    // Digest strings must be hex of the length their algorithm produces
    static bool validate(const SyncManifest& manifest, std::string& outError);

    static std::size_t expectedHexLength(digest::Algorithm algorithm);
};

} // namespace mirror
