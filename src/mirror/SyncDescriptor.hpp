#pragma once

#include "../digest/ChecksumVerifier.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace mirror
{

struct ExpectedDigest
{
    digest::Algorithm algorithm = digest::Algorithm::None;
    std::string hex;

    bool empty() const { return algorithm == digest::Algorithm::None || hex.empty(); }
};

// Remote/local/digest triple for one mirrored file. Everything except the local root
// override is fixed at construction; the override may be changed from any thread.
class SyncDescriptor
{
public:
    SyncDescriptor(std::string remoteLocation, std::string localRelativePath);
    SyncDescriptor(std::string remoteLocation, std::string localRelativePath, ExpectedDigest expectedDigest);

    SyncDescriptor(const SyncDescriptor& other);
    SyncDescriptor& operator=(const SyncDescriptor& other);

    const std::string& remoteLocation() const { return remoteLocation_; }
    const std::string& localRelativePath() const { return localRelativePath_; }
    const std::optional<ExpectedDigest>& expectedDigest() const { return expectedDigest_; }

    void setLocalRootOverride(const std::string& root);
    void clearLocalRootOverride();
    std::string localRootOverride() const;

    // override + separator + relative path, or the relative path alone when no override is set
    std::string absoluteLocalPath() const;
    std::string localFileName() const;

    static char hostSeparator();
    static std::string normalizeSeparators(const std::string& path);

private:
    std::string remoteLocation_;
    std::string localRelativePath_;
    std::optional<ExpectedDigest> expectedDigest_;

    mutable std::mutex rootMutex_;
    std::string localRootOverride_;
};

} // namespace mirror
