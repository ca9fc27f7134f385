#include "SyncDescriptor.hpp"

#include <algorithm>
#include <utility>

namespace mirror
{

SyncDescriptor::SyncDescriptor(std::string remoteLocation, std::string localRelativePath)
    : remoteLocation_(std::move(remoteLocation))
    , localRelativePath_(normalizeSeparators(localRelativePath))
{
}

SyncDescriptor::SyncDescriptor(std::string remoteLocation, std::string localRelativePath,
                               ExpectedDigest expectedDigest)
    : SyncDescriptor(std::move(remoteLocation), std::move(localRelativePath))
{
    if (!expectedDigest.empty())
    {
        expectedDigest_ = std::move(expectedDigest);
    }
}

SyncDescriptor::SyncDescriptor(const SyncDescriptor& other)
    : remoteLocation_(other.remoteLocation_)
    , localRelativePath_(other.localRelativePath_)
    , expectedDigest_(other.expectedDigest_)
    , localRootOverride_(other.localRootOverride())
{
}

SyncDescriptor& SyncDescriptor::operator=(const SyncDescriptor& other)
{
    if (this == &other)
        return *this;

    remoteLocation_ = other.remoteLocation_;
    localRelativePath_ = other.localRelativePath_;
    expectedDigest_ = other.expectedDigest_;
    setLocalRootOverride(other.localRootOverride());
    return *this;
}

void SyncDescriptor::setLocalRootOverride(const std::string& root)
{
    std::lock_guard<std::mutex> lock(rootMutex_);
    localRootOverride_ = root;
}

void SyncDescriptor::clearLocalRootOverride() { setLocalRootOverride(std::string()); }

std::string SyncDescriptor::localRootOverride() const
{
    std::lock_guard<std::mutex> lock(rootMutex_);
    return localRootOverride_;
}

std::string SyncDescriptor::absoluteLocalPath() const
{
    const std::string root = localRootOverride();
    if (root.empty())
    {
        return localRelativePath_;
    }

    const char last = root.back();
    if (last == hostSeparator() || last == '/')
    {
        return root + localRelativePath_;
    }
    return root + hostSeparator() + localRelativePath_;
}

std::string SyncDescriptor::localFileName() const
{
    return std::filesystem::path(absoluteLocalPath()).filename().string();
}

char SyncDescriptor::hostSeparator() { return static_cast<char>(std::filesystem::path::preferred_separator); }

std::string SyncDescriptor::normalizeSeparators(const std::string& path)
{
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '/', hostSeparator());
    return normalized;
}

} // namespace mirror
