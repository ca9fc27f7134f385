#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mirror
{

// Process-wide table of mutexes keyed by canonical absolute path. Two sync units that
// resolve to the same file share one mutex for as long as either holds it.
class PathLockTable
{
public:
    static PathLockTable& Instance();

    std::shared_ptr<std::mutex> acquire(const std::filesystem::path& path);

    // Number of keys with a live mutex
    std::size_t size();

    static std::string canonicalKey(const std::filesystem::path& path);

private:
    void pruneExpiredLocked();

    std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;
};

} // namespace mirror
