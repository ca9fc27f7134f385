#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace net
{

using FetchProgressCallback = std::function<void(std::uint64_t bytesDownloaded, std::uint64_t totalBytes)>;

// Per-transfer hooks. Both are optional; totalBytes is 0 when the server sends no length.
struct TransferControl
{
    std::atomic<bool>* cancel_flag = nullptr;
    FetchProgressCallback progress;

    bool cancelled() const { return cancel_flag && cancel_flag->load(); }
};

// Whole-file download. Implementations create missing parent directories, replace the
// destination only once the body is complete, and throw utils::SyncFailure otherwise.
class IFileFetcher
{
public:
    virtual ~IFileFetcher() = default;

    virtual void fetch(const std::string& url, const std::filesystem::path& destination,
                       const TransferControl& control) = 0;
};

} // namespace net
