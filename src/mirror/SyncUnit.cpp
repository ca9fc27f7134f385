#include "SyncUnit.hpp"
#include "PathLockTable.hpp"
#include "../utils/SyncErrors.hpp"

#include <plog/Log.h>

#include <mutex>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace mirror
{

SyncUnit::SyncUnit(std::shared_ptr<SyncDescriptor> descriptor, std::shared_ptr<net::IFileFetcher> fetcher)
    : descriptor_(std::move(descriptor))
    , fetcher_(std::move(fetcher))
{
    if (!descriptor_)
        throw std::invalid_argument("SyncUnit requires a descriptor");
    if (!fetcher_)
        throw std::invalid_argument("SyncUnit requires a fetcher");
}

bool SyncUnit::isLocalValid() const
{
    const fs::path localPath = descriptor_->absoluteLocalPath();
    auto pathLock = PathLockTable::Instance().acquire(localPath);
    std::lock_guard<std::mutex> lock(*pathLock);
    return checkLocalUnlocked(localPath);
}

void SyncUnit::fetch(const net::TransferControl& control)
{
    const fs::path localPath = descriptor_->absoluteLocalPath();
    auto pathLock = PathLockTable::Instance().acquire(localPath);
    std::lock_guard<std::mutex> lock(*pathLock);
    fetchUnlocked(localPath, control);
}

bool SyncUnit::ensureSynced(const net::TransferControl& control)
{
    const fs::path localPath = descriptor_->absoluteLocalPath();
    auto pathLock = PathLockTable::Instance().acquire(localPath);
    std::lock_guard<std::mutex> lock(*pathLock);

    if (checkLocalUnlocked(localPath))
    {
        return false;
    }

    fetchUnlocked(localPath, control);
    return true;
}

VerificationOutcome SyncUnit::verifyWithOptionalReplace(bool replace, const net::TransferControl& control)
{
    const fs::path localPath = descriptor_->absoluteLocalPath();
    auto pathLock = PathLockTable::Instance().acquire(localPath);
    std::lock_guard<std::mutex> lock(*pathLock);

    if (checkLocalUnlocked(localPath))
    {
        return VerificationOutcome::Good;
    }

    if (!replace)
    {
        return VerificationOutcome::Bad;
    }

    fetchUnlocked(localPath, control);

    if (checkLocalUnlocked(localPath))
    {
        return VerificationOutcome::ReplacedGood;
    }

    PLOG_WARNING << "Replaced file still fails verification: " << localPath.string() << " (remote "
                 << descriptor_->remoteLocation() << ")";
    return VerificationOutcome::ReplacedBad;
}

bool SyncUnit::checkLocalUnlocked(const fs::path& localPath) const
{
    const auto& expected = descriptor_->expectedDigest();
    if (!expected)
    {
        std::error_code ec;
        return fs::is_regular_file(localPath, ec);
    }

    try
    {
        return digest::ChecksumVerifier::verify(localPath, expected->algorithm, expected->hex);
    }
    catch (const utils::VerificationInputError& e)
    {
        PLOG_DEBUG << "Treating " << localPath.string() << " as invalid: " << e.what() << " (" << e.technicalInfo()
                   << ")";
        return false;
    }
}

void SyncUnit::fetchUnlocked(const fs::path& localPath, const net::TransferControl& control)
{
    if (control.cancelled())
    {
        throw utils::SyncFailure("Download cancelled", descriptor_->remoteLocation());
    }

    try
    {
        fetcher_->fetch(descriptor_->remoteLocation(), localPath, control);
    }
    catch (const utils::SyncFailure&)
    {
        throw;
    }
    catch (const fs::filesystem_error& e)
    {
        throw utils::SyncFailure("Unable to download file locally to " + localPath.string(), e.what());
    }

    PLOG_INFO << "Fetched " << descriptor_->remoteLocation() << " -> " << localPath.string();
}

} // namespace mirror
