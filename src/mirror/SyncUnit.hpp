#pragma once

#include "SyncDescriptor.hpp"
#include "SyncTypes.hpp"
#include "../net/FileFetcher.hpp"

#include <filesystem>
#include <memory>

namespace mirror
{

// Verify/replace decisions for one remote -> local mapping. Every operation holds the
// per-path lock for the descriptor's absolute local path.
class SyncUnit
{
public:
    SyncUnit(std::shared_ptr<SyncDescriptor> descriptor, std::shared_ptr<net::IFileFetcher> fetcher);

    // Digest match when one is configured, otherwise "exists and is a regular file".
    // Read errors count as invalid and are never thrown.
    bool isLocalValid() const;

    // Unconditional download over the local copy. Throws SyncFailure.
    void fetch(const net::TransferControl& control = {});

    // Fetches once when the local copy is invalid. Returns whether anything was written.
    bool ensureSynced(const net::TransferControl& control = {});

    // Audit (replace = false) never writes. With replace, a bad copy is fetched and re-verified.
    VerificationOutcome verifyWithOptionalReplace(bool replace, const net::TransferControl& control = {});

    const SyncDescriptor& descriptor() const { return *descriptor_; }
    std::shared_ptr<SyncDescriptor> sharedDescriptor() const { return descriptor_; }

private:
    bool checkLocalUnlocked(const std::filesystem::path& localPath) const;
    void fetchUnlocked(const std::filesystem::path& localPath, const net::TransferControl& control);

    std::shared_ptr<SyncDescriptor> descriptor_;
    std::shared_ptr<net::IFileFetcher> fetcher_;
};

} // namespace mirror
