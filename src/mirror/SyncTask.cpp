#include "SyncTask.hpp"

#include <plog/Log.h>

#include <utility>

namespace mirror
{

SyncTask::SyncTask(SyncUnit unit, SyncMode mode)
    : unit_(std::move(unit))
    , mode_(mode)
{
}

SyncResult SyncTask::run()
{
    const std::string label = unit_.descriptor().localFileName();
    submitProgress(label, 0.0);

    net::TransferControl control;
    control.cancel_flag = cancellationFlag();
    control.progress = [this, &label](std::uint64_t downloaded, std::uint64_t total)
    {
        if (total == 0)
            return;

        const double fraction = static_cast<double>(downloaded) / static_cast<double>(total);
        submitProgress(label, kTransferStart + fraction * (kTransferEnd - kTransferStart));
    };

    SyncResult result;
    result.remoteLocation = unit_.descriptor().remoteLocation();
    result.localPath = unit_.descriptor().absoluteLocalPath();

    switch (mode_)
    {
    case SyncMode::Audit:
        result.outcome = unit_.verifyWithOptionalReplace(false, control);
        break;
    case SyncMode::Ensure:
    case SyncMode::Repair:
        // Fetch and re-check happen under one path lock
        result.outcome = unit_.verifyWithOptionalReplace(true, control);
        result.changed = result.outcome == VerificationOutcome::ReplacedGood ||
                         result.outcome == VerificationOutcome::ReplacedBad;
        break;
    }

    PLOG_DEBUG << "[" << syncModeName(mode_) << "] " << result.localPath << ": " << outcomeName(result.outcome)
               << (result.changed ? " (fetched)" : "");

    submitProgress(label, 1.0);
    return result;
}

} // namespace mirror
