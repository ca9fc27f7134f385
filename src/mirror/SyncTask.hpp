#pragma once

#include "SyncTypes.hpp"
#include "SyncUnit.hpp"
#include "../tasks/TaskManager.hpp"

namespace mirror
{

// Runs one SyncUnit on a worker and reports 0.0, transfer progress, then 1.0.
class SyncTask : public tasks::Task<SyncResult>
{
public:
    // Transfer bytes are mapped into this band of the task's progress
    static constexpr double kTransferStart = 0.1;
    static constexpr double kTransferEnd = 0.9;

    SyncTask(SyncUnit unit, SyncMode mode);

    const SyncUnit& unit() const { return unit_; }
    SyncMode mode() const { return mode_; }

protected:
    SyncResult run() override;

private:
    SyncUnit unit_;
    SyncMode mode_;
};

} // namespace mirror
