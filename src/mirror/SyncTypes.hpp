#pragma once

#include <cstddef>
#include <string>

namespace mirror
{

// Result of comparing a local copy against its expected digest
enum class VerificationOutcome
{
    Good, // Local copy valid, nothing written
    Bad, // Local copy invalid, left untouched
    ReplacedGood, // Re-fetched and now valid
    ReplacedBad // Re-fetched but still invalid: remote corrupt or digest metadata stale
};

inline const char* outcomeName(VerificationOutcome outcome)
{
    switch (outcome)
    {
    case VerificationOutcome::Good:
        return "good";
    case VerificationOutcome::Bad:
        return "bad";
    case VerificationOutcome::ReplacedGood:
        return "replaced-good";
    case VerificationOutcome::ReplacedBad:
        return "replaced-bad";
    }
    return "unknown";
}

// What a batch does with each descriptor
enum class SyncMode
{
    Ensure, // default batch mode: fetch whenever the local copy is invalid, then re-verify
    Audit, // verifyWithOptionalReplace(false): read-only
    Repair // verifyWithOptionalReplace(true): fetch and re-verify
};

inline const char* syncModeName(SyncMode mode)
{
    switch (mode)
    {
    case SyncMode::Ensure:
        return "ensure";
    case SyncMode::Audit:
        return "audit";
    case SyncMode::Repair:
        return "repair";
    }
    return "unknown";
}

// Per-item result produced by a SyncTask
struct SyncResult
{
    std::string remoteLocation;
    std::string localPath;
    VerificationOutcome outcome = VerificationOutcome::Good;
    bool changed = false; // True when a fetch was performed
};

// Per-item entry of a batch that keeps going past failures
struct SyncItemReport
{
    std::string remoteLocation;
    std::string localPath;
    bool succeeded = false;
    SyncResult result;
    std::string error; // Empty on success
};

struct SyncSummary
{
    std::size_t total = 0;
    std::size_t good = 0;
    std::size_t bad = 0;
    std::size_t replacedGood = 0;
    std::size_t replacedBad = 0;
    std::size_t changed = 0;
    std::size_t failed = 0;

    void add(const SyncResult& result)
    {
        ++total;
        if (result.changed)
            ++changed;

        switch (result.outcome)
        {
        case VerificationOutcome::Good:
            ++good;
            break;
        case VerificationOutcome::Bad:
            ++bad;
            break;
        case VerificationOutcome::ReplacedGood:
            ++replacedGood;
            break;
        case VerificationOutcome::ReplacedBad:
            ++replacedBad;
            break;
        }
    }

    bool clean() const { return failed == 0 && bad == 0 && replacedBad == 0; }
};

} // namespace mirror
