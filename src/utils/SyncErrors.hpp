#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace utils
{

// Base for every error raised while verifying or transferring files. Carries technical
// details next to the human-readable message.
class SyncError : public std::runtime_error
{
public:
    explicit SyncError(const std::string& message, std::string technicalInfo = {})
        : std::runtime_error(message)
        , technicalInfo_(std::move(technicalInfo))
    {
    }

    const std::string& technicalInfo() const noexcept { return technicalInfo_; }

private:
    std::string technicalInfo_;
};

// Local file could not be read while computing its digest.
class VerificationInputError : public SyncError
{
public:
    using SyncError::SyncError;
};

// Remote unreachable, non-2xx response, cancelled transfer, or local write failure.
class SyncFailure : public SyncError
{
public:
    using SyncError::SyncError;
};

} // namespace utils
