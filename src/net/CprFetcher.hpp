#pragma once

#include "FileFetcher.hpp"

namespace net
{

struct SessionConfig
{
    int connect_timeout_ms = 10000;
    int timeout_ms = 300000;
};

// libcurl-backed fetcher (http, https, file). Sends no-cache headers and downloads into a
// ".part" sibling that is renamed over the destination on success.
class CprFetcher : public IFileFetcher
{
public:
    CprFetcher() = default;
    explicit CprFetcher(const SessionConfig& config);

    void fetch(const std::string& url, const std::filesystem::path& destination,
               const TransferControl& control) override;

    const SessionConfig& config() const { return config_; }

    static std::filesystem::path partialPathFor(const std::filesystem::path& destination);

private:
    SessionConfig config_;
};

} // namespace net
