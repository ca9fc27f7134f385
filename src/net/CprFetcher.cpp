#include "CprFetcher.hpp"
#include "../utils/SyncErrors.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace fs = std::filesystem;

namespace
{

std::string urlScheme(const std::string& url)
{
    const auto pos = url.find("://");
    if (pos == std::string::npos)
        return {};

    std::string scheme = url.substr(0, pos);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme;
}

void discardPartial(const fs::path& partialPath)
{
    std::error_code ec;
    fs::remove(partialPath, ec);
    if (ec)
    {
        PLOG_WARNING << "Failed to remove partial download " << partialPath.string() << ": " << ec.message();
    }
}

} // namespace

namespace net
{

CprFetcher::CprFetcher(const SessionConfig& config)
    : config_(config)
{
}

fs::path CprFetcher::partialPathFor(const fs::path& destination)
{
    fs::path partial = destination;
    partial += ".part";
    return partial;
}

void CprFetcher::fetch(const std::string& url, const fs::path& destination, const TransferControl& control)
{
    const std::string scheme = urlScheme(url);
    if (scheme != "http" && scheme != "https" && scheme != "file")
    {
        throw utils::SyncFailure("Unsupported remote location", url);
    }

    if (control.cancelled())
    {
        throw utils::SyncFailure("Download cancelled", url);
    }

    std::error_code ec;
    if (destination.has_parent_path())
    {
        fs::create_directories(destination.parent_path(), ec);
        if (ec)
        {
            throw utils::SyncFailure("Failed to create directory for " + destination.string(), ec.message());
        }
    }

    const fs::path partialPath = partialPathFor(destination);

    PLOG_DEBUG << "Starting download: " << url << " -> " << destination.string();

    cpr::Response response;
    {
        std::ofstream outputFile(partialPath, std::ios::binary | std::ios::trunc);
        if (!outputFile.is_open())
        {
            throw utils::SyncFailure("Failed to create output file", partialPath.string());
        }

        cpr::Session session;
        session.SetUrl(cpr::Url{ url });
        session.SetHeader(cpr::Header{ { "Cache-Control", "no-cache" }, { "Pragma", "no-cache" } });
        session.SetConnectTimeout(cpr::ConnectTimeout{ config_.connect_timeout_ms });
        session.SetTimeout(cpr::Timeout{ config_.timeout_ms });
        session.SetProgressCallback(cpr::ProgressCallback{
            [&control](cpr::cpr_pf_arg_t downloadTotal, cpr::cpr_pf_arg_t downloadNow, cpr::cpr_pf_arg_t,
                       cpr::cpr_pf_arg_t, intptr_t) -> bool
            {
                if (control.cancelled())
                {
                    return false;
                }

                if (control.progress && downloadNow > 0)
                {
                    control.progress(static_cast<std::uint64_t>(downloadNow),
                                     static_cast<std::uint64_t>(downloadTotal > 0 ? downloadTotal : 0));
                }
                return true;
            } });

        response = session.Download(outputFile);

        outputFile.close();
        if (outputFile.fail() && !response.error)
        {
            discardPartial(partialPath);
            throw utils::SyncFailure("Failed to write " + destination.string(), partialPath.string());
        }
    }

    if (control.cancelled())
    {
        PLOG_INFO << "Download cancelled: " << url;
        discardPartial(partialPath);
        throw utils::SyncFailure("Download cancelled", url);
    }

    if (response.error)
    {
        PLOG_ERROR << "Download failed: " << url << " (" << response.error.message << ")";
        discardPartial(partialPath);
        throw utils::SyncFailure("Remote unreachable: " + url, response.error.message);
    }

    // libcurl reports no status code for file:// transfers
    if (scheme != "file" && (response.status_code < 200 || response.status_code >= 300))
    {
        PLOG_ERROR << "Download failed with status: " << response.status_code << " for " << url;
        discardPartial(partialPath);
        throw utils::SyncFailure("HTTP error " + std::to_string(response.status_code), url);
    }

    fs::rename(partialPath, destination, ec);
    if (ec)
    {
        discardPartial(partialPath);
        throw utils::SyncFailure("Failed to replace " + destination.string(), ec.message());
    }

    PLOG_DEBUG << "Download completed: " << destination.string();
}

} // namespace net
