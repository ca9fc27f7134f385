#include "FixtureFetcher.hpp"
#include "utils/SyncErrors.hpp"

#include <algorithm>
#include <fstream>
#include <thread>

namespace test_utils {

void FixtureFetcher::setResponse(const std::string& url, const FixtureResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[url] = response;
}

void FixtureFetcher::setBody(const std::string& url, const std::string& body) {
    FixtureResponse response;
    response.body = body;
    setResponse(url, response);
}

void FixtureFetcher::simulateNetworkError(const std::string& error_msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulate_error_ = true;
    error_message_ = error_msg;
}

void FixtureFetcher::clearResponses() {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.clear();
    per_url_counts_.clear();
    simulate_error_ = false;
    error_message_.clear();
}

std::size_t FixtureFetcher::fetchCount(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = per_url_counts_.find(url);
    return it == per_url_counts_.end() ? 0 : it->second;
}

FixtureResponse FixtureFetcher::responseFor(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (simulate_error_) {
        FixtureResponse error_resp;
        error_resp.fail = true;
        error_resp.error_message = error_message_;
        return error_resp;
    }

    auto it = responses_.find(url);
    if (it != responses_.end()) {
        return it->second;
    }

    FixtureResponse not_found;
    not_found.fail = true;
    not_found.error_message = "HTTP 404";
    return not_found;
}

void FixtureFetcher::fetch(const std::string& url, const std::filesystem::path& destination,
                           const net::TransferControl& control) {
    ++fetch_count_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++per_url_counts_[url];
    }

    const std::size_t running = ++in_flight_;
    std::size_t peak = peak_concurrency_.load();
    while (running > peak && !peak_concurrency_.compare_exchange_weak(peak, running)) {
    }

    struct InFlightGuard {
        std::atomic<std::size_t>& counter;
        ~InFlightGuard() { --counter; }
    } guard{in_flight_};

    const FixtureResponse response = responseFor(url);

    // Sleep in small steps so a raised cancel flag is noticed mid-"transfer"
    auto remaining = response.delay;
    while (remaining.count() > 0) {
        if (control.cancelled()) {
            throw utils::SyncFailure("Download cancelled", url);
        }
        const auto step = std::min(remaining, std::chrono::milliseconds(5));
        std::this_thread::sleep_for(step);
        remaining -= step;
    }

    if (control.cancelled()) {
        throw utils::SyncFailure("Download cancelled", url);
    }

    if (response.fail) {
        throw utils::SyncFailure("Download failed: " + url, response.error_message);
    }

    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path());
    }

    {
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw utils::SyncFailure("Cannot write " + destination.string());
        }
        out << response.body;
    }

    if (control.progress) {
        const auto total = static_cast<std::uint64_t>(response.body.size());
        control.progress(total / 2, total);
        control.progress(total, total);
    }
}

}  // namespace test_utils
