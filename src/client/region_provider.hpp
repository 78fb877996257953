#pragma once

#include "common/cancel_signal.hpp"
#include "common/errors.hpp"
#include "common/http_client.hpp"

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace livelink::client {

namespace asio = boost::asio;

struct RegionInfo {
    std::string region;
    std::string url;
    int64_t distance = 0;
};

struct RegionSettings {
    std::vector<RegionInfo> regions;
};

// Parses {"regions":[{"region","url","distance"}...]}
Result<RegionSettings> parse_region_settings(const std::string& body);

/// Hands out alternative server URLs for cloud deployments, one region at a
/// time, skipping regions already attempted since the last reset.
class RegionUrlProvider {
public:
    static constexpr std::chrono::milliseconds kSettingsCacheTime{3000};

    RegionUrlProvider(std::string url, std::string token, std::shared_ptr<HttpClient> http);

    void update_token(std::string token) { token_ = std::move(token); }

    bool is_cloud() const;
    const std::string& server_url() const { return server_url_; }

    // nullopt when every region was tried, or for self-hosted servers
    asio::awaitable<Result<std::optional<std::string>>> next_best_region_url(CancelSignalPtr cancel = nullptr);

    void reset_attempts() { attempted_.clear(); }

    asio::awaitable<Result<RegionSettings>> fetch_region_settings();

private:
    std::string server_url_;
    std::string token_;
    std::shared_ptr<HttpClient> http_;

    std::optional<RegionSettings> settings_;
    std::chrono::steady_clock::time_point last_update_{};
    std::vector<std::string> attempted_;
};

} // namespace livelink::client
