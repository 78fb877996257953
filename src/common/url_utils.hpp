#pragma once

#include "common/errors.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace livelink {

// ============================================================================
// URL Components
// ============================================================================

struct UrlComponents {
    std::string scheme;   // lower case: ws, wss, http, https
    std::string host;
    std::string port;     // explicit port or the scheme default
    std::string path;     // never empty
    std::string query;    // encoded, without '?'
    bool use_ssl = false;

    // path + "?" + query, as sent in the request line
    std::string target() const;

    static std::optional<UrlComponents> parse(std::string_view url);
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// http -> ws, https -> wss; ws/wss are returned unchanged
Result<std::string> to_websocket_url(std::string_view url);

// ws -> http, wss -> https; http/https are returned unchanged
Result<std::string> to_http_url(std::string_view url);

// "https://host/base/" + "rtc" -> "https://host/base/rtc"
std::string append_url_path(std::string_view url, std::string_view segment);

// Percent-encoded "k=v&k2=v2"
std::string encode_query(const QueryParams& params);

// Appends encoded params to url, keeping any existing query
std::string with_query(std::string_view url, const QueryParams& params);

// *.livekit.cloud and *.livekit.run hosts support region failover
bool is_cloud_host(std::string_view host);

} // namespace livelink
