#include "client/region_provider.hpp"
#include "common/logger.hpp"
#include "common/url_utils.hpp"

#include <boost/json.hpp>

#include <algorithm>

namespace json = boost::json;

namespace livelink::client {

namespace {

auto& log() { return Logger::get("client.region"); }

std::string jstr(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end() && it->value().is_string())
        return std::string(it->value().as_string());
    return {};
}

int64_t jint(const json::object& obj, std::string_view key) {
    if (auto it = obj.find(key); it != obj.end()) {
        if (it->value().is_int64()) return it->value().as_int64();
        if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
        if (it->value().is_string()) {
            try {
                return std::stoll(std::string(it->value().as_string()));
            } catch (const std::exception&) {
                return 0;
            }
        }
    }
    return 0;
}

}  // anonymous namespace

Result<RegionSettings> parse_region_settings(const std::string& body) {
    boost::system::error_code ec;
    auto value = json::parse(body, ec);
    if (ec || !value.is_object()) {
        return std::unexpected(Error::connection("invalid region settings: " +
                                                 (ec ? ec.message() : std::string("not an object"))));
    }

    RegionSettings settings;
    const auto& root = value.as_object();
    if (auto it = root.find("regions"); it != root.end() && it->value().is_array()) {
        for (const auto& item : it->value().as_array()) {
            if (!item.is_object()) continue;
            const auto& obj = item.as_object();
            RegionInfo info;
            info.region = jstr(obj, "region");
            info.url = jstr(obj, "url");
            info.distance = jint(obj, "distance");
            if (!info.url.empty()) {
                settings.regions.push_back(std::move(info));
            }
        }
    }
    return settings;
}

RegionUrlProvider::RegionUrlProvider(std::string url, std::string token, std::shared_ptr<HttpClient> http)
    : server_url_(std::move(url))
    , token_(std::move(token))
    , http_(std::move(http))
{
}

bool RegionUrlProvider::is_cloud() const {
    auto parsed = UrlComponents::parse(server_url_);
    return parsed && is_cloud_host(parsed->host);
}

asio::awaitable<Result<std::optional<std::string>>> RegionUrlProvider::next_best_region_url(CancelSignalPtr cancel) {
    if (!is_cloud()) {
        co_return std::optional<std::string>{};
    }

    auto now = std::chrono::steady_clock::now();
    if (!settings_ || now - last_update_ > kSettingsCacheTime) {
        auto fetched = co_await fetch_region_settings();
        if (!fetched) {
            co_return std::unexpected(fetched.error());
        }
        settings_ = std::move(*fetched);
    }

    if (is_cancelled(cancel)) {
        co_return std::unexpected(Error::connection("region lookup cancelled", ConnectionErrorReason::CANCELLED));
    }

    for (const auto& region : settings_->regions) {
        if (std::find(attempted_.begin(), attempted_.end(), region.url) != attempted_.end()) {
            continue;
        }
        attempted_.push_back(region.url);
        log().debug("next region: {}", region.region);
        co_return std::optional<std::string>(region.url);
    }
    co_return std::optional<std::string>{};
}

asio::awaitable<Result<RegionSettings>> RegionUrlProvider::fetch_region_settings() {
    auto http_url = to_http_url(server_url_);
    if (!http_url) {
        co_return std::unexpected(http_url.error());
    }
    auto parsed = UrlComponents::parse(*http_url);
    if (!parsed) {
        co_return std::unexpected(Error::connection("invalid server url: " + server_url_));
    }

    // Settings live at the host root regardless of the server path
    std::string settings_url = parsed->scheme + "://" + parsed->host;
    bool default_port = (parsed->use_ssl && parsed->port == "443") || (!parsed->use_ssl && parsed->port == "80");
    if (!default_port) {
        settings_url += ":" + parsed->port;
    }
    settings_url += "/settings/regions";

    HttpHeaders headers;
    headers.emplace_back("Authorization", "Bearer " + token_);
    auto resp = co_await http_->get(settings_url, std::move(headers));
    if (!resp) {
        co_return std::unexpected(resp.error());
    }
    if (resp->status < 200 || resp->status >= 300) {
        auto reason = resp->status == 401 ? ConnectionErrorReason::NOT_ALLOWED
                                          : ConnectionErrorReason::INTERNAL_ERROR;
        co_return std::unexpected(Error::connection(
            "Could not fetch region settings: HTTP " + std::to_string(resp->status), reason, resp->status));
    }

    auto settings = parse_region_settings(resp->body);
    if (!settings) {
        co_return std::unexpected(settings.error());
    }
    last_update_ = std::chrono::steady_clock::now();
    co_return std::move(*settings);
}

} // namespace livelink::client
