#include "common/url_utils.hpp"

#include <boost/url.hpp>

#include <algorithm>
#include <cctype>

namespace livelink {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Result<std::string> rewrite_scheme(std::string_view url, bool to_ws) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        return std::unexpected(Error::connection("invalid url: " + std::string(url)));
    }

    boost::urls::url u(*parsed);
    auto scheme = lower(u.scheme());

    if (scheme == "ws" || scheme == "http") {
        u.set_scheme(to_ws ? "ws" : "http");
    } else if (scheme == "wss" || scheme == "https") {
        u.set_scheme(to_ws ? "wss" : "https");
    } else {
        return std::unexpected(Error::connection("unsupported url scheme: " + scheme));
    }

    return std::string(u.buffer());
}

}  // anonymous namespace

std::string UrlComponents::target() const {
    if (query.empty()) return path;
    return path + "?" + query;
}

std::optional<UrlComponents> UrlComponents::parse(std::string_view url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) return std::nullopt;

    UrlComponents result;
    result.scheme = lower(parsed->scheme());
    if (result.scheme != "ws" && result.scheme != "wss" &&
        result.scheme != "http" && result.scheme != "https") {
        return std::nullopt;
    }

    result.host = parsed->host();
    if (result.host.empty()) return std::nullopt;

    result.use_ssl = (result.scheme == "wss" || result.scheme == "https");
    result.port = parsed->has_port() ? std::string(parsed->port()) : (result.use_ssl ? "443" : "80");
    result.path = parsed->encoded_path().empty() ? "/" : std::string(parsed->encoded_path());
    if (parsed->has_query()) {
        result.query = std::string(parsed->encoded_query());
    }
    return result;
}

Result<std::string> to_websocket_url(std::string_view url) {
    return rewrite_scheme(url, true);
}

Result<std::string> to_http_url(std::string_view url) {
    return rewrite_scheme(url, false);
}

std::string append_url_path(std::string_view url, std::string_view segment) {
    std::string out(url);
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    out += '/';
    out += segment;
    return out;
}

std::string encode_query(const QueryParams& params) {
    boost::urls::url u;
    for (const auto& [key, value] : params) {
        u.params().append({key, value});
    }
    return std::string(u.encoded_query());
}

std::string with_query(std::string_view url, const QueryParams& params) {
    std::string out(url);
    if (params.empty()) return out;
    out += (out.find('?') == std::string::npos) ? '?' : '&';
    out += encode_query(params);
    return out;
}

bool is_cloud_host(std::string_view host) {
    auto h = lower(host);
    return ends_with(h, ".livekit.cloud") || ends_with(h, ".livekit.run");
}

} // namespace livelink
