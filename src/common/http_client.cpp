#include "common/http_client.hpp"
#include "common/logger.hpp"
#include "common/url_utils.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace livelink {

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;

namespace {

auto& log() { return Logger::get("common.http"); }

template<typename Stream>
asio::awaitable<HttpResponse> exchange(Stream& stream, const http::request<http::empty_body>& req) {
    co_await http::async_write(stream, req, asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, asio::use_awaitable);

    co_return HttpResponse{static_cast<int>(res.result_int()), std::move(res.body())};
}

}  // anonymous namespace

BeastHttpClient::BeastHttpClient(asio::any_io_executor ex, std::chrono::milliseconds timeout)
    : ex_(std::move(ex))
    , timeout_(timeout)
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

asio::awaitable<Result<HttpResponse>> BeastHttpClient::get(std::string url, HttpHeaders headers) {
    auto parts = UrlComponents::parse(url);
    if (!parts) {
        co_return std::unexpected(Error::connection("invalid url: " + url,
                                                    ConnectionErrorReason::SERVER_UNREACHABLE));
    }

    http::request<http::empty_body> req{http::verb::get, parts->target(), 11};
    req.set(http::field::host, parts->host);
    req.set(http::field::user_agent, "LiveLink/1.0");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }

    log().debug("GET {}://{}:{}{}", parts->scheme, parts->host, parts->port, parts->path);

    try {
        tcp::resolver resolver(ex_);
        auto endpoints = co_await resolver.async_resolve(parts->host, parts->port, asio::use_awaitable);

        if (parts->use_ssl) {
            beast::ssl_stream<beast::tcp_stream> stream(ex_, ssl_ctx_);

            if (!SSL_set_tlsext_host_name(stream.native_handle(), parts->host.c_str())) {
                co_return std::unexpected(Error::connection("failed to set SNI for " + parts->host,
                                                            ConnectionErrorReason::SERVER_UNREACHABLE));
            }

            beast::get_lowest_layer(stream).expires_after(timeout_);
            co_await beast::get_lowest_layer(stream).async_connect(endpoints, asio::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);

            auto res = co_await livelink::exchange(stream, req);

            boost::system::error_code ec;
            co_await stream.async_shutdown(asio::redirect_error(asio::use_awaitable, ec));
            co_return res;
        }

        beast::tcp_stream stream(ex_);
        stream.expires_after(timeout_);
        co_await stream.async_connect(endpoints, asio::use_awaitable);

        auto res = co_await livelink::exchange(stream, req);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;

    } catch (const boost::system::system_error& e) {
        log().debug("GET {} failed: {}", parts->host, e.what());
        co_return std::unexpected(Error::connection(e.what(), ConnectionErrorReason::SERVER_UNREACHABLE));
    }
}

} // namespace livelink
