#pragma once

#include "common/errors.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace livelink {

namespace asio = boost::asio;

struct HttpResponse {
    int status = 0;
    std::string body;
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// ============================================================================
// HttpClient
// ============================================================================

/// Minimal GET client for auxiliary endpoints (validation, region settings).
/// Any HTTP status is a successful Result; only transport failures are errors.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual asio::awaitable<Result<HttpResponse>> get(std::string url, HttpHeaders headers = {}) = 0;
};

// Boost.Beast implementation over plain TCP or TLS
class BeastHttpClient : public HttpClient {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{10000};

    explicit BeastHttpClient(asio::any_io_executor ex,
                             std::chrono::milliseconds timeout = kDefaultTimeout);

    asio::awaitable<Result<HttpResponse>> get(std::string url, HttpHeaders headers = {}) override;

private:
    asio::any_io_executor ex_;
    std::chrono::milliseconds timeout_;
    asio::ssl::context ssl_ctx_{asio::ssl::context::tlsv12_client};
};

} // namespace livelink
