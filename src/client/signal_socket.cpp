#include "client/signal_socket.hpp"
#include "client/client_info.hpp"
#include "common/logger.hpp"
#include "common/url_utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace livelink::client {

using tcp = asio::ip::tcp;

namespace {

auto& log() { return Logger::get("client.socket"); }

}  // anonymous namespace

const char* socket_ready_state_name(SocketReadyState state) {
    switch (state) {
        case SocketReadyState::CONNECTING: return "CONNECTING";
        case SocketReadyState::OPEN:       return "OPEN";
        case SocketReadyState::CLOSING:    return "CLOSING";
        case SocketReadyState::CLOSED:     return "CLOSED";
        default:                           return "UNKNOWN";
    }
}

BeastSignalSocket::BeastSignalSocket(asio::any_io_executor ex)
    : ex_(std::move(ex))
    , write_signal_(ex_)
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

BeastSignalSocket::~BeastSignalSocket() = default;

void BeastSignalSocket::set_handlers(SignalSocketHandlers handlers) {
    handlers_ = std::move(handlers);
}

void BeastSignalSocket::open(const std::string& url) {
    if (state_ != SocketReadyState::CLOSED || close_fired_) {
        log().warn("open() called twice on the same socket");
        return;
    }
    state_ = SocketReadyState::CONNECTING;

    asio::co_spawn(
        ex_,
        [self = shared_from_this(), url]() -> asio::awaitable<void> {
            co_await self->run(url);
        },
        [](std::exception_ptr ep) {
            if (ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    log().error("Unhandled exception in socket: {}", e.what());
                }
            }
        });
}

void BeastSignalSocket::send(std::string data, bool is_text) {
    if (state_ != SocketReadyState::OPEN) {
        log().debug("dropping {} byte message, socket is {}", data.size(), socket_ready_state_name(state_));
        return;
    }
    write_queue_.push({std::move(data), is_text});
    write_signal_.cancel();
}

void BeastSignalSocket::close(uint16_t code, const std::string& reason) {
    if (state_ == SocketReadyState::CLOSING || state_ == SocketReadyState::CLOSED) {
        return;
    }

    auto previous = state_;
    state_ = SocketReadyState::CLOSING;
    close_requested_ = true;
    local_close_ = websocket::close_reason(static_cast<websocket::close_code>(code), reason.substr(0, 123));

    if (previous == SocketReadyState::CONNECTING) {
        // Abort the connect in progress; run() reports the close
        if (wss_) beast::get_lowest_layer(*wss_).close();
        if (ws_) beast::get_lowest_layer(*ws_).close();
    } else {
        // Writer performs the closing handshake after any in-flight write
        write_signal_.cancel();
    }
}

void BeastSignalSocket::fire_error(const std::string& error) {
    auto handler = handlers_.on_error;
    if (handler) handler(error);
}

void BeastSignalSocket::fire_close(uint16_t code, const std::string& reason) {
    if (close_fired_) return;
    close_fired_ = true;
    auto handler = handlers_.on_close;
    if (handler) handler(code, reason);
}

asio::awaitable<void> BeastSignalSocket::run(std::string url) {
    try {
        co_await do_connect(url);
    } catch (const boost::system::system_error& e) {
        ws_.reset();
        wss_.reset();
        state_ = SocketReadyState::CLOSED;

        if (close_requested_) {
            log().debug("connect aborted by close()");
            fire_close(local_close_.code, std::string(local_close_.reason.data(), local_close_.reason.size()));
        } else {
            log().warn("connect to signal server failed: {}", e.what());
            fire_error(e.what());
            fire_close(static_cast<uint16_t>(websocket::close_code::abnormal), e.what());
        }
        co_return;
    }

    state_ = SocketReadyState::OPEN;
    {
        auto handler = handlers_.on_open;
        if (handler) handler();
    }

    asio::co_spawn(
        ex_,
        [self = shared_from_this()]() -> asio::awaitable<void> {
            co_await self->writer();
        },
        asio::detached);

    uint16_t code = static_cast<uint16_t>(websocket::close_code::abnormal);
    std::string reason;

    try {
        co_await reader();
    } catch (const boost::system::system_error& e) {
        if (e.code() == websocket::error::closed) {
            auto r = wss_ ? wss_->reason() : ws_->reason();
            code = r.code;
            reason.assign(r.reason.data(), r.reason.size());
        } else {
            reason = e.what();
            if (!close_requested_) {
                log().warn("signal socket error: {}", e.what());
                fire_error(e.what());
            }
        }
    }

    state_ = SocketReadyState::CLOSED;
    write_signal_.cancel();

    log().debug("signal socket closed: code={} reason='{}'", code, reason);
    fire_close(code, reason);
}

asio::awaitable<void> BeastSignalSocket::do_connect(const std::string& url) {
    auto parts = UrlComponents::parse(url);
    if (!parts) {
        throw boost::system::system_error(asio::error::invalid_argument, "invalid url");
    }

    auto check_aborted = [this] {
        if (close_requested_) {
            throw boost::system::system_error(asio::error::operation_aborted);
        }
    };

    tcp::resolver resolver(ex_);
    auto endpoints = co_await resolver.async_resolve(parts->host, parts->port, asio::use_awaitable);
    check_aborted();

    // Host header carries the port unless it is the default one
    std::string host = parts->host;
    if ((parts->use_ssl && parts->port != "443") || (!parts->use_ssl && parts->port != "80")) {
        host += ":" + parts->port;
    }
    std::string user_agent = std::string("LiveLink/") + kSdkVersion;

    if (parts->use_ssl) {
        wss_ = std::make_unique<WssStream>(ex_, ssl_ctx_);

        // Set SNI hostname
        if (!SSL_set_tlsext_host_name(wss_->next_layer().native_handle(), parts->host.c_str())) {
            throw boost::system::system_error(
                boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                          asio::error::get_ssl_category()));
        }

        co_await beast::get_lowest_layer(*wss_).async_connect(endpoints, asio::use_awaitable);
        check_aborted();

        co_await wss_->next_layer().async_handshake(ssl::stream_base::client, asio::use_awaitable);
        check_aborted();

        wss_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        wss_->set_option(websocket::stream_base::decorator([user_agent](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, user_agent);
        }));

        co_await wss_->async_handshake(host, parts->target(), asio::use_awaitable);
    } else {
        ws_ = std::make_unique<WsStream>(ex_);

        co_await beast::get_lowest_layer(*ws_).async_connect(endpoints, asio::use_awaitable);
        check_aborted();

        ws_->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_->set_option(websocket::stream_base::decorator([user_agent](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, user_agent);
        }));

        co_await ws_->async_handshake(host, parts->target(), asio::use_awaitable);
    }
    check_aborted();

    log().info("Connected to {}:{}{}", parts->host, parts->port, parts->path);
}

asio::awaitable<void> BeastSignalSocket::reader() {
    beast::flat_buffer buffer;

    for (;;) {
        bool is_text = false;
        if (wss_) {
            co_await wss_->async_read(buffer, asio::use_awaitable);
            is_text = wss_->got_text();
        } else {
            co_await ws_->async_read(buffer, asio::use_awaitable);
            is_text = ws_->got_text();
        }

        auto data = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());

        if (state_ != SocketReadyState::CLOSED) {
            auto handler = handlers_.on_message;
            if (handler) handler(std::move(data), is_text);
        }
    }
}

asio::awaitable<void> BeastSignalSocket::writer() {
    while (state_ == SocketReadyState::OPEN || state_ == SocketReadyState::CLOSING) {
        // Wait for data or a close request
        while (write_queue_.empty() && !close_requested_ && state_ == SocketReadyState::OPEN) {
            write_signal_.expires_at(asio::steady_timer::time_point::max());
            boost::system::error_code ec;
            co_await write_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        }

        if (state_ == SocketReadyState::CLOSED) {
            break;
        }

        if (close_requested_) {
            boost::system::error_code ec;
            if (wss_) {
                co_await wss_->async_close(local_close_, asio::redirect_error(asio::use_awaitable, ec));
            } else {
                co_await ws_->async_close(local_close_, asio::redirect_error(asio::use_awaitable, ec));
            }
            if (ec) {
                log().debug("closing handshake failed: {}", ec.message());
                if (wss_) beast::get_lowest_layer(*wss_).close();
                if (ws_) beast::get_lowest_layer(*ws_).close();
            }
            break;
        }

        auto item = std::move(write_queue_.front());
        write_queue_.pop();

        boost::system::error_code ec;
        if (wss_) {
            wss_->text(item.is_text);
            co_await wss_->async_write(asio::buffer(item.data), asio::redirect_error(asio::use_awaitable, ec));
        } else {
            ws_->text(item.is_text);
            co_await ws_->async_write(asio::buffer(item.data), asio::redirect_error(asio::use_awaitable, ec));
        }
        if (ec) {
            log().warn("signal write failed: {}", ec.message());
            break;
        }
    }
}

} // namespace livelink::client
