#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <queue>
#include <string>

namespace livelink::client {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;

enum class SocketReadyState {
    CONNECTING,
    OPEN,
    CLOSING,
    CLOSED,
};

const char* socket_ready_state_name(SocketReadyState state);

// Handlers run on the socket's executor. An empty function is skipped.
struct SignalSocketHandlers {
    std::function<void()> on_open;
    std::function<void(std::string data, bool is_text)> on_message;
    std::function<void(const std::string& error)> on_error;
    std::function<void(uint16_t code, const std::string& reason)> on_close;
};

// ============================================================================
// SignalSocket
// ============================================================================

/// Message channel to the session server.
///
/// Lifecycle: open() -> on_open or on_error, then exactly one on_close once
/// the channel is gone, whether the close was local, remote or a failure.
class SignalSocket {
public:
    virtual ~SignalSocket() = default;

    // Replaces every handler
    virtual void set_handlers(SignalSocketHandlers handlers) = 0;

    virtual void open(const std::string& url) = 0;

    // Dropped unless OPEN
    virtual void send(std::string data, bool is_text) = 0;

    // Starts the closing handshake; on_close follows asynchronously
    virtual void close(uint16_t code = 1000, const std::string& reason = {}) = 0;

    virtual SocketReadyState ready_state() const = 0;
};

class SignalSocketFactory {
public:
    virtual ~SignalSocketFactory() = default;
    virtual std::shared_ptr<SignalSocket> create() = 0;
};

// ============================================================================
// BeastSignalSocket
// ============================================================================

class BeastSignalSocket : public SignalSocket,
                          public std::enable_shared_from_this<BeastSignalSocket> {
public:
    explicit BeastSignalSocket(asio::any_io_executor ex);
    ~BeastSignalSocket() override;

    BeastSignalSocket(const BeastSignalSocket&) = delete;
    BeastSignalSocket& operator=(const BeastSignalSocket&) = delete;

    void set_handlers(SignalSocketHandlers handlers) override;
    void open(const std::string& url) override;
    void send(std::string data, bool is_text) override;
    void close(uint16_t code = 1000, const std::string& reason = {}) override;
    SocketReadyState ready_state() const override { return state_; }

private:
    asio::awaitable<void> run(std::string url);
    asio::awaitable<void> do_connect(const std::string& url);
    asio::awaitable<void> reader();
    asio::awaitable<void> writer();

    void fire_error(const std::string& error);
    void fire_close(uint16_t code, const std::string& reason);

    asio::any_io_executor ex_;
    ssl::context ssl_ctx_{ssl::context::tlsv12_client};

    using WssStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;
    using WsStream = websocket::stream<beast::tcp_stream>;
    std::unique_ptr<WssStream> wss_;
    std::unique_ptr<WsStream> ws_;

    struct WriteItem {
        std::string data;
        bool is_text{false};
    };
    std::queue<WriteItem> write_queue_;
    asio::steady_timer write_signal_;

    SocketReadyState state_ = SocketReadyState::CLOSED;
    SignalSocketHandlers handlers_;

    bool close_requested_ = false;
    bool close_fired_ = false;
    websocket::close_reason local_close_;
};

class BeastSignalSocketFactory : public SignalSocketFactory {
public:
    explicit BeastSignalSocketFactory(asio::any_io_executor ex) : ex_(std::move(ex)) {}

    std::shared_ptr<SignalSocket> create() override {
        return std::make_shared<BeastSignalSocket>(ex_);
    }

private:
    asio::any_io_executor ex_;
};

} // namespace livelink::client
