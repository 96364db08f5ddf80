#pragma once

#include "net/transport.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

namespace voxlink {

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

/**
 * @brief Split a wss:// URL into host, port (default 443) and target (default "/")
 */
Result<WsUrl> parse_ws_url(const std::string& url);

/**
 * @brief Transport over Boost.Beast WebSocket on TLS
 *
 * resolve -> TCP connect -> TLS handshake (SNI, peer verification) ->
 * WebSocket handshake -> read loop. Writes are queued and sent one at a time.
 */
class WebSocketTransport : public Transport {
public:
    WebSocketTransport(boost::asio::io_context& ioc, std::string url);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void open(Handlers handlers) override;
    void send(const std::string& message) override;
    void close() override;
    bool is_open() const override;
    size_t pending_writes() const override;

    const std::string& url() const { return url_; }

private:
    class Connection;

    boost::asio::io_context& ioc_;
    boost::asio::ssl::context ssl_ctx_;
    std::string url_;
    std::shared_ptr<Connection> connection_;
};

} // namespace voxlink
