#include "net/websocket_transport.h"
#include "logger.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <chrono>
#include <deque>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace voxlink {

Result<WsUrl> parse_ws_url(const std::string& url) {
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return make_config_error("Only wss:// URLs are supported: " + url);
    }
    std::string rest = url.substr(scheme.size());
    WsUrl out;

    std::string::size_type slash = rest.find_first_of("/?");
    std::string authority = rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);
    if (!out.target.empty() && out.target[0] == '?') {
        out.target = "/" + out.target;
    }

    std::string::size_type colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = "443";
    }
    if (out.host.empty() || out.port.empty()) {
        return make_config_error("Malformed URL: " + url);
    }
    return out;
}

// One connection attempt and its lifetime. Handlers capture shared_from_this
// so the stream outlives every pending operation; abandon() detaches the
// owner's callbacks.
class WebSocketTransport::Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(net::io_context& ioc, ssl::context& ctx, WsUrl url, Handlers handlers)
        : resolver_(net::make_strand(ioc)),
          ws_(net::make_strand(ioc), ctx),
          url_(std::move(url)),
          handlers_(std::move(handlers)) {}

    void start() {
        resolver_.async_resolve(url_.host, url_.port,
            beast::bind_front_handler(&Connection::on_resolve, shared_from_this()));
    }

    void send(const std::string& message) {
        if (!open_) {
            Logger::warn("WebSocket send dropped (not open): " + url_.host);
            return;
        }
        outbox_.push_back(message);
        if (outbox_.size() == 1) {
            do_write();
        }
    }

    void close() {
        bool was_open = open_;
        abandon();
        if (was_open) {
            ws_.async_close(websocket::close_code::normal,
                [self = shared_from_this()](beast::error_code ec) {
                    if (ec) Logger::debug("WebSocket close: " + ec.message());
                });
        } else {
            beast::error_code ignored;
            beast::get_lowest_layer(ws_).socket().close(ignored);
        }
    }

    bool is_open() const { return open_; }

    size_t pending() const { return outbox_.size(); }

private:
    // The outbox front may back an in-flight write, so it is left in place
    void abandon() {
        open_ = false;
        handlers_ = Handlers{};
    }

    void fail(beast::error_code ec, const char* what) {
        if (ec == net::error::operation_aborted || ec == websocket::error::closed) {
            bool was_open = open_;
            auto on_close = handlers_.on_close;
            abandon();
            if (was_open && on_close) on_close();
            return;
        }
        auto on_error = handlers_.on_error;
        abandon();
        if (on_error) {
            on_error(make_network_error(std::string(what) + ": " + ec.message()));
        }
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");

        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
        beast::get_lowest_layer(ws_).async_connect(results,
            beast::bind_front_handler(&Connection::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail(ec, "connect");

        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
        if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
            ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            return fail(ec, "SSL_set_tlsext_host_name");
        }
        ws_.next_layer().set_verify_callback(ssl::host_name_verification(url_.host));

        ws_.next_layer().async_handshake(ssl::stream_base::client,
            beast::bind_front_handler(&Connection::on_ssl_handshake, shared_from_this()));
    }

    void on_ssl_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "ssl_handshake");

        // The websocket stream has its own timeout settings
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(http::field::user_agent, "voxlink/1.0");
            }));
        ws_.text(true);

        std::string host = url_.host;
        if (url_.port != "443") host += ":" + url_.port;
        ws_.async_handshake(host, url_.target,
            beast::bind_front_handler(&Connection::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "handshake");

        open_ = true;
        do_read();
        if (handlers_.on_open) handlers_.on_open();
    }

    void do_read() {
        ws_.async_read(buffer_,
            beast::bind_front_handler(&Connection::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "read");

        std::string message = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        if (handlers_.on_message) handlers_.on_message(message);
        if (open_) do_read();
    }

    void do_write() {
        ws_.async_write(net::buffer(outbox_.front()),
            beast::bind_front_handler(&Connection::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "write");

        if (!outbox_.empty()) outbox_.pop_front();
        if (!outbox_.empty()) do_write();
    }

    tcp::resolver resolver_;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    WsUrl url_;
    Handlers handlers_;
    bool open_ = false;
};

WebSocketTransport::WebSocketTransport(net::io_context& ioc, std::string url)
    : ioc_(ioc), ssl_ctx_(ssl::context::tlsv12_client), url_(std::move(url)) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

WebSocketTransport::~WebSocketTransport() {
    close();
}

void WebSocketTransport::open(Handlers handlers) {
    close();
    auto parsed = parse_ws_url(url_);
    if (!parsed) {
        auto on_error = handlers.on_error;
        Error error = parsed.error();
        net::post(ioc_, [on_error, error]() {
            if (on_error) on_error(error);
        });
        return;
    }
    connection_ = std::make_shared<Connection>(ioc_, ssl_ctx_, parsed.value(), std::move(handlers));
    connection_->start();
}

void WebSocketTransport::send(const std::string& message) {
    if (!connection_) {
        Logger::warn("WebSocket send dropped (no connection)");
        return;
    }
    connection_->send(message);
}

void WebSocketTransport::close() {
    if (connection_) {
        connection_->close();
        connection_.reset();
    }
}

bool WebSocketTransport::is_open() const {
    return connection_ && connection_->is_open();
}

size_t WebSocketTransport::pending_writes() const {
    return connection_ ? connection_->pending() : 0;
}

} // namespace voxlink
