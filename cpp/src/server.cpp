/**
 * @file server.cpp
 * @brief Implementation of the HTTP infrastructure server
 *
 * Harbor - Agent Listener Subsystem
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "harbor/server.hpp"
#include "harbor/errors.hpp"
#include "harbor/utilities.hpp"

#include <asio.hpp>

#include <algorithm>
#include <cctype>
#include <map>

namespace harbor {

namespace {

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        default: return "Internal Server Error";
    }
}

/**
 * @brief One HTTP request/response exchange on an accepted connection
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(asio::ip::tcp::socket socket, const HttpServer& server)
        : socket_(std::move(socket))
        , timer_(socket_.get_executor())
        , buffer_(config::MAX_HTTP_HEADER_SIZE + config::MAX_MESSAGE_SIZE)
        , server_(server)
    {
    }

    void start() {
        auto self = shared_from_this();

        timer_.expires_after(config::READ_TIMEOUT);
        timer_.async_wait([self](const asio::error_code& ec) {
            if (!ec) {
                utilities::log_debug("HTTP request timed out");
                asio::error_code ignored;
                self->socket_.close(ignored);
            }
        });

        asio::async_read_until(socket_, buffer_, "\r\n\r\n",
            [self](const asio::error_code& ec, size_t header_size) {
                self->on_headers(ec, header_size);
            });
    }

private:
    void on_headers(const asio::error_code& ec, size_t header_size) {
        if (ec) {
            utilities::log_debug("HTTP read failed: " + ec.message());
            close();
            return;
        }

        std::string head(asio::buffers_begin(buffer_.data()),
                         asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(header_size));
        buffer_.consume(header_size);

        auto lines = utilities::split_string(head, '\n');
        for (auto& line : lines) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
        }

        // Request line: METHOD SP TARGET SP VERSION
        auto request_line = utilities::split_string(lines.front(), ' ');
        if (request_line.size() != 3) {
            respond(400);
            return;
        }

        const std::string& method = request_line[0];
        std::string path = request_line[1].substr(0, request_line[1].find('?'));

        std::map<std::string, std::string> headers;
        for (size_t i = 1; i < lines.size(); ++i) {
            auto colon = lines[i].find(':');
            if (colon == std::string::npos) {
                continue;
            }
            headers[utilities::to_lowercase(utilities::trim_string(lines[i].substr(0, colon)))] =
                utilities::trim_string(lines[i].substr(colon + 1));
        }

        if (method != "POST") {
            respond(405);
            return;
        }
        if (!server_.serves_path(path)) {
            respond(404);
            return;
        }

        auto length = headers.find("content-length");
        if (length == headers.end()) {
            respond(411);
            return;
        }
        bool numeric = !length->second.empty() && length->second.size() <= 9 &&
            std::all_of(length->second.begin(), length->second.end(),
                        [](unsigned char c) { return std::isdigit(c); });
        if (!numeric) {
            respond(400);
            return;
        }
        content_length_ = std::stoul(length->second);
        if (content_length_ > config::MAX_MESSAGE_SIZE) {
            respond(413);
            return;
        }

        auto agent = headers.find("x-agent-id");
        if (agent == headers.end() || agent->second.empty()) {
            respond(400);
            return;
        }
        agent_id_ = agent->second;

        if (buffer_.size() >= content_length_) {
            on_body(asio::error_code());
            return;
        }

        auto self = shared_from_this();
        asio::async_read(socket_, buffer_, asio::transfer_exactly(content_length_ - buffer_.size()),
            [self](const asio::error_code& read_ec, size_t) {
                self->on_body(read_ec);
            });
    }

    void on_body(const asio::error_code& ec) {
        if (ec) {
            utilities::log_debug("HTTP body read failed: " + ec.message());
            close();
            return;
        }

        std::vector<uint8_t> body(asio::buffers_begin(buffer_.data()),
                                  asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(content_length_));
        buffer_.consume(content_length_);

        std::vector<uint8_t> response;
        try {
            response = server_.dispatch(agent_id_, body);
        } catch (const std::exception& e) {
            // Failed agent traffic is indistinguishable from an unknown path
            utilities::log_warn("HTTP server " + server_.addr() + " rejected message from agent " +
                                agent_id_ + ": " + e.what());
            respond(404);
            return;
        }

        respond(200, std::move(response));
    }

    void respond(int status, std::vector<uint8_t> body = {}) {
        std::string head = "HTTP/1.1 " + std::to_string(status) + " " + status_reason(status) + "\r\n";
        head += "Content-Type: application/octet-stream\r\n";
        head += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        head += "Connection: close\r\n\r\n";

        auto out = std::make_shared<std::vector<uint8_t>>(head.begin(), head.end());
        out->insert(out->end(), body.begin(), body.end());

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(*out),
            [self, out](const asio::error_code& ec, size_t) {
                if (ec) {
                    utilities::log_debug("HTTP write failed: " + ec.message());
                }
                self->close();
            });
    }

    void close() {
        asio::error_code ignored;
        timer_.cancel();
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    asio::ip::tcp::socket socket_;
    asio::steady_timer timer_;
    asio::streambuf buffer_;
    const HttpServer& server_;
    size_t content_length_ = 0;
    std::string agent_id_;
};

} // namespace

std::string server_state_to_string(ServerState state) {
    switch (state) {
        case ServerState::CREATED: return "Created";
        case ServerState::STARTING: return "Starting";
        case ServerState::RUNNING: return "Running";
        case ServerState::STOPPED: return "Stopped";
        default: return "Unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

std::shared_ptr<HttpServer> HttpServer::create(const std::string& id, const Options& options) {
    auto protocol = config::get_option(options, config::OPTION_PROTOCOL);
    if (protocol && !protocol->empty() && utilities::to_lowercase(*protocol) != "http") {
        throw ValidationError("the " + *protocol + " server protocol is not supported; only HTTP is available");
    }

    std::string iface = config::parse_interface(options);
    uint16_t port = config::parse_port(options);

    std::vector<std::string> urls;
    auto url_option = config::get_option(options, config::OPTION_URLS);
    if (url_option && !url_option->empty()) {
        for (const auto& url : utilities::split_string(*url_option, ',')) {
            std::string path = utilities::trim_string(url);
            if (path.empty()) {
                continue;
            }
            if (path.front() != '/') {
                throw ValidationError("URL path " + path + " must begin with /");
            }
            urls.push_back(path);
        }
    }
    if (urls.empty()) {
        urls.push_back("/");
    }

    return std::make_shared<HttpServer>(PrivateTag{}, id, iface, port, std::move(urls));
}

Options HttpServer::default_options() {
    return {
        {config::OPTION_INTERFACE, config::DEFAULT_INTERFACE},
        {config::OPTION_PORT, std::to_string(config::DEFAULT_HTTP_PORT)},
        {config::OPTION_PROTOCOL, "HTTP"},
        {config::OPTION_URLS, "/"}
    };
}

std::vector<std::string> HttpServer::supported_protocols() {
    return {"HTTP"};
}

HttpServer::HttpServer(PrivateTag, std::string id, std::string iface, uint16_t port, std::vector<std::string> urls)
    : id_(std::move(id))
    , interface_(std::move(iface))
    , port_(port)
    , urls_(std::move(urls))
{
}

HttpServer::~HttpServer() = default;

// ============================================================================
// Lifecycle
// ============================================================================

void HttpServer::start() {
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ServerState::STARTING || state_ == ServerState::RUNNING) {
            throw LifecycleError("HTTP server " + addr() + " is already running");
        }
        state_ = ServerState::STARTING;
        token_ = token;
    }
    state_cv_.notify_all();

    try {
        serve(token);
    } catch (const std::exception& e) {
        set_state(ServerState::STOPPED);
        throw LifecycleError("HTTP server " + addr() + " failed: " + e.what());
    }

    set_state(ServerState::STOPPED);
    utilities::log_info("HTTP server " + addr() + " stopped");
}

void HttpServer::stop() {
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ServerState::STARTING && state_ != ServerState::RUNNING) {
            throw LifecycleError("HTTP server " + addr() + " is not running");
        }
        token = token_;
    }

    token.cancel();

    std::unique_lock<std::mutex> lock(state_mutex_);
    bool stopped = state_cv_.wait_for(lock, config::SERVER_STOP_TIMEOUT,
        [this] { return state_ == ServerState::STOPPED; });
    if (!stopped) {
        throw LifecycleError("timed out waiting for HTTP server " + addr() + " to stop");
    }
}

void HttpServer::serve(CancellationToken token) {
    auto io = std::make_shared<asio::io_context>(1);

    asio::ip::tcp::acceptor acceptor(*io);
    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(interface_), port_);
    acceptor.open(endpoint.protocol());
    acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen();
    bound_port_ = acceptor.local_endpoint().port();

    // Runs immediately if stop() already fired while binding
    token.on_cancel([io] { io->stop(); });

    std::function<void()> accept_next = [&]() {
        acceptor.async_accept([&](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                utilities::log_warn("HTTP server " + addr() + " accept failed: " + ec.message());
            } else {
                std::make_shared<HttpSession>(std::move(socket), *this)->start();
            }
            accept_next();
        });
    };
    if (token.is_cancelled()) {
        utilities::log_debug("HTTP server " + addr() + " stopped before accepting connections");
    } else {
        accept_next();

        set_state(ServerState::RUNNING);
        utilities::log_info("HTTP server listening on " + addr() + " (" + utilities::join_strings(urls_, ",") + ")");

        io->run();
    }

    asio::error_code ignored;
    acceptor.close(ignored);
    bound_port_ = 0;
}

void HttpServer::set_state(ServerState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = state;
    }
    state_cv_.notify_all();
}

ServerState HttpServer::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

// ============================================================================
// Accessors
// ============================================================================

std::string HttpServer::addr() const {
    uint16_t port = bound_port_.load();
    return config::format_address(interface_, port != 0 ? port : port_);
}

Options HttpServer::configured_options() const {
    return {
        {config::OPTION_INTERFACE, interface_},
        {config::OPTION_PORT, std::to_string(port_)},
        {config::OPTION_PROTOCOL, protocol_string()},
        {config::OPTION_URLS, utilities::join_strings(urls_, ",")}
    };
}

void HttpServer::set_handler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

std::vector<uint8_t> HttpServer::dispatch(const std::string& agent_id, const std::vector<uint8_t>& body) const {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }
    if (!handler) {
        throw LifecycleError("HTTP server " + addr() + " has no request handler");
    }
    return handler(agent_id, body);
}

bool HttpServer::serves_path(const std::string& path) const {
    return std::find(urls_.begin(), urls_.end(), path) != urls_.end();
}

} // namespace harbor
