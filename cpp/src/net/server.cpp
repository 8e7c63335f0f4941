#include "ferry/net/server.hpp"

#include <array>
#include <chrono>
#include <exception>
#include <limits>
#include <memory>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "ferry/core/log.hpp"

namespace ferry::net {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using ferry::core::Status;
using ferry::core::StatusCode;
using ferry::core::StatusDomain;
using ferry::core::make_status;

namespace {
    constexpr std::size_t kBodyBufferSize = 8192;

    [[nodiscard]] bool quiet_error(const beast::error_code& ec) noexcept {
        return ec == http::error::end_of_stream || ec == beast::error::timeout ||
               ec == asio::error::eof || ec == asio::error::connection_reset ||
               ec == asio::error::operation_aborted;
    }

    // One accepted connection. Requests are served one at a time; a PATCH
    // body is handed to the router in chunk_buffer_bytes pieces as it arrives.
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(tcp::socket&& socket, RequestRouter& router, const ServerConfig& cfg)
            : stream_(std::move(socket)), router_(router), cfg_(cfg) {
        }

        void start() {
            asio::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::do_read_header, shared_from_this()));
        }

    private:
        void arm_timeout() {
            stream_.expires_after(std::chrono::milliseconds(cfg_.read_timeout_ms));
        }

        void do_read_header() {
            parser_.emplace();
            parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
            body_.clear();
            arm_timeout();
            http::async_read_header(stream_, buffer_, *parser_,
                beast::bind_front_handler(&HttpSession::on_read_header, shared_from_this()));
        }

        void on_read_header(beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                return do_close();
            }
            if (ec) {
                if (!quiet_error(ec)) {
                    core::log_debug("read header failed: %s", ec.message().c_str());
                }
                return;
            }

            const auto& head = parser_->get().base();
            keep_alive_ = parser_->get().keep_alive();
            expects_continue_ = beast::iequals(head[http::field::expect], "100-continue");

            if (router_.is_append(head)) {
                return start_append();
            }

            if (parser_->content_length() && *parser_->content_length() > cfg_.max_buffered_body) {
                return reject_body();
            }
            if (parser_->is_done()) {
                return handle_request();
            }
            if (expects_continue_) {
                return send_continue(false);
            }
            read_body_chunk();
        }

        // ====================================================================
        // Buffered requests
        // ====================================================================

        void read_body_chunk() {
            parser_->get().body().data = body_buffer_.data();
            parser_->get().body().size = body_buffer_.size();
            arm_timeout();
            http::async_read(stream_, buffer_, *parser_,
                beast::bind_front_handler(&HttpSession::on_body_chunk, shared_from_this()));
        }

        void on_body_chunk(beast::error_code ec, std::size_t) {
            if (ec && ec != http::error::need_buffer) {
                if (!quiet_error(ec)) {
                    core::log_debug("read body failed: %s", ec.message().c_str());
                }
                return;
            }
            const std::size_t got = body_buffer_.size() - parser_->get().body().size;
            body_.append(body_buffer_.data(), got);
            if (body_.size() > cfg_.max_buffered_body) {
                return reject_body();
            }
            if (parser_->is_done()) {
                return handle_request();
            }
            read_body_chunk();
        }

        void reject_body() {
            Response res = error_response(make_status(StatusDomain::Net, StatusCode::TooLarge),
                parser_->get().version(), "request body too large");
            res.keep_alive(false);
            send(std::move(res));
        }

        void handle_request() {
            Response res;
            try {
                Request req(parser_->get().base(), std::move(body_));
                res = router_.handle(req);
            } catch (const std::exception& e) {
                core::log_error("request failed: %s", e.what());
                res = error_response(make_status(StatusDomain::Net, StatusCode::Io),
                    parser_->get().version(), std::string{});
            }
            res.keep_alive(res.keep_alive() && keep_alive_);
            send(std::move(res));
        }

        // ====================================================================
        // Streamed uploads
        // ====================================================================

        void start_append() {
            Response err;
            if (!router_.begin_append(parser_->get().base(), &ctx_, &err)) {
                err.keep_alive(false);
                return send(std::move(err));
            }
            chunk_.resize(cfg_.chunk_buffer_bytes == 0 ? kBodyBufferSize : cfg_.chunk_buffer_bytes);
            filled_ = 0;
            if (parser_->is_done()) {
                return send_append_result(router_.finish_append(ctx_));
            }
            if (expects_continue_) {
                return send_continue(true);
            }
            read_append_chunk();
        }

        void read_append_chunk() {
            parser_->get().body().data = chunk_.data() + filled_;
            parser_->get().body().size = chunk_.size() - filled_;
            arm_timeout();
            http::async_read(stream_, buffer_, *parser_,
                beast::bind_front_handler(&HttpSession::on_append_chunk, shared_from_this()));
        }

        void on_append_chunk(beast::error_code ec, std::size_t) {
            filled_ = chunk_.size() - parser_->get().body().size;
            if (ec && ec != http::error::need_buffer) {
                // Keep whatever arrived; the client resumes from the durable offset.
                Response ignored;
                if (filled_ > 0 && !flush_chunk(&ignored)) {
                    core::log_warn("upload %s: could not keep partial chunk", ctx_.upload_id.c_str());
                }
                router_.abort_append(ctx_, ec.message().c_str());
                return;
            }
            if (filled_ == chunk_.size() || parser_->is_done()) {
                Response err;
                if (filled_ > 0 && !flush_chunk(&err)) {
                    err.keep_alive(false);
                    return send(std::move(err));
                }
            }
            if (parser_->is_done()) {
                return send_append_result(router_.finish_append(ctx_));
            }
            read_append_chunk();
        }

        [[nodiscard]] bool flush_chunk(Response* err) {
            const ferry::storage::BufferView piece{chunk_.data(), static_cast<u32>(filled_)};
            filled_ = 0;
            return router_.append_piece(ctx_, piece, err);
        }

        void send_append_result(Response res) {
            res.keep_alive(res.keep_alive() && keep_alive_);
            send(std::move(res));
        }

        // ====================================================================
        // Writing
        // ====================================================================

        void send_continue(bool append) {
            auto res = std::make_shared<http::response<http::empty_body>>(http::status::continue_, parser_->get().version());
            auto self = shared_from_this();
            http::async_write(stream_, *res, [self, res, append](beast::error_code ec, std::size_t) {
                if (ec) {
                    return;
                }
                if (append) {
                    self->read_append_chunk();
                } else {
                    self->read_body_chunk();
                }
            });
        }

        void send(Response&& res) {
            auto sp = std::make_shared<Response>(std::move(res));
            http::async_write(stream_, *sp,
                beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), sp));
        }

        void on_write(std::shared_ptr<Response> res, beast::error_code ec, std::size_t) {
            if (ec) {
                if (!quiet_error(ec)) {
                    core::log_debug("write failed: %s", ec.message().c_str());
                }
                return;
            }
            if (res->need_eof()) {
                return do_close();
            }
            do_read_header();
        }

        void do_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        beast::tcp_stream stream_;
        RequestRouter& router_;
        const ServerConfig& cfg_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::buffer_body>> parser_;
        std::array<char, kBodyBufferSize> body_buffer_{};
        std::string body_;
        bool keep_alive_{true};
        bool expects_continue_{false};

        AppendContext ctx_;
        std::vector<ferry::core::u8> chunk_;
        std::size_t filled_{0};
    };
} // namespace

// ========================================================================
// TransferServer
// ========================================================================

TransferServer::TransferServer(ServerConfig cfg, RequestRouter& router)
    : cfg_(std::move(cfg)), router_(router) {
}

TransferServer::~TransferServer() {
    stop();
}

Status TransferServer::start(u16* bound_port) noexcept {
    if (running_.load()) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    try {
        beast::error_code ec;
        const auto address = asio::ip::make_address(cfg_.bind_address, ec);
        if (ec) {
            core::log_error("invalid bind address '%s'", cfg_.bind_address.c_str());
            return make_status(StatusDomain::Net, StatusCode::Invalid);
        }

        for (const u16 candidate : cfg_.ports) {
            const tcp::endpoint endpoint{address, candidate};
            tcp::acceptor acceptor(ioc_);
            acceptor.open(endpoint.protocol(), ec);
            if (!ec) {
                acceptor.set_option(asio::socket_base::reuse_address(true), ec);
            }
            if (!ec) {
                acceptor.bind(endpoint, ec);
            }
            if (!ec) {
                acceptor.listen(asio::socket_base::max_listen_connections, ec);
            }
            if (ec) {
                core::log_warn("port %u unavailable: %s", static_cast<unsigned>(candidate), ec.message().c_str());
                continue;
            }
            port_.store(acceptor.local_endpoint().port());
            acceptor_.emplace(std::move(acceptor));
            break;
        }
        if (!acceptor_) {
            core::log_error("no port available on %s (%zu candidates tried)",
                cfg_.bind_address.c_str(), cfg_.ports.size());
            return make_status(StatusDomain::Net, StatusCode::AddressInUse);
        }

        router_.set_bound_port(port_.load());
        work_.emplace(asio::make_work_guard(ioc_));
        running_.store(true);
        do_accept();

        const u32 n = cfg_.worker_threads == 0 ? 1 : cfg_.worker_threads;
        threads_.reserve(n);
        for (u32 i = 0; i < n; ++i) {
            threads_.emplace_back([this] {
                try {
                    ioc_.run();
                } catch (const std::exception& e) {
                    core::log_error("worker stopped: %s", e.what());
                }
            });
        }
    } catch (const std::exception& e) {
        core::log_error("server start failed: %s", e.what());
        stop();
        return make_status(StatusDomain::Net, StatusCode::Io);
    }

    core::log_info("listening on %s:%u", cfg_.bind_address.c_str(), static_cast<unsigned>(port_.load()));
    if (bound_port != nullptr) {
        *bound_port = port_.load();
    }
    return ferry::core::ok_status();
}

void TransferServer::stop() noexcept {
    running_.store(false);
    work_.reset();
    ioc_.stop();
    for (std::thread& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
    if (acceptor_) {
        beast::error_code ec;
        acceptor_->close(ec);
        acceptor_.reset();
    }
}

void TransferServer::do_accept() {
    acceptor_->async_accept(asio::make_strand(ioc_),
        beast::bind_front_handler(&TransferServer::on_accept, this));
}

void TransferServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (!running_.load() || !acceptor_ || !acceptor_->is_open()) {
        return;
    }
    if (ec) {
        core::log_warn("accept failed: %s", ec.message().c_str());
    } else {
        std::make_shared<HttpSession>(std::move(socket), router_, cfg_)->start();
    }
    do_accept();
}

} // namespace ferry::net
