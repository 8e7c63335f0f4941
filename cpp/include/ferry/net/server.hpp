#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"
#include "ferry/net/router.hpp"

namespace ferry::net {
    using u32 = ferry::core::u32;
    using i64 = ferry::core::i64;

    struct ServerConfig {
        std::string bind_address{"0.0.0.0"};
        std::vector<u16> ports{8080};       // tried in order; 0 picks an ephemeral port
        u32 worker_threads{4};
        i64 read_timeout_ms{60 * 1000};
        u32 chunk_buffer_bytes{1024 * 1024}; // PATCH bodies reach the engine in pieces of this size
        u64 max_buffered_body{64 * 1024};    // non-upload request bodies
    };

    // HTTP/1.1 listener. Binds to the first free port of ServerConfig::ports
    // and runs the io_context on worker_threads threads. Upload bodies are
    // streamed to the router piecewise, everything else is read whole.
    class TransferServer {
    public:
        TransferServer(ServerConfig cfg, RequestRouter& router);
        ~TransferServer();

        TransferServer(const TransferServer&) = delete;
        TransferServer& operator=(const TransferServer&) = delete;

        // AddressInUse (Net) when no candidate port can be bound.
        [[nodiscard]] ferry::core::Status start(u16* bound_port) noexcept;
        void stop() noexcept;

        [[nodiscard]] bool running() const noexcept { return running_.load(); }
        [[nodiscard]] u16 port() const noexcept { return port_.load(); }
        // Shared with timers such as the cleanup scheduler.
        [[nodiscard]] boost::asio::io_context& io_context() noexcept { return ioc_; }

    private:
        void do_accept();
        void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

        ServerConfig cfg_;
        RequestRouter& router_;
        boost::asio::io_context ioc_;
        std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
        std::optional<boost::asio::ip::tcp::acceptor> acceptor_;
        std::vector<std::thread> threads_;
        std::atomic<bool> running_{false};
        std::atomic<u16> port_{0};
    };
} // namespace ferry::net
