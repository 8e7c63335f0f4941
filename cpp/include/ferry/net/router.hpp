#pragma once

#include <atomic>
#include <cstddef>
#include <string>

#include <boost/beast/http.hpp>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"
#include "ferry/net/assets.hpp"
#include "ferry/protocol/engine.hpp"
#include "ferry/protocol/history.hpp"
#include "ferry/security/access_gate.hpp"
#include "ferry/storage/backend.hpp"
#include "ferry/storage/buffer.hpp"

namespace ferry::net {
    namespace http = boost::beast::http;

    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using RequestHead = http::request_header<>;
    using u16 = ferry::core::u16;
    using u64 = ferry::core::u64;

    inline constexpr const char* kUploadBasePath = "/files";

    struct RouterDeps {
        ferry::protocol::ProtocolEngine* engine{nullptr};
        ferry::security::AccessGate* gate{nullptr};
        ferry::storage::StorageBackend* backend{nullptr};
        const AssetProvider* assets{nullptr};               // optional
        const ferry::protocol::UploadHistory* history{nullptr}; // optional
    };

    // State of one streamed PATCH between begin_append and finish_append.
    struct AppendContext {
        std::string upload_id;
        u64 offset{0};          // next expected offset
        u64 expected_size{0};
        u64 bytes_this_request{0};
        unsigned version{11};
        bool completed{false};
    };

    // Maps HTTP requests onto the protocol engine. Stateless apart from the
    // advertised port, so one router serves every connection.
    //
    //   OPTIONS /files[/id]   capabilities        (no gate)
    //   POST    /files        create              (gate)
    //   HEAD    /files/{id}   offset              (no gate)
    //   PATCH   /files/{id}   append              (gate)
    //   DELETE  /files/{id}   cancel              (gate)
    //   GET     /api/status, /api/incomplete-uploads, /api/files
    //   POST    /api/verify-pin
    //   GET     anything else: static assets
    class RequestRouter {
    public:
        explicit RequestRouter(RouterDeps deps) noexcept;

        void set_bound_port(u16 port) noexcept { port_.store(port); }

        // Requests whose whole body has been read.
        [[nodiscard]] Response handle(const Request& req);

        // Streaming PATCH path. begin_append checks the gate and headers
        // before any body byte is read; append_piece hands each piece to the
        // engine. A false return leaves the error response in *out and the
        // connection should be closed.
        [[nodiscard]] bool is_append(const RequestHead& head) const;
        [[nodiscard]] bool begin_append(const RequestHead& head, AppendContext* ctx, Response* out);
        [[nodiscard]] bool append_piece(AppendContext& ctx, ferry::storage::BufferView piece, Response* out);
        [[nodiscard]] Response finish_append(const AppendContext& ctx);
        // The client went away mid-body; the session keeps its durable offset.
        void abort_append(const AppendContext& ctx, const char* reason) const noexcept;

    private:
        [[nodiscard]] Response handle_options(const Request& req);
        [[nodiscard]] Response handle_create(const Request& req);
        [[nodiscard]] Response handle_head(const Request& req, const std::string& id);
        [[nodiscard]] Response handle_delete(const Request& req, const std::string& id);
        [[nodiscard]] Response handle_status(const Request& req);
        [[nodiscard]] Response handle_incomplete(const Request& req);
        [[nodiscard]] Response handle_files(const Request& req);
        [[nodiscard]] Response handle_verify_pin(const Request& req);
        [[nodiscard]] Response handle_asset(const Request& req, const std::string& path);

        [[nodiscard]] ferry::core::Status check_gate(const RequestHead& head) const noexcept;

        RouterDeps deps_;
        std::atomic<u16> port_{0};
    };

    // Status -> HTTP status code.
    [[nodiscard]] http::status http_status_for(ferry::core::Status s) noexcept;
    [[nodiscard]] Response error_response(ferry::core::Status s, unsigned version, const std::string& message);
    // Strips the query string.
    [[nodiscard]] std::string request_path(const RequestHead& head);
    // "/files/<id>" -> id; false for the collection itself or other paths.
    [[nodiscard]] bool upload_id_from_path(const std::string& path, std::string* id);
    // Whether a buffered body can go to the engine as one chunk.
    [[nodiscard]] bool chunk_size_fits(std::size_t n) noexcept;
} // namespace ferry::net
