#include "ferry/net/router.hpp"

#include <cstdio>
#include <limits>
#include <utility>
#include <vector>

#include "ferry/core/log.hpp"
#include "ferry/net/json.hpp"
#include "ferry/protocol/tus.hpp"
#include "ferry/protocol/validation.hpp"
#include "ferry/storage/hashing.hpp"

namespace ferry::net {

using namespace ferry::core;
using ferry::protocol::kOffsetContentType;
using ferry::protocol::kTusExtensions;
using ferry::protocol::kTusVersion;

// ========================================================================
// Helpers
// ========================================================================

namespace {
    [[nodiscard]] bool header_value(const RequestHead& head, const char* name, std::string* out) {
        auto it = head.find(name);
        if (it == head.end()) {
            return false;
        }
        const auto v = it->value();
        out->assign(v.data(), v.size());
        return true;
    }

    [[nodiscard]] bool header_value(const RequestHead& head, http::field name, std::string* out) {
        auto it = head.find(name);
        if (it == head.end()) {
            return false;
        }
        const auto v = it->value();
        out->assign(v.data(), v.size());
        return true;
    }

    [[nodiscard]] Response make_response(http::status status, unsigned version) {
        Response res{status, version};
        res.set(http::field::server, "ferry");
        res.set(http::field::cache_control, "no-store");
        return res;
    }

    [[nodiscard]] Response json_response(http::status status, unsigned version, std::string body) {
        Response res = make_response(status, version);
        res.set(http::field::content_type, "application/json");
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    void set_tus_headers(Response* res) {
        res->set("Tus-Resumable", kTusVersion);
    }

    void set_offset_header(Response* res, u64 offset) {
        res->set("Upload-Offset", std::to_string(offset));
    }

    [[nodiscard]] const char* default_message(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Invalid: return "invalid request";
            case StatusCode::TooLarge: return "upload exceeds the allowed size";
            case StatusCode::Unsupported: return "file type not accepted";
            case StatusCode::Unauthenticated: return "PIN required";
            case StatusCode::PermissionDenied: return "invalid PIN";
            case StatusCode::NotFound: return "upload not found";
            case StatusCode::Conflict: return "offset does not match the stored offset";
            case StatusCode::Gone: return "upload can no longer be resumed";
            case StatusCode::Busy: return "another upload is in progress";
            case StatusCode::NoSpace: return "not enough storage space";
            default: return "internal storage error";
        }
    }

    [[nodiscard]] Response mismatch_response(unsigned version, u64 expected, u64 actual) {
        JsonWriter w;
        w.begin_object()
            .field("success", false)
            .key("error").begin_object()
                .field("code", status_code_name(StatusCode::Conflict))
                .field("message", default_message(StatusCode::Conflict))
                .field("expectedOffset", expected)
                .field("actualOffset", actual)
            .end_object()
        .end_object();
        Response res = json_response(http::status::conflict, version, w.take());
        set_tus_headers(&res);
        set_offset_header(&res, expected);
        return res;
    }

    // The client is describing a different file than the one this upload was created for.
    [[nodiscard]] Response length_mismatch_response(unsigned version, u64 expected, u64 actual) {
        JsonWriter w;
        w.begin_object()
            .field("success", false)
            .key("error").begin_object()
                .field("code", status_code_name(StatusCode::Conflict))
                .field("message", "upload length does not match this upload")
                .field("expectedLength", expected)
                .field("actualLength", actual)
            .end_object()
        .end_object();
        Response res = json_response(http::status::conflict, version, w.take());
        set_tus_headers(&res);
        return res;
    }

    // Tus-Resumable is optional for plain HTTP clients but must match when sent.
    [[nodiscard]] bool tus_version_ok(const RequestHead& head, unsigned version, Response* out) {
        std::string v;
        if (!header_value(head, "Tus-Resumable", &v) || v == kTusVersion) {
            return true;
        }
        *out = make_response(http::status::precondition_failed, version);
        out->set("Tus-Version", kTusVersion);
        set_tus_headers(out);
        out->prepare_payload();
        return false;
    }

    [[nodiscard]] bool path_is_upload(const std::string& path) {
        const std::string base = kUploadBasePath;
        return path == base || path.compare(0, base.size() + 1, base + "/") == 0;
    }

    [[nodiscard]] std::string trim(const std::string& s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) ++b;
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) --e;
        return s.substr(b, e - b);
    }

    // Accepts {"pin":"1234"}, pin=1234 or the bare PIN.
    [[nodiscard]] std::string pin_from_body(const std::string& raw) {
        const std::string body = trim(raw);
        if (!body.empty() && body[0] == '{') {
            const size_t key = body.find("\"pin\"");
            if (key == std::string::npos) {
                return std::string{};
            }
            size_t p = body.find(':', key + 5);
            if (p == std::string::npos) {
                return std::string{};
            }
            ++p;
            while (p < body.size() && (body[p] == ' ' || body[p] == '\t')) ++p;
            if (p < body.size() && body[p] == '"') {
                const size_t end = body.find('"', p + 1);
                return end == std::string::npos ? std::string{} : body.substr(p + 1, end - p - 1);
            }
            size_t end = p;
            while (end < body.size() && body[end] >= '0' && body[end] <= '9') ++end;
            return body.substr(p, end - p);
        }
        if (body.compare(0, 4, "pin=") == 0) {
            const size_t amp = body.find('&');
            return body.substr(4, amp == std::string::npos ? std::string::npos : amp - 4);
        }
        return body;
    }
} // namespace

http::status http_status_for(Status s) noexcept {
    switch (s.code) {
        case StatusCode::Ok: return http::status::ok;
        case StatusCode::Invalid: return http::status::bad_request;
        case StatusCode::TooLarge: return http::status::payload_too_large;
        case StatusCode::Unsupported: return http::status::unsupported_media_type;
        case StatusCode::Unauthenticated: return http::status::unauthorized;
        case StatusCode::PermissionDenied: return http::status::unauthorized;
        case StatusCode::NotFound: return http::status::not_found;
        case StatusCode::Conflict: return http::status::conflict;
        case StatusCode::Gone: return http::status::gone;
        case StatusCode::Busy: return http::status::locked;
        case StatusCode::NoSpace: return http::status::insufficient_storage;
        case StatusCode::AddressInUse:
        case StatusCode::Unavailable:
            return http::status::service_unavailable;
        default:
            return http::status::internal_server_error;
    }
}

Response error_response(Status s, unsigned version, const std::string& message) {
    JsonWriter w;
    w.begin_object()
        .field("success", false)
        .key("error").begin_object()
            .field("code", status_code_name(s.code))
            .field("message", message.empty() ? std::string(default_message(s.code)) : message)
        .end_object()
    .end_object();
    return json_response(http_status_for(s), version, w.take());
}

bool chunk_size_fits(std::size_t n) noexcept {
    return n <= std::numeric_limits<ferry::core::u32>::max();
}

std::string request_path(const RequestHead& head) {
    const auto target = head.target();
    std::string path(target.data(), target.size());
    const size_t q = path.find('?');
    if (q != std::string::npos) {
        path.resize(q);
    }
    return path;
}

bool upload_id_from_path(const std::string& path, std::string* id) {
    const std::string prefix = std::string(kUploadBasePath) + "/";
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    std::string rest = path.substr(prefix.size());
    if (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }
    if (rest.empty() || rest.find('/') != std::string::npos) {
        return false;
    }
    *id = std::move(rest);
    return true;
}

// ========================================================================
// RequestRouter
// ========================================================================

RequestRouter::RequestRouter(RouterDeps deps) noexcept : deps_(deps) {
}

Status RequestRouter::check_gate(const RequestHead& head) const noexcept {
    std::string secret;
    const bool present = header_value(head, ferry::security::kSecretHeader, &secret) ||
                         header_value(head, ferry::security::kSecretHeaderAlias, &secret);
    return deps_.gate->check(present ? &secret : nullptr);
}

Response RequestRouter::handle(const Request& req) {
    const std::string path = request_path(req);
    const auto verb = req.method();

    if (path_is_upload(path)) {
        if (verb == http::verb::options) {
            return handle_options(req);
        }
        Response res;
        if (!tus_version_ok(req, req.version(), &res)) {
            return res;
        }
        std::string id;
        if (!upload_id_from_path(path, &id)) {
            if (verb == http::verb::post) {
                return handle_create(req);
            }
            return error_response(make_status(StatusDomain::Net, StatusCode::Invalid), req.version(), "method not allowed");
        }
        switch (verb) {
            case http::verb::head:
                return handle_head(req, id);
            case http::verb::delete_:
                return handle_delete(req, id);
            case http::verb::patch: {
                AppendContext ctx;
                if (!begin_append(req, &ctx, &res)) {
                    return res;
                }
                const std::string& body = req.body();
                if (!chunk_size_fits(body.size())) {
                    return error_response(make_status(StatusDomain::Net, StatusCode::TooLarge), req.version(),
                        "request body too large");
                }
                ferry::storage::BufferView piece{reinterpret_cast<const u8*>(body.data()),
                    static_cast<ferry::core::u32>(body.size())};
                if (!body.empty() && !append_piece(ctx, piece, &res)) {
                    return res;
                }
                return finish_append(ctx);
            }
            default:
                return error_response(make_status(StatusDomain::Net, StatusCode::Invalid), req.version(), "method not allowed");
        }
    }

    if (path == "/api/status" && verb == http::verb::get) {
        return handle_status(req);
    }
    if (path == "/api/incomplete-uploads" && verb == http::verb::get) {
        return handle_incomplete(req);
    }
    if (path == "/api/files" && verb == http::verb::get) {
        return handle_files(req);
    }
    if (path == "/api/verify-pin" && verb == http::verb::post) {
        return handle_verify_pin(req);
    }
    if (verb == http::verb::get && path.compare(0, 5, "/api/") != 0) {
        return handle_asset(req, path);
    }
    return error_response(make_status(StatusDomain::Net, StatusCode::NotFound), req.version(), "no such endpoint");
}

Response RequestRouter::handle_options(const Request& req) {
    const ferry::protocol::Capabilities caps = deps_.engine->capabilities();
    Response res = make_response(http::status::no_content, req.version());
    set_tus_headers(&res);
    res.set("Tus-Version", caps.version);
    res.set("Tus-Extension", caps.extensions);
    if (caps.max_size > 0) {
        res.set("Tus-Max-Size", std::to_string(caps.max_size));
    }
    res.prepare_payload();
    return res;
}

Response RequestRouter::handle_create(const Request& req) {
    Status s = check_gate(req);
    if (!is_ok(s)) {
        return error_response(s, req.version(), std::string{});
    }

    std::string length_text;
    u64 length = 0;
    if (!header_value(req, "Upload-Length", &length_text) || !ferry::protocol::parse_u64(length_text, &length)) {
        return error_response(make_status(StatusDomain::Net, StatusCode::Invalid), req.version(),
            "Upload-Length header required");
    }

    ferry::protocol::UploadMetadata meta;
    std::string meta_text;
    if (header_value(req, "Upload-Metadata", &meta_text)) {
        s = ferry::protocol::parse_upload_metadata(meta_text, &meta);
        if (!is_ok(s)) {
            return error_response(s, req.version(), "malformed Upload-Metadata");
        }
    }
    if (meta.filename.empty()) {
        return error_response(make_status(StatusDomain::Net, StatusCode::Invalid), req.version(),
            "filename metadata required");
    }

    ferry::protocol::CreateRequest create;
    create.filename = meta.filename;
    create.mime_type = meta.filetype;
    create.expected_size = length;
    ferry::protocol::CreateResult result;
    s = deps_.engine->create(create, &result);
    if (!is_ok(s)) {
        Response res = error_response(s, req.version(), std::string{});
        set_tus_headers(&res);
        return res;
    }

    Response res = make_response(http::status::created, req.version());
    set_tus_headers(&res);
    res.set(http::field::location, std::string(kUploadBasePath) + "/" + result.upload_id);
    set_offset_header(&res, result.completed ? length : result.offset);
    res.prepare_payload();
    return res;
}

Response RequestRouter::handle_head(const Request& req, const std::string& id) {
    ferry::protocol::OffsetInfo info;
    const Status s = deps_.engine->query_offset(id, &info);
    if (!is_ok(s)) {
        Response res = make_response(http_status_for(s), req.version());
        set_tus_headers(&res);
        res.prepare_payload();
        return res;
    }
    Response res = make_response(http::status::ok, req.version());
    set_tus_headers(&res);
    set_offset_header(&res, info.offset);
    res.set("Upload-Length", std::to_string(info.expected_size));
    res.prepare_payload();
    return res;
}

Response RequestRouter::handle_delete(const Request& req, const std::string& id) {
    Status s = check_gate(req);
    if (!is_ok(s)) {
        return error_response(s, req.version(), std::string{});
    }
    s = deps_.engine->cancel(id);
    if (!is_ok(s)) {
        Response res = error_response(s, req.version(), std::string{});
        set_tus_headers(&res);
        return res;
    }
    Response res = make_response(http::status::no_content, req.version());
    set_tus_headers(&res);
    res.prepare_payload();
    return res;
}

Response RequestRouter::handle_status(const Request& req) {
    u64 available = 0;
    const bool have_space = is_ok(deps_.backend->available_bytes(&available));
    u64 active = 0;
    if (!is_ok(deps_.engine->active_upload_count(&active))) {
        active = 0;
    }

    JsonWriter w;
    w.begin_object()
        .field("success", true)
        .field("running", true)
        .field("port", static_cast<ferry::core::u32>(port_.load()))
        .field("tusVersion", kTusVersion);
    if (have_space) {
        w.field("storageAvailable", available)
         .field("storageAvailableText", ferry::protocol::format_bytes(available));
    } else {
        w.key("storageAvailable").null();
    }
    w.field("activeUploads", active)
     .field("uploadCount", deps_.history ? deps_.history->total() : u64{0})
     .field("pinRequired", deps_.gate->enabled())
    .end_object();
    return json_response(http::status::ok, req.version(), w.take());
}

Response RequestRouter::handle_incomplete(const Request& req) {
    std::vector<UploadSession> sessions;
    const Status s = deps_.engine->list_resumable(&sessions);
    if (!is_ok(s)) {
        return error_response(s, req.version(), std::string{});
    }

    JsonWriter w;
    w.begin_object().field("success", true).key("uploads").begin_array();
    for (const UploadSession& session : sessions) {
        ferry::protocol::OffsetInfo info;
        if (!is_ok(deps_.engine->query_offset(session.id, &info))) {
            continue;
        }
        w.begin_object()
            .field("sessionId", session.id)
            .field("filename", session.filename)
            .field("mimeType", session.mime_type)
            .field("expectedSize", session.expected_size)
            .field("bytesReceived", info.offset)
            .field("progressPercent", progress_percent(info.offset, session.expected_size))
            .field("expectedSizeText", ferry::protocol::format_bytes(session.expected_size))
            .field("bytesReceivedText", ferry::protocol::format_bytes(info.offset))
            .field("createdAt", session.created_at)
            .field("lastActivity", session.updated_at)
        .end_object();
    }
    w.end_array().end_object();
    return json_response(http::status::ok, req.version(), w.take());
}

Response RequestRouter::handle_files(const Request& req) {
    JsonWriter w;
    w.begin_object().field("success", true).key("files").begin_array();
    if (deps_.history) {
        for (const FinalizedFile& f : deps_.history->recent()) {
            w.begin_object()
                .field("uploadId", f.upload_id)
                .field("filename", f.filename)
                .field("mimeType", f.mime_type)
                .field("path", f.path)
                .field("size", f.size_bytes)
                .field("sizeText", ferry::protocol::format_bytes(f.size_bytes))
                .field("digest", ferry::storage::hash_to_hex(f.digest))
                .field("finalizedAt", f.finalized_at)
            .end_object();
        }
    }
    w.end_array().end_object();
    return json_response(http::status::ok, req.version(), w.take());
}

Response RequestRouter::handle_verify_pin(const Request& req) {
    std::string pin;
    if (!header_value(req, ferry::security::kSecretHeader, &pin) &&
        !header_value(req, ferry::security::kSecretHeaderAlias, &pin)) {
        pin = pin_from_body(req.body());
    }
    const Status s = deps_.gate->check(&pin);
    if (!is_ok(s)) {
        return error_response(s, req.version(), std::string{});
    }
    JsonWriter w;
    w.begin_object()
        .field("success", true)
        .field("pinRequired", deps_.gate->enabled())
    .end_object();
    return json_response(http::status::ok, req.version(), w.take());
}

Response RequestRouter::handle_asset(const Request& req, const std::string& path) {
    Asset asset;
    if (deps_.assets == nullptr || !deps_.assets->load(path, &asset)) {
        return error_response(make_status(StatusDomain::Net, StatusCode::NotFound), req.version(), "not found");
    }
    Response res{http::status::ok, req.version()};
    res.set(http::field::server, "ferry");
    res.set(http::field::content_type, asset.content_type);
    res.body() = std::move(asset.body);
    res.prepare_payload();
    return res;
}

// ========================================================================
// Streaming append
// ========================================================================

bool RequestRouter::is_append(const RequestHead& head) const {
    std::string id;
    return head.method() == http::verb::patch && upload_id_from_path(request_path(head), &id);
}

bool RequestRouter::begin_append(const RequestHead& head, AppendContext* ctx, Response* out) {
    const unsigned version = head.version();
    Status s = check_gate(head);
    if (!is_ok(s)) {
        *out = error_response(s, version, std::string{});
        return false;
    }
    if (!tus_version_ok(head, version, out)) {
        return false;
    }

    std::string id;
    if (!upload_id_from_path(request_path(head), &id)) {
        *out = error_response(make_status(StatusDomain::Net, StatusCode::NotFound), version, std::string{});
        return false;
    }

    std::string content_type;
    if (header_value(head, http::field::content_type, &content_type) && content_type != kOffsetContentType) {
        *out = error_response(make_status(StatusDomain::Net, StatusCode::Unsupported), version,
            "Content-Type must be application/offset+octet-stream");
        return false;
    }

    u64 offset = 0;
    std::string text;
    ferry::protocol::ContentRange declared;
    if (header_value(head, "Upload-Offset", &text)) {
        if (!ferry::protocol::parse_u64(text, &offset)) {
            *out = error_response(make_status(StatusDomain::Net, StatusCode::Invalid), version, "malformed Upload-Offset");
            return false;
        }
    } else if (header_value(head, http::field::content_range, &text)) {
        ferry::protocol::ContentRange range;
        if (!is_ok(ferry::protocol::parse_content_range(text, &range)) || !range.has_range) {
            *out = error_response(make_status(StatusDomain::Net, StatusCode::Invalid), version, "malformed Content-Range");
            return false;
        }
        offset = range.first;
        declared = range;
    } else {
        *out = error_response(make_status(StatusDomain::Net, StatusCode::Invalid), version,
            "Upload-Offset or Content-Range header required");
        return false;
    }

    ferry::protocol::OffsetInfo info;
    s = deps_.engine->query_offset(id, &info);
    if (!is_ok(s)) {
        *out = error_response(s, version, std::string{});
        set_tus_headers(out);
        return false;
    }
    u64 upload_length = 0;
    if (header_value(head, "Upload-Length", &text)) {
        if (!ferry::protocol::parse_u64(text, &upload_length)) {
            *out = error_response(make_status(StatusDomain::Net, StatusCode::Invalid), version, "malformed Upload-Length");
            return false;
        }
        if (upload_length != info.expected_size) {
            *out = length_mismatch_response(version, info.expected_size, upload_length);
            return false;
        }
    }
    if (declared.has_total && declared.total != info.expected_size) {
        *out = length_mismatch_response(version, info.expected_size, declared.total);
        return false;
    }
    if (offset != info.offset) {
        *out = mismatch_response(version, info.offset, offset);
        return false;
    }

    std::string length_text;
    u64 length = 0;
    const bool has_length = header_value(head, http::field::content_length, &length_text) &&
        ferry::protocol::parse_u64(length_text, &length);
    if (declared.has_range && has_length && declared.last - declared.first + 1 != length) {
        *out = error_response(make_status(StatusDomain::Net, StatusCode::Invalid), version,
            "Content-Range does not match the body length");
        set_tus_headers(out);
        return false;
    }
    if (has_length && length > info.expected_size - info.offset) {
        *out = error_response(make_status(StatusDomain::Net, StatusCode::TooLarge), version,
            "body runs past Upload-Length");
        set_tus_headers(out);
        return false;
    }

    ctx->upload_id = std::move(id);
    ctx->offset = offset;
    ctx->expected_size = info.expected_size;
    ctx->bytes_this_request = 0;
    ctx->version = version;
    ctx->completed = false;
    return true;
}

bool RequestRouter::append_piece(AppendContext& ctx, ferry::storage::BufferView piece, Response* out) {
    ferry::protocol::AppendResult result;
    const Status s = deps_.engine->append(ctx.upload_id, ctx.offset, piece, &result);
    if (!is_ok(s)) {
        if (s.code == StatusCode::Conflict) {
            *out = mismatch_response(ctx.version, result.offset, ctx.offset);
        } else {
            *out = error_response(s, ctx.version, std::string{});
            set_tus_headers(out);
            set_offset_header(out, result.offset);
        }
        return false;
    }
    ctx.offset = result.offset;
    ctx.bytes_this_request += piece.len;
    ctx.completed = result.completed;
    return true;
}

Response RequestRouter::finish_append(const AppendContext& ctx) {
    if (ctx.bytes_this_request == 0) {
        // Empty PATCH: a no-op, or a retry of a commit that failed earlier.
        AppendContext retry = ctx;
        Response err;
        if (!append_piece(retry, ferry::storage::BufferView{}, &err)) {
            return err;
        }
        Response res = make_response(http::status::no_content, ctx.version);
        set_tus_headers(&res);
        set_offset_header(&res, retry.offset);
        res.prepare_payload();
        return res;
    }
    Response res = make_response(http::status::no_content, ctx.version);
    set_tus_headers(&res);
    set_offset_header(&res, ctx.offset);
    res.prepare_payload();
    return res;
}

void RequestRouter::abort_append(const AppendContext& ctx, const char* reason) const noexcept {
    log_info("upload %s: connection lost after %llu bytes (%s), resumable at offset %llu",
        ctx.upload_id.c_str(), static_cast<unsigned long long>(ctx.bytes_this_request),
        reason ? reason : "unknown", static_cast<unsigned long long>(ctx.offset));
}

} // namespace ferry::net
