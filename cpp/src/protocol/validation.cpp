#include "ferry/protocol/validation.hpp"

#include <cstdio>
#include <cstring>
#include <limits>

#include "ferry/storage/fs_backend.hpp"

namespace ferry::protocol {

using namespace ferry::core;

namespace {
    struct MimeEntry {
        const char* ext;
        const char* mime;
    };

    constexpr MimeEntry kMimeTable[] = {
        {"mp4", "video/mp4"},
        {"m4v", "video/x-m4v"},
        {"mkv", "video/x-matroska"},
        {"webm", "video/webm"},
        {"mov", "video/quicktime"},
        {"avi", "video/x-msvideo"},
        {"3gp", "video/3gpp"},
    };

    [[nodiscard]] bool mime_is_acceptable(const std::string& mime) noexcept {
        if (mime.empty() || mime == "application/octet-stream") {
            return true;
        }
        return mime.compare(0, 6, "video/") == 0 && mime.size() > 6;
    }
} // namespace

std::string file_extension_lower(const std::string& filename) {
    const size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) {
        return std::string{};
    }
    std::string ext = filename.substr(dot + 1);
    for (char& c : ext) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return ext;
}

Status validate_upload_request(const UploadPolicy& policy,
    const std::string& filename,
    const std::string& mime_type,
    u64 expected_size) noexcept {
    if (!ferry::storage::display_name_is_safe(filename)) {
        return make_status(StatusDomain::Protocol, StatusCode::Invalid, 1);
    }

    const std::string ext = file_extension_lower(filename);
    bool ext_ok = false;
    for (const std::string& allowed : policy.allowed_extensions) {
        if (ext == allowed) {
            ext_ok = true;
            break;
        }
    }
    if (!ext_ok) {
        return make_status(StatusDomain::Protocol, StatusCode::Unsupported, 2);
    }
    if (!mime_is_acceptable(mime_type)) {
        return make_status(StatusDomain::Protocol, StatusCode::Unsupported, 3);
    }

    // Sizes are persisted as signed 64-bit integers.
    if (expected_size > static_cast<u64>(std::numeric_limits<i64>::max())) {
        return make_status(StatusDomain::Protocol, StatusCode::TooLarge, 4);
    }
    if (policy.max_upload_bytes > 0 && expected_size > policy.max_upload_bytes) {
        return make_status(StatusDomain::Protocol, StatusCode::TooLarge, 5);
    }
    return ok_status();
}

Status check_free_space(const UploadPolicy& policy, u64 available, u64 expected_size) noexcept {
    const u64 headroom = policy.min_free_bytes;
    if (expected_size > std::numeric_limits<u64>::max() - headroom) {
        return make_status(StatusDomain::Protocol, StatusCode::NoSpace);
    }
    if (available < expected_size + headroom) {
        return make_status(StatusDomain::Protocol, StatusCode::NoSpace);
    }
    return ok_status();
}

bool media_header_matches(const std::string& filename, ferry::storage::BufferView head) noexcept {
    const std::string ext = file_extension_lower(filename);
    if (ext == "mp4" || ext == "m4v" || ext == "mov" || ext == "3gp") {
        if (head.len < 8) {
            return true;
        }
        return std::memcmp(head.data + 4, "ftyp", 4) == 0;
    }
    if (ext == "mkv" || ext == "webm") {
        static const u8 kEbml[4] = {0x1A, 0x45, 0xDF, 0xA3};
        if (head.len < 4) {
            return true;
        }
        return std::memcmp(head.data, kEbml, 4) == 0;
    }
    return true;
}

const char* guess_mime_type(const std::string& filename) noexcept {
    const std::string ext = file_extension_lower(filename);
    for (const MimeEntry& e : kMimeTable) {
        if (ext == e.ext) {
            return e.mime;
        }
    }
    return "application/octet-stream";
}

std::string format_bytes(u64 bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    char buf[32];
    if (bytes < 1024) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
        return buf;
    }
    double v = static_cast<double>(bytes);
    size_t unit = 0;
    while (v >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        v /= 1024.0;
        ++unit;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %s", v, kUnits[unit]);
    return buf;
}

} // namespace ferry::protocol
