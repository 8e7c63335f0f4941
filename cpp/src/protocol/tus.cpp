#include "ferry/protocol/tus.hpp"

#include <charconv>
#include <vector>

#include <openssl/evp.h>

namespace ferry::protocol {

using namespace ferry::core;

namespace {
    [[nodiscard]] std::string_view trim(std::string_view s) noexcept {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
            s.remove_prefix(1);
        }
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
            s.remove_suffix(1);
        }
        return s;
    }

    [[nodiscard]] Status invalid() noexcept {
        return make_status(StatusDomain::Protocol, StatusCode::Invalid);
    }
} // namespace

bool parse_u64(std::string_view text, u64* out) noexcept {
    if (out == nullptr || text.empty()) {
        return false;
    }
    u64 v{};
    auto r = std::from_chars(text.data(), text.data() + text.size(), v, 10);
    if (r.ec != std::errc() || r.ptr != text.data() + text.size()) {
        return false;
    }
    *out = v;
    return true;
}

Status base64_decode(std::string_view in, std::string* out) {
    if (out == nullptr) {
        return invalid();
    }
    out->clear();
    if (in.empty()) {
        return ok_status();
    }

    // EVP_DecodeBlock wants whole quanta; some clients drop the padding.
    std::string padded(in);
    while (padded.size() % 4 != 0) {
        padded.push_back('=');
    }
    size_t pad = 0;
    if (padded.size() >= 1 && padded[padded.size() - 1] == '=') ++pad;
    if (padded.size() >= 2 && padded[padded.size() - 2] == '=') ++pad;

    std::vector<unsigned char> buf(padded.size() / 4 * 3 + 1);
    const int n = EVP_DecodeBlock(buf.data(),
        reinterpret_cast<const unsigned char*>(padded.data()), static_cast<int>(padded.size()));
    if (n < 0 || static_cast<size_t>(n) < pad) {
        return invalid();
    }
    out->assign(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n) - pad);
    return ok_status();
}

Status parse_upload_metadata(std::string_view header, UploadMetadata* out) {
    if (out == nullptr) {
        return invalid();
    }
    *out = UploadMetadata{};

    while (!header.empty()) {
        const size_t comma = header.find(',');
        std::string_view pair = trim(header.substr(0, comma));
        header = (comma == std::string_view::npos) ? std::string_view{} : header.substr(comma + 1);
        if (pair.empty()) {
            continue;
        }

        const size_t space = pair.find(' ');
        const std::string_view key = pair.substr(0, space);
        const std::string_view encoded = (space == std::string_view::npos) ? std::string_view{} : trim(pair.substr(space + 1));

        std::string value;
        const Status s = base64_decode(encoded, &value);
        if (!is_ok(s)) {
            return s;
        }
        if (key == "filename" || key == "name") {
            out->filename = std::move(value);
        } else if (key == "filetype" || key == "type") {
            out->filetype = std::move(value);
        }
    }
    return ok_status();
}

Status parse_content_range(std::string_view header, ContentRange* out) noexcept {
    if (out == nullptr) {
        return invalid();
    }
    *out = ContentRange{};
    header = trim(header);
    constexpr std::string_view kUnit = "bytes ";
    if (header.substr(0, kUnit.size()) != kUnit) {
        return invalid();
    }
    header.remove_prefix(kUnit.size());

    const size_t slash = header.find('/');
    if (slash == std::string_view::npos) {
        return invalid();
    }
    const std::string_view range = trim(header.substr(0, slash));
    const std::string_view total = trim(header.substr(slash + 1));

    if (range != "*") {
        const size_t dash = range.find('-');
        if (dash == std::string_view::npos) {
            return invalid();
        }
        if (!parse_u64(range.substr(0, dash), &out->first) || !parse_u64(range.substr(dash + 1), &out->last)) {
            return invalid();
        }
        if (out->last < out->first) {
            return invalid();
        }
        out->has_range = true;
    }
    if (total != "*") {
        if (!parse_u64(total, &out->total)) {
            return invalid();
        }
        out->has_total = true;
        if (out->has_range && out->last >= out->total) {
            return invalid();
        }
    }
    if (!out->has_range && !out->has_total) {
        return invalid();
    }
    return ok_status();
}

} // namespace ferry::protocol
