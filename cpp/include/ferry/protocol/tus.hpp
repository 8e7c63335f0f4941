#pragma once

#include <string>
#include <string_view>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"

namespace ferry::protocol {
    using ferry::core::Status;
    using u64 = ferry::core::u64;

    inline constexpr const char* kTusVersion = "1.0.0";
    inline constexpr const char* kTusExtensions = "creation,termination";
    inline constexpr const char* kOffsetContentType = "application/offset+octet-stream";

    struct UploadMetadata {
        std::string filename;
        std::string filetype;
    };

    // "key base64,key base64". Recognizes filename/name and filetype/type;
    // other keys are ignored. Invalid on malformed base64.
    [[nodiscard]] Status parse_upload_metadata(std::string_view header, UploadMetadata* out);
    [[nodiscard]] Status base64_decode(std::string_view in, std::string* out);

    // Plain non-negative decimal, no sign, no whitespace.
    [[nodiscard]] bool parse_u64(std::string_view text, u64* out) noexcept;

    struct ContentRange {
        u64 first{0};
        u64 last{0};
        u64 total{0};
        bool has_range{false};
        bool has_total{false};
    };

    // "bytes first-last/total", "bytes first-last/*" or "bytes */total".
    [[nodiscard]] Status parse_content_range(std::string_view header, ContentRange* out) noexcept;
} // namespace ferry::protocol
