#pragma once

#include <string>
#include <vector>

#include "ferry/core/errors.hpp"
#include "ferry/core/types.hpp"
#include "ferry/storage/buffer.hpp"

namespace ferry::protocol {
    using ferry::core::Status;
    using u64 = ferry::core::u64;

    struct UploadPolicy {
        std::vector<std::string> allowed_extensions{"mp4", "mkv"};
        u64 max_upload_bytes{0};  // 0: unlimited
        u64 min_free_bytes{0};    // headroom that must remain after the upload
        bool verify_magic{false};
    };

    // Checks a create request before anything is allocated.
    //   Invalid      unsafe or empty filename
    //   Unsupported  extension or MIME type not accepted
    //   TooLarge     expected_size above max_upload_bytes or not representable
    [[nodiscard]] Status validate_upload_request(const UploadPolicy& policy,
        const std::string& filename,
        const std::string& mime_type,
        u64 expected_size) noexcept;

    // NoSpace unless available covers expected_size plus the policy headroom.
    [[nodiscard]] Status check_free_space(const UploadPolicy& policy, u64 available, u64 expected_size) noexcept;

    // Container signature check on the first bytes of a file. Unknown
    // extensions and heads shorter than the signature pass.
    [[nodiscard]] bool media_header_matches(const std::string& filename, ferry::storage::BufferView head) noexcept;

    [[nodiscard]] std::string file_extension_lower(const std::string& filename);
    [[nodiscard]] const char* guess_mime_type(const std::string& filename) noexcept;
    [[nodiscard]] std::string format_bytes(u64 bytes);
} // namespace ferry::protocol
