#pragma once

#include <string>
#include <vector>

#include "ferry/core/errors.hpp"
#include "ferry/core/models.hpp"
#include "ferry/core/types.hpp"
#include "ferry/storage/buffer.hpp"

namespace ferry::storage {
    using ferry::core::Status;
    using u64 = ferry::core::u64;

    struct PendingCreateParams {
        std::string display_name;
        std::string mime_type;
        u64 expected_size{0};
    };

    struct CommitResult {
        std::string path;
        u64 size_bytes{0};
        ferry::core::Hash256 digest{};
    };

    // Device storage with a pending/visible split. Pending entries are
    // invisible to other consumers until finalize() commits them; cancel()
    // discards one. Implementations must be safe for concurrent calls on
    // different handles.
    class StorageBackend {
    public:
        virtual ~StorageBackend() = default;

        [[nodiscard]] virtual Status create_pending(const PendingCreateParams& params, std::string* out_handle) noexcept = 0;
        // Appends at the current end. Either all of data is durable on
        // return, or none of it is and the entry keeps its previous size.
        [[nodiscard]] virtual Status append(const std::string& handle, BufferView data, u64* out_written) noexcept = 0;
        // NotFound when the entry no longer exists.
        [[nodiscard]] virtual Status durable_size(const std::string& handle, u64* out) noexcept = 0;
        // Records the commit before the pending entry disappears, so a crash
        // after this point is recoverable through committed().
        [[nodiscard]] virtual Status finalize(const std::string& handle, CommitResult* out) noexcept = 0;
        // The commit finalize() recorded for handle. NotFound when the handle
        // was never committed or its committed file is gone.
        [[nodiscard]] virtual Status committed(const std::string& handle, CommitResult* out) noexcept = 0;
        // Drops the commit record once the caller has persisted the outcome.
        [[nodiscard]] virtual Status release_commit(const std::string& handle) noexcept = 0;
        // NotFound when the entry no longer exists.
        [[nodiscard]] virtual Status cancel(const std::string& handle) noexcept = 0;
        [[nodiscard]] virtual Status list_pending(std::vector<ferry::core::PendingEntry>* out) noexcept = 0;
        [[nodiscard]] virtual Status available_bytes(u64* out) noexcept = 0;
    };
} // namespace ferry::storage
