#pragma once

#include <string>
#include <vector>

#include "ferry/storage/backend.hpp"

namespace ferry::storage {
    struct FsBackendConfig {
        std::string root;
        std::string pending_dir{".pending"};
        std::string media_dir{"media"};
        bool sync_writes{true};
        bool digest_on_commit{true};
    };

    // Filesystem layout:
    //   <root>/<pending_dir>/<handle>/<display name>   pending entry
    //   <root>/<media_dir>/<display name>              committed file
    //   <root>/<pending_dir>/.committed/<handle>       commit record
    // Handles are unique directory names created by mkdtemp. Commit links the
    // file into the media directory without ever replacing an existing file.
    class FsStorageBackend final : public StorageBackend {
    public:
        explicit FsStorageBackend(FsBackendConfig cfg);

        // Creates the pending and media directories.
        [[nodiscard]] Status init() noexcept;

        [[nodiscard]] Status create_pending(const PendingCreateParams& params, std::string* out_handle) noexcept override;
        [[nodiscard]] Status append(const std::string& handle, BufferView data, u64* out_written) noexcept override;
        [[nodiscard]] Status durable_size(const std::string& handle, u64* out) noexcept override;
        [[nodiscard]] Status finalize(const std::string& handle, CommitResult* out) noexcept override;
        [[nodiscard]] Status committed(const std::string& handle, CommitResult* out) noexcept override;
        [[nodiscard]] Status release_commit(const std::string& handle) noexcept override;
        [[nodiscard]] Status cancel(const std::string& handle) noexcept override;
        [[nodiscard]] Status list_pending(std::vector<ferry::core::PendingEntry>* out) noexcept override;
        [[nodiscard]] Status available_bytes(u64* out) noexcept override;

        [[nodiscard]] const std::string& pending_root() const noexcept { return pending_root_; }
        [[nodiscard]] const std::string& media_root() const noexcept { return media_root_; }

    private:
        [[nodiscard]] Status handle_dir(const std::string& handle, std::string* out) const;
        [[nodiscard]] Status pending_file(const std::string& handle, std::string* dir, std::string* name) const;
        [[nodiscard]] Status write_commit_record(const std::string& handle, const std::string& path) noexcept;
        [[nodiscard]] Status read_commit_record(const std::string& handle, std::string* path) const;

        FsBackendConfig cfg_;
        std::string pending_root_;
        std::string media_root_;
        std::string commits_root_;
    };

    // Rejects empty names, "." and "..", path separators and control characters.
    [[nodiscard]] bool display_name_is_safe(const std::string& name) noexcept;
} // namespace ferry::storage
