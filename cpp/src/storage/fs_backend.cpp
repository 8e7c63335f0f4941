#include "ferry/storage/fs_backend.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include "ferry/core/log.hpp"
#include "ferry/storage/hashing.hpp"

namespace ferry::storage {

using namespace ferry::core;

// ========================================================================
// Helpers
// ========================================================================

namespace {
    constexpr u32 kMaxNameCollisions = 10000;

    [[nodiscard]] Status io_error(int err) noexcept {
        if (err == ENOSPC || err == EDQUOT) {
            return make_status(StatusDomain::Storage, StatusCode::NoSpace, static_cast<u32>(err));
        }
        if (err == ENOENT) {
            return make_status(StatusDomain::Storage, StatusCode::NotFound, static_cast<u32>(err));
        }
        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(err));
    }

    // mkdir -p
    [[nodiscard]] Status create_directories(const std::string& dir) {
        if (dir.empty()) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        std::string partial;
        partial.reserve(dir.size());
        for (size_t i = 0; i <= dir.size(); ++i) {
            if (i == dir.size() || dir[i] == '/') {
                if (!partial.empty() && partial != "." && partial != "/") {
                    if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
                        return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(errno));
                    }
                }
            }
            if (i < dir.size()) {
                partial.push_back(dir[i]);
            }
        }
        return ok_status();
    }

    [[nodiscard]] Status sync_directory(const std::string& dir) noexcept {
        const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (fd < 0) {
            return io_error(errno);
        }
        const int rc = ::fsync(fd);
        const int err = errno;
        ::close(fd);
        if (rc != 0 && err != EINVAL) {
            return io_error(err);
        }
        return ok_status();
    }

    [[nodiscard]] bool handle_is_safe(const std::string& handle) noexcept {
        if (handle.empty() || handle.size() > 64) {
            return false;
        }
        for (char c : handle) {
            const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
            if (!ok) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] std::string collision_name(const std::string& name, u32 n) {
        if (n == 0) {
            return name;
        }
        const size_t dot = name.rfind('.');
        char suffix[32];
        std::snprintf(suffix, sizeof(suffix), " (%u)", n);
        if (dot == std::string::npos || dot == 0) {
            return name + suffix;
        }
        return name.substr(0, dot) + suffix + name.substr(dot);
    }

    // Places src at dst without replacing an existing dst. link() gives us
    // that atomically; filesystems without hard links fall back to a checked rename.
    [[nodiscard]] Status place_no_replace(const std::string& src, const std::string& dst, bool* exists) noexcept {
        *exists = false;
        if (::link(src.c_str(), dst.c_str()) == 0) {
            if (::unlink(src.c_str()) != 0) {
                log_warn("storage: committed %s but could not unlink pending copy: %s",
                    dst.c_str(), std::strerror(errno));
            }
            return ok_status();
        }
        const int err = errno;
        if (err == EEXIST) {
            *exists = true;
            return ok_status();
        }
        if (err != EPERM && err != EXDEV && err != ENOTSUP && err != EOPNOTSUPP && err != EMLINK) {
            return io_error(err);
        }
        struct stat st{};
        if (::stat(dst.c_str(), &st) == 0) {
            *exists = true;
            return ok_status();
        }
        if (::rename(src.c_str(), dst.c_str()) != 0) {
            return io_error(errno);
        }
        return ok_status();
    }

    [[nodiscard]] bool same_file(const std::string& a, const std::string& b) noexcept {
        struct stat sa{};
        struct stat sb{};
        if (::stat(a.c_str(), &sa) != 0 || ::stat(b.c_str(), &sb) != 0) {
            return false;
        }
        return sa.st_dev == sb.st_dev && sa.st_ino == sb.st_ino;
    }
} // namespace

bool display_name_is_safe(const std::string& name) noexcept {
    if (name.empty() || name.size() > 255 || name == "." || name == "..") {
        return false;
    }
    for (unsigned char c : name) {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) {
            return false;
        }
    }
    return true;
}

// ========================================================================
// FsStorageBackend
// ========================================================================

FsStorageBackend::FsStorageBackend(FsBackendConfig cfg)
    : cfg_(std::move(cfg)),
      pending_root_(cfg_.root + "/" + cfg_.pending_dir),
      media_root_(cfg_.root + "/" + cfg_.media_dir),
      commits_root_(pending_root_ + "/.committed") {
}

Status FsStorageBackend::init() noexcept {
    if (cfg_.root.empty()) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    Status s = create_directories(pending_root_);
    if (!is_ok(s)) {
        log_error("storage: cannot create %s: %s", pending_root_.c_str(), std::strerror(static_cast<int>(s.aux)));
        return s;
    }
    s = create_directories(media_root_);
    if (!is_ok(s)) {
        log_error("storage: cannot create %s: %s", media_root_.c_str(), std::strerror(static_cast<int>(s.aux)));
        return s;
    }
    s = create_directories(commits_root_);
    if (!is_ok(s)) {
        log_error("storage: cannot create %s: %s", commits_root_.c_str(), std::strerror(static_cast<int>(s.aux)));
        return s;
    }
    return ok_status();
}

Status FsStorageBackend::handle_dir(const std::string& handle, std::string* out) const {
    if (!handle_is_safe(handle)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *out = pending_root_ + "/" + handle;
    return ok_status();
}

Status FsStorageBackend::pending_file(const std::string& handle, std::string* dir, std::string* name) const {
    Status s = handle_dir(handle, dir);
    if (!is_ok(s)) {
        return s;
    }
    DIR* d = ::opendir(dir->c_str());
    if (d == nullptr) {
        return io_error(errno);
    }
    bool found = false;
    while (dirent* e = ::readdir(d)) {
        if (std::strcmp(e->d_name, ".") == 0 || std::strcmp(e->d_name, "..") == 0) {
            continue;
        }
        *name = e->d_name;
        found = true;
        break;
    }
    ::closedir(d);
    if (!found) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }
    return ok_status();
}

Status FsStorageBackend::create_pending(const PendingCreateParams& params, std::string* out_handle) noexcept {
    if (out_handle == nullptr || !display_name_is_safe(params.display_name)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }

    // Time prefix keeps handles unique across the lifetime of retained rows.
    char prefix[32];
    std::snprintf(prefix, sizeof(prefix), "%llx-", static_cast<unsigned long long>(now_ms()));
    std::string tmpl = pending_root_ + "/" + prefix + "XXXXXX";
    if (::mkdtemp(tmpl.data()) == nullptr) {
        const int err = errno;
        log_error("storage: mkdtemp under %s failed: %s", pending_root_.c_str(), std::strerror(err));
        return io_error(err);
    }

    const std::string path = tmpl + "/" + params.display_name;
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        ::rmdir(tmpl.c_str());
        return io_error(err);
    }
    ::close(fd);

    *out_handle = tmpl.substr(pending_root_.size() + 1);
    return ok_status();
}

Status FsStorageBackend::append(const std::string& handle, BufferView data, u64* out_written) noexcept {
    if (out_written == nullptr || !buffer_ok(data)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    *out_written = 0;

    std::string dir;
    std::string name;
    Status s = pending_file(handle, &dir, &name);
    if (!is_ok(s)) {
        return s;
    }
    if (data.len == 0) {
        return ok_status();
    }

    const std::string path = dir + "/" + name;
    const int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
    if (fd < 0) {
        return io_error(errno);
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        ::close(fd);
        return io_error(err);
    }
    const off_t start = st.st_size;

    u32 written = 0;
    int err = 0;
    while (written < data.len) {
        const ssize_t n = ::write(fd, data.data + written, data.len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = errno;
            break;
        }
        written += static_cast<u32>(n);
    }
    if (err == 0 && cfg_.sync_writes && ::fdatasync(fd) != 0) {
        err = errno;
    }
    if (err != 0) {
        // No partial credit: roll the entry back to its previous durable size.
        if (::ftruncate(fd, start) != 0) {
            log_error("storage: could not roll back %s to %lld bytes: %s",
                path.c_str(), static_cast<long long>(start), std::strerror(errno));
        }
        ::close(fd);
        return io_error(err);
    }
    ::close(fd);
    *out_written = data.len;
    return ok_status();
}

Status FsStorageBackend::durable_size(const std::string& handle, u64* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    std::string dir;
    std::string name;
    Status s = pending_file(handle, &dir, &name);
    if (!is_ok(s)) {
        return s;
    }
    struct stat st{};
    if (::stat((dir + "/" + name).c_str(), &st) != 0) {
        return io_error(errno);
    }
    *out = static_cast<u64>(st.st_size);
    return ok_status();
}

Status FsStorageBackend::finalize(const std::string& handle, CommitResult* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    std::string dir;
    std::string name;
    Status s = pending_file(handle, &dir, &name);
    if (!is_ok(s)) {
        return s;
    }
    const std::string src = dir + "/" + name;

    const int fd = ::open(src.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return io_error(errno);
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0 || ::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return io_error(err);
    }
    ::close(fd);

    CommitResult result;
    result.size_bytes = static_cast<u64>(st.st_size);
    if (cfg_.digest_on_commit) {
        s = hash_file(src.c_str(), &result.digest, nullptr);
        if (!is_ok(s)) {
            return s;
        }
    }

    // A record left by an interrupted commit may already name a link to src.
    std::string recorded;
    bool placed = is_ok(read_commit_record(handle, &recorded)) && same_file(src, recorded);
    if (placed) {
        if (::unlink(src.c_str()) != 0) {
            return io_error(errno);
        }
        result.path = recorded;
    }
    for (u32 n = 0; n < kMaxNameCollisions && !placed; ++n) {
        const std::string dst = media_root_ + "/" + collision_name(name, n);
        struct stat taken{};
        if (::lstat(dst.c_str(), &taken) == 0) {
            continue;
        }
        // Recorded before the file moves: once src is gone the record is
        // the only trace of where it went.
        s = write_commit_record(handle, dst);
        if (!is_ok(s)) {
            log_error("storage: cannot record commit of %s: %s", src.c_str(), std::strerror(static_cast<int>(s.aux)));
            return s;
        }
        bool exists = false;
        s = place_no_replace(src, dst, &exists);
        if (!is_ok(s)) {
            log_error("storage: commit of %s to %s failed: %s", src.c_str(), dst.c_str(),
                std::strerror(static_cast<int>(s.aux)));
            ::unlink((commits_root_ + "/" + handle).c_str());
            return s;
        }
        if (!exists) {
            result.path = dst;
            placed = true;
        }
    }
    if (!placed) {
        ::unlink((commits_root_ + "/" + handle).c_str());
        return make_status(StatusDomain::Storage, StatusCode::Conflict);
    }

    s = sync_directory(media_root_);
    if (!is_ok(s)) {
        log_warn("storage: fsync of %s failed", media_root_.c_str());
    }
    if (::rmdir(dir.c_str()) != 0) {
        log_warn("storage: could not remove pending dir %s: %s", dir.c_str(), std::strerror(errno));
    }

    *out = std::move(result);
    return ok_status();
}

Status FsStorageBackend::write_commit_record(const std::string& handle, const std::string& path) noexcept {
    const std::string record = commits_root_ + "/" + handle;
    const std::string tmp = record + ".tmp";
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return io_error(errno);
    }
    const std::string line = path + "\n";
    size_t written = 0;
    int err = 0;
    while (written < line.size()) {
        const ssize_t n = ::write(fd, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            err = errno;
            break;
        }
        written += static_cast<size_t>(n);
    }
    if (err == 0 && ::fsync(fd) != 0) {
        err = errno;
    }
    ::close(fd);
    if (err == 0 && ::rename(tmp.c_str(), record.c_str()) != 0) {
        err = errno;
    }
    if (err != 0) {
        ::unlink(tmp.c_str());
        return io_error(err);
    }
    return sync_directory(commits_root_);
}

Status FsStorageBackend::read_commit_record(const std::string& handle, std::string* path) const {
    if (!handle_is_safe(handle)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    const std::string record = commits_root_ + "/" + handle;
    std::FILE* f = std::fopen(record.c_str(), "rb");
    if (f == nullptr) {
        return io_error(errno);
    }
    char buf[4096];
    const size_t n = std::fread(buf, 1, sizeof(buf), f);
    std::fclose(f);
    std::string line(buf, n);
    const size_t nl = line.find('\n');
    if (nl == std::string::npos || nl == 0) {
        return make_status(StatusDomain::Storage, StatusCode::Corrupt);
    }
    line.resize(nl);
    *path = std::move(line);
    return ok_status();
}

Status FsStorageBackend::committed(const std::string& handle, CommitResult* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    std::string path;
    Status s = read_commit_record(handle, &path);
    if (!is_ok(s)) {
        return s;
    }
    // The record is written before the move; only a pending entry that is
    // gone proves the move happened.
    std::string dir;
    std::string name;
    if (is_ok(pending_file(handle, &dir, &name))) {
        return make_status(StatusDomain::Storage, StatusCode::NotFound);
    }

    CommitResult result;
    result.path = path;
    if (cfg_.digest_on_commit) {
        s = hash_file(path.c_str(), &result.digest, &result.size_bytes);
        if (!is_ok(s)) {
            return s;
        }
    } else {
        struct stat st{};
        if (::stat(path.c_str(), &st) != 0) {
            return io_error(errno);
        }
        result.size_bytes = static_cast<u64>(st.st_size);
    }
    *out = std::move(result);
    return ok_status();
}

Status FsStorageBackend::release_commit(const std::string& handle) noexcept {
    if (!handle_is_safe(handle)) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    if (::unlink((commits_root_ + "/" + handle).c_str()) != 0) {
        return io_error(errno);
    }
    return ok_status();
}

Status FsStorageBackend::cancel(const std::string& handle) noexcept {
    std::string dir;
    Status s = handle_dir(handle, &dir);
    if (!is_ok(s)) {
        return s;
    }
    DIR* d = ::opendir(dir.c_str());
    if (d == nullptr) {
        return io_error(errno);
    }
    int err = 0;
    while (dirent* e = ::readdir(d)) {
        if (std::strcmp(e->d_name, ".") == 0 || std::strcmp(e->d_name, "..") == 0) {
            continue;
        }
        const std::string path = dir + "/" + e->d_name;
        if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
            err = errno;
        }
    }
    ::closedir(d);
    if (err != 0) {
        return io_error(err);
    }
    if (::rmdir(dir.c_str()) != 0 && errno != ENOENT) {
        return io_error(errno);
    }
    return ok_status();
}

Status FsStorageBackend::list_pending(std::vector<PendingEntry>* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    out->clear();
    DIR* d = ::opendir(pending_root_.c_str());
    if (d == nullptr) {
        if (errno == ENOENT) {
            return ok_status();
        }
        return io_error(errno);
    }
    while (dirent* e = ::readdir(d)) {
        if (e->d_name[0] == '.') {
            continue;
        }
        const std::string handle = e->d_name;
        if (!handle_is_safe(handle)) {
            continue;
        }
        const std::string dir = pending_root_ + "/" + handle;
        struct stat st{};
        if (::stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
            continue;
        }

        PendingEntry entry;
        entry.handle = handle;
        entry.modified_at = static_cast<Timestamp>(st.st_mtime) * kMillisPerSecond;

        std::string file_dir;
        std::string name;
        if (is_ok(pending_file(handle, &file_dir, &name))) {
            struct stat fst{};
            if (::stat((file_dir + "/" + name).c_str(), &fst) == 0) {
                entry.display_name = name;
                entry.size_bytes = static_cast<u64>(fst.st_size);
                entry.modified_at = static_cast<Timestamp>(fst.st_mtime) * kMillisPerSecond;
            }
        }
        out->push_back(std::move(entry));
    }
    ::closedir(d);
    return ok_status();
}

Status FsStorageBackend::available_bytes(u64* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Storage, StatusCode::Invalid);
    }
    struct statvfs vfs{};
    if (::statvfs(cfg_.root.c_str(), &vfs) != 0) {
        return io_error(errno);
    }
    *out = static_cast<u64>(vfs.f_bavail) * static_cast<u64>(vfs.f_frsize);
    return ok_status();
}

} // namespace ferry::storage
