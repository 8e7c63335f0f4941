#include "ferry/net/assets.hpp"

#include <cstdio>
#include <cstring>
#include <utility>

namespace ferry::net {
    namespace {
        constexpr long kMaxAssetBytes = 16L * 1024L * 1024L;

        [[nodiscard]] bool path_is_safe(const std::string& path) noexcept {
            if (path.empty() || path[0] != '/') {
                return false;
            }
            if (path.find("..") != std::string::npos || path.find('\\') != std::string::npos) {
                return false;
            }
            return path.find('\0') == std::string::npos;
        }

        [[nodiscard]] bool read_file(const std::string& path, std::string* out) {
            FILE* f = std::fopen(path.c_str(), "rb");
            if (!f) {
                return false;
            }
            std::fseek(f, 0, SEEK_END);
            const long size = std::ftell(f);
            std::fseek(f, 0, SEEK_SET);
            if (size < 0 || size > kMaxAssetBytes) {
                std::fclose(f);
                return false;
            }
            out->resize(static_cast<size_t>(size));
            const size_t n = size > 0 ? std::fread(out->data(), 1, static_cast<size_t>(size), f) : 0;
            std::fclose(f);
            return n == static_cast<size_t>(size);
        }
    } // namespace

    const char* asset_content_type(const std::string& path) noexcept {
        const char* ext = std::strrchr(path.c_str(), '.');
        if (!ext) return "application/octet-stream";

        if (std::strcmp(ext, ".html") == 0 || std::strcmp(ext, ".htm") == 0) return "text/html; charset=utf-8";
        if (std::strcmp(ext, ".css") == 0) return "text/css; charset=utf-8";
        if (std::strcmp(ext, ".js") == 0) return "application/javascript";
        if (std::strcmp(ext, ".json") == 0) return "application/json";
        if (std::strcmp(ext, ".svg") == 0) return "image/svg+xml";
        if (std::strcmp(ext, ".png") == 0) return "image/png";
        if (std::strcmp(ext, ".ico") == 0) return "image/x-icon";
        if (std::strcmp(ext, ".woff2") == 0) return "font/woff2";

        return "application/octet-stream";
    }

    DirectoryAssetProvider::DirectoryAssetProvider(std::string root) : root_(std::move(root)) {
    }

    bool DirectoryAssetProvider::load(const std::string& path, Asset* out) const {
        if (out == nullptr || root_.empty() || !path_is_safe(path)) {
            return false;
        }
        const std::string rel = (path == "/") ? std::string("/index.html") : path;
        if (!read_file(root_ + rel, &out->body)) {
            return false;
        }
        out->content_type = asset_content_type(rel);
        return true;
    }
} // namespace ferry::net
