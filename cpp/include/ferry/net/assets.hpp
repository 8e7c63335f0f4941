#pragma once

#include <string>

namespace ferry::net {
    struct Asset {
        std::string body;
        std::string content_type;
    };

    // "Serve this asset" capability for the web front end.
    class AssetProvider {
    public:
        virtual ~AssetProvider() = default;
        // path is the request path without query, e.g. "/" or "/assets/app.js".
        [[nodiscard]] virtual bool load(const std::string& path, Asset* out) const = 0;
    };

    // Serves files below a directory; "/" maps to index.html.
    class DirectoryAssetProvider final : public AssetProvider {
    public:
        explicit DirectoryAssetProvider(std::string root);
        [[nodiscard]] bool load(const std::string& path, Asset* out) const override;

    private:
        std::string root_;
    };

    [[nodiscard]] const char* asset_content_type(const std::string& path) noexcept;
} // namespace ferry::net
