#pragma once

#include <type_traits>

#include "ferry/core/types.hpp"

namespace ferry::storage {
    using u8 = ferry::core::u8;
    using u32 = ferry::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace ferry::storage
