#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace ferry::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Milliseconds since the Unix epoch.
    using Timestamp = i64;

    inline constexpr i64 kMillisPerSecond = 1000;
    inline constexpr i64 kMillisPerMinute = 60 * kMillisPerSecond;
    inline constexpr i64 kMillisPerHour = 60 * kMillisPerMinute;

    [[nodiscard]] inline Timestamp now_ms() noexcept {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    struct SubscriptionIdTag {};
    using SubscriptionId = Id<SubscriptionIdTag, u64>;

} // namespace ferry::core
