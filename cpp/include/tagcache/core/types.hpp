#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace tagcache::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Milliseconds on a monotonic clock.
    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const Hash256&, const Hash256&) noexcept = default;
        friend constexpr auto operator<=>(const Hash256&, const Hash256&) noexcept = default;
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

    // Identifies one data model (a context type, a database file). The
    // resource catalog is keyed by it.
    struct SchemaOwnerTag {};
    using SchemaOwnerId = Id<SchemaOwnerTag, u32>;

    // Table names known for a schema owner. Ordered so logs are stable.
    using ResourceSet = std::set<std::string, std::less<>>;

    // Invalidation keys: resource names or kUnknownDependency.
    using TagSet = std::set<std::string, std::less<>>;

    // Attached to reads whose tables could not be determined and purged by
    // every write.
    inline constexpr std::string_view kUnknownDependency = "UnknownDependency";

    // "a, b, c"
    [[nodiscard]] std::string join_names(const std::set<std::string, std::less<>>& names);

} // namespace tagcache::core
