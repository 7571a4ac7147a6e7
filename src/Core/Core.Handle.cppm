module;
#include <cstdint>
#include <limits>
#include <functional>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe store handle template
    // -------------------------------------------------------------------------
    // Identifies one value living in one Core::Store<Tag>.
    //
    //   Index      - slot of the value inside the issuing store.
    //   Generation - identity of the issuing store. Every store instance draws
    //                a fresh generation, so two stores of the same kind never
    //                accept each other's handles even when indices coincide.
    //
    // The Tag type parameter ensures handles of different entity kinds
    // cannot be mixed up at compile time.
    //
    // Example Usage:
    //   Core::Store<Kernel::Vertex> vertices;
    //   Core::StrongHandle<Kernel::Vertex> v = vertices.Insert(...);
    //
    //   Core::Store<Kernel::Edge> edges;
    //   // v = edges.Insert(...); // Compile error - different types!
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

// Allow StrongHandle to be used in unordered containers
namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            uint64_t val = (static_cast<uint64_t>(h.Generation) << 32) | h.Index;

            // MurmurHash3 finalizer
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };
}
