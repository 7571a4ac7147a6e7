#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <unordered_set>
#include <unordered_map>
#include <string>
#include <type_traits>

import Core;

// Tag types for StrongHandle
struct PointTag {};
struct EdgeTag {};

using PointHandle = Core::StrongHandle<PointTag>;
using EdgeHandle = Core::StrongHandle<EdgeTag>;

// -----------------------------------------------------------------------------
// Basic Functionality
// -----------------------------------------------------------------------------

TEST(StrongHandle, DefaultConstructor_Invalid)
{
    PointHandle h;
    EXPECT_FALSE(h.IsValid());
    EXPECT_FALSE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, PointHandle::INVALID_INDEX);
    EXPECT_EQ(h.Generation, 0u);
}

TEST(StrongHandle, ParameterizedConstructor_Valid)
{
    PointHandle h(42, 3);
    EXPECT_TRUE(h.IsValid());
    EXPECT_EQ(h.Index, 42u);
    EXPECT_EQ(h.Generation, 3u);
}

TEST(StrongHandle, ZeroIndexIsValid)
{
    PointHandle h(0, 1);
    EXPECT_TRUE(h.IsValid());
}

// -----------------------------------------------------------------------------
// Identity
// -----------------------------------------------------------------------------

TEST(StrongHandle, SameIndexDifferentStore_NotEqual)
{
    // Generation identifies the issuing store.
    PointHandle a(7, 1);
    PointHandle b(7, 2);
    EXPECT_NE(a, b);
}

TEST(StrongHandle, CopiesCompareEqual)
{
    PointHandle original(42, 7);
    PointHandle copy = original;
    EXPECT_EQ(copy, original);
}

TEST(StrongHandle, Ordering_IndexFirst)
{
    PointHandle h1(5, 1);
    PointHandle h2(10, 1);
    PointHandle h3(5, 2);

    EXPECT_LT(h1, h2);
    EXPECT_LT(h1, h3);
}

TEST(StrongHandle, DifferentTagsAreDistinctTypes)
{
    static_assert(!std::is_same_v<PointHandle, EdgeHandle>);
    static_assert(!std::is_convertible_v<PointHandle, EdgeHandle>);
    SUCCEED();
}

// -----------------------------------------------------------------------------
// Hash Support
// -----------------------------------------------------------------------------

TEST(StrongHandle, Hashable_UnorderedSet)
{
    std::unordered_set<PointHandle> handleSet;

    handleSet.insert(PointHandle(1, 1));
    handleSet.insert(PointHandle(2, 1));
    handleSet.insert(PointHandle(1, 2));
    handleSet.insert(PointHandle(1, 1));

    EXPECT_EQ(handleSet.size(), 3u);
    EXPECT_EQ(handleSet.count(PointHandle(1, 2)), 1u);
}

TEST(StrongHandle, Hashable_UnorderedMap)
{
    std::unordered_map<EdgeHandle, std::string> names;
    names[EdgeHandle(0, 4)] = "left";
    names[EdgeHandle(1, 4)] = "right";
    names[EdgeHandle(0, 4)] = "bottom";

    EXPECT_EQ(names.size(), 2u);
    EXPECT_EQ(names[EdgeHandle(0, 4)], "bottom");
}

TEST(StrongHandle, Hash_GenerationAffectsHash)
{
    std::hash<PointHandle> hasher;
    EXPECT_NE(hasher(PointHandle(1, 1)), hasher(PointHandle(1, 2)));
    EXPECT_NE(hasher(PointHandle(1, 1)), hasher(PointHandle(2, 1)));
}

TEST(StrongHandle, MaxValidIndex)
{
    PointHandle h(PointHandle::INVALID_INDEX - 1, std::numeric_limits<uint32_t>::max());
    EXPECT_TRUE(h.IsValid());
}

TEST(StrongHandle, ConstexprDefaultConstruction)
{
    constexpr PointHandle h;
    static_assert(!h.IsValid());
    EXPECT_FALSE(h.IsValid());
}
