#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <iterator>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

import Core;

namespace
{
    using Store = Core::Store<std::string>;
    using Handle = Store::HandleType;

    std::vector<std::string> Values(const Store& store)
    {
        std::vector<std::string> values;
        for (const auto& entry : store.Iter())
        {
            values.push_back(entry.Value);
        }
        return values;
    }
}

TEST(Store, InsertGet)
{
    Store store;
    const Handle h = store.Insert("alpha");
    ASSERT_TRUE(h.IsValid());

    auto value = store.Get(h);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(**value, "alpha");
    EXPECT_TRUE(store.Contains(h));
    EXPECT_EQ(store.Size(), 1u);
}

TEST(Store, EqualValuesGetDistinctHandles)
{
    Store store;
    const Handle a = store.Insert("same");
    const Handle b = store.Insert("same");

    EXPECT_NE(a, b);
    EXPECT_TRUE(store.Contains(a));
    EXPECT_TRUE(store.Contains(b));
    EXPECT_EQ(store.Size(), 2u);
}

TEST(Store, HandlesAreNeverReused)
{
    Store store;
    std::vector<Handle> handles;
    for (int i = 0; i < 16; ++i)
    {
        handles.push_back(store.Insert(std::to_string(i)));
    }
    for (size_t i = 0; i < handles.size(); ++i)
    {
        for (size_t j = i + 1; j < handles.size(); ++j)
        {
            EXPECT_NE(handles[i], handles[j]);
        }
    }
}

TEST(Store, ForeignHandleIsRejected)
{
    Store first;
    Store second;

    const Handle h = first.Insert("only in first");
    (void)second.Insert("only in second");

    // Same index, different store.
    EXPECT_EQ(h.Index, 0u);
    EXPECT_FALSE(second.Contains(h));
    EXPECT_EQ(second.GetUnchecked(h), nullptr);

    auto value = second.Get(h);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error(), Core::ErrorCode::ResourceNotFound);
}

TEST(Store, DefaultHandleIsRejected)
{
    Store store;
    (void)store.Insert("x");
    EXPECT_FALSE(store.Contains(Handle{}));
    EXPECT_EQ(store.GetUnchecked(Handle{}), nullptr);
}

TEST(Store, IterationIsInsertionOrdered)
{
    Store store;
    const Handle a = store.Insert("a");
    const Handle b = store.Insert("b");
    const Handle c = store.Insert("c");

    std::vector<Handle> handles;
    for (const auto& entry : store.Iter())
    {
        handles.push_back(entry.Handle);
    }

    EXPECT_EQ(handles, (std::vector<Handle>{a, b, c}));
    EXPECT_EQ(Values(store), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Store, IterationIsRestartable)
{
    Store store;
    (void)store.Insert("a");
    (void)store.Insert("b");

    const auto range = store.Iter();
    std::vector<std::string> first;
    std::vector<std::string> second;
    for (const auto& entry : range) first.push_back(entry.Value);
    for (const auto& entry : range) second.push_back(entry.Value);

    EXPECT_EQ(first, second);
    EXPECT_EQ(range.size(), 2u);
}

TEST(Store, RangeDoesNotSeeLaterInserts)
{
    Store store;
    (void)store.Insert("a");

    const auto range = store.Iter();
    (void)store.Insert("b");

    size_t visited = 0;
    for ([[maybe_unused]] const auto& entry : range) ++visited;
    EXPECT_EQ(visited, 1u);
    EXPECT_EQ(store.Iter().size(), 2u);
}

TEST(Store, ReferencesStayValidAcrossInserts)
{
    Store store;
    const Handle h = store.Insert("stable");
    const std::string* before = store.GetUnchecked(h);

    for (int i = 0; i < 1000; ++i)
    {
        (void)store.Insert(std::to_string(i));
    }

    EXPECT_EQ(store.GetUnchecked(h), before);
    EXPECT_EQ(*before, "stable");
}

TEST(Store, MoveKeepsHandlesValid)
{
    Store source;
    const Handle h = source.Insert("moved");

    Store target(std::move(source));
    EXPECT_TRUE(target.Contains(h));
    EXPECT_EQ(*target.GetUnchecked(h), "moved");

    // The moved-from store is empty and draws a new generation.
    EXPECT_FALSE(source.Contains(h));
    EXPECT_NE(source.GetGeneration(), target.GetGeneration());
}

TEST(Store, EmptyStore)
{
    Store store;
    EXPECT_TRUE(store.IsEmpty());
    EXPECT_TRUE(store.Iter().empty());
}

TEST(Store, RangeIteratorIsInputIterator)
{
    static_assert(std::is_same_v<Store::Range::Iterator::iterator_category, std::input_iterator_tag>);
    static_assert(std::is_same_v<Store::Range::Iterator::reference, Store::Entry>);

    Store store;
    (void)store.Insert("keep");
    (void)store.Insert("drop");
    (void)store.Insert("keep");

    const auto range = store.Iter();
    const auto kept = std::count_if(range.begin(), range.end(),
                                    [](const Store::Entry& entry) { return entry.Value == "keep"; });
    EXPECT_EQ(kept, 2);
}

TEST(Store, CapacityLeavesRoomForInvalidIndex)
{
    static_assert(Store::MAX_SIZE == Handle::INVALID_INDEX);

    Store store;
    const Handle h = store.Insert("first");
    EXPECT_NE(h.Index, Handle::INVALID_INDEX);
    EXPECT_NE(store.GetGeneration(), 0u);
}

TEST(Store, ConcurrentReadersDuringInsert)
{
    constexpr int kSeeded = 64;
    constexpr int kInserted = 2000;
    constexpr int kReaders = 4;

    Store store;
    std::vector<Handle> seeded;
    for (int i = 0; i < kSeeded; ++i)
    {
        seeded.push_back(store.Insert("seed" + std::to_string(i)));
    }

    std::atomic<bool> writerDone{false};
    std::atomic<int> readFailures{0};
    std::vector<Handle> inserted;
    inserted.reserve(kInserted);

    std::thread writer([&]
    {
        for (int i = 0; i < kInserted; ++i)
        {
            inserted.push_back(store.Insert("value" + std::to_string(i)));
        }
        writerDone.store(true, std::memory_order_release);
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < kReaders; ++r)
    {
        readers.emplace_back([&]
        {
            do
            {
                for (int i = 0; i < kSeeded; ++i)
                {
                    auto value = store.Get(seeded[i]);
                    if (!store.Contains(seeded[i]) || !value || **value != "seed" + std::to_string(i))
                        readFailures.fetch_add(1, std::memory_order_relaxed);
                }

                size_t visited = 0;
                for (const auto& entry : store.Iter())
                {
                    if (!store.Contains(entry.Handle))
                        readFailures.fetch_add(1, std::memory_order_relaxed);
                    ++visited;
                }
                if (visited < static_cast<size_t>(kSeeded))
                    readFailures.fetch_add(1, std::memory_order_relaxed);
            } while (!writerDone.load(std::memory_order_acquire));
        });
    }

    writer.join();
    for (auto& reader : readers)
    {
        reader.join();
    }

    EXPECT_EQ(readFailures.load(), 0);
    EXPECT_EQ(store.Size(), static_cast<size_t>(kSeeded + kInserted));

    std::unordered_set<Handle> unique(seeded.begin(), seeded.end());
    unique.insert(inserted.begin(), inserted.end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(kSeeded + kInserted));
    for (const Handle& h : inserted)
    {
        EXPECT_TRUE(store.Contains(h));
    }
}
