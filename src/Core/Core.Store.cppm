module;

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <utility>

export module Core:Store;

import :Handle;
import :Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Store - append-only typed arena
    // -------------------------------------------------------------------------
    // Values are never removed or replaced, so a handle issued by Insert()
    // resolves for the whole lifetime of the store. Each store instance owns a
    // unique generation that is stamped into every handle it issues; handles
    // from another store are rejected by Contains()/Get().
    //
    // Traversal is insertion ordered. A Range captures the size at the moment
    // it is created, so values inserted during a traversal are not visited.
    // -------------------------------------------------------------------------
    template <typename T>
    class Store
    {
    public:
        using HandleType = StrongHandle<T>;

        struct Entry
        {
            HandleType Handle;
            const T& Value;
        };

        class Range
        {
        public:
            class Iterator
            {
            public:
                // Dereferencing yields an Entry by value, so this is an input iterator.
                using iterator_category = std::input_iterator_tag;
                using value_type = Entry;
                using difference_type = std::ptrdiff_t;
                using reference = Entry;
                using pointer = void;

                Iterator() = default;
                Iterator(const Store* store, uint32_t index) : m_Store(store), m_Index(index) {}

                [[nodiscard]] Entry operator*() const
                {
                    return {HandleType(m_Index, m_Store->m_Generation), m_Store->At(m_Index)};
                }

                Iterator& operator++()
                {
                    ++m_Index;
                    return *this;
                }

                Iterator operator++(int)
                {
                    Iterator copy = *this;
                    ++m_Index;
                    return copy;
                }

                bool operator==(const Iterator& other) const
                {
                    return m_Store == other.m_Store && m_Index == other.m_Index;
                }

            private:
                const Store* m_Store = nullptr;
                uint32_t m_Index = 0;
            };

            Range(const Store* store, uint32_t count) : m_Store(store), m_Count(count) {}

            [[nodiscard]] Iterator begin() const { return Iterator(m_Store, 0); }
            [[nodiscard]] Iterator end() const { return Iterator(m_Store, m_Count); }
            [[nodiscard]] size_t size() const { return m_Count; }
            [[nodiscard]] bool empty() const { return m_Count == 0; }

        private:
            const Store* m_Store;
            uint32_t m_Count;
        };

        Store() : m_Generation(NextGeneration()) {}

        // Copying would duplicate the generation and make two stores accept
        // the same handles.
        Store(const Store&) = delete;
        Store& operator=(const Store&) = delete;

        Store(Store&& other) noexcept
        {
            std::unique_lock lock(other.m_Mutex);
            m_Values = std::move(other.m_Values);
            other.m_Values.clear();
            m_Generation = std::exchange(other.m_Generation, NextGeneration());
        }

        Store& operator=(Store&& other) noexcept
        {
            if (this != &other)
            {
                std::scoped_lock lock(m_Mutex, other.m_Mutex);
                m_Values = std::move(other.m_Values);
                other.m_Values.clear();
                m_Generation = std::exchange(other.m_Generation, NextGeneration());
            }
            return *this;
        }

        // Largest number of values one store can hold. The last index is
        // reserved for INVALID_INDEX.
        static constexpr size_t MAX_SIZE = HandleType::INVALID_INDEX;

        // Returns an invalid handle once the store holds MAX_SIZE values.
        [[nodiscard]] HandleType Insert(T value)
        {
            std::unique_lock lock(m_Mutex);

            if (m_Values.size() >= MAX_SIZE)
                return {};

            const auto index = static_cast<uint32_t>(m_Values.size());
            // POINTER STABILITY: std::deque never relocates existing elements on
            // push_back, so references handed out by Get() stay valid.
            m_Values.push_back(std::move(value));

            return {index, m_Generation};
        }

        [[nodiscard]] bool Contains(HandleType handle) const
        {
            std::shared_lock lock(m_Mutex);
            return handle.Generation == m_Generation && handle.Index < m_Values.size();
        }

        [[nodiscard]] Core::Expected<const T*> Get(HandleType handle) const
        {
            std::shared_lock lock(m_Mutex);

            if (handle.Generation != m_Generation || handle.Index >= m_Values.size())
                return std::unexpected(Core::ErrorCode::ResourceNotFound);

            return &m_Values[handle.Index];
        }

        // Returns nullptr for handles that were not issued by this store.
        [[nodiscard]] const T* GetUnchecked(HandleType handle) const
        {
            std::shared_lock lock(m_Mutex);
            if (handle.Generation == m_Generation && handle.Index < m_Values.size())
            {
                return &m_Values[handle.Index];
            }
            return nullptr;
        }

        [[nodiscard]] Range Iter() const
        {
            std::shared_lock lock(m_Mutex);
            return Range(this, static_cast<uint32_t>(m_Values.size()));
        }

        [[nodiscard]] size_t Size() const
        {
            std::shared_lock lock(m_Mutex);
            return m_Values.size();
        }

        [[nodiscard]] bool IsEmpty() const { return Size() == 0; }

        [[nodiscard]] uint32_t GetGeneration() const noexcept { return m_Generation; }

    private:
        [[nodiscard]] const T& At(uint32_t index) const
        {
            std::shared_lock lock(m_Mutex);
            return m_Values[index];
        }

        // Generation 0 is never issued so default handles match nothing.
        // Generations are 32 bit: after 2^32 - 1 stores have been created in
        // one process the counter wraps and skips 0, so a handle could in
        // principle resolve in a store created that many constructions later.
        static uint32_t NextGeneration()
        {
            static std::atomic<uint32_t> s_Next{1};
            uint32_t generation = s_Next.fetch_add(1, std::memory_order_relaxed);
            while (generation == 0)
                generation = s_Next.fetch_add(1, std::memory_order_relaxed);
            return generation;
        }

        std::deque<T> m_Values;
        uint32_t m_Generation = 0;

        mutable std::shared_mutex m_Mutex;
    };
}
