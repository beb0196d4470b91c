/**
 * @file handle.hpp
 * @brief Arena of native objects referenced by script handles
 */

#ifndef ASBRIDGE_HANDLE_HPP
#define ASBRIDGE_HANDLE_HPP

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>
#include <vector>

namespace asbridge
{
/**
 * @brief Index of a slot and the generation it was issued for
 *
 * A default-constructed ID never refers to an object.
 */
struct handle_id
{
    std::uint32_t index = 0;
    std::uint32_t generation = 0;

    explicit operator bool() const noexcept
    {
        return generation != 0;
    }

    bool operator==(const handle_id&) const = default;
};

class arena_base
{
public:
    virtual ~arena_base() = default;

    virtual void clear() noexcept = 0;
};

/**
 * @brief Storage of native objects addressed by generational IDs
 *
 * Erasing an object bumps the generation of its slot, so stale IDs are detected
 * even after the slot is reused. Addresses of stored objects are stable.
 *
 * @note Not thread-safe. Only used on the host thread.
 */
template <typename T>
class handle_arena final : public arena_base
{
public:
    using value_type = T;

    handle_arena() = default;
    handle_arena(const handle_arena&) = delete;
    handle_arena& operator=(const handle_arena&) = delete;

    /**
     * @brief Construct an object in a free slot
     *
     * If the constructor throws, the arena is left unchanged.
     */
    template <typename... Args>
    handle_id emplace(Args&&... args)
    {
        std::uint32_t idx;
        if(!m_free.empty())
        {
            idx = m_free.back();
            m_slots[idx].value.emplace(std::forward<Args>(args)...);
            m_free.pop_back();
        }
        else
        {
            // Keeps erase() and clear() from allocating
            m_free.reserve(m_slots.size() + 1);

            idx = static_cast<std::uint32_t>(m_slots.size());
            slot& s = m_slots.emplace_back();
            try
            {
                s.value.emplace(std::forward<Args>(args)...);
            }
            catch(...)
            {
                m_slots.pop_back();
                throw;
            }
        }

        ++m_size;
        return {idx, m_slots[idx].generation};
    }

    [[nodiscard]]
    T* get(handle_id id) noexcept
    {
        slot* s = find(id);
        return s ? &*s->value : nullptr;
    }

    [[nodiscard]]
    const T* get(handle_id id) const noexcept
    {
        return const_cast<handle_arena*>(this)->get(id);
    }

    [[nodiscard]]
    bool contains(handle_id id) const noexcept
    {
        return get(id) != nullptr;
    }

    /**
     * @brief Destroy the object of an ID
     *
     * @return False if the ID was already invalid
     */
    bool erase(handle_id id) noexcept
    {
        slot* s = find(id);
        if(!s)
            return false;

        s->value.reset();
        bump_generation(*s);
        m_free.push_back(id.index);
        --m_size;
        return true;
    }

    /**
     * @brief Destroy every object. All issued IDs become invalid.
     */
    void clear() noexcept override
    {
        for(std::uint32_t i = 0; i < m_slots.size(); ++i)
        {
            slot& s = m_slots[i];
            if(!s.value)
                continue;
            s.value.reset();
            bump_generation(s);
            m_free.push_back(i);
        }
        m_size = 0;
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_size;
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_size == 0;
    }

private:
    struct slot
    {
        std::optional<T> value;
        std::uint32_t generation = 1;
    };

    slot* find(handle_id id) noexcept
    {
        if(!id || id.index >= m_slots.size())
            return nullptr;
        slot& s = m_slots[id.index];
        if(s.generation != id.generation || !s.value)
            return nullptr;
        return &s;
    }

    static void bump_generation(slot& s) noexcept
    {
        // Zero is reserved for the null ID
        if(++s.generation == 0)
            s.generation = 1;
    }

    std::deque<slot> m_slots;
    // Capacity is at least the number of slots
    std::vector<std::uint32_t> m_free;
    std::size_t m_size = 0;
};
} // namespace asbridge

#endif
