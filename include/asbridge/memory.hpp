/**
 * @file memory.hpp
 * @brief RAII helpers for engines, contexts and stored script values
 */

#ifndef ASBRIDGE_MEMORY_HPP
#define ASBRIDGE_MEMORY_HPP

#pragma once

#include <cassert>
#include <cstddef>
#include <cstring>
#include <utility>
#include "detail/include_as.hpp"
#include "utility.hpp"

namespace asbridge
{
/**
 * @brief Allocator using `asAllocMem()` and `asFreeMem()`
 */
template <typename T>
class as_allocator
{
public:
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using value_type = T;

    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal = std::true_type;

    as_allocator() noexcept = default;

    template <typename U>
    as_allocator(const as_allocator<U>&) noexcept
    {}

    static T* allocate(size_type n)
    {
        return static_cast<T*>(AS_NAMESPACE_QUALIFIER asAllocMem(n * sizeof(T)));
    }

    static void deallocate(T* mem, size_type) noexcept
    {
        AS_NAMESPACE_QUALIFIER asFreeMem(static_cast<void*>(mem));
    }

    template <typename U>
    bool operator==(const as_allocator<U>&) const noexcept
    {
        return true;
    }
};

/**
 * @brief Run a nested call on the active context if possible, otherwise on a context requested from the engine.
 *
 * The caller reads the result of the nested call before destruction. The state of the outer call
 * is restored by `PopState` and is not affected by the nested call.
 */
class [[nodiscard]] reuse_active_context
{
public:
    using handle_type = AS_NAMESPACE_QUALIFIER asIScriptContext*;

    reuse_active_context(const reuse_active_context&) = delete;
    reuse_active_context& operator=(const reuse_active_context&) = delete;

    explicit reuse_active_context(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
        : m_engine(engine)
    {
        assert(m_engine != nullptr);

        handle_type active = current_context();
        if(active && active->GetEngine() == engine && active->PushState() >= 0)
        {
            m_ctx = active;
            m_is_nested = true;
        }
        else
            m_ctx = engine->RequestContext();
    }

    ~reuse_active_context()
    {
        if(!m_ctx)
            return;

        if(m_is_nested)
            m_ctx->PopState();
        else
            m_engine->ReturnContext(m_ctx);
    }

    [[nodiscard]]
    handle_type get() const noexcept
    {
        return m_ctx;
    }

    operator handle_type() const noexcept
    {
        return m_ctx;
    }

    handle_type operator->() const noexcept
    {
        return m_ctx;
    }

    [[nodiscard]]
    bool is_nested() const noexcept
    {
        return m_is_nested;
    }

private:
    AS_NAMESPACE_QUALIFIER asIScriptEngine* m_engine;
    handle_type m_ctx = nullptr;
    bool m_is_nested = false;
};

/**
 * @brief Context borrowed from the engine's context pool for the lifetime of this object
 */
class [[nodiscard]] request_context
{
public:
    using handle_type = AS_NAMESPACE_QUALIFIER asIScriptContext*;

    request_context(const request_context&) = delete;
    request_context& operator=(const request_context&) = delete;

    explicit request_context(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
        : m_engine(engine)
    {
        assert(m_engine != nullptr);
        m_ctx = m_engine->RequestContext();
    }

    ~request_context()
    {
        if(m_ctx)
            m_engine->ReturnContext(m_ctx);
    }

    [[nodiscard]]
    handle_type get() const noexcept
    {
        return m_ctx;
    }

    operator handle_type() const noexcept
    {
        return m_ctx;
    }

    handle_type operator->() const noexcept
    {
        return m_ctx;
    }

private:
    AS_NAMESPACE_QUALIFIER asIScriptEngine* m_engine;
    handle_type m_ctx = nullptr;
};

/**
 * @brief Owning pointer to a script engine, shut down on destruction
 */
class script_engine
{
public:
    using handle_type = AS_NAMESPACE_QUALIFIER asIScriptEngine*;

    script_engine() noexcept = default;

    script_engine(const script_engine&) = delete;

    script_engine(script_engine&& other) noexcept
        : m_engine(std::exchange(other.m_engine, nullptr)) {}

    explicit script_engine(handle_type engine) noexcept
        : m_engine(engine) {}

    script_engine& operator=(script_engine&& other) noexcept
    {
        if(this != &other)
            reset(std::exchange(other.m_engine, nullptr));
        return *this;
    }

    ~script_engine()
    {
        reset();
    }

    [[nodiscard]]
    handle_type get() const noexcept
    {
        return m_engine;
    }

    operator handle_type() const noexcept
    {
        return m_engine;
    }

    handle_type operator->() const noexcept
    {
        return m_engine;
    }

    void reset(handle_type engine = nullptr) noexcept
    {
        if(m_engine)
            m_engine->ShutDownAndRelease();
        m_engine = engine;
    }

private:
    handle_type m_engine = nullptr;
};

[[nodiscard]]
inline script_engine make_script_engine(
    AS_NAMESPACE_QUALIFIER asDWORD version = ANGELSCRIPT_VERSION
)
{
    return script_engine(AS_NAMESPACE_QUALIFIER asCreateScriptEngine(version));
}

namespace container
{
    /**
     * @brief Storage for one script value whose type ID is kept by the owner
     *
     * Primitives are stored inline, handles as a referenced pointer,
     * other objects as a pointer to an engine-allocated copy.
     *
     * @warning The stored value must be released by `destroy()` before the storage is destroyed.
     */
    class single
    {
    public:
        single() noexcept
        {
            m_data.ptr = nullptr;
        }

        single(const single&) = delete;

        single(single&& other) noexcept
        {
            std::memcpy(static_cast<void*>(&m_data), &other.m_data, sizeof(m_data));
            other.m_data.ptr = nullptr;
        }

        ~single()
        {
            assert(m_data.ptr == nullptr && "stored value not destroyed");
        }

        single& operator=(const single&) = delete;

        single& operator=(single&& other) noexcept
        {
            assert(m_data.ptr == nullptr && "stored value not destroyed");
            std::memcpy(static_cast<void*>(&m_data), &other.m_data, sizeof(m_data));
            other.m_data.ptr = nullptr;
            return *this;
        }

        [[nodiscard]]
        void* data_address(int type_id) noexcept
        {
            if(is_primitive_type(type_id))
                return m_data.primitive;
            else if(is_objhandle(type_id))
                return &m_data.handle;
            return m_data.ptr;
        }

        [[nodiscard]]
        const void* data_address(int type_id) const noexcept
        {
            return const_cast<single*>(this)->data_address(type_id);
        }

        bool construct(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int type_id)
        {
            assert(!is_void_type(type_id));

            if(is_primitive_type(type_id))
                std::memset(m_data.primitive, 0, sizeof(m_data.primitive));
            else if(is_objhandle(type_id))
                m_data.handle = nullptr;
            else
            {
                m_data.ptr = engine->CreateScriptObject(engine->GetTypeInfoById(type_id));
                return m_data.ptr != nullptr;
            }

            return true;
        }

        /**
         * @param ref Address of the source value. For handles it is the address of the handle variable.
         */
        bool copy_construct(
            AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int type_id, const void* ref
        )
        {
            assert(!is_void_type(type_id));
            assert(ref != nullptr);

            if(is_primitive_type(type_id))
            {
                std::memset(m_data.primitive, 0, sizeof(m_data.primitive));
                copy_primitive_value(m_data.primitive, ref, type_id);
            }
            else if(is_objhandle(type_id))
            {
                m_data.handle = *static_cast<void* const*>(ref);
                if(m_data.handle)
                    engine->AddRefScriptObject(m_data.handle, engine->GetTypeInfoById(type_id));
            }
            else
            {
                m_data.ptr = engine->CreateScriptObjectCopy(
                    const_cast<void*>(ref), engine->GetTypeInfoById(type_id)
                );
                return m_data.ptr != nullptr;
            }

            return true;
        }

        /**
         * @brief Take over a handle whose reference is already counted for this storage
         */
        void adopt_handle(void* handle) noexcept
        {
            m_data.handle = handle;
        }

        void destroy(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int type_id) noexcept
        {
            if(!is_primitive_type(type_id) && m_data.ptr)
                engine->ReleaseScriptObject(m_data.ptr, engine->GetTypeInfoById(type_id));
            m_data.ptr = nullptr;
        }

        /**
         * @brief Report the stored reference to the garbage collector
         *
         * @param ti Type info of the stored value, null for primitives
         */
        void enum_refs(AS_NAMESPACE_QUALIFIER asITypeInfo* ti) const
        {
            if(!ti || !m_data.ptr)
                return;

            auto flags = ti->GetFlags();
            if(flags & AS_NAMESPACE_QUALIFIER asOBJ_REF)
                ti->GetEngine()->GCEnumCallback(m_data.ptr);
            else if((flags & AS_NAMESPACE_QUALIFIER asOBJ_VALUE) && (flags & AS_NAMESPACE_QUALIFIER asOBJ_GC))
                ti->GetEngine()->ForwardGCEnumReferences(m_data.ptr, ti);
        }

    private:
        union data_type
        {
            std::byte primitive[8];
            void* handle;
            void* ptr;
        };

        data_type m_data;
    };
} // namespace container
} // namespace asbridge

#endif
