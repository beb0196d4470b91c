#include <asbridge/ext/buffer.hpp>
#include <cassert>
#include <limits>
#include <utility>
#include <asbridge/ext/array.hpp>

namespace asbridge::ext
{
void* script_buffer::operator new(std::size_t bytes)
{
    return AS_NAMESPACE_QUALIFIER asAllocMem(bytes);
}

void script_buffer::operator delete(void* p)
{
    AS_NAMESPACE_QUALIFIER asFreeMem(p);
}

script_buffer* script_buffer::create(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, size_type byte_length)
{
    auto* ti = engine->GetTypeInfoByName("buffer");
    if(!ti)
        throw bridge_error(error_kind::type_mismatch, "script type \"buffer\" is not registered");

    auto* buf = new script_buffer(ti);
    try
    {
        buf->m_data.resize(byte_length);
    }
    catch(...)
    {
        buf->release();
        throw;
    }
    return buf;
}

script_buffer* script_buffer::create(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, std::span<const std::byte> bytes)
{
    if(bytes.size() > std::numeric_limits<size_type>::max())
        throw range_error("buffer too large");

    script_buffer* buf = create(engine, static_cast<size_type>(bytes.size()));
    std::copy(bytes.begin(), bytes.end(), buf->m_data.begin());
    return buf;
}

script_buffer::script_buffer(AS_NAMESPACE_QUALIFIER asITypeInfo* ti)
    : m_ti(ti)
{
    m_ti->AddRef();
}

script_buffer::~script_buffer()
{
    m_ti->Release();
}

void script_buffer::detach() noexcept
{
    std::vector<std::byte>().swap(m_data);
    m_detached = true;
}

std::uint8_t& script_buffer::script_at(size_type idx)
{
    if(idx >= m_data.size())
        throw range_error("buffer index out of range");
    return reinterpret_cast<std::uint8_t&>(m_data[idx]);
}

script_buffer* script_buffer::slice(size_type begin, size_type end) const
{
    if(begin > end || end > m_data.size())
        throw range_error("slice range is outside the buffer");
    return create(m_ti->GetEngine(), bytes().subspan(begin, end - begin));
}

int buffer_handle_type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    int tid = engine->GetTypeIdByDecl("buffer@");
    if(tid < 0)
        throw marshal_error(error_kind::type_mismatch, "script type \"buffer\" is not registered");
    return tid;
}

script_buffer* as_script_buffer(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
{
    if(is_primitive_type(ref.type_id) || is_void_type(ref.type_id))
        return nullptr;

    auto* ti = engine->GetTypeInfoById(ref.type_id);
    if(!ti || ti != engine->GetTypeInfoByName("buffer"))
        return nullptr;

    return static_cast<script_buffer*>(ref.object());
}

namespace detail
{
    static script_buffer* self(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return static_cast<script_buffer*>(gen->GetObject());
    }

    static void buffer_factory(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            gen->SetReturnAddress(script_buffer::create(gen->GetEngine()));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void buffer_factory_length(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            gen->SetReturnAddress(script_buffer::create(gen->GetEngine(), gen->GetArgDWord(0)));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void buffer_factory_array(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            auto* engine = gen->GetEngine();
            auto data = to_native<std::vector<std::uint8_t>>(engine, generic_arg(gen, 0));
            gen->SetReturnAddress(script_buffer::create(engine, std::as_bytes(std::span(data))));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void buffer_addref(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->addref();
    }

    static void buffer_release(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->release();
    }

    static void buffer_byte_length(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnDWord(self(gen)->byte_length());
    }

    static void buffer_detached(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(self(gen)->detached());
    }

    static void buffer_detach(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->detach();
    }

    static void buffer_at(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            gen->SetReturnAddress(&self(gen)->script_at(gen->GetArgDWord(0)));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void buffer_slice(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            gen->SetReturnAddress(self(gen)->slice(gen->GetArgDWord(0), gen->GetArgDWord(1)));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void buffer_to_array(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            std::span<const std::byte> bytes = std::as_const(*self(gen)).bytes();
            std::vector<std::uint8_t> data(bytes.size());
            std::memcpy(data.data(), bytes.data(), bytes.size());

            host_value arr = to_host(gen->GetEngine(), data);
            set_generic_return(gen, arr);
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    template <typename T>
    void buffer_get_number(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            data_view view(self(gen)->bytes());
            T val = view.get<T>(gen->GetArgDWord(0), gen->GetArgByte(1) != 0);

            host_value ret = to_host(gen->GetEngine(), val);
            set_generic_return(gen, ret);
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    template <typename T>
    void buffer_set_number(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            T val = to_native<T>(gen->GetEngine(), generic_arg(gen, 1));
            data_view view(self(gen)->bytes());
            view.set<T>(gen->GetArgDWord(0), val, gen->GetArgByte(2) != 0);
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }
} // namespace detail

void register_script_buffer(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    using namespace detail;

    [[maybe_unused]] int r = 0;
    auto behaviour = [&](AS_NAMESPACE_QUALIFIER asEBehaviours beh, const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectBehaviour(
            "buffer", beh, decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };
    auto method = [&](const std::string& decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectMethod(
            "buffer", decl.c_str(), AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };
    auto number_accessors = [&]<typename T>(std::in_place_type_t<T>, const char* script_type, const char* suffix)
    {
        method(
            string_concat(script_type, " get_", suffix, "(uint byte_offset, bool little_endian = true) const"),
            &buffer_get_number<T>
        );
        method(
            string_concat("void set_", suffix, "(uint byte_offset, ", script_type, " value, bool little_endian = true)"),
            &buffer_set_number<T>
        );
    };

    r = engine->RegisterObjectType("buffer", 0, AS_NAMESPACE_QUALIFIER asOBJ_REF);
    assert(r >= 0);

    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_FACTORY, "buffer@ f()", &buffer_factory);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_FACTORY, "buffer@ f(uint byte_length)", &buffer_factory_length);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_FACTORY, "buffer@ f(const array<uint8>&in bytes)", &buffer_factory_array);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ADDREF, "void f()", &buffer_addref);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASE, "void f()", &buffer_release);

    method("uint get_byte_length() const property", &buffer_byte_length);
    method("bool get_detached() const property", &buffer_detached);
    method("void detach()", &buffer_detach);
    method("uint8& opIndex(uint idx)", &buffer_at);
    method("const uint8& opIndex(uint idx) const", &buffer_at);
    method("buffer@ slice(uint begin, uint end) const", &buffer_slice);
    method("array<uint8>@ to_array() const", &buffer_to_array);

    number_accessors(std::in_place_type<std::int8_t>, "int8", "int8");
    number_accessors(std::in_place_type<std::uint8_t>, "uint8", "uint8");
    number_accessors(std::in_place_type<std::int16_t>, "int16", "int16");
    number_accessors(std::in_place_type<std::uint16_t>, "uint16", "uint16");
    number_accessors(std::in_place_type<std::int32_t>, "int", "int32");
    number_accessors(std::in_place_type<std::uint32_t>, "uint", "uint32");
    number_accessors(std::in_place_type<std::int64_t>, "int64", "int64");
    number_accessors(std::in_place_type<std::uint64_t>, "uint64", "uint64");
    number_accessors(std::in_place_type<float>, "float", "float32");
    number_accessors(std::in_place_type<double>, "double", "float64");
}
} // namespace asbridge::ext

namespace asbridge
{
std::vector<std::byte> converter<std::vector<std::byte>>::to_native(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref
)
{
    std::span<const std::byte> bytes = converter<std::span<const std::byte>>::to_native(engine, ref);
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

host_value converter<std::vector<std::byte>>::to_host(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const std::vector<std::byte>& bytes
)
{
    int tid = type_id(engine);
    return host_value::adopt_handle(engine, tid, ext::script_buffer::create(engine, bytes));
}

std::span<const std::byte> converter<std::span<const std::byte>>::to_native(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref
)
{
    return converter<std::span<std::byte>>::to_native(engine, ref);
}

std::span<std::byte> converter<std::span<std::byte>>::to_native(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref
)
{
    ext::script_buffer* buf = ext::as_script_buffer(engine, ref);
    if(!buf)
    {
        if(is_objhandle(ref.type_id) && engine->GetTypeInfoById(ref.type_id) == engine->GetTypeInfoByName("buffer"))
            throw marshal_error(error_kind::type_mismatch, "cannot pass a null buffer");
        throw marshal_error::type_mismatch("buffer@", type_decl(engine, ref.type_id));
    }
    return buf->bytes();
}
} // namespace asbridge
