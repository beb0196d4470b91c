#include <asbridge/ext/vocabulary.hpp>
#include <new>
#include <string_view>

namespace asbridge::ext
{
script_optional::script_optional(AS_NAMESPACE_QUALIFIER asITypeInfo* ti)
    : m_ti(ti)
{
    assert(m_ti);
    m_ti->AddRef();
}

script_optional::script_optional(AS_NAMESPACE_QUALIFIER asITypeInfo* ti, const void* value)
    : script_optional(ti)
{
    assign(value);
}

script_optional::script_optional(const script_optional& other)
    : script_optional(other.m_ti)
{
    if(other.has_value())
        m_value = host_value::copy_of(m_ti->GetEngine(), other.ref());
}

script_optional::~script_optional()
{
    reset();
    m_ti->Release();
}

script_optional& script_optional::operator=(const script_optional& other)
{
    if(&other == this)
        return *this;

    assert(m_ti == other.m_ti);
    if(other.has_value())
        m_value = host_value::copy_of(m_ti->GetEngine(), other.ref());
    else
        reset();

    return *this;
}

void script_optional::set(host_value&& val)
{
    if(!same_script_type(val.type_id(), element_type_id()))
    {
        auto* engine = m_ti->GetEngine();
        throw marshal_error::type_mismatch(
            type_decl(engine, element_type_id()), type_decl(engine, val.type_id())
        );
    }

    m_value = std::move(val);
}

void script_optional::assign(const void* val)
{
    m_value = host_value::copy_of(m_ti->GetEngine(), host_ref{val, element_type_id()});
}

void script_optional::reset() noexcept
{
    m_value.reset();
}

void* script_optional::value()
{
    if(!has_value())
    {
        set_script_exception("bad optional access");
        return nullptr;
    }

    return m_value.address();
}

const void* script_optional::value_or(const void* val) const noexcept
{
    return has_value() ? m_value.address() : val;
}

void script_optional::enum_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    m_value.enum_refs(engine);
}

void script_optional::release_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine*)
{
    reset();
}

const script_optional* as_script_optional(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
{
    if(is_primitive_type(ref.type_id) || is_void_type(ref.type_id) || is_objhandle(ref.type_id))
        return nullptr;

    auto* ti = engine->GetTypeInfoById(ref.type_id);
    if(!ti || std::string_view(ti->GetName()) != "optional" || ti->GetSubTypeCount() != 1)
        return nullptr;
    if(const char* ns = ti->GetNamespace(); ns && *ns != '\0')
        return nullptr;

    return static_cast<const script_optional*>(ref.address);
}

namespace detail
{
    static std::nullopt_t script_nullopt = std::nullopt;

    static script_optional* self(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return static_cast<script_optional*>(gen->GetObject());
    }

    static AS_NAMESPACE_QUALIFIER asITypeInfo* hidden_type_arg(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return *static_cast<AS_NAMESPACE_QUALIFIER asITypeInfo**>(gen->GetAddressOfArg(0));
    }

    static void optional_template_callback(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        auto* ti = hidden_type_arg(gen);
        bool& no_gc = **static_cast<bool**>(gen->GetAddressOfArg(1));

        int subtype_id = ti->GetSubTypeId();
        bool ok = true;
        if(is_void_type(subtype_id))
            ok = false;
        else if(is_primitive_type(subtype_id))
            no_gc = true;
        else if(!is_objhandle(subtype_id) && (ti->GetSubType()->GetFlags() & AS_NAMESPACE_QUALIFIER asOBJ_REF))
        {
            ti->GetEngine()->WriteMessage(
                "optional", 0, 0, AS_NAMESPACE_QUALIFIER asMSGTYPE_ERROR, "optional<T> stores reference types by handle only"
            );
            ok = false;
        }
        else
            no_gc = !type_requires_gc(ti->GetSubType());

        *static_cast<bool*>(gen->GetAddressOfReturnLocation()) = ok;
    }

    static void optional_construct(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        new(gen->GetObject()) script_optional(hidden_type_arg(gen));
    }

    static void optional_construct_nullopt(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        new(gen->GetObject()) script_optional(hidden_type_arg(gen));
    }

    static void optional_construct_value(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        auto* ti = hidden_type_arg(gen);
        auto* mem = new(gen->GetObject()) script_optional(ti);
        try
        {
            mem->assign(generic_arg(gen, 1).address);
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void optional_copy_construct(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        auto* mem = new(gen->GetObject()) script_optional(hidden_type_arg(gen));
        try
        {
            *mem = *static_cast<const script_optional*>(gen->GetArgObject(1));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void optional_destruct(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->~script_optional();
    }

    static void optional_enum_refs(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->enum_refs(*static_cast<AS_NAMESPACE_QUALIFIER asIScriptEngine**>(gen->GetAddressOfArg(0)));
    }

    static void optional_release_refs(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->release_refs(*static_cast<AS_NAMESPACE_QUALIFIER asIScriptEngine**>(gen->GetAddressOfArg(0)));
    }

    static void optional_assign(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            *self(gen) = *static_cast<const script_optional*>(gen->GetArgObject(0));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
        gen->SetReturnAddress(self(gen));
    }

    static void optional_assign_value(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            self(gen)->assign(generic_arg(gen, 0).address);
        }
        catch(...)
        {
            translate_exception(current_context());
        }
        gen->SetReturnAddress(self(gen));
    }

    static void optional_assign_nullopt(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->reset();
        gen->SetReturnAddress(self(gen));
    }

    static void optional_has_value(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(self(gen)->has_value());
    }

    static void optional_value(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnAddress(self(gen)->value());
    }

    static void optional_value_or(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnAddress(const_cast<void*>(self(gen)->value_or(generic_arg(gen, 0).address)));
    }

    static void optional_reset(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->reset();
    }
} // namespace detail

void register_script_optional(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    using namespace detail;

    value_class<std::nullopt_t>(engine, "nullopt_t", AS_NAMESPACE_QUALIFIER asOBJ_POD);
    global(engine)
        .property("const nullopt_t nullopt", script_nullopt);

    [[maybe_unused]] int r = 0;
    auto behaviour = [&](AS_NAMESPACE_QUALIFIER asEBehaviours beh, const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectBehaviour(
            "optional<T>", beh, decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };
    auto method = [&](const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectMethod(
            "optional<T>", decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };

    r = engine->RegisterObjectType(
        "optional<class T>",
        sizeof(script_optional),
        AS_NAMESPACE_QUALIFIER asOBJ_VALUE |
            AS_NAMESPACE_QUALIFIER asOBJ_TEMPLATE |
            AS_NAMESPACE_QUALIFIER asOBJ_GC |
            AS_NAMESPACE_QUALIFIER asOBJ_APP_CLASS_CDAK |
            AS_NAMESPACE_QUALIFIER asOBJ_APP_CLASS_MORE_CONSTRUCTORS
    );
    assert(r >= 0);

    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_TEMPLATE_CALLBACK, "bool f(int&in, bool&out)", &optional_template_callback);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_CONSTRUCT, "void f(int&in)", &optional_construct);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_CONSTRUCT, "void f(int&in, const optional<T>&in)", &optional_copy_construct);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_CONSTRUCT, "void f(int&in, const T&in value)", &optional_construct_value);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_CONSTRUCT, "void f(int&in, const nullopt_t&in)", &optional_construct_nullopt);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_DESTRUCT, "void f()", &optional_destruct);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ENUMREFS, "void f(int&in)", &optional_enum_refs);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASEREFS, "void f(int&in)", &optional_release_refs);

    method("optional<T>& opAssign(const optional<T>&in other)", &optional_assign);
    method("optional<T>& opAssign(const T&in value)", &optional_assign_value);
    method("optional<T>& opAssign(const nullopt_t&in)", &optional_assign_nullopt);
    method("bool get_has_value() const property", &optional_has_value);
    method("T& get_value() property", &optional_value);
    method("const T& get_value() const property", &optional_value);
    method("const T& value_or(const T&in val) const", &optional_value_or);
    method("void reset()", &optional_reset);
}
} // namespace asbridge::ext
