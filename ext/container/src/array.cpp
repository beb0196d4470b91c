#include <asbridge/ext/array.hpp>
#include <algorithm>
#include <string_view>
#include <utility>

namespace asbridge::ext
{
void* script_array::operator new(std::size_t bytes)
{
    return AS_NAMESPACE_QUALIFIER asAllocMem(bytes);
}

void script_array::operator delete(void* p)
{
    AS_NAMESPACE_QUALIFIER asFreeMem(p);
}

script_array* script_array::create(AS_NAMESPACE_QUALIFIER asITypeInfo* ti)
{
    auto* arr = new script_array(ti);
    if(ti->GetFlags() & AS_NAMESPACE_QUALIFIER asOBJ_GC)
        ti->GetEngine()->NotifyGarbageCollectorOfNewObject(arr, ti);
    return arr;
}

script_array::script_array(AS_NAMESPACE_QUALIFIER asITypeInfo* ti)
    : m_ti(ti)
{
    m_ti->AddRef();
}

script_array::~script_array()
{
    clear();
    m_ti->Release();
}

void script_array::enum_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    for(const host_value& v : m_data)
        v.enum_refs(engine);
}

void script_array::release_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine*)
{
    clear();
}

void script_array::push_back(host_value&& val)
{
    if(!same_script_type(val.type_id(), element_type_id()))
    {
        throw marshal_error::type_mismatch(
            type_decl(get_engine(), element_type_id()), type_decl(get_engine(), val.type_id())
        );
    }

    m_data.push_back(std::move(val));
}

void script_array::emplace_back()
{
    m_data.emplace_back(get_engine(), element_type_id());
}

void script_array::append_copy(host_ref val)
{
    m_data.push_back(host_value::copy_of(get_engine(), host_ref{val.address, element_type_id()}));
}

void* script_array::script_at(size_type idx)
{
    if(idx >= size())
    {
        set_script_exception("index out of range");
        return nullptr;
    }

    return m_data[idx].address();
}

void script_array::script_insert(size_type idx, const void* val)
{
    if(idx > size())
    {
        set_script_exception("index out of range");
        return;
    }

    host_value v = host_value::copy_of(get_engine(), host_ref{val, element_type_id()});
    m_data.insert(m_data.begin() + idx, std::move(v));
}

void script_array::script_erase(size_type idx)
{
    if(idx >= size())
    {
        set_script_exception("index out of range");
        return;
    }

    m_data.erase(m_data.begin() + idx);
}

void script_array::pop_back()
{
    if(empty())
    {
        set_script_exception("pop_back() on empty array");
        return;
    }

    m_data.pop_back();
}

void script_array::clear() noexcept
{
    m_data.clear();
}

void script_array::reverse() noexcept
{
    std::reverse(m_data.begin(), m_data.end());
}

void script_array::assign(const script_array& other)
{
    if(&other == this)
        return;

    std::vector<host_value> tmp;
    tmp.reserve(other.size());
    for(const host_value& v : other.m_data)
        tmp.push_back(host_value::copy_of(get_engine(), v.ref()));
    m_data.swap(tmp);
}

int array_handle_type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int element_type_id)
{
    std::string decl = string_concat("array<", type_decl(engine, element_type_id), ">@");
    int tid = engine->GetTypeIdByDecl(decl.c_str());
    if(tid < 0)
        throw marshal_error(error_kind::type_mismatch, string_concat("script type \"", decl, "\" is not available"));
    return tid;
}

const script_array* as_script_array(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
{
    if(is_primitive_type(ref.type_id) || is_void_type(ref.type_id))
        return nullptr;

    auto* ti = engine->GetTypeInfoById(ref.type_id);
    if(!ti || std::string_view(ti->GetName()) != "array" || ti->GetSubTypeCount() != 1)
        return nullptr;
    if(const char* ns = ti->GetNamespace(); ns && *ns != '\0')
        return nullptr;

    return static_cast<const script_array*>(ref.object());
}

namespace detail
{
    static script_array* self(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return static_cast<script_array*>(gen->GetObject());
    }

    static AS_NAMESPACE_QUALIFIER asITypeInfo* hidden_type_arg(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return *static_cast<AS_NAMESPACE_QUALIFIER asITypeInfo**>(gen->GetAddressOfArg(0));
    }

    static void array_template_callback(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
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
                "array", 0, 0, AS_NAMESPACE_QUALIFIER asMSGTYPE_ERROR, "array<T> stores reference types by handle only"
            );
            ok = false;
        }
        else
            no_gc = !type_requires_gc(ti->GetSubType());

        *static_cast<bool*>(gen->GetAddressOfReturnLocation()) = ok;
    }

    static void array_factory(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnAddress(script_array::create(hidden_type_arg(gen)));
    }

    static void array_factory_n(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        auto* arr = script_array::create(hidden_type_arg(gen));
        try
        {
            auto n = *static_cast<script_array::size_type*>(gen->GetAddressOfArg(1));
            for(script_array::size_type i = 0; i < n; ++i)
                arr->emplace_back();
        }
        catch(...)
        {
            arr->release();
            translate_exception(current_context());
            return;
        }
        gen->SetReturnAddress(arr);
    }

    static void array_factory_n_value(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        auto* arr = script_array::create(hidden_type_arg(gen));
        try
        {
            auto n = *static_cast<script_array::size_type*>(gen->GetAddressOfArg(1));
            host_ref val = generic_arg(gen, 2);
            for(script_array::size_type i = 0; i < n; ++i)
                arr->append_copy(val);
        }
        catch(...)
        {
            arr->release();
            translate_exception(current_context());
            return;
        }
        gen->SetReturnAddress(arr);
    }

    /**
     * The list buffer holds the element count followed by the elements.
     * Primitives and handles are packed by their size, value objects are stored inline.
     */
    static void array_list_factory(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        auto* ti = hidden_type_arg(gen);
        auto* arr = script_array::create(ti);
        auto* engine = ti->GetEngine();

        try
        {
            auto* buf = *static_cast<std::byte**>(gen->GetAddressOfArg(1));
            script_init_list_repeat list(buf);

            int subtype_id = ti->GetSubTypeId();
            std::size_t elem_size;
            if(is_primitive_type(subtype_id))
                elem_size = engine->GetSizeOfPrimitiveType(subtype_id);
            else if(is_objhandle(subtype_id))
                elem_size = sizeof(void*);
            else
                elem_size = ti->GetSubType()->GetSize();

            auto* elem = static_cast<std::byte*>(list.data());
            for(script_init_list_repeat::size_type i = 0; i < list.size(); ++i)
            {
                if(is_objhandle(subtype_id))
                {
                    // The engine already counted the reference for the list
                    void*& handle = *reinterpret_cast<void**>(elem);
                    arr->push_back(host_value::adopt_handle(engine, subtype_id, std::exchange(handle, nullptr)));
                }
                else
                    arr->append_copy(host_ref{elem, subtype_id});
                elem += elem_size;
            }
        }
        catch(...)
        {
            arr->release();
            translate_exception(current_context());
            return;
        }
        gen->SetReturnAddress(arr);
    }

    static void array_addref(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->addref();
    }

    static void array_release(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->release();
    }

    static void array_get_refcount(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnDWord(static_cast<AS_NAMESPACE_QUALIFIER asDWORD>(self(gen)->get_refcount()));
    }

    static void array_set_gc_flag(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->set_gc_flag();
    }

    static void array_get_gc_flag(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(self(gen)->get_gc_flag());
    }

    static void array_enum_refs(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->enum_refs(*static_cast<AS_NAMESPACE_QUALIFIER asIScriptEngine**>(gen->GetAddressOfArg(0)));
    }

    static void array_release_refs(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->release_refs(*static_cast<AS_NAMESPACE_QUALIFIER asIScriptEngine**>(gen->GetAddressOfArg(0)));
    }

    static void array_assign(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            self(gen)->assign(*static_cast<const script_array*>(gen->GetArgObject(0)));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
        gen->SetReturnAddress(self(gen));
    }

    static void array_at(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnAddress(self(gen)->script_at(gen->GetArgDWord(0)));
    }

    static void array_size(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnDWord(self(gen)->size());
    }

    static void array_empty(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(self(gen)->empty());
    }

    static void array_push_back(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            self(gen)->append_copy(generic_arg(gen, 0));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void array_pop_back(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->pop_back();
    }

    static void array_insert(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            self(gen)->script_insert(gen->GetArgDWord(0), generic_arg(gen, 1).address);
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void array_erase(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->script_erase(gen->GetArgDWord(0));
    }

    static void array_clear(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->clear();
    }

    static void array_reverse(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->reverse();
    }
} // namespace detail

void register_script_array(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    using namespace detail;

    [[maybe_unused]] int r = 0;
    auto behaviour = [&](AS_NAMESPACE_QUALIFIER asEBehaviours beh, const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectBehaviour(
            "array<T>", beh, decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };
    auto method = [&](const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectMethod(
            "array<T>", decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };

    r = engine->RegisterObjectType(
        "array<class T>",
        0,
        AS_NAMESPACE_QUALIFIER asOBJ_REF | AS_NAMESPACE_QUALIFIER asOBJ_GC | AS_NAMESPACE_QUALIFIER asOBJ_TEMPLATE
    );
    assert(r >= 0);

    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_TEMPLATE_CALLBACK, "bool f(int&in, bool&out)", &array_template_callback);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_FACTORY, "array<T>@ f(int&in)", &array_factory);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_FACTORY, "array<T>@ f(int&in, uint length) explicit", &array_factory_n);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_FACTORY, "array<T>@ f(int&in, uint length, const T&in value)", &array_factory_n_value);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_LIST_FACTORY, "array<T>@ f(int&in, int&in) {repeat T}", &array_list_factory);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ADDREF, "void f()", &array_addref);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASE, "void f()", &array_release);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_GETREFCOUNT, "int f()", &array_get_refcount);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_SETGCFLAG, "void f()", &array_set_gc_flag);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_GETGCFLAG, "bool f()", &array_get_gc_flag);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ENUMREFS, "void f(int&in)", &array_enum_refs);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASEREFS, "void f(int&in)", &array_release_refs);

    method("array<T>& opAssign(const array<T>&in other)", &array_assign);
    method("T& opIndex(uint idx)", &array_at);
    method("const T& opIndex(uint idx) const", &array_at);
    method("uint get_size() const property", &array_size);
    method("bool empty() const", &array_empty);
    method("void push_back(const T&in value)", &array_push_back);
    method("void pop_back()", &array_pop_back);
    method("void insert(uint idx, const T&in value)", &array_insert);
    method("void erase(uint idx)", &array_erase);
    method("void clear()", &array_clear);
    method("void reverse()", &array_reverse);

    r = engine->RegisterDefaultArrayType("array<T>");
    assert(r >= 0);
}
} // namespace asbridge::ext
