#include <asbridge/ext/dictionary.hpp>
#include <asbridge/ext/array.hpp>

namespace asbridge::ext
{
void* script_dictionary::operator new(std::size_t bytes)
{
    return AS_NAMESPACE_QUALIFIER asAllocMem(bytes);
}

void script_dictionary::operator delete(void* p)
{
    AS_NAMESPACE_QUALIFIER asFreeMem(p);
}

script_dictionary* script_dictionary::create(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    auto* ti = engine->GetTypeInfoByName("dictionary");
    if(!ti)
        throw bridge_error(error_kind::type_mismatch, "script type \"dictionary\" is not registered");

    auto* dict = new script_dictionary(ti);
    engine->NotifyGarbageCollectorOfNewObject(dict, ti);
    return dict;
}

script_dictionary::script_dictionary(AS_NAMESPACE_QUALIFIER asITypeInfo* ti)
    : m_ti(ti)
{
    m_ti->AddRef();
}

script_dictionary::~script_dictionary()
{
    clear();
    m_ti->Release();
}

void script_dictionary::enum_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    for(const auto& [k, v] : m_data)
        v.enum_refs(engine);
}

void script_dictionary::release_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine*)
{
    clear();
}

void script_dictionary::set(std::string_view key, host_value&& val)
{
    auto it = m_data.find(key);
    if(it != m_data.end())
        it->second = std::move(val);
    else
        m_data.emplace(std::string(key), std::move(val));
}

const host_value* script_dictionary::find(std::string_view key) const
{
    auto it = m_data.find(key);
    if(it == m_data.end())
        return nullptr;
    return &it->second;
}

bool script_dictionary::erase(std::string_view key)
{
    auto it = m_data.find(key);
    if(it == m_data.end())
        return false;
    m_data.erase(it);
    return true;
}

std::vector<std::string> script_dictionary::keys() const
{
    std::vector<std::string> result;
    result.reserve(m_data.size());
    for(const auto& [k, v] : m_data)
        result.push_back(k);
    return result;
}

bool script_dictionary::get_to(std::string_view key, void* dst, int dst_type_id) const
{
    const host_value* val = find(key);
    if(!val)
        return false;
    return assign_to(get_engine(), dst, dst_type_id, val->ref());
}

int dictionary_handle_type_id(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    int tid = engine->GetTypeIdByDecl("dictionary@");
    if(tid < 0)
        throw marshal_error(error_kind::type_mismatch, "script type \"dictionary\" is not registered");
    return tid;
}

const script_dictionary* as_script_dictionary(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
{
    if(is_primitive_type(ref.type_id) || is_void_type(ref.type_id))
        return nullptr;

    auto* ti = engine->GetTypeInfoById(ref.type_id);
    if(!ti || ti != engine->GetTypeInfoByName("dictionary"))
        return nullptr;

    return static_cast<const script_dictionary*>(ref.object());
}

namespace detail
{
    static script_dictionary* self(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return static_cast<script_dictionary*>(gen->GetObject());
    }

    static const std::string& key_arg(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return *static_cast<const std::string*>(gen->GetArgAddress(0));
    }

    static void dictionary_factory(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            gen->SetReturnAddress(script_dictionary::create(gen->GetEngine()));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void dictionary_addref(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->addref();
    }

    static void dictionary_release(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->release();
    }

    static void dictionary_get_refcount(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnDWord(static_cast<AS_NAMESPACE_QUALIFIER asDWORD>(self(gen)->get_refcount()));
    }

    static void dictionary_set_gc_flag(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->set_gc_flag();
    }

    static void dictionary_get_gc_flag(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(self(gen)->get_gc_flag());
    }

    static void dictionary_enum_refs(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->enum_refs(*static_cast<AS_NAMESPACE_QUALIFIER asIScriptEngine**>(gen->GetAddressOfArg(0)));
    }

    static void dictionary_release_refs(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->release_refs(*static_cast<AS_NAMESPACE_QUALIFIER asIScriptEngine**>(gen->GetAddressOfArg(0)));
    }

    static void dictionary_set(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            host_ref val = generic_arg(gen, 1);
            self(gen)->set(key_arg(gen), host_value::copy_of(gen->GetEngine(), val));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void dictionary_get(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        void* dst = gen->GetArgAddress(1);
        int dst_tid = gen->GetArgTypeId(1);
        gen->SetReturnByte(self(gen)->get_to(key_arg(gen), dst, dst_tid));
    }

    static void dictionary_exists(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(self(gen)->contains(key_arg(gen)));
    }

    static void dictionary_erase(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(self(gen)->erase(key_arg(gen)));
    }

    static void dictionary_size(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnDWord(static_cast<AS_NAMESPACE_QUALIFIER asDWORD>(self(gen)->size()));
    }

    static void dictionary_empty(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(self(gen)->size() == 0);
    }

    static void dictionary_clear(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        self(gen)->clear();
    }

    static void dictionary_get_keys(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            host_value keys = to_host(gen->GetEngine(), self(gen)->keys());
            set_generic_return(gen, keys);
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }
} // namespace detail

void register_script_dictionary(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    using namespace detail;

    [[maybe_unused]] int r = 0;
    auto behaviour = [&](AS_NAMESPACE_QUALIFIER asEBehaviours beh, const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectBehaviour(
            "dictionary", beh, decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };
    auto method = [&](const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectMethod(
            "dictionary", decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };

    r = engine->RegisterObjectType(
        "dictionary", 0, AS_NAMESPACE_QUALIFIER asOBJ_REF | AS_NAMESPACE_QUALIFIER asOBJ_GC
    );
    assert(r >= 0);

    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_FACTORY, "dictionary@ f()", &dictionary_factory);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ADDREF, "void f()", &dictionary_addref);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASE, "void f()", &dictionary_release);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_GETREFCOUNT, "int f()", &dictionary_get_refcount);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_SETGCFLAG, "void f()", &dictionary_set_gc_flag);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_GETGCFLAG, "bool f()", &dictionary_get_gc_flag);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ENUMREFS, "void f(int&in)", &dictionary_enum_refs);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASEREFS, "void f(int&in)", &dictionary_release_refs);

    method("void set(const string&in key, const ?&in value)", &dictionary_set);
    method("bool get(const string&in key, ?&out value) const", &dictionary_get);
    method("bool exists(const string&in key) const", &dictionary_exists);
    method("bool erase(const string&in key)", &dictionary_erase);
    method("uint get_size() const property", &dictionary_size);
    method("bool empty() const", &dictionary_empty);
    method("void clear()", &dictionary_clear);
    method("array<string>@ get_keys() const", &dictionary_get_keys);
}
} // namespace asbridge::ext
