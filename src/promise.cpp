#include <asbridge/promise.hpp>
#include <asbridge/memory.hpp>

namespace asbridge
{
void* script_promise::operator new(std::size_t bytes)
{
    return AS_NAMESPACE_QUALIFIER asAllocMem(bytes);
}

void script_promise::operator delete(void* p)
{
    AS_NAMESPACE_QUALIFIER asFreeMem(p);
}

script_promise* script_promise::create(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, int value_type_id)
{
    std::string decl = string_concat("promise<", type_decl(engine, value_type_id), '>');
    AS_NAMESPACE_QUALIFIER asITypeInfo* ti = engine->GetTypeInfoByDecl(decl.c_str());
    if(!ti)
        throw bridge_error(error_kind::generic, string_concat("script type \"", decl, "\" is not available"));

    auto* p = new script_promise(ti);
    if(ti->GetFlags() & AS_NAMESPACE_QUALIFIER asOBJ_GC)
        engine->NotifyGarbageCollectorOfNewObject(p, ti);
    return p;
}

script_promise::script_promise(AS_NAMESPACE_QUALIFIER asITypeInfo* ti)
    : m_ti(ti)
{
    m_ti->AddRef();
}

script_promise::~script_promise()
{
    // The engine owning the type info is still alive because the type info is referenced
    release_refs(m_ti->GetEngine());
    m_ti->Release();
}

void script_promise::addref() noexcept
{
    m_gc_flag = false;
    ++m_refcount;
}

void script_promise::release() noexcept
{
    m_gc_flag = false;
    if(m_refcount.dec() == 0)
        delete this;
}

void script_promise::enum_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    m_value.enum_refs(engine);
    for(const callback_pair& cb : m_callbacks)
    {
        if(cb.on_resolved)
            engine->GCEnumCallback(cb.on_resolved);
        if(cb.on_rejected)
            engine->GCEnumCallback(cb.on_rejected);
    }
}

void script_promise::release_refs(AS_NAMESPACE_QUALIFIER asIScriptEngine*)
{
    m_value.reset();
    for(const callback_pair& cb : m_callbacks)
    {
        if(cb.on_resolved)
            cb.on_resolved->Release();
        if(cb.on_rejected)
            cb.on_rejected->Release();
    }
    m_callbacks.clear();
}

void script_promise::resolve(host_value&& val)
{
    assert(is_pending());

    if(!same_script_type(val.type_id(), value_type_id()))
    {
        reject(error_value{
            error_kind::type_mismatch,
            marshal_error::type_mismatch(
                type_decl(get_engine(), value_type_id()), type_decl(get_engine(), val.type_id())
            )
                .what()
        });
        return;
    }

    m_value = std::move(val);
    m_state = state_type::resolved;
    schedule_callbacks();
}

void script_promise::reject(error_value err)
{
    assert(is_pending());

    m_reason = std::move(err);
    m_state = state_type::rejected;
    schedule_callbacks();
}

void script_promise::schedule_callbacks()
{
    if(m_callbacks.empty())
        return;

    runtime* rt = runtime::from_engine(get_engine());
    assert(rt);

    for(const callback_pair& cb : m_callbacks)
    {
        addref();
        rt->loop().post(
            [this, cb]()
            {
                run_callback(cb);
                if(cb.on_resolved)
                    cb.on_resolved->Release();
                if(cb.on_rejected)
                    cb.on_rejected->Release();
                release();
            }
        );
    }
    // References of the callbacks now belong to the posted tasks
    m_callbacks.clear();
}

void script_promise::run_callback(const callback_pair& cb)
{
    AS_NAMESPACE_QUALIFIER asIScriptFunction* fn = is_resolved() ? cb.on_resolved : cb.on_rejected;
    if(!fn)
        return;

    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine = get_engine();
    runtime* rt = runtime::from_engine(engine);

    try
    {
        std::optional<string_constant> reason_str;
        reuse_active_context ctx(engine);
        int r = ctx->Prepare(fn);
        if(r < 0)
        {
            rt->report_error(string_concat(
                "cannot prepare promise callback: ",
                to_string(static_cast<AS_NAMESPACE_QUALIFIER asERetCodes>(r))
            ));
            return;
        }

        if(is_resolved())
            set_context_arg(ctx, fn, 0, m_value);
        else
        {
            reason_str.emplace(engine, m_reason.message);
            ctx->SetArgAddress(0, const_cast<void*>(reason_str->get()));
        }

        r = ctx.is_nested() ? ctx->Execute() : rt->execute(ctx);
        if(r == AS_NAMESPACE_QUALIFIER asEXECUTION_EXCEPTION)
        {
            call_error err = from_host_exception(ctx);
            rt->report_error(string_concat(
                "exception in promise callback: ", err.what(), " at ", err.where()
            ));
        }
        else if(r != AS_NAMESPACE_QUALIFIER asEXECUTION_FINISHED)
        {
            rt->report_error(string_concat(
                "promise callback ended as ",
                to_string(static_cast<AS_NAMESPACE_QUALIFIER asEContextState>(r))
            ));
        }
    }
    catch(const std::exception& e)
    {
        rt->report_error(string_concat("failed to run promise callback: ", e.what()));
    }
}

const void* script_promise::script_value() const
{
    switch(m_state)
    {
    case state_type::resolved:
        return m_value.address();

    case state_type::rejected:
        set_script_exception(m_reason.message);
        return nullptr;

    default:
        set_script_exception("promise is pending");
        return nullptr;
    }
}

std::string script_promise::script_reason() const
{
    return is_rejected() ? m_reason.message : std::string();
}

void script_promise::then(
    AS_NAMESPACE_QUALIFIER asIScriptFunction* on_resolved,
    AS_NAMESPACE_QUALIFIER asIScriptFunction* on_rejected
)
{
    if(!runtime::from_engine(get_engine()))
    {
        set_script_exception("no runtime is bound to the engine");
        return;
    }

    if(on_resolved)
        on_resolved->AddRef();
    if(on_rejected)
        on_rejected->AddRef();
    m_callbacks.push_back({on_resolved, on_rejected});

    if(!is_pending())
        schedule_callbacks();
}

void script_promise::wait()
{
    if(!is_pending())
        return;

    AS_NAMESPACE_QUALIFIER asIScriptContext* ctx = current_context();
    runtime* rt = runtime::from_engine(get_engine());
    // Only runtime::execute can resume the context
    if(!ctx || !rt || !rt->loop().in_host_thread() || ctx->IsNested() ||
       ctx->GetUserData(ASBRIDGE_RUNTIME_USER_ID) != rt)
    {
        set_script_exception("cannot wait for a pending promise in this context");
        return;
    }

    addref();
    ctx->SetUserData(this, ASBRIDGE_WAIT_TARGET_USER_ID);
    ctx->Suspend();
}

promise_handle converter<promise_handle>::to_native(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, host_ref ref)
{
    auto* ti = engine->GetTypeInfoById(ref.type_id);
    if(!is_objhandle(ref.type_id) || !ti || std::string_view(ti->GetName()) != "promise")
        throw marshal_error::type_mismatch("promise<T>@", type_decl(engine, ref.type_id));

    auto* p = static_cast<script_promise*>(ref.object());
    if(p)
        p->addref();
    return promise_handle(p);
}

host_value converter<promise_handle>::to_host(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, const promise_handle& p)
{
    if(!p)
        throw marshal_error(error_kind::type_mismatch, "cannot pass a null promise");

    p->addref();
    return host_value::adopt_handle(
        engine, p->get_type_info()->GetTypeId() | AS_NAMESPACE_QUALIFIER asTYPEID_OBJHANDLE, p.get()
    );
}

namespace detail
{
    static script_promise* promise_self(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        return static_cast<script_promise*>(gen->GetObject());
    }

    static void promise_template_callback(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        auto* ti = *static_cast<AS_NAMESPACE_QUALIFIER asITypeInfo**>(gen->GetAddressOfArg(0));
        bool& no_gc = **static_cast<bool**>(gen->GetAddressOfArg(1));

        int subtype_id = ti->GetSubTypeId();
        bool ok = true;
        if(is_void_type(subtype_id))
            ok = false;
        else if(is_primitive_type(subtype_id))
            no_gc = true;
        else
        {
            // Values are stored by copy
            auto* sub = ti->GetSubType();
            if(!is_objhandle(subtype_id) && (sub->GetFlags() & AS_NAMESPACE_QUALIFIER asOBJ_REF))
                ok = false;
            // Callbacks may capture the promise through delegates
            no_gc = false;
        }

        *static_cast<bool*>(gen->GetAddressOfReturnLocation()) = ok;
    }

    static void promise_addref(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        promise_self(gen)->addref();
    }

    static void promise_release(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        promise_self(gen)->release();
    }

    static void promise_get_refcount(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnDWord(static_cast<AS_NAMESPACE_QUALIFIER asDWORD>(promise_self(gen)->get_refcount()));
    }

    static void promise_set_gc_flag(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        promise_self(gen)->set_gc_flag();
    }

    static void promise_get_gc_flag(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(promise_self(gen)->get_gc_flag());
    }

    static void promise_enum_refs(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        promise_self(gen)->enum_refs(*static_cast<AS_NAMESPACE_QUALIFIER asIScriptEngine**>(gen->GetAddressOfArg(0)));
    }

    static void promise_release_refs(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        promise_self(gen)->release_refs(*static_cast<AS_NAMESPACE_QUALIFIER asIScriptEngine**>(gen->GetAddressOfArg(0)));
    }

    static void promise_is_pending(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(promise_self(gen)->is_pending());
    }

    static void promise_is_resolved(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(promise_self(gen)->is_resolved());
    }

    static void promise_is_rejected(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnByte(promise_self(gen)->is_rejected());
    }

    static void promise_value(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        gen->SetReturnAddress(const_cast<void*>(promise_self(gen)->script_value()));
    }

    static void promise_reason(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        try
        {
            string_constant str(gen->GetEngine(), promise_self(gen)->script_reason());
            gen->SetReturnObject(const_cast<void*>(str.get()));
        }
        catch(...)
        {
            translate_exception(current_context());
        }
    }

    static void promise_then(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        promise_self(gen)->then(
            static_cast<AS_NAMESPACE_QUALIFIER asIScriptFunction*>(gen->GetArgAddress(0)),
            static_cast<AS_NAMESPACE_QUALIFIER asIScriptFunction*>(gen->GetArgAddress(1))
        );
    }

    static void promise_wait(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
    {
        promise_self(gen)->wait();
    }
} // namespace detail

void register_script_promise(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    using namespace detail;

    [[maybe_unused]] int r = 0;
    auto behaviour = [&](AS_NAMESPACE_QUALIFIER asEBehaviours beh, const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectBehaviour(
            "promise<T>", beh, decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };
    auto method = [&](const char* decl, AS_NAMESPACE_QUALIFIER asGENFUNC_t fn)
    {
        r = engine->RegisterObjectMethod(
            "promise<T>", decl, AS_NAMESPACE_QUALIFIER asFUNCTION(fn), AS_NAMESPACE_QUALIFIER asCALL_GENERIC
        );
        assert(r >= 0);
    };

    r = engine->RegisterObjectType(
        "promise<class T>",
        0,
        AS_NAMESPACE_QUALIFIER asOBJ_REF | AS_NAMESPACE_QUALIFIER asOBJ_GC | AS_NAMESPACE_QUALIFIER asOBJ_TEMPLATE
    );
    assert(r >= 0);

    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_TEMPLATE_CALLBACK, "bool f(int&in, bool&out)", &promise_template_callback);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ADDREF, "void f()", &promise_addref);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASE, "void f()", &promise_release);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_GETREFCOUNT, "int f()", &promise_get_refcount);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_SETGCFLAG, "void f()", &promise_set_gc_flag);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_GETGCFLAG, "bool f()", &promise_get_gc_flag);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_ENUMREFS, "void f(int&in)", &promise_enum_refs);
    behaviour(AS_NAMESPACE_QUALIFIER asBEHAVE_RELEASEREFS, "void f(int&in)", &promise_release_refs);

    r = engine->RegisterFuncdef("void promise<T>::resolve_callback(const T&in)");
    assert(r >= 0);
    r = engine->RegisterFuncdef("void promise<T>::reject_callback(const string&in)");
    assert(r >= 0);

    method("bool get_is_pending() const property", &promise_is_pending);
    method("bool get_is_resolved() const property", &promise_is_resolved);
    method("bool get_is_rejected() const property", &promise_is_rejected);
    method("const T& get_value() const property", &promise_value);
    method("string get_reason() const property", &promise_reason);
    method("void then(resolve_callback@ on_resolved, reject_callback@ on_rejected = null)", &promise_then);
    method("void wait()", &promise_wait);
}
} // namespace asbridge
