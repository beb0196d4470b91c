#include <asbridge/marshal.hpp>
#include <cmath>
#include <limits>
#include <utility>

namespace asbridge
{
std::optional<host_ref> find_object_property(host_ref obj, std::string_view name)
{
    void* ptr = obj.object();
    if(!ptr)
        return std::nullopt;

    int tid = obj.type_id & ~AS_NAMESPACE_QUALIFIER asTYPEID_HANDLETOCONST;
    if(!(tid & AS_NAMESPACE_QUALIFIER asTYPEID_SCRIPTOBJECT))
        return std::nullopt;

    auto* script_obj = static_cast<AS_NAMESPACE_QUALIFIER asIScriptObject*>(ptr);
    for(AS_NAMESPACE_QUALIFIER asUINT i = 0; i < script_obj->GetPropertyCount(); ++i)
    {
        const char* prop_name = script_obj->GetPropertyName(i);
        if(prop_name && name == prop_name)
            return host_ref{script_obj->GetAddressOfProperty(i), script_obj->GetPropertyTypeId(i)};
    }

    return std::nullopt;
}

host_ref generic_arg(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen, AS_NAMESPACE_QUALIFIER asUINT idx)
{
    AS_NAMESPACE_QUALIFIER asDWORD flags = 0;
    int tid = gen->GetArgTypeId(idx, &flags);
    void* slot = gen->GetAddressOfArg(idx);

    // References and objects passed by value occupy a pointer on the stack
    if(flags & AS_NAMESPACE_QUALIFIER asTM_INOUTREF)
        return {*static_cast<void**>(slot), tid};
    if(is_primitive_type(tid) || is_objhandle(tid))
        return {slot, tid};
    return {*static_cast<void**>(slot), tid};
}

void set_generic_return(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen, host_value& val)
{
    int ret_tid = gen->GetReturnTypeId();
    if(is_void_type(ret_tid))
        return;

    auto* engine = gen->GetEngine();
    if(!same_script_type(ret_tid, val.type_id()))
        throw marshal_error::type_mismatch(type_decl(engine, ret_tid), type_decl(engine, val.type_id()));

    if(is_primitive_type(ret_tid))
        copy_primitive_value(gen->GetAddressOfReturnLocation(), val.address(), ret_tid);
    else if(is_objhandle(ret_tid))
        gen->SetReturnObject(*static_cast<void**>(val.address()));
    else
        gen->SetReturnObject(val.address());
}

host_ref context_return(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx, AS_NAMESPACE_QUALIFIER asIScriptFunction* func)
{
    AS_NAMESPACE_QUALIFIER asDWORD flags = 0;
    int tid = func->GetReturnTypeId(&flags);
    if(is_void_type(tid))
        return {};

    void* addr = ctx->GetAddressOfReturnValue();
    if(flags & AS_NAMESPACE_QUALIFIER asTM_INOUTREF)
        addr = *static_cast<void**>(addr);
    return {addr, tid};
}

void set_context_arg(
    AS_NAMESPACE_QUALIFIER asIScriptContext* ctx,
    AS_NAMESPACE_QUALIFIER asIScriptFunction* func,
    AS_NAMESPACE_QUALIFIER asUINT idx,
    host_value& val
)
{
    int param_tid = 0;
    AS_NAMESPACE_QUALIFIER asDWORD flags = 0;
    func->GetParam(idx, &param_tid, &flags);

    auto* engine = ctx->GetEngine();

    // A handle can be passed to a parameter of the object type
    void* addr = val.address();
    const int val_tid = val.type_id();
    if(is_objhandle(val_tid) && !is_objhandle(param_tid) &&
       same_script_type(param_tid, val_tid & ~AS_NAMESPACE_QUALIFIER asTYPEID_OBJHANDLE))
    {
        addr = val.ref().object();
        if(!addr)
        {
            throw marshal_error(error_kind::type_mismatch, "cannot pass a null handle as an object")
                .at_index(idx);
        }
    }
    else if(!same_script_type(param_tid, val_tid))
    {
        throw marshal_error::type_mismatch(type_decl(engine, param_tid), type_decl(engine, val_tid))
            .at_index(idx);
    }

    int r = 0;
    if(flags & AS_NAMESPACE_QUALIFIER asTM_INOUTREF)
        r = ctx->SetArgAddress(idx, addr);
    else if(is_primitive_type(param_tid))
        copy_primitive_value(ctx->GetAddressOfArg(idx), addr, param_tid);
    else if(is_objhandle(param_tid))
        r = ctx->SetArgObject(idx, *static_cast<void**>(addr));
    else
        r = ctx->SetArgObject(idx, addr);

    if(r < 0)
    {
        throw marshal_error(
            error_kind::type_mismatch,
            string_concat("cannot pass argument ", std::to_string(idx), ": ", to_string(static_cast<AS_NAMESPACE_QUALIFIER asERetCodes>(r)))
        );
    }
}

namespace detail
{
    template <typename D, typename S>
    bool checked_number_cast(D& dst, S src) noexcept
    {
        if constexpr(std::integral<D> && std::integral<S>)
        {
            if(!std::in_range<D>(src))
                return false;
        }
        else if constexpr(std::integral<D>)
        {
            if(!std::isfinite(src))
                return false;

            // Both bounds are powers of two, which S represents exactly
            const S upper = std::ldexp(S(1), std::numeric_limits<D>::digits);
            const S lower = std::is_signed_v<D> ? -upper : S(0);
            const S t = std::trunc(src);
            if(t < lower || t >= upper)
                return false;
        }
        else if constexpr(std::floating_point<S> && sizeof(D) < sizeof(S))
        {
            if(std::isfinite(src) && std::abs(src) > std::numeric_limits<D>::max())
                return false;
        }

        dst = static_cast<D>(src);
        return true;
    }
} // namespace detail

bool assign_to(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
    void* dst,
    int dst_type_id,
    host_ref src
)
{
    if(!dst || is_void_type(src.type_id) || !src.address)
        return false;

    auto is_number = [](int tid)
    {
        return is_integral(tid) || is_floating_point(tid);
    };

    if(is_number(dst_type_id) && is_number(src.type_id))
    {
        return visit_primitive_type(
            [&]<typename D>(D* d) -> bool
            {
                return visit_primitive_type(
                    [d]<typename S>(const S* s) -> bool
                    {
                        if constexpr(std::same_as<D, bool> || std::same_as<S, bool>)
                            return false;
                        else
                            return detail::checked_number_cast(*d, *s);
                    },
                    src.type_id,
                    src.address
                );
            },
            dst_type_id,
            dst
        );
    }

    if(!same_script_type(dst_type_id, src.type_id))
        return false;

    if(is_primitive_type(dst_type_id))
    {
        copy_primitive_value(dst, src.address, dst_type_id);
        return true;
    }

    auto* ti = engine->GetTypeInfoById(dst_type_id);
    if(is_objhandle(dst_type_id))
    {
        void*& handle = *static_cast<void**>(dst);
        void* obj = src.object();
        if(obj)
            engine->AddRefScriptObject(obj, ti);
        if(handle)
            engine->ReleaseScriptObject(handle, ti);
        handle = obj;
        return true;
    }

    return engine->AssignScriptObject(dst, src.object(), ti) >= 0;
}
} // namespace asbridge
