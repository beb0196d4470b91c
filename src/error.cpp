#include <asbridge/error.hpp>

namespace asbridge
{
std::string_view to_string(error_kind kind) noexcept
{
    switch(kind)
    {
    case error_kind::type_mismatch:
        return "type_mismatch";
    case error_kind::invalid_encoding:
        return "invalid_encoding";
    case error_kind::missing_field:
        return "missing_field";
    case error_kind::host_threw:
        return "host_threw";
    case error_kind::bad_return_type:
        return "bad_return_type";
    case error_kind::invalid_argument:
        return "invalid_argument";
    case error_kind::out_of_range:
        return "out_of_range";
    case error_kind::invalid_handle:
        return "invalid_handle";
    case error_kind::generic:
        break;
    }

    return "generic";
}

marshal_error::marshal_error(error_kind kind, const std::string& msg)
    : bridge_error(kind, msg) {}

marshal_error::marshal_error(
    error_kind kind, const std::string& msg, std::string field, std::optional<std::size_t> idx
)
    : bridge_error(kind, msg), m_field(std::move(field)), m_index(idx) {}

marshal_error marshal_error::type_mismatch(std::string_view expected, std::string_view got)
{
    return marshal_error(
        error_kind::type_mismatch,
        string_concat("type mismatch: expected ", expected, ", got ", got)
    );
}

marshal_error marshal_error::invalid_encoding()
{
    return marshal_error(error_kind::invalid_encoding, "invalid UTF-8 string");
}

marshal_error marshal_error::missing_field(std::string_view name)
{
    return marshal_error(
        error_kind::missing_field,
        string_concat("missing field \"", name, '"'),
        std::string(name),
        std::nullopt
    );
}

marshal_error marshal_error::at_index(std::size_t idx) const
{
    return marshal_error(
        kind(),
        string_concat(what(), " (at index ", std::to_string(idx), ')'),
        m_field,
        idx
    );
}

marshal_error marshal_error::in_field(std::string_view name) const
{
    return marshal_error(
        kind(),
        string_concat(what(), " (in field \"", name, "\")"),
        std::string(name),
        m_index
    );
}

error_value error_value::from_exception(std::exception_ptr ex)
{
    try
    {
        std::rethrow_exception(ex);
    }
    catch(const bridge_error& e)
    {
        return {e.kind(), e.what()};
    }
    catch(const std::exception& e)
    {
        return {error_kind::generic, e.what()};
    }
    catch(...)
    {
        return {error_kind::generic, "unknown exception"};
    }
}

void to_host_error(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx, const std::exception& e)
{
    if(!ctx)
        ctx = current_context();
    if(ctx)
        ctx->SetException(e.what());
}

void to_host_error(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx, const error_value& err)
{
    if(!ctx)
        ctx = current_context();
    if(ctx)
        ctx->SetException(err.message.c_str());
}

call_error from_host_exception(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx)
{
    assert(ctx != nullptr);

    const char* msg = ctx->GetExceptionString();

    std::string where;
    const char* section = nullptr;
    int column = 0;
    int line = ctx->GetExceptionLineNumber(&column, &section);
    if(section && line > 0)
    {
        where = string_concat(
            section, '(', std::to_string(line), ':', std::to_string(column), ')'
        );
    }

    return call_error::host_threw(msg ? msg : "script exception", std::move(where));
}

void translate_exception(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx)
{
    try
    {
        throw;
    }
    catch(const std::exception& e)
    {
        to_host_error(ctx, e);
    }
    catch(...)
    {
        if(!ctx)
            ctx = current_context();
        if(ctx)
            ctx->SetException("unknown exception");
    }
}

static void exception_translator_callback(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx, void*)
{
    translate_exception(ctx);
}

int set_exception_translator(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
{
    return engine->SetTranslateAppExceptionCallback(
        AS_NAMESPACE_QUALIFIER asFUNCTION(exception_translator_callback),
        nullptr,
        AS_NAMESPACE_QUALIFIER asCALL_CDECL
    );
}
} // namespace asbridge
