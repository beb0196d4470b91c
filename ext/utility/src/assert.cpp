#include <asbridge/ext/assert.hpp>
#include <stdexcept>
#include <string>

namespace asbridge::ext
{
static std::string extract_string(AS_NAMESPACE_QUALIFIER asIStringFactory* factory, const void* str)
{
    assert(factory);

    AS_NAMESPACE_QUALIFIER asUINT sz = 0;
    if(factory->GetRawStringData(str, nullptr, &sz) < 0)
        throw std::runtime_error("failed to get raw string data");

    std::string result;
    result.resize(sz);
    if(factory->GetRawStringData(str, result.data(), nullptr) < 0)
        throw std::runtime_error("failed to get raw string data");

    return result;
}

namespace detail
{
    class script_assert_impl
    {
    public:
        std::function<assert_handler_type> callback;
        bool set_ex = true;
        AS_NAMESPACE_QUALIFIER asIStringFactory* str_factory = nullptr;

        static script_assert_impl& from_engine(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
        {
            auto* impl = static_cast<script_assert_impl*>(engine->GetUserData(ASBRIDGE_EXT_ASSERT_USER_ID));
            assert(impl);
            return *impl;
        }

        static void cleanup(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine)
        {
            delete static_cast<script_assert_impl*>(engine->GetUserData(ASBRIDGE_EXT_ASSERT_USER_ID));
        }

        static void assert_simple(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
        {
            bool pred = gen->GetArgByte(0) != 0;
            if(!pred)
                from_engine(gen->GetEngine()).on_failure("assertion failure");
        }

        static void assert_msg(AS_NAMESPACE_QUALIFIER asIScriptGeneric* gen)
        {
            bool pred = gen->GetArgByte(0) != 0;
            if(pred)
                return;

            auto& this_ = from_engine(gen->GetEngine());
            try
            {
                this_.on_failure(extract_string(this_.str_factory, gen->GetArgAddress(1)));
            }
            catch(...)
            {
                translate_exception(current_context());
            }
        }

    private:
        void on_failure(std::string_view msg)
        {
            if(set_ex)
            {
                if(auto* ctx = current_context())
                {
                    std::string buf(msg);
                    ctx->SetException(buf.c_str(), true);
                }
            }
            if(callback)
                callback(msg);
        }
    };
} // namespace detail

void register_script_assert(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
    std::function<assert_handler_type> callback,
    bool set_ex
)
{
    using detail::script_assert_impl;

    auto* impl = static_cast<script_assert_impl*>(engine->GetUserData(ASBRIDGE_EXT_ASSERT_USER_ID));
    if(!impl)
    {
        impl = new script_assert_impl();
        engine->SetUserData(impl, ASBRIDGE_EXT_ASSERT_USER_ID);
        engine->SetEngineUserDataCleanupCallback(&script_assert_impl::cleanup, ASBRIDGE_EXT_ASSERT_USER_ID);
    }
    impl->callback = std::move(callback);
    impl->set_ex = set_ex;

    global g(engine);
    g.function("void assert(bool pred)", &script_assert_impl::assert_simple);

    AS_NAMESPACE_QUALIFIER asIStringFactory* factory = nullptr;
    int string_t_id = engine->GetStringFactory(nullptr, &factory);
    if(string_t_id >= 0 && factory)
    {
        impl->str_factory = factory;
        g.function(
            string_concat("void assert(bool pred, const ", engine->GetTypeDeclaration(string_t_id, true), "&in msg)"),
            &script_assert_impl::assert_msg
        );
    }
}
} // namespace asbridge::ext
