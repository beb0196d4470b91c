#include <shared_test_lib.hpp>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <asbridge/ext/stdstring.hpp>
#include <asbridge/ext/array.hpp>
#include <asbridge/ext/dictionary.hpp>
#include <asbridge/ext/buffer.hpp>
#include <asbridge/ext/vocabulary.hpp>
#include <asbridge/ext/assert.hpp>
#include <asbridge/ext/exec.hpp>
#include <asbridge/concurrent/threading.hpp>

namespace asbridge_test
{
static void print_message(const AS_NAMESPACE_QUALIFIER asSMessageInfo* msg)
{
    switch(msg->type)
    {
    case AS_NAMESPACE_QUALIFIER asMSGTYPE_ERROR:
        std::cerr << "ERROR: ";
        break;
    case AS_NAMESPACE_QUALIFIER asMSGTYPE_WARNING:
        std::cerr << "WARNING: ";
        break;
    case AS_NAMESPACE_QUALIFIER asMSGTYPE_INFORMATION:
        std::cerr << "INFO: ";
        break;
    }
    std::cerr << msg->message << std::endl;
}

void setup_message_callback(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
    bool propagate_error_to_gtest
)
{
    if(propagate_error_to_gtest)
    {
        asbridge::global(engine)
            .message_callback(
                +[](const AS_NAMESPACE_QUALIFIER asSMessageInfo* msg, void*)
                {
                    if(msg->type == AS_NAMESPACE_QUALIFIER asMSGTYPE_ERROR)
                        ADD_FAILURE() << "ERROR: " << msg->message;
                    else
                        print_message(msg);
                }
            );
    }
    else
    {
        asbridge::global(engine)
            .message_callback(
                +[](const AS_NAMESPACE_QUALIFIER asSMessageInfo* msg, void*)
                { print_message(msg); }
            );
    }
}

namespace
{
    std::mutex g_alloc_mx;
    std::map<std::size_t, std::size_t> g_alloc_sizes;

    void* recording_alloc(std::size_t bytes)
    {
        {
            std::lock_guard lock(g_alloc_mx);
            ++g_alloc_sizes[bytes];
        }
        return std::malloc(bytes);
    }

    // Blocks from the default functions may be freed here, which also use malloc
    void recording_free(void* p)
    {
        std::free(p);
    }
} // namespace

allocation_recorder::allocation_recorder()
{
    {
        std::lock_guard lock(g_alloc_mx);
        g_alloc_sizes.clear();
    }
    AS_NAMESPACE_QUALIFIER asSetGlobalMemoryFunctions(&recording_alloc, &recording_free);
}

allocation_recorder::~allocation_recorder()
{
    AS_NAMESPACE_QUALIFIER asResetGlobalMemoryFunctions();
}

std::size_t allocation_recorder::count(std::size_t bytes) const
{
    std::lock_guard lock(g_alloc_mx);
    auto it = g_alloc_sizes.find(bytes);
    return it == g_alloc_sizes.end() ? 0 : it->second;
}

void asbridge_test_suite::msg_callback(const AS_NAMESPACE_QUALIFIER asSMessageInfo* msg, void*)
{
    if(msg->type == AS_NAMESPACE_QUALIFIER asMSGTYPE_ERROR)
    {
        ADD_FAILURE()
            << msg->section
            << "(" << msg->row << ':' << msg->col << "): "
            << msg->message;
    }
    else if(msg->type == AS_NAMESPACE_QUALIFIER asMSGTYPE_WARNING)
    {
        std::cerr
            << msg->section
            << "(" << msg->row << ':' << msg->col << "): "
            << msg->message
            << std::endl;
    }
}

static void assert_callback(std::string_view sv)
{
    AS_NAMESPACE_QUALIFIER asIScriptContext* ctx = AS_NAMESPACE_QUALIFIER asGetActiveContext();

    const char* section = "";
    int line = ctx ? ctx->GetLineNumber(0, nullptr, &section) : 0;

    GTEST_FAIL_AT(section ? section : "", line)
        << "Script assert() failed: " << sv;
}

static void test_print(const std::string& msg)
{
    std::cerr << msg << std::endl;
}

void asbridge_test_suite::SetUp()
{
    // The runtime starts worker threads
    asbridge::concurrent::prepare_multithread();

    m_engine = asbridge::make_script_engine();
    asbridge::global(m_engine)
        .message_callback(&asbridge_test_suite::msg_callback, this)
        .exception_translator();

    register_all();

    m_rt = std::make_unique<asbridge::runtime>(
        m_engine.get(),
        asbridge::runtime_options{
            .worker_threads = 2,
            .on_error = [](std::string_view msg)
            { ADD_FAILURE() << "Runtime error: " << msg; }
        }
    );
    register_with_runtime(*m_rt);
}

void asbridge_test_suite::TearDown()
{
    if(m_module)
    {
        m_module->Discard();
        m_module = nullptr;
    }
    m_rt.reset();
    m_engine.reset();
}

AS_NAMESPACE_QUALIFIER asIScriptModule* asbridge_test_suite::build_module(
    std::string_view section, std::string_view code
)
{
    std::string section_name(section);
    m_module = m_engine->GetModule(section_name.c_str(), AS_NAMESPACE_QUALIFIER asGM_ALWAYS_CREATE);

    int r = asbridge::ext::load_string(m_module, section_name.c_str(), code);
    if(r < 0)
    {
        ADD_FAILURE() << "Failed to load section \"" << section << "\", r = " << r;
        return nullptr;
    }
    r = m_module->Build();
    if(r < 0)
    {
        ADD_FAILURE() << "Failed to build section \"" << section << "\", r = " << r;
        return nullptr;
    }

    return m_module;
}

void asbridge_test_suite::run_string(std::string_view section, std::string_view code)
{
    std::string section_name(section);
    std::string func_code = asbridge::string_concat("void run_string(){\n", code, "\n;}");

    // Code can refer to the globals of the module built last
    auto* m = m_module ?
                  m_module :
                  m_engine->GetModule("run_string", AS_NAMESPACE_QUALIFIER asGM_ALWAYS_CREATE);
    AS_NAMESPACE_QUALIFIER asIScriptFunction* f = nullptr;
    int r = m->CompileFunction(section_name.c_str(), func_code.c_str(), -1, 0, &f);
    ASSERT_GE(r, 0) << "Failed to compile section \"" << section << '\"';
    ASSERT_TRUE(f != nullptr);

    asbridge::request_context ctx(m_engine);
    r = ctx->Prepare(f);
    if(r < 0)
    {
        f->Release();
        FAIL() << "Failed to prepare: " << asbridge::to_string(static_cast<AS_NAMESPACE_QUALIFIER asERetCodes>(r));
    }
    r = m_rt->execute(ctx);
    if(r == AS_NAMESPACE_QUALIFIER asEXECUTION_EXCEPTION)
    {
        int column = 0;
        const char* ex_section = "";
        int line = ctx->GetExceptionLineNumber(&column, &ex_section);
        ADD_FAILURE()
            << "Script exception at " << ex_section << " (" << line << ':' << column << "): "
            << ctx->GetExceptionString();
    }
    else
    {
        EXPECT_EQ(r, AS_NAMESPACE_QUALIFIER asEXECUTION_FINISHED)
            << asbridge::to_string(static_cast<AS_NAMESPACE_QUALIFIER asEContextState>(r));
    }
    f->Release();

    m_rt->run();
}

void asbridge_test_suite::register_all()
{
    using namespace asbridge;

    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine = m_engine.get();

    ext::configure_engine_for_ext_string(engine);
    ext::register_std_string(engine);
    ext::register_string_utils(engine);
    ext::register_script_array(engine);
    ext::register_script_optional(engine);
    ext::register_script_dictionary(engine);
    ext::register_script_buffer(engine);
    register_script_promise(engine);
    ext::register_script_assert(
        engine,
        &assert_callback,
        false // The failure is reported by GTEST_FAIL_AT() in the callback
    );

    global(engine)
        .function("void print(const string&in msg)", fp<&test_print>);
}

void asbridge_test_suite::register_with_runtime(asbridge::runtime&) {}
} // namespace asbridge_test
