#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <asbridge/asbridge.hpp>
#include <asbridge/concurrent/threading.hpp>
#include <asbridge/ext/stdstring.hpp>
#include <asbridge/ext/array.hpp>
#include <asbridge/ext/dictionary.hpp>
#include <asbridge/ext/buffer.hpp>
#include <asbridge/ext/vocabulary.hpp>
#include <asbridge/ext/assert.hpp>
#include <asbridge/ext/exec.hpp>
#include <asbridge/ext/demo.hpp>

static std::vector<std::string> script_args;

static void script_print(const std::string& str, bool newline)
{
    std::cout << str;
    if(newline)
        std::cout << std::endl;
}

static std::vector<std::string> get_script_args()
{
    return script_args;
}

static void message_callback(const asSMessageInfo* msg, void*)
{
    const char* level_str = "";
    switch(msg->type)
    {
    case asMSGTYPE_ERROR: level_str = "ERROR"; break;
    case asMSGTYPE_WARNING: level_str = "WARNING"; break;
    case asMSGTYPE_INFORMATION: level_str = "INFO"; break;
    }

    std::cerr
        << msg->section
        << '(' << msg->row << ':' << msg->col << "): "
        << level_str << ": "
        << msg->message
        << std::endl;
}

static void print_exception(asIScriptContext* ctx)
{
    const char* section = nullptr;
    int col = 0;
    int row = ctx->GetExceptionLineNumber(&col, &section);

    std::cerr
        << (section ? section : "<unknown>")
        << '(' << row << ':' << col << "): "
        << "Exception: "
        << ctx->GetExceptionString()
        << std::endl;
}

static std::size_t worker_threads_from_env()
{
    const char* env = std::getenv("ASRUN_THREADS");
    if(!env || *env == '\0')
        return asbridge::runtime_options{}.worker_threads;

    char* end = nullptr;
    unsigned long n = std::strtoul(env, &end, 10);
    if(*end != '\0' || n == 0)
    {
        std::cerr << "[asrun] ignoring invalid ASRUN_THREADS=" << env << std::endl;
        return asbridge::runtime_options{}.worker_threads;
    }
    return static_cast<std::size_t>(n);
}

static int run_entry(asbridge::runtime& rt, asIScriptModule* m)
{
    asIScriptFunction* entry_i = m->GetFunctionByDecl("int main()");
    asIScriptFunction* entry_v = m->GetFunctionByDecl("void main()");
    asIScriptFunction* entry = entry_i ? entry_i : entry_v;
    if(!entry)
    {
        std::cerr
            << "Cannot find a suitable entry point (either \"int main()\" or \"void main()\")"
            << std::endl;
        return EXIT_FAILURE;
    }

    asbridge::request_context ctx(rt.get_engine());
    int r = ctx->Prepare(entry);
    if(r < 0)
    {
        std::cerr << "Failed to prepare entry point: " << asbridge::to_string(static_cast<asERetCodes>(r)) << std::endl;
        return EXIT_FAILURE;
    }

    r = rt.execute(ctx);
    if(r != asEXECUTION_FINISHED)
    {
        std::cerr << "Script execution error: " << asbridge::to_string(static_cast<asEContextState>(r)) << std::endl;
        if(r == asEXECUTION_EXCEPTION)
            print_exception(ctx);
        return EXIT_FAILURE;
    }

    int ret_val = EXIT_SUCCESS;
    if(entry_i)
        ret_val = static_cast<int>(ctx->GetReturnDWord());

    // Promises created by the script may still be settling
    rt.run();

    return ret_val;
}

int main(int argc, char* argv[])
{
    if(argc <= 1)
    {
        std::cout
            << "USAGE\n"
            << "asrun [script] [args...]\n"
            << '\n'
            << "The asrun will use \"int main()\" or \"void main()\" in the script as entry point.\n"
            << "Arguments after the script are available through \"array<string>@ get_args()\".\n"
            << '\n'
            << "ENVIRONMENT\n"
            << "ASRUN_THREADS: worker threads for asynchronous functions (default "
            << asbridge::runtime_options{}.worker_threads << ")\n"
            << '\n'
            << "INFORMATION\n"
            << "ANGELSCRIPT_VERSION_STRING: " << ANGELSCRIPT_VERSION_STRING
            << '\n'
            << "asGetLibraryVersion: " << asGetLibraryVersion()
            << '\n'
            << "asGetLibraryOptions: " << asGetLibraryOptions()
            << '\n'
            << "asbridge::library_version: " << asbridge::library_version()
            << std::endl;
        return 0;
    }

    for(int i = 2; i < argc; ++i)
        script_args.emplace_back(argv[i]);

    asbridge::concurrent::prepare_multithread();

    asbridge::script_engine engine = asbridge::make_script_engine();

    asbridge::global g(engine);
    g
        .message_callback(&message_callback)
        .exception_translator();

    asbridge::ext::configure_engine_for_ext_string(engine);
    asbridge::ext::register_std_string(engine);
    asbridge::ext::register_string_utils(engine);
    asbridge::ext::register_script_array(engine);
    asbridge::ext::register_script_optional(engine);
    asbridge::ext::register_script_dictionary(engine);
    asbridge::ext::register_script_buffer(engine);
    asbridge::register_script_promise(engine);
    asbridge::ext::register_script_assert(
        engine,
        [](std::string_view msg)
        { std::cerr << "[asrun] assertion failure: " << msg << std::endl; }
    );
    g
        .function("void print(const string&in str, bool newline=true)", asbridge::fp<&script_print>)
        .function("array<string>@ get_args()", asbridge::fp<&get_script_args>);

    int ret_val = EXIT_SUCCESS;
    {
        asbridge::runtime_options opts;
        opts.worker_threads = worker_threads_from_env();
        asbridge::runtime rt(engine, std::move(opts));

        asbridge::ext::register_demo_module(rt);

        asIScriptModule* m = engine->GetModule("asrun", asGM_ALWAYS_CREATE);
        int r = asbridge::ext::load_file(m, argv[1]);
        if(r < 0)
        {
            std::cerr << "Failed to load script: " << asbridge::to_string(static_cast<asERetCodes>(r)) << std::endl;
            return EXIT_FAILURE;
        }
        r = m->Build();
        if(r < 0)
        {
            std::cerr << "Failed to build module: " << asbridge::to_string(static_cast<asERetCodes>(r)) << std::endl;
            return EXIT_FAILURE;
        }

        ret_val = run_entry(rt, m);
        m->Discard();
    }

    return ret_val;
}
