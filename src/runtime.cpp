#include <asbridge/runtime.hpp>
#include <cassert>
#include <iostream>
#include <asbridge/promise.hpp>

namespace asbridge
{
runtime::runtime(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine, runtime_options opts)
    : m_engine(engine),
      m_opts(std::move(opts)),
      m_loop(),
      m_scheduler(m_opts.worker_threads)
{
    assert(m_engine != nullptr);
    assert(!from_engine(m_engine) && "engine already has a runtime");

    m_engine->SetUserData(this, ASBRIDGE_RUNTIME_USER_ID);
}

runtime::~runtime()
{
    m_loop.run();
    m_scheduler.shutdown();
    // Tasks posted by the last scheduled work
    m_loop.run();

    for(auto& [type, a] : m_arenas)
        a->clear();

    m_engine->SetUserData(nullptr, ASBRIDGE_RUNTIME_USER_ID);
}

int runtime::execute(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx)
{
    assert(m_loop.in_host_thread());

    // Marks the context as one that may wait for promises
    struct driver_mark
    {
        AS_NAMESPACE_QUALIFIER asIScriptContext* ctx;
        void* prev;

        ~driver_mark()
        {
            ctx->SetUserData(prev, ASBRIDGE_RUNTIME_USER_ID);
        }
    } mark{ctx, ctx->SetUserData(this, ASBRIDGE_RUNTIME_USER_ID)};

    int r = ctx->Execute();
    while(r == AS_NAMESPACE_QUALIFIER asEXECUTION_SUSPENDED)
    {
        auto* target = static_cast<script_promise*>(
            ctx->GetUserData(ASBRIDGE_WAIT_TARGET_USER_ID)
        );
        // Suspended by someone else
        if(!target)
            break;
        ctx->SetUserData(nullptr, ASBRIDGE_WAIT_TARGET_USER_ID);

        bool settled = m_loop.run_until(
            [target]()
            { return !target->is_pending(); }
        );
        target->release();

        if(!settled)
        {
            report_error("waiting for a promise that can never be settled");
            ctx->Abort();
            return AS_NAMESPACE_QUALIFIER asEXECUTION_ABORTED;
        }

        r = ctx->Execute();
    }

    return r;
}

void runtime::run()
{
    m_loop.run();
}

void runtime::report_error(std::string_view msg)
{
    if(m_opts.on_error)
        m_opts.on_error(msg);
    else
        std::cerr << "asbridge: " << msg << std::endl;
}
} // namespace asbridge
