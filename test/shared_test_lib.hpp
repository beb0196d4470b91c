#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <gtest/gtest.h>
#include <asbridge/asbridge.hpp>

namespace asbridge_test
{
template <typename T>
::testing::AssertionResult result_has_value(const asbridge::call_result<T>& r)
{
    if(r.has_value())
        return ::testing::AssertionSuccess();
    else
    {
        return ::testing::AssertionFailure()
               << '[' << asbridge::to_string(r.error().kind()) << "] "
               << r.error().what()
               << (r.error().where().empty() ? "" : " at ")
               << r.error().where();
    }
}

void setup_message_callback(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
    bool propagate_error_to_gtest = false
);

/**
 * @brief Record the sizes passed to the global memory functions of AngelScript while alive
 *
 * Only one recorder may be alive at a time.
 */
class allocation_recorder
{
public:
    allocation_recorder();
    ~allocation_recorder();

    allocation_recorder(const allocation_recorder&) = delete;
    allocation_recorder& operator=(const allocation_recorder&) = delete;

    /**
     * @brief Number of allocations of exactly `bytes`
     */
    [[nodiscard]]
    std::size_t count(std::size_t bytes) const;
};

/**
 * @brief Engine with every extension registered and a runtime bound to it
 */
class asbridge_test_suite : public ::testing::Test
{
public:
    void SetUp() override;

    void TearDown() override;

    AS_NAMESPACE_QUALIFIER asIScriptEngine* get_engine() const noexcept
    {
        return m_engine.get();
    }

    asbridge::runtime& get_runtime() const noexcept
    {
        return *m_rt;
    }

    /**
     * @brief Build a module from code
     *
     * @return Null if the build failed, which also fails the test
     */
    AS_NAMESPACE_QUALIFIER asIScriptModule* build_module(std::string_view section, std::string_view code);

    /**
     * @brief Run code as the body of a function through `runtime::execute`, then drain the event loop
     *
     * A script exception fails the test.
     */
    void run_string(std::string_view section, std::string_view code);

    /**
     * @brief Look up a function of the module built last
     */
    template <typename Signature>
    asbridge::script_callback<Signature> get_function(const char* decl)
    {
        AS_NAMESPACE_QUALIFIER asIScriptFunction* f = nullptr;
        if(m_module)
            f = m_module->GetFunctionByDecl(decl);
        EXPECT_TRUE(f != nullptr) << "Function not found: " << decl;
        return asbridge::script_callback<Signature>(f);
    }

protected:
    virtual void register_all();

    /**
     * @brief Registration that needs the runtime, e.g. functions returning promises
     */
    virtual void register_with_runtime(asbridge::runtime& rt);

    static void msg_callback(const AS_NAMESPACE_QUALIFIER asSMessageInfo* msg, void* param);

private:
    asbridge::script_engine m_engine;
    std::unique_ptr<asbridge::runtime> m_rt;
    AS_NAMESPACE_QUALIFIER asIScriptModule* m_module = nullptr;
};
} // namespace asbridge_test
