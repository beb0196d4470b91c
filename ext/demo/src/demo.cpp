#include <asbridge/ext/demo.hpp>
#include <chrono>
#include <limits>
#include <memory>
#include <asbridge/ext/stdstring.hpp>
#include <asbridge/ext/array.hpp>
#include <asbridge/ext/dictionary.hpp>
#include <asbridge/ext/vocabulary.hpp>

namespace asbridge::ext
{
static int wrapping_add(int a, int b) noexcept
{
    return static_cast<int>(static_cast<std::uint32_t>(a) + static_cast<std::uint32_t>(b));
}

void counter::increment() noexcept
{
    m_value = wrapping_add(m_value, 1);
}

void counter::decrement() noexcept
{
    m_value = wrapping_add(m_value, -1);
}

void counter::add(int n) noexcept
{
    m_value = wrapping_add(m_value, n);
}

namespace demo
{
    int add(int a, int b) noexcept
    {
        return wrapping_add(a, b);
    }

    std::string greet(const std::string& name)
    {
        return string_concat("Hello, ", name, '!');
    }

    int get_magic_number() noexcept
    {
        return 42;
    }

    person create_person(const std::string& name, std::uint32_t age)
    {
        return person{name, age};
    }

    std::string describe_person(const person& p)
    {
        return string_concat(p.name, " is ", std::to_string(p.age), " years old");
    }

    int call_with_value(const script_callback<int(int)>& cb, int value)
    {
        return cb(value);
    }

    int map_and_sum(const std::vector<int>& numbers, const script_callback<int(int)>& cb)
    {
        int sum = 0;
        for(int n : numbers)
            sum = wrapping_add(sum, cb(n));
        return sum;
    }

    std::vector<int> double_array(const std::vector<int>& numbers)
    {
        std::vector<int> result;
        result.reserve(numbers.size());
        for(int n : numbers)
            result.push_back(wrapping_add(n, n));
        return result;
    }

    std::uint32_t array_length(const std::vector<int>& arr) noexcept
    {
        return static_cast<std::uint32_t>(arr.size());
    }

    int divide(int a, int b)
    {
        if(b == 0)
            throw domain_error("Division by zero");
        if(a == std::numeric_limits<int>::min() && b == -1)
            throw domain_error("Division overflow");
        return a / b;
    }

    std::optional<int> maybe_double(int n) noexcept
    {
        if(n < 0)
            return std::nullopt;
        return wrapping_add(n, n);
    }

    std::string greet_optional(const std::optional<std::string>& name)
    {
        if(!name)
            return "Hello, stranger!";
        return greet(*name);
    }

    static std::string greet_stranger()
    {
        return greet_optional(std::nullopt);
    }

    promise_handle async_add(runtime& rt, int a, int b)
    {
        return spawn<int>(
            rt,
            [a, b]()
            { return add(a, b); }
        );
    }

    promise_handle delayed_value(runtime& rt, int value, std::uint32_t ms)
    {
        return spawn_continuation<int>(
            rt,
            [&rt, value, ms](completion<int> done)
            {
                // Timer tasks must be copyable
                auto shared_done = std::make_shared<completion<int>>(std::move(done));
                rt.scheduler().post_after(
                    std::chrono::milliseconds(ms),
                    [shared_done, value]()
                    { std::move(*shared_done).resolve(value); }
                );
            }
        );
    }

    promise_handle async_divide(runtime& rt, int a, int b)
    {
        return spawn<int>(
            rt,
            [a, b]()
            { return divide(a, b); }
        );
    }

    promise_handle async_sum(runtime& rt, const std::vector<int>& numbers)
    {
        return spawn<int>(
            rt,
            [numbers]()
            {
                int sum = 0;
                for(int n : numbers)
                    sum = wrapping_add(sum, n);
                return sum;
            }
        );
    }
} // namespace demo

void register_demo_module(runtime& rt)
{
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine = rt.get_engine();

    global(engine)
        .function("int add(int a, int b)", fp<&demo::add>)
        .function("string greet(const string&in name)", fp<&demo::greet>)
        .function("int get_magic_number()", fp<&demo::get_magic_number>)
        .function("dictionary@ create_person(const string&in name, uint age)", fp<&demo::create_person>)
        .function("string describe_person(const ?&in person)", fp<&demo::describe_person>)
        .funcdef("int int_callback(int)")
        .function("int call_with_value(int_callback@ cb, int value)", fp<&demo::call_with_value>)
        .function("int map_and_sum(const array<int>&in numbers, int_callback@ cb)", fp<&demo::map_and_sum>)
        .function("array<int>@ double_array(const array<int>&in numbers)", fp<&demo::double_array>)
        .function("uint array_length(const array<int>&in arr)", fp<&demo::array_length>)
        .function("int divide(int a, int b)", fp<&demo::divide>)
        .function("optional<int> maybe_double(int n)", fp<&demo::maybe_double>)
        .function("string greet_optional(const ?&in name)", fp<&demo::greet_optional>)
        .function("string greet_optional()", fp<&demo::greet_stranger>)
        .function("promise<int>@ async_add(int a, int b)", fp<&demo::async_add>)
        .function("promise<int>@ delayed_value(int value, uint ms)", fp<&demo::delayed_value>)
        .function("promise<int>@ async_divide(int a, int b)", fp<&demo::async_divide>)
        .function("promise<int>@ async_sum(const array<int>&in numbers)", fp<&demo::async_sum>);

    handle_class<counter>(engine, "Counter")
        .factory<>()
        .factory<int>("int initial")
        .method("void increment()", fp<&counter::increment>)
        .method("void decrement()", fp<&counter::decrement>)
        .method("void add(int n)", fp<&counter::add>)
        .method("int get_value() const property", fp<&counter::value>)
        .method("void set_value(int val) property", fp<&counter::set_value>)
        .method("void reset()", fp<&counter::reset>);
}
} // namespace asbridge::ext
