/**
 * @file demo.hpp
 * @brief Demonstration module exercising every part of the bridge
 *
 * @details Registers plain functions, a record, callbacks, sequences, the `Counter` class,
 *          error returns, optionals and promise-returning functions.
 */

#ifndef ASBRIDGE_EXT_DEMO_HPP
#define ASBRIDGE_EXT_DEMO_HPP

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include <asbridge/asbridge.hpp>

namespace asbridge::ext
{
struct person
{
    std::string name;
    std::uint32_t age = 0;
};

class counter
{
public:
    explicit counter(int initial = 0) noexcept
        : m_value(initial) {}

    void increment() noexcept;
    void decrement() noexcept;
    void add(int n) noexcept;

    [[nodiscard]]
    int value() const noexcept
    {
        return m_value;
    }

    void set_value(int val) noexcept
    {
        m_value = val;
    }

    void reset() noexcept
    {
        m_value = 0;
    }

private:
    int m_value;
};

namespace demo
{
    /**
     * @brief Two's complement wrapping addition
     */
    [[nodiscard]]
    int add(int a, int b) noexcept;

    [[nodiscard]]
    std::string greet(const std::string& name);

    [[nodiscard]]
    int get_magic_number() noexcept;

    [[nodiscard]]
    person create_person(const std::string& name, std::uint32_t age);

    [[nodiscard]]
    std::string describe_person(const person& p);

    int call_with_value(const script_callback<int(int)>& cb, int value);

    /**
     * @brief Sum of `cb(x)` for every element, calling `cb` in sequence order
     */
    int map_and_sum(const std::vector<int>& numbers, const script_callback<int(int)>& cb);

    [[nodiscard]]
    std::vector<int> double_array(const std::vector<int>& numbers);

    [[nodiscard]]
    std::uint32_t array_length(const std::vector<int>& arr) noexcept;

    /**
     * @exception domain_error "Division by zero", or "Division overflow" for `INT_MIN / -1`
     */
    int divide(int a, int b);

    /**
     * @return Nothing for a negative number
     */
    [[nodiscard]]
    std::optional<int> maybe_double(int n) noexcept;

    [[nodiscard]]
    std::string greet_optional(const std::optional<std::string>& name);

    [[nodiscard]]
    promise_handle async_add(runtime& rt, int a, int b);

    /**
     * @brief Resolve with the value after a timer expires
     */
    [[nodiscard]]
    promise_handle delayed_value(runtime& rt, int value, std::uint32_t ms);

    [[nodiscard]]
    promise_handle async_divide(runtime& rt, int a, int b);

    [[nodiscard]]
    promise_handle async_sum(runtime& rt, const std::vector<int>& numbers);
} // namespace demo

/**
 * @brief Register the demonstration module
 *
 * @pre `string`, `array<T>`, `optional<T>`, `dictionary` and `promise<T>` are registered
 */
void register_demo_module(runtime& rt);
} // namespace asbridge::ext

namespace asbridge
{
template <>
struct record_traits<ext::person>
{
    static constexpr std::tuple fields{
        record_field{"name", &ext::person::name},
        record_field{"age", &ext::person::age}
    };
};
} // namespace asbridge

#endif
