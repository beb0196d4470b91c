/**
 * @file meta.hpp
 * @brief Function traits for the binding wrappers
 */

#ifndef ASBRIDGE_META_HPP
#define ASBRIDGE_META_HPP

#pragma once

#include <tuple>
#include <type_traits>

namespace asbridge
{
namespace detail
{
    template <typename T>
    struct func_traits_impl;

    template <typename R, typename... Args>
    struct func_traits_impl<R (*)(Args...)>
    {
        using return_type = R;
        using args_tuple = std::tuple<Args...>;
        using class_type = void;
    };

    template <typename R, typename... Args>
    struct func_traits_impl<R (*)(Args...) noexcept> : func_traits_impl<R (*)(Args...)>
    {};

#define ASBRIDGE_FUNC_TRAITS_IMPL_MEMBER(const_, noexcept_)         \
    template <typename R, typename Class, typename... Args>         \
    struct func_traits_impl<R (Class::*)(Args...) const_ noexcept_> \
    {                                                               \
        using return_type = R;                                      \
        using args_tuple = std::tuple<Args...>;                     \
        using class_type = Class;                                   \
    }

    ASBRIDGE_FUNC_TRAITS_IMPL_MEMBER(const, noexcept);
    ASBRIDGE_FUNC_TRAITS_IMPL_MEMBER(const, );
    ASBRIDGE_FUNC_TRAITS_IMPL_MEMBER(, noexcept);
    ASBRIDGE_FUNC_TRAITS_IMPL_MEMBER(, );

#undef ASBRIDGE_FUNC_TRAITS_IMPL_MEMBER
} // namespace detail

/**
 * @brief Traits of function pointers and member function pointers
 */
template <typename T>
struct function_traits : detail::func_traits_impl<std::decay_t<std::remove_cvref_t<T>>>
{
    using my_base = detail::func_traits_impl<std::decay_t<std::remove_cvref_t<T>>>;

    using return_type = typename my_base::return_type;
    using args_tuple = typename my_base::args_tuple;
    using class_type = typename my_base::class_type;

    static constexpr bool is_method_v = !std::is_void_v<class_type>;
};

/**
 * @brief Compile-time function pointer for the binding wrappers
 */
template <auto Function>
struct fp_wrapper
{
    static constexpr auto get() noexcept
    {
        return Function;
    }
};

template <auto Function>
inline constexpr fp_wrapper<Function> fp{};
} // namespace asbridge

#endif
