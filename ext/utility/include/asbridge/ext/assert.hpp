/**
 * @file assert.hpp
 * @brief Script assertion
 */

#ifndef ASBRIDGE_EXT_ASSERT_HPP
#define ASBRIDGE_EXT_ASSERT_HPP

#pragma once

#include <functional>
#include <string_view>
#include <asbridge/asbridge.hpp>

namespace asbridge::ext
{
using assert_handler_type = void(std::string_view);

/**
 * @brief Register `assert(bool)` and, if a string type is registered, `assert(bool, const string&in)`
 *
 * @param callback Called with the message on assertion failure
 * @param set_ex Set a script exception on assertion failure
 */
void register_script_assert(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
    std::function<assert_handler_type> callback,
    bool set_ex = true
);
} // namespace asbridge::ext

#endif
