/**
 * @file detail/config.hpp
 * @brief Compile-time config
 *
 * @details Every user data ID below can be overridden by defining the macro
 *          before including any asbridge header.
 */

#ifndef ASBRIDGE_DETAIL_CONFIG_HPP
#define ASBRIDGE_DETAIL_CONFIG_HPP

#pragma once

#include <version>
#include "include_as.hpp"

#if !defined(NDEBUG) && !defined(ASBRIDGE_DEBUG)
#    define ASBRIDGE_DEBUG
#endif

// Promises and the assert extension need asIScriptEngine::GetStringFactory
#if ANGELSCRIPT_VERSION < 23800
#    error "asbridge requires AngelScript 2.38.0 or later"
#endif

// Engine user data: pointer to the asbridge::runtime bound to the engine
#ifndef ASBRIDGE_RUNTIME_USER_ID
#    define ASBRIDGE_RUNTIME_USER_ID 2300
#endif

// Context user data: promise awaited by a suspended context
#ifndef ASBRIDGE_WAIT_TARGET_USER_ID
#    define ASBRIDGE_WAIT_TARGET_USER_ID 2302
#endif

// Engine user data: state of the assert extension
#ifndef ASBRIDGE_EXT_ASSERT_USER_ID
#    define ASBRIDGE_EXT_ASSERT_USER_ID 2303
#endif

#endif
