/**
 * @file asbridge.hpp
 * @brief Umbrella header of the native interop core
 */

#ifndef ASBRIDGE_ASBRIDGE_HPP
#define ASBRIDGE_ASBRIDGE_HPP

#pragma once

// clang-format off: Used by CMakeLists.txt for parsing version

#define ASBRIDGE_VERSION_MAJOR 0
#define ASBRIDGE_VERSION_MINOR 3
#define ASBRIDGE_VERSION_PATCH 0

// clang-format on

#define ASBRIDGE_VERSION_STRING "0.3.0"

// IWYU pragma: begin_exports

#include "detail/include_as.hpp"
#include "detail/config.hpp"
#include "utility.hpp"
#include "memory.hpp"
#include "error.hpp"
#include "marshal.hpp"
#include "async.hpp"
#include "handle.hpp"
#include "runtime.hpp"
#include "callback.hpp"
#include "promise.hpp"
#include "bind.hpp"

// IWYU pragma: end_exports

namespace asbridge
{
[[nodiscard]]
const char* library_version() noexcept;

/**
 * @brief Check if `asGetLibraryOptions()` returns "AS_MAX_PORTABILITY"
 */
[[nodiscard]]
bool has_max_portability(
    const char* options = AS_NAMESPACE_QUALIFIER asGetLibraryOptions()
);

/**
 * @brief Check if `asGetLibraryOptions()` doesn't return "AS_NO_EXCEPTIONS"
 */
[[nodiscard]]
bool has_exceptions(
    const char* options = AS_NAMESPACE_QUALIFIER asGetLibraryOptions()
);
} // namespace asbridge

#endif
