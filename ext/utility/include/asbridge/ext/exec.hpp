/**
 * @file exec.hpp
 * @brief Loading and executing script code
 */

#ifndef ASBRIDGE_EXT_EXEC_HPP
#define ASBRIDGE_EXT_EXEC_HPP

#pragma once

#include <filesystem>
#include <ios>
#include <string_view>
#include <asbridge/asbridge.hpp>

namespace asbridge::ext
{
/**
 * @brief Load a string as script section
 *
 * @return AngelScript error code
 */
int load_string(
    AS_NAMESPACE_QUALIFIER asIScriptModule* m,
    const char* section_name,
    std::string_view code,
    int line_offset = 0
);

/**
 * @brief Load a file as script section named after the file
 *
 * @return AngelScript error code
 */
int load_file(
    AS_NAMESPACE_QUALIFIER asIScriptModule* m,
    const std::filesystem::path& filename,
    std::ios_base::openmode mode = std::ios_base::in
);

/**
 * @brief Compile a piece of code as the body of a function and execute it
 *
 * @return AngelScript error code of the compilation
 *
 * @exception call_error The code raised a script exception
 */
int exec(
    AS_NAMESPACE_QUALIFIER asIScriptEngine* engine,
    std::string_view code
);
} // namespace asbridge::ext

#endif
