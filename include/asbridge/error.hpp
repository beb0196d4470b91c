/**
 * @file error.hpp
 * @brief Error taxonomy and translation between native exceptions and script exceptions
 */

#ifndef ASBRIDGE_ERROR_HPP
#define ASBRIDGE_ERROR_HPP

#pragma once

#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include "detail/include_as.hpp"
#include "utility.hpp"

namespace asbridge
{
enum class error_kind
{
    // Value conversion
    type_mismatch,
    invalid_encoding,
    missing_field,

    // Calling script functions
    host_threw,
    bad_return_type,

    // Rejected by native logic
    invalid_argument,
    out_of_range,

    // Stale handle to native state
    invalid_handle,

    // Foreign exception wrapped by the bridge
    generic
};

[[nodiscard]]
std::string_view to_string(error_kind kind) noexcept;

/**
 * @brief Base of every error raised by the bridge
 *
 * Only `what()` crosses into the script. The kind stays on the native side.
 */
class bridge_error : public std::runtime_error
{
public:
    bridge_error(error_kind kind, const std::string& msg)
        : std::runtime_error(msg), m_kind(kind) {}

    [[nodiscard]]
    error_kind kind() const noexcept
    {
        return m_kind;
    }

private:
    error_kind m_kind;
};

/**
 * @brief Failure of the value marshaller
 */
class marshal_error : public bridge_error
{
public:
    marshal_error(error_kind kind, const std::string& msg);

    [[nodiscard]]
    static marshal_error type_mismatch(std::string_view expected, std::string_view got);

    [[nodiscard]]
    static marshal_error invalid_encoding();

    [[nodiscard]]
    static marshal_error missing_field(std::string_view name);

    /**
     * @brief Name of the record field being converted when the error occurred
     */
    [[nodiscard]]
    const std::string& field() const noexcept
    {
        return m_field;
    }

    /**
     * @brief Index of the first sequence element that failed to convert
     */
    [[nodiscard]]
    std::optional<std::size_t> index() const noexcept
    {
        return m_index;
    }

    /**
     * @brief Copy of this error located at a sequence element
     */
    [[nodiscard]]
    marshal_error at_index(std::size_t idx) const;

    /**
     * @brief Copy of this error located at a record field
     */
    [[nodiscard]]
    marshal_error in_field(std::string_view name) const;

private:
    marshal_error(error_kind kind, const std::string& msg, std::string field, std::optional<std::size_t> idx);

    std::string m_field;
    std::optional<std::size_t> m_index;
};

/**
 * @brief Failure of a call into script code
 */
class call_error : public bridge_error
{
public:
    call_error(error_kind kind, const std::string& msg, std::string where = {})
        : bridge_error(kind, msg), m_where(std::move(where)) {}

    [[nodiscard]]
    static call_error host_threw(const std::string& msg, std::string where = {})
    {
        return call_error(error_kind::host_threw, msg, std::move(where));
    }

    [[nodiscard]]
    static call_error bad_return_type(const std::string& msg)
    {
        return call_error(error_kind::bad_return_type, msg);
    }

    /**
     * @brief Script location of the exception as "section(line:column)", may be empty
     */
    [[nodiscard]]
    const std::string& where() const noexcept
    {
        return m_where;
    }

private:
    std::string m_where;
};

/**
 * @brief Invalid input rejected by native logic, e.g. a division by zero
 */
class domain_error : public bridge_error
{
public:
    explicit domain_error(const std::string& msg)
        : bridge_error(error_kind::invalid_argument, msg) {}
};

/**
 * @brief Offset, length or index outside the valid range
 */
class range_error : public bridge_error
{
public:
    explicit range_error(const std::string& msg)
        : bridge_error(error_kind::out_of_range, msg) {}
};

/**
 * @brief Access through a handle whose native object is gone
 */
class handle_error : public bridge_error
{
public:
    explicit handle_error(const std::string& msg = "invalid handle")
        : bridge_error(error_kind::invalid_handle, msg) {}
};

/**
 * @brief Storable form of an error, used by rejected promises
 */
struct error_value
{
    error_kind kind = error_kind::generic;
    std::string message;

    [[nodiscard]]
    static error_value from_exception(std::exception_ptr ex);

    bool operator==(const error_value&) const = default;
};

/**
 * @brief Set a native error as exception of a script context
 *
 * @param ctx Context to receive the exception. The active context is used if null.
 */
void to_host_error(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx, const std::exception& e);
void to_host_error(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx, const error_value& err);

/**
 * @brief Convert the exception of a context into a native error
 *
 * @pre The context is in the `asEXECUTION_EXCEPTION` state
 */
[[nodiscard]]
call_error from_host_exception(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx);

/**
 * @brief Exception translator for the engine and the generic wrappers. Must be called inside a catch block.
 *
 * Unknown exception types still produce a script exception. Nothing is swallowed.
 */
void translate_exception(AS_NAMESPACE_QUALIFIER asIScriptContext* ctx);

/**
 * @brief Register `translate_exception` as the exception translator of the engine
 *
 * @return AngelScript error code. Fails on platforms without native calling convention support.
 */
int set_exception_translator(AS_NAMESPACE_QUALIFIER asIScriptEngine* engine);
} // namespace asbridge

#endif
