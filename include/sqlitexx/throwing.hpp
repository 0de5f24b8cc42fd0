/*

throwing.hpp
------------

Helpers to bridge sqlitexx::result into exceptions for users who prefer
exception-based error handling.

*/

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <sqlitexx/config.hpp>
#include <sqlitexx/detail/result.hpp>

namespace sqlitexx
{

#if !SQLITEXX_THROWING_ENABLED
#error "SQLITEXX_NO_EXCEPTIONS is defined; throwing.hpp is disabled."
#endif

class exception : public std::runtime_error
{
public:
    explicit exception(sqlitexx::error err)
        : std::runtime_error(err.message().empty() ? std::string(error_code_to_string(err.code())) : err.message()),
          error_(std::move(err))
    {
    }

    [[nodiscard]] const sqlitexx::error& error() const noexcept { return error_; }

private:
    sqlitexx::error error_;
};

template<class T>
[[nodiscard]] inline T unwrap(result<T>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
    return std::move(*r);
}

inline void unwrap(result<void>&& r)
{
    if (!r)
        throw exception(std::move(r.error()));
}

} // namespace sqlitexx
