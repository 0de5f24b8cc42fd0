#pragma once

#include <iostream>
#include <sqlitexx/detail/result.hpp>

inline void print_error(const sqlitexx::error& err)
{
    std::cout << "Error: " << sqlitexx::error_code_to_string(err.code()) << " - " << err.message() << "\n";
    if (err.engine_code() != 0)
        std::cout << "SQLite: " << err.engine_code() << "\n";
}
