/*

config.hpp
----------

Global build configuration for sqlitexx.

Define SQLITEXX_NO_EXCEPTIONS to disable exception-based wrappers.

*/

#pragma once

#if defined(SQLITEXX_NO_EXCEPTIONS)
#define SQLITEXX_THROWING_ENABLED 0
#else
#define SQLITEXX_THROWING_ENABLED 1
#endif
