#pragma once

#include <sqlitexx/config.hpp>

#include <sqlitexx/detail/result.hpp>
#include <sqlitexx/detail/log.hpp>

#include <sqlitexx/open_options.hpp>
#include <sqlitexx/connection.hpp>

#include <sqlitexx/actor.hpp>
#include <sqlitexx/client.hpp>

// Connection pooling
#include <sqlitexx/pool.hpp>

#if SQLITEXX_THROWING_ENABLED
#include <sqlitexx/throwing.hpp>
#endif
