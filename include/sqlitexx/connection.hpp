/*

connection.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Thin RAII layer over sqlite3* and sqlite3_stmt*. A connection is owned by
exactly one actor thread; nothing here is synchronized.

*/

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <sqlite3.h>

#include <sqlitexx/detail/log.hpp>
#include <sqlitexx/detail/result.hpp>
#include <sqlitexx/open_options.hpp>

namespace sqlitexx
{

/// Build an error from the connection's last failure
[[nodiscard]] inline error engine_error(sqlite3* db, int rc, errc code = errc::execution_failed)
{
    if (db == nullptr)
        return error(code, sqlite3_errstr(rc), rc);
    return error(code, sqlite3_errmsg(db), sqlite3_extended_errcode(db));
}

namespace detail
{

template<class>
struct is_optional : std::false_type {};

template<class T>
struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail


/**
 * Prepared statement, finalized on destruction.
 */
class statement
{
public:
    statement() = default;

    explicit statement(sqlite3_stmt* stmt) noexcept
        : stmt_(stmt)
    {
    }

    statement(statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr))
    {
    }

    statement& operator=(statement&& other) noexcept
    {
        if (this != &other)
        {
            finalize();
            stmt_ = std::exchange(other.stmt_, nullptr);
        }
        return *this;
    }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    ~statement()
    {
        finalize();
    }

    [[nodiscard]] sqlite3_stmt* handle() const noexcept { return stmt_; }

    /**
     * Bind a value to a 1-based parameter index.
     * Accepts integers, floating point, text, nullptr and std::optional of those.
     */
    template<class T>
    result_void bind(int index, const T& value)
    {
        int rc = SQLITE_OK;
        if constexpr (std::is_same_v<T, std::nullptr_t>)
        {
            rc = sqlite3_bind_null(stmt_, index);
        }
        else if constexpr (detail::is_optional<T>::value)
        {
            if (!value)
                return bind(index, nullptr);
            return bind(index, *value);
        }
        else if constexpr (std::is_integral_v<T>)
        {
            rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            rc = sqlite3_bind_double(stmt_, index, static_cast<double>(value));
        }
        else
        {
            static_assert(std::is_convertible_v<const T&, std::string_view>, "unsupported bind type");
            std::string_view text = value;
            rc = sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }

        if (rc != SQLITE_OK)
            return fail(engine_error(sqlite3_db_handle(stmt_), rc));
        return ok();
    }

    /// Bind every argument in order, starting at parameter 1
    template<class... Args>
    result_void bind_all(const Args&... args)
    {
        result_void res = ok();
        int index = 1;
        ((res = res ? bind(index++, args) : res), ...);
        (void)index;
        return res;
    }

    /// Advance; true when a row is available, false once the statement is done
    result<bool> step()
    {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW)
            return true;
        if (rc == SQLITE_DONE)
            return false;
        return fail<bool>(engine_error(sqlite3_db_handle(stmt_), rc));
    }

    result_void reset()
    {
        const int rc = sqlite3_reset(stmt_);
        if (rc != SQLITE_OK)
            return fail(engine_error(sqlite3_db_handle(stmt_), rc));
        sqlite3_clear_bindings(stmt_);
        return ok();
    }

    [[nodiscard]] int column_count() const noexcept
    {
        return sqlite3_column_count(stmt_);
    }

    [[nodiscard]] bool column_is_null(int index) const noexcept
    {
        return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
    }

    /// Read a 0-based column of the current row
    template<class T>
    [[nodiscard]] T column(int index) const
    {
        if constexpr (detail::is_optional<T>::value)
        {
            if (column_is_null(index))
                return std::nullopt;
            return column<typename T::value_type>(index);
        }
        else if constexpr (std::is_integral_v<T>)
        {
            return static_cast<T>(sqlite3_column_int64(stmt_, index));
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            return static_cast<T>(sqlite3_column_double(stmt_, index));
        }
        else
        {
            static_assert(std::is_same_v<T, std::string>, "unsupported column type");
            const auto* text = sqlite3_column_text(stmt_, index);
            if (text == nullptr)
                return std::string{};
            return std::string(reinterpret_cast<const char*>(text),
                static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
        }
    }

private:
    void finalize() noexcept
    {
        if (stmt_ != nullptr)
        {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    sqlite3_stmt* stmt_ = nullptr;
};


/**
 * One SQLite session. Move-only; closed on destruction.
 *
 * Query helpers are const so that read closures (which receive a
 * const connection&) can run statements; operations that change the
 * session itself require a mutable reference.
 */
class connection
{
public:
    connection() = default;

    connection(connection&& other) noexcept
        : db_(std::exchange(other.db_, nullptr))
    {
    }

    connection& operator=(connection&& other) noexcept
    {
        if (this != &other)
        {
            release();
            db_ = std::exchange(other.db_, nullptr);
        }
        return *this;
    }

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    ~connection()
    {
        release();
    }

    /**
     * Open a session and apply the configured busy timeout, journal mode and pragmas.
     *
     * @return errc::open_failed if the engine refuses the target or a pragma fails,
     *         errc::pragma_update if the journal mode could not be switched
     */
    static result<connection> open(const open_options& options)
    {
        const std::string target = options.target();
        sqlite3* db = nullptr;
        const int rc = sqlite3_open_v2(target.c_str(), &db, static_cast<int>(options.flags),
            options.vfs.empty() ? nullptr : options.vfs.c_str());
        if (rc != SQLITE_OK)
        {
            auto err = engine_error(db, rc, errc::open_failed);
            sqlite3_close_v2(db);
            return fail<connection>(errc::open_failed, "opening '" + target + "': " + err.message(), err.engine_code());
        }
        sqlite3_extended_result_codes(db, 1);

        connection conn(db);

        if (auto res = conn.set_busy_timeout(options.busy_timeout); !res)
            return fail<connection>(errc::open_failed, res.error().message(), res.error().engine_code());

        if (options.journal_mode)
        {
            const std::string expected(to_string(*options.journal_mode));
            auto reported = conn.pragma_update("journal_mode", expected);
            if (!reported)
                return fail<connection>(errc::open_failed, reported.error().message(), reported.error().engine_code());

            std::string got = std::move(*reported);
            std::transform(got.begin(), got.end(), got.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (got != expected)
            {
                return fail<connection>(errc::pragma_update,
                    "updating pragma journal_mode: expected '" + expected + "', got '" + got + "'");
            }
        }

        for (const auto& pragma : options.pragmas)
        {
            if (auto res = conn.execute_batch(pragma); !res)
            {
                return fail<connection>(errc::open_failed,
                    "applying '" + pragma + "': " + res.error().message(), res.error().engine_code());
            }
        }

        SQLITEXX_LOG_DEBUG("CONNECTION", "opened " << target);
        return conn;
    }

    [[nodiscard]] sqlite3* handle() const noexcept { return db_; }

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    /// Run one or more statements without parameters or results
    result_void execute_batch(std::string_view sql) const
    {
        const std::string text(sql);
        char* message = nullptr;
        const int rc = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &message);
        if (rc != SQLITE_OK)
        {
            std::string what = message != nullptr ? message : sqlite3_errstr(rc);
            sqlite3_free(message);
            return fail(errc::execution_failed, std::move(what), sqlite3_extended_errcode(db_));
        }
        return ok();
    }

    result<statement> prepare(std::string_view sql) const
    {
        sqlite3_stmt* stmt = nullptr;
        const int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
        if (rc != SQLITE_OK)
            return fail<statement>(engine_error(db_, rc));
        return statement(stmt);
    }

    /// Run a single statement with bound parameters; returns the number of changed rows
    template<class... Args>
    result<int> execute(std::string_view sql, const Args&... args) const
    {
        auto stmt = prepare(sql);
        if (!stmt)
            return fail<int>(std::move(stmt.error()));
        if (auto bound = stmt->bind_all(args...); !bound)
            return fail<int>(std::move(bound.error()));

        while (true)
        {
            auto row = stmt->step();
            if (!row)
                return fail<int>(std::move(row.error()));
            if (!*row)
                break;
        }
        return changes();
    }

    /// First column of the first row; errc::execution_failed when no row is returned
    template<class T, class... Args>
    result<T> query_row(std::string_view sql, const Args&... args) const
    {
        auto stmt = prepare(sql);
        if (!stmt)
            return fail<T>(std::move(stmt.error()));
        if (auto bound = stmt->bind_all(args...); !bound)
            return fail<T>(std::move(bound.error()));

        auto row = stmt->step();
        if (!row)
            return fail<T>(std::move(row.error()));
        if (!*row)
            return fail<T>(errc::execution_failed, "query returned no rows");
        return stmt->template column<T>(0);
    }

    /**
     * Visit every row of a query.
     *
     * @param visit Called with the statement positioned on each row
     * @return Number of rows visited
     */
    template<class F, class... Args>
    result<std::size_t> query_each(std::string_view sql, F&& visit, const Args&... args) const
    {
        auto stmt = prepare(sql);
        if (!stmt)
            return fail<std::size_t>(std::move(stmt.error()));
        if (auto bound = stmt->bind_all(args...); !bound)
            return fail<std::size_t>(std::move(bound.error()));

        std::size_t rows = 0;
        while (true)
        {
            auto row = stmt->step();
            if (!row)
                return fail<std::size_t>(std::move(row.error()));
            if (!*row)
                break;
            visit(static_cast<const statement&>(*stmt));
            ++rows;
        }
        return rows;
    }

    /// Set a pragma; returns the value SQLite reports back (empty if it reports none)
    result<std::string> pragma_update(std::string_view name, std::string_view value) const
    {
        std::string sql = "PRAGMA ";
        sql.append(name);
        sql.append(" = ");
        sql.append(value);

        auto stmt = prepare(sql);
        if (!stmt)
            return fail<std::string>(std::move(stmt.error()));
        auto row = stmt->step();
        if (!row)
            return fail<std::string>(std::move(row.error()));
        if (!*row)
            return std::string{};
        return stmt->template column<std::string>(0);
    }

    [[nodiscard]] std::int64_t last_insert_rowid() const noexcept
    {
        return sqlite3_last_insert_rowid(db_);
    }

    [[nodiscard]] int changes() const noexcept
    {
        return sqlite3_changes(db_);
    }

    [[nodiscard]] bool is_autocommit() const noexcept
    {
        return sqlite3_get_autocommit(db_) != 0;
    }

    result_void set_busy_timeout(std::chrono::milliseconds timeout)
    {
        const int rc = sqlite3_busy_timeout(db_, static_cast<int>(timeout.count()));
        if (rc != SQLITE_OK)
            return fail(engine_error(db_, rc));
        return ok();
    }

    /**
     * Close the session. On failure the handle is still released (SQLite
     * finishes the close once outstanding statements are finalized) and the
     * engine error is reported.
     */
    result_void close()
    {
        if (db_ == nullptr)
            return ok();

        sqlite3* db = std::exchange(db_, nullptr);
        const int rc = sqlite3_close(db);
        if (rc != SQLITE_OK)
        {
            auto err = engine_error(db, rc);
            sqlite3_close_v2(db);
            return fail(errc::execution_failed, "closing connection: " + err.message(), err.engine_code());
        }
        return ok();
    }

private:
    explicit connection(sqlite3* db) noexcept
        : db_(db)
    {
    }

    void release() noexcept
    {
        if (db_ != nullptr)
        {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
    }

    sqlite3* db_ = nullptr;
};


/**
 * Scoped transaction; rolls back on destruction unless committed.
 */
class transaction
{
public:
    enum class behavior
    {
        deferred,
        immediate,
        exclusive
    };

    static result<transaction> begin(connection& conn, behavior mode = behavior::deferred)
    {
        std::string_view sql = "BEGIN DEFERRED";
        if (mode == behavior::immediate)
            sql = "BEGIN IMMEDIATE";
        else if (mode == behavior::exclusive)
            sql = "BEGIN EXCLUSIVE";

        if (auto res = conn.execute_batch(sql); !res)
            return fail<transaction>(std::move(res.error()));
        return transaction(conn);
    }

    transaction(transaction&& other) noexcept
        : conn_(std::exchange(other.conn_, nullptr))
    {
    }

    transaction& operator=(transaction&&) = delete;
    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    ~transaction()
    {
        if (conn_ != nullptr)
        {
            if (auto res = rollback(); !res)
                SQLITEXX_LOG_WARN("CONNECTION", "rollback on scope exit failed: " << res.error().to_string());
        }
    }

    result_void commit()
    {
        return finish("COMMIT");
    }

    result_void rollback()
    {
        return finish("ROLLBACK");
    }

private:
    explicit transaction(connection& conn) noexcept
        : conn_(&conn)
    {
    }

    result_void finish(std::string_view sql)
    {
        if (conn_ == nullptr)
            return fail(errc::internal_error, "transaction already finished");
        connection* conn = std::exchange(conn_, nullptr);
        return conn->execute_batch(sql);
    }

    connection* conn_ = nullptr;
};

} // namespace sqlitexx
