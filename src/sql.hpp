#ifndef MFA_SQL_HPP
#define MFA_SQL_HPP

#include "env.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>
#include <memory>
#include <unordered_map>
#include <optional>
#include <format>
#include <mutex>

// Include ODBC headers
#include <sql.h>
#include <sqlext.h>

/**
 * @file sql.hpp
 * @brief Thin ODBC layer: per-thread connections keyed by an environment
 * variable holding the connection string, cached prepared statements and
 * typed parameter binding.
 */

namespace mfa::sql {

// --- Forward Declarations for Internal Types ---
namespace detail {
    class StmtHandle;
}

// --- Public Interface ---

/// @class error
/// @brief Exception thrown for ODBC-related errors.
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    error(std::string_view message, std::string state)
        : std::runtime_error(std::string(message)), sqlstate(std::move(state)) {}

    std::string sqlstate;
};

/// @class row
/// @brief Represents a single row in a result set. SQL NULL is kept as an empty optional.
class row {
public:
    /**
     * @brief Converts the column text to T (std::string, int, long long).
     * @throws sql::error for a missing column, a NULL value or an unparsable number.
     */
    template<typename T>
    [[nodiscard]] T get_value(std::string_view col_name) const;

    [[nodiscard]] bool is_null(std::string_view col_name) const;

private:
    friend class detail::StmtHandle;
    std::unordered_map<std::string, std::optional<std::string>, util::string_hash, util::string_equal> m_data;
};

/// @class resultset
/// @brief Represents a collection of rows returned from a query.
class resultset {
public:
    [[nodiscard]] std::vector<row>::const_iterator begin() const { return m_rows.begin(); }
    [[nodiscard]] std::vector<row>::const_iterator end() const { return m_rows.end(); }
    [[nodiscard]] bool empty() const { return m_rows.empty(); }
    [[nodiscard]] size_t size() const { return m_rows.size(); }
    [[nodiscard]] const row& at(size_t index) const { return m_rows.at(index); }

private:
    friend class detail::StmtHandle;
    std::vector<row> m_rows;
};

/**
 * @brief Executes a general SQL query and returns a structured result set.
 */
template<typename... Args>
[[nodiscard]] resultset query(std::string_view db_key, std::string_view sql_query, Args&&... args);

/**
 * @brief Executes a SQL statement that does not return a result set (INSERT, UPDATE, DELETE).
 * @return The number of rows affected, as reported by SQLRowCount.
 */
template<typename... Args>
long long exec(std::string_view db_key, std::string_view sql_query, Args&&... args);


// --- Internal Implementation Details ---
namespace detail {

// --- RAII Handle Wrappers ---
template<SQLSMALLINT HandleType>
class ODBCHandle {
public:
    ODBCHandle() = default;
    ~ODBCHandle() {
        if (m_handle != SQL_NULL_HANDLE) {
            SQLFreeHandle(HandleType, m_handle);
        }
    }
    ODBCHandle(const ODBCHandle&) = delete;
    ODBCHandle& operator=(const ODBCHandle&) = delete;
    ODBCHandle(ODBCHandle&& other) noexcept : m_handle(other.m_handle) {
        other.m_handle = SQL_NULL_HANDLE;
    }
    ODBCHandle& operator=(ODBCHandle&& other) noexcept {
        if (this != &other) {
            if (m_handle != SQL_NULL_HANDLE) {
                SQLFreeHandle(HandleType, m_handle);
            }
            m_handle = other.m_handle;
            other.m_handle = SQL_NULL_HANDLE;
        }
        return *this;
    }

    SQLHANDLE get() const { return m_handle; }
    SQLHANDLE* get_ptr() { return &m_handle; }

private:
    SQLHANDLE m_handle = SQL_NULL_HANDLE;
};

class EnvHandle : public ODBCHandle<SQL_HANDLE_ENV> {
public:
    EnvHandle();
};

class DbcHandle : public ODBCHandle<SQL_HANDLE_DBC> {
public:
    explicit DbcHandle(const EnvHandle& env);
    ~DbcHandle();
    DbcHandle(const DbcHandle&) = delete;
    DbcHandle& operator=(const DbcHandle&) = delete;

    void mark_connected() noexcept { m_connected = true; }

private:
    bool m_connected{false};
};

class StmtHandle : public ODBCHandle<SQL_HANDLE_STMT> {
public:
    explicit StmtHandle(const DbcHandle& dbc);
    [[nodiscard]] resultset fetch_all() const;
    [[nodiscard]] long long affected_rows() const;
private:
    static std::vector<std::string> get_column_names(SQLHSTMT stmt_handle, SQLSMALLINT num_cols);
    static row fetch_single_row(SQLHSTMT stmt_handle, SQLSMALLINT num_cols, const std::vector<std::string>& col_names);
};

// --- Shared Environment Handle, allocated once per process ---
class SharedEnvHandle {
public:
    static EnvHandle& get() {
        static EnvHandle s_env_handle;
        return s_env_handle;
    }
};


// --- Error Handling ---
void check_odbc_error(SQLRETURN retcode, SQLHANDLE handle, SQLSMALLINT handle_type, std::string_view context);

/// @brief SQLSTATE values worth one reconnect: general error and communication link failure.
[[nodiscard]] inline bool is_retryable(const error& e) noexcept {
    return e.sqlstate == "HY000" || e.sqlstate == "01000" || e.sqlstate == "08S01" || e.sqlstate == "08003";
}


// --- Connection Class ---
class Connection {
public:
    explicit Connection(std::string_view conn_str);
    StmtHandle& get_or_create_statement(std::string_view sql_query);

private:
    DbcHandle m_dbc;
    std::unordered_map<std::string, std::unique_ptr<StmtHandle>, util::string_hash, util::string_equal> m_statement_cache;
};

// --- Thread-Local Connection Manager ---
class ConnectionManager {
public:
    static Connection& get_connection(std::string_view db_key);
    static void invalidate_connection(std::string_view db_key);
private:
    static inline thread_local std::unordered_map<std::string, std::unique_ptr<Connection>, util::string_hash, util::string_equal> m_connections;
};

} // namespace detail
} // namespace mfa::sql

// Template implementation must be in the header
#include "sql.tpp"

#endif // MFA_SQL_HPP
