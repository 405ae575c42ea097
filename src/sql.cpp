#include "sql.hpp"
#include <vector>
#include <charconv>
#include <thread>

namespace mfa::sql {

namespace {
    const std::string& column_text(const std::unordered_map<std::string, std::optional<std::string>, util::string_hash, util::string_equal>& data,
                                   std::string_view col_name) {
        const auto it = data.find(col_name);
        if (it == data.end()) {
            throw sql::error(std::format("Column '{}' not found in result set.", col_name));
        }
        if (!it->second) {
            throw sql::error(std::format("Column '{}' is NULL.", col_name));
        }
        return *it->second;
    }

    template<typename T>
    T parse_number(const std::string& text, std::string_view col_name) {
        T value{};
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            throw sql::error(std::format("Invalid type requested for column '{}'.", col_name));
        }
        return value;
    }
}

template<typename T>
T row::get_value(std::string_view col_name) const {
    const std::string& text = column_text(m_data, col_name);
    if constexpr (std::is_same_v<T, std::string>) {
        return text;
    } else {
        return parse_number<T>(text, col_name);
    }
}

template std::string row::get_value<std::string>(std::string_view) const;
template int row::get_value<int>(std::string_view) const;
template long long row::get_value<long long>(std::string_view) const;

bool row::is_null(std::string_view col_name) const {
    const auto it = m_data.find(col_name);
    return it == m_data.end() || !it->second;
}


namespace detail {

// --- StmtHandle Helper Functions ---

std::vector<std::string> StmtHandle::get_column_names(SQLHSTMT stmt_handle, SQLSMALLINT num_cols) {
    std::vector<std::string> col_names;
    col_names.reserve(num_cols);
    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(num_cols); ++i) {
        std::vector<SQLCHAR> col_name_buffer(256);
        SQLSMALLINT name_len = 0;
        check_odbc_error(SQLDescribeCol(stmt_handle, i, col_name_buffer.data(), static_cast<SQLSMALLINT>(col_name_buffer.size()), &name_len, nullptr, nullptr, nullptr, nullptr),
                         stmt_handle, SQL_HANDLE_STMT, "SQLDescribeCol");
        col_names.emplace_back(reinterpret_cast<char*>(col_name_buffer.data()), name_len);
    }
    return col_names;
}

/**
 * @brief Fetches every column of the current row as text, reading long
 * values in chunks.
 */
row StmtHandle::fetch_single_row(SQLHSTMT stmt_handle, SQLSMALLINT num_cols, const std::vector<std::string>& col_names) {
    row current_row;
    constexpr size_t buffer_size = 4096;
    std::vector<char> buffer(buffer_size);

    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(num_cols); ++i) {
        std::string value;
        bool is_null = false;
        while (true) {
            SQLLEN indicator = 0;
            SQLRETURN ret = SQLGetData(stmt_handle, i, SQL_C_CHAR, buffer.data(), static_cast<SQLLEN>(buffer.size()), &indicator);
            if (ret == SQL_NO_DATA) {
                break;
            }
            check_odbc_error(ret, stmt_handle, SQL_HANDLE_STMT, "SQLGetData");
            if (indicator == SQL_NULL_DATA) {
                is_null = true;
                break;
            }
            // With SQL_SUCCESS_WITH_INFO the buffer was filled minus the terminator.
            if (ret == SQL_SUCCESS_WITH_INFO) {
                value.append(buffer.data(), buffer.size() - 1);
                continue;
            }
            value.append(buffer.data(), static_cast<size_t>(indicator));
            break;
        }
        if (is_null) {
            current_row.m_data[col_names[i - 1]] = std::nullopt;
        } else {
            current_row.m_data[col_names[i - 1]] = std::move(value);
        }
    }
    return current_row;
}

resultset StmtHandle::fetch_all() const {
    resultset rs;

    SQLSMALLINT num_cols = 0;
    check_odbc_error(SQLNumResultCols(get(), &num_cols), get(), SQL_HANDLE_STMT, "SQLNumResultCols");

    if (num_cols == 0) {
        return rs;
    }

    const auto col_names = StmtHandle::get_column_names(get(), num_cols);

    SQLRETURN ret;
    while ((ret = SQLFetch(get())) != SQL_NO_DATA) {
        check_odbc_error(ret, get(), SQL_HANDLE_STMT, "SQLFetch");
        rs.m_rows.push_back(StmtHandle::fetch_single_row(get(), num_cols, col_names));
    }

    return rs;
}

long long StmtHandle::affected_rows() const {
    SQLLEN count = 0;
    check_odbc_error(SQLRowCount(get(), &count), get(), SQL_HANDLE_STMT, "SQLRowCount");
    return static_cast<long long>(count);
}


// --- Error Handling Implementation ---

void check_odbc_error(SQLRETURN retcode, SQLHANDLE handle, SQLSMALLINT handle_type, std::string_view context) {
    if (retcode == SQL_SUCCESS || retcode == SQL_SUCCESS_WITH_INFO) {
        return;
    }

    std::vector<SQLCHAR> sql_state(6);
    SQLINTEGER native_error = 0;
    std::vector<SQLCHAR> message_text(SQL_MAX_MESSAGE_LENGTH);
    SQLSMALLINT text_length = 0;
    std::string error_msg = std::format("ODBC Error on '{}': ", context);
    std::string first_state;

    SQLSMALLINT i = 1;
    while (handle != SQL_NULL_HANDLE &&
           SQLGetDiagRec(handle_type, handle, i, sql_state.data(), &native_error, message_text.data(), static_cast<SQLSMALLINT>(message_text.size()), &text_length) == SQL_SUCCESS) {
        if (first_state.empty()) {
            first_state = reinterpret_cast<char*>(sql_state.data());
        }
        error_msg += std::format("[SQLState: {}] [Native Error: {}] {}",
                                 reinterpret_cast<char*>(sql_state.data()),
                                 native_error,
                                 reinterpret_cast<char*>(message_text.data()));
        i++;
    }

    throw sql::error(error_msg, std::move(first_state));
}

// --- RAII Handle Implementation ---

EnvHandle::EnvHandle() {
    check_odbc_error(SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, get_ptr()),
                     SQL_NULL_HANDLE, SQL_HANDLE_ENV, "SQLAllocHandle (ENV)");
    check_odbc_error(SQLSetEnvAttr(get(), SQL_ATTR_ODBC_VERSION, reinterpret_cast<SQLPOINTER>(SQL_OV_ODBC3), 0),
                     get(), SQL_HANDLE_ENV, "SQLSetEnvAttr (ODBC_VERSION)");
}

DbcHandle::DbcHandle(const EnvHandle& env) {
    check_odbc_error(SQLAllocHandle(SQL_HANDLE_DBC, env.get(), get_ptr()),
                     env.get(), SQL_HANDLE_ENV, "SQLAllocHandle (DBC)");
}

DbcHandle::~DbcHandle() {
    if (m_connected) {
        SQLDisconnect(get());
    }
}

StmtHandle::StmtHandle(const DbcHandle& dbc) {
    check_odbc_error(SQLAllocHandle(SQL_HANDLE_STMT, dbc.get(), get_ptr()),
                     dbc.get(), SQL_HANDLE_DBC, "SQLAllocHandle (STMT)");
}

// --- Connection Implementation ---

Connection::Connection(std::string_view conn_str) : m_dbc(SharedEnvHandle::get()) {
    std::vector<SQLCHAR> connection_string_buffer(conn_str.begin(), conn_str.end());
    connection_string_buffer.push_back('\0');

    check_odbc_error(SQLDriverConnect(m_dbc.get(), nullptr, connection_string_buffer.data(),
                                      SQL_NTS, nullptr, 0, nullptr, SQL_DRIVER_NOPROMPT),
                     m_dbc.get(), SQL_HANDLE_DBC, "SQLDriverConnect");
    m_dbc.mark_connected();
}

StmtHandle& Connection::get_or_create_statement(std::string_view sql_query) {
    if (auto it = m_statement_cache.find(sql_query); it != m_statement_cache.end()) {
        return *it->second;
    }
    auto new_stmt = std::make_unique<StmtHandle>(m_dbc);
    std::string query_text(sql_query);
    SQLRETURN ret = SQLPrepare(new_stmt->get(), reinterpret_cast<SQLCHAR*>(query_text.data()), static_cast<SQLINTEGER>(query_text.size()));
    check_odbc_error(ret, new_stmt->get(), SQL_HANDLE_STMT, "SQLPrepare (cached)");

    auto& stmt_ref = *new_stmt;
    m_statement_cache[std::move(query_text)] = std::move(new_stmt);

    log::debug("Cached new prepared statement for {}", sql_query);
    return stmt_ref;
}

// --- Connection Manager Implementation ---
Connection& ConnectionManager::get_connection(std::string_view db_key) {
    if (auto it = m_connections.find(db_key); it != m_connections.end()) {
        return *it->second;
    }

    const auto conn_str = env::get<std::string>(std::string(db_key));
    auto new_conn = std::make_unique<Connection>(conn_str);
    auto& conn_ref = *new_conn;
    m_connections[std::string(db_key)] = std::move(new_conn);

    log::debug("Created new ODBC connection for '{}' on thread {}", db_key, std::this_thread::get_id());
    return conn_ref;
}

void ConnectionManager::invalidate_connection(std::string_view db_key) {
    if (auto it = m_connections.find(db_key); it != m_connections.end()) {
        m_connections.erase(it);
    }
}

} // namespace detail
} // namespace mfa::sql
