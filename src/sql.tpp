#ifndef MFA_SQL_TPP
#define MFA_SQL_TPP

#include <tuple>
#include <array>
#include <type_traits>
#include <string>
#include <chrono>
#include <format>

namespace mfa::sql {
namespace detail {

// Converts string-like values to an owned std::string and every integral type
// to long long (bound as BIGINT), so the bound buffers outlive SQLExecute.
template<typename T>
auto convert_for_binding(T&& value) {
    using DecayedT = std::decay_t<T>;
    if constexpr (std::is_convertible_v<DecayedT, std::string_view>) {
        return std::string(std::forward<T>(value));
    } else if constexpr (std::is_same_v<DecayedT, bool>) {
        return static_cast<int>(value);
    } else if constexpr (std::is_integral_v<DecayedT>) {
        return static_cast<long long>(value);
    } else {
        return std::forward<T>(value);
    }
}

template<typename... Args>
auto make_binding_tuple(Args&&... args) {
    return std::make_tuple(convert_for_binding(std::forward<Args>(args))...);
}


template<typename TupleType>
void bind_all_params(StmtHandle& stmt, TupleType& params_tuple, std::array<SQLLEN, std::tuple_size_v<TupleType>>& indicators) {

    auto bind_one = [&stmt, &indicators](int index, auto& value) {
        using T = std::decay_t<decltype(value)>;

        if constexpr (std::is_same_v<T, std::string>) {
            indicators[index - 1] = SQL_NTS;
            SQLRETURN r = SQLBindParameter(stmt.get(), index, SQL_PARAM_INPUT, SQL_C_CHAR, SQL_VARCHAR,
                                           value.length(), 0, static_cast<SQLPOINTER>(value.data()), 0, &indicators[index - 1]);
            check_odbc_error(r, stmt.get(), SQL_HANDLE_STMT, "SQLBindParameter (string)");
        } else if constexpr (std::is_same_v<T, int>) {
            SQLRETURN r = SQLBindParameter(stmt.get(), index, SQL_PARAM_INPUT, SQL_C_SLONG, SQL_INTEGER, 0, 0, static_cast<SQLPOINTER>(&value), 0, nullptr);
            check_odbc_error(r, stmt.get(), SQL_HANDLE_STMT, "SQLBindParameter (int)");
        } else if constexpr (std::is_same_v<T, long long>) {
            SQLRETURN r = SQLBindParameter(stmt.get(), index, SQL_PARAM_INPUT, SQL_C_SBIGINT, SQL_BIGINT, 0, 0, static_cast<SQLPOINTER>(&value), 0, nullptr);
            check_odbc_error(r, stmt.get(), SQL_HANDLE_STMT, "SQLBindParameter (bigint)");
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for SQL parameter binding");
        }
    };

    int param_index = 1;
    std::apply([&](auto&... param) {
        (bind_one(param_index++, param), ...);
    }, params_tuple);
}

/**
 * @brief Prepares (or reuses) the statement, binds the parameters, executes it
 * and hands the statement to `consume`. A dropped connection is retried once
 * on a fresh connection.
 */
template<typename Consumer, typename... Args>
auto run(std::string_view db_key, std::string_view sql_query, std::string_view operation, Consumer&& consume, Args&&... args) {
    for (int attempt = 1; attempt <= 2; ++attempt) {
        try {
            Connection& conn = ConnectionManager::get_connection(db_key);
            StmtHandle& stmt = conn.get_or_create_statement(sql_query);

            auto params_tuple = make_binding_tuple(args...);
            std::array<SQLLEN, sizeof...(args)> indicators{};
            SQLFreeStmt(stmt.get(), SQL_RESET_PARAMS);
            if constexpr (sizeof...(args) > 0) {
                bind_all_params(stmt, params_tuple, indicators);
            }

            const auto start_time = std::chrono::steady_clock::now();
            SQLRETURN ret = SQLExecute(stmt.get());
            const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_time);
            log::perf("SQL on '{}' took {} microseconds. Query: {}", db_key, duration.count(), sql_query);
            if (ret != SQL_NO_DATA) {
                check_odbc_error(ret, stmt.get(), SQL_HANDLE_STMT, "SQLExecute");
            }

            auto result = consume(stmt, ret);
            SQLFreeStmt(stmt.get(), SQL_CLOSE);
            return result;

        } catch (const sql::error& e) {
            if (attempt == 1 && is_retryable(e)) {
                log::warn("SQL connection error on '{}' (SQLSTATE: {}). Attempting reconnect. Error: {}", db_key, e.sqlstate, e.what());
                ConnectionManager::invalidate_connection(db_key);
                continue;
            }
            throw;
        } catch (const env::error&) {
            throw;
        } catch (const std::exception& e) {
            throw sql::error(std::format("Generic exception in sql::{}: {}", operation, e.what()));
        }
    }
    throw sql::error(std::format("SQL {} failed after multiple attempts.", operation));
}

} // namespace detail


template<typename... Args>
[[nodiscard]] resultset query(std::string_view db_key, std::string_view sql_query, Args&&... args) {
    return detail::run(db_key, sql_query, "query",
        [](const detail::StmtHandle& stmt, SQLRETURN) { return stmt.fetch_all(); },
        std::forward<Args>(args)...);
}

template<typename... Args>
long long exec(std::string_view db_key, std::string_view sql_query, Args&&... args) {
    return detail::run(db_key, sql_query, "exec",
        [](const detail::StmtHandle& stmt, SQLRETURN ret) {
            // A searched UPDATE/DELETE that touches no row reports SQL_NO_DATA.
            return ret == SQL_NO_DATA ? 0LL : stmt.affected_rows();
        },
        std::forward<Args>(args)...);
}

} // namespace mfa::sql

#endif // MFA_SQL_TPP
