#include "db/postgresql/pg_store_support.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/pooled_connection.hpp"

#include <format>

namespace hookrelay::pg {

DbResultSet run(IConnectionPool& pool, const std::string& sql, const DbParams& params) {
    auto conn = pool.acquire();
    if (!conn) {
        throw StorageError(std::format("No database connection available from pool '{}'",
                                       pool.name()));
    }

    auto result = (*conn)->execute_params(sql, params);
    if (!result.success) {
        if (!(*conn)->is_connected()) {
            conn->discard();
        }
        throw StorageError(std::format("Statement failed: {}", utils::trim(result.error_message)));
    }
    return result;
}

std::string ms_param(std::chrono::system_clock::time_point tp) {
    return std::to_string(utils::to_unix_millis(tp));
}

std::optional<std::string> ms_param(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return std::nullopt;
    return ms_param(*tp);
}

std::chrono::system_clock::time_point time_col(const DbRow& row, size_t idx) {
    return utils::from_unix_millis(int_col(row, idx));
}

std::optional<std::chrono::system_clock::time_point> opt_time_col(const DbRow& row, size_t idx) {
    if (idx >= row.size() || !row[idx]) return std::nullopt;
    return utils::from_unix_millis(int_col(row, idx));
}

std::string text_col(const DbRow& row, size_t idx) {
    if (idx >= row.size() || !row[idx]) return {};
    return *row[idx];
}

int64_t int_col(const DbRow& row, size_t idx) {
    if (idx >= row.size() || !row[idx]) return 0;
    return utils::parse_int<int64_t>(*row[idx]);
}

std::optional<int> opt_int_col(const DbRow& row, size_t idx) {
    if (idx >= row.size() || !row[idx]) return std::nullopt;
    return utils::try_parse_int<int>(*row[idx]);
}

bool bool_col(const DbRow& row, size_t idx) {
    const auto v = text_col(row, idx);
    return v == "t" || v == "true";
}

} // namespace hookrelay::pg
