#pragma once

#include "db/iconnection_pool.hpp"
#include "db/idb_connection.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hookrelay::pg {

/**
 * @brief Run one parameterized statement on a pooled connection
 *
 * Throws StorageError when no connection is available or the statement
 * fails; a connection that lost its server is discarded from the pool.
 */
[[nodiscard]] DbResultSet run(IConnectionPool& pool,
                              const std::string& sql,
                              const DbParams& params = {});

// ---- Parameter / column conversion ----------------------------------------
// Timestamps are stored as BIGINT unix milliseconds.

[[nodiscard]] std::string ms_param(std::chrono::system_clock::time_point tp);
[[nodiscard]] std::optional<std::string> ms_param(
    const std::optional<std::chrono::system_clock::time_point>& tp);

[[nodiscard]] std::chrono::system_clock::time_point time_col(const DbRow& row, size_t idx);
[[nodiscard]] std::optional<std::chrono::system_clock::time_point> opt_time_col(const DbRow& row,
                                                                               size_t idx);

[[nodiscard]] std::string text_col(const DbRow& row, size_t idx);
[[nodiscard]] int64_t int_col(const DbRow& row, size_t idx);
[[nodiscard]] std::optional<int> opt_int_col(const DbRow& row, size_t idx);
[[nodiscard]] bool bool_col(const DbRow& row, size_t idx);

} // namespace hookrelay::pg
