#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hookrelay {

/// One result row; nullopt marks SQL NULL
using DbRow = std::vector<std::optional<std::string>>;

/// Positional statement parameters ($1, $2, ...); nullopt binds NULL
using DbParams = std::vector<std::optional<std::string>>;

/**
 * @brief Result set from a statement execution
 *
 * Owns the result data (copied out of the native result handle).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT / RETURNING
    std::vector<std::string> column_names;
    std::vector<DbRow> rows;

    // For DML
    uint64_t affected_rows = 0;

    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; thread safety comes from the pool.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute SQL text without parameters (DDL, health checks)
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute a parameterized statement; values are sent out of band
     */
    [[nodiscard]] virtual DbResultSet execute_params(const std::string& sql,
                                                     const DbParams& params) = 0;

    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent statements (0 = none)
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    virtual void close() = 0;
};

} // namespace hookrelay
