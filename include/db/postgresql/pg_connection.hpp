#pragma once

#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

namespace hookrelay {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * All libpq calls are encapsulated here. Parameterized statements go
 * through PQexecParams in text format.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(const std::string& sql, const DbParams& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    void close() override;

private:
    /// Consumes res
    DbResultSet to_result_set(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief Open a PgConnection with PQconnectdb
 * @return nullptr when the server refuses; the reason is logged
 */
[[nodiscard]] std::unique_ptr<IDbConnection> connect_postgres(const std::string& conninfo);

} // namespace hookrelay
