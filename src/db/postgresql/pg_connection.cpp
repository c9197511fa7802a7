#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <cstring>
#include <format>
#include <vector>

namespace hookrelay {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return {false, "Connection is null", {}, {}, 0, false};
    }
    return to_result_set(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql, const DbParams& params) {
    if (!conn_) {
        return {false, "Connection is null", {}, {}, 0, false};
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    PGresult* res = PQexecParams(conn_, sql.c_str(),
                                 static_cast<int>(values.size()),
                                 nullptr,            // infer parameter types
                                 values.data(),
                                 nullptr, nullptr,   // text format
                                 0);                 // text results
    return to_result_set(res);
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }
    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }
    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }
    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);
    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }
    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::to_result_set(PGresult* res) {
    if (!res) {
        return {false, PQerrorMessage(conn_), {}, {}, 0, false};
    }

    DbResultSet result;
    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        result.success = true;
        result.has_rows = true;

        const int ncols = PQnfields(res);
        result.column_names.reserve(ncols);
        for (int i = 0; i < ncols; ++i) {
            result.column_names.emplace_back(PQfname(res, i));
        }

        const int nrows = PQntuples(res);
        result.rows.reserve(nrows);
        for (int r = 0; r < nrows; ++r) {
            DbRow row;
            row.reserve(ncols);
            for (int c = 0; c < ncols; ++c) {
                if (PQgetisnull(res, r, c)) {
                    row.emplace_back(std::nullopt);
                } else {
                    row.emplace_back(std::string(PQgetvalue(res, r, c),
                                                 static_cast<size_t>(PQgetlength(res, r, c))));
                }
            }
            result.rows.push_back(std::move(row));
        }
    } else if (status == PGRES_COMMAND_OK) {
        result.success = true;
    } else {
        result.error_message = PQresultErrorMessage(res);
        if (result.error_message.empty()) {
            result.error_message = PQerrorMessage(conn_);
        }
    }

    // RETURNING statements report tuples and a command tag
    const char* affected = PQcmdTuples(res);
    if (result.success && affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected);
    }

    PQclear(res);
    return result;
}

// ============================================================================
// Connect
// ============================================================================

std::unique_ptr<IDbConnection> connect_postgres(const std::string& conninfo) {
    PGconn* conn = PQconnectdb(conninfo.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("Failed to connect to PostgreSQL: {}", PQerrorMessage(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace hookrelay
