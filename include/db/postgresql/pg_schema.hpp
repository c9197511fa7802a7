#pragma once

#include "db/iconnection_pool.hpp"

namespace hookrelay {

/**
 * @brief Creates the four relay tables and their indexes if missing
 *
 * Idempotent; safe to run on every start. Throws StorageError.
 */
class PgSchema {
public:
    static void migrate(IConnectionPool& pool);
};

} // namespace hookrelay
