#pragma once

/**
 * @file IQueryExecutor.hpp
 * @brief Query execution interface used by the PostgreSQL adapters
 */

#include <json/json.h>
#include <string>
#include <vector>

namespace nfcassociation::infrastructure::persistence {

/**
 * @brief Parameterized SQL execution returning rows as JSON
 *
 * Empty string parameters are bound as SQL NULL. Failures throw
 * shared::exception::InfrastructureException.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute SELECT query
     * @return Array of rows, each a JSON object keyed by column name
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE command
     * @return Number of affected rows
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) = 0;
};

} // namespace nfcassociation::infrastructure::persistence
