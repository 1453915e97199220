#pragma once

/**
 * @file PostgresQueryExecutor.hpp
 * @brief libpq implementation of IQueryExecutor over a single connection
 */

#include "nfcassociation/infrastructure/persistence/IQueryExecutor.hpp"
#include <libpq-fe.h>
#include <mutex>
#include <string>

namespace nfcassociation::infrastructure::persistence {

/**
 * @brief Owns one PGconn, serializes statements and reconnects when the
 * connection drops
 */
class PostgresQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param conninfo libpq connection string
     * @throws shared::exception::InfrastructureException if the first connect fails
     */
    explicit PostgresQueryExecutor(std::string conninfo);
    ~PostgresQueryExecutor() override;

    PostgresQueryExecutor(const PostgresQueryExecutor&) = delete;
    PostgresQueryExecutor& operator=(const PostgresQueryExecutor&) = delete;

    Json::Value executeQuery(const std::string& query,
                             const std::vector<std::string>& params = {}) override;

    int executeCommand(const std::string& query,
                       const std::vector<std::string>& params) override;

    /**
     * @brief Build a conninfo string from discrete settings
     */
    static std::string buildConnInfo(const std::string& host, int port, const std::string& dbName,
                                     const std::string& user, const std::string& password);

private:
    /** Caller holds mutex_ */
    void ensureConnected();

    /** Caller holds mutex_; result must be PQclear'ed */
    PGresult* execute(const std::string& query, const std::vector<std::string>& params);

    static Json::Value pgResultToJson(PGresult* res);

    std::string conninfo_;
    PGconn* conn_ = nullptr;
    std::mutex mutex_;
};

} // namespace nfcassociation::infrastructure::persistence
