/**
 * @file PostgresQueryExecutor.cpp
 * @brief PostgresQueryExecutor implementation
 */

#include "nfcassociation/infrastructure/persistence/PostgresQueryExecutor.hpp"
#include "shared/exception/Exceptions.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace nfcassociation::infrastructure::persistence {

using shared::exception::InfrastructureException;

namespace {

// PostgreSQL type OIDs
constexpr Oid BOOLOID = 16;
constexpr Oid INT8OID = 20;
constexpr Oid INT2OID = 21;
constexpr Oid INT4OID = 23;
constexpr Oid FLOAT4OID = 700;
constexpr Oid FLOAT8OID = 701;

std::string quoteConnValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted.push_back('\\');
        quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

} // anonymous namespace

PostgresQueryExecutor::PostgresQueryExecutor(std::string conninfo)
    : conninfo_(std::move(conninfo)) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureConnected();
    spdlog::info("[PostgresQueryExecutor] Connected to PostgreSQL");
}

PostgresQueryExecutor::~PostgresQueryExecutor() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::string PostgresQueryExecutor::buildConnInfo(const std::string& host, int port, const std::string& dbName,
                                                 const std::string& user, const std::string& password) {
    return "host=" + quoteConnValue(host) +
           " port=" + std::to_string(port) +
           " dbname=" + quoteConnValue(dbName) +
           " user=" + quoteConnValue(user) +
           " password=" + quoteConnValue(password) +
           " connect_timeout=5";
}

void PostgresQueryExecutor::ensureConnected() {
    if (conn_ && PQstatus(conn_) == CONNECTION_OK) {
        return;
    }

    if (conn_) {
        spdlog::warn("[PostgresQueryExecutor] Connection lost, reconnecting");
        PQreset(conn_);
        if (PQstatus(conn_) == CONNECTION_OK) {
            return;
        }
        PQfinish(conn_);
        conn_ = nullptr;
    }

    conn_ = PQconnectdb(conninfo_.c_str());
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw InfrastructureException("DB_CONNECTION_FAILED", "PostgreSQL connection failed: " + error);
    }
}

PGresult* PostgresQueryExecutor::execute(const std::string& query, const std::vector<std::string>& params) {
    ensureConnected();

    // Empty strings are bound as NULL
    std::vector<const char*> paramValues;
    for (const auto& param : params) {
        paramValues.push_back(param.empty() ? nullptr : param.c_str());
    }

    PGresult* res = PQexecParams(
        conn_,
        query.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        paramValues.data(),
        nullptr,
        nullptr,
        0
    );

    if (!res) {
        throw InfrastructureException("DB_QUERY_FAILED", "Query execution failed: null result");
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        std::string error = PQerrorMessage(conn_);
        PQclear(res);
        throw InfrastructureException("DB_QUERY_FAILED", "Query failed: " + error);
    }
    return res;
}

Json::Value PostgresQueryExecutor::executeQuery(const std::string& query,
                                                const std::vector<std::string>& params) {
    spdlog::debug("[PostgresQueryExecutor] Query: {} ({} params)", query, params.size());

    std::lock_guard<std::mutex> lock(mutex_);
    PGresult* res = execute(query, params);
    Json::Value result = pgResultToJson(res);
    PQclear(res);
    return result;
}

int PostgresQueryExecutor::executeCommand(const std::string& query,
                                          const std::vector<std::string>& params) {
    spdlog::debug("[PostgresQueryExecutor] Command: {} ({} params)", query, params.size());

    std::lock_guard<std::mutex> lock(mutex_);
    PGresult* res = execute(query, params);

    const char* affectedRowsStr = PQcmdTuples(res);
    int affectedRows = 0;
    if (affectedRowsStr && affectedRowsStr[0] != '\0') {
        affectedRows = std::atoi(affectedRowsStr);
    }
    PQclear(res);
    return affectedRows;
}

Json::Value PostgresQueryExecutor::pgResultToJson(PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            const char* fieldName = PQfname(res, j);

            if (PQgetisnull(res, i, j)) {
                row[fieldName] = Json::nullValue;
                continue;
            }

            const char* value = PQgetvalue(res, i, j);
            Oid type = PQftype(res, j);

            if (type == INT2OID || type == INT4OID) {
                row[fieldName] = std::atoi(value);
            } else if (type == INT8OID) {
                row[fieldName] = static_cast<Json::Int64>(std::atoll(value));
            } else if (type == FLOAT4OID || type == FLOAT8OID) {
                row[fieldName] = std::atof(value);
            } else if (type == BOOLOID) {
                row[fieldName] = (value[0] == 't');
            } else {
                row[fieldName] = value;
            }
        }
        array.append(row);
    }

    return array;
}

} // namespace nfcassociation::infrastructure::persistence
