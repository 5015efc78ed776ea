#pragma once

#include <string>
#include <vector>

#include <mysqlx/xdevapi.h>

#include "ConnectionPool.h"
#include "LinkStore.h"

/**
 * @brief LinkStore backed by the `links` table through the MySQL X DevAPI.
 *
 * Uniqueness of short_code comes from the table's primary key; the click
 * counter is bumped by a single UPDATE inside a transaction. No application
 * side locking is involved.
 */
class MySqlLinkStore : public LinkStore {
public:
    explicit MySqlLinkStore(ConnectionPool& pool);

    // Executes every statement of the schema file; false if the file is unreadable.
    bool setupDatabase(const std::string& schemaPath);

    // Splits a SQL script on ';', dropping "--" comments and blank statements.
    static std::vector<std::string> splitStatements(const std::string& sqlContent);

    // SELECT used by findAll(): newest first, insertion order breaking timestamp ties.
    static std::string listQuery();

    Link insert(const std::string& code, const std::string& target_url) override;
    std::optional<std::string> recordClick(const std::string& code) override;
    std::unique_ptr<Link> find(const std::string& code) override;
    std::vector<Link> findAll() override;
    bool erase(const std::string& code) override;

private:
    ConnectionPool& pool;

    static Link rowToLink(mysqlx::Row& row);
    static void rollbackQuietly(mysqlx::Session& session, const std::string& function);
    // Marks the lease broken so the pool reconnects it, then throws StoreError.
    [[noreturn]] static void rethrow(PooledSession& session, const mysqlx::Error& e, const std::string& function);
};
