#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

#include <mysqlx/xdevapi.h>

class ConnectionPool;

// Borrowed session; goes back to the pool when the lease is destroyed.
class PooledSession {
public:
    PooledSession(ConnectionPool& pool, std::unique_ptr<mysqlx::Session> session);
    ~PooledSession();

    PooledSession(PooledSession&& other) noexcept;
    PooledSession(const PooledSession&) = delete;
    PooledSession& operator=(const PooledSession&) = delete;
    PooledSession& operator=(PooledSession&&) = delete;

    mysqlx::Session& operator*() { return *session; }
    mysqlx::Session* operator->() { return session.get(); }

    // The session hit a driver error; the pool discards it instead of reusing it.
    void markBroken() { broken = true; }

private:
    ConnectionPool* pool;
    std::unique_ptr<mysqlx::Session> session;
    bool broken = false;
};

/**
 * @brief Fixed-size pool of MySQL X DevAPI sessions.
 *
 * Constructed once in main() and handed to MySqlLinkStore by reference, so the
 * lifetime of every database connection is owned by a single object. Sessions
 * are closed when the pool is destroyed.
 *
 * A lease released as broken is dropped. Its slot is reopened through the
 * session factory by the next acquire() that finds no idle session.
 */
class ConnectionPool {
public:
    using SessionFactory = std::function<std::unique_ptr<mysqlx::Session>()>;

    ConnectionPool(std::string uri, int poolSize, std::chrono::seconds acquireTimeout);
    ConnectionPool(SessionFactory factory, int poolSize, std::chrono::seconds acquireTimeout);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Opens poolSize sessions. Returns false (and logs) if any of them fails.
    bool connect();

    // Waits up to acquireTimeout for a free session; throws StoreError on timeout
    // or when a discarded session cannot be reopened.
    PooledSession acquire();

private:
    friend class PooledSession;
    void release(std::unique_ptr<mysqlx::Session> session, bool broken);

    SessionFactory factory;
    int poolSize;
    std::chrono::seconds acquireTimeout;

    std::queue<std::unique_ptr<mysqlx::Session>> connectionPool;
    int missing = 0; // slots whose session was discarded and not yet reopened
    std::mutex poolMutex;
    std::condition_variable poolCv;
};
