#include "ConnectionPool.h"
#include "LinkErrors.h"
#include "Logger.h"

#include <utility>

using std::string;
using std::unique_ptr;
using std::lock_guard;
using std::unique_lock;

namespace {

const char* FILE_NAME = "ConnectionPool.cpp";
const char* CLASS_NAME = "ConnectionPool";

} // namespace

// --- PooledSession ---

PooledSession::PooledSession(ConnectionPool& owner, unique_ptr<mysqlx::Session> borrowed)
    : pool(&owner), session(std::move(borrowed)) {}

PooledSession::PooledSession(PooledSession&& other) noexcept
    : pool(other.pool), session(std::move(other.session)), broken(other.broken) {
    other.pool = nullptr;
}

PooledSession::~PooledSession() {
    if (pool) {
        pool->release(std::move(session), broken);
    }
}

// --- ConnectionPool ---

ConnectionPool::ConnectionPool(string uri, int poolSize, std::chrono::seconds acquireTimeout)
    : ConnectionPool(
          [uri = std::move(uri)] { return std::make_unique<mysqlx::Session>(uri); },
          poolSize, acquireTimeout) {}

ConnectionPool::ConnectionPool(SessionFactory factory, int poolSize, std::chrono::seconds acquireTimeout)
    : factory(std::move(factory)), poolSize(poolSize), acquireTimeout(acquireTimeout) {}

ConnectionPool::~ConnectionPool() {
    lock_guard<std::mutex> lock(poolMutex);
    while (!connectionPool.empty()) {
        try {
            if (connectionPool.front()) {
                connectionPool.front()->close();
            }
        } catch (const mysqlx::Error& e) {
            SaveLogs::log_warn(FILE_NAME, CLASS_NAME, "~ConnectionPool",
                               string("Failed to close session: ") + e.what());
        }
        connectionPool.pop();
    }
}

bool ConnectionPool::connect() {
    try {
        for (int i = 0; i < poolSize; ++i) {
            auto session = factory();
            lock_guard<std::mutex> lock(poolMutex);
            connectionPool.push(std::move(session));
        }
        SaveLogs::log_info(FILE_NAME, CLASS_NAME, "connect",
                           "Database connection pool established with " + std::to_string(poolSize) + " sessions.");
        return true;
    } catch (const mysqlx::Error& e) {
        SaveLogs::log_error(FILE_NAME, CLASS_NAME, "connect",
                            string("MySQL X DevAPI connection failed: ") + e.what());
    } catch (const std::exception& e) {
        SaveLogs::log_error(FILE_NAME, CLASS_NAME, "connect",
                            string("Failed to establish pool: ") + e.what());
    }
    return false;
}

PooledSession ConnectionPool::acquire() {
    unique_lock<std::mutex> lock(poolMutex);

    // Wait until the pool has a connection available, or a slot to reopen (with a timeout)
    if (!poolCv.wait_for(lock, acquireTimeout, [this] { return !connectionPool.empty() || missing > 0; })) {
        throw StoreError("Database pool timeout: No connections available.");
    }

    if (!connectionPool.empty()) {
        unique_ptr<mysqlx::Session> session = std::move(connectionPool.front());
        connectionPool.pop();
        return PooledSession(*this, std::move(session));
    }

    // Reopen a discarded slot; the lock is not held while connecting.
    --missing;
    lock.unlock();
    string failure;
    try {
        return PooledSession(*this, factory());
    } catch (const mysqlx::Error& e) {
        failure = e.what();
    } catch (const std::exception& e) {
        failure = e.what();
    }

    lock.lock();
    ++missing;
    lock.unlock();
    poolCv.notify_one();
    SaveLogs::log_error(FILE_NAME, CLASS_NAME, "acquire", "Reconnect failed: " + failure);
    throw StoreError("Database reconnect failed: " + failure);
}

void ConnectionPool::release(unique_ptr<mysqlx::Session> session, bool broken) {
    {
        lock_guard<std::mutex> lock(poolMutex);
        if (broken) {
            ++missing;
        } else {
            connectionPool.push(std::move(session));
        }
    }
    if (broken) {
        SaveLogs::log_warn(FILE_NAME, CLASS_NAME, "release", "Discarding broken session.");
        // Dropped outside the lock; closing a dead socket may take a while.
        session.reset();
    }
    poolCv.notify_one(); // Notify one waiting thread that a connection is free
}
