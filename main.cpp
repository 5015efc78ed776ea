/**
 * @file main.cpp
 * @brief Entry point of the shortlink service.
 *
 * Builds the long-lived resources in dependency order (Sentry, connection
 * pool, link store, registry, HTTP server) and tears them down in reverse
 * when the listener stops. Without DATABASE_URL the service runs on the
 * in-memory store, which is only suitable for local development.
 */

#include <chrono>
#include <memory>
#include <string>

#include <sentry.h>

#include "Config.h"
#include "ConnectionPool.h"
#include "LinkRegistry.h"
#include "Logger.h"
#include "MemoryLinkStore.h"
#include "MySqlLinkStore.h"
#include "Server.h"
#include "ShutdownSignal.h"

using namespace std;

namespace {

void initSentry() {
    if (Config::SENTRY_DSN.empty()) {
        SaveLogs::log_info("main.cpp", "-", "initSentry", "SENTRY_DSN not set, error reporting is console-only.");
        return;
    }
    sentry_options_t* options = sentry_options_new();
    sentry_options_set_dsn(options, Config::SENTRY_DSN.c_str());
    sentry_options_set_release(options, ("shortlink@" + Config::APP_VERSION).c_str());
    if (sentry_init(options) != 0) {
        SaveLogs::log_warn("main.cpp", "-", "initSentry", "sentry_init failed, continuing without Sentry.");
    }
}

int serve(LinkStore& store, ShutdownSignal& shutdown) {
    LinkRegistry registry(store);
    LinkServer app(registry, Config::STATIC_DIR);

    shutdown.start([&app](int) { app.stop(); });
    bool ok = app.run(Config::HOST, Config::PORT);
    shutdown.stopWaiting();

    if (!ok) {
        SaveLogs::log_error("main.cpp", "-", "serve",
                            "Server failed to listen on " + Config::HOST + ":" + to_string(Config::PORT));
        return 1;
    }
    SaveLogs::log_info("main.cpp", "-", "serve", "Server stopped.");
    return 0;
}

} // namespace

int main() {
    // Before any thread is spawned, so that all of them inherit the blocked mask.
    ShutdownSignal shutdown;
    initSentry();
    SaveLogs::log_info("main.cpp", "-", "main", "Starting shortlink " + Config::APP_VERSION);

    int status = 0;
    if (Config::DATABASE_URL.empty()) {
        SaveLogs::log_warn("main.cpp", "-", "main", "DATABASE_URL not set, falling back to the in-memory store.");
        MemoryLinkStore store;
        status = serve(store, shutdown);
    } else {
        // 1. Initialize Database (Connect and Ensure Schema exists)
        ConnectionPool pool(Config::DATABASE_URL, Config::DB_POOL_SIZE,
                            chrono::seconds(Config::DB_POOL_TIMEOUT_SECONDS));
        MySqlLinkStore store(pool);
        if (!pool.connect() || !store.setupDatabase(Config::SCHEMA_PATH)) {
            SaveLogs::log_error("main.cpp", "-", "main",
                                "Database initialization failed. Check DATABASE_URL and MySQL server status.");
            status = 1;
        } else {
            // 2. Run the Server
            status = serve(store, shutdown);
        }
    }

    sentry_close();
    return status;
}
