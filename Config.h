#pragma once

#include <string>

class Config {
public:
    static const std::string HOST;
    static const int PORT;
    static const std::string DATABASE_URL;
    static const int DB_POOL_SIZE;
    static const int DB_POOL_TIMEOUT_SECONDS;
    static const std::string SCHEMA_PATH;
    static const std::string STATIC_DIR;
    static const std::string SENTRY_DSN;
    static const std::string APP_VERSION;
};
