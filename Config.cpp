#include "Config.h"
#include <cstdlib>
#include <string>
#include <iostream>
using namespace std;

// Reads an environment variable, falling back to a local default when unset or empty.
static std::string getEnv(const char* name, const std::string& defaultValue = "") {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
        return std::string(value);
    }
    return defaultValue;
}

static int getEnvInt(const char* name, int defaultValue) {
    std::string raw = getEnv(name);
    if (raw.empty()) return defaultValue;
    try {
        int parsed = std::stoi(raw);
        if (parsed > 0) return parsed;
    } catch (const std::exception&) {
        // fall through to the warning below
    }
    // SaveLogs is not usable during static initialisation, write straight to stderr.
    cerr << "CONFIG_WARN: Ignoring invalid value '" << raw << "' for " << name
         << ", using " << defaultValue << endl;
    return defaultValue;
}

// --- Definitions of Static Member Variables ---

// Listener
const std::string Config::HOST = getEnv("HOST", "0.0.0.0");
const int Config::PORT = getEnvInt("PORT", 3000);

// Datastore (MUST be set via Environment Variables in Production, empty selects the in-memory store)
const std::string Config::DATABASE_URL = getEnv("DATABASE_URL");
const int Config::DB_POOL_SIZE = getEnvInt("DB_POOL_SIZE", 10);
const int Config::DB_POOL_TIMEOUT_SECONDS = getEnvInt("DB_POOL_TIMEOUT_SECONDS", 5);
const std::string Config::SCHEMA_PATH = getEnv("SCHEMA_PATH", "schema.sql");

// Front-end assets and error reporting
const std::string Config::STATIC_DIR = getEnv("STATIC_DIR", "public");
const std::string Config::SENTRY_DSN = getEnv("SENTRY_DSN");
const std::string Config::APP_VERSION = getEnv("APP_VERSION", "1.0");
