#pragma once
#include <httplib.h>
#include <string>

/**
 * @brief Console + Sentry logging.
 *
 * Console lines follow the format
 * <date and time> | <FileName> | <class Name> | <function name> | <message>
 * Errors are additionally captured as Sentry events; requests become breadcrumbs.
 * All Sentry calls are no-ops when sentry_init() was never called.
 */
class SaveLogs {
public:
    // Pre-routing hook: logs the request and attaches CORS headers. Always returns true.
    static bool log_request(const httplib::Request &req, httplib::Response &res);

    static void log_info(const std::string &file, const std::string &cls,
                         const std::string &function, const std::string &message);
    static void log_warn(const std::string &file, const std::string &cls,
                         const std::string &function, const std::string &message);
    static void log_error(const std::string &file, const std::string &cls,
                          const std::string &function, const std::string &message);

private:
    static std::string timestamp();
    static void write_line(const std::string &file, const std::string &cls,
                           const std::string &function, const std::string &message);
};
