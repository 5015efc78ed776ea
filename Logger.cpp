#include "Logger.h"
#include <sentry.h>
#include <iostream>
#include <sstream>
#include <string>
#include <ctime>
#include <iomanip>
#include <mutex>

using namespace httplib;
using namespace std;

// --- CORS Configuration (dashboard and stats pages call the JSON API) ---
const string CORS_HEADER_KEY = "Access-Control-Allow-Origin";
const string CORS_HEADER_VALUE = "*";

// Keeps lines from concurrent worker threads from interleaving.
static mutex consoleMutex;

string SaveLogs::timestamp() {
    time_t now = time(nullptr);
    tm ltm{};
    stringstream time_ss;
    if (localtime_r(&now, &ltm)) {
        time_ss << put_time(&ltm, "%Y-%m-%d %H:%M:%S");
    } else {
        time_ss << "TIME_ERROR";
    }
    return time_ss.str();
}

void SaveLogs::write_line(const string &file, const string &cls,
                          const string &function, const string &message) {
    string line = timestamp() + " | " + file + " | " + cls + " | " + function + " | " + message;
    lock_guard<mutex> lock(consoleMutex);
    cerr << line << endl;
}

bool SaveLogs::log_request(const Request &req, Response &res) {
    // 1. Prepare Request Details
    string payload_summary;
    bool has_body = req.method == "POST" || req.method == "PUT";
    if (has_body) {
        const size_t max_len = 100;
        payload_summary = (req.body.size() < max_len) ? req.body : req.body.substr(0, max_len) + "...";
    } else {
        payload_summary = "[N/A]";
    }

    // 2. Add CORS headers to response
    res.set_header(CORS_HEADER_KEY, CORS_HEADER_VALUE);
    res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");

    // 3. Sentry breadcrumb, attached to whatever error event follows on this scope
    {
        sentry_value_t crumb = sentry_value_new_breadcrumb("http", (req.method + " " + req.path).c_str());
        sentry_value_t data = sentry_value_new_object();
        sentry_value_set_by_key(data, "ip", sentry_value_new_string(req.remote_addr.c_str()));
        sentry_value_set_by_key(data, "payload_summary", sentry_value_new_string(payload_summary.c_str()));
        sentry_value_set_by_key(crumb, "data", data);
        sentry_add_breadcrumb(crumb);
    }

    // 4. Log to console
    write_line("Logger.cpp", "SaveLogs", "log_request",
               "IP: " + req.remote_addr + ", Method: " + req.method + ", Path: " + req.path
               + " | Payload: " + payload_summary);
    return true;
}

void SaveLogs::log_info(const string &file, const string &cls,
                        const string &function, const string &message) {
    write_line(file, cls, function, message);
}

void SaveLogs::log_warn(const string &file, const string &cls,
                        const string &function, const string &message) {
    write_line(file, cls, function, "WARN: " + message);
}

void SaveLogs::log_error(const string &file, const string &cls,
                         const string &function, const string &message) {
    write_line(file, cls, function, "ERROR: " + message);

    sentry_value_t event = sentry_value_new_message_event(SENTRY_LEVEL_ERROR, "shortlink", message.c_str());
    sentry_value_t tags = sentry_value_new_object();
    sentry_value_set_by_key(tags, "app.file", sentry_value_new_string(file.c_str()));
    sentry_value_set_by_key(tags, "app.class", sentry_value_new_string(cls.c_str()));
    sentry_value_set_by_key(tags, "app.function", sentry_value_new_string(function.c_str()));
    sentry_value_set_by_key(event, "tags", tags);
    sentry_capture_event(event);
}
