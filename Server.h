#pragma once
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <string>

#include "LinkRegistry.h"

/**
 * @brief HTTP front of the shortener.
 *
 * Translates requests into LinkRegistry calls and LinkErrors into status codes.
 * Holds no per-request state; the registry reference is shared by all of
 * httplib's worker threads.
 */
class LinkServer {
public:
    LinkServer(LinkRegistry& registry, std::string staticDir);

    // Binds and blocks until stop() is called.
    bool run(const std::string& host, int port);

    // Split bind/listen, used by tests to grab an ephemeral port. Returns -1 on failure.
    int bindToAnyPort(const std::string& host);
    bool listenAfterBind();

    void stop();
    bool isRunning() const;

    static nlohmann::json linkToJson(const Link& link);

    // Percent-encodes every byte that may not appear in a header value (controls, space, DEL, non-ASCII).
    static std::string encodeLocation(const std::string& target);

private:
    httplib::Server svr;
    LinkRegistry& registry;
    std::string staticDir;
    std::chrono::steady_clock::time_point startedAt;

    // --- Middleware ---
    void setupMiddleware();

    // --- Routes ---
    void setupRoutes();
    void handleRedirect(const httplib::Request &req, httplib::Response &res);
    void handleStatsPage(const httplib::Request &req, httplib::Response &res);
    void handleHealth(const httplib::Request &req, httplib::Response &res);
    void handleCreate(const httplib::Request &req, httplib::Response &res);
    void handleList(const httplib::Request &req, httplib::Response &res);
    void handleGet(const httplib::Request &req, httplib::Response &res);
    void handleDelete(const httplib::Request &req, httplib::Response &res);

    // --- Utility ---
    // Runs a handler body and turns any LinkError into its status code and {error} payload.
    static void respondWithErrors(httplib::Response &res, const std::string &function,
                                  const std::function<void()> &body);
    static void sendError(httplib::Response &res, int status, const std::string &message);
    static void sendJson(httplib::Response &res, int status, const nlohmann::json &payload);
};
