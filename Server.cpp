#include "Server.h"
#include "Config.h"
#include "LinkErrors.h"
#include "Logger.h"

#include <fstream>
#include <sstream>
#include <utility>

using namespace std;
using json = nlohmann::json;

namespace {

const char* FILE_NAME = "Server.cpp";
const char* CLASS_NAME = "LinkServer";
const char* INTERNAL_ERROR = "Internal server error.";

} // namespace

LinkServer::LinkServer(LinkRegistry& registry, std::string staticDir)
    : registry(registry), staticDir(std::move(staticDir)), startedAt(chrono::steady_clock::now()) {
    setupMiddleware();
    setupRoutes();
}

bool LinkServer::run(const string& host, int port) {
    SaveLogs::log_info(FILE_NAME, CLASS_NAME, "run",
                       "Server is running on http://" + host + ":" + to_string(port));
    return svr.listen(host, port);
}

int LinkServer::bindToAnyPort(const string& host) {
    return svr.bind_to_any_port(host);
}

bool LinkServer::listenAfterBind() {
    return svr.listen_after_bind();
}

void LinkServer::stop() {
    svr.stop();
}

bool LinkServer::isRunning() const {
    return svr.is_running();
}

json LinkServer::linkToJson(const Link& link) {
    json j = {
        {"short_code", link.short_code},
        {"target_url", link.target_url},
        {"total_clicks", link.total_clicks},
        {"created_at", link.created_at},
        {"last_clicked", nullptr},
    };
    if (link.last_clicked) {
        j["last_clicked"] = *link.last_clicked;
    }
    return j;
}

std::string LinkServer::encodeLocation(const string& target) {
    static const char HEX[] = "0123456789ABCDEF";
    string encoded;
    encoded.reserve(target.size());
    for (unsigned char c : target) {
        if (c <= 0x20 || c >= 0x7F) {
            encoded += '%';
            encoded += HEX[c >> 4];
            encoded += HEX[c & 0x0F];
        } else {
            encoded += static_cast<char>(c);
        }
    }
    return encoded;
}

// --- Utility Implementation ---

void LinkServer::sendJson(httplib::Response &res, int status, const json &payload) {
    res.status = status;
    res.set_content(payload.dump(), "application/json");
}

void LinkServer::sendError(httplib::Response &res, int status, const string &message) {
    sendJson(res, status, json{{"error", message}});
}

void LinkServer::respondWithErrors(httplib::Response &res, const string &function,
                                   const std::function<void()> &body) {
    try {
        body();
    } catch (const ValidationError &e) {
        sendError(res, 400, e.what());
    } catch (const ConflictError &e) {
        sendError(res, 409, e.what());
    } catch (const NotFoundError &e) {
        sendError(res, 404, e.what());
    } catch (const StoreError &e) {
        // Store detail stays in the logs.
        SaveLogs::log_error(FILE_NAME, CLASS_NAME, function, string("Database error: ") + e.what());
        sendError(res, 500, INTERNAL_ERROR);
    } catch (const exception &e) {
        SaveLogs::log_error(FILE_NAME, CLASS_NAME, function, string("Unexpected error: ") + e.what());
        sendError(res, 500, INTERNAL_ERROR);
    }
}

// --- Middleware Setup ---
void LinkServer::setupMiddleware() {
    svr.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res) {
        SaveLogs::log_request(req, res);
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // Last line of defence for anything thrown outside respondWithErrors.
    svr.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        string detail = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const exception &e) {
            detail = e.what();
        } catch (...) {
            // detail keeps its default
        }
        SaveLogs::log_error(FILE_NAME, CLASS_NAME, "exception_handler", req.method + " " + req.path + ": " + detail);
        sendError(res, 500, INTERNAL_ERROR);
    });

    // Dashboard assets; a file of the same name takes precedence over the /:code route.
    if (!svr.set_mount_point("/", staticDir)) {
        SaveLogs::log_warn(FILE_NAME, CLASS_NAME, "setupMiddleware",
                           "Static directory '" + staticDir + "' not found, dashboard disabled.");
    }
}

// --- Route Setup ---
void LinkServer::setupRoutes() {
    // GET /healthz - registered before the catch-all code route
    svr.Get("/healthz", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleHealth(req, res);
    });

    // GET /code/<code> - stats page, data fetched client-side
    svr.Get(R"(/code/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleStatsPage(req, res);
    });

    svr.Post("/api/links", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleCreate(req, res);
    });

    svr.Get("/api/links", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleList(req, res);
    });

    svr.Get(R"(/api/links/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleGet(req, res);
    });

    svr.Delete(R"(/api/links/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleDelete(req, res);
    });

    // CORS preflight for the JSON API; headers are set by the pre-routing logger
    svr.Options(R"(/api/links(/[^/]+)?)", [](const httplib::Request &, httplib::Response &res) {
        res.status = 204;
    });

    // GET /<short_code> - redirect with click accounting
    svr.Get(R"(/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
        this->handleRedirect(req, res);
    });
}

// --- Route Handlers ---

void LinkServer::handleRedirect(const httplib::Request &req, httplib::Response &res) {
    string code = req.matches[1];
    respondWithErrors(res, "handleRedirect", [&] {
        // target_url is free-form; httplib drops a Location it considers unsafe and answers 200.
        string target = registry.redirect(code);
        res.set_redirect(encodeLocation(target), 302);
    });
}

void LinkServer::handleStatsPage(const httplib::Request &, httplib::Response &res) {
    string path = staticDir + "/stats.html";
    ifstream file(path);
    if (!file.is_open()) {
        SaveLogs::log_error(FILE_NAME, CLASS_NAME, "handleStatsPage", "Could not open " + path);
        sendError(res, 500, INTERNAL_ERROR);
        return;
    }
    stringstream html;
    html << file.rdbuf();
    res.status = 200;
    res.set_content(html.str(), "text/html");
}

void LinkServer::handleHealth(const httplib::Request &, httplib::Response &res) {
    double uptime = chrono::duration<double>(chrono::steady_clock::now() - startedAt).count();
    sendJson(res, 200, json{{"ok", true}, {"version", Config::APP_VERSION}, {"uptime", uptime}});
}

void LinkServer::handleCreate(const httplib::Request &req, httplib::Response &res) {
    json body = json::parse(req.body, nullptr, /*allow_exceptions*/ false);
    if (body.is_discarded() || !body.is_object()) {
        sendError(res, 400, "Invalid JSON body.");
        return;
    }

    string targetUrl;
    auto target = body.find("target_url");
    if (target != body.end() && target->is_string()) {
        targetUrl = target->get<string>();
    }

    optional<string> shortCode;
    auto code = body.find("short_code");
    if (code != body.end() && !code->is_null()) {
        if (!code->is_string()) {
            sendError(res, 400, "Short code must be 6 to 8 alphanumeric characters.");
            return;
        }
        shortCode = code->get<string>();
    }

    respondWithErrors(res, "handleCreate", [&] {
        Link link = registry.create(targetUrl, shortCode);
        SaveLogs::log_info(FILE_NAME, CLASS_NAME, "handleCreate", "Created link " + link.short_code);
        sendJson(res, 201, linkToJson(link));
    });
}

void LinkServer::handleList(const httplib::Request &, httplib::Response &res) {
    respondWithErrors(res, "handleList", [&] {
        json links = json::array();
        for (const auto& link : registry.list()) {
            links.push_back(linkToJson(link));
        }
        sendJson(res, 200, links);
    });
}

void LinkServer::handleGet(const httplib::Request &req, httplib::Response &res) {
    string code = req.matches[1];
    respondWithErrors(res, "handleGet", [&] {
        sendJson(res, 200, linkToJson(registry.get(code)));
    });
}

void LinkServer::handleDelete(const httplib::Request &req, httplib::Response &res) {
    string code = req.matches[1];
    respondWithErrors(res, "handleDelete", [&] {
        registry.remove(code);
        SaveLogs::log_info(FILE_NAME, CLASS_NAME, "handleDelete", "Deleted link " + code);
        res.status = 204;
    });
}
