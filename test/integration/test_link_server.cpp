#include "LinkErrors.h"
#include "LinkRegistry.h"
#include "MemoryLinkStore.h"
#include "Server.h"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const char* STATS_PAGE = "<html><body>stats page</body></html>";
const char* INDEX_PAGE = "<html><body>dashboard</body></html>";

// Every operation fails the way an unreachable database does.
class FailingLinkStore : public LinkStore {
public:
    Link insert(const std::string&, const std::string&) override { fail(); }
    std::optional<std::string> recordClick(const std::string&) override { fail(); }
    std::unique_ptr<Link> find(const std::string&) override { fail(); }
    std::vector<Link> findAll() override { fail(); }
    bool erase(const std::string&) override { fail(); }

private:
    [[noreturn]] static void fail() {
        throw StoreError("Connection refused by db-internal-7.corp:33060");
    }
};

} // namespace

class LinkServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        staticDir = fs::temp_directory_path() / ("shortlink_static_" + std::to_string(::getpid()));
        fs::create_directories(staticDir);
        std::ofstream(staticDir / "stats.html") << STATS_PAGE;
        std::ofstream(staticDir / "index.html") << INDEX_PAGE;
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
        if (listener.joinable()) {
            listener.join();
        }
        std::error_code ec;
        fs::remove_all(staticDir, ec);
    }

    void start(LinkStore& store) {
        registry = std::make_unique<LinkRegistry>(store);
        server = std::make_unique<LinkServer>(*registry, staticDir.string());
        port = server->bindToAnyPort("127.0.0.1");
        ASSERT_GT(port, 0);
        listener = std::thread([this] { server->listenAfterBind(); });
        for (int i = 0; i < 200 && !server->isRunning(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_TRUE(server->isRunning());
        client = std::make_unique<httplib::Client>("127.0.0.1", port);
    }

    httplib::Result createLink(const json& body) {
        return client->Post("/api/links", body.dump(), "application/json");
    }

    fs::path staticDir;
    std::unique_ptr<LinkRegistry> registry;
    std::unique_ptr<LinkServer> server;
    std::unique_ptr<httplib::Client> client;
    std::thread listener;
    int port = -1;
};

TEST_F(LinkServerTest, EndToEndLifecycle) {
    MemoryLinkStore store;
    start(store);

    auto created = createLink({{"target_url", "https://example.com"}});
    ASSERT_TRUE(created);
    ASSERT_EQ(created->status, 201);
    json link = json::parse(created->body);
    std::string code = link["short_code"];
    EXPECT_EQ(code.size(), 7u);
    EXPECT_EQ(link["target_url"], "https://example.com");
    EXPECT_EQ(link["total_clicks"], 0);
    EXPECT_TRUE(link["last_clicked"].is_null());
    EXPECT_TRUE(link["created_at"].is_string());

    auto redirected = client->Get("/" + code);
    ASSERT_TRUE(redirected);
    EXPECT_EQ(redirected->status, 302);
    EXPECT_EQ(redirected->get_header_value("Location"), "https://example.com");

    auto stats = client->Get("/api/links/" + code);
    ASSERT_TRUE(stats);
    ASSERT_EQ(stats->status, 200);
    json after = json::parse(stats->body);
    EXPECT_EQ(after["total_clicks"], 1);
    EXPECT_FALSE(after["last_clicked"].is_null());

    auto deleted = client->Delete("/api/links/" + code);
    ASSERT_TRUE(deleted);
    EXPECT_EQ(deleted->status, 204);
    EXPECT_TRUE(deleted->body.empty());

    auto gone = client->Get("/" + code);
    ASSERT_TRUE(gone);
    EXPECT_EQ(gone->status, 404);
    EXPECT_TRUE(json::parse(gone->body).contains("error"));
}

TEST_F(LinkServerTest, CreateValidation) {
    MemoryLinkStore store;
    start(store);

    auto missingUrl = createLink({{"short_code", "abc123"}});
    ASSERT_TRUE(missingUrl);
    EXPECT_EQ(missingUrl->status, 400);

    auto emptyUrl = createLink({{"target_url", ""}});
    ASSERT_TRUE(emptyUrl);
    EXPECT_EQ(emptyUrl->status, 400);

    auto badCode = createLink({{"target_url", "https://example.com"}, {"short_code", "a-b"}});
    ASSERT_TRUE(badCode);
    EXPECT_EQ(badCode->status, 400);
    EXPECT_EQ(json::parse(badCode->body)["error"], "Short code must be 6 to 8 alphanumeric characters.");

    auto numericCode = createLink({{"target_url", "https://example.com"}, {"short_code", 123456}});
    ASSERT_TRUE(numericCode);
    EXPECT_EQ(numericCode->status, 400);

    auto notJson = client->Post("/api/links", "target_url=https://example.com", "application/x-www-form-urlencoded");
    ASSERT_TRUE(notJson);
    EXPECT_EQ(notJson->status, 400);

    auto nullCode = createLink({{"target_url", "https://example.com"}, {"short_code", nullptr}});
    ASSERT_TRUE(nullCode);
    EXPECT_EQ(nullCode->status, 201);

    // Only the null-code request persisted anything.
    EXPECT_EQ(store.findAll().size(), 1u);
}

TEST_F(LinkServerTest, DuplicateCodeIsConflict) {
    MemoryLinkStore store;
    start(store);

    auto first = createLink({{"target_url", "https://a.example"}, {"short_code", "myCode1"}});
    ASSERT_TRUE(first);
    EXPECT_EQ(first->status, 201);

    auto second = createLink({{"target_url", "https://b.example"}, {"short_code", "myCode1"}});
    ASSERT_TRUE(second);
    EXPECT_EQ(second->status, 409);

    auto stats = client->Get("/api/links/myCode1");
    ASSERT_TRUE(stats);
    EXPECT_EQ(json::parse(stats->body)["target_url"], "https://a.example");
}

TEST_F(LinkServerTest, ListNewestFirst) {
    MemoryLinkStore store;
    start(store);

    auto empty = client->Get("/api/links");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty->status, 200);
    EXPECT_EQ(json::parse(empty->body), json::array());

    for (const char* code : {"firstAA", "secondB", "thirdCC"}) {
        auto res = createLink({{"target_url", "https://example.com"}, {"short_code", code}});
        ASSERT_TRUE(res);
        ASSERT_EQ(res->status, 201);
    }

    auto listed = client->Get("/api/links");
    ASSERT_TRUE(listed);
    json links = json::parse(listed->body);
    ASSERT_EQ(links.size(), 3u);
    EXPECT_EQ(links[0]["short_code"], "thirdCC");
    EXPECT_EQ(links[1]["short_code"], "secondB");
    EXPECT_EQ(links[2]["short_code"], "firstAA");
}

TEST_F(LinkServerTest, UnknownCodes) {
    MemoryLinkStore store;
    start(store);

    for (const char* path : {"/nothere", "/api/links/nothere"}) {
        auto res = client->Get(path);
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 404) << path;
    }
    auto deleted = client->Delete("/api/links/nothere");
    ASSERT_TRUE(deleted);
    EXPECT_EQ(deleted->status, 404);
}

TEST_F(LinkServerTest, StatsPageIsStaticHtml) {
    MemoryLinkStore store;
    start(store);

    auto res = client->Get("/code/whatever");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, STATS_PAGE);
    EXPECT_NE(res->get_header_value("Content-Type").find("text/html"), std::string::npos);
}

TEST_F(LinkServerTest, HealthEndpointReportsUptime) {
    MemoryLinkStore store;
    start(store);

    auto res = client->Get("/healthz");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["ok"], true);
    EXPECT_TRUE(body["version"].is_string());
    EXPECT_TRUE(body["uptime"].is_number());
    EXPECT_GE(body["uptime"].get<double>(), 0.0);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(LinkServerTest, StoreFailureIsOpaque500) {
    FailingLinkStore store;
    start(store);

    std::vector<httplib::Result> results;
    results.push_back(createLink({{"target_url", "https://example.com"}}));
    results.push_back(client->Get("/api/links"));
    results.push_back(client->Get("/api/links/abc123"));
    results.push_back(client->Delete("/api/links/abc123"));
    results.push_back(client->Get("/abc123"));

    for (auto& res : results) {
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 500);
        EXPECT_EQ(json::parse(res->body)["error"], "Internal server error.");
        EXPECT_EQ(res->body.find("db-internal-7"), std::string::npos);
    }
}

TEST_F(LinkServerTest, RedirectEncodesControlCharacters) {
    MemoryLinkStore store;
    start(store);

    auto created = createLink({{"target_url", "https://a.example/\nx"}, {"short_code", "crlf001"}});
    ASSERT_TRUE(created);
    ASSERT_EQ(created->status, 201);

    auto redirected = client->Get("/crlf001");
    ASSERT_TRUE(redirected);
    EXPECT_EQ(redirected->status, 302);
    EXPECT_EQ(redirected->get_header_value("Location"), "https://a.example/%0Ax");

    // The click is still counted.
    EXPECT_EQ(store.find("crlf001")->total_clicks, 1u);
}

TEST(LinkServerEncodeLocation, EscapesOnlyUnsafeBytes) {
    EXPECT_EQ(LinkServer::encodeLocation("https://example.com/a?b=c&d=%20#frag"),
              "https://example.com/a?b=c&d=%20#frag");
    EXPECT_EQ(LinkServer::encodeLocation("https://a.example/\r\nSet-Cookie: x=1"),
              "https://a.example/%0D%0ASet-Cookie:%20x=1");
    EXPECT_EQ(LinkServer::encodeLocation("https://b.example/caf\xC3\xA9"), "https://b.example/caf%C3%A9");
    EXPECT_EQ(LinkServer::encodeLocation("a\tb\x7F"), "a%09b%7F");
}

TEST_F(LinkServerTest, PreflightAllowsCrossOrigin) {
    MemoryLinkStore store;
    start(store);

    for (const char* path : {"/api/links", "/api/links/abc123"}) {
        auto res = client->Options(path);
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 204) << path;
        EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*") << path;
        std::string methods = res->get_header_value("Access-Control-Allow-Methods");
        for (const char* method : {"GET", "POST", "DELETE", "OPTIONS"}) {
            EXPECT_NE(methods.find(method), std::string::npos) << path << " " << method;
        }
        EXPECT_NE(res->get_header_value("Access-Control-Allow-Headers").find("Content-Type"), std::string::npos);
    }
}

TEST_F(LinkServerTest, DashboardServedAtRoot) {
    MemoryLinkStore store;
    start(store);

    auto root = client->Get("/");
    ASSERT_TRUE(root);
    EXPECT_EQ(root->status, 200);
    EXPECT_EQ(root->body, INDEX_PAGE);

    // A file name wins over the code route.
    auto page = client->Get("/index.html");
    ASSERT_TRUE(page);
    EXPECT_EQ(page->status, 200);
    EXPECT_EQ(page->body, INDEX_PAGE);
    EXPECT_EQ(store.findAll().size(), 0u);
}

TEST_F(LinkServerTest, LongTargetUrlIsKeptWhole) {
    MemoryLinkStore store;
    start(store);

    // Past the 64 KiB a MySQL TEXT column could hold.
    std::string target = "https://example.com/?q=" + std::string(70000, 'a');
    auto created = createLink({{"target_url", target}, {"short_code", "longurl"}});
    ASSERT_TRUE(created);
    ASSERT_EQ(created->status, 201);

    auto stats = client->Get("/api/links/longurl");
    ASSERT_TRUE(stats);
    EXPECT_EQ(json::parse(stats->body)["target_url"], target);
}
