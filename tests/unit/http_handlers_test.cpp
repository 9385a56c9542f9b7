/**
 * @file http_handlers_test.cpp
 * @brief Unit tests for the todo HTTP endpoints
 *
 * Runs a real HttpServer over a file store in a scratch directory and drives
 * it with httplib::Client:
 * - Route table and method matching
 * - JSON encoding of records, lists and errors
 * - Status codes (200, 201, 400, 404, 409, 500)
 * - Query parameter decoding and id/title precedence
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "http/server.hpp"
#include "runtime/config.hpp"
#include "service/todo_service.hpp"
#include "store/id_generator.hpp"
#include "store/todo_store.hpp"

// HttpHandlersTest disabled under ThreadSanitizer due to cpp-httplib incompatibility.
// The library's internal threading triggers TSAN segfaults during server initialization.
#if defined(__SANITIZE_THREAD__)
// GCC automatically defines __SANITIZE_THREAD__ when -fsanitize=thread is used
#define TODOD_SKIP_HTTP_TESTS 1
#elif defined(__has_feature)
// Clang requires checking __has_feature(thread_sanitizer)
#if __has_feature(thread_sanitizer)
#define TODOD_SKIP_HTTP_TESTS 1
#else
#define TODOD_SKIP_HTTP_TESTS 0
#endif
#else
#define TODOD_SKIP_HTTP_TESTS 0
#endif

#if !TODOD_SKIP_HTTP_TESTS

namespace fs = std::filesystem;
using namespace todod;
using namespace todod::http;
using namespace testing;

namespace {
constexpr int kTestPort = 19999;
constexpr const char *kJson = "application/json";
}  // namespace

/**
 * @brief Test fixture for HTTP handler tests
 *
 * Uses a dedicated loopback test port to avoid conflicts.
 */
class HttpHandlersTest : public Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
                   ("todod_http_test_" + std::string(UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(temp_dir);
        store_path = temp_dir / "db" / "todo.json";

        todo_store = std::make_unique<store::TodoStore>(store_path.string());
        ids = std::make_unique<store::IdGenerator>();
        todos = std::make_unique<service::TodoService>(*todo_store, *ids);

        runtime::HttpConfig http_config;
        http_config.bind = "127.0.0.1";
        http_config.port = kTestPort;
        http_config.thread_pool_size = 4;

        server = std::make_unique<HttpServer>(http_config, *todos);

        std::string error;
        ASSERT_TRUE(server->start(error)) << "Failed to start HTTP server: " << error;

        // Give server time to bind
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        client = std::make_unique<httplib::Client>("127.0.0.1", kTestPort);
        client->set_connection_timeout(1, 0);  // 1 second timeout
    }

    void TearDown() override {
        client.reset();
        if (server) {
            server->stop();
        }
        server.reset();
        todos.reset();
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    nlohmann::json create(const std::string &title, const std::string &body) {
        nlohmann::json payload = {{"title", title}, {"body", body}};
        auto res = client->Post("/todos/create-todo", payload.dump(), kJson);
        EXPECT_TRUE(res);
        if (!res) {
            return nullptr;
        }
        EXPECT_EQ(201, res->status) << res->body;
        return nlohmann::json::parse(res->body);
    }

    static void ExpectError(const httplib::Result &res, int status, const std::string &message) {
        ASSERT_TRUE(res) << "Request failed";
        EXPECT_EQ(status, res->status);
        EXPECT_EQ(kJson, res->get_header_value("Content-Type"));
        auto json = nlohmann::json::parse(res->body);
        EXPECT_EQ(nlohmann::json({{"error", message}}), json);
    }

    fs::path temp_dir;
    fs::path store_path;
    std::unique_ptr<store::TodoStore> todo_store;
    std::unique_ptr<store::IdGenerator> ids;
    std::unique_ptr<service::TodoService> todos;
    std::unique_ptr<HttpServer> server;
    std::unique_ptr<httplib::Client> client;
};

//=============================================================================
// List
//=============================================================================

TEST_F(HttpHandlersTest, ListWithoutDocumentIsEmptyArray) {
    auto res = client->Get("/todos");

    ASSERT_TRUE(res) << "Request failed";
    EXPECT_EQ(200, res->status);
    EXPECT_EQ(kJson, res->get_header_value("Content-Type"));
    EXPECT_EQ(nlohmann::json::array(), nlohmann::json::parse(res->body));
}

TEST_F(HttpHandlersTest, CreateThenListIncludesRecord) {
    auto created = create("buy milk", "");
    ASSERT_TRUE(created.is_object());

    auto res = client->Get("/todos");
    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);

    auto json = nlohmann::json::parse(res->body);
    ASSERT_EQ(1u, json.size());
    EXPECT_EQ(created, json[0]);
    EXPECT_EQ("buy milk", json[0]["title"]);
    EXPECT_EQ("", json[0]["body"]);
}

//=============================================================================
// Create
//=============================================================================

TEST_F(HttpHandlersTest, CreateReturnsFullRecord) {
    auto res = client->Post("/todos/create-todo", R"({"title":"buy milk","body":""})", kJson);

    ASSERT_TRUE(res);
    EXPECT_EQ(201, res->status);
    EXPECT_EQ(kJson, res->get_header_value("Content-Type"));

    auto json = nlohmann::json::parse(res->body);
    EXPECT_THAT(json["id"].get<std::string>(), MatchesRegex("[0-9]+-[0-9]+"));
    EXPECT_EQ("buy milk", json["title"]);
    EXPECT_EQ("", json["body"]);
    EXPECT_FALSE(json["createdAt"].get<std::string>().empty());

    // Wire key order follows the record layout
    EXPECT_EQ(0u, res->body.find("{\"id\":"));
}

TEST_F(HttpHandlersTest, CreateDuplicateTitleConflicts) {
    create("buy milk", "");

    auto res = client->Post("/todos/create-todo", R"({"title":"buy milk","body":""})", kJson);
    ExpectError(res, 409, "Todo with this title already exists");

    auto listed = client->Get("/todos");
    ASSERT_TRUE(listed);
    EXPECT_EQ(1u, nlohmann::json::parse(listed->body).size());
}

TEST_F(HttpHandlersTest, CreateMissingBodyKey) {
    auto res = client->Post("/todos/create-todo", R"({"title":"buy milk"})", kJson);
    ExpectError(res, 400, "title and body are required");
}

TEST_F(HttpHandlersTest, CreateEmptyTitle) {
    auto res = client->Post("/todos/create-todo", R"({"title":"","body":"x"})", kJson);
    ExpectError(res, 400, "title and body are required");
}

TEST_F(HttpHandlersTest, CreateEmptyRequestBody) {
    auto res = client->Post("/todos/create-todo", "", kJson);
    ExpectError(res, 400, "title and body are required");
}

TEST_F(HttpHandlersTest, CreateMalformedJson) {
    auto res = client->Post("/todos/create-todo", R"({"title": "buy milk",)", kJson);
    ExpectError(res, 400, "Invalid JSON payload");
    EXPECT_FALSE(fs::exists(store_path));
}

//=============================================================================
// Get one
//=============================================================================

TEST_F(HttpHandlersTest, GetByIdMatchesGetByTitle) {
    auto created = create("buy milk", "full fat");
    const std::string id = created["id"].get<std::string>();

    auto by_id = client->Get("/todo?id=" + id);
    auto by_title = client->Get("/todo?title=buy%20milk");

    ASSERT_TRUE(by_id);
    ASSERT_TRUE(by_title);
    EXPECT_EQ(200, by_id->status);
    EXPECT_EQ(200, by_title->status);
    EXPECT_EQ(nlohmann::json::parse(by_id->body), nlohmann::json::parse(by_title->body));
    EXPECT_EQ(created, nlohmann::json::parse(by_id->body));
}

TEST_F(HttpHandlersTest, GetIdTakesPrecedenceOverTitle) {
    auto first = create("first", "");
    create("second", "");
    const std::string id = first["id"].get<std::string>();

    auto res = client->Get("/todo?id=" + id + "&title=second");
    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);
    EXPECT_EQ("first", nlohmann::json::parse(res->body)["title"]);

    auto miss = client->Get("/todo?id=nope&title=second");
    ExpectError(miss, 404, "Todo not found");
}

TEST_F(HttpHandlersTest, UpdateIdTakesPrecedenceOverTitle) {
    auto first = create("first", "first-body");
    create("second", "second-body");
    const std::string id = first["id"].get<std::string>();

    auto res = client->Patch("/todos/update-todo?id=" + id + "&title=second", R"({"body":"changed"})", kJson);
    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status) << res->body;
    EXPECT_EQ("first", nlohmann::json::parse(res->body)["title"].get<std::string>());

    auto second = client->Get("/todo?title=second");
    ASSERT_TRUE(second);
    EXPECT_EQ("second-body", nlohmann::json::parse(second->body)["body"].get<std::string>());
}

TEST_F(HttpHandlersTest, DeleteIdTakesPrecedenceOverTitle) {
    create("second", "");

    ExpectError(client->Delete("/todos/delete-todo?id=nope&title=second"), 404, "Todo not found");

    auto res = client->Get("/todos");
    ASSERT_TRUE(res);
    EXPECT_EQ(1u, nlohmann::json::parse(res->body).size());
}

TEST_F(HttpHandlersTest, GetWithoutParamsIsNotFound) {
    create("first", "");

    ExpectError(client->Get("/todo"), 404, "Todo not found");
}

//=============================================================================
// Update
//=============================================================================

TEST_F(HttpHandlersTest, UpdateByTitleChangesOnlyBody) {
    auto created = create("buy milk", "");

    auto res = client->Patch("/todos/update-todo?title=buy%20milk", R"({"body":"2%"})", kJson);
    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);
    EXPECT_EQ(kJson, res->get_header_value("Content-Type"));

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ("2%", json["body"]);
    EXPECT_EQ(created["id"], json["id"]);
    EXPECT_EQ(created["title"], json["title"]);
    EXPECT_EQ(created["createdAt"], json["createdAt"]);

    auto fetched = client->Get("/todo?title=buy%20milk");
    ASSERT_TRUE(fetched);
    EXPECT_EQ("2%", nlohmann::json::parse(fetched->body)["body"]);
}

TEST_F(HttpHandlersTest, UpdateById) {
    auto created = create("t", "old");
    const std::string id = created["id"].get<std::string>();

    auto res = client->Patch("/todos/update-todo?id=" + id, R"({"body":"new"})", kJson);
    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);
    EXPECT_EQ("new", nlohmann::json::parse(res->body)["body"]);
}

TEST_F(HttpHandlersTest, UpdateMissingBodyKey) {
    create("t", "old");

    auto res = client->Patch("/todos/update-todo?title=t", R"({"title":"renamed"})", kJson);
    ExpectError(res, 400, "body is required in payload");
}

TEST_F(HttpHandlersTest, UpdateUnknownRecord) {
    auto res = client->Patch("/todos/update-todo?title=ghost", R"({"body":"x"})", kJson);
    ExpectError(res, 404, "Todo not found");
}

TEST_F(HttpHandlersTest, UpdateMalformedJson) {
    create("t", "old");

    auto res = client->Patch("/todos/update-todo?title=t", "{body:", kJson);
    ExpectError(res, 400, "Invalid JSON payload");
}

//=============================================================================
// Delete
//=============================================================================

TEST_F(HttpHandlersTest, DeleteByTitleThenGetIsNotFound) {
    auto created = create("buy milk", "");
    const std::string id = created["id"].get<std::string>();

    auto res = client->Delete("/todos/delete-todo?title=buy%20milk");
    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);
    EXPECT_EQ(kJson, res->get_header_value("Content-Type"));
    EXPECT_EQ(nlohmann::json({{"success", true}}), nlohmann::json::parse(res->body));

    ExpectError(client->Get("/todo?title=buy%20milk"), 404, "Todo not found");
    ExpectError(client->Get("/todo?id=" + id), 404, "Todo not found");
}

TEST_F(HttpHandlersTest, DeleteWithoutKey) {
    ExpectError(client->Delete("/todos/delete-todo"), 400, "id or title query param required");
}

TEST_F(HttpHandlersTest, DeleteNoMatch) {
    create("t", "");

    ExpectError(client->Delete("/todos/delete-todo?id=missing"), 404, "Todo not found");
}

//=============================================================================
// Routing and failures
//=============================================================================

TEST_F(HttpHandlersTest, UnknownPathIsRouteNotFound) {
    ExpectError(client->Get("/nope"), 404, "Route Not Found");
}

TEST_F(HttpHandlersTest, WrongMethodIsRouteNotFound) {
    ExpectError(client->Post("/todos", "{}", kJson), 404, "Route Not Found");
    ExpectError(client->Get("/todos/create-todo"), 404, "Route Not Found");
    ExpectError(client->Delete("/todo?id=1"), 404, "Route Not Found");
}

TEST_F(HttpHandlersTest, HeadIsNotAliasedToGet) {
    auto res = client->Head("/todos");
    ASSERT_TRUE(res) << "Request failed";
    EXPECT_EQ(404, res->status);

    auto one = client->Head("/todo?title=x");
    ASSERT_TRUE(one) << "Request failed";
    EXPECT_EQ(404, one->status);
}

TEST_F(HttpHandlersTest, PathsMatchExactly) {
    ExpectError(client->Get("/todos/"), 404, "Route Not Found");
    ExpectError(client->Get("/todos/extra"), 404, "Route Not Found");
}

TEST_F(HttpHandlersTest, CorruptStoreIsInternalServerError) {
    fs::create_directories(store_path.parent_path());
    std::ofstream(store_path) << "{ definitely not a todo list";

    auto res = client->Get("/todos");
    ExpectError(res, 500, "Internal Server Error");

    // Detail stays server-side
    EXPECT_EQ(std::string::npos, res->body.find("todo.json"));

    ExpectError(client->Post("/todos/create-todo", R"({"title":"t","body":""})", kJson), 500,
                "Internal Server Error");
}

TEST_F(HttpHandlersTest, PersistsAcrossServerInstances) {
    create("durable", "yes");

    server->stop();

    // Fresh store/service/server over the same document
    store::TodoStore reopened_store(store_path.string());
    store::IdGenerator reopened_ids;
    service::TodoService reopened(reopened_store, reopened_ids);
    auto listed = reopened.list();
    ASSERT_EQ(service::ResultCode::OK, listed.code);
    ASSERT_EQ(1u, listed.todos.size());
    EXPECT_EQ("durable", listed.todos[0].title.value());
}

TEST_F(HttpHandlersTest, StartTwiceFails) {
    std::string error;
    EXPECT_FALSE(server->start(error));
    EXPECT_EQ("Server already running", error);
}

#endif  // !TODOD_SKIP_HTTP_TESTS
