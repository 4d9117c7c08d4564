#include <gtest/gtest.h>
#include <http/bridge_api.hpp>
#include <http/http_server.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using json = nlohmann::json;

TEST(HttpParse, RequestWithBody) {
    std::string raw =
        "POST /cli?x=1 HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 16\r\n"
        "\r\n"
        "{\"args\":[\"ver\"]}";
    EXPECT_EQ(complete_request_size(raw), raw.size());

    auto r = parse_http_request(raw);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.method, "POST");
    EXPECT_EQ(r.value.path, "/cli");
    EXPECT_EQ(r.value.target, "/cli?x=1");
    EXPECT_EQ(r.value.header("content-type"), "application/json");
    EXPECT_EQ(r.value.header("CONTENT-TYPE"), "application/json");
    EXPECT_EQ(r.value.body, "{\"args\":[\"ver\"]}");
}

TEST(HttpParse, IncompleteRequestNeedsMoreBytes) {
    EXPECT_EQ(complete_request_size("GET /health HTTP/1.1\r\nHost: x\r\n"), 0u);
    EXPECT_EQ(complete_request_size("POST /cli HTTP/1.1\r\nContent-Length: 10\r\n\r\n{}"), 0u);
    std::string get = "GET /health HTTP/1.1\r\n\r\n";
    EXPECT_EQ(complete_request_size(get), get.size());
}

TEST(HttpParse, MalformedRequests) {
    EXPECT_TRUE(parse_http_request("GARBAGE\r\n\r\n").is_err());
    EXPECT_TRUE(parse_http_request("GET / SPDY/3\r\n\r\n").is_err());
    EXPECT_TRUE(parse_http_request("GET / HTTP/1.1\r\nno-colon\r\n\r\n").is_err());
    EXPECT_TRUE(parse_http_request(
        "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n0\r\n\r\n").is_err());
}

TEST(HttpResponse, SerializeHasLengthAndClose) {
    auto resp = HttpResponse::json(503, {{"ok", false}});
    std::string s = resp.serialize();
    EXPECT_EQ(s.rfind("HTTP/1.1 503 Service Unavailable\r\n", 0), 0u);
    EXPECT_NE(s.find("Content-Length: 12\r\n"), std::string::npos);
    EXPECT_NE(s.find("Connection: close\r\n"), std::string::npos);
}

TEST(CliRequest, ArgsAndTimeout) {
    auto r = parse_cli_request(R"({"args": ["msg", "bob", "hi there"], "timeout": 2.5})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.args.size(), 3u);
    ASSERT_TRUE(r.value.timeout.has_value());
    EXPECT_EQ(r.value.timeout->count(), 2500);
}

TEST(CliRequest, RawCommand) {
    auto r = parse_cli_request(R"({"command": "infos"})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.command, "infos");
    EXPECT_FALSE(r.value.timeout.has_value());
}

TEST(CliRequest, Rejections) {
    EXPECT_TRUE(parse_cli_request("not json").is_err());
    EXPECT_TRUE(parse_cli_request("[]").is_err());
    EXPECT_TRUE(parse_cli_request("{}").is_err());
    EXPECT_TRUE(parse_cli_request(R"({"args": "recv"})").is_err());
    EXPECT_TRUE(parse_cli_request(R"({"args": []})").is_err());
    EXPECT_TRUE(parse_cli_request(R"({"args": ["a", 1]})").is_err());
    EXPECT_TRUE(parse_cli_request(R"({"command": 5})").is_err());
    EXPECT_TRUE(parse_cli_request(R"({"args": ["recv"], "timeout": -1})").is_err());
    EXPECT_TRUE(parse_cli_request(R"({"args": ["recv"], "timeout": "60"})").is_err());
}

TEST(CliRequest, TimeoutAboveOneDayRejected) {
    EXPECT_TRUE(parse_cli_request(R"({"args": ["infos"], "timeout": 86400})").is_ok());
    auto r = parse_cli_request(R"({"args": ["infos"], "timeout": 1e10})");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("86400"), std::string::npos);
    EXPECT_TRUE(parse_cli_request(R"({"args": ["infos"], "timeout": 1e400})").is_err());
}

TEST(CliResult, JsonShape) {
    auto ok = command_result_json(CommandResult::ok("a\nb"));
    EXPECT_EQ(ok["success"], true);
    EXPECT_EQ(ok["stdout"], "a\nb");
    EXPECT_EQ(ok["returncode"], 0);
    EXPECT_TRUE(ok["error"].is_null());

    auto bad = command_result_json(CommandResult::fail(CommandError::Timeout, "Command timeout"));
    EXPECT_EQ(bad["success"], false);
    EXPECT_EQ(bad["stderr"], "Command timeout");
    EXPECT_EQ(bad["returncode"], -1);
    EXPECT_EQ(bad["error"], "timeout");

    EXPECT_EQ(command_http_status(CommandResult::fail(CommandError::Malformed, "")), 400);
    EXPECT_EQ(command_http_status(CommandResult::fail(CommandError::NotRunning, "")), 503);
    EXPECT_EQ(command_http_status(CommandResult::fail(CommandError::SessionCrashed, "")), 200);
}

class BridgeApiTest : public ::testing::Test {
protected:
    BridgeConfig cfg;
    std::unique_ptr<SessionSupervisor> supervisor;
    std::unique_ptr<BridgeApi> api;

    void SetUp() override {
        cfg.serial_port = "/dev/ttyTEST";
        cfg.device_name = "api";
        supervisor = std::make_unique<SessionSupervisor>(cfg);   // never started
        api = std::make_unique<BridgeApi>(*supervisor);
    }

    HttpRequest post_cli(const std::string& body) {
        HttpRequest req;
        req.method = "POST";
        req.path = "/cli";
        req.body = body;
        return req;
    }
};

TEST_F(BridgeApiTest, HealthUnhealthyBeforeStart) {
    auto resp = api->handle_health(HttpRequest{});
    EXPECT_EQ(resp.status, 200);
    auto j = json::parse(resp.body);
    EXPECT_EQ(j["status"], "unhealthy");
    EXPECT_EQ(j["serial_port"], "/dev/ttyTEST");
    EXPECT_EQ(j["device_name"], "api");
    EXPECT_TRUE(j["pid"].is_null());
    EXPECT_EQ(j["pending_commands"], 0);
    EXPECT_NE(j["advert_log"].get<std::string>().find("api.adverts.jsonl"), std::string::npos);
}

TEST_F(BridgeApiTest, CliNotRunningIs503) {
    auto resp = api->handle_cli(post_cli(R"({"args": ["infos"]})"));
    EXPECT_EQ(resp.status, 503);
    auto j = json::parse(resp.body);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error"], "not_running");
}

TEST_F(BridgeApiTest, CliValidationIs400) {
    EXPECT_EQ(api->handle_cli(post_cli("{}")).status, 400);
    EXPECT_EQ(api->handle_cli(post_cli("{bad")).status, 400);

    auto resp = api->handle_cli(post_cli(R"({"args": ["msg", "a\nb"]})"));
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(json::parse(resp.body)["error"], "malformed");
}

TEST_F(BridgeApiTest, RecvDefaultsToLongTimeout) {
    EXPECT_EQ(supervisor->default_timeout({"recv"}), std::chrono::seconds(60));
    EXPECT_EQ(supervisor->default_timeout({"infos"}), std::chrono::seconds(10));
}

// ── Live server ────────────────────────────────────────────────

static std::string http_roundtrip(int port, const std::string& request) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return "";
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        close(fd);
        return "";
    }
    platform::send_all(fd, request);

    std::string response;
    char buf[1024];
    ssize_t n;
    while ((n = recv(fd, buf, sizeof(buf), 0)) > 0) response.append(buf, static_cast<size_t>(n));
    close(fd);
    return response;
}

TEST(HttpServer, RoutesOverRealSocket) {
    HttpServer server("127.0.0.1", 0);
    server.route("GET", "/ping", [](const HttpRequest&) {
        return HttpResponse::json(200, {{"pong", true}});
    });
    server.route("POST", "/boom", [](const HttpRequest&) -> HttpResponse {
        throw std::runtime_error("handler exploded");
    });
    ASSERT_TRUE(server.start().is_ok());
    ASSERT_GT(server.port(), 0);

    auto ok = http_roundtrip(server.port(), "GET /ping HTTP/1.1\r\nHost: x\r\n\r\n");
    EXPECT_EQ(ok.rfind("HTTP/1.1 200 OK", 0), 0u);
    EXPECT_NE(ok.find("{\"pong\":true}"), std::string::npos);

    auto missing = http_roundtrip(server.port(), "GET /nope HTTP/1.1\r\n\r\n");
    EXPECT_EQ(missing.rfind("HTTP/1.1 404", 0), 0u);

    auto wrong = http_roundtrip(server.port(), "POST /ping HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(wrong.rfind("HTTP/1.1 405", 0), 0u);

    auto boom = http_roundtrip(server.port(), "POST /boom HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    EXPECT_EQ(boom.rfind("HTTP/1.1 500", 0), 0u);

    server.stop();
    EXPECT_FALSE(server.is_running());
}
