/*
 * 설명: 한 줄 명령 해석기의 인자 검사, 오류 출력 형식, 연결 후 명령 흐름을 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "cli/shell.hpp"

#include <cassert>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "test_support.hpp"

using testing_support::FakeIrcServer;
using testing_support::RecordingSink;

namespace {
struct ShellFixture {
    std::string dir;
    std::shared_ptr<RecordingSink> sink;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<storage::ScrollbackStore> scrollback;
    std::shared_ptr<storage::ConfigStore> config_store;
    std::unique_ptr<client::Engine> engine;

    ShellFixture() : dir(testing_support::MakeTempDir()), sink(new RecordingSink()) {
        logger.reset(new Logger());
        logger->SetLevel(config::LogLevel::kError);
        scrollback.reset(new storage::ScrollbackStore(dir + "/scrollback", logger));
        config_store.reset(new storage::ConfigStore(dir + "/connections.json"));
        engine.reset(new client::Engine(sink, scrollback, config_store, logger));
    }

    ~ShellFixture() {
        engine.reset();
        testing_support::RemoveTree(dir);
    }

    std::string Run(const std::string &line, cli::ShellResult *result = NULL) {
        std::ostringstream out;
        cli::ShellResult r = cli::ExecuteLine(*engine, line, out);
        if (result != NULL) {
            *result = r;
        }
        return out.str();
    }
};
}  // namespace

void TestBasicCommands() {
    ShellFixture fx;
    cli::ShellResult result = cli::ShellResult::kExit;

    assert(fx.Run("", &result).empty());
    assert(result == cli::ShellResult::kContinue);
    assert(fx.Run("list").empty());
    assert(fx.Run("saved").empty());
    assert(fx.Run("help").find("connect <server> <port> <nick>") != std::string::npos);

    fx.Run("quit", &result);
    assert(result == cli::ShellResult::kExit);
    fx.Run("exit", &result);
    assert(result == cli::ShellResult::kExit);
}

void TestArgumentErrors() {
    ShellFixture fx;
    assert(fx.Run("connect irc.example.net").find("error: usage: connect") == 0);
    assert(fx.Run("connect irc.example.net port nick").find("error: usage: connect") == 0);
    assert(fx.Run("connect irc.example.net 70000 nick").find("error: usage: connect") == 0);
    assert(fx.Run("join") == "error: missing connection id\n");
    assert(fx.Run("join abc") == "error: missing channel or target\n");
    assert(fx.Run("msg abc #a hi") == "error: connection not found\n");
    assert(fx.Run("msg abc #a") == "error: usage: msg <id> <target> <text...>\n");
    assert(fx.Run("disconnect abc") == "error: connection not found\n");
    assert(fx.Run("scrollback abc") == "error: usage: scrollback <id> <target> [limit]\n");
    assert(fx.Run("scrollback abc #a x") == "error: invalid limit\n");
    assert(fx.Run("scrollback abc #a") == "error: connection not found\n");
    assert(fx.Run("frobnicate abc #a") == "error: unknown command frobnicate\n");
}

void TestConnectedSession() {
    ShellFixture fx;
    FakeIrcServer server;

    std::ostringstream connect;
    connect << "connect 127.0.0.1 " << server.port() << " tester #one,#two";
    std::string id = fx.Run(connect.str());
    assert(!id.empty() && id[id.size() - 1] == '\n');
    id.erase(id.size() - 1);
    assert(id.size() == 36);
    assert(fx.Run("list") == id + "\n");

    std::string saved = fx.Run("saved");
    nlohmann::json profile = nlohmann::json::parse(saved);
    assert(profile["nickname"] == "tester");
    assert(profile["autoJoin"].size() == 2);
    assert(profile["useTls"] == false);

    assert(server.Accept());
    assert(testing_support::SkipRegistration(server));
    std::string line;
    server.Send(":irc.example.net 001 tester :Welcome");
    assert(server.ReadLine(line) && line == "JOIN #one");
    assert(server.ReadLine(line) && line == "JOIN #two");

    assert(fx.Run("msg " + id + " #one hello there friend") == "ok\n");
    assert(server.ReadLine(line) && line == "PRIVMSG #one :hello there friend");
    client::ChatMessage echo;
    assert(fx.sink->WaitForMessage("hello there friend", echo));

    std::string history = fx.Run("scrollback " + id + " #one 5");
    nlohmann::json record = nlohmann::json::parse(history);
    assert(record["message"] == "hello there friend");
    assert(record["kind"] == "privmsg");

    assert(fx.Run("msg " + id + " #one") == "error: usage: msg <id> <target> <text...>\n");
    assert(fx.Run("topic " + id + " #one fresh topic") == "ok\n");
    assert(server.ReadLine(line) && line == "TOPIC #one :fresh topic");
    assert(fx.Run("part " + id + " #two") == "ok\n");
    assert(server.ReadLine(line) && line == "PART #two");
    assert(fx.Run("join " + id + " #three") == "ok\n");
    assert(server.ReadLine(line) && line == "JOIN #three");

    assert(fx.Run("disconnect " + id + " gone for now") == "ok\n");
    assert(server.ReadLine(line) && line == "QUIT :gone for now");
    assert(fx.Run("list").empty());
}

int main() {
    TestBasicCommands();
    TestArgumentErrors();
    TestConnectedSession();
    return 0;
}
