/*
 * 설명: 가짜 IRC 서버를 상대로 세션의 등록, 수신 라인 해석, 명령 처리, 종료 시 Disconnected 단일성을 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "client/session.hpp"

#include <cassert>
#include <fstream>
#include <string>
#include <thread>

#include "test_support.hpp"

using testing_support::FakeIrcServer;
using testing_support::RecordingSink;

namespace {
std::shared_ptr<Logger> QuietLogger() {
    std::shared_ptr<Logger> logger(new Logger());
    logger->SetLevel(config::LogLevel::kError);
    return logger;
}

// 세션 하나를 스레드에서 돌리고, 소멸 시 QUIT을 넣은 뒤 join한다.
class SessionRun {
   public:
    SessionRun(const client::ConnectionConfig &config, const std::string &scrollback_dir = "")
        : dir_(testing_support::MakeTempDir()),
          sink_(new RecordingSink()),
          inbox_(new client::CommandInbox()) {
        std::shared_ptr<Logger> logger = QuietLogger();
        scrollback_.reset(new storage::ScrollbackStore(
            scrollback_dir.empty() ? dir_ + "/scrollback" : scrollback_dir, logger));
        session_.reset(new client::Session("conn-1", config, inbox_, sink_, scrollback_, logger));
        thread_ = std::thread(&client::Session::Run, session_);
    }

    ~SessionRun() {
        Join();
        testing_support::RemoveTree(dir_);
    }

    void Join() {
        if (thread_.joinable()) {
            inbox_->Send(client::ConnectionCommand::Quit());
            thread_.join();
        }
    }

    const std::string &dir() const { return dir_; }
    RecordingSink &sink() { return *sink_; }
    client::CommandInbox &inbox() { return *inbox_; }
    client::Session &session() { return *session_; }
    storage::ScrollbackStore &scrollback() { return *scrollback_; }

   private:
    std::string dir_;
    std::shared_ptr<RecordingSink> sink_;
    std::shared_ptr<client::CommandInbox> inbox_;
    std::shared_ptr<storage::ScrollbackStore> scrollback_;
    std::shared_ptr<client::Session> session_;
    std::thread thread_;
};

void WaitReady(FakeIrcServer &server, SessionRun &run) {
    assert(server.Accept());
    assert(testing_support::SkipRegistration(server));
    assert(run.sink().WaitForCount(client::EventType::kConnected, 1));
}
}  // namespace

void TestHandshakeWithoutPassword() {
    FakeIrcServer server;
    SessionRun run(testing_support::LocalConfig(server.port(), "tester"));
    assert(server.Accept());

    std::string line;
    assert(server.ReadLine(line) && line == "NICK tester");
    assert(server.ReadLine(line) && line == "USER tester 0 * :tester");
    assert(run.sink().WaitForCount(client::EventType::kConnected, 1));

    client::IrcEvent connected;
    assert(run.sink().Last(client::EventType::kConnected, connected));
    assert(connected.connection_id == "conn-1");
    assert(connected.nickname == "tester");
    assert(connected.server == "127.0.0.1");
    assert(connected.text == "connected");
    assert(run.sink().Topics()[0] == client::kEventTopic);

    assert(run.inbox().Send(client::ConnectionCommand::Quit()));
    assert(server.ReadLine(line) && line == "QUIT");
    run.Join();

    assert(run.sink().Count(client::EventType::kDisconnected) == 1);
    client::IrcEvent disconnected;
    assert(run.sink().Last(client::EventType::kDisconnected, disconnected));
    assert(!disconnected.has_text);
    assert(run.session().finished());
    assert(run.session().state() == client::SessionState::kClosed);
    assert(run.inbox().IsClosed());
}

void TestHandshakeWithPassword() {
    FakeIrcServer server;
    client::ConnectionConfig config = testing_support::LocalConfig(server.port(), "tester");
    config.password = "hunter2";
    config.username = "ident";
    config.realname = "Real Name";
    SessionRun run(config);
    assert(server.Accept());

    std::string line;
    assert(server.ReadLine(line) && line == "PASS hunter2");
    assert(server.ReadLine(line) && line == "NICK tester");
    assert(server.ReadLine(line) && line == "USER ident 0 * :Real Name");
}

void TestPingAnsweredSilently() {
    FakeIrcServer server;
    SessionRun run(testing_support::LocalConfig(server.port(), "tester"));
    WaitReady(server, run);

    std::string line;
    server.Send("PING :abc");
    assert(server.ReadLine(line) && line == "PONG :abc");
    server.Send("PING irc.example.net");
    assert(server.ReadLine(line) && line == "PONG :irc.example.net");

    assert(run.sink().Events().size() == 1);
}

void TestWelcomeAutoJoins() {
    FakeIrcServer server;
    client::ConnectionConfig config = testing_support::LocalConfig(server.port(), "tester");
    config.auto_join.push_back("#a");
    config.auto_join.push_back("#b");
    SessionRun run(config);
    WaitReady(server, run);

    std::string line;
    assert(server.ExpectSilence(100));
    server.Send(":irc.example.net 001 tester :Welcome to the network");
    assert(server.ReadLine(line) && line == "JOIN #a");
    assert(server.ReadLine(line) && line == "JOIN #b");
    assert(run.sink().WaitForCount(client::EventType::kConnected, 2));

    client::IrcEvent welcome;
    assert(run.sink().Last(client::EventType::kConnected, welcome));
    assert(welcome.text == "welcome");
}

void TestInboundTraffic() {
    FakeIrcServer server;
    SessionRun run(testing_support::LocalConfig(server.port(), "tester"));
    WaitReady(server, run);

    client::ChatMessage message;

    server.Send(":alice!a@host PRIVMSG #chan :hello all");
    assert(run.sink().WaitForMessage("hello all", message));
    assert(message.target == "#chan");
    assert(message.has_sender && message.sender == "alice");
    assert(message.kind == client::MessageKind::kPrivmsg);
    assert(message.connection_id == "conn-1");

    server.Send(":bob!b@host PRIVMSG TESTER :psst");
    assert(run.sink().WaitForMessage("psst", message));
    assert(message.target == "bob");

    server.Send(":alice!a@host PRIVMSG #chan :\x01" "ACTION waves\x01");
    assert(run.sink().WaitForMessage("waves", message));
    assert(message.kind == client::MessageKind::kAction);

    server.Send(":irc.example.net NOTICE tester :server notice");
    assert(run.sink().WaitForMessage("server notice", message));
    assert(message.kind == client::MessageKind::kNotice);
    assert(message.target == "tester");
    assert(message.sender == "irc.example.net");

    server.Send(":carol!c@host JOIN #chan");
    assert(run.sink().WaitForMessage("carol joined #chan", message));
    assert(message.kind == client::MessageKind::kJoin);
    assert(message.sender == "carol");

    server.Send(":carol!c@host PART #chan :bye");
    assert(run.sink().WaitForMessage("carol left #chan (bye)", message));
    assert(message.kind == client::MessageKind::kPart);

    server.Send(":dave!d@host PART #chan");
    assert(run.sink().WaitForMessage("dave left #chan", message));

    server.Send(":carol!c@host QUIT :gone");
    assert(run.sink().WaitForMessage("carol quit: gone", message));
    assert(message.kind == client::MessageKind::kQuit);
    assert(message.target == "carol");

    server.Send(":irc.example.net 353 tester = #chan :@alice +bob carol");
    assert(run.sink().WaitForCount(client::EventType::kNames, 1));
    client::IrcEvent names;
    assert(run.sink().Last(client::EventType::kNames, names));
    assert(names.channel == "#chan");
    assert(names.users.size() == 3);
    assert(names.users[0].nick == "alice" && names.users[0].modes[0] == "op");
    assert(names.users[1].nick == "bob" && names.users[1].modes[0] == "voice");
    assert(names.users[2].modes.empty());

    server.Send(":irc.example.net 332 tester #chan :the topic");
    assert(run.sink().WaitForMessage("Topic: the topic", message));
    assert(message.kind == client::MessageKind::kTopic);
    client::IrcEvent topic;
    assert(run.sink().Last(client::EventType::kTopic, topic));
    assert(topic.channel == "#chan" && topic.text == "the topic" && !topic.has_setter);

    server.Send(":irc.example.net 433 * tester :Nickname is already in use");
    assert(run.sink().WaitForCount(client::EventType::kError, 1));
    client::IrcEvent error;
    assert(run.sink().Last(client::EventType::kError, error));
    assert(error.text == "nickname already in use");

    // 알 수 없는 명령은 무시된다.
    server.Send(":irc.example.net 372 tester :- motd line");
    server.Send(":alice!a@host PRIVMSG #chan :after motd");
    assert(run.sink().WaitForMessage("after motd", message));

    std::vector<client::IrcEvent> events = run.sink().Events();
    long long last = 0;
    for (std::size_t i = 0; i < events.size(); ++i) {
        if (events[i].type == client::EventType::kMessage) {
            assert(events[i].data.timestamp >= last);
            last = events[i].data.timestamp;
        }
    }

    std::vector<client::ChatMessage> stored;
    std::string read_error;
    assert(run.scrollback().ReadLast("127.0.0.1:" + std::to_string(server.port()) + ":tester",
                                     "#chan", stored, read_error));
    assert(stored.size() == 7);
    assert(stored[0].message == "hello all");
    assert(stored.back().message == "after motd");
}

void TestOutboundCommands() {
    FakeIrcServer server;
    SessionRun run(testing_support::LocalConfig(server.port(), "tester"));
    WaitReady(server, run);

    std::string line;
    assert(run.inbox().Send(client::ConnectionCommand::Join("#x")));
    assert(server.ReadLine(line) && line == "JOIN #x");
    assert(run.inbox().Send(client::ConnectionCommand::Topic("#x")));
    assert(server.ReadLine(line) && line == "TOPIC #x");
    assert(run.inbox().Send(client::ConnectionCommand::Topic("#x", "new topic")));
    assert(server.ReadLine(line) && line == "TOPIC #x :new topic");
    assert(run.inbox().Send(client::ConnectionCommand::Part("#x", "later")));
    assert(server.ReadLine(line) && line == "PART #x :later");
    assert(run.inbox().Send(client::ConnectionCommand::Part("#y")));
    assert(server.ReadLine(line) && line == "PART #y");

    assert(run.inbox().Send(client::ConnectionCommand::Privmsg("#x", "hi there")));
    assert(server.ReadLine(line) && line == "PRIVMSG #x :hi there");
    client::ChatMessage echo;
    assert(run.sink().WaitForMessage("hi there", echo));
    assert(echo.sender == "tester" && echo.target == "#x");
    assert(echo.kind == client::MessageKind::kPrivmsg);

    assert(run.inbox().Send(client::ConnectionCommand::Quit("bye")));
    assert(server.ReadLine(line) && line == "QUIT :bye");
    assert(server.WaitForClose());
    run.Join();

    assert(run.sink().Count(client::EventType::kDisconnected) == 1);
    client::IrcEvent disconnected;
    assert(run.sink().Last(client::EventType::kDisconnected, disconnected));
    assert(disconnected.has_text && disconnected.text == "bye");
}

void TestPeerCloseFlushesFinalLine() {
    FakeIrcServer server;
    SessionRun run(testing_support::LocalConfig(server.port(), "tester"));
    WaitReady(server, run);

    server.SendRaw(":alice!a@host PRIVMSG #chan :tail without newline");
    server.CloseClient();

    assert(run.sink().WaitForCount(client::EventType::kDisconnected, 1));
    client::ChatMessage message;
    assert(run.sink().WaitForMessage("tail without newline", message, 0));
    client::IrcEvent disconnected;
    assert(run.sink().Last(client::EventType::kDisconnected, disconnected));
    assert(disconnected.text == "connection closed");

    run.Join();
    assert(run.sink().Count(client::EventType::kDisconnected) == 1);
    assert(run.inbox().IsClosed());
    assert(!run.inbox().Send(client::ConnectionCommand::Join("#late")));
}

void TestQuitRacingPeerClose() {
    for (int i = 0; i < 5; ++i) {
        FakeIrcServer server;
        SessionRun run(testing_support::LocalConfig(server.port(), "tester"));
        WaitReady(server, run);

        run.inbox().Send(client::ConnectionCommand::Quit("racing"));
        server.CloseClient();
        run.Join();
        assert(run.sink().Count(client::EventType::kDisconnected) == 1);
    }
}

void TestExternalClaimSuppressesDisconnected() {
    FakeIrcServer server;
    SessionRun run(testing_support::LocalConfig(server.port(), "tester"));
    WaitReady(server, run);

    assert(run.session().ClaimDisconnectAnnouncement());
    assert(!run.session().ClaimDisconnectAnnouncement());
    run.Join();
    assert(run.sink().Count(client::EventType::kDisconnected) == 0);
}

void TestConnectFailureReportsError() {
    int port = 0;
    {
        FakeIrcServer closed;
        port = closed.port();
    }

    std::shared_ptr<RecordingSink> sink(new RecordingSink());
    std::shared_ptr<client::CommandInbox> inbox(new client::CommandInbox());
    std::string dir = testing_support::MakeTempDir();
    std::shared_ptr<Logger> logger = QuietLogger();
    std::shared_ptr<storage::ScrollbackStore> scrollback(new storage::ScrollbackStore(dir, logger));
    client::Session session("conn-x", testing_support::LocalConfig(port, "tester"), inbox, sink,
                            scrollback, logger);
    session.Run();

    assert(sink->Count(client::EventType::kError) == 1);
    assert(sink->Count(client::EventType::kConnected) == 0);
    assert(sink->Count(client::EventType::kDisconnected) == 0);
    client::IrcEvent error;
    assert(sink->Last(client::EventType::kError, error));
    assert(error.connection_id == "conn-x");
    assert(error.text.find("failed to connect: ") == 0);
    assert(session.finished());
    assert(inbox->IsClosed());

    testing_support::RemoveTree(dir);
}

void TestScrollbackFailureStillEmits() {
    FakeIrcServer server;
    std::string blocker_dir = testing_support::MakeTempDir();
    const std::string blocker = blocker_dir + "/not-a-dir";
    {
        std::ofstream file(blocker.c_str());
        file << "x";
    }

    SessionRun run(testing_support::LocalConfig(server.port(), "tester"), blocker + "/scrollback");
    WaitReady(server, run);

    server.Send(":alice!a@host PRIVMSG #chan :still delivered");
    client::ChatMessage message;
    assert(run.sink().WaitForMessage("still delivered", message));

    run.Join();
    testing_support::RemoveTree(blocker_dir);
}

void TestLatin1PayloadKeepsSessionAlive() {
    FakeIrcServer server;
    SessionRun run(testing_support::LocalConfig(server.port(), "tester"));
    WaitReady(server, run);

    server.Send(":alice!a@host PRIVMSG #chan :caf\xe9 latin1");
    server.Send(":alice!a@host PRIVMSG #chan :after latin1");
    client::ChatMessage message;
    assert(run.sink().WaitForMessage("after latin1", message));
    assert(run.sink().Count(client::EventType::kError) == 0);
    assert(run.sink().Count(client::EventType::kDisconnected) == 0);

    std::vector<client::ChatMessage> stored;
    std::string error;
    assert(run.scrollback().ReadLast("127.0.0.1:" + std::to_string(server.port()) + ":tester",
                                     "#chan", stored, error));
    assert(stored.size() == 2);
    assert(stored[0].message == "caf\xef\xbf\xbd latin1");
    assert(stored[1].message == "after latin1");
}

void TestTlsHandshakeFailureReportsError() {
    FakeIrcServer server;
    client::ConnectionConfig config = testing_support::LocalConfig(server.port(), "tester");
    config.use_tls = true;
    SessionRun run(config);

    // 평문 서버는 ClientHello에 응답하지 않고 끊는다.
    assert(server.Accept());
    server.CloseClient();
    assert(run.sink().WaitForCount(client::EventType::kError, 1));
    run.Join();

    assert(run.sink().Count(client::EventType::kError) == 1);
    assert(run.sink().Count(client::EventType::kConnected) == 0);
    assert(run.sink().Count(client::EventType::kDisconnected) == 0);
    client::IrcEvent error;
    assert(run.sink().Last(client::EventType::kError, error));
    assert(error.text.find("failed to connect: failed to establish tls stream to 127.0.0.1") == 0);
    assert(run.session().finished());
    assert(run.inbox().IsClosed());
}

int main() {
    TestHandshakeWithoutPassword();
    TestHandshakeWithPassword();
    TestPingAnsweredSilently();
    TestWelcomeAutoJoins();
    TestInboundTraffic();
    TestOutboundCommands();
    TestPeerCloseFlushesFinalLine();
    TestQuitRacingPeerClose();
    TestExternalClaimSuppressesDisconnected();
    TestConnectFailureReportsError();
    TestScrollbackFailureStillEmits();
    TestLatin1PayloadKeepsSessionAlive();
    TestTlsHandshakeFailureReportsError();
    return 0;
}
