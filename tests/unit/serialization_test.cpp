/*
 * 설명: 모든 MessageKind/EventType/CommandType에 변환이 있는지, 채팅 기록과 연결 설정, UI 이벤트의 JSON 형태를 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "client/serialization.hpp"

#include <cassert>
#include <set>
#include <sstream>
#include <string>

#include "client/event_sink.hpp"

void TestEveryMessageKindRoundTrips() {
    const client::MessageKind kinds[] = {
        client::MessageKind::kPrivmsg, client::MessageKind::kAction, client::MessageKind::kNotice,
        client::MessageKind::kJoin,    client::MessageKind::kPart,   client::MessageKind::kQuit,
        client::MessageKind::kNick,    client::MessageKind::kTopic,  client::MessageKind::kInfo,
        client::MessageKind::kError};
    std::set<std::string> names;
    for (std::size_t i = 0; i < sizeof(kinds) / sizeof(kinds[0]); ++i) {
        std::string name = client::MessageKindToString(kinds[i]);
        names.insert(name);
        client::MessageKind parsed = client::MessageKind::kInfo;
        assert(client::ParseMessageKind(name, parsed));
        assert(parsed == kinds[i]);
    }
    assert(names.size() == 10);
    assert(client::MessageKindToString(client::MessageKind::kPrivmsg) == "privmsg");
    assert(client::MessageKindToString(client::MessageKind::kAction) == "action");

    client::MessageKind unused;
    assert(!client::ParseMessageKind("PRIVMSG", unused));
}

void TestEveryEventTypeHasTag() {
    const client::EventType types[] = {client::EventType::kConnected,
                                       client::EventType::kDisconnected,
                                       client::EventType::kMessage,
                                       client::EventType::kNames,
                                       client::EventType::kTopic,
                                       client::EventType::kError};
    std::set<std::string> tags;
    for (std::size_t i = 0; i < sizeof(types) / sizeof(types[0]); ++i) {
        client::IrcEvent event;
        event.type = types[i];
        nlohmann::json value = client::EventToJson(event);
        assert(value["type"] == client::EventTypeToString(types[i]));
        tags.insert(value["type"].get<std::string>());
    }
    assert(tags.size() == 6);
}

void TestEveryCommandTypeHasName() {
    std::set<std::string> names;
    names.insert(client::CommandTypeToString(client::ConnectionCommand::Join("#a").type));
    names.insert(client::CommandTypeToString(client::ConnectionCommand::Part("#a").type));
    names.insert(client::CommandTypeToString(client::ConnectionCommand::Privmsg("#a", "x").type));
    names.insert(client::CommandTypeToString(client::ConnectionCommand::Topic("#a").type));
    names.insert(client::CommandTypeToString(client::ConnectionCommand::Quit().type));
    assert(names.size() == 5);

    client::ConnectionCommand part = client::ConnectionCommand::Part("#a", "bye");
    assert(part.has_text && part.text == "bye");
    assert(!client::ConnectionCommand::Quit().has_text);
}

void TestChatMessageJson() {
    client::ChatMessage message;
    message.connection_id = "conn-1";
    message.target = "#chan";
    message.sender = "alice";
    message.has_sender = true;
    message.message = "hello";
    message.kind = client::MessageKind::kAction;
    message.timestamp = 1700000000123LL;

    nlohmann::json value = client::ChatMessageToJson(message);
    assert(value["connection_id"] == "conn-1");
    assert(value["kind"] == "action");
    assert(value["timestamp"] == 1700000000123LL);
    assert(value.find("metadata") == value.end());

    client::ChatMessage parsed;
    std::string error;
    assert(client::ChatMessageFromJson(value, parsed, error));
    assert(parsed.sender == "alice" && parsed.has_sender);
    assert(parsed.kind == client::MessageKind::kAction);
    assert(parsed.timestamp == message.timestamp);

    message.has_sender = false;
    message.metadata["source"] = "test";
    value = client::ChatMessageToJson(message);
    assert(value["sender"].is_null());
    assert(value["metadata"]["source"] == "test");
    assert(client::ChatMessageFromJson(value, parsed, error));
    assert(!parsed.has_sender);
    assert(parsed.metadata["source"] == "test");

    value["kind"] = "shout";
    assert(!client::ChatMessageFromJson(value, parsed, error));
    nlohmann::json broken;
    broken["target"] = "#chan";
    error.clear();
    assert(!client::ChatMessageFromJson(broken, parsed, error));
    assert(!error.empty());
}

void TestConfigJson() {
    client::ConnectionConfig config;
    config.server = "irc.example.net";
    config.port = 6697;
    config.use_tls = true;
    config.nickname = "tester";
    config.realname = "Test User";
    config.auto_join.push_back("#a");
    config.auto_join.push_back("#b");

    nlohmann::json value = client::ConfigToJson(config);
    assert(value["useTls"] == true);
    assert(value["username"].is_null());
    assert(value["realname"] == "Test User");
    assert(value["autoJoin"].size() == 2);

    client::ConnectionConfig parsed;
    std::string error;
    assert(client::ConfigFromJson(value, parsed, error));
    assert(parsed.StorageKey() == "irc.example.net:6697:tester");
    assert(parsed.EffectiveUsername() == "tester");
    assert(parsed.EffectiveRealname() == "Test User");
    assert(parsed.auto_join[1] == "#b");

    value["port"] = 70000;
    assert(!client::ConfigFromJson(value, parsed, error));
}

void TestEventJsonShapes() {
    nlohmann::json connected = client::EventToJson(
        client::IrcEvent::Connected("c1", "tester", "irc.example.net", "welcome"));
    assert(connected["type"] == "connected");
    assert(connected["message"] == "welcome");
    assert(connected["server"] == "irc.example.net");

    nlohmann::json disconnected = client::EventToJson(client::IrcEvent::Disconnected("c1"));
    assert(disconnected["type"] == "disconnected");
    assert(disconnected.find("reason") == disconnected.end());

    std::vector<client::ChannelUser> users = protocol::DecodeNameList("@alice bob");
    nlohmann::json names = client::EventToJson(client::IrcEvent::Names("c1", "#chan", users));
    assert(names["users"][0]["nick"] == "alice");
    assert(names["users"][0]["modes"][0] == "op");
    assert(names["users"][1]["modes"].empty());

    nlohmann::json topic = client::EventToJson(client::IrcEvent::Topic("c1", "#chan", "hi"));
    assert(topic["topic"] == "hi");
    assert(topic["setter"].is_null());

    client::ChatMessage message;
    message.connection_id = "c1";
    message.target = "#chan";
    message.message = "hey";
    nlohmann::json wrapped = client::EventToJson(client::IrcEvent::Message(message));
    assert(wrapped["type"] == "message");
    assert(wrapped["data"]["message"] == "hey");
}

void TestJsonLineSink() {
    std::ostringstream out;
    client::JsonLineEventSink sink(out);
    sink.Emit(client::kEventTopic, client::IrcEvent::Error("c1", "nickname already in use"));
    std::string line = out.str();
    assert(line.compare(0, 12, "irc://event ") == 0);
    nlohmann::json value = nlohmann::json::parse(line.substr(12));
    assert(value["type"] == "error");
    assert(value["message"] == "nickname already in use");
}

void TestInvalidUtf8Output() {
    nlohmann::json value;
    value["text"] = std::string("caf\xe9");
    assert(client::DumpJson(value) == "{\"text\":\"caf\xef\xbf\xbd\"}");

    client::ChatMessage message;
    message.connection_id = "c1";
    message.target = "#chan";
    message.message = std::string("\xff\xfe raw");
    std::ostringstream out;
    client::JsonLineEventSink sink(out);
    sink.Emit(client::kEventTopic, client::IrcEvent::Message(message));
    nlohmann::json parsed = nlohmann::json::parse(out.str().substr(12));
    assert(parsed["data"]["message"] == "\xef\xbf\xbd\xef\xbf\xbd raw");
}

int main() {
    TestEveryMessageKindRoundTrips();
    TestEveryEventTypeHasTag();
    TestEveryCommandTypeHasName();
    TestChatMessageJson();
    TestConfigJson();
    TestEventJsonShapes();
    TestJsonLineSink();
    TestInvalidUtf8Output();
    return 0;
}
