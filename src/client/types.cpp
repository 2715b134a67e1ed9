/*
 * 설명: 엔진 데이터 모델의 생성 헬퍼와 열거형 문자열 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/serialization_test.cpp
 */
#include "client/types.hpp"

#include <chrono>
#include <sstream>

namespace client {

const char kEventTopic[] = "irc://event";

ConnectionConfig::ConnectionConfig() : port(6667), use_tls(false) {}

std::string ConnectionConfig::StorageKey() const {
    std::ostringstream oss;
    oss << server << ":" << port << ":" << nickname;
    return oss.str();
}

const std::string &ConnectionConfig::EffectiveUsername() const {
    return username.empty() ? nickname : username;
}

const std::string &ConnectionConfig::EffectiveRealname() const {
    return realname.empty() ? nickname : realname;
}

ConnectionCommand::ConnectionCommand() : type(CommandType::kQuit), has_text(false) {}

ConnectionCommand ConnectionCommand::Join(const std::string &channel) {
    ConnectionCommand cmd;
    cmd.type = CommandType::kJoin;
    cmd.target = channel;
    return cmd;
}

ConnectionCommand ConnectionCommand::Part(const std::string &channel) {
    ConnectionCommand cmd;
    cmd.type = CommandType::kPart;
    cmd.target = channel;
    return cmd;
}

ConnectionCommand ConnectionCommand::Part(const std::string &channel, const std::string &reason) {
    ConnectionCommand cmd = Part(channel);
    cmd.text = reason;
    cmd.has_text = true;
    return cmd;
}

ConnectionCommand ConnectionCommand::Privmsg(const std::string &target,
                                             const std::string &message) {
    ConnectionCommand cmd;
    cmd.type = CommandType::kPrivmsg;
    cmd.target = target;
    cmd.text = message;
    cmd.has_text = true;
    return cmd;
}

ConnectionCommand ConnectionCommand::Topic(const std::string &channel) {
    ConnectionCommand cmd;
    cmd.type = CommandType::kTopic;
    cmd.target = channel;
    return cmd;
}

ConnectionCommand ConnectionCommand::Topic(const std::string &channel, const std::string &topic) {
    ConnectionCommand cmd = Topic(channel);
    cmd.text = topic;
    cmd.has_text = true;
    return cmd;
}

ConnectionCommand ConnectionCommand::Quit() {
    ConnectionCommand cmd;
    cmd.type = CommandType::kQuit;
    return cmd;
}

ConnectionCommand ConnectionCommand::Quit(const std::string &reason) {
    ConnectionCommand cmd = Quit();
    cmd.text = reason;
    cmd.has_text = true;
    return cmd;
}

ChatMessage::ChatMessage() : has_sender(false), kind(MessageKind::kInfo), timestamp(0) {}

IrcEvent::IrcEvent() : type(EventType::kError), has_text(false), has_setter(false) {}

IrcEvent IrcEvent::Connected(const std::string &connection_id, const std::string &nickname,
                             const std::string &server, const std::string &message) {
    IrcEvent event;
    event.type = EventType::kConnected;
    event.connection_id = connection_id;
    event.nickname = nickname;
    event.server = server;
    event.text = message;
    event.has_text = true;
    return event;
}

IrcEvent IrcEvent::Disconnected(const std::string &connection_id) {
    IrcEvent event;
    event.type = EventType::kDisconnected;
    event.connection_id = connection_id;
    return event;
}

IrcEvent IrcEvent::Disconnected(const std::string &connection_id, const std::string &reason) {
    IrcEvent event = Disconnected(connection_id);
    event.text = reason;
    event.has_text = true;
    return event;
}

IrcEvent IrcEvent::Message(const ChatMessage &message) {
    IrcEvent event;
    event.type = EventType::kMessage;
    event.connection_id = message.connection_id;
    event.data = message;
    return event;
}

IrcEvent IrcEvent::Names(const std::string &connection_id, const std::string &channel,
                         const std::vector<ChannelUser> &users) {
    IrcEvent event;
    event.type = EventType::kNames;
    event.connection_id = connection_id;
    event.channel = channel;
    event.users = users;
    return event;
}

IrcEvent IrcEvent::Topic(const std::string &connection_id, const std::string &channel,
                         const std::string &topic) {
    IrcEvent event;
    event.type = EventType::kTopic;
    event.connection_id = connection_id;
    event.channel = channel;
    event.text = topic;
    event.has_text = true;
    return event;
}

IrcEvent IrcEvent::Error(const std::string &connection_id, const std::string &message) {
    IrcEvent event;
    event.type = EventType::kError;
    event.connection_id = connection_id;
    event.text = message;
    event.has_text = true;
    return event;
}

std::string CommandTypeToString(CommandType type) {
    switch (type) {
        case CommandType::kJoin:
            return "join";
        case CommandType::kPart:
            return "part";
        case CommandType::kPrivmsg:
            return "privmsg";
        case CommandType::kTopic:
            return "topic";
        case CommandType::kQuit:
            return "quit";
    }
    return "quit";
}

std::string MessageKindToString(MessageKind kind) {
    switch (kind) {
        case MessageKind::kPrivmsg:
            return "privmsg";
        case MessageKind::kAction:
            return "action";
        case MessageKind::kNotice:
            return "notice";
        case MessageKind::kJoin:
            return "join";
        case MessageKind::kPart:
            return "part";
        case MessageKind::kQuit:
            return "quit";
        case MessageKind::kNick:
            return "nick";
        case MessageKind::kTopic:
            return "topic";
        case MessageKind::kInfo:
            return "info";
        case MessageKind::kError:
            return "error";
    }
    return "info";
}

bool ParseMessageKind(const std::string &raw, MessageKind &out) {
    static const MessageKind kAll[] = {
        MessageKind::kPrivmsg, MessageKind::kAction, MessageKind::kNotice, MessageKind::kJoin,
        MessageKind::kPart,    MessageKind::kQuit,   MessageKind::kNick,   MessageKind::kTopic,
        MessageKind::kInfo,    MessageKind::kError};
    for (std::size_t i = 0; i < sizeof(kAll) / sizeof(kAll[0]); ++i) {
        if (MessageKindToString(kAll[i]) == raw) {
            out = kAll[i];
            return true;
        }
    }
    return false;
}

std::string EventTypeToString(EventType type) {
    switch (type) {
        case EventType::kConnected:
            return "connected";
        case EventType::kDisconnected:
            return "disconnected";
        case EventType::kMessage:
            return "message";
        case EventType::kNames:
            return "names";
        case EventType::kTopic:
            return "topic";
        case EventType::kError:
            return "error";
    }
    return "error";
}

long long CurrentTimestampMillis() {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::system_clock;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace client
