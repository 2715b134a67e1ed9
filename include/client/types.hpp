/*
 * 설명: 연결 설정, 세션으로 보내는 명령, 채팅 기록, UI로 내보내는 이벤트 등 엔진의 데이터 모델을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/serialization_test.cpp, tests/unit/session_test.cpp
 */
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "protocol/message.hpp"

namespace client {

extern const char kEventTopic[];

// username/realname/password는 비어 있으면 지정되지 않은 것으로 본다.
struct ConnectionConfig {
    std::string server;
    int port;
    bool use_tls;
    std::string nickname;
    std::string username;
    std::string realname;
    std::string password;
    std::vector<std::string> auto_join;

    ConnectionConfig();

    // server:port:nickname. 대소문자를 구분한다.
    std::string StorageKey() const;
    const std::string &EffectiveUsername() const;
    const std::string &EffectiveRealname() const;
};

enum class CommandType { kJoin, kPart, kPrivmsg, kTopic, kQuit };

struct ConnectionCommand {
    CommandType type;
    // JOIN/PART/TOPIC의 채널 또는 PRIVMSG 대상
    std::string target;
    // PART/QUIT 사유, PRIVMSG 본문, TOPIC 내용
    std::string text;
    bool has_text;

    ConnectionCommand();

    static ConnectionCommand Join(const std::string &channel);
    static ConnectionCommand Part(const std::string &channel);
    static ConnectionCommand Part(const std::string &channel, const std::string &reason);
    static ConnectionCommand Privmsg(const std::string &target, const std::string &message);
    static ConnectionCommand Topic(const std::string &channel);
    static ConnectionCommand Topic(const std::string &channel, const std::string &topic);
    static ConnectionCommand Quit();
    static ConnectionCommand Quit(const std::string &reason);
};

enum class MessageKind {
    kPrivmsg,
    kAction,
    kNotice,
    kJoin,
    kPart,
    kQuit,
    kNick,
    kTopic,
    kInfo,
    kError
};

struct ChatMessage {
    std::string connection_id;
    std::string target;
    std::string sender;
    bool has_sender;
    std::string message;
    MessageKind kind;
    long long timestamp;
    // null이면 메타데이터 없음
    nlohmann::json metadata;

    ChatMessage();
};

typedef protocol::NameEntry ChannelUser;

enum class EventType { kConnected, kDisconnected, kMessage, kNames, kTopic, kError };

struct IrcEvent {
    EventType type;
    std::string connection_id;
    std::string nickname;
    std::string server;
    // Connected.message, Disconnected.reason, Topic.topic, Error.message
    std::string text;
    bool has_text;
    std::string channel;
    std::string setter;
    bool has_setter;
    std::vector<ChannelUser> users;
    ChatMessage data;

    IrcEvent();

    static IrcEvent Connected(const std::string &connection_id, const std::string &nickname,
                              const std::string &server, const std::string &message);
    static IrcEvent Disconnected(const std::string &connection_id);
    static IrcEvent Disconnected(const std::string &connection_id, const std::string &reason);
    static IrcEvent Message(const ChatMessage &message);
    static IrcEvent Names(const std::string &connection_id, const std::string &channel,
                          const std::vector<ChannelUser> &users);
    static IrcEvent Topic(const std::string &connection_id, const std::string &channel,
                          const std::string &topic);
    static IrcEvent Error(const std::string &connection_id, const std::string &message);
};

std::string CommandTypeToString(CommandType type);
std::string MessageKindToString(MessageKind kind);
bool ParseMessageKind(const std::string &raw, MessageKind &out);
std::string EventTypeToString(EventType type);

long long CurrentTimestampMillis();

}  // namespace client
