/*
 * 설명: 채팅 기록(snake_case 키)과 연결 설정(camelCase 키), UI 이벤트의 JSON 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/serialization_test.cpp
 */
#include "client/serialization.hpp"

namespace {
nlohmann::json OptionalString(const std::string &value, bool present) {
    if (!present) {
        return nlohmann::json();
    }
    return nlohmann::json(value);
}

// null이거나 키가 없으면 빈 문자열로 본다.
std::string ReadOptionalString(const nlohmann::json &value, const char *key) {
    nlohmann::json::const_iterator it = value.find(key);
    if (it == value.end() || it->is_null()) {
        return std::string();
    }
    return it->get<std::string>();
}

nlohmann::json UsersToJson(const std::vector<client::ChannelUser> &users) {
    nlohmann::json list = nlohmann::json::array();
    for (std::size_t i = 0; i < users.size(); ++i) {
        nlohmann::json user;
        user["nick"] = users[i].nick;
        user["modes"] = users[i].modes;
        list.push_back(user);
    }
    return list;
}
}  // namespace

namespace client {

nlohmann::json ChatMessageToJson(const ChatMessage &message) {
    nlohmann::json value;
    value["connection_id"] = message.connection_id;
    value["target"] = message.target;
    value["sender"] = OptionalString(message.sender, message.has_sender);
    value["message"] = message.message;
    value["kind"] = MessageKindToString(message.kind);
    value["timestamp"] = message.timestamp;
    if (!message.metadata.is_null()) {
        value["metadata"] = message.metadata;
    }
    return value;
}

bool ChatMessageFromJson(const nlohmann::json &value, ChatMessage &out, std::string &error) {
    try {
        ChatMessage message;
        message.connection_id = value.at("connection_id").get<std::string>();
        message.target = value.at("target").get<std::string>();
        nlohmann::json::const_iterator sender = value.find("sender");
        if (sender != value.end() && !sender->is_null()) {
            message.sender = sender->get<std::string>();
            message.has_sender = true;
        }
        message.message = value.at("message").get<std::string>();
        std::string kind = value.at("kind").get<std::string>();
        if (!ParseMessageKind(kind, message.kind)) {
            error = "unknown message kind: " + kind;
            return false;
        }
        message.timestamp = value.at("timestamp").get<long long>();
        nlohmann::json::const_iterator metadata = value.find("metadata");
        if (metadata != value.end()) {
            message.metadata = *metadata;
        }
        out = message;
        return true;
    } catch (const nlohmann::json::exception &ex) {
        error = ex.what();
        return false;
    }
}

nlohmann::json ConfigToJson(const ConnectionConfig &config) {
    nlohmann::json value;
    value["server"] = config.server;
    value["port"] = config.port;
    value["useTls"] = config.use_tls;
    value["nickname"] = config.nickname;
    value["username"] = OptionalString(config.username, !config.username.empty());
    value["realname"] = OptionalString(config.realname, !config.realname.empty());
    value["password"] = OptionalString(config.password, !config.password.empty());
    value["autoJoin"] = config.auto_join;
    return value;
}

bool ConfigFromJson(const nlohmann::json &value, ConnectionConfig &out, std::string &error) {
    try {
        ConnectionConfig config;
        config.server = value.at("server").get<std::string>();
        config.port = value.at("port").get<int>();
        config.use_tls = value.value("useTls", false);
        config.nickname = value.at("nickname").get<std::string>();
        config.username = ReadOptionalString(value, "username");
        config.realname = ReadOptionalString(value, "realname");
        config.password = ReadOptionalString(value, "password");
        nlohmann::json::const_iterator auto_join = value.find("autoJoin");
        if (auto_join != value.end() && !auto_join->is_null()) {
            config.auto_join = auto_join->get<std::vector<std::string> >();
        }
        if (config.port <= 0 || config.port > 65535) {
            error = "port out of range";
            return false;
        }
        out = config;
        return true;
    } catch (const nlohmann::json::exception &ex) {
        error = ex.what();
        return false;
    }
}

std::string DumpJson(const nlohmann::json &value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json EventToJson(const IrcEvent &event) {
    nlohmann::json value;
    value["type"] = EventTypeToString(event.type);
    switch (event.type) {
        case EventType::kConnected:
            value["connection_id"] = event.connection_id;
            value["nickname"] = event.nickname;
            value["server"] = event.server;
            if (event.has_text) {
                value["message"] = event.text;
            }
            break;
        case EventType::kDisconnected:
            value["connection_id"] = event.connection_id;
            if (event.has_text) {
                value["reason"] = event.text;
            }
            break;
        case EventType::kMessage:
            value["data"] = ChatMessageToJson(event.data);
            break;
        case EventType::kNames:
            value["connection_id"] = event.connection_id;
            value["channel"] = event.channel;
            value["users"] = UsersToJson(event.users);
            break;
        case EventType::kTopic:
            value["connection_id"] = event.connection_id;
            value["channel"] = event.channel;
            value["topic"] = event.text;
            value["setter"] = OptionalString(event.setter, event.has_setter);
            break;
        case EventType::kError:
            value["connection_id"] = event.connection_id;
            value["message"] = event.text;
            break;
    }
    return value;
}

}  // namespace client
