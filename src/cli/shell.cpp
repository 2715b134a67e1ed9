/*
 * 설명: connect/disconnect/join/part/msg/topic/scrollback/list/saved 명령을 해석해 엔진을 호출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/shell_test.cpp
 */
#include "cli/shell.hpp"

#include <cstdlib>
#include <sstream>
#include <vector>

#include "client/serialization.hpp"

namespace {
std::vector<std::string> Split(const std::string &text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, delimiter)) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// 공백 하나를 건너뛴 나머지 전체를 돌려준다.
std::string Rest(std::istringstream &iss) {
    std::string rest;
    std::getline(iss, rest);
    if (!rest.empty() && rest[0] == ' ') {
        rest.erase(0, 1);
    }
    return rest;
}

bool ParseNumber(const std::string &raw, long &out) {
    if (raw.empty()) {
        return false;
    }
    char *end = NULL;
    long value = std::strtol(raw.c_str(), &end, 10);
    if (end == NULL || *end != '\0' || value < 0) {
        return false;
    }
    out = value;
    return true;
}

void Report(std::ostream &out, client::RouteStatus status) {
    if (status == client::RouteStatus::kOk) {
        out << "ok\n";
    } else {
        out << "error: " << client::RouteStatusToString(status) << "\n";
    }
}

void HandleConnect(client::Engine &engine, std::istringstream &iss, std::ostream &out) {
    client::ConnectionConfig config;
    std::string port_text;
    long port = 0;
    if (!(iss >> config.server >> port_text >> config.nickname) || !ParseNumber(port_text, port) ||
        port == 0 || port > 65535) {
        out << "error: usage: connect <server> <port> <nick> [tls] [#chan,#chan2]\n";
        return;
    }
    config.port = static_cast<int>(port);

    std::string option;
    while (iss >> option) {
        if (option == "tls") {
            config.use_tls = true;
        } else {
            config.auto_join = Split(option, ',');
        }
    }

    std::string id;
    std::string error;
    if (!engine.Connect(config, id, error)) {
        out << "error: " << error << "\n";
        return;
    }
    out << id << "\n";
}

void HandleScrollback(client::Engine &engine, std::istringstream &iss, std::ostream &out) {
    std::string id;
    std::string target;
    if (!(iss >> id >> target)) {
        out << "error: usage: scrollback <id> <target> [limit]\n";
        return;
    }

    std::vector<client::ChatMessage> messages;
    std::string error;
    std::string limit_text;
    bool ok = false;
    if (iss >> limit_text) {
        long limit = 0;
        if (!ParseNumber(limit_text, limit)) {
            out << "error: invalid limit\n";
            return;
        }
        ok = engine.Scrollback(id, target, static_cast<std::size_t>(limit), messages, error);
    } else {
        ok = engine.Scrollback(id, target, messages, error);
    }

    if (!ok) {
        out << "error: " << error << "\n";
        return;
    }
    for (std::size_t i = 0; i < messages.size(); ++i) {
        out << client::DumpJson(client::ChatMessageToJson(messages[i])) << "\n";
    }
}
}  // namespace

namespace cli {

ShellResult ExecuteLine(client::Engine &engine, const std::string &line, std::ostream &out) {
    std::istringstream iss(line);
    std::string command;
    if (!(iss >> command)) {
        return ShellResult::kContinue;
    }

    if (command == "quit" || command == "exit") {
        return ShellResult::kExit;
    }
    if (command == "help") {
        PrintUsage(out);
        return ShellResult::kContinue;
    }
    if (command == "connect") {
        HandleConnect(engine, iss, out);
        return ShellResult::kContinue;
    }
    if (command == "scrollback") {
        HandleScrollback(engine, iss, out);
        return ShellResult::kContinue;
    }
    if (command == "list") {
        std::vector<std::string> ids = engine.ListConnections();
        for (std::size_t i = 0; i < ids.size(); ++i) {
            out << ids[i] << "\n";
        }
        return ShellResult::kContinue;
    }
    if (command == "saved") {
        std::vector<client::ConnectionConfig> saved = engine.SavedConnections();
        for (std::size_t i = 0; i < saved.size(); ++i) {
            out << client::DumpJson(client::ConfigToJson(saved[i])) << "\n";
        }
        return ShellResult::kContinue;
    }

    std::string id;
    if (!(iss >> id)) {
        out << "error: missing connection id\n";
        return ShellResult::kContinue;
    }

    if (command == "disconnect") {
        std::string reason = Rest(iss);
        Report(out, reason.empty() ? engine.Disconnect(id) : engine.Disconnect(id, reason));
        return ShellResult::kContinue;
    }

    std::string target;
    if (!(iss >> target)) {
        out << "error: missing channel or target\n";
        return ShellResult::kContinue;
    }
    std::string text = Rest(iss);

    if (command == "join") {
        Report(out, engine.Join(id, target));
    } else if (command == "part") {
        Report(out, text.empty() ? engine.Part(id, target) : engine.Part(id, target, text));
    } else if (command == "msg") {
        if (text.empty()) {
            out << "error: usage: msg <id> <target> <text...>\n";
        } else {
            Report(out, engine.SendMessage(id, target, text));
        }
    } else if (command == "topic") {
        Report(out, text.empty() ? engine.SetTopic(id, target) : engine.SetTopic(id, target, text));
    } else {
        out << "error: unknown command " << command << "\n";
    }
    return ShellResult::kContinue;
}

void PrintUsage(std::ostream &out) {
    out << "connect <server> <port> <nick> [tls] [#chan,#chan2]\n"
        << "disconnect <id> [reason...]\n"
        << "join <id> <channel>\n"
        << "part <id> <channel> [reason...]\n"
        << "msg <id> <target> <text...>\n"
        << "topic <id> <channel> [topic...]\n"
        << "scrollback <id> <target> [limit]\n"
        << "list\n"
        << "saved\n"
        << "quit\n";
}

}  // namespace cli
