/*
 * 설명: 클라이언트 송신 명령(PASS/NICK/USER/JOIN/PART/PRIVMSG/TOPIC/QUIT/PONG)의 wire 형식을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/commands_test.cpp
 */
#include "protocol/commands.hpp"

namespace protocol {

const char kLineTerminator[] = "\r\n";

std::string BuildPass(const std::string &password) { return "PASS " + password; }

std::string BuildNick(const std::string &nickname) { return "NICK " + nickname; }

std::string BuildUser(const std::string &username, const std::string &realname) {
    return "USER " + username + " 0 * :" + realname;
}

std::string BuildJoin(const std::string &channel) { return "JOIN " + channel; }

std::string BuildPart(const std::string &channel) { return "PART " + channel; }

std::string BuildPart(const std::string &channel, const std::string &reason) {
    return "PART " + channel + " :" + reason;
}

std::string BuildPrivmsg(const std::string &target, const std::string &message) {
    return "PRIVMSG " + target + " :" + message;
}

std::string BuildTopic(const std::string &channel) { return "TOPIC " + channel; }

std::string BuildTopic(const std::string &channel, const std::string &topic) {
    return "TOPIC " + channel + " :" + topic;
}

std::string BuildQuit() { return "QUIT"; }

std::string BuildQuit(const std::string &reason) { return "QUIT :" + reason; }

std::string BuildPong(const std::string &token) { return "PONG :" + token; }

std::string TerminateLine(const std::string &line) { return line + kLineTerminator; }

}  // namespace protocol
