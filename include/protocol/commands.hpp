/*
 * 설명: 클라이언트가 보내는 IRC 명령을 정규 wire 형식(종단 문자 제외)으로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/commands_test.cpp
 */
#pragma once

#include <string>

namespace protocol {

extern const char kLineTerminator[];

std::string BuildPass(const std::string &password);
std::string BuildNick(const std::string &nickname);
std::string BuildUser(const std::string &username, const std::string &realname);
std::string BuildJoin(const std::string &channel);
std::string BuildPart(const std::string &channel);
std::string BuildPart(const std::string &channel, const std::string &reason);
std::string BuildPrivmsg(const std::string &target, const std::string &message);
std::string BuildTopic(const std::string &channel);
std::string BuildTopic(const std::string &channel, const std::string &topic);
std::string BuildQuit();
std::string BuildQuit(const std::string &reason);
std::string BuildPong(const std::string &token);

std::string TerminateLine(const std::string &line);

}  // namespace protocol
