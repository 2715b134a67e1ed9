/*
 * 설명: 채팅 기록과 연결 설정을 JSON 레코드로, UI 이벤트를 type 태그가 붙은 JSON 객체로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/serialization_test.cpp
 */
#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "client/types.hpp"

namespace client {

nlohmann::json ChatMessageToJson(const ChatMessage &message);
bool ChatMessageFromJson(const nlohmann::json &value, ChatMessage &out, std::string &error);

nlohmann::json ConfigToJson(const ConnectionConfig &config);
bool ConfigFromJson(const nlohmann::json &value, ConnectionConfig &out, std::string &error);

nlohmann::json EventToJson(const IrcEvent &event);

// 잘못된 UTF-8 바이트는 U+FFFD로 바꿔 직렬화한다. indent가 음수이면 한 줄로 출력한다.
std::string DumpJson(const nlohmann::json &value, int indent = -1);

}  // namespace client
