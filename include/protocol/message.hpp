/*
 * 설명: IRC 라인을 prefix/command/params/trailing으로 관대하게 파싱하고 prefix 닉, NAMES 항목, CTCP ACTION을 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/message_test.cpp
 */
#pragma once

#include <string>
#include <vector>

namespace protocol {

struct ParsedMessage {
    std::string prefix;
    bool has_prefix;
    std::string command;
    std::vector<std::string> params;
    std::string trailing;
    bool has_trailing;

    ParsedMessage() : has_prefix(false), has_trailing(false) {}
};

// NAMES(353) 응답의 항목 하나. modes는 sigil 순서를 유지한다.
struct NameEntry {
    std::string nick;
    std::vector<std::string> modes;
};

ParsedMessage ParseMessageLine(const std::string &line);
bool ExtractNick(const std::string &prefix, std::string &nick);
bool EqualsIgnoreCase(const std::string &a, const std::string &b);
NameEntry DecodeNameEntry(const std::string &entry);
std::vector<NameEntry> DecodeNameList(const std::string &list);
bool DecodeCtcpAction(const std::string &text, std::string &action);

}  // namespace protocol
