/*
 * 설명: IRC 라인을 prefix/command/params/trailing으로 파싱한다. 실패하지 않으며 해석 불가 입력은 빈 필드로 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/message_test.cpp
 */
#include "protocol/message.hpp"

#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace {
const char kCtcpDelimiter = '\x01';
const char kActionPrefix[] = "ACTION ";

std::string Trim(const std::string &text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

const char *RoleForSigil(char sigil) {
    switch (sigil) {
        case '~':
            return "owner";
        case '&':
            return "admin";
        case '@':
            return "op";
        case '%':
            return "halfop";
        case '+':
            return "voice";
        default:
            return NULL;
    }
}
}  // namespace

namespace protocol {

ParsedMessage ParseMessageLine(const std::string &line) {
    ParsedMessage msg;
    std::string rest = Trim(line);

    if (!rest.empty() && rest[0] == ':') {
        std::size_t space = rest.find(' ');
        if (space == std::string::npos) {
            // prefix 뒤에 공백이 없으면 전체를 command로 둔다.
            msg.command = rest;
            return msg;
        }
        msg.prefix = rest.substr(1, space - 1);
        msg.has_prefix = true;
        rest = rest.substr(space + 1);
    }

    std::string head = rest;
    std::size_t trailing_pos = rest.find(" :");
    if (trailing_pos != std::string::npos) {
        head = rest.substr(0, trailing_pos);
        msg.trailing = rest.substr(trailing_pos + 2);
        msg.has_trailing = true;
    }

    std::istringstream tokens(head);
    std::string token;
    if (tokens >> token) {
        msg.command = token;
    }
    while (tokens >> token) {
        msg.params.push_back(token);
    }
    return msg;
}

bool ExtractNick(const std::string &prefix, std::string &nick) {
    std::string candidate = prefix.substr(0, prefix.find('!'));
    if (candidate.empty()) {
        return false;
    }
    nick = candidate;
    return true;
}

bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

NameEntry DecodeNameEntry(const std::string &entry) {
    NameEntry decoded;
    std::size_t idx = 0;
    while (idx < entry.size()) {
        const char *role = RoleForSigil(entry[idx]);
        if (role == NULL) {
            break;
        }
        decoded.modes.push_back(role);
        ++idx;
    }
    decoded.nick = entry.substr(idx);
    return decoded;
}

std::vector<NameEntry> DecodeNameList(const std::string &list) {
    std::vector<NameEntry> entries;
    std::istringstream tokens(list);
    std::string token;
    while (tokens >> token) {
        entries.push_back(DecodeNameEntry(token));
    }
    return entries;
}

bool DecodeCtcpAction(const std::string &text, std::string &action) {
    if (text.empty() || text[0] != kCtcpDelimiter || text[text.size() - 1] != kCtcpDelimiter) {
        return false;
    }

    std::size_t start = text.find_first_not_of(kCtcpDelimiter);
    if (start == std::string::npos) {
        return false;
    }
    std::size_t end = text.find_last_not_of(kCtcpDelimiter);
    std::string body = text.substr(start, end - start + 1);

    const std::size_t prefix_len = sizeof(kActionPrefix) - 1;
    if (body.compare(0, prefix_len, kActionPrefix) != 0) {
        return false;
    }
    action = body.substr(prefix_len);
    return true;
}

}  // namespace protocol
