/*
 * 설명: 수신 버퍼를 LF 기준으로 분리하고 남은 조각은 다음 수신까지 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/framer_test.cpp
 */
#include "protocol/framer.hpp"

#include <cstddef>

namespace {
void StripCarriageReturn(std::string &line) {
    if (!line.empty() && line[line.size() - 1] == '\r') {
        line.erase(line.size() - 1);
    }
}
}  // namespace

namespace protocol {

std::vector<std::string> ExtractLines(std::string &buffer) {
    std::vector<std::string> lines;

    std::size_t start = 0;
    std::size_t pos = std::string::npos;
    while ((pos = buffer.find('\n', start)) != std::string::npos) {
        std::string line = buffer.substr(start, pos - start);
        StripCarriageReturn(line);
        lines.push_back(line);
        start = pos + 1;
    }
    buffer.erase(0, start);

    return lines;
}

bool ExtractFinalLine(std::string &buffer, std::string &line) {
    if (buffer.empty()) {
        return false;
    }
    line = buffer;
    buffer.clear();
    StripCarriageReturn(line);
    return true;
}

}  // namespace protocol
