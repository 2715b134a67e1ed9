/*
 * 설명: 수신 버퍼를 LF 기준으로 라인 단위로 분리한다. 라인 끝의 CR은 제거하며 길이 제한은 두지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/framer_test.cpp
 */
#pragma once

#include <string>
#include <vector>

namespace protocol {

std::vector<std::string> ExtractLines(std::string &buffer);

// EOF 시점에 종단 문자 없이 남은 마지막 라인을 꺼낸다.
bool ExtractFinalLine(std::string &buffer, std::string &line);

}  // namespace protocol
