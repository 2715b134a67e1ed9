/*
 * 설명: 표준 입력의 한 줄 명령을 엔진 API 호출로 바꾸는 명령 계층. 결과와 오류는 out에 한 줄씩 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/shell_test.cpp
 */
#pragma once

#include <ostream>
#include <string>

#include "client/engine.hpp"

namespace cli {

enum class ShellResult { kContinue, kExit };

ShellResult ExecuteLine(client::Engine &engine, const std::string &line, std::ostream &out);
void PrintUsage(std::ostream &out);

}  // namespace cli
